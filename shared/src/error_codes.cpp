#include "snapvault/error_codes.hpp"

#include <array>

namespace snapvault
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 14> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::SourceMissing, "source_missing"},
            {ErrorCode::CorruptArchive, "corrupt_archive"},
            {ErrorCode::RangeNotSatisfiable, "range_not_satisfiable"},
            {ErrorCode::InvalidRange, "invalid_range"},
            {ErrorCode::UnknownOperation, "unknown_operation"},
            {ErrorCode::MissingChunk, "missing_chunk"},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch"},
            {ErrorCode::NothingToRestore, "nothing_to_restore"},
            {ErrorCode::IOFailure, "io_failure"},
            {ErrorCode::InvalidRequest, "invalid_request"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace snapvault
