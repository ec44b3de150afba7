/**
 * SnapVault - Error taxonomy shared by the server, the client and the tests.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace snapvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        SourceMissing = 1,
        CorruptArchive = 2,
        RangeNotSatisfiable = 3,
        InvalidRange = 4,
        UnknownOperation = 5,
        MissingChunk = 6,
        ChecksumMismatch = 7,
        NothingToRestore = 8,
        IOFailure = 9,
        InvalidRequest = 10,
        NotFound = 11,
        Conflict = 12,
        InternalError = 13
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace snapvault
