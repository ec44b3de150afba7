#include "snapvault/server/chunk_assembler.hpp"

#include <fstream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "snapvault/crypto.hpp"
#include "snapvault/error_codes.hpp"

namespace snapvault::server
{

    ChunkAssembler::ChunkAssembler(OperationRegistry &registry) : registry_(registry) {}

    std::string ChunkAssembler::chunk_name(std::uint64_t chunk_index)
    {
        return "chunk_" + std::to_string(chunk_index);
    }

    std::string ChunkAssembler::begin(const std::optional<std::string> &requested_id, std::uint64_t total_chunks)
    {
        auto operation = registry_.create(requested_id, total_chunks);
        spdlog::info("Upload {} started, expecting {} chunk(s)", operation.id, total_chunks);
        return operation.id;
    }

    std::string ChunkAssembler::join(const std::string &operation_id, std::uint64_t total_chunks)
    {
        auto [operation, created] = registry_.create_or_get(operation_id, total_chunks);
        if (created)
        {
            spdlog::info("Upload {} started, expecting {} chunk(s)", operation.id, total_chunks);
        }
        return operation.id;
    }

    void ChunkAssembler::write_atomically(const std::filesystem::path &target, std::string_view bytes)
    {
        auto temp = target;
        temp += ".part-" + crypto::random_identifier().substr(0, 8);
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw TransferError(ErrorCode::IOFailure, "Unable to write " + target.filename().string());
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (!out)
            {
                out.close();
                std::error_code ec;
                std::filesystem::remove(temp, ec);
                throw TransferError(ErrorCode::IOFailure, "Unable to write " + target.filename().string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw TransferError(ErrorCode::IOFailure, "Unable to store " + target.filename().string() + ": " + ec.message());
        }
    }

    ChunkOutcome ChunkAssembler::accept(const std::string &operation_id, std::uint64_t chunk_index, std::string_view bytes)
    {
        // Validate before touching the staging directory; record_chunk re-checks under the lock.
        const auto operation = registry_.lookup(operation_id);
        if (operation.status != snapvault::protocol::OperationStatus::Uploading)
        {
            throw TransferError(ErrorCode::Conflict, "Upload session " + operation_id + " is " +
                                                         std::string(snapvault::protocol::to_string(operation.status)));
        }
        if (chunk_index >= operation.total_chunks)
        {
            throw TransferError(ErrorCode::InvalidRequest, "Chunk index " + std::to_string(chunk_index) +
                                                               " out of range for " +
                                                               std::to_string(operation.total_chunks) + " chunks");
        }

        write_atomically(operation.staging_dir / chunk_name(chunk_index), bytes);
        const auto updated = registry_.record_chunk(operation_id, chunk_index);
        spdlog::debug("Upload {} chunk {} stored ({} bytes, {}/{})", operation_id, chunk_index, bytes.size(),
                      updated.chunks_received(), updated.total_chunks);

        ChunkOutcome outcome;
        outcome.chunks_received = updated.chunks_received();
        outcome.total_chunks = updated.total_chunks;
        outcome.state = updated.all_chunks_received() ? ChunkOutcome::State::ReadyToAssemble
                                                      : ChunkOutcome::State::MoreExpected;
        return outcome;
    }

    std::filesystem::path ChunkAssembler::assemble(const std::string &operation_id)
    {
        const auto operation = registry_.lookup(operation_id);
        for (std::uint64_t index = 0; index < operation.total_chunks; ++index)
        {
            if (!std::filesystem::is_regular_file(operation.staging_dir / chunk_name(index)))
            {
                throw TransferError(ErrorCode::MissingChunk, "Missing chunk " + std::to_string(index));
            }
        }

        const auto combined = operation.staging_dir / kCombinedName;
        std::ofstream out(combined, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw TransferError(ErrorCode::IOFailure, "Unable to create combined archive");
        }

        std::vector<char> buffer(crypto::kDigestBlockSize);
        for (std::uint64_t index = 0; index < operation.total_chunks; ++index)
        {
            std::ifstream in(operation.staging_dir / chunk_name(index), std::ios::binary);
            if (!in.is_open())
            {
                throw TransferError(ErrorCode::MissingChunk, "Missing chunk " + std::to_string(index));
            }
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto read = in.gcount();
                if (read > 0)
                {
                    out.write(buffer.data(), read);
                }
            }
            if (!out)
            {
                throw TransferError(ErrorCode::IOFailure, "Unable to write combined archive");
            }
        }
        out.close();
        if (!out)
        {
            throw TransferError(ErrorCode::IOFailure, "Unable to write combined archive");
        }

        // Fragments are no longer needed once combined.
        for (std::uint64_t index = 0; index < operation.total_chunks; ++index)
        {
            std::error_code ec;
            std::filesystem::remove(operation.staging_dir / chunk_name(index), ec);
        }
        spdlog::info("Upload {} assembled from {} chunk(s)", operation_id, operation.total_chunks);
        return combined;
    }

    std::filesystem::path ChunkAssembler::store_single(const std::string &operation_id, std::string_view bytes)
    {
        const auto operation = registry_.lookup(operation_id);
        const auto target = operation.staging_dir / kSingleShotName;
        write_atomically(target, bytes);
        registry_.record_chunk(operation_id, 0);
        return target;
    }

} // namespace snapvault::server
