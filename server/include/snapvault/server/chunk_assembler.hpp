#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "snapvault/server/operation_registry.hpp"

namespace snapvault::server
{

    struct ChunkOutcome
    {
        enum class State
        {
            MoreExpected,
            ReadyToAssemble
        };

        State state{State::MoreExpected};
        std::uint64_t chunks_received{};
        std::uint64_t total_chunks{};
    };

    class ChunkAssembler
    {
    public:
        static constexpr auto kCombinedName = "combined.zip";
        static constexpr auto kSingleShotName = "backup.zip";

        explicit ChunkAssembler(OperationRegistry &registry);

        std::string begin(const std::optional<std::string> &requested_id, std::uint64_t total_chunks);

        // Client-chosen id: the first request creates the operation, concurrent ones join it.
        std::string join(const std::string &operation_id, std::uint64_t total_chunks);

        // Stores the fragment as chunk_<index> in the staging directory. A repeated index
        // overwrites the earlier copy.
        ChunkOutcome accept(const std::string &operation_id, std::uint64_t chunk_index, std::string_view bytes);

        // Concatenates chunk_0..chunk_{n-1} into combined.zip. Throws MissingChunk.
        std::filesystem::path assemble(const std::string &operation_id);

        // Whole archive in one request, stored as backup.zip of a fresh operation.
        std::filesystem::path store_single(const std::string &operation_id, std::string_view bytes);

        static std::string chunk_name(std::uint64_t chunk_index);

    private:
        static void write_atomically(const std::filesystem::path &target, std::string_view bytes);

        OperationRegistry &registry_;
    };

} // namespace snapvault::server
