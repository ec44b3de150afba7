/**
 * SnapVault - Content digests and identifier minting built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

namespace snapvault::crypto
{

    inline constexpr std::size_t kDigestBlockSize = 64 * 1024;

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input, std::size_t block_size = kDigestBlockSize);

    // Reads the file in fixed-size blocks; memory use does not depend on file size.
    std::string hash_file(const std::filesystem::path &path, std::size_t block_size = kDigestBlockSize);

    // 128 random bits, lowercase hex.
    std::string random_identifier();

} // namespace snapvault::crypto
