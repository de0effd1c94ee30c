/**
 * ChunkVault - Content hashing and random identifiers built on libsodium.
 *
 * All digests are BLAKE2b (crypto_generichash) rendered as lowercase hex.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

#include <sodium.h>

namespace chunkvault::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Hex string of `bytes` random bytes.
    std::string random_token(std::size_t bytes);

    class Hasher
    {
    public:
        Hasher();

        void update(std::span<const std::byte> data);

        // The hasher cannot be updated after this call.
        std::string finish();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

} // namespace chunkvault::crypto
