#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    class StorageError : public std::runtime_error
    {
    public:
        StorageError(chunkvault::ErrorCode code, std::string message);

        chunkvault::ErrorCode code() const noexcept { return code_; }

    private:
        chunkvault::ErrorCode code_;
    };

    // One directory per session, one file per chunk index. A chunk file only
    // ever appears under its final name once its content is fully written.
    class ChunkStore
    {
    public:
        explicit ChunkStore(std::filesystem::path sessions_root);

        const std::filesystem::path &root() const noexcept { return root_; }

        std::filesystem::path session_dir(const std::string &session_id) const;
        std::filesystem::path chunk_path(const std::string &session_id, std::uint64_t index) const;

        void create_session(const std::string &session_id);
        bool has_session(const std::string &session_id) const;
        std::vector<std::string> list_sessions() const;

        // Overwrites any previous content stored for the index.
        void write_chunk(const std::string &session_id, std::uint64_t index, std::span<const std::byte> data);

        // Sorted ascending.
        std::vector<std::uint64_t> list_chunks(const std::string &session_id) const;

        std::uint64_t chunk_size_on_disk(const std::string &session_id, std::uint64_t index) const;

        // Deletes every chunk file, finished or in flight, but leaves the
        // session directory and anything else in it.
        void remove_chunks(const std::string &session_id);

    private:
        std::filesystem::path root_;
    };

} // namespace chunkvault::server
