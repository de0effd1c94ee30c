#include "chunkvault/server/chunk_store.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <optional>
#include <string_view>

#include "chunkvault/crypto.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr std::string_view kChunkPrefix = "chunk_";
        constexpr std::string_view kChunkSuffix = ".part";

        std::optional<std::uint64_t> parse_chunk_name(const std::string &name)
        {
            if (name.size() <= kChunkPrefix.size() + kChunkSuffix.size() || !name.starts_with(kChunkPrefix) ||
                !name.ends_with(kChunkSuffix))
            {
                return std::nullopt;
            }
            const auto digits = std::string_view(name).substr(
                kChunkPrefix.size(), name.size() - kChunkPrefix.size() - kChunkSuffix.size());
            std::uint64_t value{};
            const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec != std::errc{} || end != digits.data() + digits.size())
            {
                return std::nullopt;
            }
            return value;
        }

        bool is_valid_session_id(const std::string &session_id)
        {
            return !session_id.empty() && session_id.size() <= 64 &&
                   std::all_of(session_id.begin(), session_id.end(), [](char ch)
                               { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'); });
        }
    } // namespace

    StorageError::StorageError(chunkvault::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    ChunkStore::ChunkStore(std::filesystem::path sessions_root)
        : root_(std::move(sessions_root))
    {
        std::filesystem::create_directories(root_);
    }

    std::filesystem::path ChunkStore::session_dir(const std::string &session_id) const
    {
        // Ids name directories; anything else could escape the root.
        if (!is_valid_session_id(session_id))
        {
            throw StorageError(chunkvault::ErrorCode::NotFound, "Unknown session: " + session_id);
        }
        return root_ / session_id;
    }

    std::filesystem::path ChunkStore::chunk_path(const std::string &session_id, std::uint64_t index) const
    {
        return session_dir(session_id) / (std::string(kChunkPrefix) + std::to_string(index) + std::string(kChunkSuffix));
    }

    void ChunkStore::create_session(const std::string &session_id)
    {
        std::error_code ec;
        std::filesystem::create_directories(session_dir(session_id), ec);
        if (ec)
        {
            throw StorageError(chunkvault::ErrorCode::IoError, "Failed to create session storage: " + ec.message());
        }
    }

    bool ChunkStore::has_session(const std::string &session_id) const
    {
        if (!is_valid_session_id(session_id))
        {
            return false;
        }
        std::error_code ec;
        return std::filesystem::is_directory(root_ / session_id, ec);
    }

    std::vector<std::string> ChunkStore::list_sessions() const
    {
        std::vector<std::string> result;
        for (const auto &entry : std::filesystem::directory_iterator(root_))
        {
            const auto name = entry.path().filename().string();
            if (entry.is_directory() && is_valid_session_id(name))
            {
                result.push_back(name);
            }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    void ChunkStore::write_chunk(const std::string &session_id, std::uint64_t index, std::span<const std::byte> data)
    {
        const auto final_path = chunk_path(session_id, index);
        if (!has_session(session_id))
        {
            throw StorageError(chunkvault::ErrorCode::NotFound, "Unknown session: " + session_id);
        }

        // Concurrent writers of the same index each get their own temp file;
        // the last rename wins and readers never see a partial chunk.
        auto temp_path = final_path.parent_path() /
                         ("." + final_path.filename().string() + "." + crypto::random_token(8) + ".tmp");
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw StorageError(chunkvault::ErrorCode::IoError, "Failed to open chunk file for writing");
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                throw StorageError(chunkvault::ErrorCode::IoError, "Failed to write chunk " + std::to_string(index));
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw StorageError(chunkvault::ErrorCode::IoError, "Failed to publish chunk: " + ec.message());
        }
    }

    std::vector<std::uint64_t> ChunkStore::list_chunks(const std::string &session_id) const
    {
        const auto dir = session_dir(session_id);
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec)
        {
            throw StorageError(chunkvault::ErrorCode::NotFound, "Unknown session: " + session_id);
        }
        std::vector<std::uint64_t> indices;
        for (const auto &entry : it)
        {
            if (!entry.is_regular_file())
            {
                continue;
            }
            if (auto index = parse_chunk_name(entry.path().filename().string()))
            {
                indices.push_back(*index);
            }
        }
        std::sort(indices.begin(), indices.end());
        return indices;
    }

    std::uint64_t ChunkStore::chunk_size_on_disk(const std::string &session_id, std::uint64_t index) const
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(chunk_path(session_id, index), ec);
        if (ec)
        {
            throw StorageError(chunkvault::ErrorCode::IoError,
                               "Failed to stat chunk " + std::to_string(index) + ": " + ec.message());
        }
        return static_cast<std::uint64_t>(size);
    }

    void ChunkStore::remove_chunks(const std::string &session_id)
    {
        const auto dir = session_dir(session_id);
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec)
        {
            throw StorageError(chunkvault::ErrorCode::NotFound, "Unknown session: " + session_id);
        }
        std::vector<std::filesystem::path> doomed;
        for (const auto &entry : it)
        {
            const auto name = entry.path().filename().string();
            const bool in_flight = name.starts_with(".") && name.ends_with(".tmp");
            if (entry.is_regular_file() && (parse_chunk_name(name) || in_flight))
            {
                doomed.push_back(entry.path());
            }
        }
        for (const auto &path : doomed)
        {
            std::filesystem::remove(path, ec);
            if (ec)
            {
                throw StorageError(chunkvault::ErrorCode::IoError,
                                   "Failed to remove " + path.filename().string() + ": " + ec.message());
            }
        }
    }

} // namespace chunkvault::server
