#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "chunkvault/client/logger.hpp"

namespace chunkvault::client
{

    // Local disk failure while reading the source or writing progress.
    class LocalIoError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ProgressRecord
    {
        std::string session_id;
        std::uint64_t chunk_size{};
        std::uint64_t file_size{};
        std::string filename;
        std::string file_checksum;
        // Informational only; the server's accepted set is authoritative.
        std::uint64_t chunks_accepted{};
    };

    // Persists one ProgressRecord beside each source file
    // (<source>.uploadmeta.json). Writes go through a temporary file and a
    // rename, so an abrupt stop leaves either the old or the new record.
    class ProgressStore
    {
    public:
        explicit ProgressStore(Logger &logger);

        static std::filesystem::path record_path(const std::filesystem::path &source);

        // Missing, unreadable or malformed records all load as std::nullopt.
        std::optional<ProgressRecord> load(const std::filesystem::path &source) const;

        // Drops the record when the file content changed since it was written.
        std::optional<ProgressRecord> validate(std::optional<ProgressRecord> record,
                                               const std::string &current_checksum) const;

        void persist(const std::filesystem::path &source, const ProgressRecord &record) const;

        void clear(const std::filesystem::path &source) const;

    private:
        Logger &logger_;
    };

} // namespace chunkvault::client
