#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chunkvault::server
{

    class Assembler;
    class ChunkStore;

    struct AssembledArtifact
    {
        std::filesystem::path path;
        std::uint64_t size{};
        std::string content_hash;
    };

    enum class SessionStatus : std::uint8_t
    {
        Open,
        Completed
    };

    std::string_view to_string(SessionStatus status) noexcept;

    struct UploadSession
    {
        std::string session_id;
        std::string filename;
        std::uint64_t chunk_size{};
        SessionStatus status{SessionStatus::Open};
        // Set once the session is completed.
        std::uint64_t total_chunks{};
        std::optional<AssembledArtifact> artifact;
    };

    // Owns the session lifecycle. Unknown session ids are reported as
    // NotFound by every operation; a known session without chunks lists as
    // empty. Chunk writes only share-lock their session, so writes to
    // different indices never wait on each other; completion takes the
    // session lock exclusively.
    //
    // A completed session loses its chunks but keeps its record: it lists
    // every index as accepted, refuses further chunks with Conflict, and
    // answers a repeated completion with the artifact it already built.
    class UploadSessionRegistry
    {
    public:
        UploadSessionRegistry(ChunkStore &store, const Assembler &assembler, std::uint64_t chunk_size);

        UploadSession initiate(const std::string &filename);

        void put_chunk(const std::string &session_id, std::uint64_t index, std::span<const std::byte> data,
                       const std::optional<std::string> &chunk_hash = std::nullopt);

        std::vector<std::uint64_t> list_accepted(const std::string &session_id) const;

        AssembledArtifact complete(const std::string &session_id, std::uint64_t total_chunks);

    private:
        struct Entry
        {
            UploadSession session;
            mutable std::shared_mutex gate;
        };

        std::shared_ptr<Entry> lookup(const std::string &session_id) const;
        void load_existing();
        void persist(const UploadSession &session) const;

        static std::string sanitize_filename(const std::string &filename);

        ChunkStore &store_;
        const Assembler &assembler_;
        std::uint64_t chunk_size_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
    };

} // namespace chunkvault::server
