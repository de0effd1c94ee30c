#include "chunkvault/server/upload_session.hpp"

#include <filesystem>
#include <fstream>
#include <numeric>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/assembler.hpp"
#include "chunkvault/server/chunk_store.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kMetadataFile = "session.json";
        constexpr auto kFallbackFilename = "assembled.bin";

        nlohmann::json to_json(const UploadSession &session)
        {
            nlohmann::json json = {
                {"session_id", session.session_id},
                {"filename", session.filename},
                {"chunk_size", session.chunk_size},
                {"status", to_string(session.status)},
            };
            if (session.artifact)
            {
                json["total_chunks"] = session.total_chunks;
                json["artifact"] = {
                    {"path", session.artifact->path.string()},
                    {"size", session.artifact->size},
                    {"content_hash", session.artifact->content_hash},
                };
            }
            return json;
        }

        UploadSession session_from_json(const nlohmann::json &json)
        {
            UploadSession session{};
            session.session_id = json.at("session_id").get<std::string>();
            session.filename = json.at("filename").get<std::string>();
            session.chunk_size = json.at("chunk_size").get<std::uint64_t>();
            session.status = json.value("status", std::string{"open"}) == "completed" ? SessionStatus::Completed
                                                                                      : SessionStatus::Open;
            if (auto it = json.find("artifact"); it != json.end())
            {
                session.total_chunks = json.at("total_chunks").get<std::uint64_t>();
                session.artifact = AssembledArtifact{
                    .path = std::filesystem::path(it->at("path").get<std::string>()),
                    .size = it->at("size").get<std::uint64_t>(),
                    .content_hash = it->at("content_hash").get<std::string>(),
                };
            }
            return session;
        }

        StorageError unknown_session(const std::string &session_id)
        {
            return StorageError(chunkvault::ErrorCode::NotFound, "Unknown session: " + session_id);
        }
    } // namespace

    std::string_view to_string(SessionStatus status) noexcept
    {
        return status == SessionStatus::Completed ? "completed" : "open";
    }

    UploadSessionRegistry::UploadSessionRegistry(ChunkStore &store, const Assembler &assembler,
                                                 std::uint64_t chunk_size)
        : store_(store), assembler_(assembler), chunk_size_(chunk_size)
    {
        if (chunk_size_ == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        load_existing();
    }

    UploadSession UploadSessionRegistry::initiate(const std::string &filename)
    {
        auto entry = std::make_shared<Entry>();
        entry->session.session_id = crypto::random_token(16);
        entry->session.filename = sanitize_filename(filename);
        entry->session.chunk_size = chunk_size_;
        entry->session.status = SessionStatus::Open;

        store_.create_session(entry->session.session_id);
        persist(entry->session);

        std::lock_guard lock(mutex_);
        sessions_[entry->session.session_id] = entry;
        spdlog::info("Session {} opened for '{}' (chunk size {})", entry->session.session_id,
                     entry->session.filename, entry->session.chunk_size);
        return entry->session;
    }

    void UploadSessionRegistry::put_chunk(const std::string &session_id, std::uint64_t index,
                                          std::span<const std::byte> data, const std::optional<std::string> &chunk_hash)
    {
        auto entry = lookup(session_id);
        std::shared_lock gate(entry->gate);
        if (entry->session.status != SessionStatus::Open)
        {
            throw StorageError(chunkvault::ErrorCode::Conflict, "Session " + session_id + " is already completed");
        }
        if (data.size() > entry->session.chunk_size)
        {
            throw StorageError(chunkvault::ErrorCode::InvalidPayload,
                               "Chunk " + std::to_string(index) + " exceeds session chunk size");
        }
        if (chunk_hash && crypto::hash_bytes(data) != *chunk_hash)
        {
            throw StorageError(chunkvault::ErrorCode::InvalidPayload,
                               "Chunk " + std::to_string(index) + " hash mismatch");
        }
        store_.write_chunk(session_id, index, data);
        spdlog::debug("Session {} stored chunk {} ({} bytes)", session_id, index, data.size());
    }

    std::vector<std::uint64_t> UploadSessionRegistry::list_accepted(const std::string &session_id) const
    {
        auto entry = lookup(session_id);
        std::shared_lock gate(entry->gate);
        if (entry->session.status == SessionStatus::Completed)
        {
            std::vector<std::uint64_t> all(entry->session.total_chunks);
            std::iota(all.begin(), all.end(), std::uint64_t{0});
            return all;
        }
        return store_.list_chunks(session_id);
    }

    AssembledArtifact UploadSessionRegistry::complete(const std::string &session_id, std::uint64_t total_chunks)
    {
        auto entry = lookup(session_id);
        std::unique_lock gate(entry->gate);
        if (entry->session.status == SessionStatus::Completed)
        {
            // The client lost our answer; give it the same one again.
            if (total_chunks != entry->session.total_chunks || !entry->session.artifact)
            {
                throw StorageError(chunkvault::ErrorCode::Conflict,
                                   "Session " + session_id + " was completed with " +
                                       std::to_string(entry->session.total_chunks) + " chunk(s)");
            }
            spdlog::info("Session {} already completed, repeating result", session_id);
            return *entry->session.artifact;
        }

        auto artifact = assembler_.assemble(entry->session, total_chunks);

        entry->session.status = SessionStatus::Completed;
        entry->session.total_chunks = total_chunks;
        entry->session.artifact = artifact;
        try
        {
            persist(entry->session);
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Session {} completed but its record could not be saved: {}", session_id, ex.what());
        }
        try
        {
            store_.remove_chunks(session_id);
        }
        catch (const StorageError &ex)
        {
            // The artifact is already published; leftover chunks are only disk usage.
            spdlog::warn("Session {} completed but its chunks could not be removed: {}", session_id, ex.what());
        }
        spdlog::info("Session {} assembled into {} ({} bytes)", session_id, artifact.path.string(), artifact.size);
        return artifact;
    }

    std::shared_ptr<UploadSessionRegistry::Entry> UploadSessionRegistry::lookup(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            throw unknown_session(session_id);
        }
        return it->second;
    }

    void UploadSessionRegistry::load_existing()
    {
        for (const auto &session_id : store_.list_sessions())
        {
            const auto path = store_.session_dir(session_id) / kMetadataFile;
            try
            {
                std::ifstream in(path);
                if (!in.is_open())
                {
                    spdlog::warn("Skipping session {}: no metadata", session_id);
                    continue;
                }
                nlohmann::json json;
                in >> json;
                auto session = session_from_json(json);
                if (session.session_id != session_id || session.chunk_size == 0 ||
                    (session.status == SessionStatus::Completed && !session.artifact))
                {
                    spdlog::warn("Skipping session {}: inconsistent metadata", session_id);
                    continue;
                }
                auto entry = std::make_shared<Entry>();
                entry->session = std::move(session);
                sessions_[session_id] = std::move(entry);
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping session {}: {}", session_id, ex.what());
            }
        }
        if (!sessions_.empty())
        {
            spdlog::info("Restored {} session(s) from {}", sessions_.size(), store_.root().string());
        }
    }

    void UploadSessionRegistry::persist(const UploadSession &session) const
    {
        const auto path = store_.session_dir(session.session_id) / kMetadataFile;
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << to_json(session).dump(2);
            out.flush();
            if (!out)
            {
                throw StorageError(chunkvault::ErrorCode::IoError, "Failed to write session metadata");
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw StorageError(chunkvault::ErrorCode::IoError, "Failed to publish session metadata: " + ec.message());
        }
    }

    std::string UploadSessionRegistry::sanitize_filename(const std::string &filename)
    {
        auto name = std::filesystem::path(filename).filename().string();
        if (name.empty() || name == "." || name == "..")
        {
            return kFallbackFilename;
        }
        return name;
    }

} // namespace chunkvault::server
