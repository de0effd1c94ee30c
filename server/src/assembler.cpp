#include "chunkvault/server/assembler.hpp"

#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr std::size_t kCopyBufferSize = 1024 * 1024;

        void append_chunk(const std::filesystem::path &chunk_path, std::ofstream &out, crypto::Hasher &hasher,
                          std::vector<char> &buffer, std::uint64_t &written)
        {
            std::ifstream in(chunk_path, std::ios::binary);
            if (!in.is_open())
            {
                throw StorageError(chunkvault::ErrorCode::IoError, "Failed to open " + chunk_path.filename().string());
            }
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto read_count = static_cast<std::size_t>(in.gcount());
                if (read_count == 0)
                {
                    break;
                }
                out.write(buffer.data(), static_cast<std::streamsize>(read_count));
                if (!out)
                {
                    throw StorageError(chunkvault::ErrorCode::IoError, "Failed to write artifact");
                }
                hasher.update(std::as_bytes(std::span(buffer.data(), read_count)));
                written += read_count;
            }
            if (in.bad())
            {
                throw StorageError(chunkvault::ErrorCode::IoError, "Failed to read " + chunk_path.filename().string());
            }
        }

        void discard_partial(const std::filesystem::path &temp_path)
        {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            if (ec)
            {
                spdlog::warn("Could not remove partial artifact {}: {}", temp_path.string(), ec.message());
            }
        }
    } // namespace

    Assembler::Assembler(const ChunkStore &store, std::filesystem::path artifacts_dir)
        : store_(store), artifacts_dir_(std::move(artifacts_dir))
    {
        std::filesystem::create_directories(artifacts_dir_);
    }

    std::filesystem::path Assembler::artifact_path(const UploadSession &session) const
    {
        return artifacts_dir_ / (session.session_id + "__" + session.filename);
    }

    AssembledArtifact Assembler::assemble(const UploadSession &session, std::uint64_t total_chunks) const
    {
        verify_coverage(session, total_chunks);

        const auto final_path = artifact_path(session);
        auto temp_path = final_path;
        temp_path += ".partial";

        AssembledArtifact artifact{.path = final_path};
        try
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw StorageError(chunkvault::ErrorCode::IoError, "Failed to create " + temp_path.filename().string());
            }
            crypto::Hasher hasher;
            std::vector<char> buffer(kCopyBufferSize);
            for (std::uint64_t index = 0; index < total_chunks; ++index)
            {
                append_chunk(store_.chunk_path(session.session_id, index), out, hasher, buffer, artifact.size);
            }
            out.flush();
            if (!out)
            {
                throw StorageError(chunkvault::ErrorCode::IoError, "Failed to flush artifact");
            }
            out.close();
            artifact.content_hash = hasher.finish();

            std::filesystem::rename(temp_path, final_path);
        }
        catch (const StorageError &ex)
        {
            discard_partial(temp_path);
            spdlog::error("Assembly of session {} failed: {}", session.session_id, ex.what());
            throw;
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            discard_partial(temp_path);
            spdlog::error("Assembly of session {} failed: {}", session.session_id, ex.what());
            throw StorageError(chunkvault::ErrorCode::IoError, ex.what());
        }
        return artifact;
    }

    void Assembler::verify_coverage(const UploadSession &session, std::uint64_t total_chunks) const
    {
        if (total_chunks == 0)
        {
            throw StorageError(chunkvault::ErrorCode::InvalidPayload, "total_chunks must be at least 1");
        }

        const auto indices = store_.list_chunks(session.session_id);
        for (std::uint64_t expected = 0; expected < total_chunks; ++expected)
        {
            if (expected >= indices.size() || indices[expected] != expected)
            {
                throw StorageError(chunkvault::ErrorCode::AssemblyIncomplete,
                                   "Chunk " + std::to_string(expected) + " of " + std::to_string(total_chunks) +
                                       " is missing");
            }
        }
        if (indices.size() != total_chunks)
        {
            throw StorageError(chunkvault::ErrorCode::AssemblyIncomplete,
                               "Session holds chunks beyond index " + std::to_string(total_chunks - 1));
        }

        // Only the final chunk may be short.
        for (std::uint64_t index = 0; index + 1 < total_chunks; ++index)
        {
            if (store_.chunk_size_on_disk(session.session_id, index) != session.chunk_size)
            {
                throw StorageError(chunkvault::ErrorCode::AssemblyIncomplete,
                                   "Chunk " + std::to_string(index) + " is shorter than the chunk size");
            }
        }
    }

} // namespace chunkvault::server
