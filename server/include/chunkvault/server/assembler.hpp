#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    class Assembler
    {
    public:
        Assembler(const ChunkStore &store, std::filesystem::path artifacts_dir);

        // <artifacts>/<session id>__<filename>; unique per session.
        std::filesystem::path artifact_path(const UploadSession &session) const;

        // Throws StorageError(AssemblyIncomplete) unless the stored chunks are
        // exactly [0, total_chunks). Nothing is visible under the artifact name
        // until the whole concatenation has been written.
        AssembledArtifact assemble(const UploadSession &session, std::uint64_t total_chunks) const;

    private:
        void verify_coverage(const UploadSession &session, std::uint64_t total_chunks) const;

        const ChunkStore &store_;
        std::filesystem::path artifacts_dir_;
    };

} // namespace chunkvault::server
