#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "chunkvault/client/chunk_uploader.hpp"
#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/progress_store.hpp"
#include "chunkvault/client/transport.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::client
{

    // Start -> Fresh|Resumed -> Transferring -> Completing -> Done.
    // Aborted is a resumable pause: rerunning the controller picks up from
    // whatever the server has accepted.
    enum class TransferState : std::uint8_t
    {
        Start,
        Fresh,
        Resumed,
        Transferring,
        Completing,
        Done,
        Aborted
    };

    std::string_view to_string(TransferState state) noexcept;

    struct TransferOptions
    {
        // Stop after this many newly sent chunks in one run.
        std::optional<std::uint64_t> max_new_chunks;
    };

    struct TransferReport
    {
        TransferState state{TransferState::Start};
        bool resumed{};
        std::string session_id;
        std::uint64_t file_size{};
        std::uint64_t total_chunks{};
        std::uint64_t previously_accepted{};
        std::uint64_t chunks_sent{};
        std::optional<chunkvault::protocol::CompleteResponse> artifact;
        std::string detail;
    };

    class TransferController
    {
    public:
        using ProgressCallback = std::function<void(std::uint64_t accepted, std::uint64_t total)>;

        TransferController(UploadTransport &transport, ChunkUploader &uploader, ProgressStore &progress, Logger &logger,
                           TransferOptions options = {});

        void set_progress_callback(ProgressCallback callback);

        // Throws LocalIoError when the source or the progress record cannot
        // be read or written. Network and server failures end in Aborted (or
        // Transferring when only completion failed) and never lose progress.
        TransferReport run(const std::filesystem::path &source);

    private:
        struct RunContext
        {
            std::filesystem::path source;
            std::uint64_t file_size{};
            std::string checksum;
            ProgressRecord record;
            std::set<std::uint64_t> accepted;
        };

        bool start_fresh(RunContext &context, TransferReport &report);
        bool resume(RunContext &context, TransferReport &report);
        bool transfer(RunContext &context, TransferReport &report);
        void finish(RunContext &context, TransferReport &report);
        std::vector<std::uint8_t> read_chunk(std::ifstream &in, const RunContext &context, std::uint64_t index) const;

        UploadTransport &transport_;
        ChunkUploader &uploader_;
        ProgressStore &progress_;
        Logger &logger_;
        TransferOptions options_;
        ProgressCallback on_progress_;
    };

} // namespace chunkvault::client
