#include "chunkvault/client/transfer_controller.hpp"

#include <array>

#include "chunkvault/chunking.hpp"
#include "chunkvault/crypto.hpp"

namespace chunkvault::client
{

    namespace
    {
        struct StateLabel
        {
            TransferState state;
            std::string_view label;
        };

        constexpr std::array<StateLabel, 7> kStateLabels{{
            {TransferState::Start, "start"},
            {TransferState::Fresh, "fresh"},
            {TransferState::Resumed, "resumed"},
            {TransferState::Transferring, "transferring"},
            {TransferState::Completing, "completing"},
            {TransferState::Done, "done"},
            {TransferState::Aborted, "aborted"},
        }};
    } // namespace

    std::string_view to_string(TransferState state) noexcept
    {
        for (const auto &entry : kStateLabels)
        {
            if (entry.state == state)
            {
                return entry.label;
            }
        }
        return "unknown";
    }

    TransferController::TransferController(UploadTransport &transport, ChunkUploader &uploader, ProgressStore &progress,
                                           Logger &logger, TransferOptions options)
        : transport_(transport), uploader_(uploader), progress_(progress), logger_(logger), options_(options) {}

    void TransferController::set_progress_callback(ProgressCallback callback)
    {
        on_progress_ = std::move(callback);
    }

    TransferReport TransferController::run(const std::filesystem::path &source)
    {
        TransferReport report;
        RunContext context;
        context.source = source;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec))
        {
            throw LocalIoError("Source is not a readable file: " + source.string());
        }
        context.file_size = static_cast<std::uint64_t>(std::filesystem::file_size(source, ec));
        if (ec)
        {
            throw LocalIoError("Cannot stat " + source.string() + ": " + ec.message());
        }
        try
        {
            context.checksum = crypto::hash_file(source);
        }
        catch (const std::runtime_error &ex)
        {
            throw LocalIoError(ex.what());
        }
        report.file_size = context.file_size;

        auto loaded = progress_.load(source);
        const bool had_record = loaded.has_value();
        auto record = progress_.validate(std::move(loaded), context.checksum);
        if (had_record && !record)
        {
            progress_.clear(source);
        }

        bool ready = false;
        if (record)
        {
            context.record = *record;
            ready = resume(context, report);
            if (!ready && report.state != TransferState::Aborted)
            {
                // The server no longer knows the session.
                progress_.clear(source);
                ready = start_fresh(context, report);
            }
        }
        else
        {
            ready = start_fresh(context, report);
        }
        if (!ready)
        {
            return report;
        }

        report.session_id = context.record.session_id;
        report.total_chunks = total_chunks(context.file_size, context.record.chunk_size);
        report.previously_accepted = context.accepted.size();

        if (!transfer(context, report))
        {
            return report;
        }
        finish(context, report);
        return report;
    }

    bool TransferController::start_fresh(RunContext &context, TransferReport &report)
    {
        report.state = TransferState::Fresh;
        report.resumed = false;
        const auto filename = context.source.filename().string();
        try
        {
            const auto response = transport_.initiate(chunkvault::protocol::InitiateRequest{.filename = filename});
            if (response.session_id.empty() || response.chunk_size == 0)
            {
                report.state = TransferState::Aborted;
                report.detail = "server announced an invalid session";
                logger_.error("transfer", report.detail);
                return false;
            }
            context.record = ProgressRecord{
                .session_id = response.session_id,
                .chunk_size = response.chunk_size,
                .file_size = context.file_size,
                .filename = filename,
                .file_checksum = context.checksum,
                .chunks_accepted = 0,
            };
        }
        catch (const std::runtime_error &ex)
        {
            // TransportError and RemoteError alike: nothing was created locally.
            report.state = TransferState::Aborted;
            report.detail = std::string("initiate failed: ") + ex.what();
            logger_.error("transfer", report.detail);
            return false;
        }
        context.accepted.clear();
        progress_.persist(context.source, context.record);
        logger_.info("transfer", "initiated session ", context.record.session_id, " chunk_size=",
                     context.record.chunk_size);
        return true;
    }

    bool TransferController::resume(RunContext &context, TransferReport &report)
    {
        report.state = TransferState::Resumed;
        report.resumed = true;
        try
        {
            const auto response = transport_.query_accepted(
                chunkvault::protocol::QueryAcceptedRequest{.session_id = context.record.session_id});
            context.accepted.clear();
            const auto total = total_chunks(context.file_size, context.record.chunk_size);
            for (const auto index : response.indices)
            {
                if (index < total)
                {
                    context.accepted.insert(index);
                }
            }
            logger_.info("transfer", "resuming session ", context.record.session_id, ": server holds ",
                         context.accepted.size(), " chunk(s), local record noted ", context.record.chunks_accepted);
            return true;
        }
        catch (const RemoteError &ex)
        {
            if (ex.code() == chunkvault::ErrorCode::NotFound)
            {
                logger_.warn("transfer", "session ", context.record.session_id, " unknown to server, starting over");
                report.resumed = false;
                return false;
            }
            report.state = TransferState::Aborted;
            report.detail = std::string("status query rejected: ") + ex.what();
        }
        catch (const TransportError &ex)
        {
            report.state = TransferState::Aborted;
            report.detail = std::string("status query failed: ") + ex.what();
        }
        logger_.error("transfer", report.detail);
        return false;
    }

    bool TransferController::transfer(RunContext &context, TransferReport &report)
    {
        report.state = TransferState::Transferring;
        if (on_progress_)
        {
            on_progress_(context.accepted.size(), report.total_chunks);
        }

        std::ifstream in(context.source, std::ios::binary);
        if (!in.is_open())
        {
            throw LocalIoError("Cannot open " + context.source.string() + " for reading");
        }

        for (std::uint64_t index = 0; index < report.total_chunks; ++index)
        {
            if (context.accepted.contains(index))
            {
                continue;
            }
            if (options_.max_new_chunks && report.chunks_sent >= *options_.max_new_chunks)
            {
                report.state = TransferState::Aborted;
                report.detail = "stopped after " + std::to_string(report.chunks_sent) + " new chunk(s)";
                logger_.info("transfer", report.detail);
                return false;
            }

            auto result = uploader_.upload(context.record.session_id, index, read_chunk(in, context, index));
            if (result.outcome != ChunkOutcome::Accepted)
            {
                report.state = TransferState::Aborted;
                report.detail = "chunk " + std::to_string(index) + " failed after " + std::to_string(result.attempts) +
                                " attempt(s): " + result.last_error;
                logger_.error("transfer", report.detail);
                return false;
            }

            context.accepted.insert(index);
            ++report.chunks_sent;
            context.record.chunks_accepted = context.accepted.size();
            progress_.persist(context.source, context.record);
            if (on_progress_)
            {
                on_progress_(context.accepted.size(), report.total_chunks);
            }
        }
        return true;
    }

    void TransferController::finish(RunContext &context, TransferReport &report)
    {
        report.state = TransferState::Completing;
        chunkvault::protocol::CompleteResponse response;
        try
        {
            response = transport_.complete(chunkvault::protocol::CompleteRequest{
                .session_id = context.record.session_id,
                .total_chunks = report.total_chunks,
            });
        }
        catch (const std::runtime_error &ex)
        {
            report.state = TransferState::Transferring;
            report.detail = std::string("completion failed: ") + ex.what();
            logger_.error("transfer", report.detail);
            return;
        }

        if (response.size != context.file_size ||
            (!response.content_hash.empty() && response.content_hash != context.checksum))
        {
            // Completing the same session again would repeat this artifact, so
            // the next run starts a new one.
            progress_.clear(context.source);
            report.state = TransferState::Transferring;
            report.detail = "assembled artifact " + response.final_path + " does not match the source";
            logger_.error("transfer", report.detail);
            return;
        }

        progress_.clear(context.source);
        report.artifact = response;
        report.state = TransferState::Done;
        logger_.info("transfer", "session ", context.record.session_id, " complete: ", response.final_path);
    }

    std::vector<std::uint8_t> TransferController::read_chunk(std::ifstream &in, const RunContext &context,
                                                             std::uint64_t index) const
    {
        const auto range = chunk_range(index, context.file_size, context.record.chunk_size);
        std::vector<std::uint8_t> data(static_cast<std::size_t>(range.length));
        in.clear();
        in.seekg(static_cast<std::streamoff>(range.offset));
        in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (static_cast<std::uint64_t>(in.gcount()) != range.length)
        {
            throw LocalIoError("Short read of chunk " + std::to_string(index) + " from " + context.source.string());
        }
        return data;
    }

} // namespace chunkvault::client
