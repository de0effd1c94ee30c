#include "chunkvault/client/chunk_uploader.hpp"

#include <span>

#include "chunkvault/crypto.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::client
{

    ChunkUploader::ChunkUploader(UploadTransport &transport, RetryPolicy policy, Sleeper &sleeper, Logger &logger)
        : transport_(transport), policy_(std::move(policy)), sleeper_(sleeper), logger_(logger) {}

    ChunkResult ChunkUploader::upload(const std::string &session_id, std::uint64_t index, std::vector<std::uint8_t> data)
    {
        chunkvault::protocol::PutChunkRequest request{
            .session_id = session_id,
            .index = index,
            .data = std::move(data),
        };
        request.chunk_hash = crypto::hash_bytes(std::as_bytes(std::span(request.data)));

        ChunkResult result;
        for (std::size_t attempt = 1; attempt <= policy_.max_attempts(); ++attempt)
        {
            result.attempts = attempt;
            try
            {
                const auto response = transport_.put_chunk(request);
                if (response.index != index)
                {
                    throw TransportError("Server acknowledged chunk " + std::to_string(response.index) +
                                         " instead of " + std::to_string(index));
                }
                result.outcome = ChunkOutcome::Accepted;
                result.last_error.clear();
                return result;
            }
            catch (const RemoteError &ex)
            {
                logger_.error("chunk", "chunk ", index, " rejected: ", ex.what());
                result.remote_error = ex.code();
                result.last_error = ex.what();
                return result;
            }
            catch (const TransportError &ex)
            {
                result.last_error = ex.what();
                if (!policy_.should_retry(attempt))
                {
                    logger_.error("chunk", "chunk ", index, " attempt ", attempt, " failed: ", ex.what(),
                                  "; giving up");
                    break;
                }
                const auto delay = policy_.backoff_after(attempt);
                logger_.warn("chunk", "chunk ", index, " attempt ", attempt, " failed: ", ex.what(), "; retrying in ",
                             delay.count(), "ms");
                sleeper_.sleep_for(delay);
            }
        }
        result.outcome = ChunkOutcome::Failed;
        return result;
    }

} // namespace chunkvault::client
