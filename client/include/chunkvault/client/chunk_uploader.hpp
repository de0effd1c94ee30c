#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/retry_policy.hpp"
#include "chunkvault/client/transport.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::client
{

    enum class ChunkOutcome : std::uint8_t
    {
        Accepted,
        Failed
    };

    struct ChunkResult
    {
        ChunkOutcome outcome{ChunkOutcome::Failed};
        std::size_t attempts{};
        // Set when the server rejected the chunk outright.
        std::optional<chunkvault::ErrorCode> remote_error{};
        std::string last_error{};
    };

    // Delivers one chunk, retrying transport failures per the RetryPolicy.
    // Knows nothing about sessions beyond the id it is handed.
    class ChunkUploader
    {
    public:
        ChunkUploader(UploadTransport &transport, RetryPolicy policy, Sleeper &sleeper, Logger &logger);

        ChunkResult upload(const std::string &session_id, std::uint64_t index, std::vector<std::uint8_t> data);

    private:
        UploadTransport &transport_;
        RetryPolicy policy_;
        Sleeper &sleeper_;
        Logger &logger_;
    };

} // namespace chunkvault::client
