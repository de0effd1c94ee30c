#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkvault/error_codes.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::client
{

    // Connection, timeout or server-side failure; the request may be repeated.
    class TransportError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The server rejected the request; repeating it will not help.
    class RemoteError : public std::runtime_error
    {
    public:
        RemoteError(chunkvault::ErrorCode code, const std::string &message);

        chunkvault::ErrorCode code() const noexcept { return code_; }

    private:
        chunkvault::ErrorCode code_;
    };

    // Client view of the four upload endpoints.
    class UploadTransport
    {
    public:
        virtual ~UploadTransport() = default;

        virtual chunkvault::protocol::InitiateResponse initiate(const chunkvault::protocol::InitiateRequest &request) = 0;

        virtual chunkvault::protocol::QueryAcceptedResponse query_accepted(
            const chunkvault::protocol::QueryAcceptedRequest &request) = 0;

        virtual chunkvault::protocol::PutChunkResponse put_chunk(const chunkvault::protocol::PutChunkRequest &request) = 0;

        virtual chunkvault::protocol::CompleteResponse complete(const chunkvault::protocol::CompleteRequest &request) = 0;
    };

} // namespace chunkvault::client
