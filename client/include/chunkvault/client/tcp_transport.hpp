#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/transport.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::client
{

    // Blocking request/response over one TCP connection. Each request has its
    // own deadline, name resolution included; on any failure the connection is
    // dropped and reopened by the next request. Completion gets a separate,
    // longer deadline because the server assembles the whole file before it
    // answers.
    class TcpTransport : public UploadTransport
    {
    public:
        TcpTransport(std::string host, std::uint16_t port, std::chrono::milliseconds timeout,
                     std::chrono::milliseconds completion_timeout, Logger &logger);

        chunkvault::protocol::InitiateResponse initiate(const chunkvault::protocol::InitiateRequest &request) override;

        chunkvault::protocol::QueryAcceptedResponse query_accepted(
            const chunkvault::protocol::QueryAcceptedRequest &request) override;

        chunkvault::protocol::PutChunkResponse put_chunk(const chunkvault::protocol::PutChunkRequest &request) override;

        chunkvault::protocol::CompleteResponse complete(const chunkvault::protocol::CompleteRequest &request) override;

        void ping();

    private:
        using Deadline = std::chrono::steady_clock::time_point;

        template <typename Response>
        Response call(chunkvault::protocol::Command command, const nlohmann::json &payload,
                      std::chrono::milliseconds timeout);

        chunkvault::protocol::ResponseEnvelope rpc(chunkvault::protocol::Command command, const nlohmann::json &payload,
                                                   std::chrono::milliseconds timeout);

        void connect(Deadline deadline);
        bool wait_for(const std::error_code &pending, Deadline deadline);
        void abandon(const std::error_code &pending);
        void write_all(const std::vector<std::uint8_t> &frame, Deadline deadline);
        void read_exact(void *data, std::size_t size, Deadline deadline);
        void reset_connection();
        std::string next_request_id();

        std::string host_;
        std::uint16_t port_;
        std::chrono::milliseconds timeout_;
        std::chrono::milliseconds completion_timeout_;
        Logger &logger_;

        asio::io_context io_context_;
        asio::ip::tcp::resolver resolver_;
        asio::ip::tcp::socket socket_;
        bool connected_{false};
        std::uint64_t request_counter_{0};
    };

} // namespace chunkvault::client
