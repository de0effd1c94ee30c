#include "chunkvault/client/tcp_transport.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <memory>
#include <span>
#include <sstream>
#include <vector>

#include "chunkvault/error_codes.hpp"
#include "chunkvault/framing.hpp"

namespace chunkvault::client
{

    RemoteError::RemoteError(chunkvault::ErrorCode code, const std::string &message)
        : std::runtime_error(std::string(chunkvault::to_string(code)) + ": " + message), code_(code) {}

    namespace
    {
        struct ResolveState
        {
            std::error_code error = asio::error::would_block;
            asio::ip::tcp::resolver::results_type endpoints;
        };
    } // namespace

    TcpTransport::TcpTransport(std::string host, std::uint16_t port, std::chrono::milliseconds timeout,
                               std::chrono::milliseconds completion_timeout, Logger &logger)
        : host_(std::move(host)), port_(port), timeout_(timeout), completion_timeout_(completion_timeout),
          logger_(logger), resolver_(io_context_), socket_(io_context_) {}

    template <typename Response>
    Response TcpTransport::call(chunkvault::protocol::Command command, const nlohmann::json &payload,
                                std::chrono::milliseconds timeout)
    {
        const auto response = rpc(command, payload, timeout);
        try
        {
            return response.payload.get<Response>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.error("rpc", "malformed ", chunkvault::protocol::to_string(command), " response: ", ex.what());
            throw TransportError("Malformed server response");
        }
    }

    chunkvault::protocol::InitiateResponse TcpTransport::initiate(const chunkvault::protocol::InitiateRequest &request)
    {
        return call<chunkvault::protocol::InitiateResponse>(chunkvault::protocol::Command::Initiate, request, timeout_);
    }

    chunkvault::protocol::QueryAcceptedResponse TcpTransport::query_accepted(
        const chunkvault::protocol::QueryAcceptedRequest &request)
    {
        return call<chunkvault::protocol::QueryAcceptedResponse>(chunkvault::protocol::Command::QueryAccepted, request, timeout_);
    }

    chunkvault::protocol::PutChunkResponse TcpTransport::put_chunk(const chunkvault::protocol::PutChunkRequest &request)
    {
        return call<chunkvault::protocol::PutChunkResponse>(chunkvault::protocol::Command::PutChunk, request, timeout_);
    }

    chunkvault::protocol::CompleteResponse TcpTransport::complete(const chunkvault::protocol::CompleteRequest &request)
    {
        return call<chunkvault::protocol::CompleteResponse>(chunkvault::protocol::Command::Complete, request,
                                                             completion_timeout_);
    }

    void TcpTransport::ping()
    {
        (void)rpc(chunkvault::protocol::Command::Ping, nlohmann::json::object(), timeout_);
    }

    chunkvault::protocol::ResponseEnvelope TcpTransport::rpc(chunkvault::protocol::Command command,
                                                             const nlohmann::json &payload,
                                                             std::chrono::milliseconds timeout)
    {
        const Deadline deadline = std::chrono::steady_clock::now() + timeout;

        chunkvault::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        chunkvault::protocol::ResponseEnvelope response;
        try
        {
            if (!connected_)
            {
                connect(deadline);
            }
            write_all(chunkvault::protocol::encode_frame(nlohmann::json(envelope)), deadline);

            std::array<std::uint8_t, chunkvault::protocol::kFrameHeaderSize> header{};
            read_exact(header.data(), header.size(), deadline);
            std::vector<std::uint8_t> buffer(chunkvault::protocol::decode_frame_length(header));
            read_exact(buffer.data(), buffer.size(), deadline);
            response = chunkvault::protocol::decode_frame_payload(buffer).get<chunkvault::protocol::ResponseEnvelope>();
        }
        catch (const TransportError &)
        {
            reset_connection();
            throw;
        }
        catch (const std::system_error &ex)
        {
            reset_connection();
            logger_.warn("rpc", chunkvault::protocol::to_string(command), " failed: ", ex.what());
            throw TransportError(ex.what());
        }
        catch (const std::exception &ex)
        {
            // Undecodable frames leave the stream position unknown.
            reset_connection();
            logger_.warn("rpc", "bad response to ", chunkvault::protocol::to_string(command), ": ", ex.what());
            throw TransportError(std::string("Failed to decode server response: ") + ex.what());
        }

        if (response.request_id != envelope.request_id)
        {
            reset_connection();
            throw TransportError("Response does not match request " + *envelope.request_id);
        }
        if (response.kind == chunkvault::protocol::ResponseKind::Error)
        {
            logger_.warn("rpc", chunkvault::protocol::to_string(command), " error=", chunkvault::to_string(response.error),
                         " msg=", response.message);
            if (chunkvault::is_transient(response.error))
            {
                throw TransportError("Server error: " + response.message);
            }
            throw RemoteError(response.error, response.message);
        }
        logger_.info("rpc", "success cmd=", chunkvault::protocol::to_string(command));
        return response;
    }

    void TcpTransport::connect(Deadline deadline)
    {
        // The resolver may outlive this call when it times out, so its handler
        // owns the state it writes to.
        auto resolved = std::make_shared<ResolveState>();
        resolver_.async_resolve(host_, std::to_string(port_),
                                [resolved](const std::error_code &ec, asio::ip::tcp::resolver::results_type results)
                                {
                                    resolved->error = ec;
                                    resolved->endpoints = std::move(results);
                                });
        if (!wait_for(resolved->error, deadline))
        {
            resolver_.cancel();
            throw TransportError("Timed out resolving " + host_);
        }
        if (resolved->error)
        {
            throw TransportError("Cannot resolve " + host_ + ": " + resolved->error.message());
        }

        std::error_code error = asio::error::would_block;
        asio::async_connect(socket_, resolved->endpoints,
                            [&error](const std::error_code &ec, const asio::ip::tcp::endpoint & /*endpoint*/)
                            { error = ec; });
        if (!wait_for(error, deadline))
        {
            abandon(error);
            throw TransportError("Timed out connecting to " + host_ + ":" + std::to_string(port_));
        }
        if (error)
        {
            throw TransportError("Cannot connect to " + host_ + ":" + std::to_string(port_) + ": " + error.message());
        }
        connected_ = true;
        logger_.info("rpc", "connected to ", host_, ':', port_);
    }

    bool TcpTransport::wait_for(const std::error_code &pending, Deadline deadline)
    {
        io_context_.restart();
        while (pending == asio::error::would_block && std::chrono::steady_clock::now() < deadline)
        {
            io_context_.run_one_until(deadline);
            if (io_context_.stopped())
            {
                break;
            }
        }
        return pending != asio::error::would_block;
    }

    void TcpTransport::abandon(const std::error_code &pending)
    {
        // Closing the socket completes its pending operation with
        // operation_aborted; its handler must run before the caller's frame goes.
        std::error_code ignored;
        socket_.close(ignored);
        io_context_.restart();
        while (pending == asio::error::would_block && io_context_.run_one() > 0)
        {
        }
    }

    void TcpTransport::write_all(const std::vector<std::uint8_t> &frame, Deadline deadline)
    {
        std::error_code error = asio::error::would_block;
        asio::async_write(socket_, asio::buffer(frame),
                          [&error](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          { error = ec; });
        if (!wait_for(error, deadline))
        {
            abandon(error);
            throw TransportError("Request timed out");
        }
        if (error)
        {
            throw TransportError("Send failed: " + error.message());
        }
    }

    void TcpTransport::read_exact(void *data, std::size_t size, Deadline deadline)
    {
        std::error_code error = asio::error::would_block;
        asio::async_read(socket_, asio::buffer(data, size),
                         [&error](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         { error = ec; });
        if (!wait_for(error, deadline))
        {
            abandon(error);
            throw TransportError("Request timed out");
        }
        if (error)
        {
            throw TransportError("Receive failed: " + error.message());
        }
    }

    void TcpTransport::reset_connection()
    {
        std::error_code ignored;
        socket_.close(ignored);
        connected_ = false;
    }

    std::string TcpTransport::next_request_id()
    {
        std::ostringstream oss;
        oss << "req-" << (++request_counter_);
        return oss.str();
    }

} // namespace chunkvault::client
