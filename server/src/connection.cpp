#include "chunkvault/server/connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <span>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    Connection::Connection(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services)
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        endpoint_label_ = ec ? std::string("unknown") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Connection::~Connection()
    {
        spdlog::debug("Connection {} released", endpoint_label_);
    }

    void Connection::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Connection::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size{};
                             try
                             {
                                 payload_size = chunkvault::protocol::decode_frame_length(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const auto json = chunkvault::protocol::decode_frame_payload(buffer_);
                                 process_message(json);
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(chunkvault::ErrorCode::InvalidPayload, ex.what());
                             }
                             buffer_.clear();
                             buffer_.shrink_to_fit();
                             read_frame_header();
                         });
    }

    void Connection::process_message(const nlohmann::json &json)
    {
        chunkvault::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkvault::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), chunkvault::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case chunkvault::protocol::Command::Initiate:
            handle_initiate(envelope);
            break;
        case chunkvault::protocol::Command::QueryAccepted:
            handle_query_accepted(envelope);
            break;
        case chunkvault::protocol::Command::PutChunk:
            handle_put_chunk(envelope);
            break;
        case chunkvault::protocol::Command::Complete:
            handle_complete(envelope);
            break;
        case chunkvault::protocol::Command::Ping:
            send_ok(nlohmann::json::object(), envelope.request_id);
            break;
        default:
            send_error(chunkvault::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Connection::send_response(const chunkvault::protocol::ResponseEnvelope &envelope)
    {
        if (closed_)
        {
            return;
        }
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(
                chunkvault::protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                              }
                          });
    }

    void Connection::send_ok(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        chunkvault::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkvault::protocol::ResponseKind::Ok;
        envelope.error = chunkvault::ErrorCode::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        send_response(envelope);
    }

    void Connection::send_error(chunkvault::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        spdlog::warn("{} <- {}: {}", remote_endpoint(), chunkvault::to_string(code), message);
        chunkvault::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkvault::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    std::string Connection::remote_endpoint() const
    {
        return endpoint_label_;
    }

} // namespace chunkvault::server
