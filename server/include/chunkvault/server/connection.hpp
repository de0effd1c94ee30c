#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"
#include "chunkvault/framing.hpp"
#include "chunkvault/protocol.hpp"
#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    struct ServerServices
    {
        UploadSessionRegistry &registry;
    };

    // One client connection: reads framed requests, answers each before
    // reading the next.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, ServerServices services);
        ~Connection();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const chunkvault::protocol::ResponseEnvelope &envelope);
        void send_ok(nlohmann::json payload, const std::optional<std::string> &request_id);
        void send_error(chunkvault::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);

        void handle_initiate(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_query_accepted(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_put_chunk(const chunkvault::protocol::RequestEnvelope &envelope);
        void handle_complete(const chunkvault::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string endpoint_label_;
        bool closed_{false};

        std::array<std::uint8_t, chunkvault::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
    };

} // namespace chunkvault::server
