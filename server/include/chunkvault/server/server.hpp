#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <thread>
#include <vector>

#include "chunkvault/server/assembler.hpp"
#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/config.hpp"
#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        // Safe to call from any thread.
        void stop();

        // Actual bound port; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        ChunkStore chunk_store_;
        Assembler assembler_;
        UploadSessionRegistry registry_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkvault::server
