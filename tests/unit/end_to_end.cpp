#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "chunkvault/client/chunk_uploader.hpp"
#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/progress_store.hpp"
#include "chunkvault/client/retry_policy.hpp"
#include "chunkvault/client/tcp_transport.hpp"
#include "chunkvault/client/transfer_controller.hpp"
#include "chunkvault/crypto.hpp"
#include "chunkvault/server/server.hpp"

using namespace chunkvault;
using namespace chunkvault::client;
using namespace std::chrono_literals;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    class NoSleep : public Sleeper
    {
    public:
        void sleep_for(std::chrono::milliseconds /*delay*/) override {}
    };

    // Runs a server on an ephemeral loopback port for the lifetime of the object.
    class RunningServer
    {
    public:
        explicit RunningServer(const std::filesystem::path &root)
            : server_(server::ServerConfig{
                  .address = "127.0.0.1",
                  .port = 0,
                  .root = root,
                  .worker_threads = 2,
                  .chunk_size = 1000,
              }),
              thread_([this]
                      { server_.run(); })
        {
        }

        ~RunningServer()
        {
            server_.stop();
            thread_.join();
        }

        std::uint16_t port() const { return server_.port(); }

    private:
        server::Server server_;
        std::thread thread_;
    };

    void test_upload_over_tcp()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_e2e";
        cleanup_path(root);
        std::filesystem::create_directories(root / "client");

        const auto source = root / "client" / "flight.log";
        {
            std::ofstream out(source, std::ios::binary);
            for (int i = 0; i < 4500; ++i)
            {
                out.put(static_cast<char>(i * 7));
            }
        }
        const auto checksum = crypto::hash_file(source);

        RunningServer running(root / "server");
        Logger logger(std::nullopt);
        TcpTransport transport("127.0.0.1", running.port(), 5s, 30s, logger);
        transport.ping();

        NoSleep sleeper;
        ChunkUploader uploader(transport, RetryPolicy::standard(), sleeper, logger);
        ProgressStore progress(logger);

        TransferController bounded(transport, uploader, progress, logger, TransferOptions{.max_new_chunks = 3});
        const auto first = bounded.run(source);
        assert(first.state == TransferState::Aborted);
        assert(first.total_chunks == 5);
        assert(first.chunks_sent == 3);

        const auto accepted = transport.query_accepted(protocol::QueryAcceptedRequest{.session_id = first.session_id});
        assert((accepted.indices == std::vector<std::uint64_t>{0, 1, 2}));

        TransferController controller(transport, uploader, progress, logger);
        const auto second = controller.run(source);
        assert(second.state == TransferState::Done);
        assert(second.resumed);
        assert(second.chunks_sent == 2);
        assert(second.artifact.has_value());
        assert(second.artifact->size == 4500);
        assert(second.artifact->content_hash == checksum);
        assert(crypto::hash_file(second.artifact->final_path) == checksum);
        assert(!std::filesystem::exists(ProgressStore::record_path(source)));

        // A completed session keeps answering with its final state.
        const auto after = transport.query_accepted(protocol::QueryAcceptedRequest{.session_id = first.session_id});
        assert((after.indices == std::vector<std::uint64_t>{0, 1, 2, 3, 4}));
        const auto repeated = transport.complete(protocol::CompleteRequest{.session_id = first.session_id, .total_chunks = 5});
        assert(repeated.final_path == second.artifact->final_path);
        assert(repeated.content_hash == checksum);

        bool conflict = false;
        try
        {
            (void)transport.put_chunk(protocol::PutChunkRequest{.session_id = first.session_id, .index = 0, .data = {1}});
        }
        catch (const RemoteError &ex)
        {
            conflict = ex.code() == ErrorCode::Conflict;
        }
        assert(conflict);

        // Rejections do not poison the connection.
        transport.ping();

        bool incomplete = false;
        const auto session = transport.initiate(protocol::InitiateRequest{.filename = "partial.bin"});
        try
        {
            (void)transport.complete(protocol::CompleteRequest{.session_id = session.session_id, .total_chunks = 2});
        }
        catch (const RemoteError &ex)
        {
            incomplete = ex.code() == ErrorCode::AssemblyIncomplete;
        }
        assert(incomplete);
    }

    void test_silent_server_times_out()
    {
        // Connections land in the listen backlog but are never answered.
        asio::io_context io_context;
        asio::ip::tcp::acceptor acceptor(io_context,
                                         asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        Logger logger(std::nullopt);
        TcpTransport transport("127.0.0.1", acceptor.local_endpoint().port(), 200ms, 200ms, logger);

        const auto started = std::chrono::steady_clock::now();
        bool timed_out = false;
        try
        {
            transport.ping();
        }
        catch (const TransportError &)
        {
            timed_out = true;
        }
        assert(timed_out);
        assert(std::chrono::steady_clock::now() - started < 5s);
    }

    void test_unreachable_server()
    {
        std::uint16_t closed_port = 0;
        {
            asio::io_context io_context;
            asio::ip::tcp::acceptor acceptor(io_context,
                                             asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
            closed_port = acceptor.local_endpoint().port();
        }
        Logger logger(std::nullopt);
        TcpTransport transport("127.0.0.1", closed_port, 1s, 1s, logger);
        bool failed = false;
        try
        {
            transport.ping();
        }
        catch (const TransportError &)
        {
            failed = true;
        }
        assert(failed);
    }

    void test_host_names_resolve_within_deadline()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_e2e_resolve";
        cleanup_path(root);
        {
            RunningServer running(root / "server");
            Logger logger(std::nullopt);
            TcpTransport by_name("localhost", running.port(), 5s, 5s, logger);
            by_name.ping();
            const auto session = by_name.initiate(protocol::InitiateRequest{.filename = "named.bin"});
            assert(!session.session_id.empty());
        }
        cleanup_path(root);

        Logger logger(std::nullopt);
        TcpTransport transport("chunkvault-upload.invalid", 9, 500ms, 500ms, logger);
        const auto started = std::chrono::steady_clock::now();
        bool failed = false;
        try
        {
            transport.ping();
        }
        catch (const TransportError &)
        {
            failed = true;
        }
        assert(failed);
        assert(std::chrono::steady_clock::now() - started < 3s);
    }

} // namespace

void run_end_to_end_tests()
{
    test_upload_over_tcp();
    test_silent_server_times_out();
    test_unreachable_server();
    test_host_names_resolve_within_deadline();
    cleanup_path(std::filesystem::temp_directory_path() / "chunkvault_e2e");
    std::cout << "End-to-end tests passed\n";
}
