#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include "chunkvault/client/chunk_uploader.hpp"
#include "chunkvault/client/config.hpp"
#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/progress_store.hpp"
#include "chunkvault/client/retry_policy.hpp"
#include "chunkvault/client/tcp_transport.hpp"
#include "chunkvault/client/transfer_controller.hpp"
#include "chunkvault/version.hpp"

namespace
{

    constexpr int kExitDone = 0;
    constexpr int kExitIncomplete = 1;
    constexpr int kExitUsage = 2;

    void print_report(const chunkvault::client::TransferReport &report)
    {
        using chunkvault::client::TransferState;

        std::cout << std::endl;
        if (report.state == TransferState::Done && report.artifact)
        {
            std::cout << "Upload complete: " << report.artifact->final_path << " (" << report.artifact->size
                      << " bytes, " << report.total_chunks << " chunk(s), " << report.chunks_sent << " sent this run)"
                      << std::endl;
            return;
        }
        std::cout << "Upload incomplete (" << chunkvault::client::to_string(report.state) << "): "
                  << report.previously_accepted + report.chunks_sent << " / " << report.total_chunks
                  << " chunk(s) accepted";
        if (!report.detail.empty())
        {
            std::cout << " - " << report.detail;
        }
        std::cout << "\nRun the same command again to resume." << std::endl;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace chunkvault::client;

    if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h"))
    {
        std::cout << "ChunkVault uploader " << chunkvault::version() << "\n" << usage(argv[0]) << std::endl;
        return kExitDone;
    }

    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);

        TcpTransport transport(config.host, config.port, config.request_timeout, config.completion_timeout, logger);
        ThreadSleeper sleeper;
        ChunkUploader uploader(transport, RetryPolicy(config.retry_schedule), sleeper, logger);
        ProgressStore progress(logger);

        TransferController controller(transport, uploader, progress, logger,
                                      TransferOptions{.max_new_chunks = config.max_chunks});
        controller.set_progress_callback([](std::uint64_t accepted, std::uint64_t total)
                                         { std::cout << "\rUploaded chunks " << accepted << " / " << total
                                                     << std::flush; });

        const auto report = controller.run(config.source);
        print_report(report);
        return report.state == TransferState::Done ? kExitDone : kExitIncomplete;
    }
    catch (const UsageError &ex)
    {
        std::cerr << "ERROR: " << ex.what() << "\n" << usage(argv[0]) << std::endl;
        return kExitUsage;
    }
    catch (const LocalIoError &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return kExitUsage;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return kExitIncomplete;
    }
}
