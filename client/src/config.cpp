#include "chunkvault/client/config.hpp"

#include <sstream>
#include <string>

namespace chunkvault::client
{

    namespace
    {

        std::uint64_t parse_unsigned(const std::string &flag, const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    throw UsageError(flag + " expects a non-negative integer, got '" + value + "'");
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw UsageError(flag + " expects a non-negative integer, got '" + value + "'");
            }
        }

        std::chrono::seconds parse_seconds(const std::string &flag, const std::string &value)
        {
            const auto seconds = parse_unsigned(flag, value);
            if (seconds > kMaxDurationSeconds)
            {
                throw UsageError(flag + " must not exceed " + std::to_string(kMaxDurationSeconds) + " seconds");
            }
            return std::chrono::seconds{static_cast<std::chrono::seconds::rep>(seconds)};
        }

        std::chrono::seconds parse_positive_seconds(const std::string &flag, const std::string &value)
        {
            const auto seconds = parse_seconds(flag, value);
            if (seconds.count() == 0)
            {
                throw UsageError(flag + " must be positive");
            }
            return seconds;
        }

        std::vector<std::chrono::milliseconds> parse_schedule(const std::string &value)
        {
            std::vector<std::chrono::milliseconds> schedule;
            std::istringstream iss(value);
            std::string item;
            while (std::getline(iss, item, ','))
            {
                schedule.emplace_back(parse_seconds("--retry-schedule", item));
            }
            if (schedule.empty())
            {
                throw UsageError("--retry-schedule needs at least one delay");
            }
            return schedule;
        }

    } // namespace

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " <file> <host>:<port> [--max-chunks <N>] [--log <file>] [--timeout <seconds>]"
               " [--complete-timeout <seconds>] [--retry-schedule <s1,s2,...>]";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw UsageError("Expected a source file and a server endpoint");
        }

        ClientConfig config;
        int index = 1;
        config.source = std::filesystem::path(argv[index++]);

        const std::string endpoint = argv[index++];
        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw UsageError("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port = parse_unsigned("port", endpoint.substr(colon_pos + 1));
        if (port == 0 || port > 65535)
        {
            throw UsageError("Port must be between 1 and 65535");
        }
        config.port = static_cast<std::uint16_t>(port);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (index >= argc)
            {
                throw UsageError(arg == "--max-chunks" || arg == "--log" || arg == "--timeout" ||
                                         arg == "--complete-timeout" || arg == "--retry-schedule"
                                     ? arg + " requires a value"
                                     : "Unknown argument: " + arg);
            }
            const std::string value = argv[index++];
            if (arg == "--max-chunks")
            {
                config.max_chunks = parse_unsigned(arg, value);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(value);
            }
            else if (arg == "--timeout")
            {
                config.request_timeout = parse_positive_seconds(arg, value);
            }
            else if (arg == "--complete-timeout")
            {
                config.completion_timeout = parse_positive_seconds(arg, value);
            }
            else if (arg == "--retry-schedule")
            {
                config.retry_schedule = parse_schedule(value);
            }
            else
            {
                throw UsageError("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace chunkvault::client
