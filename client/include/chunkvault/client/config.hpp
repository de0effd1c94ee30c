#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkvault::client
{

    class UsageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ClientConfig
    {
        std::filesystem::path source;
        std::string host;
        std::uint16_t port{};
        std::optional<std::uint64_t> max_chunks;
        std::optional<std::filesystem::path> log_path;
        std::chrono::milliseconds request_timeout{std::chrono::seconds{60}};
        std::chrono::milliseconds completion_timeout{std::chrono::seconds{3600}};
        std::vector<std::chrono::milliseconds> retry_schedule{
            std::chrono::seconds{1}, std::chrono::seconds{2}, std::chrono::seconds{5}, std::chrono::seconds{10}};
    };

    // Upper bound for every duration flag.
    inline constexpr std::uint64_t kMaxDurationSeconds = 86400;

    // Throws UsageError on malformed or missing arguments.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace chunkvault::client
