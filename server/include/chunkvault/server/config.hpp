#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkvault::server
{

    inline constexpr std::uint64_t kDefaultChunkSize = 10ULL * 1024 * 1024;

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace chunkvault::server
