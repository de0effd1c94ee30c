/**
 * ChunkVault - Chunk arithmetic shared by the uploader and the assembler.
 */
#pragma once

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace chunkvault
{

    struct ChunkRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    // ceil(file_size / chunk_size), never less than one: an empty file still
    // travels as a single empty chunk.
    constexpr std::uint64_t total_chunks(std::uint64_t file_size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        const auto count = file_size / chunk_size + (file_size % chunk_size == 0 ? 0 : 1);
        return std::max<std::uint64_t>(count, 1);
    }

    constexpr ChunkRange chunk_range(std::uint64_t index, std::uint64_t file_size, std::uint64_t chunk_size)
    {
        const auto offset = std::min(file_size, index * chunk_size);
        const auto end = std::min(file_size, offset + chunk_size);
        return ChunkRange{.offset = offset, .length = end - offset};
    }

} // namespace chunkvault
