/**
 * ChunkVault - Length-prefixed CBOR framing helpers.
 *
 * A frame is a 4-byte big-endian payload length followed by the CBOR
 * encoding of one JSON envelope. Binary fields travel as CBOR byte strings.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkvault::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    inline constexpr std::uint32_t kMaxFramePayload = 64u * 1024u * 1024u;

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Throws std::length_error when the announced length exceeds kMaxFramePayload.
    std::uint32_t decode_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header);

    nlohmann::json decode_frame_payload(std::span<const std::uint8_t> payload);

} // namespace chunkvault::protocol
