#include "chunkvault/framing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace chunkvault::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        void check_length(std::size_t length)
        {
            if (length > kMaxFramePayload)
            {
                throw std::length_error("Frame payload of " + std::to_string(length) + " bytes exceeds limit");
            }
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto payload = nlohmann::json::to_cbor(message);
        check_length(payload.size());
        std::vector<std::uint8_t> frame(kFrameHeaderSize + payload.size());
        write_u32_be(static_cast<std::uint32_t>(payload.size()),
                     std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(payload.begin(), payload.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::uint32_t decode_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header)
    {
        const auto length = read_u32_be(header);
        check_length(length);
        return length;
    }

    nlohmann::json decode_frame_payload(std::span<const std::uint8_t> payload)
    {
        return nlohmann::json::from_cbor(payload.begin(), payload.end());
    }

} // namespace chunkvault::protocol
