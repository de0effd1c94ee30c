/**
 * ChunkVault - Shared error codes carried in response envelopes.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        Conflict = 4,
        AssemblyIncomplete = 5,
        Unsupported = 6,
        Timeout = 7,
        IoError = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Server-side failures a client may retry: the request itself was valid.
    constexpr bool is_transient(ErrorCode code) noexcept
    {
        return code == ErrorCode::Timeout || code == ErrorCode::IoError || code == ErrorCode::InternalError;
    }

} // namespace chunkvault
