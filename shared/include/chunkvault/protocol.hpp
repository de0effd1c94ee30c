/**
 * ChunkVault - Shared protocol schema and serialization helpers.
 *
 * Every command has a dedicated request and response struct; the envelope
 * payload is always one of them.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::protocol
{

    enum class Command : std::uint8_t
    {
        Initiate,
        QueryAccepted,
        PutChunk,
        Complete,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct InitiateRequest
    {
        std::string filename;
    };

    void to_json(nlohmann::json &json, const InitiateRequest &request);
    void from_json(const nlohmann::json &json, InitiateRequest &request);

    struct InitiateResponse
    {
        std::string session_id;
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const InitiateResponse &response);
    void from_json(const nlohmann::json &json, InitiateResponse &response);

    struct QueryAcceptedRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const QueryAcceptedRequest &request);
    void from_json(const nlohmann::json &json, QueryAcceptedRequest &request);

    struct QueryAcceptedResponse
    {
        // Ascending, no duplicates.
        std::vector<std::uint64_t> indices;
    };

    void to_json(nlohmann::json &json, const QueryAcceptedResponse &response);
    void from_json(const nlohmann::json &json, QueryAcceptedResponse &response);

    struct PutChunkRequest
    {
        std::string session_id;
        std::uint64_t index{};
        std::vector<std::uint8_t> data;
        std::optional<std::string> chunk_hash{};
    };

    void to_json(nlohmann::json &json, const PutChunkRequest &request);
    void from_json(const nlohmann::json &json, PutChunkRequest &request);

    struct PutChunkResponse
    {
        std::uint64_t index{};
        std::uint64_t bytes{};
    };

    void to_json(nlohmann::json &json, const PutChunkResponse &response);
    void from_json(const nlohmann::json &json, PutChunkResponse &response);

    struct CompleteRequest
    {
        std::string session_id;
        std::uint64_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const CompleteRequest &request);
    void from_json(const nlohmann::json &json, CompleteRequest &request);

    struct CompleteResponse
    {
        std::string final_path;
        std::uint64_t size{};
        std::string content_hash;
    };

    void to_json(nlohmann::json &json, const CompleteResponse &response);
    void from_json(const nlohmann::json &json, CompleteResponse &response);

} // namespace chunkvault::protocol
