#include "chunkvault/protocol.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace chunkvault::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 5> kCommandMappings{{
            {Command::Initiate, "INITIATE"},
            {Command::QueryAccepted, "QUERY_ACCEPTED"},
            {Command::PutChunk, "PUT_CHUNK"},
            {Command::Complete, "COMPLETE"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const InitiateRequest &request)
    {
        json = {{"filename", request.filename}};
    }

    void from_json(const nlohmann::json &json, InitiateRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
    }

    void to_json(nlohmann::json &json, const InitiateResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"chunk_size", response.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, InitiateResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.chunk_size = json.at("chunk_size").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const QueryAcceptedRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, QueryAcceptedRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const QueryAcceptedResponse &response)
    {
        json = {{"indices", response.indices}};
    }

    void from_json(const nlohmann::json &json, QueryAcceptedResponse &response)
    {
        response.indices = json.value("indices", std::vector<std::uint64_t>{});
        std::sort(response.indices.begin(), response.indices.end());
        response.indices.erase(std::unique(response.indices.begin(), response.indices.end()), response.indices.end());
    }

    void to_json(nlohmann::json &json, const PutChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"index", request.index},
            {"data", nlohmann::json::binary(request.data)},
        };
        if (request.chunk_hash)
        {
            json["hash"] = *request.chunk_hash;
        }
    }

    void from_json(const nlohmann::json &json, PutChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.index = json.at("index").get<std::uint64_t>();
        const auto &data = json.at("data");
        if (!data.is_binary())
        {
            throw std::invalid_argument("Chunk data must be a byte string");
        }
        const auto &bytes = data.get_binary();
        request.data.assign(bytes.begin(), bytes.end());
        if (auto it = json.find("hash"); it != json.end())
        {
            request.chunk_hash = it->get<std::string>();
        }
        else
        {
            request.chunk_hash.reset();
        }
    }

    void to_json(nlohmann::json &json, const PutChunkResponse &response)
    {
        json = {
            {"index", response.index},
            {"bytes", response.bytes},
        };
    }

    void from_json(const nlohmann::json &json, PutChunkResponse &response)
    {
        response.index = json.at("index").get<std::uint64_t>();
        response.bytes = json.value("bytes", 0ULL);
    }

    void to_json(nlohmann::json &json, const CompleteRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"total_chunks", request.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, CompleteRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.total_chunks = json.at("total_chunks").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const CompleteResponse &response)
    {
        json = {
            {"final_path", response.final_path},
            {"size", response.size},
            {"content_hash", response.content_hash},
        };
    }

    void from_json(const nlohmann::json &json, CompleteResponse &response)
    {
        response.final_path = json.at("final_path").get<std::string>();
        response.size = json.value("size", 0ULL);
        response.content_hash = json.value("content_hash", std::string{});
    }

} // namespace chunkvault::protocol
