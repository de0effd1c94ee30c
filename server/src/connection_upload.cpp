#include "chunkvault/server/connection.hpp"

#include <span>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "chunkvault/server/assembler.hpp"
#include "chunkvault/server/chunk_store.hpp"

namespace chunkvault::server
{

    void Connection::handle_initiate(const chunkvault::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkvault::protocol::InitiateRequest>();
            const auto session = services_.registry.initiate(request.filename);
            chunkvault::protocol::InitiateResponse response{
                .session_id = session.session_id,
                .chunk_size = session.chunk_size,
            };
            send_ok(response, envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const StorageError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_query_accepted(const chunkvault::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkvault::protocol::QueryAcceptedRequest>();
            chunkvault::protocol::QueryAcceptedResponse response{
                .indices = services_.registry.list_accepted(request.session_id),
            };
            send_ok(response, envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const StorageError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_put_chunk(const chunkvault::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkvault::protocol::PutChunkRequest>();
            services_.registry.put_chunk(request.session_id, request.index, std::as_bytes(std::span(request.data)),
                                         request.chunk_hash);
            chunkvault::protocol::PutChunkResponse response{
                .index = request.index,
                .bytes = request.data.size(),
            };
            send_ok(response, envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::invalid_argument &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const StorageError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_complete(const chunkvault::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkvault::protocol::CompleteRequest>();
            const auto artifact = services_.registry.complete(request.session_id, request.total_chunks);
            chunkvault::protocol::CompleteResponse response{
                .final_path = artifact.path.generic_string(),
                .size = artifact.size,
                .content_hash = artifact.content_hash,
            };
            send_ok(response, envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const StorageError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkvault::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

} // namespace chunkvault::server
