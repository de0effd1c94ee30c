#include "chunkvault/client/progress_store.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace chunkvault::client
{

    namespace
    {
        constexpr auto kRecordSuffix = ".uploadmeta.json";

        nlohmann::json to_json(const ProgressRecord &record)
        {
            return {
                {"session_id", record.session_id},
                {"chunk_size", record.chunk_size},
                {"file_size", record.file_size},
                {"filename", record.filename},
                {"file_checksum", record.file_checksum},
                {"chunks_accepted", record.chunks_accepted},
            };
        }

        ProgressRecord record_from_json(const nlohmann::json &json)
        {
            ProgressRecord record{};
            record.session_id = json.at("session_id").get<std::string>();
            record.chunk_size = json.at("chunk_size").get<std::uint64_t>();
            record.file_size = json.at("file_size").get<std::uint64_t>();
            record.filename = json.at("filename").get<std::string>();
            record.file_checksum = json.at("file_checksum").get<std::string>();
            record.chunks_accepted = json.value("chunks_accepted", 0ULL);
            return record;
        }
    } // namespace

    ProgressStore::ProgressStore(Logger &logger) : logger_(logger) {}

    std::filesystem::path ProgressStore::record_path(const std::filesystem::path &source)
    {
        auto path = source;
        path += kRecordSuffix;
        return path;
    }

    std::optional<ProgressRecord> ProgressStore::load(const std::filesystem::path &source) const
    {
        const auto path = record_path(source);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return std::nullopt;
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            logger_.warn("progress", "cannot open ", path.string(), ", starting fresh");
            return std::nullopt;
        }
        try
        {
            nlohmann::json json;
            in >> json;
            auto record = record_from_json(json);
            if (record.session_id.empty() || record.chunk_size == 0 || record.file_checksum.empty())
            {
                logger_.warn("progress", "incomplete record in ", path.string(), ", starting fresh");
                return std::nullopt;
            }
            return record;
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("progress", "corrupt record in ", path.string(), ": ", ex.what());
            return std::nullopt;
        }
    }

    std::optional<ProgressRecord> ProgressStore::validate(std::optional<ProgressRecord> record,
                                                          const std::string &current_checksum) const
    {
        if (record && record->file_checksum != current_checksum)
        {
            logger_.info("progress", "source changed since session ", record->session_id, ", discarding record");
            return std::nullopt;
        }
        return record;
    }

    void ProgressStore::persist(const std::filesystem::path &source, const ProgressRecord &record) const
    {
        const auto path = record_path(source);
        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw LocalIoError("Cannot write progress file " + temp_path.string());
            }
            out << to_json(record).dump(2);
            out.flush();
            if (!out)
            {
                throw LocalIoError("Failed writing progress file " + temp_path.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            throw LocalIoError("Failed to replace progress file " + path.string() + ": " + ec.message());
        }
    }

    void ProgressStore::clear(const std::filesystem::path &source) const
    {
        std::error_code ec;
        std::filesystem::remove(record_path(source), ec);
        if (ec)
        {
            throw LocalIoError("Failed to remove progress file: " + ec.message());
        }
    }

} // namespace chunkvault::client
