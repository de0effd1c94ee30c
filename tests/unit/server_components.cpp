#include <atomic>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/server/assembler.hpp"
#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/upload_session.hpp"

using namespace chunkvault;
using namespace chunkvault::server;

namespace
{

    constexpr std::uint64_t kTestChunkSize = 4;

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        std::vector<std::byte> bytes(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(text[i]);
        }
        return bytes;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Fresh store, assembler and registry under a private temp root.
    struct Fixture
    {
        explicit Fixture(const std::string &name)
            : root(std::filesystem::temp_directory_path() / ("chunkvault_server_" + name)),
              store((cleanup_path(root), root / "sessions")),
              assembler(store, root / "artifacts"),
              registry(store, assembler, kTestChunkSize)
        {
        }

        ~Fixture() { cleanup_path(root); }

        std::filesystem::path root;
        ChunkStore store;
        Assembler assembler;
        UploadSessionRegistry registry;
    };

    template <typename Fn>
    std::optional<ErrorCode> storage_error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const StorageError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    void test_put_is_idempotent()
    {
        Fixture fx("idempotent");
        const auto session = fx.registry.initiate("notes.txt");
        assert(session.chunk_size == kTestChunkSize);
        assert(session.status == SessionStatus::Open);

        fx.registry.put_chunk(session.session_id, 0, bytes_of("aaaa"));
        fx.registry.put_chunk(session.session_id, 0, bytes_of("aaaa"));
        fx.registry.put_chunk(session.session_id, 0, bytes_of("bbbb"));

        const auto accepted = fx.registry.list_accepted(session.session_id);
        assert((accepted == std::vector<std::uint64_t>{0}));
        assert(read_file(fx.store.chunk_path(session.session_id, 0)) == "bbbb");
    }

    void test_out_of_order_assembly()
    {
        Fixture fx("out_of_order");
        const auto session = fx.registry.initiate("report.bin");

        fx.registry.put_chunk(session.session_id, 2, bytes_of("ij"));
        fx.registry.put_chunk(session.session_id, 0, bytes_of("abcd"));
        fx.registry.put_chunk(session.session_id, 1, bytes_of("efgh"));
        assert((fx.registry.list_accepted(session.session_id) == std::vector<std::uint64_t>{0, 1, 2}));

        const auto artifact = fx.registry.complete(session.session_id, 3);
        assert(artifact.path == fx.root / "artifacts" / (session.session_id + "__report.bin"));
        assert(artifact.size == 10);
        assert(read_file(artifact.path) == "abcdefghij");
        assert(artifact.content_hash == crypto::hash_bytes(bytes_of("abcdefghij")));

        // The chunks are gone; the record stays.
        assert(fx.store.list_chunks(session.session_id).empty());
        assert(std::filesystem::exists(fx.store.session_dir(session.session_id) / "session.json"));
        assert((fx.registry.list_accepted(session.session_id) == std::vector<std::uint64_t>{0, 1, 2}));
    }

    void test_completion_is_repeatable()
    {
        Fixture fx("repeat_complete");
        const auto session = fx.registry.initiate("twice.bin");
        fx.registry.put_chunk(session.session_id, 0, bytes_of("abcd"));
        fx.registry.put_chunk(session.session_id, 1, bytes_of("e"));

        const auto first = fx.registry.complete(session.session_id, 2);
        const auto again = fx.registry.complete(session.session_id, 2);
        assert(again.path == first.path);
        assert(again.size == 5);
        assert(again.content_hash == first.content_hash);
        assert(read_file(again.path) == "abcde");

        assert(storage_error_of([&]
                                { (void)fx.registry.complete(session.session_id, 3); }) == ErrorCode::Conflict);
        assert(storage_error_of([&]
                                { fx.registry.put_chunk(session.session_id, 1, bytes_of("e")); }) ==
               ErrorCode::Conflict);
        assert(fx.store.list_chunks(session.session_id).empty());

        const auto record = nlohmann::json::parse(read_file(fx.store.session_dir(session.session_id) / "session.json"));
        assert(record.at("status") == "completed");
        assert(record.at("total_chunks") == 2);
        assert(record.at("artifact").at("content_hash") == first.content_hash);
        for (const auto &entry : std::filesystem::directory_iterator(fx.store.session_dir(session.session_id)))
        {
            assert(entry.path().extension() != ".tmp");
        }
    }

    void test_chunks_removed_when_record_cannot_be_saved()
    {
        Fixture fx("record_unwritable");
        const auto session = fx.registry.initiate("stuck.bin");
        fx.registry.put_chunk(session.session_id, 0, bytes_of("abcd"));
        fx.registry.put_chunk(session.session_id, 1, bytes_of("ef"));

        // A directory in the way of the metadata temp file makes the write fail.
        const auto blocker = fx.store.session_dir(session.session_id) / "session.json.tmp";
        std::filesystem::create_directories(blocker / "occupied");

        const auto artifact = fx.registry.complete(session.session_id, 2);
        assert(read_file(artifact.path) == "abcdef");
        assert(fx.store.list_chunks(session.session_id).empty());
        assert(std::filesystem::is_directory(blocker));

        // The earlier record is intact and the running registry still answers.
        const auto record = nlohmann::json::parse(read_file(fx.store.session_dir(session.session_id) / "session.json"));
        assert(record.at("status") == "open");
        assert(fx.registry.complete(session.session_id, 2).path == artifact.path);
    }

    void test_unknown_versus_empty()
    {
        Fixture fx("unknown_vs_empty");
        const auto session = fx.registry.initiate("empty.bin");
        assert(fx.registry.list_accepted(session.session_id).empty());

        const std::string unknown = "0123456789abcdef0123456789abcdef";
        assert(storage_error_of([&]
                                { (void)fx.registry.list_accepted(unknown); }) == ErrorCode::NotFound);
        assert(storage_error_of([&]
                                { fx.registry.put_chunk(unknown, 0, bytes_of("abcd")); }) == ErrorCode::NotFound);
        assert(storage_error_of([&]
                                { (void)fx.registry.complete(unknown, 1); }) == ErrorCode::NotFound);

        // Ids that could never name a session directory are unknown as well.
        assert(storage_error_of([&]
                                { (void)fx.registry.list_accepted("../etc"); }) == ErrorCode::NotFound);
        assert(storage_error_of([&]
                                { (void)fx.store.session_dir("../etc"); }) == ErrorCode::NotFound);
    }

    void test_completeness_gate()
    {
        Fixture fx("completeness");
        for (std::uint64_t total = 1; total <= 5; ++total)
        {
            for (std::uint64_t missing = 0; missing < total; ++missing)
            {
                const auto session = fx.registry.initiate("gate.bin");
                std::string expected;
                for (std::uint64_t index = 0; index < total; ++index)
                {
                    const std::string data = index + 1 == total ? "z" : std::string(kTestChunkSize, 'a' + index);
                    expected += data;
                    if (index != missing)
                    {
                        fx.registry.put_chunk(session.session_id, index, bytes_of(data));
                    }
                }

                assert(storage_error_of([&]
                                        { (void)fx.registry.complete(session.session_id, total); }) ==
                       ErrorCode::AssemblyIncomplete);
                assert(!std::filesystem::exists(fx.assembler.artifact_path(session)));
                assert(fx.registry.list_accepted(session.session_id).size() == total - 1);

                const std::string data = missing + 1 == total ? "z" : std::string(kTestChunkSize, 'a' + missing);
                fx.registry.put_chunk(session.session_id, missing, bytes_of(data));
                const auto artifact = fx.registry.complete(session.session_id, total);
                assert(read_file(artifact.path) == expected);
            }
        }
    }

    void test_extra_chunk_blocks_completion()
    {
        Fixture fx("extra_chunk");
        const auto session = fx.registry.initiate("extra.bin");
        fx.registry.put_chunk(session.session_id, 0, bytes_of("abcd"));
        fx.registry.put_chunk(session.session_id, 1, bytes_of("ef"));
        fx.registry.put_chunk(session.session_id, 5, bytes_of("gh"));

        assert(storage_error_of([&]
                                { (void)fx.registry.complete(session.session_id, 2); }) ==
               ErrorCode::AssemblyIncomplete);
        assert(storage_error_of([&]
                                { (void)fx.registry.complete(session.session_id, 0); }) == ErrorCode::InvalidPayload);
        assert((fx.registry.list_accepted(session.session_id) == std::vector<std::uint64_t>{0, 1, 5}));
    }

    void test_short_middle_chunk_rejected()
    {
        Fixture fx("short_middle");
        const auto session = fx.registry.initiate("short.bin");
        fx.registry.put_chunk(session.session_id, 0, bytes_of("abcd"));
        fx.registry.put_chunk(session.session_id, 1, bytes_of("ef"));
        fx.registry.put_chunk(session.session_id, 2, bytes_of("ijkl"));

        assert(storage_error_of([&]
                                { (void)fx.registry.complete(session.session_id, 3); }) ==
               ErrorCode::AssemblyIncomplete);
        assert(!std::filesystem::exists(fx.assembler.artifact_path(session)));

        fx.registry.put_chunk(session.session_id, 1, bytes_of("efgh"));
        const auto artifact = fx.registry.complete(session.session_id, 3);
        assert(read_file(artifact.path) == "abcdefghijkl");
    }

    void test_put_validation()
    {
        Fixture fx("put_validation");
        const auto session = fx.registry.initiate("check.bin");

        assert(storage_error_of([&]
                                { fx.registry.put_chunk(session.session_id, 0, bytes_of("abcde")); }) ==
               ErrorCode::InvalidPayload);

        const auto good = bytes_of("abcd");
        const auto good_hash = crypto::hash_bytes(good);
        assert(storage_error_of([&]
                                { fx.registry.put_chunk(session.session_id, 0, bytes_of("abce"), good_hash); }) ==
               ErrorCode::InvalidPayload);
        assert(fx.registry.list_accepted(session.session_id).empty());

        fx.registry.put_chunk(session.session_id, 0, good, good_hash);
        assert((fx.registry.list_accepted(session.session_id) == std::vector<std::uint64_t>{0}));
    }

    void test_concurrent_puts()
    {
        Fixture fx("concurrent_puts");
        const auto session = fx.registry.initiate("parallel.bin");
        constexpr std::uint64_t kChunks = 32;

        std::vector<std::thread> writers;
        for (std::uint64_t worker = 0; worker < 4; ++worker)
        {
            writers.emplace_back([&, worker]
                                 {
                for (std::uint64_t index = worker; index < kChunks; index += 4)
                {
                    fx.registry.put_chunk(session.session_id, index, bytes_of(std::string(kTestChunkSize, 'x')));
                    // Listing while others write only ever shows whole chunks.
                    for (const auto listed : fx.registry.list_accepted(session.session_id))
                    {
                        assert(fx.store.chunk_size_on_disk(session.session_id, listed) == kTestChunkSize);
                    }
                } });
        }
        for (auto &writer : writers)
        {
            writer.join();
        }

        const auto accepted = fx.registry.list_accepted(session.session_id);
        assert(accepted.size() == kChunks);
        const auto artifact = fx.registry.complete(session.session_id, kChunks);
        assert(artifact.size == kChunks * kTestChunkSize);
    }

    void test_concurrent_completion()
    {
        Fixture fx("concurrent_complete");
        const auto session = fx.registry.initiate("race.bin");
        fx.registry.put_chunk(session.session_id, 0, bytes_of("abcd"));
        fx.registry.put_chunk(session.session_id, 1, bytes_of("ef"));

        std::vector<AssembledArtifact> results(4);
        std::atomic<int> failed{0};
        std::vector<std::thread> finishers;
        for (std::size_t i = 0; i < results.size(); ++i)
        {
            finishers.emplace_back([&, i]
                                   {
                const auto code = storage_error_of([&] { results[i] = fx.registry.complete(session.session_id, 2); });
                if (code)
                {
                    ++failed;
                } });
        }
        for (auto &finisher : finishers)
        {
            finisher.join();
        }
        assert(failed == 0);
        for (const auto &result : results)
        {
            assert(result.path == fx.assembler.artifact_path(session));
            assert(result.content_hash == results.front().content_hash);
        }
        assert(read_file(fx.assembler.artifact_path(session)) == "abcdef");
    }

    void test_zero_byte_file()
    {
        Fixture fx("zero_byte");
        const auto session = fx.registry.initiate("empty.dat");
        fx.registry.put_chunk(session.session_id, 0, {});
        assert((fx.registry.list_accepted(session.session_id) == std::vector<std::uint64_t>{0}));

        const auto artifact = fx.registry.complete(session.session_id, 1);
        assert(artifact.size == 0);
        assert(std::filesystem::exists(artifact.path));
        assert(std::filesystem::file_size(artifact.path) == 0);
        assert(artifact.content_hash == crypto::hash_bytes({}));
    }

    void test_filename_sanitised()
    {
        Fixture fx("sanitise");
        assert(fx.registry.initiate("../../etc/passwd").filename == "passwd");
        assert(fx.registry.initiate("").filename == "assembled.bin");
        assert(fx.registry.initiate("..").filename == "assembled.bin");
    }

    void test_registry_reload()
    {
        const auto root = std::filesystem::temp_directory_path() / "chunkvault_server_reload";
        cleanup_path(root);

        std::string open_id;
        std::string completed_id;
        {
            ChunkStore store(root / "sessions");
            Assembler assembler(store, root / "artifacts");
            UploadSessionRegistry registry(store, assembler, kTestChunkSize);

            open_id = registry.initiate("keep.bin").session_id;
            registry.put_chunk(open_id, 1, bytes_of("ef"));

            completed_id = registry.initiate("done.bin").session_id;
            registry.put_chunk(completed_id, 0, bytes_of("ab"));
            (void)registry.complete(completed_id, 1);

            // A session directory whose metadata cannot be parsed.
            std::filesystem::create_directories(root / "sessions" / "deadbeef");
            std::ofstream(root / "sessions" / "deadbeef" / "session.json") << "{ not json";
        }

        ChunkStore store(root / "sessions");
        Assembler assembler(store, root / "artifacts");
        UploadSessionRegistry registry(store, assembler, kTestChunkSize);
        assert((registry.list_accepted(open_id) == std::vector<std::uint64_t>{1}));

        // A completed session answers with the artifact it built before the restart.
        assert((registry.list_accepted(completed_id) == std::vector<std::uint64_t>{0}));
        const auto replayed = registry.complete(completed_id, 1);
        assert(replayed.path == root / "artifacts" / (completed_id + "__done.bin"));
        assert(replayed.size == 2);
        assert(replayed.content_hash == crypto::hash_bytes(bytes_of("ab")));
        assert(storage_error_of([&]
                                { registry.put_chunk(completed_id, 0, bytes_of("ab")); }) == ErrorCode::Conflict);
        assert(storage_error_of([&]
                                { (void)registry.list_accepted("deadbeef"); }) == ErrorCode::NotFound);

        registry.put_chunk(open_id, 0, bytes_of("abcd"));
        const auto assembled = registry.complete(open_id, 2);
        assert(assembled.path == root / "artifacts" / (open_id + "__keep.bin"));
        assert(read_file(assembled.path) == "abcdef");

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_put_is_idempotent();
    test_out_of_order_assembly();
    test_completion_is_repeatable();
    test_chunks_removed_when_record_cannot_be_saved();
    test_unknown_versus_empty();
    test_completeness_gate();
    test_extra_chunk_blocks_completion();
    test_short_middle_chunk_rejected();
    test_put_validation();
    test_concurrent_puts();
    test_concurrent_completion();
    test_zero_byte_file();
    test_filename_sanitised();
    test_registry_reload();
    std::cout << "Server component tests passed\n";
}
