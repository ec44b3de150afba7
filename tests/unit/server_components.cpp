#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "snapvault/archive.hpp"
#include "snapvault/crypto.hpp"
#include "snapvault/error_codes.hpp"
#include "snapvault/protocol.hpp"
#include "snapvault/server/chunk_assembler.hpp"
#include "snapvault/server/managed_files.hpp"
#include "snapvault/server/operation_registry.hpp"
#include "snapvault/server/reclaimer.hpp"
#include "snapvault/server/restore_engine.hpp"

using namespace snapvault;
using namespace snapvault::server;
using snapvault::protocol::OperationStatus;

namespace
{

    const std::vector<std::filesystem::path> kDatabases{"database/books_data.db", "database/books_static.db"};

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, const std::string &contents)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::vector<std::filesystem::path> snapshots_of(const std::filesystem::path &directory)
    {
        std::vector<std::filesystem::path> found;
        for (const auto &entry : std::filesystem::directory_iterator(directory))
        {
            if (entry.path().extension() == ".bak")
            {
                found.push_back(entry.path());
            }
        }
        return found;
    }

    template <typename Fn>
    ErrorCode error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const TransferError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    void test_managed_files()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_managed_test";
        cleanup_path(root);
        ManagedFileSet files(root, kDatabases);

        auto status = files.status();
        assert(status.databases.size() == 2);
        assert(!status.all_files_exist);
        assert(status.total_size_bytes == 0);
        assert(status.databases[0].size_formatted == "0 B");
        assert(error_of([&]
                        { files.require_all_present(); }) == ErrorCode::SourceMissing);

        write_file(root / "database" / "books_data.db", std::string(100, 'd'));
        write_file(root / "database" / "books_static.db", std::string(50, 's'));
        status = files.status();
        assert(status.all_files_exist);
        assert(status.total_size_bytes == 150);
        assert(status.databases[0].path == "database/books_data.db");
        assert(status.databases[1].size_bytes == 50);
        files.require_all_present();

        const auto destinations = files.destinations_by_name();
        assert(destinations.size() == 2);
        assert(destinations.at("books_static.db") == (root / "database" / "books_static.db").lexically_normal());
        assert(files.display_path(root / "database" / "books_data.db") == "database/books_data.db");

        assert(error_of([&]
                        { ManagedFileSet empty(root, {}); }) == ErrorCode::InvalidRequest);
        cleanup_path(root);
    }

    void test_registry_transitions()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_registry_test";
        cleanup_path(root);
        OperationRegistry registry(root);

        const auto minted = registry.create(std::nullopt, 3);
        assert(OperationRegistry::is_valid_id(minted.id));
        assert(std::filesystem::is_directory(minted.staging_dir));
        assert(minted.status == OperationStatus::Uploading);

        auto operation = registry.record_chunk(minted.id, 2);
        operation = registry.record_chunk(minted.id, 2);
        assert(operation.chunks_received() == 1);
        operation = registry.record_chunk(minted.id, 0);
        assert(operation.chunks_received() == 2);
        assert(!operation.all_chunks_received());
        assert(error_of([&]
                        { (void)registry.record_chunk(minted.id, 3); }) == ErrorCode::InvalidRequest);

        assert(registry.try_begin_restore(minted.id));
        assert(!registry.try_begin_restore(minted.id));
        assert(error_of([&]
                        { (void)registry.record_chunk(minted.id, 1); }) == ErrorCode::Conflict);

        assert(registry.mark_completed(minted.id, {"database/books_data.db"}));
        assert(!registry.mark_failed(minted.id, "late failure"));
        const auto record = registry.lookup(minted.id).to_record();
        assert(record.status == OperationStatus::Completed);
        assert(record.completed_at.has_value());
        assert(record.restored_files.size() == 1);
        assert(!record.error);

        assert(error_of([&]
                        { (void)registry.create(std::string("client-id"), 0); }) == ErrorCode::InvalidRequest);
        assert(error_of([&]
                        { (void)registry.create(std::string("../escape"), 1); }) == ErrorCode::InvalidRequest);
        (void)registry.create(std::string("client-id"), 2);
        assert(error_of([&]
                        { (void)registry.create(std::string("client-id"), 2); }) == ErrorCode::Conflict);
        assert(error_of([&]
                        { (void)registry.lookup("nope"); }) == ErrorCode::UnknownOperation);
        assert(!registry.find("nope"));

        const auto terminal = registry.terminal_ids();
        assert(terminal.size() == 1 && terminal.front() == minted.id);
        assert(registry.size() == 2);
        assert(registry.remove(minted.id));
        assert(!registry.remove(minted.id));
        assert(registry.size() == 1);

        cleanup_path(root);
    }

    void test_registry_persistence()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_registry_reload_test";
        cleanup_path(root);
        {
            OperationRegistry registry(root);
            (void)registry.create(std::string("pending"), 4);
            (void)registry.record_chunk("pending", 1);
            (void)registry.create(std::string("interrupted"), 1);
            assert(registry.try_begin_restore("interrupted"));
        }

        OperationRegistry reloaded(root);
        assert(reloaded.size() == 2);
        const auto pending = reloaded.lookup("pending");
        assert(pending.status == OperationStatus::Uploading);
        assert(pending.chunks_received() == 1);
        assert(pending.total_chunks == 4);

        const auto interrupted = reloaded.lookup("interrupted");
        assert(interrupted.status == OperationStatus::Failed);
        assert(interrupted.error == std::string("Restore interrupted by server restart"));

        cleanup_path(root);
    }

    void test_registry_expire_idle()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_registry_expire_test";
        cleanup_path(root);
        OperationRegistry registry(root);
        (void)registry.create(std::string("idle"), 2);
        (void)registry.create(std::string("finished"), 1);
        assert(registry.try_begin_restore("finished"));

        const auto now = TransferOperation::Clock::now();
        assert(registry.expire_idle(std::chrono::seconds(3600), now).empty());

        const auto expired = registry.expire_idle(std::chrono::seconds(3600), now + std::chrono::hours(2));
        assert(expired.size() == 1 && expired.front() == "idle");
        assert(registry.lookup("idle").status == OperationStatus::Failed);
        assert(registry.lookup("finished").status == OperationStatus::Restoring);

        cleanup_path(root);
    }

    void test_chunk_assembler()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_assembler_test";
        cleanup_path(root);
        OperationRegistry registry(root);
        ChunkAssembler assembler(registry);

        const auto id = assembler.begin(std::string("upload-1"), 3);
        assert(id == "upload-1");

        auto outcome = assembler.accept(id, 2, "CCC");
        assert(outcome.state == ChunkOutcome::State::MoreExpected);
        outcome = assembler.accept(id, 0, "stale");
        outcome = assembler.accept(id, 0, "AAAA");
        assert(outcome.chunks_received == 2);
        outcome = assembler.accept(id, 1, "BB");
        assert(outcome.state == ChunkOutcome::State::ReadyToAssemble);
        assert(outcome.chunks_received == 3 && outcome.total_chunks == 3);

        const auto combined = assembler.assemble(id);
        assert(combined.filename() == ChunkAssembler::kCombinedName);
        assert(read_file(combined) == "AAAABBCCC");
        assert(!std::filesystem::exists(combined.parent_path() / ChunkAssembler::chunk_name(0)));

        assert(error_of([&]
                        { (void)assembler.accept("unknown", 0, "x"); }) == ErrorCode::UnknownOperation);
        assert(error_of([&]
                        { (void)assembler.accept(id, 5, "x"); }) == ErrorCode::InvalidRequest);

        const auto gap = assembler.begin(std::nullopt, 2);
        (void)assembler.accept(gap, 0, "one");
        (void)assembler.accept(gap, 1, "two");
        std::filesystem::remove(registry.lookup(gap).staging_dir / ChunkAssembler::chunk_name(1));
        bool caught = false;
        try
        {
            (void)assembler.assemble(gap);
        }
        catch (const TransferError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::MissingChunk);
            assert(std::string(ex.what()) == "Missing chunk 1");
        }
        assert(caught);

        const auto single = assembler.begin(std::nullopt, 1);
        const auto stored = assembler.store_single(single, "whole archive");
        assert(stored.filename() == ChunkAssembler::kSingleShotName);
        assert(read_file(stored) == "whole archive");
        assert(registry.lookup(single).all_chunks_received());

        assert(registry.try_begin_restore(id));
        assert(error_of([&]
                        { (void)assembler.accept(id, 0, "late"); }) == ErrorCode::Conflict);

        cleanup_path(root);
    }

    void test_concurrent_chunk_delivery()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_concurrency_test";
        cleanup_path(root);
        OperationRegistry registry(root);
        ChunkAssembler assembler(registry);

        const std::string id = "parallel-upload";
        constexpr std::uint64_t kTotal = 4;
        constexpr int kThreads = 8;
        std::atomic<int> conflicts{0};
        std::atomic<int> other_errors{0};

        auto run_all = [&](auto &&work)
        {
            std::vector<std::thread> threads;
            for (int t = 0; t < kThreads; ++t)
            {
                threads.emplace_back(work, t);
            }
            for (auto &thread : threads)
            {
                thread.join();
            }
        };

        // Duplicate deliveries of the first chunk all land on one operation.
        run_all([&](int)
                {
            try
            {
                const auto joined = assembler.join(id, kTotal);
                assert(joined == id);
                (void)assembler.accept(joined, 0, "chunk-0");
            }
            catch (const TransferError &ex)
            {
                if (ex.code() == ErrorCode::Conflict)
                {
                    ++conflicts;
                }
                else
                {
                    ++other_errors;
                }
            } });
        assert(conflicts == 0);
        assert(other_errors == 0);
        assert(registry.size() == 1);
        assert(registry.lookup(id).chunks_received() == 1);

        // The remaining chunks, each delivered twice.
        run_all([&](int t)
                {
            const auto index = static_cast<std::uint64_t>(t % 3) + 1;
            try
            {
                (void)assembler.accept(id, index, "chunk-" + std::to_string(index));
            }
            catch (const TransferError &)
            {
                ++other_errors;
            } });
        assert(other_errors == 0);
        const auto operation = registry.lookup(id);
        assert(operation.chunks_received() == kTotal);
        assert(operation.all_chunks_received());

        std::atomic<int> claims{0};
        run_all([&](int)
                {
            if (registry.try_begin_restore(id))
            {
                ++claims;
            } });
        assert(claims == 1);
        assert(registry.lookup(id).status == OperationStatus::Restoring);
        assert(read_file(assembler.assemble(id)) == "chunk-0chunk-1chunk-2chunk-3");

        // Joining an existing id keeps its original chunk count.
        const auto [existing, created] = registry.create_or_get(id, 9);
        assert(!created);
        assert(existing.total_chunks == kTotal);
        assert(error_of([&]
                        { (void)registry.create_or_get("bad id!", 1); }) == ErrorCode::InvalidRequest);
        assert(error_of([&]
                        { (void)registry.create_or_get("zero-chunks", 0); }) == ErrorCode::InvalidRequest);

        cleanup_path(root);
    }

    void test_restore_engine()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_restore_test";
        cleanup_path(root);
        const auto data_path = root / "database" / "books_data.db";
        const auto static_path = root / "database" / "books_static.db";
        write_file(data_path, "old data");
        write_file(static_path, "old static");

        const auto source_dir = root / "source";
        write_file(source_dir / "books_data.db", "new data");
        write_file(source_dir / "books_static.db", "new static");
        write_file(source_dir / "unrelated.db", "ignored");
        // Stored out of configuration order.
        const auto archive_path =
            archive::build({source_dir / "books_static.db", source_dir / "unrelated.db", source_dir / "books_data.db"},
                           root / "incoming.zip")
                .path;

        ManagedFileSet files(root, kDatabases);
        OperationRegistry registry(root / "uploads");
        RestoreEngine engine(files, registry);

        (void)registry.create(std::string("restore-ok"), 1);
        assert(registry.try_begin_restore("restore-ok"));
        const auto result = engine.restore(archive_path, "restore-ok");
        assert(result.success);
        assert(result.message == "Database restored successfully");
        assert(result.restored_files ==
               (std::vector<std::string>{"database/books_data.db", "database/books_static.db"}));
        assert(read_file(data_path) == "new data");
        assert(read_file(static_path) == "new static");
        assert(!std::filesystem::exists(root / "database" / "unrelated.db"));

        assert(result.snapshots.size() == 2);
        assert(read_file(result.snapshots[0]) == "old data");
        assert(read_file(result.snapshots[1]) == "old static");
        const auto operation = registry.lookup("restore-ok");
        assert(operation.status == OperationStatus::Completed);
        assert(operation.restored_files == result.restored_files);

        // Back to back, usually within the same second: earlier snapshots survive.
        (void)registry.create(std::string("restore-again"), 1);
        assert(registry.try_begin_restore("restore-again"));
        const auto again = engine.restore(archive_path, "restore-again");
        assert(again.success);
        assert(again.snapshots.size() == 2);
        for (const auto &snapshot : again.snapshots)
        {
            assert(snapshot != result.snapshots[0]);
            assert(snapshot != result.snapshots[1]);
        }
        assert(read_file(result.snapshots[0]) == "old data");
        assert(read_file(result.snapshots[1]) == "old static");
        assert(read_file(again.snapshots[0]) == "new data");
        assert(snapshots_of(root / "database").size() == 4);

        // An archive without any managed database still snapshots, then changes nothing.
        for (const auto &snapshot : snapshots_of(root / "database"))
        {
            std::filesystem::remove(snapshot);
        }
        const auto foreign = archive::build({source_dir / "unrelated.db"}, root / "foreign.zip").path;
        (void)registry.create(std::string("restore-empty"), 1);
        assert(registry.try_begin_restore("restore-empty"));
        const auto empty = engine.restore(foreign, "restore-empty");
        assert(!empty.success);
        assert(empty.code == ErrorCode::NothingToRestore);
        assert(empty.message == "No database files found in backup");
        assert(empty.snapshots.size() == 2);
        assert(snapshots_of(root / "database").size() == 2);
        for (const auto &snapshot : empty.snapshots)
        {
            assert(std::filesystem::exists(snapshot));
        }
        assert(read_file(data_path) == "new data");
        assert(read_file(static_path) == "new static");
        assert(registry.lookup("restore-empty").status == OperationStatus::Failed);

        const auto corrupt = root / "corrupt.zip";
        write_file(corrupt, "definitely not a zip");
        (void)registry.create(std::string("restore-corrupt"), 1);
        assert(registry.try_begin_restore("restore-corrupt"));
        const auto broken = engine.restore(corrupt, "restore-corrupt");
        assert(!broken.success);
        assert(broken.code == ErrorCode::CorruptArchive);
        assert(read_file(static_path) == "new static");
        const auto failed = registry.lookup("restore-corrupt");
        assert(failed.status == OperationStatus::Failed);
        assert(failed.error.has_value());

        cleanup_path(root);
    }

    void test_checksum_verification()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_checksum_test";
        cleanup_path(root);
        write_file(root / "database" / "books_data.db", "data");
        const auto archive_path = root / "uploads" / "incoming.zip";
        write_file(archive_path, "archive bytes");

        ManagedFileSet files(root, kDatabases);
        OperationRegistry registry(root / "uploads");
        RestoreEngine engine(files, registry);

        (void)registry.create(std::string("sum-ok"), 1);
        assert(registry.try_begin_restore("sum-ok"));
        const auto expected = crypto::hash_file(archive_path);
        const auto ok = engine.verify_checksum(archive_path, "sum-ok", expected);
        assert(ok.matched);
        assert(ok.calculated == expected);
        assert(registry.lookup("sum-ok").status == OperationStatus::Restoring);

        (void)registry.create(std::string("sum-bad"), 1);
        assert(registry.try_begin_restore("sum-bad"));
        const auto bad = engine.verify_checksum(archive_path, "sum-bad", std::string(64, '0'));
        assert(!bad.matched);
        assert(bad.code == ErrorCode::ChecksumMismatch);
        assert(bad.calculated == expected);
        assert(registry.lookup("sum-bad").status == OperationStatus::Failed);

        // The archive vanished before it could be hashed.
        (void)registry.create(std::string("sum-gone"), 1);
        assert(registry.try_begin_restore("sum-gone"));
        const auto gone = engine.verify_checksum(root / "uploads" / "missing.zip", "sum-gone", expected);
        assert(!gone.matched);
        assert(gone.code != ErrorCode::Ok);
        assert(gone.code != ErrorCode::ChecksumMismatch);
        const auto failed = registry.lookup("sum-gone");
        assert(failed.status == OperationStatus::Failed);
        assert(failed.error.has_value());

        cleanup_path(root);
    }

    void test_reclaimer()
    {
        auto now = Reclaimer::Clock::time_point{} + std::chrono::hours(1);
        Reclaimer reclaimer([&]
                            { return now; });

        int ran = 0;
        (void)reclaimer.schedule(std::chrono::seconds(10), "first", [&]
                                 { ++ran; });
        const auto second = reclaimer.schedule(std::chrono::seconds(20), "second", [&]
                                               { ran += 10; });
        (void)reclaimer.schedule(std::chrono::seconds(5), "throws", []
                                 { throw std::runtime_error("boom"); });
        assert(reclaimer.pending() == 3);
        assert(reclaimer.next_due() == now + std::chrono::seconds(5));

        assert(reclaimer.run_due() == 0);
        now += std::chrono::seconds(10);
        assert(reclaimer.run_due() == 2);
        assert(ran == 1);
        assert(reclaimer.pending() == 1);

        assert(reclaimer.cancel(second));
        assert(!reclaimer.cancel(second));
        now += std::chrono::minutes(5);
        assert(reclaimer.run_due() == 0);
        assert(ran == 1);
        assert(!reclaimer.next_due());

        const auto root = std::filesystem::temp_directory_path() / "snapvault_reclaimer_test";
        cleanup_path(root);
        const auto archive_file = root / "books_db_backup.zip";
        write_file(archive_file, "zip");
        (void)reclaimer.schedule_file_removal(archive_file, std::chrono::seconds(600));

        OperationRegistry registry(root / "uploads");
        const auto operation = registry.create(std::string("old-op"), 1);
        assert(registry.mark_failed("old-op", "abandoned"));
        (void)reclaimer.schedule_operation_removal(registry, "old-op", std::chrono::seconds(3600));

        now += std::chrono::seconds(599);
        assert(reclaimer.run_due() == 0);
        assert(std::filesystem::exists(archive_file));
        now += std::chrono::seconds(1);
        assert(reclaimer.run_due() == 1);
        assert(!std::filesystem::exists(archive_file));

        now += std::chrono::seconds(3600);
        assert(reclaimer.run_due() == 1);
        assert(!std::filesystem::exists(operation.staging_dir));
        assert(!registry.find("old-op"));

        (void)reclaimer.schedule(std::chrono::seconds(1), "dropped", [&]
                                 { ++ran; });
        reclaimer.clear();
        now += std::chrono::seconds(5);
        assert(reclaimer.run_due() == 0);
        assert(ran == 1);

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_managed_files();
    test_registry_transitions();
    test_registry_persistence();
    test_registry_expire_idle();
    test_chunk_assembler();
    test_concurrent_chunk_delivery();
    test_restore_engine();
    test_checksum_verification();
    test_reclaimer();
}
