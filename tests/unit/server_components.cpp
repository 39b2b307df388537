#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "nanocloud/error_codes.hpp"
#include "nanocloud/server/chunk_store.hpp"
#include "nanocloud/server/config.hpp"
#include "nanocloud/server/disconnect_signal.hpp"
#include "nanocloud/server/merger.hpp"
#include "nanocloud/server/name_sanitizer.hpp"
#include "nanocloud/server/operation_gate.hpp"
#include "nanocloud/server/path_resolver.hpp"
#include "nanocloud/server/permissions.hpp"
#include "nanocloud/server/quota_ledger.hpp"
#include "nanocloud/server/small_file_uploader.hpp"
#include "nanocloud/server/stale_sweeper.hpp"
#include "nanocloud/server/storage_error.hpp"
#include "nanocloud/server/storage_info.hpp"
#include "nanocloud/server/upload_context.hpp"

using namespace nanocloud;
using namespace nanocloud::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto dir = std::filesystem::temp_directory_path() / name;
        cleanup_path(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    template <typename Fn>
    std::optional<ErrorCode> storage_code_of(Fn &&fn)
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

    std::size_t count_entries(const std::filesystem::path &dir)
    {
        std::size_t count = 0;
        for ([[maybe_unused]] const auto &entry : std::filesystem::recursive_directory_iterator(dir))
        {
            ++count;
        }
        return count;
    }

    class FlagSignal final : public DisconnectSignal
    {
    public:
        explicit FlagSignal(bool aborted) : aborted_(aborted) {}
        bool aborted() const override { return aborted_; }

    private:
        bool aborted_;
    };

    class FullDisk final : public StorageInfoProvider
    {
    public:
        using StorageInfoProvider::StorageInfoProvider;
        bool has_room_for(const std::filesystem::path &, std::uint64_t) const override { return false; }
    };

    const PermissionPolicy kPolicy(static_cast<std::filesystem::perms>(0755), static_cast<std::filesystem::perms>(0644));

    void test_name_sanitizer()
    {
        assert(sanitize_filename("../../etc/passwd", EmptyNamePolicy::Reject) == "passwd");
        assert(sanitize_filename("C:\\Users\\me\\report (1).pdf", EmptyNamePolicy::Reject) == "report (1).pdf");
        assert(sanitize_filename("a<b>:c|d.txt", EmptyNamePolicy::Reject) == "a_b__c_d.txt");
        assert(sanitize_filename("  padded.txt  ", EmptyNamePolicy::Reject) == "padded.txt");
        assert(sanitize_filename("r\xC3\xA9sum\xC3\xA9.txt", EmptyNamePolicy::Reject) == "r__sum__.txt");

        assert(sanitize_filename("..", EmptyNamePolicy::Reject).empty());
        assert(sanitize_filename("   ", EmptyNamePolicy::Reject).empty());
        assert(sanitize_filename("dir/", EmptyNamePolicy::Reject).empty());

        const std::chrono::system_clock::time_point fixed{std::chrono::seconds{1700000000}};
        assert(sanitize_filename(".", EmptyNamePolicy::TimestampDefault, fixed) == "file_1700000000");

        assert(sanitize_segment("a/b") == "a_b");
        assert(sanitize_segment("..").empty());
        assert(sanitize_relative_path("/photos//2024/../x?.jpg", EmptyNamePolicy::Reject) == "photos/2024/x_.jpg");
        assert(sanitize_upload_name("", "plain.txt", EmptyNamePolicy::Reject) == "plain.txt");
        assert(sanitize_upload_name("album/plain.txt", "plain.txt", EmptyNamePolicy::Reject) == "album/plain.txt");

        // A folder never stands in for an unusable file name.
        for (const auto *raw : {"album/..", "album/.", "album/", "album/   "})
        {
            assert(sanitize_upload_name(raw, "video.bin", EmptyNamePolicy::Reject).empty());
        }
        const auto defaulted = sanitize_relative_path("album/..", EmptyNamePolicy::TimestampDefault);
        assert(defaulted.starts_with("album/file_"));
    }

    void test_path_resolver_containment()
    {
        const auto root = fresh_dir("nanocloud_resolver_root");
        const auto outside = fresh_dir("nanocloud_resolver_outside");
        std::filesystem::create_directories(root / "docs");
        write_file(root / "docs" / "readme.txt", "hi");
        write_file(outside / "secret.txt", "secret");

        const PathResolver resolver(root);
        assert(resolver.resolve("").relative().empty());
        const auto docs = resolver.resolve_directory("docs");
        assert(docs.relative() == "docs");
        assert(docs.absolute() == resolver.root() / "docs");
        assert(resolver.resolve_directory("/docs/").relative() == "docs");

        // Parent references are stripped before the lookup, never followed.
        assert(storage_code_of([&]
                               { (void)resolver.resolve("../../etc/passwd"); }) == ErrorCode::NotFound);
        assert(storage_code_of([&]
                               { (void)resolver.resolve("a/../../b"); }) == ErrorCode::NotFound);
        assert(storage_code_of([&]
                               { (void)resolver.resolve("/etc/passwd"); }) == ErrorCode::NotFound);
        assert(storage_code_of([&]
                               { (void)resolver.resolve_directory("docs/readme.txt"); }) == ErrorCode::NotFound);

        std::filesystem::create_directory_symlink(outside, root / "escape");
        assert(storage_code_of([&]
                               { (void)resolver.resolve("escape"); }) == ErrorCode::OutsideRoot);
        assert(storage_code_of([&]
                               { (void)resolver.resolve_directory("escape"); }) == ErrorCode::OutsideRoot);
        assert(storage_code_of([&]
                               { (void)resolver.prepare_destination(resolver.resolve(""), "escape/x.txt", kPolicy); }) ==
               ErrorCode::OutsideRoot);
        assert(!std::filesystem::exists(outside / "x.txt"));

        std::filesystem::create_symlink(outside / "secret.txt", root / "link.txt");
        assert(storage_code_of([&]
                               { (void)resolver.resolve_for_new_entry("link.txt"); }) == ErrorCode::OutsideRoot);

        const auto fresh = resolver.resolve_for_new_entry("docs/new.txt");
        assert(fresh.absolute() == resolver.root() / "docs" / "new.txt");
        assert(fresh.relative() == "docs/new.txt");

        const auto nested = resolver.prepare_destination(docs, "a/b/c.txt", kPolicy);
        assert(nested.relative() == "docs/a/b/c.txt");
        assert(std::filesystem::is_directory(resolver.root() / "docs" / "a" / "b"));
        assert(!std::filesystem::exists(nested.absolute()));

        cleanup_path(root);
        cleanup_path(outside);
    }

    void test_chunk_store_basics()
    {
        const auto chunk_root = fresh_dir("nanocloud_chunk_store");
        FilesystemChunkStore store(chunk_root);
        const std::string id = "session-a";

        assert(!store.has_session(id));
        assert(store.present_indices(id).empty());
        assert(store.remove_session(id) == RemovalStatus::Absent);

        store.write_chunk(id, 2, "cc");
        store.write_chunk(id, 0, "aa");
        store.write_chunk(id, 0, "AAA");
        assert(store.has_session(id));
        assert(*store.chunk_size(id, 0) == 3);
        assert(!store.chunk_size(id, 1).has_value());

        write_file(store.session_dir(id) / "notes.txt", "ignored");
        write_file(store.session_dir(id) / "7.part.tmp", "ignored");
        const auto present = store.present_indices(id);
        assert(present.size() == 2);
        assert(present.contains(0));
        assert(present.contains(2));

        const auto chunk = store.open_chunk(id, 0);
        const std::string bytes{std::istreambuf_iterator<char>(*chunk), std::istreambuf_iterator<char>()};
        assert(bytes == "AAA");
        assert(storage_code_of([&]
                               { (void)store.open_chunk(id, 1); }) == ErrorCode::MissingChunks);

        assert(storage_code_of([&]
                               { store.write_chunk("../evil", 0, "x"); }) == ErrorCode::InvalidUploadId);
        assert(storage_code_of([&]
                               { (void)store.has_session(""); }) == ErrorCode::InvalidUploadId);

        const auto sessions = store.list_sessions();
        assert(sessions.size() == 1);
        assert(sessions.front() == id);

        assert(store.remove_session(id) == RemovalStatus::Removed);
        assert(!store.has_session(id));

        cleanup_path(chunk_root);
    }

    void test_stale_sweeper()
    {
        const auto chunk_root = fresh_dir("nanocloud_sweeper");
        FilesystemChunkStore store(chunk_root);
        store.write_chunk("old-session", 0, "x");
        store.write_chunk("fresh-session", 0, "y");

        const auto now = std::filesystem::file_time_type::clock::now();
        const auto old_stamp = now - std::chrono::hours(3);
        std::filesystem::last_write_time(store.chunk_path("old-session", 0), old_stamp);
        std::filesystem::last_write_time(store.session_dir("old-session"), old_stamp);

        const StaleSweeper sweeper(store, std::chrono::hours(2));
        const auto report = sweeper.sweep(now);
        assert(report.examined == 2);
        assert(report.removed == 1);
        assert(report.failed == 0);
        assert(!store.has_session("old-session"));
        assert(store.has_session("fresh-session"));

        cleanup_path(chunk_root);
    }

    void test_merger_success_and_failures()
    {
        const auto root = fresh_dir("nanocloud_merge_root");
        const auto chunk_root = fresh_dir("nanocloud_merge_chunks");
        const PathResolver resolver(root);
        FilesystemChunkStore store(chunk_root);
        const StorageInfoProvider storage(root);
        const Merger merger(store, kPolicy, storage, 4);

        store.write_chunk("merge-ok", 0, "hello ");
        store.write_chunk("merge-ok", 1, "chunked ");
        store.write_chunk("merge-ok", 2, "world");
        const auto ok = merger.merge(MergeRequest{
            .upload_id = "merge-ok",
            .total_chunks = 3,
            .destination = resolver.resolve_for_new_entry("greeting.txt"),
            .expected_size = 19,
        });
        assert(ok.ok());
        assert(ok.final_size == 19);
        assert(read_file(resolver.root() / "greeting.txt") == "hello chunked world");
        assert(!store.has_session("merge-ok"));

        store.write_chunk("merge-gap", 0, "a");
        store.write_chunk("merge-gap", 2, "c");
        const auto gap = merger.merge(MergeRequest{
            .upload_id = "merge-gap",
            .total_chunks = 3,
            .destination = resolver.resolve_for_new_entry("gap.txt"),
        });
        assert(gap.error == ErrorCode::MissingChunks);
        assert(gap.message.find("chunk 1 of 3") != std::string::npos);
        assert(!std::filesystem::exists(resolver.root() / "gap.txt"));
        assert(store.has_session("merge-gap"));

        store.write_chunk("merge-size", 0, "abc");
        store.write_chunk("merge-size", 1, "def");
        const auto mismatch = merger.merge(MergeRequest{
            .upload_id = "merge-size",
            .total_chunks = 2,
            .destination = resolver.resolve_for_new_entry("size.txt"),
            .expected_size = 7,
        });
        assert(mismatch.error == ErrorCode::SizeMismatch);
        assert(!std::filesystem::exists(resolver.root() / "size.txt"));
        assert(store.has_session("merge-size"));

        const auto too_big = merger.merge(MergeRequest{
            .upload_id = "merge-size",
            .total_chunks = 2,
            .destination = resolver.resolve_for_new_entry("size.txt"),
            .max_file_bytes = 5,
        });
        assert(too_big.error == ErrorCode::FileTooLarge);

        const auto over_quota = merger.merge(MergeRequest{
            .upload_id = "merge-size",
            .total_chunks = 2,
            .destination = resolver.resolve_for_new_entry("size.txt"),
            .quota_remaining = 5,
        });
        assert(over_quota.error == ErrorCode::SessionQuotaExceeded);

        write_file(root / "taken.txt", "original");
        const auto taken = merger.merge(MergeRequest{
            .upload_id = "merge-size",
            .total_chunks = 2,
            .destination = resolver.resolve_for_new_entry("taken.txt"),
        });
        assert(taken.error == ErrorCode::AlreadyExists);
        assert(read_file(root / "taken.txt") == "original");
        assert(store.has_session("merge-size"));

        const FullDisk full(root);
        const Merger starved(store, kPolicy, full);
        const auto no_room = starved.merge(MergeRequest{
            .upload_id = "merge-size",
            .total_chunks = 2,
            .destination = resolver.resolve_for_new_entry("size.txt"),
        });
        assert(no_room.error == ErrorCode::InsufficientSpace);
        assert(!std::filesystem::exists(resolver.root() / "size.txt"));

        cleanup_path(root);
        cleanup_path(chunk_root);
    }

    void test_concurrent_merges_have_one_winner()
    {
        const auto root = fresh_dir("nanocloud_race_root");
        const auto chunk_root = fresh_dir("nanocloud_race_chunks");
        const PathResolver resolver(root);
        FilesystemChunkStore store(chunk_root);
        const StorageInfoProvider storage(root);
        const Merger merger(store, kPolicy, storage);

        const std::string first(256 * 1024, 'a');
        const std::string second(256 * 1024, 'b');
        store.write_chunk("race-one", 0, first);
        store.write_chunk("race-two", 0, second);
        const auto destination = resolver.resolve_for_new_entry("contested.bin");

        std::atomic<bool> go{false};
        MergeOutcome outcomes[2];
        auto run = [&](int slot, const std::string &id)
        {
            while (!go.load())
            {
                std::this_thread::yield();
            }
            outcomes[slot] = merger.merge(MergeRequest{.upload_id = id, .total_chunks = 1, .destination = destination});
        };
        std::thread a(run, 0, std::string("race-one"));
        std::thread b(run, 1, std::string("race-two"));
        go.store(true);
        a.join();
        b.join();

        const int winners = static_cast<int>(outcomes[0].ok()) + static_cast<int>(outcomes[1].ok());
        assert(winners == 1);
        const auto &loser = outcomes[0].ok() ? outcomes[1] : outcomes[0];
        assert(loser.error == ErrorCode::AlreadyExists);
        const auto content = read_file(destination.absolute());
        assert(content == first || content == second);

        cleanup_path(root);
        cleanup_path(chunk_root);
    }

    struct UploaderFixture
    {
        std::filesystem::path root = fresh_dir("nanocloud_small_root");
        std::filesystem::path chunk_root = fresh_dir("nanocloud_small_chunks");
        ServerConfig config;
        PathResolver resolver{root};
        FilesystemChunkStore chunks{chunk_root};
        StorageInfoProvider storage{root};

        UploaderFixture()
        {
            config.storage_root = root;
            config.chunk_root = chunk_root;
        }

        ~UploaderFixture()
        {
            cleanup_path(root);
            cleanup_path(chunk_root);
        }

        UploadContext context() { return UploadContext{config, resolver, chunks, storage, kPolicy}; }
    };

    void test_small_file_uploader()
    {
        UploaderFixture fixture;
        const SmallFileUploader uploader(fixture.context());
        const NeverDisconnected connected;
        const auto target = fixture.resolver.resolve_directory("");
        UploadQuota quota(1024);

        const auto stored = uploader.upload(target, SmallFile{.original_name = "notes?.txt", .data = "hello"}, quota,
                                            connected);
        assert(stored.success);
        assert(stored.sanitized_name == "notes_.txt");
        assert(stored.size == 5);
        assert(read_file(fixture.resolver.root() / "notes_.txt") == "hello");
        assert(quota.used() == 5);
        // Only the published file remains, no temp files.
        assert(count_entries(fixture.resolver.root()) == 1);

        const auto duplicate = uploader.upload(target, SmallFile{.original_name = "notes?.txt", .data = "other"},
                                               quota, connected);
        assert(!duplicate.success);
        assert(duplicate.message == std::string(user_message(ErrorCode::AlreadyExists)));
        assert(read_file(fixture.resolver.root() / "notes_.txt") == "hello");
        assert(quota.used() == 5);

        const auto folder = uploader.upload(
            target, SmallFile{.original_name = "pic.jpg", .relative_path = "album/../2024/pic.jpg", .data = "jpg"},
            quota, connected);
        assert(folder.success);
        assert(folder.sanitized_name == "album/2024/pic.jpg");
        assert(std::filesystem::exists(fixture.resolver.root() / "album" / "2024" / "pic.jpg"));

        const auto unnamed = uploader.upload(target, SmallFile{.original_name = "..", .data = "x"}, quota, connected);
        assert(unnamed.success);
        assert(unnamed.sanitized_name.starts_with("file_"));

        const FlagSignal gone(true);
        const auto aborted = uploader.upload(target, SmallFile{.original_name = "partial.bin", .data = "abc"}, quota,
                                             gone);
        assert(!aborted.success);
        assert(aborted.message == std::string(user_message(ErrorCode::Aborted)));
        assert(!std::filesystem::exists(fixture.resolver.root() / "partial.bin"));
        assert(count_entries(fixture.resolver.root()) == 5);

        UploadQuota tight(2);
        const auto over_quota = uploader.upload(target, SmallFile{.original_name = "q.txt", .data = "abc"}, tight,
                                                connected);
        assert(!over_quota.success);
        assert(over_quota.message == std::string(user_message(ErrorCode::SessionQuotaExceeded)));

        fixture.config.max_file_bytes = 2;
        const auto too_large = uploader.upload(target, SmallFile{.original_name = "big.txt", .data = "abc"}, quota,
                                               connected);
        assert(!too_large.success);
        assert(too_large.message == std::string(user_message(ErrorCode::FileTooLarge)));
        assert(!std::filesystem::exists(fixture.resolver.root() / "big.txt"));
    }

    void test_quota_ledger_persists()
    {
        const auto chunk_root = fresh_dir("nanocloud_quota");
        {
            QuotaLedger ledger(chunk_root);
            UploadQuota quota(100, &ledger, std::string("token-1"));
            assert(quota.remaining() == 100);
            quota.charge(60);
            assert(!quota.allows(41));
            assert(quota.allows(40));
            ledger.add("../bad", 5);
            assert(ledger.used("../bad") == 0);
        }
        QuotaLedger reopened(chunk_root);
        assert(reopened.used("token-1") == 60);
        UploadQuota resumed(100, &reopened, std::string("token-1"));
        assert(resumed.remaining() == 40);

        UploadQuota anonymous(10);
        anonymous.charge(4);
        assert(anonymous.remaining() == 6);

        cleanup_path(chunk_root);
    }

    void test_config_loading()
    {
        const auto dir = fresh_dir("nanocloud_config");
        const auto path = dir / "server.json";
        write_file(path, R"({
            "storage_root": "/srv/files",
            "port": 8080,
            "dir_permissions": "0750",
            "file_permissions": 416,
            "chunk_stale_hours": 4,
            "read_only": true,
            "request_timeout_seconds": 30,
            "log_level": "debug",
            "file_owner": null
        })");

        ServerConfig config;
        load_config_file(path, config);
        assert(config.storage_root == "/srv/files");
        assert(config.port == 8080);
        assert(config.dir_permissions == static_cast<std::filesystem::perms>(0750));
        assert(config.file_permissions == static_cast<std::filesystem::perms>(0640));
        assert(config.chunk_stale_age == std::chrono::hours(4));
        assert(config.read_only);
        assert(config.request_timeout == std::chrono::seconds(30));
        assert(config.log_level == spdlog::level::debug);
        assert(!config.file_owner.has_value());
        validate_config(config);

        write_file(path, R"({"storage_root": "/srv", "shell_access": true})");
        bool rejected = false;
        try
        {
            load_config_file(path, config);
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);

        write_file(path, R"({"port": "eighty"})");
        rejected = false;
        try
        {
            load_config_file(path, config);
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);

        ServerConfig bad;
        bad.storage_root = "/srv";
        bad.chunk_size = 0;
        rejected = false;
        try
        {
            validate_config(bad);
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);

        cleanup_path(dir);
    }

    void test_operation_gate()
    {
        ServerConfig config;
        assert(check_operation_allowed(config, Operation::Upload) == ErrorCode::Ok);
        assert(check_operation_allowed(config, Operation::UploadCheck) == ErrorCode::Ok);

        config.upload_enabled = false;
        assert(check_operation_allowed(config, Operation::UploadChunk) == ErrorCode::OperationDisabled);

        config.upload_enabled = true;
        config.read_only = true;
        assert(check_operation_allowed(config, Operation::Upload) == ErrorCode::OperationDisabled);
        assert(check_operation_allowed(config, Operation::UploadCheck) == ErrorCode::OperationDisabled);
    }

} // namespace

void run_server_component_tests()
{
    test_name_sanitizer();
    test_path_resolver_containment();
    test_chunk_store_basics();
    test_stale_sweeper();
    test_merger_success_and_failures();
    test_concurrent_merges_have_one_winner();
    test_small_file_uploader();
    test_quota_ledger_persists();
    test_config_loading();
    test_operation_gate();
}
