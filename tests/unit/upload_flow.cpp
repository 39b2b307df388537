#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "nanocloud/error_codes.hpp"
#include "nanocloud/server/api.hpp"
#include "nanocloud/server/chunk_store.hpp"
#include "nanocloud/server/config.hpp"
#include "nanocloud/server/disconnect_signal.hpp"
#include "nanocloud/server/path_resolver.hpp"
#include "nanocloud/server/permissions.hpp"
#include "nanocloud/server/quota_ledger.hpp"
#include "nanocloud/server/storage_info.hpp"
#include "nanocloud/server/upload_context.hpp"
#include "nanocloud/server/upload_session.hpp"
#include "nanocloud/upload_identity.hpp"

using namespace nanocloud;
using namespace nanocloud::server;

namespace
{

    constexpr std::uint64_t kTwoMiB = 2 * 1024 * 1024;

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    class FlagSignal final : public DisconnectSignal
    {
    public:
        explicit FlagSignal(bool aborted) : aborted_(aborted) {}
        bool aborted() const override { return aborted_; }

    private:
        bool aborted_;
    };

    ServerConfig make_config(const std::string &name)
    {
        const auto base = std::filesystem::temp_directory_path() / name;
        cleanup_path(base);
        ServerConfig config;
        config.storage_root = base / "storage";
        config.chunk_root = base / "chunks";
        config.chunk_size = kTwoMiB;
        config.chunk_threshold = kTwoMiB;
        return config;
    }

    // A request as httplib hands it to a route after decoding a multipart body.
    httplib::Request post(std::string_view action, const httplib::MultipartFormDataItems &form,
                          std::optional<std::string> token = std::nullopt)
    {
        httplib::Request request;
        request.method = "POST";
        request.path = "/api";
        request.target = "/api?action=" + std::string(action);
        request.params.emplace("action", std::string(action));
        request.set_header("Content-Type", "multipart/form-data; boundary=nanocloud-test");
        if (token)
        {
            request.set_header("X-Session-Token", *token);
        }
        for (const auto &part : form)
        {
            request.files.emplace(part.name, part);
        }
        return request;
    }

    httplib::Request get(std::string_view action)
    {
        httplib::Request request;
        request.method = "GET";
        request.path = "/api";
        request.target = "/api?action=" + std::string(action);
        request.params.emplace("action", std::string(action));
        return request;
    }

    httplib::Response handle(Api &api, const httplib::Request &request,
                             const DisconnectSignal &signal = NeverDisconnected{})
    {
        httplib::Response response;
        api.handle(request, response, signal);
        return response;
    }

    nlohmann::json body_of(const httplib::Response &response)
    {
        return nlohmann::json::parse(response.body);
    }

    httplib::MultipartFormData field(const std::string &name, const std::string &value)
    {
        return {name, value, "", ""};
    }

    httplib::MultipartFormData file_part(const std::string &name, const std::string &filename, std::string_view data)
    {
        return {name, std::string(data), filename, "application/octet-stream"};
    }

    nlohmann::json send_chunk(Api &api, const std::string &upload_id, std::uint64_t index, std::uint64_t total,
                              const std::string &content, const DisconnectSignal &signal, int expected_status = 200)
    {
        const auto range = chunk_range(index, content.size(), kTwoMiB);
        const httplib::MultipartFormDataItems form{
            field("uploadId", upload_id),
            field("chunkIndex", std::to_string(index)),
            field("totalChunks", std::to_string(total)),
            field("filename", "movie.mp4"),
            field("fileSize", std::to_string(content.size())),
            field("relativePath", ""),
            field("path", "videos"),
            file_part("chunk", "blob", std::string_view(content).substr(range.offset, range.length)),
        };
        const auto response = handle(api, post("upload_chunk", form), signal);
        assert(response.status == expected_status);
        return body_of(response);
    }

    nlohmann::json check(Api &api, const std::string &upload_id)
    {
        const auto response = handle(api, post("upload_check", {field("uploadId", upload_id)}));
        assert(response.status == 200);
        return body_of(response);
    }

    void test_ten_megabyte_resume_scenario()
    {
        auto config = make_config("nanocloud_flow_resume");
        std::filesystem::create_directories(config.storage_root / "videos");
        const auto chunk_root = config.chunk_root;
        const auto storage_root = config.storage_root;
        Api api(config);
        const NeverDisconnected connected;

        std::string content(10 * 1024 * 1024, '\0');
        for (std::size_t i = 0; i < content.size(); ++i)
        {
            content[i] = static_cast<char>('a' + (i * 7 + i / 4096) % 26);
        }
        const auto upload_id = derive_upload_id(UploadIdentity{
            .filename = "movie.mp4",
            .size = content.size(),
            .last_modified = 1700000000000,
            .destination = "videos",
        });
        const auto total = chunk_count(content.size(), kTwoMiB);
        assert(total == 5);

        assert(check(api, upload_id).at("exists") == false);
        for (std::uint64_t index = 0; index < 3; ++index)
        {
            const auto reply = send_chunk(api, upload_id, index, total, content, connected);
            assert(reply.at("success") == true);
            assert(reply.at("chunkIndex") == index);
            assert(!reply.contains("filename"));
        }

        // The client drops here; a new connection asks where to resume.
        const auto status = check(api, upload_id);
        assert(status.at("exists") == true);
        assert(status.at("nextChunkIndex") == 3);

        assert(send_chunk(api, upload_id, 3, total, content, connected).at("success") == true);
        const auto final_reply = send_chunk(api, upload_id, 4, total, content, connected);
        assert(final_reply.at("success") == true);
        assert(final_reply.at("filename") == "movie.mp4");
        assert(final_reply.at("size") == 10485760);
        assert(final_reply.contains("storage"));

        const auto stored = std::filesystem::canonical(storage_root) / "videos" / "movie.mp4";
        assert(std::filesystem::file_size(stored) == 10485760);
        assert(read_file(stored) == content);
        assert(std::filesystem::is_empty(chunk_root / "chunks"));
        assert(check(api, upload_id).at("exists") == false);

        // Same file again is refused at chunk 0 rather than after a full upload.
        const auto again = send_chunk(api, upload_id, 0, total, content, connected);
        assert(again.at("success") == false);
        assert(again.at("message") == std::string(user_message(ErrorCode::AlreadyExists)));
        assert(std::filesystem::is_empty(chunk_root / "chunks"));

        cleanup_path(chunk_root.parent_path());
    }

    struct SessionFixture
    {
        ServerConfig config = make_config("nanocloud_flow_session");
        PathResolver resolver{config.storage_root};
        FilesystemChunkStore chunks{config.chunk_root};
        StorageInfoProvider storage{resolver.root()};
        PermissionPolicy permissions{PermissionPolicy::from_config(config)};
        UploadSession session{UploadContext{config, resolver, chunks, storage, permissions}};

        ~SessionFixture() { cleanup_path(config.chunk_root.parent_path()); }
    };

    ChunkRequest chunk_request(const std::string &id, std::uint64_t index, std::uint64_t total, std::string_view data,
                               std::optional<std::uint64_t> file_size = std::nullopt)
    {
        return ChunkRequest{
            .upload_id = id,
            .chunk_index = index,
            .total_chunks = total,
            .filename = "report.txt",
            .file_size = file_size,
            .data = data,
        };
    }

    void test_out_of_order_resume()
    {
        SessionFixture fixture;
        const NeverDisconnected connected;
        UploadQuota quota(fixture.config.max_session_bytes);
        const std::string id = "out-of-order";

        assert(fixture.session.state(id, 4) == SessionState::Unknown);
        assert(fixture.session.receive_chunk(chunk_request(id, 0, 4, "aa"), quota, connected).status ==
               ChunkStatus::Acknowledged);
        assert(fixture.session.state(id, 4) == SessionState::InProgress);

        const auto early_last = fixture.session.receive_chunk(chunk_request(id, 3, 4, "dd"), quota, connected);
        assert(early_last.status == ChunkStatus::MergeFailed);
        assert(early_last.error == ErrorCode::MissingChunks);
        assert(fixture.session.check_status(id).next_chunk_index == 1);

        assert(fixture.session.receive_chunk(chunk_request(id, 2, 4, "cc"), quota, connected).status ==
               ChunkStatus::Acknowledged);
        assert(fixture.session.check_status(id).next_chunk_index == 1);
        assert(fixture.session.receive_chunk(chunk_request(id, 1, 4, "bb"), quota, connected).status ==
               ChunkStatus::Acknowledged);

        const auto status = fixture.session.check_status(id);
        assert(status.exists);
        assert(status.next_chunk_index == 4);
        assert(fixture.session.state(id, 4) == SessionState::ReadyToMerge);

        // Re-sending the last chunk completes the upload.
        const auto merged = fixture.session.receive_chunk(chunk_request(id, 3, 4, "dd"), quota, connected);
        assert(merged.status == ChunkStatus::Merged);
        assert(merged.result.has_value());
        assert(merged.result->size == 8);
        assert(read_file(fixture.resolver.root() / "report.txt") == "aabbccdd");
        assert(!fixture.chunks.has_session(id));
        assert(quota.used() == 8);
    }

    void test_disconnect_rolls_back_session()
    {
        SessionFixture fixture;
        UploadQuota quota(fixture.config.max_session_bytes);
        const std::string id = "dropped-upload";

        assert(fixture.session.receive_chunk(chunk_request(id, 0, 3, "aa"), quota, NeverDisconnected{}).status ==
               ChunkStatus::Acknowledged);
        const auto aborted = fixture.session.receive_chunk(chunk_request(id, 1, 3, "bb"), quota, FlagSignal(true));
        assert(aborted.status == ChunkStatus::Aborted);
        assert(aborted.error == ErrorCode::Aborted);
        assert(!fixture.chunks.has_session(id));

        const auto status = fixture.session.check_status(id);
        assert(!status.exists);
        assert(status.next_chunk_index == 0);
    }

    void test_failed_merge_keeps_chunks()
    {
        SessionFixture fixture;
        const NeverDisconnected connected;
        UploadQuota quota(fixture.config.max_session_bytes);
        const std::string id = "short-upload";

        assert(fixture.session.receive_chunk(chunk_request(id, 0, 2, "abc", 10), quota, connected).status ==
               ChunkStatus::Acknowledged);
        const auto failed = fixture.session.receive_chunk(chunk_request(id, 1, 2, "def", 10), quota, connected);
        assert(failed.status == ChunkStatus::MergeFailed);
        assert(failed.error == ErrorCode::SizeMismatch);
        assert(!std::filesystem::exists(fixture.resolver.root() / "report.txt"));
        assert(fixture.chunks.has_session(id));
        assert(fixture.session.check_status(id).next_chunk_index == 2);
        assert(quota.used() == 0);
    }

    void test_chunk_request_validation()
    {
        SessionFixture fixture;
        const NeverDisconnected connected;
        UploadQuota quota(fixture.config.max_session_bytes);

        assert(fixture.session.receive_chunk(chunk_request("bad/id", 0, 1, "x"), quota, connected).error ==
               ErrorCode::InvalidUploadId);
        assert(fixture.session.receive_chunk(chunk_request("ok-id", 2, 2, "x"), quota, connected).error ==
               ErrorCode::InvalidRequest);
        assert(fixture.session.receive_chunk(chunk_request("ok-id", 0, kMaxTotalChunks + 1, "x"), quota, connected)
                   .error == ErrorCode::InvalidRequest);

        auto unnamed = chunk_request("ok-id", 0, 2, "x");
        unnamed.filename = "..";
        assert(fixture.session.receive_chunk(unnamed, quota, connected).error == ErrorCode::InvalidName);

        // A path ending in ".." must not store the file under its folder's name.
        for (const std::uint64_t index : {0, 1})
        {
            auto dotted = chunk_request("ok-id", index, 2, "x");
            dotted.filename = "video.bin";
            dotted.relative_path = "album/..";
            assert(fixture.session.receive_chunk(dotted, quota, connected).error == ErrorCode::InvalidName);
        }
        assert(!std::filesystem::exists(fixture.resolver.root() / "album"));

        auto missing_dir = chunk_request("ok-id", 0, 2, "x");
        missing_dir.target_path = "nowhere";
        assert(fixture.session.receive_chunk(missing_dir, quota, connected).error == ErrorCode::NotFound);

        fixture.config.max_file_bytes = 4;
        assert(fixture.session.receive_chunk(chunk_request("ok-id", 0, 2, "x", 5), quota, connected).error ==
               ErrorCode::FileTooLarge);
        UploadQuota tight(4);
        fixture.config.max_file_bytes = 100;
        assert(fixture.session.receive_chunk(chunk_request("ok-id", 0, 2, "x", 5), tight, connected).error ==
               ErrorCode::SessionQuotaExceeded);
        assert(!fixture.chunks.has_session("ok-id"));
    }

    void test_chunk_zero_sweeps_stale_sessions()
    {
        SessionFixture fixture;
        const NeverDisconnected connected;
        UploadQuota quota(fixture.config.max_session_bytes);

        assert(fixture.session.receive_chunk(chunk_request("stale-a", 0, 2, "aa"), quota, connected).status ==
               ChunkStatus::Acknowledged);
        assert(fixture.session.receive_chunk(chunk_request("fresh-c", 0, 3, "cc"), quota, connected).status ==
               ChunkStatus::Acknowledged);

        const auto old_stamp = std::filesystem::file_time_type::clock::now() - std::chrono::hours(3);
        std::filesystem::last_write_time(fixture.chunks.chunk_path("stale-a", 0), old_stamp);
        std::filesystem::last_write_time(fixture.chunks.session_dir("stale-a"), old_stamp);

        // A later chunk of another session does not sweep.
        assert(fixture.session.receive_chunk(chunk_request("fresh-c", 1, 3, "cc"), quota, connected).status ==
               ChunkStatus::Acknowledged);
        assert(fixture.chunks.has_session("stale-a"));

        assert(fixture.session.receive_chunk(chunk_request("session-b", 0, 2, "bb"), quota, connected).status ==
               ChunkStatus::Acknowledged);
        assert(!fixture.chunks.has_session("stale-a"));
        assert(fixture.chunks.has_session("fresh-c"));
        assert(fixture.chunks.has_session("session-b"));
        assert(fixture.session.check_status("fresh-c").next_chunk_index == 2);
    }

    void test_small_uploads_through_api()
    {
        auto config = make_config("nanocloud_flow_small");
        config.max_session_bytes = 8;
        const auto base = config.chunk_root.parent_path();
        Api api(config);

        const httplib::MultipartFormDataItems two_files{
            field("path", ""),
            file_part("files[]", "one.txt", "12345"),
            file_part("files[]", "two.txt", "678"),
            field("relativePaths[]", ""),
            field("relativePaths[]", "notes/two.txt"),
        };
        const auto first = body_of(handle(api, post("upload", two_files, std::string("quota-token"))));
        assert(first.at("success") == true);
        assert(first.at("message") == "Upload processed.");
        assert(first.at("results").size() == 2);
        assert(first.at("results")[0].at("filename") == "one.txt");
        assert(first.at("results")[1].at("filename") == "notes/two.txt");
        assert(first.at("results")[1].at("size") == 3);

        const httplib::MultipartFormDataItems over{file_part("files[]", "three.txt", "9")};
        const auto second = body_of(handle(api, post("upload", over, std::string("quota-token"))));
        assert(second.at("results")[0].at("success") == false);
        assert(second.at("results")[0].at("message") == std::string(user_message(ErrorCode::SessionQuotaExceeded)));

        // No token: the cap applies to this request alone.
        const auto third = body_of(handle(api, post("upload", over)));
        assert(third.at("results")[0].at("success") == true);

        auto cookie_request = post("upload", {file_part("files[]", "cookie.txt", "1")});
        cookie_request.set_header("Cookie", "theme=dark; nanocloud_session=quota-token");
        const auto by_cookie = body_of(handle(api, cookie_request));
        assert(by_cookie.at("results")[0].at("success") == false);

        const httplib::MultipartFormDataItems lost{field("path", "missing/folder"), file_part("files[]", "x.txt", "x")};
        const auto not_found = handle(api, post("upload", lost));
        assert(not_found.status == 200);
        assert(body_of(not_found).at("message") == "Target path not found.");

        assert(handle(api, post("upload", {field("path", "")})).status == 400);

        // The ledger outlives the Api instance.
        Api restarted(config);
        const httplib::MultipartFormDataItems later{file_part("files[]", "four.txt", "1")};
        const auto after_restart = body_of(handle(restarted, post("upload", later, std::string("quota-token"))));
        assert(after_restart.at("results")[0].at("success") == false);

        cleanup_path(base);
    }

    void test_api_routing_and_gates()
    {
        auto config = make_config("nanocloud_flow_routing");
        const auto base = config.chunk_root.parent_path();
        Api api(config);

        const auto info = handle(api, get("info"));
        assert(info.status == 200);
        const auto info_body = body_of(info);
        assert(info_body.at("readOnly") == false);
        assert(info_body.at("chunkSize") == kTwoMiB);

        const auto get_upload = handle(api, get("upload"));
        assert(get_upload.status == 405);
        assert(get_upload.get_header_value("Allow") == "POST");
        assert(handle(api, get("list")).status == 400);

        auto put = get("info");
        put.method = "PUT";
        const auto put_reply = handle(api, put);
        assert(put_reply.status == 405);
        assert(put_reply.get_header_value("Allow") == "GET, POST");

        assert(handle(api, post("upload_check", {field("note", "x")})).status == 400);

        const auto rejected = handle(api, post("upload_check", {field("uploadId", "../../etc")}));
        assert(rejected.status == 200);
        assert(body_of(rejected).at("success") == false);

        assert(handle(api, post("upload_chunk", {field("uploadId", "abc")})).status == 400);

        // The action may come from the body when the query has none.
        httplib::Request json_body;
        json_body.method = "POST";
        json_body.path = "/api";
        json_body.set_header("Content-Type", "application/json");
        json_body.body = R"({"action":"upload_check","uploadId":"never-seen"})";
        const auto by_body = handle(api, json_body);
        assert(by_body.status == 200);
        assert(body_of(by_body).at("exists") == false);

        json_body.body = "[1, 2]";
        assert(handle(api, json_body).status == 400);
        json_body.set_header("Content-Type", "text/plain");
        json_body.body = "action=info";
        assert(handle(api, json_body).status == 415);

        config.read_only = true;
        Api read_only(config);
        assert(handle(read_only, post("upload", {file_part("files[]", "x.txt", "x")})).status == 403);
        assert(handle(read_only, post("upload_check", {field("uploadId", "abc")})).status == 403);
        const auto read_only_info = body_of(handle(read_only, get("info")));
        assert(read_only_info.at("readOnly") == true);
        assert(read_only_info.at("uploadEnabled") == false);

        // The same decision is available from the request head alone.
        httplib::Response refused;
        assert(!read_only.admit(get("upload_chunk"), refused));
        assert(refused.status == 403);
        assert(body_of(refused).at("message") == std::string(user_message(ErrorCode::OperationDisabled)));
        httplib::Response allowed;
        assert(read_only.admit(get("info"), allowed));
        assert(api.admit(get("upload_chunk"), allowed));

        cleanup_path(base);
    }

} // namespace

void run_upload_flow_tests()
{
    test_ten_megabyte_resume_scenario();
    test_out_of_order_resume();
    test_disconnect_rolls_back_session();
    test_failed_merge_keeps_chunks();
    test_chunk_request_validation();
    test_chunk_zero_sweeps_stale_sessions();
    test_small_uploads_through_api();
    test_api_routing_and_gates();
}
