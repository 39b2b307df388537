#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nanocloud/client/config.hpp"
#include "nanocloud/client/http_client.hpp"
#include "nanocloud/client/logger.hpp"
#include "nanocloud/protocol.hpp"
#include "nanocloud/upload_identity.hpp"

namespace nanocloud::client
{

    struct FileJob
    {
        std::filesystem::path local;
        // "<folder>/<path inside folder>" for folder uploads, empty otherwise.
        std::string relative_path;
    };

    // Expands folders recursively into per-file jobs, in a stable order.
    std::vector<FileJob> collect_jobs(const std::vector<std::filesystem::path> &inputs);

    UploadIdentity identity_for(const FileJob &job, std::uint64_t size, const std::string &destination);

    class Uploader
    {
    public:
        Uploader(const ClientConfig &config, HttpClient &http, Logger &logger);

        // Uploads every input; returns the process exit status.
        int run();

    private:
        bool upload_file(const FileJob &job);
        bool upload_small(const FileJob &job, std::uint64_t size);
        bool upload_chunked(const FileJob &job, std::uint64_t size);
        std::optional<nanocloud::protocol::ChunkResponse> send_chunk(const httplib::MultipartFormDataItems &form,
                                                                     const std::string &label);
        void fetch_info();

        const ClientConfig &config_;
        HttpClient &http_;
        Logger &logger_;
        std::uint64_t chunk_size_{2 * 1024 * 1024};
        std::uint64_t chunk_threshold_{2 * 1024 * 1024};
    };

} // namespace nanocloud::client
