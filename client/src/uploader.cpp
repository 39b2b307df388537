#include "nanocloud/client/uploader.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace nanocloud::client
{

    namespace
    {
        std::int64_t to_unix_millis(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto system_time = time_point_cast<milliseconds>(time - std::filesystem::file_time_type::clock::now() +
                                                                   system_clock::now());
            return static_cast<std::int64_t>(system_time.time_since_epoch().count());
        }

        std::string display_name(const FileJob &job)
        {
            return job.relative_path.empty() ? job.local.filename().string() : job.relative_path;
        }

        std::string read_range(const std::filesystem::path &path, const ChunkRange &range)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open " + path.string());
            }
            in.seekg(static_cast<std::streamoff>(range.offset));
            std::string data(static_cast<std::size_t>(range.length), '\0');
            in.read(data.data(), static_cast<std::streamsize>(data.size()));
            if (static_cast<std::uint64_t>(in.gcount()) != range.length)
            {
                throw std::runtime_error("Short read from " + path.string());
            }
            return data;
        }

    } // namespace

    std::vector<FileJob> collect_jobs(const std::vector<std::filesystem::path> &inputs)
    {
        std::vector<FileJob> jobs;
        for (const auto &input : inputs)
        {
            if (!std::filesystem::is_directory(input))
            {
                jobs.push_back(FileJob{.local = input});
                continue;
            }
            auto normal = std::filesystem::absolute(input).lexically_normal();
            if (normal.filename().empty())
            {
                normal = normal.parent_path();
            }
            const auto base = normal.filename();

            std::vector<FileJob> folder_jobs;
            for (const auto &entry : std::filesystem::recursive_directory_iterator(input))
            {
                if (!entry.is_regular_file())
                {
                    continue;
                }
                const auto inside = entry.path().lexically_relative(input);
                folder_jobs.push_back(FileJob{
                    .local = entry.path(),
                    .relative_path = (base / inside).generic_string(),
                });
            }
            std::sort(folder_jobs.begin(), folder_jobs.end(), [](const FileJob &a, const FileJob &b)
                      { return a.relative_path < b.relative_path; });
            jobs.insert(jobs.end(), folder_jobs.begin(), folder_jobs.end());
        }
        return jobs;
    }

    UploadIdentity identity_for(const FileJob &job, std::uint64_t size, const std::string &destination)
    {
        return UploadIdentity{
            .filename = job.local.filename().string(),
            .size = size,
            .last_modified = to_unix_millis(std::filesystem::last_write_time(job.local)),
            .destination = destination,
            .relative_path = job.relative_path,
        };
    }

    Uploader::Uploader(const ClientConfig &config, HttpClient &http, Logger &logger)
        : config_(config), http_(http), logger_(logger) {}

    int Uploader::run()
    {
        fetch_info();

        const auto jobs = collect_jobs(config_.inputs);
        std::size_t failures = 0;
        for (const auto &job : jobs)
        {
            if (!upload_file(job))
            {
                ++failures;
            }
        }
        std::cout << (jobs.size() - failures) << " of " << jobs.size() << " file(s) uploaded" << std::endl;
        return failures == 0 ? 0 : 1;
    }

    void Uploader::fetch_info()
    {
        const auto info = http_.get_info().get<nanocloud::protocol::InfoResponse>();
        if (info.chunk_size > 0)
        {
            chunk_size_ = info.chunk_size;
        }
        if (info.chunk_threshold > 0)
        {
            chunk_threshold_ = info.chunk_threshold;
        }
        if (config_.chunk_size)
        {
            chunk_size_ = *config_.chunk_size;
        }
        if (info.read_only || !info.upload_enabled)
        {
            std::cout << "WARNING: server does not accept uploads" << std::endl;
        }
        logger_.log("info", "chunk size ", chunk_size_, ", threshold ", chunk_threshold_, ", free ",
                    info.storage.free_bytes);
    }

    bool Uploader::upload_file(const FileJob &job)
    {
        const auto name = display_name(job);
        std::error_code ec;
        const auto size = std::filesystem::file_size(job.local, ec);
        if (ec)
        {
            std::cout << "ERROR: " << name << ": " << ec.message() << std::endl;
            return false;
        }

        try
        {
            return size > chunk_threshold_ ? upload_chunked(job, size) : upload_small(job, size);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("upload", name, ": ", ex.what());
            std::cout << "ERROR: " << name << ": " << ex.what() << std::endl;
            return false;
        }
    }

    bool Uploader::upload_small(const FileJob &job, std::uint64_t size)
    {
        const auto name = display_name(job);
        httplib::MultipartFormDataItems form{
            {"path", config_.target_path, "", ""},
            {"files[]", read_range(job.local, {0, size}), job.local.filename().string(), "application/octet-stream"},
        };
        if (!job.relative_path.empty())
        {
            form.push_back({"relativePaths[]", job.relative_path, "", ""});
        }

        const auto response = http_.call("upload", form).get<nanocloud::protocol::UploadResponse>();
        if (!response.success || response.results.empty())
        {
            std::cout << "ERROR: " << name << ": " << response.message << std::endl;
            return false;
        }
        const auto &result = response.results.front();
        if (!result.success)
        {
            std::cout << "ERROR: " << name << ": " << result.message << std::endl;
            return false;
        }
        logger_.log("upload", name, " stored as ", result.sanitized_name, " (", result.size, " bytes)");
        std::cout << "OK " << name << " (" << result.size << " bytes)" << std::endl;
        return true;
    }

    bool Uploader::upload_chunked(const FileJob &job, std::uint64_t size)
    {
        const auto name = display_name(job);
        const auto upload_id = derive_upload_id(identity_for(job, size, config_.target_path));
        const auto total = chunk_count(size, chunk_size_);

        const httplib::MultipartFormDataItems check{{"uploadId", upload_id, "", ""}};
        const auto status = http_.call("upload_check", check).get<nanocloud::protocol::UploadCheckResponse>();
        if (!status.success)
        {
            std::cout << "ERROR: " << name << ": " << status.message << std::endl;
            return false;
        }

        // A session that holds every chunk but was never merged restarts at the
        // last chunk so the merge runs again.
        auto start = status.exists ? std::min(status.next_chunk_index, total - 1) : 0;
        if (start > 0)
        {
            std::cout << "Resuming " << name << " at chunk " << start << "/" << total << std::endl;
            logger_.log("resume", name, " id ", upload_id, " from chunk ", start);
        }

        for (auto index = start; index < total; ++index)
        {
            const auto range = chunk_range(index, size, chunk_size_);
            const httplib::MultipartFormDataItems form{
                {"uploadId", upload_id, "", ""},
                {"chunkIndex", std::to_string(index), "", ""},
                {"totalChunks", std::to_string(total), "", ""},
                {"filename", job.local.filename().string(), "", ""},
                {"fileSize", std::to_string(size), "", ""},
                {"relativePath", job.relative_path, "", ""},
                {"path", config_.target_path, "", ""},
                {"chunk", read_range(job.local, range), "blob", "application/octet-stream"},
            };

            const auto label = name + " chunk " + std::to_string(index + 1) + "/" + std::to_string(total);
            const auto response = send_chunk(form, label);
            if (!response)
            {
                std::cout << "ERROR: " << name << ": chunk " << index << " failed; run again to resume" << std::endl;
                return false;
            }
            if (index + 1 == total)
            {
                if (!response->is_final())
                {
                    std::cout << "ERROR: " << name << ": server did not finish the upload" << std::endl;
                    return false;
                }
                logger_.log("upload", name, " merged as ", *response->filename, " (", response->size.value_or(0),
                            " bytes)");
                std::cout << "OK " << name << " (" << response->size.value_or(0) << " bytes)" << std::endl;
            }
        }
        return true;
    }

    std::optional<nanocloud::protocol::ChunkResponse> Uploader::send_chunk(const httplib::MultipartFormDataItems &form,
                                                                           const std::string &label)
    {
        for (unsigned attempt = 1; attempt <= config_.retries; ++attempt)
        {
            std::string failure;
            try
            {
                auto response = http_.call("upload_chunk", form).get<nanocloud::protocol::ChunkResponse>();
                if (response.success)
                {
                    logger_.log("chunk", label, " ok");
                    return response;
                }
                failure = response.message;
            }
            catch (const TransportError &ex)
            {
                failure = ex.what();
            }
            logger_.warn("chunk", label, " attempt ", attempt, " failed: ", failure);
            if (attempt < config_.retries)
            {
                std::this_thread::sleep_for(config_.retry_delay * attempt);
            }
            else
            {
                std::cout << "ERROR: " << label << ": " << failure << std::endl;
            }
        }
        return std::nullopt;
    }

} // namespace nanocloud::client
