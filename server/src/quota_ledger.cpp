#include "nanocloud/server/quota_ledger.hpp"

#include <chrono>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "nanocloud/upload_identity.hpp"

namespace nanocloud::server
{

    namespace
    {
        constexpr auto kSessionsDir = "sessions";
    }

    QuotaLedger::QuotaLedger(const std::filesystem::path &chunk_root) : dir_(chunk_root / kSessionsDir)
    {
        std::filesystem::create_directories(dir_);
    }

    bool QuotaLedger::is_valid_token(std::string_view token) noexcept
    {
        return nanocloud::is_valid_upload_id(token);
    }

    std::uint64_t QuotaLedger::used(std::string_view token) const
    {
        if (!is_valid_token(token))
        {
            return 0;
        }
        std::lock_guard lock(mutex_);
        return read_locked(token);
    }

    void QuotaLedger::add(std::string_view token, std::uint64_t bytes)
    {
        if (!is_valid_token(token))
        {
            return;
        }
        std::lock_guard lock(mutex_);
        const auto total = read_locked(token) + bytes;
        const nlohmann::json json{
            {"uploaded_bytes", total},
            {"updated", std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count()},
        };

        const auto path = entry_path(token);
        auto temp = path;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            out << json.dump(2);
            if (!out)
            {
                spdlog::warn("Cannot persist quota for session {}", token);
                return;
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, path, ec);
        if (ec)
        {
            spdlog::warn("Cannot persist quota for session {}: {}", token, ec.message());
        }
    }

    std::filesystem::path QuotaLedger::entry_path(std::string_view token) const
    {
        return dir_ / (std::string(token) + ".json");
    }

    std::uint64_t QuotaLedger::read_locked(std::string_view token) const
    {
        std::ifstream in(entry_path(token));
        if (!in.is_open())
        {
            return 0;
        }
        try
        {
            nlohmann::json json;
            in >> json;
            return json.value("uploaded_bytes", std::uint64_t{0});
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::warn("Ignoring corrupt quota entry for session {}: {}", token, ex.what());
            return 0;
        }
    }

    UploadQuota::UploadQuota(std::uint64_t limit, QuotaLedger *ledger, std::optional<std::string> token)
        : limit_(limit), ledger_(ledger), token_(std::move(token))
    {
        if (ledger_ && token_)
        {
            used_ = ledger_->used(*token_);
        }
    }

    void UploadQuota::charge(std::uint64_t bytes)
    {
        used_ += bytes;
        if (ledger_ && token_)
        {
            ledger_->add(*token_, bytes);
        }
    }

} // namespace nanocloud::server
