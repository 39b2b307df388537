#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace nanocloud::server
{

    // Bytes uploaded per client session token, persisted as
    // <chunk_root>/sessions/<token>.json so the total survives restarts.
    class QuotaLedger
    {
    public:
        explicit QuotaLedger(const std::filesystem::path &chunk_root);

        // Tokens outside [A-Za-z0-9-]{1,128} are never persisted.
        static bool is_valid_token(std::string_view token) noexcept;

        std::uint64_t used(std::string_view token) const;
        void add(std::string_view token, std::uint64_t bytes);

    private:
        std::filesystem::path dir_;
        mutable std::mutex mutex_;

        std::filesystem::path entry_path(std::string_view token) const;
        std::uint64_t read_locked(std::string_view token) const;
    };

    // Per-request view of a session's quota. Without a ledger entry the quota
    // only spans the current request.
    class UploadQuota
    {
    public:
        UploadQuota(std::uint64_t limit, QuotaLedger *ledger = nullptr, std::optional<std::string> token = std::nullopt);

        std::uint64_t used() const noexcept { return used_; }
        std::uint64_t remaining() const noexcept { return used_ >= limit_ ? 0 : limit_ - used_; }
        bool allows(std::uint64_t bytes) const noexcept { return bytes <= remaining(); }

        void charge(std::uint64_t bytes);

    private:
        std::uint64_t limit_;
        std::uint64_t used_{};
        QuotaLedger *ledger_;
        std::optional<std::string> token_;
    };

} // namespace nanocloud::server
