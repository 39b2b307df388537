#include "nanocloud/server/storage_info.hpp"

#include <cmath>
#include <system_error>

#include <spdlog/spdlog.h>

namespace nanocloud::server
{

    StorageInfoProvider::StorageInfoProvider(std::filesystem::path storage_root)
        : storage_root_(std::move(storage_root)) {}

    nanocloud::protocol::StorageInfo StorageInfoProvider::storage_info() const
    {
        std::error_code ec;
        const auto space = std::filesystem::space(storage_root_, ec);
        if (ec)
        {
            spdlog::warn("Cannot query disk space for {}: {}", storage_root_.string(), ec.message());
            return {};
        }
        nanocloud::protocol::StorageInfo info{
            .total_bytes = space.capacity,
            .free_bytes = space.available,
            .used_bytes = space.capacity >= space.free ? space.capacity - space.free : 0,
        };
        if (info.total_bytes > 0)
        {
            const auto percent = static_cast<double>(info.used_bytes) * 100.0 / static_cast<double>(info.total_bytes);
            info.used_percent = std::round(percent * 100.0) / 100.0;
        }
        return info;
    }

    bool StorageInfoProvider::has_room_for(const std::filesystem::path &where, std::uint64_t bytes) const
    {
        std::error_code ec;
        const auto space = std::filesystem::space(where, ec);
        if (ec)
        {
            spdlog::warn("Cannot query disk space for {}: {}", where.string(), ec.message());
            return true;
        }
        return space.available >= bytes;
    }

} // namespace nanocloud::server
