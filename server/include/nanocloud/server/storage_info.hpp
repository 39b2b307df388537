#pragma once

#include <cstdint>
#include <filesystem>

#include "nanocloud/protocol.hpp"

namespace nanocloud::server
{

    // Disk usage of the volume holding the storage root. Virtual so tests can
    // simulate a full disk.
    class StorageInfoProvider
    {
    public:
        explicit StorageInfoProvider(std::filesystem::path storage_root);
        virtual ~StorageInfoProvider() = default;

        virtual nanocloud::protocol::StorageInfo storage_info() const;

        // True when the volume holding `where` can take `bytes` more. A volume
        // that cannot be queried is reported as having room.
        virtual bool has_room_for(const std::filesystem::path &where, std::uint64_t bytes) const;

    private:
        std::filesystem::path storage_root_;
    };

} // namespace nanocloud::server
