#pragma once

namespace nanocloud::server
{

    struct ServerConfig;
    class PathResolver;
    class ChunkStore;
    class StorageInfoProvider;
    class PermissionPolicy;

    // Collaborators shared by both upload paths. All references outlive the
    // uploaders built on them.
    struct UploadContext
    {
        const ServerConfig &config;
        const PathResolver &resolver;
        ChunkStore &chunks;
        const StorageInfoProvider &storage;
        const PermissionPolicy &permissions;
    };

} // namespace nanocloud::server
