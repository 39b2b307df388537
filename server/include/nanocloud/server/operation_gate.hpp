#pragma once

#include <optional>

#include "nanocloud/error_codes.hpp"
#include "nanocloud/protocol.hpp"

namespace nanocloud::server
{

    struct ServerConfig;

    enum class Operation
    {
        Upload,
        UploadChunk,
        UploadCheck
    };

    // Decides whether a mutating operation may run. Read-only mode wins over
    // every per-operation switch. Returns ErrorCode::Ok when allowed.
    nanocloud::ErrorCode check_operation_allowed(const ServerConfig &config, Operation operation) noexcept;

    // The gated operation behind an action; empty for read-only actions.
    std::optional<Operation> operation_for(protocol::Action action) noexcept;

} // namespace nanocloud::server
