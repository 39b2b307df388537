#include "nanocloud/server/operation_gate.hpp"

#include "nanocloud/server/config.hpp"

namespace nanocloud::server
{

    nanocloud::ErrorCode check_operation_allowed(const ServerConfig &config, Operation operation) noexcept
    {
        if (config.read_only)
        {
            return nanocloud::ErrorCode::OperationDisabled;
        }
        switch (operation)
        {
        case Operation::Upload:
        case Operation::UploadChunk:
        case Operation::UploadCheck:
            return config.upload_enabled ? nanocloud::ErrorCode::Ok : nanocloud::ErrorCode::OperationDisabled;
        }
        return nanocloud::ErrorCode::OperationDisabled;
    }

    std::optional<Operation> operation_for(protocol::Action action) noexcept
    {
        switch (action)
        {
        case protocol::Action::Upload:
            return Operation::Upload;
        case protocol::Action::UploadChunk:
            return Operation::UploadChunk;
        case protocol::Action::UploadCheck:
            return Operation::UploadCheck;
        case protocol::Action::Info:
            return std::nullopt;
        }
        return std::nullopt;
    }

} // namespace nanocloud::server
