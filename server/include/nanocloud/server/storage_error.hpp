#pragma once

#include <stdexcept>
#include <string>

#include "nanocloud/error_codes.hpp"

namespace nanocloud::server
{

    // Thrown by the filesystem-facing layers. what() may contain absolute paths
    // and is only ever logged; clients see user_message(code()).
    class StorageError : public std::runtime_error
    {
    public:
        StorageError(nanocloud::ErrorCode code, std::string message);

        nanocloud::ErrorCode code() const noexcept { return code_; }

    private:
        nanocloud::ErrorCode code_;
    };

} // namespace nanocloud::server
