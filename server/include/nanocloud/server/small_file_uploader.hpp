#pragma once

#include <string>
#include <string_view>

#include "nanocloud/protocol.hpp"
#include "nanocloud/server/path_resolver.hpp"
#include "nanocloud/server/upload_context.hpp"

namespace nanocloud::server
{

    class DisconnectSignal;
    class UploadQuota;

    struct SmallFile
    {
        std::string original_name;
        // Sub-path inside an uploaded folder; empty for a plain file.
        std::string relative_path;
        std::string_view data;
    };

    // Single-request upload for files at or below the chunk threshold. The
    // bytes go to a temp file beside the destination and are published with a
    // no-overwrite link, so a file appears either whole or not at all.
    class SmallFileUploader
    {
    public:
        explicit SmallFileUploader(UploadContext context);

        nanocloud::protocol::UploadResult upload(const PathHandle &target_dir, const SmallFile &file,
                                                 UploadQuota &quota, const DisconnectSignal &signal) const;

    private:
        UploadContext context_;
    };

} // namespace nanocloud::server
