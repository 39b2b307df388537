#pragma once

#include <array>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "nanocloud/protocol.hpp"
#include "nanocloud/server/chunk_store.hpp"
#include "nanocloud/server/config.hpp"
#include "nanocloud/server/path_resolver.hpp"
#include "nanocloud/server/permissions.hpp"
#include "nanocloud/server/quota_ledger.hpp"
#include "nanocloud/server/request_fields.hpp"
#include "nanocloud/server/small_file_uploader.hpp"
#include "nanocloud/server/storage_info.hpp"
#include "nanocloud/server/upload_session.hpp"

namespace nanocloud::server
{

    class DisconnectSignal;

    // Request boundary of the server: runs /api requests through the action
    // handlers and turns every outcome, including exceptions, into a JSON
    // response that carries no filesystem detail.
    class Api
    {
    public:
        explicit Api(ServerConfig config);

        Api(const Api &) = delete;
        Api &operator=(const Api &) = delete;

        void handle(const httplib::Request &request, httplib::Response &response, const DisconnectSignal &signal);

        // Runs on the request head, before any body byte is read. Answers 403
        // and returns false when the action named in the query is disabled.
        bool admit(const httplib::Request &request, httplib::Response &response) const;

        const ServerConfig &config() const noexcept { return config_; }

    private:
        struct Call
        {
            const httplib::Request &request;
            const RequestFields &fields;
            const DisconnectSignal &signal;
        };

        struct Reply
        {
            int status{200};
            nlohmann::json body;
            // Allow header of a 405 reply.
            std::string allow{};
        };

        using Handler = Reply (Api::*)(const Call &);

        Reply handle_upload(const Call &call);
        Reply handle_upload_chunk(const Call &call);
        Reply handle_upload_check(const Call &call);
        Reply handle_info(const Call &call);

        Reply dispatch(const httplib::Request &request, const DisconnectSignal &signal);

        UploadQuota quota_for(const httplib::Request &request);

        // Indexed by protocol::to_index(Action).
        static const std::array<Handler, protocol::kActionCount> handlers_;

        ServerConfig config_;
        PathResolver resolver_;
        FilesystemChunkStore chunks_;
        StorageInfoProvider storage_;
        PermissionPolicy permissions_;
        QuotaLedger ledger_;
        UploadSession uploads_;
        SmallFileUploader small_files_;
    };

    // Writes a JSON body with the given status.
    void write_json(httplib::Response &response, int status, const nlohmann::json &body);

} // namespace nanocloud::server
