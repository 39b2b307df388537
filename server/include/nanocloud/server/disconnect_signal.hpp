#pragma once

namespace nanocloud::server
{

    // Lets upload code ask whether the client went away while a request body
    // was being handled.
    class DisconnectSignal
    {
    public:
        virtual ~DisconnectSignal() = default;
        virtual bool aborted() const = 0;
    };

    class NeverDisconnected final : public DisconnectSignal
    {
    public:
        bool aborted() const override { return false; }
    };

} // namespace nanocloud::server
