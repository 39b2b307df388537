#include "nanocloud/server/stale_sweeper.hpp"

#include <spdlog/spdlog.h>

#include "nanocloud/server/chunk_store.hpp"

namespace nanocloud::server
{

    StaleSweeper::StaleSweeper(ChunkStore &store, std::chrono::hours max_age) : store_(store), max_age_(max_age) {}

    SweepReport StaleSweeper::sweep() const
    {
        return sweep(std::filesystem::file_time_type::clock::now());
    }

    SweepReport StaleSweeper::sweep(std::filesystem::file_time_type now) const
    {
        SweepReport report{};
        const auto cutoff = now - max_age_;
        for (const auto &upload_id : store_.list_sessions())
        {
            ++report.examined;
            const auto modified = store_.last_modified(upload_id);
            if (!modified || *modified >= cutoff)
            {
                continue;
            }
            switch (store_.remove_session(upload_id))
            {
            case RemovalStatus::Removed:
                ++report.removed;
                spdlog::info("Removed stale upload session {}", upload_id);
                break;
            case RemovalStatus::Absent:
                break;
            case RemovalStatus::Failed:
                ++report.failed;
                break;
            }
        }
        return report;
    }

} // namespace nanocloud::server
