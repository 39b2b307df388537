#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace nanocloud::server
{

    class ChunkStore;

    struct SweepReport
    {
        std::size_t examined{};
        std::size_t removed{};
        std::size_t failed{};
    };

    // Deletes chunk sessions idle for longer than `max_age`. Runs inline when
    // an upload starts; there is no background timer.
    class StaleSweeper
    {
    public:
        StaleSweeper(ChunkStore &store, std::chrono::hours max_age);

        SweepReport sweep() const;
        SweepReport sweep(std::filesystem::file_time_type now) const;

    private:
        ChunkStore &store_;
        std::chrono::hours max_age_;
    };

} // namespace nanocloud::server
