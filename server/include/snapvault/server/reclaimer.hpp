#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace snapvault::server
{

    class OperationRegistry;

    // Deferred removal of temporary artifacts. Nothing runs on its own: the owner calls
    // run_due() from a timer, tests call it with a hand-advanced clock.
    class Reclaimer
    {
    public:
        using Clock = std::chrono::steady_clock;
        using TaskId = std::uint64_t;
        using Task = std::function<void()>;

        Reclaimer();
        explicit Reclaimer(std::function<Clock::time_point()> now);

        TaskId schedule(std::chrono::seconds delay, std::string label, Task task);

        bool cancel(TaskId id);

        // Runs every task due at `now`, outside the lock. Returns how many ran.
        std::size_t run_due(Clock::time_point now);
        std::size_t run_due();

        std::optional<Clock::time_point> next_due() const;
        std::size_t pending() const;

        // Drops every pending task without running it.
        void clear();

        TaskId schedule_file_removal(const std::filesystem::path &path, std::chrono::seconds delay);

        // Removes the staging directory, then the registry record.
        TaskId schedule_operation_removal(OperationRegistry &registry, const std::string &operation_id,
                                          std::chrono::seconds delay);

    private:
        struct Entry
        {
            TaskId id{};
            std::string label;
            Task task;
        };

        std::function<Clock::time_point()> now_;
        mutable std::mutex mutex_;
        std::multimap<Clock::time_point, Entry> queue_;
        TaskId next_id_{1};
    };

} // namespace snapvault::server
