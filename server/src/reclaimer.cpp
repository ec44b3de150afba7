#include "snapvault/server/reclaimer.hpp"

#include <exception>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "snapvault/server/operation_registry.hpp"

namespace snapvault::server
{

    Reclaimer::Reclaimer() : Reclaimer([]
                                       { return Clock::now(); })
    {
    }

    Reclaimer::Reclaimer(std::function<Clock::time_point()> now) : now_(std::move(now)) {}

    Reclaimer::TaskId Reclaimer::schedule(std::chrono::seconds delay, std::string label, Task task)
    {
        const auto due = now_() + delay;
        std::lock_guard lock(mutex_);
        const auto id = next_id_++;
        queue_.emplace(due, Entry{id, std::move(label), std::move(task)});
        return id;
    }

    bool Reclaimer::cancel(TaskId id)
    {
        std::lock_guard lock(mutex_);
        for (auto it = queue_.begin(); it != queue_.end(); ++it)
        {
            if (it->second.id == id)
            {
                queue_.erase(it);
                return true;
            }
        }
        return false;
    }

    std::size_t Reclaimer::run_due(Clock::time_point now)
    {
        std::vector<Entry> due;
        {
            std::lock_guard lock(mutex_);
            const auto end = queue_.upper_bound(now);
            for (auto it = queue_.begin(); it != end; ++it)
            {
                due.push_back(std::move(it->second));
            }
            queue_.erase(queue_.begin(), end);
        }

        for (auto &entry : due)
        {
            try
            {
                entry.task();
                spdlog::debug("Reclaimed {}", entry.label);
            }
            catch (const std::exception &ex)
            {
                spdlog::debug("Reclaim of {} failed: {}", entry.label, ex.what());
            }
        }
        return due.size();
    }

    std::size_t Reclaimer::run_due()
    {
        return run_due(now_());
    }

    std::optional<Reclaimer::Clock::time_point> Reclaimer::next_due() const
    {
        std::lock_guard lock(mutex_);
        if (queue_.empty())
        {
            return std::nullopt;
        }
        return queue_.begin()->first;
    }

    std::size_t Reclaimer::pending() const
    {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    void Reclaimer::clear()
    {
        std::lock_guard lock(mutex_);
        if (!queue_.empty())
        {
            spdlog::debug("Discarding {} pending reclaim task(s)", queue_.size());
        }
        queue_.clear();
    }

    Reclaimer::TaskId Reclaimer::schedule_file_removal(const std::filesystem::path &path, std::chrono::seconds delay)
    {
        return schedule(delay, "file " + path.string(), [path]
                        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                throw std::filesystem::filesystem_error("remove", path, ec);
            } });
    }

    Reclaimer::TaskId Reclaimer::schedule_operation_removal(OperationRegistry &registry, const std::string &operation_id,
                                                            std::chrono::seconds delay)
    {
        return schedule(delay, "operation " + operation_id, [&registry, operation_id]
                        {
            std::error_code ec;
            std::filesystem::remove_all(registry.staging_root() / operation_id, ec);
            registry.remove(operation_id);
            if (ec)
            {
                throw std::filesystem::filesystem_error("remove_all", registry.staging_root() / operation_id, ec);
            } });
    }

} // namespace snapvault::server
