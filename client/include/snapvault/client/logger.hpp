#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace snapvault::client
{

    // Transfer journal for the client. Records are "[tag] text"; with no path the
    // journal is a null sink and nothing is formatted.
    class TransferLog
    {
    public:
        explicit TransferLog(const std::optional<std::filesystem::path> &path);

        template <typename... Args>
        void info(std::string_view tag, Args &&...args)
        {
            write(spdlog::level::info, tag, concat(std::forward<Args>(args)...));
        }

        template <typename... Args>
        void warn(std::string_view tag, Args &&...args)
        {
            write(spdlog::level::warn, tag, concat(std::forward<Args>(args)...));
        }

        bool enabled() const noexcept { return static_cast<bool>(journal_); }

    private:
        template <typename... Args>
        std::string concat(Args &&...args) const
        {
            if (!journal_)
            {
                return {};
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            return std::string(buf.data(), buf.size());
        }

        void write(spdlog::level::level_enum level, std::string_view tag, const std::string &text);

        std::shared_ptr<spdlog::logger> journal_;
    };

} // namespace snapvault::client
