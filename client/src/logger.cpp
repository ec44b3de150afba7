#include "snapvault/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <iostream>

namespace snapvault::client
{

    TransferLog::TransferLog(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            journal_ = std::make_shared<spdlog::logger>("transfers", std::move(sink));
            journal_->set_pattern("%Y-%m-%d %H:%M:%S.%e %L %v");
            journal_->set_level(spdlog::level::info);
            journal_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "WARNING: transfer log " << path->string() << " unavailable: " << ex.what() << std::endl;
            journal_.reset();
        }
    }

    void TransferLog::write(spdlog::level::level_enum level, std::string_view tag, const std::string &text)
    {
        if (!journal_)
        {
            return;
        }
        journal_->log(level, "[{}] {}", tag, text);
    }

} // namespace snapvault::client
