#include "snapvault/client/transfer_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

namespace snapvault::client
{

    TransferStateStore::TransferStateStore(std::optional<std::filesystem::path> state_path)
        : state_path_(state_path ? *state_path : default_state_path())
    {
        load();
    }

    std::optional<TransferStateStore::Entry> TransferStateStore::find_download(
        const std::filesystem::path &local_path) const
    {
        const auto normalized = normalize_path(local_path);
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                               { return entry.local_path == normalized; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void TransferStateStore::upsert_download(const std::filesystem::path &local_path, const std::string &checksum,
                                             std::uint64_t total_size, std::uint64_t bytes_transferred)
    {
        auto normalized_local = normalize_path(local_path);
        auto it = find_entry(normalized_local);
        if (it == entries_.end())
        {
            entries_.push_back(Entry{normalized_local, checksum, total_size, bytes_transferred});
        }
        else
        {
            it->checksum = checksum;
            it->total_size = total_size;
            it->bytes_transferred = bytes_transferred;
        }
        save();
    }

    void TransferStateStore::update_download_progress(const std::filesystem::path &local_path,
                                                      std::uint64_t bytes_transferred)
    {
        auto it = find_entry(normalize_path(local_path));
        if (it != entries_.end())
        {
            it->bytes_transferred = bytes_transferred;
            save();
        }
    }

    void TransferStateStore::remove_download(const std::filesystem::path &local_path)
    {
        auto it = find_entry(normalize_path(local_path));
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::filesystem::path TransferStateStore::default_state_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".snapvault" / "transfers.json";
        }
        return std::filesystem::path(".snapvault") / "transfers.json";
    }

    void TransferStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            if (!item.is_object())
            {
                continue;
            }
            Entry entry;
            entry.local_path = normalize_path(std::filesystem::path(item.value("local", std::string{})));
            entry.checksum = item.value("checksum", std::string{});
            entry.total_size = item.value("total", 0ULL);
            entry.bytes_transferred = item.value("bytes", 0ULL);
            if (!entry.checksum.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void TransferStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"local", entry.local_path.generic_string()},
                            {"checksum", entry.checksum},
                            {"total", entry.total_size},
                            {"bytes", entry.bytes_transferred}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (out.is_open())
        {
            out << json.dump(2);
        }
    }

    std::vector<TransferStateStore::Entry>::iterator TransferStateStore::find_entry(
        const std::filesystem::path &local_path)
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.local_path == local_path; });
    }

    std::filesystem::path TransferStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace snapvault::client
