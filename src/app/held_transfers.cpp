#include <utility>

#include "app/held_transfers.hpp"
#include "util/log.hpp"

namespace app
{

void HeldTransfers::put(std::vector<chunk::ChunkRecord> records)
{
    if (records.empty())
        return;
    const std::string key = records.front().meta.object_key;

    std::lock_guard<std::mutex> lk(mu_);
    Held                        h;
    h.records  = std::move(records);
    h.since    = now_();
    held_[key] = std::move(h);
}

std::optional<std::vector<chunk::ChunkRecord>> HeldTransfers::take(const std::string &object_key)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = held_.find(object_key);
    if (it == held_.end())
        return std::nullopt;
    auto records = std::move(it->second.records);
    held_.erase(it);
    return records;
}

std::vector<HeldTransfers::Summary> HeldTransfers::list() const
{
    std::vector<Summary>        out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &kv : held_)
        out.push_back({kv.first, kv.second.records.front().meta.object_size,
                       kv.second.records.size()});
    return out;
}

std::vector<std::vector<chunk::ChunkRecord>> HeldTransfers::expire(std::chrono::milliseconds window)
{
    std::vector<std::vector<chunk::ChunkRecord>> out;
    std::lock_guard<std::mutex>                  lk(mu_);
    const TimePoint                              now = now_();
    for (auto it = held_.begin(); it != held_.end();)
    {
        if (now - it->second.since > window)
        {
            LOG_SYSTEM("[XFER] dropped unaccepted transfer %s", it->first.c_str());
            out.push_back(std::move(it->second.records));
            it = held_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return out;
}

std::size_t HeldTransfers::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return held_.size();
}

}  // namespace app
