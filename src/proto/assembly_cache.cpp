#include <string>

#include "proto/assembly_cache.hpp"
#include "util/log.hpp"

namespace chunk
{

const char *outcome_name(InsertOutcome o)
{
    switch (o)
    {
        case InsertOutcome::Accepted:
            return "accepted";
        case InsertOutcome::DuplicateIgnored:
            return "duplicate";
        case InsertOutcome::Rejected:
            return "rejected";
    }
    return "?";
}

InsertResult AssemblyCache::insert(const ChunkRecord &rec)
{
    const Metadata &m = rec.meta;
    if (m.total == 0)
        return {InsertOutcome::Rejected, "total is zero"};
    if (m.index >= m.total)
        return {InsertOutcome::Rejected, "index " + std::to_string(m.index) + " out of range (total " +
                                             std::to_string(m.total) + ")"};

    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(m.object_key);
    if (it == map_.end())
    {
        Entry e;
        e.total       = m.total;
        e.object_size = m.object_size;
        it            = map_.emplace(m.object_key, std::move(e)).first;
        LOG_DEBUG("new entry %s (total=%u)", m.object_key.c_str(), m.total);
    }
    Entry &st = it->second;

    // conflicting chunks are dropped; the stored entry stays as it was
    if (st.total != m.total)
        return {InsertOutcome::Rejected, "total " + std::to_string(m.total) + " conflicts with " +
                                             std::to_string(st.total)};
    if (st.object_size != m.object_size)
        return {InsertOutcome::Rejected, "objectSize " + std::to_string(m.object_size) +
                                             " conflicts with " + std::to_string(st.object_size)};

    if (!st.parts.emplace(m.index, rec).second)
    {
        LOG_DEBUG("duplicate chunk (key=%s, index=%u)", m.object_key.c_str(), m.index);
        return {InsertOutcome::DuplicateIgnored, {}};
    }
    // local receive time, never the sender's timestamp
    st.last_updated = now_();
    return {InsertOutcome::Accepted, {}};
}

bool AssemblyCache::is_complete(const std::string &object_key) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(object_key);
    return it != map_.end() && it->second.parts.size() == it->second.total;
}

std::optional<std::vector<ChunkRecord>> AssemblyCache::take_complete(const std::string &object_key)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(object_key);
    if (it == map_.end() || it->second.parts.size() != it->second.total)
        return std::nullopt;

    std::vector<ChunkRecord> out;
    out.reserve(it->second.parts.size());
    for (auto &kv : it->second.parts)
        out.push_back(std::move(kv.second));
    map_.erase(it);
    return out;
}

std::vector<std::string> AssemblyCache::evict_expired(TimePoint                 now,
                                                      std::chrono::milliseconds window,
                                                      std::vector<ChunkRecord> *dropped)
{
    std::vector<std::string>    evicted;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = map_.begin(); it != map_.end();)
    {
        if (now - it->second.last_updated > window)
        {
            evicted.push_back(it->first);
            if (dropped)
            {
                for (auto &kv : it->second.parts)
                    dropped->push_back(std::move(kv.second));
            }
            it = map_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return evicted;
}

std::size_t AssemblyCache::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return map_.size();
}

std::size_t AssemblyCache::received(const std::string &object_key) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(object_key);
    return it == map_.end() ? 0 : it->second.parts.size();
}

std::vector<PendingInfo> AssemblyCache::pending() const
{
    std::vector<PendingInfo>    out;
    std::lock_guard<std::mutex> lk(mu_);
    const TimePoint             now = now_();
    out.reserve(map_.size());
    for (const auto &kv : map_)
    {
        PendingInfo p;
        p.object_key = kv.first;
        p.received   = kv.second.parts.size();
        p.total      = kv.second.total;
        p.idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - kv.second.last_updated);
        out.push_back(std::move(p));
    }
    return out;
}

}  // namespace chunk
