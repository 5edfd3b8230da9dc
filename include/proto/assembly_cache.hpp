#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "proto/chunk.hpp"
#include "transport/itransport.hpp"

namespace chunk
{

// A received chunk: metadata plus a handle to its bytes, never the bytes.
struct ChunkRecord
{
    Metadata              meta;
    transport::PayloadRef payload_ref;
};

enum class InsertOutcome
{
    Accepted,
    DuplicateIgnored,
    Rejected,
};

const char *outcome_name(InsertOutcome o);

struct InsertResult
{
    InsertOutcome outcome{InsertOutcome::Rejected};
    std::string   reason;  // set when Rejected
};

struct PendingInfo
{
    std::string               object_key;
    std::size_t               received{0};
    std::uint32_t             total{0};
    std::chrono::milliseconds idle{0};
};

// Receive-side store of partial objects, keyed by object key. All operations
// take one mutex, so a completed entry is handed out at most once and an
// eviction sweep never removes an entry mid-completion.
class AssemblyCache
{
  public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowFn     = std::function<TimePoint()>;

    AssemblyCache() : now_([] { return Clock::now(); }) {}
    explicit AssemblyCache(NowFn now) : now_(std::move(now)) {}

    AssemblyCache(const AssemblyCache &)            = delete;
    AssemblyCache &operator=(const AssemblyCache &) = delete;

    InsertResult insert(const ChunkRecord &rec);
    bool         is_complete(const std::string &object_key) const;
    std::optional<std::vector<ChunkRecord>> take_complete(const std::string &object_key);
    // Returns the evicted keys. The dropped records go to `dropped` when given,
    // so their payloads can be released.
    std::vector<std::string> evict_expired(TimePoint                  now,
                                           std::chrono::milliseconds  window,
                                           std::vector<ChunkRecord>  *dropped = nullptr);

    std::size_t              size() const;
    std::size_t              received(const std::string &object_key) const;
    std::vector<PendingInfo> pending() const;
    TimePoint                now() const { return now_(); }

  private:
    struct Entry
    {
        std::uint32_t                          total       = 0;
        std::uint64_t                          object_size = 0;
        std::map<std::uint32_t, ChunkRecord>   parts;  // by index; size() <= total
        TimePoint                              last_updated{};
    };

    mutable std::mutex                     mu_;
    NowFn                                  now_;
    std::unordered_map<std::string, Entry> map_;
};

}  // namespace chunk
