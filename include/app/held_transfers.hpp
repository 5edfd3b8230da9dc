#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "proto/assembly_cache.hpp"

namespace app
{

// Completed transfers waiting for an explicit accept or discard when the
// completion policy is Notify. Entries age out like incomplete ones do.
class HeldTransfers
{
  public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowFn     = std::function<TimePoint()>;

    struct Summary
    {
        std::string   object_key;
        std::uint64_t object_size{0};
        std::size_t   parts{0};
    };

    HeldTransfers() : now_([] { return Clock::now(); }) {}
    explicit HeldTransfers(NowFn now) : now_(std::move(now)) {}

    // Keyed by the records' object key; empty sets are ignored.
    void put(std::vector<chunk::ChunkRecord> records);
    std::optional<std::vector<chunk::ChunkRecord>> take(const std::string &object_key);
    std::vector<Summary>                           list() const;
    // Removes entries held longer than `window` and returns their records.
    std::vector<std::vector<chunk::ChunkRecord>> expire(std::chrono::milliseconds window);
    std::size_t                                  size() const;

  private:
    struct Held
    {
        std::vector<chunk::ChunkRecord> records;
        TimePoint                       since{};
    };

    mutable std::mutex          mu_;
    NowFn                       now_;
    std::map<std::string, Held> held_;
};

}  // namespace app
