#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "app/object_source.hpp"
#include "proto/assembly_cache.hpp"
#include "proto/chunk.hpp"
#include "proto/reassembler.hpp"
#include "transport/itransport.hpp"
#include "util/config.hpp"

namespace app
{

// What deliver() does once every chunk of an object is in.
enum class CompletionPolicy
{
    AutoMerge,  // merge right away and hand the result to the object sink
    Notify,     // hand the consumed records to the ready sink; caller merges
};

struct TransferOptions
{
    std::size_t               chunk_size       = constants::DEFAULT_CHUNK_SIZE;
    std::size_t               attachment_limit = constants::ATTACHMENT_LIMIT;
    std::chrono::milliseconds expiry_window    = constants::DEFAULT_EXPIRY_WINDOW;
    std::chrono::milliseconds sweep_interval   = constants::DEFAULT_SWEEP_INTERVAL;
    std::uint64_t             max_object_size  = constants::DEFAULT_MAX_OBJECT_SIZE;  // 0 = no cap
    CompletionPolicy          policy           = CompletionPolicy::AutoMerge;
};

TransferOptions options_from_config(const config::Config &c);

enum class SendState
{
    Idle,
    Splitting,
    Sending,
    Completed,
    Failed,
    Cancelled,
};

enum class SendErrc
{
    None = 0,
    EmptyObject,
    FitsUnsplit,  // not larger than one chunk; send it as a plain attachment
    TooLarge,     // above max_object_size
    PlanFailed,
    SourceRead,
    Transport,
    Cancelled,
};

const char *state_name(SendState s);
const char *send_errc_name(SendErrc e);

struct SendReport
{
    SendState                    state{SendState::Idle};
    SendErrc                     error{SendErrc::None};
    std::string                  object_key;
    std::uint32_t                total{0};
    std::uint32_t                sent{0};
    std::optional<std::uint32_t> failed_index;
    transport::TransportError    transport_error;

    bool ok() const { return state == SendState::Completed; }
};

enum class DeliverOutcome
{
    Ignored,    // not a chunk message
    Rejected,   // chunk message with conflicting or out-of-range metadata
    Duplicate,
    Accepted,   // stored, object still incomplete
    Completed,  // this delivery consumed the completed object
};

const char *deliver_outcome_name(DeliverOutcome o);

struct Stats
{
    std::uint64_t ignored        = 0;
    std::uint64_t accepted       = 0;
    std::uint64_t duplicates     = 0;
    std::uint64_t rejected       = 0;
    std::uint64_t completed      = 0;
    std::uint64_t merge_failures = 0;
    std::uint64_t evicted        = 0;
};

using OnProgress = std::function<void(std::uint32_t done, std::uint32_t total)>;

class TransferService
{
  public:
    using OnObject = std::function<void(const chunk::MergeResult &)>;
    using OnReady  = std::function<void(std::vector<chunk::ChunkRecord>)>;
    using OnSweep  = std::function<void()>;

    TransferService(transport::ITransport &t, chunk::AssemblyCache &cache, TransferOptions opts);
    ~TransferService() { stop_sweeper(); }

    TransferService(const TransferService &)            = delete;
    TransferService &operator=(const TransferService &) = delete;

    // Sinks must be installed before start().
    void set_on_object(OnObject cb) { on_object_ = std::move(cb); }
    void set_on_ready(OnReady cb) { on_ready_ = std::move(cb); }
    // Runs on the sweeper thread after each eviction pass.
    void set_on_sweep(OnSweep cb) { on_sweep_ = std::move(cb); }

    bool start();
    void stop();

    // Sender side. Blocks until every chunk was sent or the sequence aborted.
    // `cancel` is polled between chunks, never mid-chunk.
    SendReport send_object(ObjectSource                &src,
                           std::string_view             name,
                           const OnProgress            &on_progress = {},
                           const std::atomic<bool>     *cancel      = nullptr);

    // Receiver side, once per incoming chunk-shaped message.
    DeliverOutcome deliver(std::string_view metadata_text, const transport::PayloadRef &ref);
    void           on_rx(const transport::InboundMessage &m);

    // Ordered merge through this service's transport. The records' payloads
    // are released afterwards, whatever the outcome.
    chunk::MergeResult merge(std::vector<chunk::ChunkRecord> records);
    // Drops records handed out by the ready sink without merging them.
    void discard(const std::vector<chunk::ChunkRecord> &records);

    std::vector<std::string> sweep_now();

    Stats                       stats() const;
    const TransferOptions      &options() const { return opts_; }
    const chunk::AssemblyCache &cache() const { return cache_; }

  private:
    void start_sweeper();
    void stop_sweeper();
    void finish(std::vector<chunk::ChunkRecord> records);
    bool plausible_size(const chunk::Metadata &m, std::string &why) const;

    transport::ITransport &tx_;
    chunk::AssemblyCache  &cache_;
    TransferOptions        opts_;
    OnObject               on_object_;
    OnReady                on_ready_;
    OnSweep                on_sweep_;
    // periodic eviction
    std::thread      sweep_thr_;
    std::atomic_bool sweep_stop_{true};
    // counters
    std::atomic<std::uint64_t> n_ignored_{0};
    std::atomic<std::uint64_t> n_accepted_{0};
    std::atomic<std::uint64_t> n_duplicates_{0};
    std::atomic<std::uint64_t> n_rejected_{0};
    std::atomic<std::uint64_t> n_completed_{0};
    std::atomic<std::uint64_t> n_merge_failures_{0};
    std::atomic<std::uint64_t> n_evicted_{0};
};

}  // namespace app
