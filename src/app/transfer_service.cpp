#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "app/transfer_service.hpp"
#include "proto/assembly_cache.hpp"
#include "proto/chunk.hpp"
#include "proto/reassembler.hpp"
#include "transport/itransport.hpp"
#include "util/log.hpp"

namespace app
{

TransferOptions options_from_config(const config::Config &c)
{
    TransferOptions o;
    o.chunk_size       = c.chunk_size;
    o.attachment_limit = c.attachment_limit;
    o.expiry_window    = c.expiry_window;
    o.sweep_interval   = c.sweep_interval;
    o.max_object_size  = c.max_object_size;
    o.policy           = c.auto_merge ? CompletionPolicy::AutoMerge : CompletionPolicy::Notify;
    return o;
}

const char *state_name(SendState s)
{
    switch (s)
    {
        case SendState::Idle:
            return "idle";
        case SendState::Splitting:
            return "splitting";
        case SendState::Sending:
            return "sending";
        case SendState::Completed:
            return "completed";
        case SendState::Failed:
            return "failed";
        case SendState::Cancelled:
            return "cancelled";
    }
    return "?";
}

const char *send_errc_name(SendErrc e)
{
    switch (e)
    {
        case SendErrc::None:
            return "none";
        case SendErrc::EmptyObject:
            return "empty-object";
        case SendErrc::FitsUnsplit:
            return "fits-unsplit";
        case SendErrc::TooLarge:
            return "too-large";
        case SendErrc::PlanFailed:
            return "plan-failed";
        case SendErrc::SourceRead:
            return "source-read";
        case SendErrc::Transport:
            return "transport";
        case SendErrc::Cancelled:
            return "cancelled";
    }
    return "?";
}

const char *deliver_outcome_name(DeliverOutcome o)
{
    switch (o)
    {
        case DeliverOutcome::Ignored:
            return "ignored";
        case DeliverOutcome::Rejected:
            return "rejected";
        case DeliverOutcome::Duplicate:
            return "duplicate";
        case DeliverOutcome::Accepted:
            return "accepted";
        case DeliverOutcome::Completed:
            return "completed";
    }
    return "?";
}

TransferService::TransferService(transport::ITransport &t,
                                 chunk::AssemblyCache  &cache,
                                 TransferOptions        opts)
    : tx_(t), cache_(cache), opts_(std::move(opts))
{
}

bool TransferService::start()
{
    // in case a previous sweeper is still around
    stop_sweeper();

    transport::Settings s{};
    s.role             = tx_.name();
    s.attachment_limit = opts_.attachment_limit;

    if (!tx_.start(s, [this](const transport::InboundMessage &m) { this->on_rx(m); }))
    {
        LOG_ERROR("start: transport '%s' failed to start", tx_.name().c_str());
        return false;
    }
    start_sweeper();
    return true;
}

void TransferService::stop()
{
    stop_sweeper();
    tx_.stop();
}

void TransferService::start_sweeper()
{
    sweep_stop_.store(false);
    sweep_thr_ = std::thread([this] {
        using namespace std::chrono;
        const auto interval = opts_.sweep_interval;
        const auto tick     = std::min<milliseconds>(interval, milliseconds(200));
        auto       next     = steady_clock::now() + interval;
        while (!sweep_stop_.load())
        {
            if (steady_clock::now() >= next)
            {
                sweep_now();
                if (on_sweep_)
                    on_sweep_();
                next = steady_clock::now() + interval;
            }
            std::this_thread::sleep_for(tick);
        }
    });
}

void TransferService::stop_sweeper()
{
    sweep_stop_.store(true);
    if (sweep_thr_.joinable())
        sweep_thr_.join();
}

std::vector<std::string> TransferService::sweep_now()
{
    std::vector<chunk::ChunkRecord> dropped;
    auto evicted = cache_.evict_expired(cache_.now(), opts_.expiry_window, &dropped);
    for (const auto &key : evicted)
        LOG_SYSTEM("[XFER] evicted stale transfer %s", key.c_str());
    n_evicted_.fetch_add(evicted.size());
    discard(dropped);
    return evicted;
}

SendReport TransferService::send_object(ObjectSource            &src,
                                        std::string_view         name,
                                        const OnProgress        &on_progress,
                                        const std::atomic<bool> *cancel)
{
    SendReport        rep;
    const std::string obj_name(name);
    const auto        size = src.size();

    auto abort_with = [&](SendErrc e) {
        rep.state = (e == SendErrc::Cancelled) ? SendState::Cancelled : SendState::Failed;
        rep.error = e;
        return rep;
    };

    // 1) Pre-flight, before anything is split
    if (size == 0)
    {
        LOG_ERROR("send_object: '%s' is empty", obj_name.c_str());
        return abort_with(SendErrc::EmptyObject);
    }
    if (opts_.max_object_size != 0 && size > opts_.max_object_size)
    {
        LOG_ERROR("send_object: '%s' is %llu bytes, above max_object_size %llu", obj_name.c_str(),
                  (unsigned long long)size, (unsigned long long)opts_.max_object_size);
        return abort_with(SendErrc::TooLarge);
    }
    if (size <= opts_.chunk_size)
    {
        LOG_INFO("send_object: '%s' fits in one message, not splitting", obj_name.c_str());
        return abort_with(SendErrc::FitsUnsplit);
    }

    // 2) Split
    rep.state = SendState::Splitting;
    const std::int64_t start = chunk::now_ms();
    chunk::Identity    id{obj_name, chunk::make_object_key(obj_name, size, start)};
    rep.object_key = id.object_key;
    auto plan      = chunk::plan_chunks(id, size, opts_.chunk_size, start);
    if (plan.empty())
        return abort_with(SendErrc::PlanFailed);
    rep.total = static_cast<std::uint32_t>(plan.size());
    LOG_DEBUG("send_object: %s -> %u chunks", rep.object_key.c_str(), rep.total);

    // 3) Send, one chunk in flight
    rep.state = SendState::Sending;
    transport::OutboundMessage msg;
    for (const auto &d : plan)
    {
        if (cancel && cancel->load())
        {
            LOG_INFO("send_object: %s cancelled after %u of %u chunks", rep.object_key.c_str(),
                     rep.sent, rep.total);
            return abort_with(SendErrc::Cancelled);
        }

        if (!src.read(d.range.offset, d.range.length, msg.payload))
        {
            LOG_ERROR("send_object: reading chunk %u of '%s' failed", d.meta.index,
                      obj_name.c_str());
            rep.failed_index = d.meta.index;
            return abort_with(SendErrc::SourceRead);
        }
        msg.content         = chunk::encode(d.meta);
        msg.attachment_name = chunk::part_name(obj_name, d.meta.index, d.meta.total);

        transport::TransportError err;
        if (!tx_.send(msg, err))
        {
            LOG_ERROR("send_object: chunk %u/%u of %s failed (%s: %s)", d.meta.index + 1,
                      rep.total, rep.object_key.c_str(), transport::errc_name(err.code),
                      err.detail.c_str());
            rep.failed_index    = d.meta.index;
            rep.transport_error = std::move(err);
            return abort_with(SendErrc::Transport);
        }
        rep.sent++;
        if (on_progress)
            on_progress(rep.sent, rep.total);
    }

    rep.state = SendState::Completed;
    LOG_SYSTEM("[XFER] sent %s in %u parts (%llu bytes)", obj_name.c_str(), rep.total,
               (unsigned long long)size);
    return rep;
}

void TransferService::on_rx(const transport::InboundMessage &m)
{
    // no content or no attachment: cannot be a chunk
    if (m.content.empty() || m.attachments.empty())
        return;
    const auto &att = m.attachments.front();
    if (att.ref.empty())
        return;
    deliver(m.content, att.ref);
}

DeliverOutcome TransferService::deliver(std::string_view metadata_text, const transport::PayloadRef &ref)
{
    auto meta = chunk::parse(metadata_text);
    if (!meta)
    {
        n_ignored_.fetch_add(1);
        return DeliverOutcome::Ignored;
    }

    const std::string key = meta->object_key;
    std::string       why;
    if (!plausible_size(*meta, why))
    {
        n_rejected_.fetch_add(1);
        LOG_WARN("[XFER] rejected chunk for %s: %s", key.c_str(), why.c_str());
        tx_.release(ref);
        return DeliverOutcome::Rejected;
    }

    const auto res = cache_.insert({std::move(*meta), ref});
    switch (res.outcome)
    {
        case chunk::InsertOutcome::Rejected:
            n_rejected_.fetch_add(1);
            LOG_WARN("[XFER] rejected chunk for %s: %s", key.c_str(), res.reason.c_str());
            tx_.release(ref);
            return DeliverOutcome::Rejected;
        case chunk::InsertOutcome::DuplicateIgnored:
            // not released: a host redelivery may carry the very ref already stored
            n_duplicates_.fetch_add(1);
            return DeliverOutcome::Duplicate;
        case chunk::InsertOutcome::Accepted:
            n_accepted_.fetch_add(1);
            break;
    }

    if (!cache_.is_complete(key))
        return DeliverOutcome::Accepted;

    // another delivery may have consumed it between the two calls
    auto records = cache_.take_complete(key);
    if (!records)
        return DeliverOutcome::Accepted;

    n_completed_.fetch_add(1);
    LOG_INFO("all %zu chunks received for %s", records->size(), key.c_str());
    finish(std::move(*records));
    return DeliverOutcome::Completed;
}

// objectSize comes from the sender; bound it before anything is sized from it.
bool TransferService::plausible_size(const chunk::Metadata &m, std::string &why) const
{
    if (opts_.max_object_size != 0 && m.object_size > opts_.max_object_size)
    {
        why = "objectSize " + std::to_string(m.object_size) + " above max_object_size " +
              std::to_string(opts_.max_object_size);
        return false;
    }
    if (m.total != 0 && opts_.attachment_limit != 0)
    {
        // largest chunk the object implies, rounded up
        const std::uint64_t per_chunk = m.object_size / m.total + (m.object_size % m.total != 0);
        if (per_chunk > opts_.attachment_limit)
        {
            why = "objectSize " + std::to_string(m.object_size) + " cannot fit in " +
                  std::to_string(m.total) + " attachments of " +
                  std::to_string(opts_.attachment_limit) + " bytes";
            return false;
        }
    }
    return true;
}

void TransferService::finish(std::vector<chunk::ChunkRecord> records)
{
    if (opts_.policy == CompletionPolicy::Notify)
    {
        if (on_ready_)
            on_ready_(std::move(records));
        else
        {
            LOG_WARN("completed transfer dropped: no ready sink installed");
            discard(records);
        }
        return;
    }

    auto result = merge(std::move(records));
    if (on_object_)
        on_object_(result);
}

void TransferService::discard(const std::vector<chunk::ChunkRecord> &records)
{
    for (const auto &r : records)
        tx_.release(r.payload_ref);
}

chunk::MergeResult TransferService::merge(std::vector<chunk::ChunkRecord> records)
{
    std::vector<transport::PayloadRef> refs;
    refs.reserve(records.size());
    for (const auto &r : records)
        refs.push_back(r.payload_ref);

    auto result = chunk::merge(std::move(records),
                               [this](const transport::PayloadRef &ref, transport::Payload &out,
                                      transport::TransportError &err) {
                                   return tx_.resolve_payload(ref, out, err);
                               });
    for (const auto &ref : refs)
        tx_.release(ref);

    if (result.error == chunk::MergeErrc::None)
    {
        LOG_SYSTEM("[XFER] merged %s (%zu bytes)", result.object->name.c_str(),
                   result.object->bytes.size());
    }
    else if (result.object)
    {
        // assembled data is kept; the caller decides what a short object means
        LOG_SYSTEM("[XFER] merged %s with warning: %s", result.object->name.c_str(),
                   result.detail.c_str());
    }
    else
    {
        n_merge_failures_.fetch_add(1);
        LOG_SYSTEM("[XFER] merge failed (%s): %s", chunk::merge_errc_name(result.error),
                   result.detail.c_str());
    }
    return result;
}

Stats TransferService::stats() const
{
    Stats s;
    s.ignored        = n_ignored_.load();
    s.accepted       = n_accepted_.load();
    s.duplicates     = n_duplicates_.load();
    s.rejected       = n_rejected_.load();
    s.completed      = n_completed_.load();
    s.merge_failures = n_merge_failures_.load();
    s.evicted        = n_evicted_.load();
    return s;
}

}  // namespace app
