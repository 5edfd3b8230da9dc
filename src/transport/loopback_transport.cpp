#include <string>

#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{

const char *errc_name(TransportErrc e)
{
    switch (e)
    {
        case TransportErrc::None:
            return "none";
        case TransportErrc::NotStarted:
            return "not-started";
        case TransportErrc::TooLarge:
            return "too-large";
        case TransportErrc::Network:
            return "network";
        case TransportErrc::Quota:
            return "quota";
        case TransportErrc::RevokedRef:
            return "revoked-ref";
    }
    return "?";
}

// LoopbackTransport: an in-process channel. Every sent message is stored as an
// attachment and echoed back to on_rx, so sender and receiver run in one process.
bool LoopbackTransport::start(const Settings &s, OnMessage on_rx)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_rx_   = std::move(on_rx);
    limit_   = s.attachment_limit;
    started_ = true;
    return true;
}

bool LoopbackTransport::send(const OutboundMessage &msg, TransportError &err)
{
    InboundMessage in;
    OnMessage      cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_ || !on_rx_)
        {
            err = {TransportErrc::NotStarted, "loopback not started"};
            return false;
        }
        if (limit_ != 0 && msg.payload.size() > limit_)
        {
            err = {TransportErrc::TooLarge, "attachment " + std::to_string(msg.payload.size()) +
                                                " bytes exceeds limit " + std::to_string(limit_)};
            return false;
        }
        PayloadRef ref = "loop://" + std::to_string(next_ref_++) + "/" + msg.attachment_name;
        attachments_.emplace(ref, msg.payload);

        in.content = msg.content;
        in.attachments.push_back({msg.attachment_name, ref, msg.payload.size()});
        cb = on_rx_;
    }
    // on_rx may resolve payloads on this transport, so call it unlocked
    cb(in);
    return true;
}

bool LoopbackTransport::resolve_payload(const PayloadRef &ref, Payload &out, TransportError &err)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = attachments_.find(ref);
    if (it == attachments_.end())
    {
        err = {TransportErrc::RevokedRef, "unknown attachment " + ref};
        return false;
    }
    out = it->second;
    return true;
}

bool LoopbackTransport::revoke(const PayloadRef &ref)
{
    std::lock_guard<std::mutex> lk(mu_);
    return attachments_.erase(ref) > 0;
}

std::size_t LoopbackTransport::stored() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return attachments_.size();
}

void LoopbackTransport::stop()
{
    std::lock_guard<std::mutex> lk(mu_);
    started_ = false;
    on_rx_   = nullptr;
    attachments_.clear();
}

bool LoopbackTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return started_;
}

}  // namespace transport
