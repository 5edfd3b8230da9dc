#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "util/constants.hpp"

namespace transport
{

using Payload    = std::vector<std::uint8_t>;
using PayloadRef = std::string;  // opaque, only the transport that issued it can resolve it

enum class TransportErrc
{
    None = 0,
    NotStarted,
    TooLarge,    // attachment above the channel's hard ceiling
    Network,
    Quota,       // host rate limit
    RevokedRef,  // reference expired or unknown
};

const char *errc_name(TransportErrc e);

struct TransportError
{
    TransportErrc code{TransportErrc::None};
    std::string   detail;
};

// One chunk on the wire: text content (metadata) plus one named attachment.
struct OutboundMessage
{
    std::string content;
    std::string attachment_name;
    Payload     payload;
};

struct Attachment
{
    std::string name;
    PayloadRef  ref;
    std::size_t size = 0;
};

struct InboundMessage
{
    std::string             content;
    std::vector<Attachment> attachments;
};

using OnMessage = std::function<void(const InboundMessage &)>;

struct Settings
{
    std::string role;  // "loopback" for the in-process channel
    std::size_t attachment_limit = constants::ATTACHMENT_LIMIT;
};

struct ITransport
{
    virtual bool start(const Settings &s, OnMessage on_rx) = 0;
    // Blocks until the host channel accepted (or refused) the message.
    virtual bool send(const OutboundMessage &msg, TransportError &err) = 0;
    virtual bool resolve_payload(const PayloadRef &ref, Payload &out, TransportError &err) = 0;
    // The receiver is done with `ref`; hosts that keep attachments may drop it.
    virtual void        release(const PayloadRef &ref) { (void)ref; }
    virtual void        stop() = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
