#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "transport/itransport.hpp"

namespace transport {

class LoopbackTransport final : public ITransport {
public:
  bool start(const Settings& s, OnMessage on_rx) override;
  bool send(const OutboundMessage& msg, TransportError& err) override;
  bool resolve_payload(const PayloadRef& ref, Payload& out, TransportError& err) override;
  void release(const PayloadRef& ref) override { (void)revoke(ref); }
  void stop() override;
  std::string name() const override { return "loopback"; }
  bool link_ready() const override;

  // Drops a stored attachment; later resolves fail with RevokedRef.
  // False when the ref is unknown or already gone.
  bool revoke(const PayloadRef& ref);
  std::size_t stored() const;

private:
  mutable std::mutex                      mu_;
  OnMessage                               on_rx_{};
  std::size_t                             limit_{0};
  bool                                    started_{false};
  std::uint64_t                           next_ref_{1};
  std::unordered_map<PayloadRef, Payload> attachments_;
};

} // namespace transport
