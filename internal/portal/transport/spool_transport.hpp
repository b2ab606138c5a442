#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "portal_transport.hpp"

namespace bidsub::portal::transport {

/*
  Outbox transport for a downstream uploader.

  Each request lands atomically as <root>/<endpoint>/<key>.json together
  with a <key>.receipt. Posting a key that already has a receipt returns
  that receipt unchanged and writes nothing.
*/
class SpoolTransport final : public PortalTransport {
 public:
  explicit SpoolTransport(std::filesystem::path root, std::string confirmation_prefix = "SPOOL");

  TransportResponse Post(const TransportRequest& request, std::chrono::milliseconds timeout) override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
  std::string           confirmation_prefix_;
  std::mutex            mutex_;
};

} // namespace bidsub::portal::transport
