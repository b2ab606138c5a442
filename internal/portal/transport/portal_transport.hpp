#pragma once

#include <chrono>
#include <map>
#include <string>

namespace bidsub::portal::transport {

struct TransportRequest {
  std::string endpoint;

  // Stable across resubmissions of the same job.
  std::string idempotency_key;

  std::string                        body;
  std::map<std::string, std::string> headers;
};

struct TransportResponse {
  int         status_code = 0;
  std::string body;
};

/*
  Wire-level delivery used by the real portal adapters.

  Throws on transport failure (unreachable, I/O); the adapter classifies
  that as retryable. A non-2xx response is returned, not thrown.
*/
class PortalTransport {
 public:
  virtual ~PortalTransport() = default;

  virtual TransportResponse Post(const TransportRequest& request, std::chrono::milliseconds timeout) = 0;
};

} // namespace bidsub::portal::transport
