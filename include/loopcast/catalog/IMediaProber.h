// Repository: Loopcast
// Component: Media Prober Interface
// Purpose: Decodability + duration check for one candidate file.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_CATALOG_IMEDIA_PROBER_H_
#define LOOPCAST_CATALOG_IMEDIA_PROBER_H_

#include <chrono>
#include <optional>
#include <string>

namespace loopcast::catalog {

struct ProbeResult {
  bool ok = false;
  bool timed_out = false;
  std::optional<double> duration_seconds;  // nullopt when the container has none
  std::string error;                       // empty when ok
};

// Implementations must return within roughly `timeout` and must not throw
// for unreadable or corrupt inputs; those are reported as !ok.
class IMediaProber {
 public:
  virtual ~IMediaProber() = default;

  virtual ProbeResult Probe(const std::string& path,
                            std::chrono::milliseconds timeout) = 0;
};

}  // namespace loopcast::catalog

#endif  // LOOPCAST_CATALOG_IMEDIA_PROBER_H_
