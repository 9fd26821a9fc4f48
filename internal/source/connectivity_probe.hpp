#pragma once

#include <memory>

namespace relay::source {

/*
  On-demand reachability check of the message source
  (for a bot API source, a getMe call).

  Returns false or throws when the source is unreachable; both mean
  "disconnected" to the caller.
*/
class ConnectivityProbe {
 public:
  virtual ~ConnectivityProbe() = default;

  virtual bool Probe() = 0;
};

using ConnectivityProbePtr = std::shared_ptr<ConnectivityProbe>;

} // namespace relay::source
