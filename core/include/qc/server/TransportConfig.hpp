#pragma once
#include <string>

namespace qc {

// Where the service listens and where completion notices go.
struct TransportConfig {
  std::string endpoint{"tcp://127.0.0.1:6565"};
  std::string identity{"rustcharts"};

  // Notifications use their own DEALER socket; empty = same as endpoint.
  std::string notifyEndpoint;
  std::string notifyRoute{"telegram"};

  int receiveTimeoutMs{250};  // poll period, so stop() is noticed

  const std::string& resolvedNotifyEndpoint() const {
    return notifyEndpoint.empty() ? endpoint : notifyEndpoint;
  }
};

} // namespace qc
