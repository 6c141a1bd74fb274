#pragma once
#include "qc/notify/NotificationChannel.hpp"
#include "qc/server/ZmqSocket.hpp"
#include <memory>
#include <string>

namespace qc {

// Sends notices over a DEALER socket connected to `endpoint`. The socket is
// opened on first use and reopened after a failed send.
class ZmqNotificationChannel : public NotificationChannel {
public:
  ZmqNotificationChannel(ZmqContext& ctx, std::string endpoint);

  Status send(const std::string& route, const std::string& payload) override;

private:
  ZmqContext& ctx_;
  std::string endpoint_;
  std::unique_ptr<ZmqSocket> socket_;
};

} // namespace qc
