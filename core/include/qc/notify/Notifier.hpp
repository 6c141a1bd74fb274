#pragma once
#include "qc/artifact/ArtifactWriter.hpp"
#include "qc/errors/Error.hpp"
#include "qc/notify/NotificationChannel.hpp"
#include "qc/request/ChartRequest.hpp"
#include <string>

namespace qc {

// ["ok","send_message",{"text","description","image_path","ticker",
//   "timeframe","chat_id","subscriber_list"}]; absent optionals are null.
std::string buildNotificationPayload(const ChartRequest& request, const Artifact& artifact);

// "chat_id: N", else "subscriber_list: S", else "default destination".
std::string notificationDestination(const ChartRequest& request);

// Announces finished artifacts. Failures are logged and returned, never
// retried; the artifact stays on disk either way.
class Notifier {
public:
  explicit Notifier(NotificationChannel& channel, std::string route = "telegram");

  Status notify(const ChartRequest& request, const Artifact& artifact);

  const std::string& route() const { return route_; }

private:
  NotificationChannel& channel_;
  std::string route_;
};

} // namespace qc
