#include "qc/notify/Notifier.hpp"
#include "qc/debug/Log.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <utility>

namespace qc {

std::string buildNotificationPayload(const ChartRequest& request, const Artifact& artifact) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartArray();
  w.String("ok");
  w.String("send_message");

  w.StartObject();
  w.Key("text");        w.String(request.desc.c_str(), static_cast<rapidjson::SizeType>(request.desc.size()));
  w.Key("description"); w.String(request.desc.c_str(), static_cast<rapidjson::SizeType>(request.desc.size()));
  w.Key("image_path");  w.String(artifact.path.c_str(), static_cast<rapidjson::SizeType>(artifact.path.size()));
  w.Key("ticker");      w.String(artifact.ticker.c_str(), static_cast<rapidjson::SizeType>(artifact.ticker.size()));
  w.Key("timeframe");   w.String(artifact.timeframe.c_str(), static_cast<rapidjson::SizeType>(artifact.timeframe.size()));

  w.Key("chat_id");
  if (request.hasChatId) w.Int64(request.chatId);
  else w.Null();

  w.Key("subscriber_list");
  if (request.hasSubscriberList) {
    w.String(request.subscriberList.c_str(),
             static_cast<rapidjson::SizeType>(request.subscriberList.size()));
  } else {
    w.Null();
  }
  w.EndObject();

  w.EndArray();
  return sb.GetString();
}

std::string notificationDestination(const ChartRequest& request) {
  if (request.hasChatId) return "chat_id: " + std::to_string(request.chatId);
  if (request.hasSubscriberList) return "subscriber_list: " + request.subscriberList;
  return "default destination";
}

Notifier::Notifier(NotificationChannel& channel, std::string route)
  : channel_(channel), route_(std::move(route)) {}

Status Notifier::notify(const ChartRequest& request, const Artifact& artifact) {
  Status st = channel_.send(route_, buildNotificationPayload(request, artifact));
  if (!st.ok) {
    logf(LogLevel::Error, "notification for %s %s failed: %s",
         artifact.ticker.c_str(), artifact.timeframe.c_str(), st.err.message.c_str());
    return st;
  }
  logf(LogLevel::Info, "notification sent to %s (route %s)",
       notificationDestination(request).c_str(), route_.c_str());
  return st;
}

} // namespace qc
