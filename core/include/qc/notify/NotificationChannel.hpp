#pragma once
#include "qc/errors/Error.hpp"
#include <string>
#include <vector>

namespace qc {

// External delivery channel for completion notices: one multipart message
// [route, payload] per notice.
class NotificationChannel {
public:
  virtual ~NotificationChannel() = default;

  virtual Status send(const std::string& route, const std::string& payload) = 0;
};

// Keeps every message in memory. Used by tests and dry runs.
class RecordingChannel : public NotificationChannel {
public:
  struct Message {
    std::string route;
    std::string payload;
  };

  Status send(const std::string& route, const std::string& payload) override {
    if (failNext_) {
      failNext_ = false;
      return Status::fail(ErrorCode::IoError, "recording channel: forced failure");
    }
    messages_.push_back({route, payload});
    return Status::success();
  }

  void failNextSend() { failNext_ = true; }
  const std::vector<Message>& messages() const { return messages_; }

private:
  std::vector<Message> messages_;
  bool failNext_{false};
};

} // namespace qc
