#include "qc/notify/ZmqNotificationChannel.hpp"
#include <stdexcept>
#include <utility>
#include <zmq.h>

namespace qc {

ZmqNotificationChannel::ZmqNotificationChannel(ZmqContext& ctx, std::string endpoint)
  : ctx_(ctx), endpoint_(std::move(endpoint)) {}

Status ZmqNotificationChannel::send(const std::string& route, const std::string& payload) {
  if (!socket_) {
    try {
      socket_ = std::make_unique<ZmqSocket>(ctx_, ZMQ_DEALER);
    } catch (const std::runtime_error& e) {
      return Status::fail(ErrorCode::IoError, e.what());
    }
    // Bounded linger: an unreachable peer must not block shutdown.
    if (!socket_->setLinger(1000) || !socket_->connect(endpoint_)) {
      Status st = Status::fail(ErrorCode::IoError, socket_->lastError());
      socket_.reset();
      return st;
    }
  }

  if (!socket_->sendMultipart({route, payload})) {
    Status st = Status::fail(ErrorCode::IoError, socket_->lastError());
    socket_.reset();
    return st;
  }
  return Status::success();
}

} // namespace qc
