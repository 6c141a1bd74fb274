#include "qc/server/ZmqSocket.hpp"
#include <cerrno>
#include <stdexcept>
#include <zmq.h>

namespace qc {

namespace {

std::string zmqErrorMessage() {
  const char* text = zmq_strerror(zmq_errno());
  return text != nullptr ? std::string{text} : std::string{"unknown"};
}

} // namespace

ZmqContext::ZmqContext() : ctx_(zmq_ctx_new()) {
  if (ctx_ == nullptr) {
    throw std::runtime_error("zmq_ctx_new failed: " + zmqErrorMessage());
  }
}

ZmqContext::~ZmqContext() {
  if (ctx_ != nullptr) {
    zmq_ctx_term(ctx_);
    ctx_ = nullptr;
  }
}

ZmqSocket::ZmqSocket(ZmqContext& ctx, int type) : sock_(zmq_socket(ctx.raw(), type)) {
  if (sock_ == nullptr) {
    throw std::runtime_error("zmq_socket failed: " + zmqErrorMessage());
  }
}

ZmqSocket::~ZmqSocket() {
  if (sock_ != nullptr) {
    zmq_close(sock_);
    sock_ = nullptr;
  }
}

bool ZmqSocket::check(int rc, const char* what) {
  if (rc == 0) return true;
  lastError_ = std::string(what) + ": " + zmqErrorMessage();
  return false;
}

bool ZmqSocket::setIdentity(const std::string& identity) {
  return check(zmq_setsockopt(sock_, ZMQ_ROUTING_ID, identity.data(), identity.size()),
               "ZMQ_ROUTING_ID");
}

bool ZmqSocket::setReceiveTimeout(int ms) {
  return check(zmq_setsockopt(sock_, ZMQ_RCVTIMEO, &ms, sizeof(ms)), "ZMQ_RCVTIMEO");
}

bool ZmqSocket::setLinger(int ms) {
  return check(zmq_setsockopt(sock_, ZMQ_LINGER, &ms, sizeof(ms)), "ZMQ_LINGER");
}

bool ZmqSocket::connect(const std::string& endpoint) {
  return check(zmq_connect(sock_, endpoint.c_str()), "zmq_connect");
}

bool ZmqSocket::sendMultipart(const std::vector<std::string>& frames) {
  for (std::size_t i = 0; i < frames.size(); i++) {
    const int flags = (i + 1 < frames.size()) ? ZMQ_SNDMORE : 0;
    if (zmq_send(sock_, frames[i].data(), frames[i].size(), flags) < 0) {
      lastError_ = "zmq_send: " + zmqErrorMessage();
      return false;
    }
  }
  return true;
}

RecvStatus ZmqSocket::recvMultipart(std::vector<std::string>& frames) {
  frames.clear();
  for (;;) {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    if (zmq_msg_recv(&msg, sock_, 0) < 0) {
      const int err = zmq_errno();
      zmq_msg_close(&msg);
      if ((err == EAGAIN || err == EINTR) && frames.empty()) return RecvStatus::Timeout;
      lastError_ = std::string("zmq_msg_recv: ") + zmq_strerror(err);
      return RecvStatus::Error;
    }
    frames.emplace_back(static_cast<const char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
    const bool more = zmq_msg_more(&msg) != 0;
    zmq_msg_close(&msg);
    if (!more) return RecvStatus::Received;
  }
}

} // namespace qc
