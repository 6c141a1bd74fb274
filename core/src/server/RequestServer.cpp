#include "qc/server/RequestServer.hpp"
#include "qc/debug/Log.hpp"
#include <memory>
#include <stdexcept>
#include <zmq.h>

namespace qc {

RequestServer::RequestServer(const TransportConfig& config, ChartPipeline& pipeline,
                             ZmqContext& ctx)
  : config_(config), pipeline_(pipeline), ctx_(ctx) {}

PipelineResult RequestServer::handleFrames(const std::vector<std::string>& frames) {
  handled_++;
  if (frames.empty() || frames.back().empty()) {
    failed_++;
    PipelineResult r;
    r.ok = false;
    r.err = Error{ErrorCode::MalformedRequest, "received invalid or missing JSON payload"};
    logf(LogLevel::Error, "%s", r.err.message.c_str());
    return r;
  }

  PipelineResult r = pipeline_.run(frames.back());
  if (!r.ok) failed_++;
  return r;
}

Status RequestServer::run() {
  std::unique_ptr<ZmqSocket> sock;
  try {
    sock = std::make_unique<ZmqSocket>(ctx_, ZMQ_DEALER);
  } catch (const std::runtime_error& e) {
    return Status::fail(ErrorCode::IoError, e.what());
  }

  if (!sock->setIdentity(config_.identity) ||
      !sock->setReceiveTimeout(config_.receiveTimeoutMs) ||
      !sock->setLinger(0)) {
    return Status::fail(ErrorCode::IoError, sock->lastError());
  }

  logf(LogLevel::Init, "connecting to %s as '%s'",
       config_.endpoint.c_str(), config_.identity.c_str());
  if (!sock->connect(config_.endpoint)) {
    return Status::fail(ErrorCode::IoError, sock->lastError());
  }

  running_.store(true);
  logf(LogLevel::Ready, "awaiting incoming chart messages");

  std::vector<std::string> frames;
  while (running_.load()) {
    const RecvStatus rs = sock->recvMultipart(frames);
    if (rs == RecvStatus::Timeout) continue;
    if (rs == RecvStatus::Error) {
      if (!running_.load()) break;  // interrupted by stop()
      return Status::fail(ErrorCode::IoError, sock->lastError());
    }
    handleFrames(frames);
  }

  logf(LogLevel::Info, "server stopped after %llu requests (%llu failed)",
       static_cast<unsigned long long>(handled_.load()),
       static_cast<unsigned long long>(failed_.load()));
  return Status::success();
}

} // namespace qc
