#pragma once
#include "qc/errors/Error.hpp"
#include "qc/pipeline/ChartPipeline.hpp"
#include "qc/server/TransportConfig.hpp"
#include "qc/server/ZmqSocket.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace qc {

// DEALER loop: connect to the broker as `identity`, receive multipart
// requests and run each through the pipeline before receiving the next.
class RequestServer {
public:
  RequestServer(const TransportConfig& config, ChartPipeline& pipeline, ZmqContext& ctx);

  // Routing/identity and delimiter frames are ignored; the last frame is
  // the ["chart","request",{...}] payload.
  PipelineResult handleFrames(const std::vector<std::string>& frames);

  // Blocks until stop(). Fails only when the socket cannot be set up or
  // the receive itself errors.
  Status run();

  // Safe from a signal handler or another thread.
  void stop() { running_.store(false); }

  // Readable while run() is active on another thread.
  std::uint64_t handled() const { return handled_.load(); }
  std::uint64_t failed() const { return failed_.load(); }

private:
  TransportConfig config_;
  ChartPipeline& pipeline_;
  ZmqContext& ctx_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> handled_{0};
  std::atomic<std::uint64_t> failed_{0};
};

} // namespace qc
