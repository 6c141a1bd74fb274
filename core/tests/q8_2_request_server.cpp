// Q8.2 — RequestServer test
// Frame handling, plus one request end to end over an inproc ROUTER.

#include "qc/scale/ChartFrame.hpp"
#include "qc/server/RequestServer.hpp"

#include <zmq.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

class SolidRasterizer : public qc::Rasterizer {
public:
  qc::Status rasterize(const qc::ChartLayout&, qc::RasterImage& out) override {
    out.width = qc::ChartFrame::kCanvasWidth;
    out.height = qc::ChartFrame::kCanvasHeight;
    out.bottomUp = false;
    out.rgba.assign(static_cast<std::size_t>(out.width) * out.height * 4, 200);
    return qc::Status::success();
  }
  const qc::Stats& lastStats() const override { return stats_; }

private:
  qc::Stats stats_{};
};

static const char* kPayload = R"(["chart","request",{
  "title": "SRV", "ticker": "SRV", "timeframe": "5m",
  "cols": ["timestamp","open","high","low","close","volume"],
  "data": [[1700000000000,1,2,0.5,1.5,3],[1700000300000,1.5,2.5,1,2,4]],
  "candle_colors": ["#00FF00","#00FF00"],
  "plots": {},
  "desc": "served"
}])";

int main() {
  const fs::path dir = fs::temp_directory_path() / "qc_q8_2_server";
  fs::remove_all(dir);
  fs::create_directories(dir);

  qc::ZmqContext ctx;
  SolidRasterizer raster;
  qc::ArtifactWriter writer(dir.string());
  qc::RecordingChannel channel;
  qc::Notifier notifier(channel);
  qc::ChartPipeline pipeline(raster, writer, notifier);

  // ---- Test 1: the last frame carries the payload ----
  {
    qc::TransportConfig tc;
    qc::RequestServer server(tc, pipeline, ctx);

    auto r = server.handleFrames({"", kPayload});
    requireTrue(r.ok, "delimiter + payload");
    requireTrue(fs::exists(dir / "SRV_5m.png"), "artifact written");
    requireTrue(channel.messages().size() == 1, "notified");

    auto single = server.handleFrames({kPayload});
    requireTrue(single.ok, "payload only");

    auto empty = server.handleFrames({});
    requireTrue(!empty.ok && empty.err.code == qc::ErrorCode::MalformedRequest, "no frames");
    auto blank = server.handleFrames({kPayload, ""});
    requireTrue(!blank.ok && blank.err.code == qc::ErrorCode::MalformedRequest, "empty last frame");
    auto garbage = server.handleFrames({"{oops"});
    requireTrue(!garbage.ok && garbage.err.code == qc::ErrorCode::MalformedRequest, "garbage");

    requireTrue(server.handled() == 5 && server.failed() == 3, "counters");
    std::printf("  Test 1 (frames): PASS\n");
  }

  // ---- Test 2: DEALER loop over inproc ----
  {
    fs::remove(dir / "SRV_5m.png");
    const std::size_t sentBefore = channel.messages().size();

    void* router = zmq_socket(ctx.raw(), ZMQ_ROUTER);
    requireTrue(router != nullptr, "router socket");
    int one = 1;
    requireTrue(zmq_setsockopt(router, ZMQ_ROUTER_MANDATORY, &one, sizeof(one)) == 0, "mandatory");
    int linger = 0;
    requireTrue(zmq_setsockopt(router, ZMQ_LINGER, &linger, sizeof(linger)) == 0, "linger");
    requireTrue(zmq_bind(router, "inproc://qc-q8-2") == 0, "bind");

    qc::TransportConfig tc;
    tc.endpoint = "inproc://qc-q8-2";
    tc.identity = "qc-test";
    tc.receiveTimeoutMs = 50;
    qc::RequestServer server(tc, pipeline, ctx);

    qc::Status runStatus;
    std::thread loop([&] { runStatus = server.run(); });

    // ROUTER_MANDATORY fails with EHOSTUNREACH until the DEALER is attached.
    bool sent = false;
    for (int i = 0; i < 200 && !sent; i++) {
      if (zmq_send(router, "qc-test", 7, ZMQ_SNDMORE) == 7) {
        zmq_send(router, "", 0, ZMQ_SNDMORE);
        sent = zmq_send(router, kPayload, std::strlen(kPayload), 0) >= 0;
      } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
    requireTrue(sent, "request delivered");

    for (int i = 0; i < 300 && server.handled() == 0; i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    server.stop();
    loop.join();
    zmq_close(router);

    requireTrue(runStatus.ok, "clean stop");
    requireTrue(server.handled() == 1 && server.failed() == 0, "one request served");
    requireTrue(fs::exists(dir / "SRV_5m.png"), "artifact from the loop");
    requireTrue(channel.messages().size() == sentBefore + 1, "loop notified");
    std::printf("  Test 2 (server loop): PASS\n");
  }

  fs::remove_all(dir);
  std::printf("Q8.2 request_server: ALL PASS\n");
  return 0;
}
