// Chart rendering service.
// Connects to the broker as a DEALER, renders every ["chart","request",{...}]
// it receives to a PNG in the output directory and announces it on the
// notification route.

#include "qc/artifact/ArtifactWriter.hpp"
#include "qc/compose/GlCompositor.hpp"
#include "qc/config/ServiceConfig.hpp"
#include "qc/debug/Log.hpp"
#include "qc/notify/Notifier.hpp"
#include "qc/notify/ZmqNotificationChannel.hpp"
#include "qc/pipeline/ChartPipeline.hpp"
#include "qc/server/RequestServer.hpp"
#include "qc/server/ZmqSocket.hpp"

#include <csignal>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static qc::RequestServer* gServer = nullptr;

static void onSignal(int) {
  if (gServer) gServer->stop();
}

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  qc::ConfigResult cr = qc::loadServiceConfig(args);
  if (cr.showHelp) {
    std::fputs(qc::serviceUsage(), stdout);
    return 0;
  }
  if (!cr.ok) {
    qc::logf(qc::LogLevel::Error, "%s", cr.err.message.c_str());
    std::fputs(qc::serviceUsage(), stderr);
    return 1;
  }
  const qc::ServiceConfig& cfg = cr.config;

  qc::Status st = qc::ensureOutputDirectory(cfg.outputDirectory);
  if (!st.ok) {
    qc::logf(qc::LogLevel::Error, "%s", st.err.message.c_str());
    return 1;
  }
  if (!cfg.configPath.empty()) {
    qc::logf(qc::LogLevel::Init, "config: %s", cfg.configPath.c_str());
  }
  qc::logf(qc::LogLevel::Init, "using output directory: %s", cfg.outputDirectory.c_str());
  qc::logf(qc::LogLevel::Init, "font: %s", cfg.fontPath.c_str());
  qc::logf(qc::LogLevel::Init, "notifications: route '%s' via %s",
           cfg.transport.notifyRoute.c_str(), cfg.transport.resolvedNotifyEndpoint().c_str());

  std::unique_ptr<qc::ZmqContext> zmq;
  try {
    zmq = std::make_unique<qc::ZmqContext>();
  } catch (const std::runtime_error& e) {
    qc::logf(qc::LogLevel::Error, "%s", e.what());
    return 1;
  }

  qc::GlCompositor compositor(cfg.fontPath);
  qc::ArtifactWriter writer(cfg.outputDirectory);
  qc::ZmqNotificationChannel channel(*zmq, cfg.transport.resolvedNotifyEndpoint());
  qc::Notifier notifier(channel, cfg.transport.notifyRoute);
  qc::ChartPipeline pipeline(compositor, writer, notifier);

  qc::RequestServer server(cfg.transport, pipeline, *zmq);
  gServer = &server;
  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  st = server.run();
  gServer = nullptr;
  if (!st.ok) {
    qc::logf(qc::LogLevel::Error, "transport: %s", st.err.message.c_str());
    return 1;
  }
  return 0;
}
