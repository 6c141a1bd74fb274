// Q8.1 — ServiceConfig test
// Config file sections, flag overrides and startup failures.

#include "qc/config/ServiceConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void writeFile(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream f(p);
  f << text;
}

int main() {
  const fs::path root = fs::temp_directory_path() / "qc_q8_1_config";
  fs::remove_all(root);
  fs::create_directories(root);
  // Keep the default config lookup inside the sandbox.
  setenv("HOME", root.c_str(), 1);

  // ---- Test 1: applyConfigJson ----
  {
    qc::ServiceConfig cfg;
    auto st = qc::applyConfigJson(R"({
      "charts": {"directory": "/srv/charts", "font": "/fonts/a.ttf"},
      "transport": {"endpoint": "tcp://10.0.0.1:7000", "identity": "charts-1",
                    "notify_endpoint": "tcp://10.0.0.2:7001"},
      "unrelated": {"x": 1}
    })", cfg);
    requireTrue(st.ok, "valid config");
    requireTrue(cfg.outputDirectory == "/srv/charts", "directory");
    requireTrue(cfg.fontPath == "/fonts/a.ttf", "font");
    requireTrue(cfg.transport.endpoint == "tcp://10.0.0.1:7000", "endpoint");
    requireTrue(cfg.transport.identity == "charts-1", "identity");
    requireTrue(cfg.transport.resolvedNotifyEndpoint() == "tcp://10.0.0.2:7001", "notify endpoint");
    requireTrue(cfg.transport.notifyRoute == "telegram", "route default kept");

    qc::ServiceConfig defaults;
    requireTrue(defaults.transport.resolvedNotifyEndpoint() == defaults.transport.endpoint,
                "notify falls back to endpoint");
    std::printf("  Test 1 (config json): PASS\n");
  }

  // ---- Test 2: config json errors ----
  {
    qc::ServiceConfig cfg;
    auto bad = qc::applyConfigJson("{charts:", cfg);
    requireTrue(!bad.ok && bad.err.code == qc::ErrorCode::SchemaError, "parse error");
    auto wrong = qc::applyConfigJson(R"({"charts": {"directory": 5}})", cfg);
    requireTrue(!wrong.ok && wrong.err.message.find("charts.directory") != std::string::npos, "type error");
    auto notObj = qc::applyConfigJson(R"({"transport": []})", cfg);
    requireTrue(!notObj.ok, "section must be an object");
    std::printf("  Test 2 (config errors): PASS\n");
  }

  // ---- Test 3: default file + flag overrides ----
  {
    writeFile(root / ".corky" / "config.json",
              R"({"charts": {"directory": "/from/file"}, "transport": {"identity": "file-id"}})");
    requireTrue(qc::defaultConfigPath() == (root / ".corky" / "config.json").string(), "default path");

    auto r = qc::loadServiceConfig({});
    requireTrue(r.ok, "default file loads");
    requireTrue(r.config.outputDirectory == "/from/file", "dir from file");
    requireTrue(r.config.transport.identity == "file-id", "identity from file");

    auto o = qc::loadServiceConfig({"--out-dir", "/from/flag", "--endpoint", "ipc:///tmp/q.sock"});
    requireTrue(o.ok, "overrides ok");
    requireTrue(o.config.outputDirectory == "/from/flag", "flag wins");
    requireTrue(o.config.transport.endpoint == "ipc:///tmp/q.sock", "endpoint flag");
    requireTrue(o.config.transport.identity == "file-id", "file value kept");
    fs::remove(root / ".corky" / "config.json");
    std::printf("  Test 3 (file + flags): PASS\n");
  }

  // ---- Test 4: missing files and directories ----
  {
    auto none = qc::loadServiceConfig({});
    requireTrue(!none.ok && none.err.code == qc::ErrorCode::IoError, "no config file");

    auto flagsOnly = qc::loadServiceConfig({"--out-dir", "/only/flag"});
    requireTrue(flagsOnly.ok && flagsOnly.config.configPath.empty(), "default file optional with --out-dir");

    auto explicitMissing = qc::loadServiceConfig({"--config", (root / "nope.json").string(), "--out-dir", "/x"});
    requireTrue(!explicitMissing.ok, "explicit config must exist");

    writeFile(root / "nodir.json", R"({"charts": {}})");
    auto noDir = qc::loadServiceConfig({"--config", (root / "nodir.json").string()});
    requireTrue(!noDir.ok && noDir.err.code == qc::ErrorCode::SchemaError, "directory required");
    std::printf("  Test 4 (missing settings): PASS\n");
  }

  // ---- Test 5: flag parsing ----
  {
    auto help = qc::loadServiceConfig({"--help"});
    requireTrue(help.ok && help.showHelp, "help");
    auto unknown = qc::loadServiceConfig({"--bogus"});
    requireTrue(!unknown.ok && unknown.err.message.find("--bogus") != std::string::npos, "unknown flag");
    auto dangling = qc::loadServiceConfig({"--out-dir"});
    requireTrue(!dangling.ok && dangling.err.code == qc::ErrorCode::SchemaError, "missing value");
    requireTrue(std::string(qc::serviceUsage()).find("--out-dir") != std::string::npos, "usage");
    std::printf("  Test 5 (flags): PASS\n");
  }

  // ---- Test 6: ensureOutputDirectory ----
  {
    const fs::path nested = root / "a" / "b" / "c";
    requireTrue(qc::ensureOutputDirectory(nested.string()).ok, "mkdir -p");
    requireTrue(fs::is_directory(nested), "created");
    requireTrue(qc::ensureOutputDirectory(nested.string()).ok, "idempotent");

    writeFile(root / "plain", "x");
    auto st = qc::ensureOutputDirectory((root / "plain").string());
    requireTrue(!st.ok && st.err.code == qc::ErrorCode::IoError, "file in the way");
    std::printf("  Test 6 (output directory): PASS\n");
  }

  fs::remove_all(root);
  std::printf("Q8.1 service_config: ALL PASS\n");
  return 0;
}
