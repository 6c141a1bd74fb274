#pragma once
#include "qc/errors/Error.hpp"
#include "qc/server/TransportConfig.hpp"
#include <string>
#include <vector>

namespace qc {

inline constexpr const char* kDefaultFontPath = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

// Startup configuration of the chart service.
//
// File (JSON):
//   {
//     "charts":    {"directory": "...", "font": "..."},
//     "transport": {"endpoint": "...", "identity": "...",
//                   "notify_endpoint": "...", "notify_route": "..."}
//   }
// Command-line flags override file values.
struct ServiceConfig {
  std::string configPath;
  std::string outputDirectory;
  std::string fontPath{kDefaultFontPath};
  TransportConfig transport;
};

struct ConfigResult {
  bool ok{true};
  Error err{};
  ServiceConfig config{};
  bool showHelp{false};
};

// $HOME/.corky/config.json ("" when HOME is unset).
std::string defaultConfigPath();

// Merge a JSON document into `out`. Unknown keys are ignored; known keys
// with the wrong type are a SchemaError.
Status applyConfigJson(const std::string& json, ServiceConfig& out);

// --config <path> --out-dir <dir> --endpoint <ep> --identity <id> --font <ttf>
//
// The file is optional only when it is the default one and --out-dir is
// given. A missing output directory setting is fatal.
ConfigResult loadServiceConfig(const std::vector<std::string>& args);

// mkdir -p. IoError when it cannot be created or is not a directory.
Status ensureOutputDirectory(const std::string& dir);

const char* serviceUsage();

} // namespace qc
