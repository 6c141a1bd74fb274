#include "qc/config/ServiceConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace qc {

namespace {

bool readFile(const std::string& path, std::string& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

// Copies obj[key] into out when present. False if present but not a string.
bool readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || it->value.IsNull()) return true;
  if (!it->value.IsString()) return false;
  out = it->value.GetString();
  return true;
}

bool fileExists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

} // namespace

std::string defaultConfigPath() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return {};
  return std::string(home) + "/.corky/config.json";
}

Status applyConfigJson(const std::string& json, ServiceConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError()) {
    return Status::fail(ErrorCode::SchemaError,
        std::string("config is not valid JSON: ") +
        rapidjson::GetParseError_En(doc.GetParseError()) +
        " at offset " + std::to_string(doc.GetErrorOffset()));
  }
  if (!doc.IsObject()) {
    return Status::fail(ErrorCode::SchemaError, "config root must be an object");
  }

  auto section = doc.FindMember("charts");
  if (section != doc.MemberEnd()) {
    if (!section->value.IsObject()) {
      return Status::fail(ErrorCode::SchemaError, "config: 'charts' must be an object");
    }
    const auto& c = section->value;
    if (!readString(c, "directory", out.outputDirectory))
      return Status::fail(ErrorCode::SchemaError, "config: charts.directory must be a string");
    if (!readString(c, "font", out.fontPath))
      return Status::fail(ErrorCode::SchemaError, "config: charts.font must be a string");
  }

  section = doc.FindMember("transport");
  if (section != doc.MemberEnd()) {
    if (!section->value.IsObject()) {
      return Status::fail(ErrorCode::SchemaError, "config: 'transport' must be an object");
    }
    const auto& t = section->value;
    TransportConfig& tc = out.transport;
    if (!readString(t, "endpoint", tc.endpoint) ||
        !readString(t, "identity", tc.identity) ||
        !readString(t, "notify_endpoint", tc.notifyEndpoint) ||
        !readString(t, "notify_route", tc.notifyRoute)) {
      return Status::fail(ErrorCode::SchemaError, "config: transport values must be strings");
    }
  }

  return Status::success();
}

const char* serviceUsage() {
  return
    "usage: chart_server [--config <file>] [--out-dir <dir>] [--endpoint <zmq endpoint>]\n"
    "                    [--identity <name>] [--font <ttf>]\n";
}

ConfigResult loadServiceConfig(const std::vector<std::string>& args) {
  ConfigResult res;
  ServiceConfig& cfg = res.config;

  auto fail = [&](ErrorCode code, const std::string& msg) {
    res.ok = false;
    res.err.code = code;
    res.err.message = msg;
    return res;
  };

  bool explicitConfig = false;
  std::string outDir, endpoint, identity, font;

  for (std::size_t i = 0; i < args.size(); i++) {
    const std::string& a = args[i];
    if (a == "-h" || a == "--help") {
      res.showHelp = true;
      return res;
    }
    std::string* target = nullptr;
    if (a == "--config") { target = &cfg.configPath; explicitConfig = true; }
    else if (a == "--out-dir") target = &outDir;
    else if (a == "--endpoint") target = &endpoint;
    else if (a == "--identity") target = &identity;
    else if (a == "--font") target = &font;
    else return fail(ErrorCode::SchemaError, "unknown argument: " + a);

    if (i + 1 >= args.size()) return fail(ErrorCode::SchemaError, a + " needs a value");
    *target = args[++i];
  }

  if (!explicitConfig) cfg.configPath = defaultConfigPath();

  if (!cfg.configPath.empty() && fileExists(cfg.configPath)) {
    std::string text;
    if (!readFile(cfg.configPath, text)) {
      return fail(ErrorCode::IoError, "cannot read config file " + cfg.configPath);
    }
    Status st = applyConfigJson(text, cfg);
    if (!st.ok) return fail(st.err.code, cfg.configPath + ": " + st.err.message);
  } else if (explicitConfig || outDir.empty()) {
    return fail(ErrorCode::IoError,
                "config file " + (cfg.configPath.empty() ? std::string("~/.corky/config.json")
                                                         : cfg.configPath) + " not found");
  } else {
    cfg.configPath.clear();
  }

  if (!outDir.empty()) cfg.outputDirectory = outDir;
  if (!endpoint.empty()) cfg.transport.endpoint = endpoint;
  if (!identity.empty()) cfg.transport.identity = identity;
  if (!font.empty()) cfg.fontPath = font;

  if (cfg.outputDirectory.empty()) {
    return fail(ErrorCode::SchemaError, "output directory not specified in 'charts' section");
  }
  return res;
}

Status ensureOutputDirectory(const std::string& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return Status::fail(ErrorCode::IoError, "cannot create " + dir + ": " + ec.message());
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    return Status::fail(ErrorCode::IoError, dir + " is not a directory");
  }
  return Status::success();
}

} // namespace qc
