// Q6.1 — ArtifactWriter test
// File naming, atomic placement and I/O failures.

#include "qc/artifact/ArtifactWriter.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
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

static std::vector<std::uint8_t> readAll(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), {});
}

static qc::ChartRequest request(const char* ticker, const char* tf) {
  qc::ChartRequest r;
  r.ticker = ticker;
  r.timeframe = tf;
  return r;
}

int main() {
  const fs::path dir = fs::temp_directory_path() / "qc_q6_1_artifacts";
  fs::remove_all(dir);
  fs::create_directories(dir);

  // ---- Test 1: naming ----
  {
    auto r = request("BTCUSD", "1h");
    requireTrue(qc::ArtifactWriter::fileNameFor(r) == "BTCUSD_1h.png", "default name");
    r.hasImageFilename = true;
    r.imageFilename = "custom.png";
    requireTrue(qc::ArtifactWriter::fileNameFor(r) == "custom.png", "explicit name");

    qc::ArtifactWriter w("/charts//");
    requireTrue(w.directory() == "/charts", "trailing slashes stripped");
    requireTrue(w.pathFor(request("ETH", "4h")) == "/charts/ETH_4h.png", "path");
    std::printf("  Test 1 (naming): PASS\n");
  }

  // ---- Test 2: write + overwrite ----
  {
    qc::ArtifactWriter w(dir.string());
    const std::vector<std::uint8_t> first = {1, 2, 3, 4};
    auto res = w.write(request("BTCUSD", "1h"), first);
    requireTrue(res.ok, "write ok");
    requireTrue(res.artifact.path == (dir / "BTCUSD_1h.png").string(), "artifact path");
    requireTrue(res.artifact.ticker == "BTCUSD" && res.artifact.timeframe == "1h", "artifact ids");
    requireTrue(readAll(res.artifact.path) == first, "bytes on disk");
    for (const auto& e : fs::directory_iterator(dir)) {
      requireTrue(e.path().string().find(".tmp") == std::string::npos, "no temp file left");
    }

    const std::vector<std::uint8_t> second = {9, 9};
    requireTrue(w.write(request("BTCUSD", "1h"), second).ok, "rewrite ok");
    requireTrue(readAll(res.artifact.path) == second, "same key replaces");
    std::printf("  Test 2 (write): PASS\n");
  }

  // ---- Test 3: distinct names coexist ----
  {
    qc::ArtifactWriter w(dir.string());
    requireTrue(w.write(request("ETHUSD", "1h"), {7}).ok, "eth");
    requireTrue(w.write(request("ETHUSD", "4h"), {8}).ok, "eth 4h");
    requireTrue(readAll((dir / "ETHUSD_1h.png").string()) == std::vector<std::uint8_t>{7}, "1h intact");
    requireTrue(readAll((dir / "ETHUSD_4h.png").string()) == std::vector<std::uint8_t>{8}, "4h intact");
    std::printf("  Test 3 (distinct names): PASS\n");
  }

  // ---- Test 4: failures ----
  {
    qc::ArtifactWriter missing((dir / "does" / "not" / "exist").string());
    auto res = missing.write(request("BTCUSD", "1h"), {1});
    requireTrue(!res.ok, "missing directory fails");
    requireTrue(res.err.code == qc::ErrorCode::IoError, "IoError");
    requireTrue(res.err.message.find("BTCUSD_1h.png") != std::string::npos, "message names path");

    qc::ArtifactWriter w(dir.string());
    auto empty = w.write(request("EMPTY", "1h"), {});
    requireTrue(!empty.ok && empty.err.code == qc::ErrorCode::IoError, "empty payload");
    requireTrue(!fs::exists(dir / "EMPTY_1h.png"), "nothing written");
    std::printf("  Test 4 (failures): PASS\n");
  }

  // ---- Test 5: concurrent writers of one name ----
  {
    const std::string a = qc::ArtifactWriter::tempPathFor("/x/BTC_1h.png");
    const std::string b = qc::ArtifactWriter::tempPathFor("/x/BTC_1h.png");
    requireTrue(a != b, "temp names differ per call");
    requireTrue(a.rfind("/x/BTC_1h.png.tmp.", 0) == 0, "temp is a sibling");

    qc::ArtifactWriter w(dir.string());
    const int kWriters = 8;
    std::vector<std::vector<std::uint8_t>> payloads;
    for (int i = 0; i < kWriters; i++) {
      payloads.emplace_back(64 * 1024, static_cast<std::uint8_t>(i + 1));
    }
    std::vector<int> ok(kWriters, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; i++) {
      threads.emplace_back([&, i] {
        for (int k = 0; k < 20; k++) {
          if (w.write(request("RACE", "1m"), payloads[i]).ok) ok[i]++;
        }
      });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kWriters; i++) requireTrue(ok[i] == 20, "every write succeeded");
    const auto onDisk = readAll((dir / "RACE_1m.png").string());
    bool whole = false;
    for (const auto& p : payloads) whole = whole || (onDisk == p);
    requireTrue(whole, "file is exactly one writer's payload");
    for (const auto& e : fs::directory_iterator(dir)) {
      requireTrue(e.path().string().find(".tmp") == std::string::npos, "no temp files left");
    }
    std::printf("  Test 5 (concurrent writers): PASS\n");
  }

  fs::remove_all(dir);
  std::printf("Q6.1 artifact_writer: ALL PASS\n");
  return 0;
}
