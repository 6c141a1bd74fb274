#pragma once
#include "qc/errors/Error.hpp"
#include "qc/request/ChartRequest.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace qc {

// A chart PNG that landed on disk.
struct Artifact {
  std::string path;
  std::string ticker;
  std::string timeframe;
};

struct ArtifactResult {
  bool ok{true};
  Error err{};
  Artifact artifact{};
};

// Persists encoded charts under a fixed output directory.
class ArtifactWriter {
public:
  explicit ArtifactWriter(std::string directory);

  // image_filename verbatim when supplied, else "{ticker}_{timeframe}.png".
  static std::string fileNameFor(const ChartRequest& request);

  // Full path: directory + "/" + fileNameFor(request).
  std::string pathFor(const ChartRequest& request) const;

  // Sibling temporary name, unique per process and per call:
  // "<path>.tmp.<pid>.<n>".
  static std::string tempPathFor(const std::string& path);

  // Write to a sibling temporary file, then rename over the target, so a
  // failed write never leaves a partial artifact. IoError on failure.
  ArtifactResult write(const ChartRequest& request,
                       const std::vector<std::uint8_t>& pngBytes) const;

  const std::string& directory() const { return directory_; }

private:
  std::string directory_;
};

} // namespace qc
