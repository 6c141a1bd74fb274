#include "qc/artifact/ArtifactWriter.hpp"
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

namespace qc {

ArtifactWriter::ArtifactWriter(std::string directory)
  : directory_(std::move(directory)) {
  while (directory_.size() > 1 && directory_.back() == '/') directory_.pop_back();
}

std::string ArtifactWriter::fileNameFor(const ChartRequest& request) {
  if (request.hasImageFilename && !request.imageFilename.empty()) {
    return request.imageFilename;
  }
  return request.ticker + "_" + request.timeframe + ".png";
}

std::string ArtifactWriter::tempPathFor(const std::string& path) {
  static std::atomic<std::uint64_t> counter{0};
  return path + ".tmp." + std::to_string(static_cast<long>(::getpid())) + "." +
         std::to_string(counter.fetch_add(1));
}

std::string ArtifactWriter::pathFor(const ChartRequest& request) const {
  return directory_ + "/" + fileNameFor(request);
}

ArtifactResult ArtifactWriter::write(const ChartRequest& request,
                                     const std::vector<std::uint8_t>& pngBytes) const {
  ArtifactResult res;
  const std::string path = pathFor(request);
  const std::string tmpPath = tempPathFor(path);

  auto fail = [&](const std::string& what) {
    res.ok = false;
    res.err.code = ErrorCode::IoError;
    res.err.message = what + " " + path + ": " + std::strerror(errno);
    return res;
  };

  if (pngBytes.empty()) {
    errno = EINVAL;
    return fail("nothing to write to");
  }

  std::FILE* f = std::fopen(tmpPath.c_str(), "wb");
  if (!f) return fail("cannot open");

  const std::size_t written = std::fwrite(pngBytes.data(), 1, pngBytes.size(), f);
  const bool flushed = std::fflush(f) == 0;
  const int saved = errno;
  std::fclose(f);

  if (written != pngBytes.size() || !flushed) {
    std::remove(tmpPath.c_str());
    errno = saved;
    return fail("short write to");
  }

  if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
    const int renameErr = errno;
    std::remove(tmpPath.c_str());
    errno = renameErr;
    return fail("cannot rename into");
  }

  res.artifact.path = path;
  res.artifact.ticker = request.ticker;
  res.artifact.timeframe = request.timeframe;
  return res;
}

} // namespace qc
