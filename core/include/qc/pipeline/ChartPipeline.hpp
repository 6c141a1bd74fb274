#pragma once
#include "qc/artifact/ArtifactWriter.hpp"
#include "qc/compose/Rasterizer.hpp"
#include "qc/debug/Stats.hpp"
#include "qc/errors/Error.hpp"
#include "qc/notify/Notifier.hpp"
#include "qc/request/RequestParser.hpp"
#include "qc/style/ChartStyle.hpp"
#include <string>

namespace qc {

struct PipelineResult {
  bool ok{true};
  Error err{};
  Artifact artifact{};
  bool notified{false};
  Stats stats{};
};

// decode -> scales + layers -> rasterize -> PNG -> write -> notify.
//
// Any failure before the write aborts the request: no file, no notification.
// A failed notification is logged and leaves the result ok (the artifact
// exists) with notified == false.
class ChartPipeline {
public:
  ChartPipeline(Rasterizer& rasterizer, const ArtifactWriter& writer,
                Notifier& notifier, const ChartStyle& style = ChartStyle{});

  // Transport payload ["chart","request",{...}].
  PipelineResult run(const std::string& envelope);

  // Already validated request.
  PipelineResult process(const ChartRequest& request);

private:
  Rasterizer& rasterizer_;
  const ArtifactWriter& writer_;
  Notifier& notifier_;
  ChartStyle style_;
  RequestParser parser_;

  PipelineResult fail(const ChartRequest* request, const Error& err) const;
};

} // namespace qc
