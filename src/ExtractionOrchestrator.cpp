#include "scantext/ExtractionOrchestrator.hpp"

#include "scantext/ExtractionError.hpp"
#include "scantext/Logger.hpp"
#include "scantext/ReadingOrder.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace scantext {

namespace {

const char *kTag = "Orchestrator";

using Clock = std::chrono::steady_clock;

/**
 * @brief Per-request bookkeeping; never shared between requests
 */
struct RequestContext {
  ExtractionResult result;
  Clock::time_point start;
  Clock::time_point deadline;

  void enter(PipelineState state) { result.states.push_back(state); }

  std::chrono::milliseconds remaining() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                 Clock::now());
  }

  void fail(ErrorKind kind, const std::string &message) {
    result.status = ExtractionStatus::Failure;
    result.error = kind;
    result.message = message;
    result.spans.clear();
    result.meanConfidence = 0.0;
    result.fullText.clear();
    enter(PipelineState::Failed);
  }

  void partialFailure(const std::string &message) {
    result.status = ExtractionStatus::PartialFailure;
    result.error = ErrorKind::PartialFailure;
    result.message = message;
    result.spans.clear();
    result.meanConfidence = 0.0;
    result.fullText.clear();
    enter(PipelineState::Failed);
  }
};

std::optional<BoundingBox> scaleBox(const std::optional<BoundingBox> &box,
                                    double factor) {
  if (!box) {
    return std::nullopt;
  }
  BoundingBox scaled;
  scaled.x = static_cast<int>(std::floor(box->x * factor));
  scaled.y = static_cast<int>(std::floor(box->y * factor));
  scaled.width = std::max(
      1, static_cast<int>(std::ceil((box->x + box->width) * factor)) - scaled.x);
  scaled.height = std::max(
      1,
      static_cast<int>(std::ceil((box->y + box->height) * factor)) - scaled.y);
  return scaled;
}

// Map spans found on a resampled image back onto the original one
void mapToOriginal(std::vector<RecognizedSpan> &spans, double factor,
                   int width, int height) {
  for (RecognizedSpan &span : spans) {
    BoundingBox scaled = *scaleBox(span.bbox, factor);
    span.bbox = clampToImage(scaled, width, height);
  }
  sortByReadingOrder(spans);
}

bool overlaps(const BoundingBox &a, const BoundingBox &b) {
  return a.x < b.x + b.width && b.x < a.x + a.width && a.y < b.y + b.height &&
         b.y < a.y + a.height;
}

} // anonymous namespace

ExtractionOrchestrator::ExtractionOrchestrator(
    const ImageNormalizer &normalizer, OcrEngineAdapter &adapter,
    const ServiceConfig &config)
    : m_normalizer(normalizer), m_adapter(adapter), m_config(config) {}

const ServiceConfig &ExtractionOrchestrator::getConfig() const {
  return m_config;
}

ExtractionResult
ExtractionOrchestrator::extract(const UploadedDocument &document,
                                const std::optional<BoundingBox> &roi) {
  RequestContext ctx;
  ctx.start = Clock::now();
  ctx.deadline =
      ctx.start + std::chrono::milliseconds(m_config.requestTimeoutMs);

  auto finish = [&ctx]() {
    ctx.result.durationMs =
        std::chrono::duration<double, std::milli>(Clock::now() - ctx.start)
            .count();
    if (ctx.result.error) {
      logWarning(kTag, toString(ctx.result.status), " (",
                 toString(*ctx.result.error), ") after ", ctx.result.durationMs,
                 " ms: ", ctx.result.message);
    } else {
      logInfo(kTag, "Extracted ", ctx.result.spans.size(), " spans from ",
              ctx.result.pageCount, " page(s) in ", ctx.result.durationMs,
              " ms (attempts: ", ctx.result.attempts, ")");
    }
    return ctx.result;
  };

  ctx.enter(PipelineState::Received);

  if (document.size() > m_config.maxUploadBytes) {
    ctx.fail(ErrorKind::PayloadTooLarge,
             "Upload of " + std::to_string(document.size()) +
                 " bytes exceeds the limit of " +
                 std::to_string(m_config.maxUploadBytes) + " bytes");
    return finish();
  }

  ctx.enter(PipelineState::Normalizing);

  std::vector<NormalizedImage> pages;
  try {
    pages = m_normalizer.normalizePages(document);
  } catch (const ExtractionError &e) {
    ctx.fail(e.kind(), e.what());
    return finish();
  } catch (const std::exception &e) {
    ctx.fail(ErrorKind::DecodeError,
             std::string("Failed to normalize upload: ") + e.what());
    return finish();
  }

  if (pages.empty()) {
    ctx.fail(ErrorKind::DecodeError, "Upload contains no pages");
    return finish();
  }

  ctx.result.imageWidth = pages.front().width;
  ctx.result.imageHeight = pages.front().height;
  ctx.result.pageCount = static_cast<int>(pages.size());

  ctx.enter(PipelineState::Recognizing);

  std::vector<RecognizedSpan> spans;
  for (const NormalizedImage &page : pages) {
    if (!page.textLayer.empty()) {
      appendTextLayer(page, roi, spans);
      continue;
    }

    if (ctx.remaining().count() <= 0) {
      ctx.fail(ErrorKind::EngineTimeout,
               "Request deadline exceeded before recognition of page " +
                   std::to_string(page.page + 1) + " started");
      return finish();
    }

    PageOutcome outcome;
    try {
      outcome = recognizePage(page, roi, ctx.deadline, ctx.result.attempts);
    } catch (const ExtractionError &e) {
      ctx.fail(e.kind(), e.what());
      return finish();
    } catch (const std::exception &e) {
      ctx.fail(ErrorKind::EngineError,
               std::string("Recognition failed: ") + e.what());
      return finish();
    }

    ctx.result.retried = ctx.result.retried || outcome.retried;
    if (!outcome.spans) {
      ctx.partialFailure(outcome.message);
      return finish();
    }

    for (RecognizedSpan &span : *outcome.spans) {
      span.page = page.page;
      spans.push_back(std::move(span));
    }
  }

  // Assembly: filter, then order across pages so indices stay contiguous
  const double threshold = m_config.confidenceThreshold;
  if (threshold > 0.0) {
    spans.erase(std::remove_if(spans.begin(), spans.end(),
                               [threshold](const RecognizedSpan &span) {
                                 return span.confidence < threshold;
                               }),
                spans.end());
  }
  sortByReadingOrder(spans);

  double total = 0.0;
  for (const RecognizedSpan &span : spans) {
    total += span.confidence;
  }

  ctx.result.meanConfidence = spans.empty() ? 0.0 : total / spans.size();
  ctx.result.fullText = joinText(spans);
  ctx.result.spans = std::move(spans);
  ctx.result.status = ExtractionStatus::Success;
  ctx.result.message = ctx.result.retried
                           ? "Recognized at reduced resolution after a timeout"
                           : "OK";
  ctx.enter(PipelineState::Assembled);

  return finish();
}

ExtractionOrchestrator::PageOutcome ExtractionOrchestrator::recognizePage(
    const NormalizedImage &image, const std::optional<BoundingBox> &roi,
    std::chrono::steady_clock::time_point deadline, int &attempts) {
  PageOutcome outcome;
  std::chrono::milliseconds engineTimeout(m_config.engineTimeoutMs);

  try {
    ++attempts;
    outcome.spans = m_adapter.recognize(image, roi, engineTimeout, deadline);
    return outcome;
  } catch (const ExtractionError &e) {
    if (e.kind() != ErrorKind::EngineTimeout) {
      throw;
    }
  }

  if (deadline <= Clock::now()) {
    outcome.message = "Recognition timed out and the request deadline left "
                      "no time to retry";
    return outcome;
  }

  logInfo(kTag, "Recognition of page ", image.page + 1,
          " timed out, retrying at ", m_config.retryScale, "x resolution");

  NormalizedImage reduced = m_normalizer.downscale(image, m_config.retryScale);
  double toReduced = reduced.scale / image.scale;

  outcome.retried = true;
  try {
    ++attempts;
    std::vector<RecognizedSpan> spans = m_adapter.recognize(
        reduced, scaleBox(roi, toReduced), engineTimeout, deadline);
    mapToOriginal(spans, 1.0 / toReduced, image.width, image.height);
    outcome.spans = std::move(spans);
  } catch (const ExtractionError &e) {
    if (e.kind() != ErrorKind::EngineTimeout) {
      throw;
    }
    outcome.message = "Recognition timed out at full and reduced resolution";
  }
  return outcome;
}

void ExtractionOrchestrator::appendTextLayer(
    const NormalizedImage &page, const std::optional<BoundingBox> &roi,
    std::vector<RecognizedSpan> &spans) const {
  std::optional<BoundingBox> region;
  if (roi) {
    region = clampToImage(*roi, page.width, page.height);
  }

  for (const RecognizedSpan &span : page.textLayer) {
    if (region && !overlaps(span.bbox, *region)) {
      continue;
    }
    spans.push_back(span);
  }
  logDebug(kTag, "Page ", page.page + 1, " read from the PDF text layer");
}

} // namespace scantext
