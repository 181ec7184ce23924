#include "scantext/OcrEngineAdapter.hpp"

#include "scantext/ExtractionError.hpp"
#include "scantext/Logger.hpp"
#include "scantext/ReadingOrder.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace scantext {

namespace {

const char *kTag = "EngineAdapter";

using Clock = std::chrono::steady_clock;

bool hasVisibleText(const std::string &text) {
  return text.find_first_not_of(" \t\r\n") != std::string::npos;
}

/**
 * @brief Hand-off between a caller and its queued job
 *
 * Whichever side moves first wins: a job that starts marks itself Running,
 * a caller that gives up first marks the job Abandoned so it never runs.
 */
struct CallState {
  enum class Phase { Queued, Running, Abandoned };

  std::mutex mutex;
  std::condition_variable changed;
  Phase phase = Phase::Queued;
  Clock::time_point startedAt;

  bool begin() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (phase == Phase::Abandoned) {
        return false;
      }
      phase = Phase::Running;
      startedAt = Clock::now();
    }
    changed.notify_all();
    return true;
  }

  // Wait for the job to start; abandons it at the deadline
  std::optional<Clock::time_point> awaitStart(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex);
    changed.wait_until(lock, deadline,
                       [this] { return phase != Phase::Queued; });
    if (phase == Phase::Queued) {
      phase = Phase::Abandoned;
      return std::nullopt;
    }
    return startedAt;
  }
};

} // anonymous namespace

OcrEngineAdapter::OcrEngineAdapter(WorkerPool &pool, EngineFactory factory)
    : m_pool(pool), m_factory(std::move(factory)), m_invocations(0) {}

std::vector<RecognizedSpan>
OcrEngineAdapter::recognize(const NormalizedImage &image,
                            const std::optional<BoundingBox> &roi,
                            std::chrono::milliseconds timeout) {
  return recognize(image, roi, timeout, Clock::now() + timeout);
}

std::vector<RecognizedSpan>
OcrEngineAdapter::recognize(const NormalizedImage &image,
                            const std::optional<BoundingBox> &roi,
                            std::chrono::milliseconds timeout,
                            std::chrono::steady_clock::time_point deadline) {
  ++m_invocations;

  std::optional<BoundingBox> region;
  if (roi) {
    region = clampToImage(*roi, image.width, image.height);
    if (region->width == 0 || region->height == 0) {
      logDebug(kTag, "Region of interest lies outside the image");
      return {};
    }
  }

  if (!m_factory) {
    throw ExtractionError(ErrorKind::EngineError,
                          "No recognition engine configured");
  }

  // The job owns its inputs; it may outlive this call after a timeout
  EngineFactory factory = m_factory;
  auto state = std::make_shared<CallState>();
  auto submitted = m_pool.trySubmit(
      [factory, image, region, state]() -> std::vector<RecognizedSpan> {
        if (!state->begin()) {
          return {};
        }
        std::unique_ptr<RecognitionEngine> engine = factory();
        if (!engine) {
          throw std::runtime_error("Engine factory returned no engine");
        }
        return engine->recognize(image, region);
      });

  if (!submitted) {
    throw ExtractionError(ErrorKind::ServiceBusy,
                          "Recognition pool is at capacity");
  }

  std::optional<Clock::time_point> startedAt = state->awaitStart(deadline);
  if (!startedAt) {
    logWarning(kTag, "Recognition of ", image.width, "x", image.height,
               " image never started before the deadline; dropping call");
    throw ExtractionError(ErrorKind::EngineTimeout,
                          "Recognition did not start before the deadline");
  }

  std::future<std::vector<RecognizedSpan>> &future = *submitted;
  Clock::time_point giveUpAt = std::min(*startedAt + timeout, deadline);
  if (future.wait_until(giveUpAt) != std::future_status::ready) {
    logWarning(kTag, "Recognition exceeded ", timeout.count(), " ms on ",
               image.width, "x", image.height, " image; abandoning call");
    throw ExtractionError(ErrorKind::EngineTimeout,
                          "Recognition exceeded " +
                              std::to_string(timeout.count()) + " ms");
  }

  std::vector<RecognizedSpan> spans;
  try {
    spans = future.get();
  } catch (const ExtractionError &) {
    throw;
  } catch (const std::exception &e) {
    logError(kTag, "Engine failed: ", e.what());
    throw ExtractionError(ErrorKind::EngineError,
                          std::string("Recognition engine failed: ") +
                              e.what());
  }

  spans = sanitize(std::move(spans), image.width, image.height);
  sortByReadingOrder(spans);
  return spans;
}

std::vector<RecognizedSpan>
OcrEngineAdapter::sanitize(std::vector<RecognizedSpan> spans, int width,
                           int height) {
  std::vector<RecognizedSpan> kept;
  kept.reserve(spans.size());

  for (RecognizedSpan &span : spans) {
    if (!hasVisibleText(span.text)) {
      continue;
    }

    span.bbox = clampToImage(span.bbox, width, height);

    if (std::isnan(span.confidence) || span.confidence < 0.0) {
      span.confidence = 0.0;
    } else if (span.confidence > 1.0) {
      span.confidence = 1.0;
    }

    kept.push_back(std::move(span));
  }

  return kept;
}

} // namespace scantext
