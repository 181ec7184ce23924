#ifndef SCANTEXT_OCR_ENGINE_ADAPTER_HPP
#define SCANTEXT_OCR_ENGINE_ADAPTER_HPP

#include "scantext/RecognitionEngine.hpp"
#include "scantext/Types.hpp"
#include "scantext/WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <vector>

namespace scantext {

/**
 * @brief Runs a recognition engine on the worker pool with a time budget
 *
 * Every call constructs its own engine through the factory, on the worker
 * thread, so no engine state is shared between requests. The engine budget
 * starts when a worker picks the call up; time spent queued counts only
 * against the caller's deadline. When either runs out the caller stops
 * waiting and gets EngineTimeout. A call still queued at that point is
 * dropped without running; a running native call keeps its thread until it
 * finishes and its result is discarded.
 */
class OcrEngineAdapter {
public:
  /**
   * @param pool Process-wide pool; must outlive the adapter
   * @param factory Creates one engine per call
   */
  OcrEngineAdapter(WorkerPool &pool, EngineFactory factory);

  /**
   * @brief Recognize text in an image
   * @param image Normalized image
   * @param roi Optional region of interest; clamped to the image, an empty
   * intersection yields no spans without invoking the engine
   * @param timeout Maximum time to wait for the engine
   * @return Spans in reading order with contiguous order indices, boxes
   * clamped to the image and confidences clamped to [0, 1]
   * @throws ExtractionError EngineTimeout, EngineError or ServiceBusy
   */
  std::vector<RecognizedSpan>
  recognize(const NormalizedImage &image,
            const std::optional<BoundingBox> &roi,
            std::chrono::milliseconds timeout);

  /**
   * @brief Recognize text with an engine budget and an overall deadline
   * @param timeout Maximum engine run time, counted from when a worker starts
   * the call
   * @param deadline Latest time to wait, including time spent queued
   * @throws ExtractionError EngineTimeout, EngineError or ServiceBusy
   */
  std::vector<RecognizedSpan>
  recognize(const NormalizedImage &image,
            const std::optional<BoundingBox> &roi,
            std::chrono::milliseconds timeout,
            std::chrono::steady_clock::time_point deadline);

  /**
   * @brief Number of recognize() calls made so far
   */
  std::size_t invocationCount() const { return m_invocations.load(); }

  /**
   * @brief Clamp boxes and confidences, drop spans without text
   */
  static std::vector<RecognizedSpan>
  sanitize(std::vector<RecognizedSpan> spans, int width, int height);

private:
  WorkerPool &m_pool;
  EngineFactory m_factory;
  std::atomic<std::size_t> m_invocations;
};

} // namespace scantext

#endif // SCANTEXT_OCR_ENGINE_ADAPTER_HPP
