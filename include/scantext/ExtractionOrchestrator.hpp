#ifndef SCANTEXT_EXTRACTION_ORCHESTRATOR_HPP
#define SCANTEXT_EXTRACTION_ORCHESTRATOR_HPP

#include "scantext/ImageNormalizer.hpp"
#include "scantext/OcrEngineAdapter.hpp"
#include "scantext/ServiceConfig.hpp"
#include "scantext/Types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace scantext {

/**
 * @brief Sequences normalization and recognition for one upload
 *
 * States: Received -> Normalizing -> Recognizing -> Assembled, or Failed from
 * any of them. Two budgets apply: the engine timeout bounds each engine
 * attempt, the request timeout bounds the whole call.
 *
 * A PDF yields one image per page. Pages with an embedded text layer are
 * taken as they are; the others are recognized one after another, each with
 * its own retry. Spans of all pages are assembled into one reading order.
 *
 * Failure policy:
 * - PayloadTooLarge is detected in Received, before any normalization
 * - UnsupportedFormat and DecodeError are terminal
 * - EngineTimeout is retried once on a reduced-resolution image; a second
 *   timeout on any page yields PartialFailure
 * - EngineError and ServiceBusy are terminal
 *
 * extract() never throws; every outcome is an ExtractionResult.
 */
class ExtractionOrchestrator {
public:
  /**
   * @param normalizer Decoder for uploads; must outlive the orchestrator
   * @param adapter Engine runner; must outlive the orchestrator
   * @param config Limits and thresholds, copied
   */
  ExtractionOrchestrator(const ImageNormalizer &normalizer,
                         OcrEngineAdapter &adapter,
                         const ServiceConfig &config);

  /**
   * @brief Run the pipeline for one upload
   * @param document Uploaded bytes and declared content type
   * @param roi Optional region of interest in normalized-image coordinates
   * @return The assembled result; spans are empty unless status is Success
   */
  ExtractionResult extract(const UploadedDocument &document,
                           const std::optional<BoundingBox> &roi = std::nullopt);

  const ServiceConfig &getConfig() const;

private:
  struct PageOutcome {
    std::optional<std::vector<RecognizedSpan>> spans; ///< Unset: timed out
    bool retried = false;
    std::string message;
  };

  PageOutcome recognizePage(const NormalizedImage &image,
                            const std::optional<BoundingBox> &roi,
                            std::chrono::steady_clock::time_point deadline,
                            int &attempts);
  void appendTextLayer(const NormalizedImage &page,
                       const std::optional<BoundingBox> &roi,
                       std::vector<RecognizedSpan> &spans) const;

  const ImageNormalizer &m_normalizer;
  OcrEngineAdapter &m_adapter;
  ServiceConfig m_config;
};

} // namespace scantext

#endif // SCANTEXT_EXTRACTION_ORCHESTRATOR_HPP
