#ifndef SCANTEXT_RECOGNITION_ENGINE_HPP
#define SCANTEXT_RECOGNITION_ENGINE_HPP

#include "scantext/Types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scantext {

/**
 * @brief Capability interface of an OCR engine
 *
 * Implementations convert a normalized raster into word-level spans. They may
 * return spans in any order and with raw confidences; the OcrEngineAdapter
 * clamps, orders and numbers them. A fatal engine failure is reported by
 * throwing (any std::exception).
 */
class RecognitionEngine {
public:
  virtual ~RecognitionEngine() = default;

  /**
   * @brief Recognize text in an image
   * @param image Normalized raster
   * @param roi Optional region restricting recognition, already clamped to
   * the image
   * @return Recognized spans with boxes in image coordinates
   */
  virtual std::vector<RecognizedSpan>
  recognize(const NormalizedImage &image,
            const std::optional<BoundingBox> &roi) = 0;

  /**
   * @brief Engine name and version for diagnostics
   */
  virtual std::string describe() const = 0;
};

/**
 * @brief Creates a fresh engine for one recognition call
 */
using EngineFactory = std::function<std::unique_ptr<RecognitionEngine>()>;

} // namespace scantext

#endif // SCANTEXT_RECOGNITION_ENGINE_HPP
