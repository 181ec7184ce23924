#ifndef SCANTEXT_TESSERACT_ENGINE_HPP
#define SCANTEXT_TESSERACT_ENGINE_HPP

#include "scantext/RecognitionEngine.hpp"
#include "scantext/ServiceConfig.hpp"

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace scantext {

/**
 * @brief RecognitionEngine backed by Tesseract
 *
 * Example usage:
 * @code
 * scantext::EngineOptions options;
 * options.language = "eng";
 * scantext::TesseractEngine engine(options);
 * auto spans = engine.recognize(normalized, std::nullopt);
 * @endcode
 */
class TesseractEngine : public RecognitionEngine {
public:
  /**
   * @brief Create and initialize a Tesseract instance
   * @param options Language, tessdata path and page segmentation mode
   * @throws std::runtime_error if Tesseract cannot be initialized
   */
  explicit TesseractEngine(const EngineOptions &options);

  ~TesseractEngine() override;

  // Disable copy operations (Tesseract API is not copyable)
  TesseractEngine(const TesseractEngine &) = delete;
  TesseractEngine &operator=(const TesseractEngine &) = delete;

  std::vector<RecognizedSpan>
  recognize(const NormalizedImage &image,
            const std::optional<BoundingBox> &roi) override;

  std::string describe() const override;

  /**
   * @brief Get available languages of the loaded tessdata
   */
  std::vector<std::string> getAvailableLanguages() const;

  /**
   * @brief Get the Tesseract version string
   */
  static std::string getTesseractVersion();

  /**
   * @brief Factory creating one initialized engine per call
   */
  static EngineFactory factory(const EngineOptions &options);

private:
  /**
   * @brief Hand an OpenCV raster to Tesseract as packed RGB
   */
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  EngineOptions m_options;
  cv::Mat m_rgb; ///< Keeps the pixels alive while Tesseract reads them
};

} // namespace scantext

#endif // SCANTEXT_TESSERACT_ENGINE_HPP
