#ifndef SCANTEXT_TEST_SUPPORT_HPP
#define SCANTEXT_TEST_SUPPORT_HPP

#include "scantext/ImageNormalizer.hpp"
#include "scantext/RecognitionEngine.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace scantext {
namespace test {

/**
 * @brief Scripted behaviour shared by every FakeEngine a factory creates
 *
 * Shared ownership keeps the script alive for calls abandoned after a
 * timeout.
 */
struct FakeScript {
  std::vector<RecognizedSpan> spans;
  /// Delay of the n-th call; the last entry repeats
  std::vector<std::chrono::milliseconds> delays;
  std::string failWith; ///< Non-empty: throw std::runtime_error
  /// Overrides spans when set
  std::function<std::vector<RecognizedSpan>(const NormalizedImage &)> produce;

  std::atomic<int> calls{0};

  std::mutex mutex;
  std::vector<int> seenWidths;
  std::vector<std::optional<BoundingBox>> seenRegions;
};

class FakeEngine : public RecognitionEngine {
public:
  explicit FakeEngine(std::shared_ptr<FakeScript> script)
      : m_script(std::move(script)) {}

  std::vector<RecognizedSpan>
  recognize(const NormalizedImage &image,
            const std::optional<BoundingBox> &roi) override {
    int call = m_script->calls++;
    {
      std::lock_guard<std::mutex> lock(m_script->mutex);
      m_script->seenWidths.push_back(image.width);
      m_script->seenRegions.push_back(roi);
    }

    if (!m_script->delays.empty()) {
      std::size_t index = std::min<std::size_t>(call, m_script->delays.size() - 1);
      std::this_thread::sleep_for(m_script->delays[index]);
    }

    if (!m_script->failWith.empty()) {
      throw std::runtime_error(m_script->failWith);
    }

    if (m_script->produce) {
      return m_script->produce(image);
    }
    return m_script->spans;
  }

  std::string describe() const override { return "fake"; }

private:
  std::shared_ptr<FakeScript> m_script;
};

inline EngineFactory fakeFactory(std::shared_ptr<FakeScript> script) {
  return [script]() -> std::unique_ptr<RecognitionEngine> {
    return std::make_unique<FakeEngine>(script);
  };
}

/**
 * @brief Normalizer that counts its calls
 */
class CountingNormalizer : public ImageNormalizer {
public:
  explicit CountingNormalizer(const NormalizerOptions &options)
      : ImageNormalizer(options) {}

  std::vector<NormalizedImage>
  normalizePages(const UploadedDocument &document) const override {
    ++normalizeCalls;
    return ImageNormalizer::normalizePages(document);
  }

  NormalizedImage downscale(const NormalizedImage &image,
                            double factor) const override {
    ++downscaleCalls;
    return ImageNormalizer::downscale(image, factor);
  }

  mutable std::atomic<int> normalizeCalls{0};
  mutable std::atomic<int> downscaleCalls{0};
};

inline RecognizedSpan makeSpan(const std::string &text, int x, int y, int w,
                               int h, double confidence = 0.9) {
  RecognizedSpan span;
  span.text = text;
  span.bbox.x = x;
  span.bbox.y = y;
  span.bbox.width = w;
  span.bbox.height = h;
  span.confidence = confidence;
  return span;
}

/**
 * @brief White page with dark text, encoded in the given extension
 */
inline std::vector<unsigned char> encodedPage(int width, int height,
                                              const std::string &ext = ".png") {
  cv::Mat page(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
  cv::putText(page, "Scan", cv::Point(width / 8, height / 2),
              cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(0, 0, 0), 2);

  std::vector<unsigned char> bytes;
  if (!cv::imencode(ext, page, bytes)) {
    throw std::runtime_error("Failed to encode test page as " + ext);
  }
  return bytes;
}

inline UploadedDocument pngDocument(int width, int height) {
  UploadedDocument document;
  document.bytes = encodedPage(width, height);
  document.contentType = "image/png";
  document.fileName = "page.png";
  return document;
}

} // namespace test
} // namespace scantext

#endif // SCANTEXT_TEST_SUPPORT_HPP
