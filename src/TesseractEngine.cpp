#include "scantext/TesseractEngine.hpp"

#include "scantext/Logger.hpp"

#include <opencv2/imgproc.hpp>

#include <stdexcept>

namespace scantext {

namespace {

const char *kTag = "Tesseract";

std::string trimmed(const char *text) {
  std::string value = text != nullptr ? text : "";
  size_t start = value.find_first_not_of(" \t\n\r");
  size_t end = value.find_last_not_of(" \t\n\r");
  if (start == std::string::npos) {
    return "";
  }
  return value.substr(start, end - start + 1);
}

} // anonymous namespace

TesseractEngine::TesseractEngine(const EngineOptions &options)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()),
      m_options(options) {
  const char *tessDataPath =
      m_options.tessDataPath.empty() ? nullptr : m_options.tessDataPath.c_str();

  int result = m_tesseract->Init(tessDataPath, m_options.language.c_str());
  if (result != 0) {
    throw std::runtime_error("Failed to initialize Tesseract with language: " +
                             m_options.language);
  }

  m_tesseract->SetPageSegMode(
      static_cast<tesseract::PageSegMode>(m_options.pageSegMode));
}

TesseractEngine::~TesseractEngine() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

std::vector<RecognizedSpan>
TesseractEngine::recognize(const NormalizedImage &image,
                           const std::optional<BoundingBox> &roi) {
  std::vector<RecognizedSpan> spans;

  if (image.raster.empty()) {
    return spans;
  }

  setImage(image.raster);

  if (roi) {
    m_tesseract->SetRectangle(roi->x, roi->y, roi->width, roi->height);
  }

  // Must call Recognize before GetIterator
  if (m_tesseract->Recognize(nullptr) != 0) {
    throw std::runtime_error("Tesseract recognition failed");
  }

  std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
  const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

  if (ri) {
    do {
      std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
      std::string text = trimmed(word.get());
      if (text.empty()) {
        continue;
      }

      int x1, y1, x2, y2;
      if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
        continue;
      }

      RecognizedSpan span;
      span.text = text;
      span.bbox.x = x1;
      span.bbox.y = y1;
      span.bbox.width = x2 - x1;
      span.bbox.height = y2 - y1;
      // Tesseract reports 0-100
      span.confidence = ri->Confidence(level) / 100.0;
      spans.push_back(span);
    } while (ri->Next(level));
  }

  logDebug(kTag, "Recognized ", spans.size(), " words in ", image.width, "x",
           image.height, " image");

  m_tesseract->Clear();
  return spans;
}

std::string TesseractEngine::describe() const {
  return std::string("tesseract ") + tesseract::TessBaseAPI::Version() + " (" +
         m_options.language + ")";
}

std::vector<std::string> TesseractEngine::getAvailableLanguages() const {
  std::vector<std::string> languages;
  m_tesseract->GetAvailableLanguagesAsVector(&languages);
  return languages;
}

std::string TesseractEngine::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

EngineFactory TesseractEngine::factory(const EngineOptions &options) {
  return [options]() -> std::unique_ptr<RecognitionEngine> {
    return std::make_unique<TesseractEngine>(options);
  };
}

void TesseractEngine::setImage(const cv::Mat &image) {
  // Tesseract expects packed RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, m_rgb, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, m_rgb, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, m_rgb, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(m_rgb.data, m_rgb.cols, m_rgb.rows, 3,
                        static_cast<int>(m_rgb.step));
}

} // namespace scantext
