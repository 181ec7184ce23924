#include "scantext/TesseractEngine.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace scantext;

namespace {

// Tesseract needs installed tessdata; skip instead of failing without it
std::unique_ptr<TesseractEngine> makeEngine() {
  EngineOptions options;
  options.language = "eng";
  try {
    return std::make_unique<TesseractEngine>(options);
  } catch (const std::runtime_error &e) {
    std::cerr << "Tesseract unavailable: " << e.what() << "\n";
    return nullptr;
  }
}

NormalizedImage textImage() {
  // Create a simple test image with text
  cv::Mat page(200, 600, CV_8UC1, cv::Scalar(255));
  cv::putText(page, "OCR Analysis Test", cv::Point(50, 50),
              cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0), 2);
  cv::putText(page, "Hello World", cv::Point(50, 100),
              cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0), 2);
  cv::putText(page, "Testing 123", cv::Point(50, 150),
              cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0), 2);

  NormalizedImage image;
  image.raster = page;
  image.width = page.cols;
  image.height = page.rows;
  return image;
}

bool containsWord(const std::vector<RecognizedSpan> &spans,
                  const std::string &word) {
  return std::any_of(spans.begin(), spans.end(),
                     [&word](const RecognizedSpan &span) {
                       return span.text.find(word) != std::string::npos;
                     });
}

} // anonymous namespace

TEST(TesseractEngineTest, VersionIsReported) {
  EXPECT_FALSE(TesseractEngine::getTesseractVersion().empty());
}

TEST(TesseractEngineTest, RecognizesRenderedText) {
  auto engine = makeEngine();
  if (!engine) {
    GTEST_SKIP() << "eng traineddata not installed";
  }

  auto spans = engine->recognize(textImage(), std::nullopt);
  ASSERT_FALSE(spans.empty());
  EXPECT_TRUE(containsWord(spans, "Hello"));
  EXPECT_TRUE(containsWord(spans, "World"));

  for (const auto &span : spans) {
    EXPECT_FALSE(span.text.empty());
    EXPECT_GE(span.confidence, 0.0);
    EXPECT_LE(span.confidence, 1.0);
    EXPECT_GT(span.bbox.width, 0);
    EXPECT_GT(span.bbox.height, 0);
  }
}

TEST(TesseractEngineTest, RegionRestrictsRecognition) {
  auto engine = makeEngine();
  if (!engine) {
    GTEST_SKIP() << "eng traineddata not installed";
  }

  // Only the middle line
  BoundingBox middle{0, 70, 600, 45};
  auto spans = engine->recognize(textImage(), middle);
  EXPECT_TRUE(containsWord(spans, "Hello"));
  EXPECT_FALSE(containsWord(spans, "Testing"));

  for (const auto &span : spans) {
    EXPECT_GE(span.bbox.y, 60);
    EXPECT_LE(span.bbox.y + span.bbox.height, 125);
  }
}

TEST(TesseractEngineTest, EngineIsReusable) {
  auto engine = makeEngine();
  if (!engine) {
    GTEST_SKIP() << "eng traineddata not installed";
  }

  auto first = engine->recognize(textImage(), std::nullopt);
  auto second = engine->recognize(textImage(), std::nullopt);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].text, second[i].text);
    EXPECT_EQ(first[i].bbox, second[i].bbox);
  }
  EXPECT_NE(engine->describe().find("eng"), std::string::npos);
}

TEST(TesseractEngineTest, FactoryCreatesIndependentEngines) {
  if (!makeEngine()) {
    GTEST_SKIP() << "eng traineddata not installed";
  }

  EngineOptions options;
  EngineFactory factory = TesseractEngine::factory(options);
  auto first = factory();
  auto second = factory();
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  EXPECT_NE(first.get(), second.get());
}

TEST(TesseractEngineTest, UnknownLanguageFailsToInitialize) {
  EngineOptions options;
  options.language = "zz_not_a_language";
  EXPECT_THROW(TesseractEngine engine(options), std::runtime_error);
}
