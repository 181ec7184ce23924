#include "TestSupport.hpp"
#include "scantext/ExtractionError.hpp"
#include "scantext/ImageNormalizer.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>
#include <string>

using namespace scantext;
using scantext::test::encodedPage;
using scantext::test::pngDocument;

namespace {

NormalizerOptions plainOptions() {
  NormalizerOptions options;
  options.deskew = false;
  return options;
}

ErrorKind normalizeError(const ImageNormalizer &normalizer,
                         const UploadedDocument &document) {
  try {
    normalizer.normalize(document);
  } catch (const ExtractionError &e) {
    return e.kind();
  }
  ADD_FAILURE() << "normalize() did not throw";
  return ErrorKind::EngineError;
}

// Splice an APP1 Exif segment with the given orientation after the SOI marker
std::vector<unsigned char> withExifOrientation(std::vector<unsigned char> jpeg,
                                               unsigned char orientation) {
  std::vector<unsigned char> app1 = {
      0xFF, 0xE1, 0x00, 0x22,                         // APP1, length 34
      'E',  'x',  'i',  'f',  0x00, 0x00,             // Exif header
      'M',  'M',  0x00, 0x2A, 0x00, 0x00, 0x00, 0x08, // big-endian TIFF
      0x00, 0x01,                                     // one entry
      0x01, 0x12, 0x00, 0x03, 0x00, 0x00, 0x00, 0x01, // orientation SHORT
      0x00, orientation, 0x00, 0x00,                  // value
      0x00, 0x00, 0x00, 0x00};                        // no next IFD
  jpeg.insert(jpeg.begin() + 2, app1.begin(), app1.end());
  return jpeg;
}

// Minimal one-page PDF; poppler rebuilds the missing xref table
std::vector<unsigned char> minimalPdf(int widthPt, int heightPt) {
  std::string pdf =
      "%PDF-1.4\n"
      "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
      "2 0 obj\n<< /Type /Pages /Kids [3 0 R] /Count 1 >>\nendobj\n"
      "3 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " +
      std::to_string(widthPt) + " " + std::to_string(heightPt) +
      "] >>\nendobj\n"
      "trailer\n<< /Root 1 0 R /Size 4 >>\n%%EOF\n";
  return std::vector<unsigned char>(pdf.begin(), pdf.end());
}

// Multi-page PDF; each entry is the content stream of one page, drawn with
// Helvetica as /F1. Stream lengths are exact so the objects parse as written.
std::vector<unsigned char> pdfWithPages(const std::vector<std::string> &contents,
                                        int widthPt, int heightPt) {
  const int count = static_cast<int>(contents.size());
  std::string kids;
  for (int i = 0; i < count; ++i) {
    kids += std::to_string(4 + 2 * i) + " 0 R ";
  }

  std::string pdf =
      "%PDF-1.4\n"
      "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
      "2 0 obj\n<< /Type /Pages /Kids [" + kids + "] /Count " +
      std::to_string(count) + " >>\nendobj\n"
      "3 0 obj\n<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>\n"
      "endobj\n";

  for (int i = 0; i < count; ++i) {
    int pageObj = 4 + 2 * i;
    int streamObj = pageObj + 1;
    pdf += std::to_string(pageObj) +
           " 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " +
           std::to_string(widthPt) + " " + std::to_string(heightPt) +
           "] /Resources << /Font << /F1 3 0 R >> >> /Contents " +
           std::to_string(streamObj) + " 0 R >>\nendobj\n";
    pdf += std::to_string(streamObj) + " 0 obj\n<< /Length " +
           std::to_string(contents[i].size()) + " >>\nstream\n" +
           contents[i] + "\nendstream\nendobj\n";
  }

  pdf += "trailer\n<< /Root 1 0 R /Size " + std::to_string(4 + 2 * count) +
         " >>\n%%EOF\n";
  return std::vector<unsigned char>(pdf.begin(), pdf.end());
}

// White page with a dark bar, rotated counter-clockwise by the given degrees
cv::Mat rotatedBar(double degrees) {
  cv::Mat page(300, 300, CV_8UC3, cv::Scalar(255, 255, 255));
  cv::rectangle(page, cv::Rect(50, 130, 200, 40), cv::Scalar(0, 0, 0),
                cv::FILLED);
  cv::Mat rotation =
      cv::getRotationMatrix2D(cv::Point2f(150, 150), degrees, 1.0);
  cv::Mat skewed;
  cv::warpAffine(page, skewed, rotation, page.size(), cv::INTER_LINEAR,
                 cv::BORDER_CONSTANT, cv::Scalar(255, 255, 255));
  return skewed;
}

} // anonymous namespace

TEST(ImageNormalizerTest, DecodesPngToGray) {
  ImageNormalizer normalizer(plainOptions());
  NormalizedImage image = normalizer.normalize(pngDocument(120, 80));

  EXPECT_EQ(image.width, 120);
  EXPECT_EQ(image.height, 80);
  EXPECT_EQ(image.raster.cols, 120);
  EXPECT_EQ(image.raster.rows, 80);
  EXPECT_EQ(image.raster.channels(), 1);
  EXPECT_EQ(image.colorMode, ColorMode::Gray);
  EXPECT_EQ(image.rotationAngle, 0);
  EXPECT_FALSE(image.mirrored);
  EXPECT_TRUE(image.denoised);
  EXPECT_DOUBLE_EQ(image.scale, 1.0);
}

TEST(ImageNormalizerTest, KeepsColorWhenGrayscaleIsOff) {
  NormalizerOptions options = plainOptions();
  options.grayscale = false;
  ImageNormalizer normalizer(options);

  NormalizedImage image = normalizer.normalize(pngDocument(64, 32));
  EXPECT_EQ(image.colorMode, ColorMode::Color);
  EXPECT_EQ(image.raster.channels(), 3);
}

TEST(ImageNormalizerTest, BinarizeProducesTwoLevels) {
  NormalizerOptions options = plainOptions();
  options.binarize = true;
  ImageNormalizer normalizer(options);

  NormalizedImage image = normalizer.normalize(pngDocument(160, 80));
  ASSERT_EQ(image.raster.type(), CV_8UC1);

  cv::Mat other = (image.raster != 0) & (image.raster != 255);
  EXPECT_EQ(cv::countNonZero(other), 0);
}

TEST(ImageNormalizerTest, UploadBytesAreNotModified) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document = pngDocument(50, 40);
  const std::vector<unsigned char> original = document.bytes;

  normalizer.normalize(document);
  EXPECT_EQ(document.bytes, original);
}

TEST(ImageNormalizerTest, UnsupportedContentType) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document = pngDocument(32, 32);
  document.contentType = "text/plain";

  EXPECT_EQ(normalizeError(normalizer, document),
            ErrorKind::UnsupportedFormat);
}

TEST(ImageNormalizerTest, UnknownOctetStreamIsUnsupported) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document;
  document.contentType = "application/octet-stream";
  document.bytes = {'j', 'u', 's', 't', ' ', 't', 'e', 'x', 't'};

  EXPECT_EQ(normalizeError(normalizer, document),
            ErrorKind::UnsupportedFormat);
}

TEST(ImageNormalizerTest, OctetStreamIsSniffed) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document = pngDocument(40, 20);
  document.contentType = "application/octet-stream";

  NormalizedImage image = normalizer.normalize(document);
  EXPECT_EQ(image.width, 40);
  EXPECT_EQ(image.height, 20);
  // No declared type at all is sniffed the same way
  document.contentType.clear();
  EXPECT_EQ(normalizer.normalize(document).width, 40);
}

TEST(ImageNormalizerTest, CorruptBytesAreDecodeError) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document;
  document.contentType = "image/png";
  document.bytes = {0x89, 'P', 'N', 'G', 0x00, 0x01, 0x02, 0x03};

  EXPECT_EQ(normalizeError(normalizer, document), ErrorKind::DecodeError);
}

TEST(ImageNormalizerTest, MislabelledUploadIsDecodeError) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document;
  document.contentType = "image/png";
  document.bytes = withExifOrientation(encodedPage(100, 50, ".jpg"), 6);

  EXPECT_EQ(normalizeError(normalizer, document), ErrorKind::DecodeError);

  // The same bytes declared correctly decode with their orientation
  document.contentType = "image/jpeg";
  EXPECT_EQ(normalizer.normalize(document).rotationAngle, 90);
}

TEST(ImageNormalizerTest, EmptyUploadIsDecodeError) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document;
  document.contentType = "image/jpeg";

  EXPECT_EQ(normalizeError(normalizer, document), ErrorKind::DecodeError);
}

TEST(ImageNormalizerTest, AppliesExifRotation) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document;
  document.contentType = "image/jpeg";
  document.bytes = withExifOrientation(encodedPage(100, 50, ".jpg"), 6);

  NormalizedImage image = normalizer.normalize(document);
  EXPECT_EQ(image.width, 50);
  EXPECT_EQ(image.height, 100);
  EXPECT_EQ(image.rotationAngle, 90);
  EXPECT_FALSE(image.mirrored);
}

TEST(ImageNormalizerTest, MirroredExifOrientation) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document;
  document.contentType = "image/jpeg";
  document.bytes = withExifOrientation(encodedPage(100, 50, ".jpg"), 2);

  NormalizedImage image = normalizer.normalize(document);
  EXPECT_EQ(image.width, 100);
  EXPECT_EQ(image.height, 50);
  EXPECT_EQ(image.rotationAngle, 0);
  EXPECT_TRUE(image.mirrored);
}

TEST(ImageNormalizerTest, ApplyOrientationMovesPixels) {
  cv::Mat row = (cv::Mat_<uchar>(1, 2) << 10, 20);
  int angle = -1;
  bool mirrored = true;

  cv::Mat same = ImageNormalizer::applyOrientation(row, 1, angle, mirrored);
  EXPECT_EQ(angle, 0);
  EXPECT_FALSE(mirrored);
  EXPECT_EQ(same.at<uchar>(0, 0), 10);

  cv::Mat flipped = ImageNormalizer::applyOrientation(row, 2, angle, mirrored);
  EXPECT_TRUE(mirrored);
  EXPECT_EQ(flipped.at<uchar>(0, 0), 20);
  EXPECT_EQ(flipped.at<uchar>(0, 1), 10);

  cv::Mat cw = ImageNormalizer::applyOrientation(row, 6, angle, mirrored);
  EXPECT_EQ(angle, 90);
  ASSERT_EQ(cw.rows, 2);
  ASSERT_EQ(cw.cols, 1);
  EXPECT_EQ(cw.at<uchar>(0, 0), 10);
  EXPECT_EQ(cw.at<uchar>(1, 0), 20);

  cv::Mat ccw = ImageNormalizer::applyOrientation(row, 8, angle, mirrored);
  EXPECT_EQ(angle, 270);
  ASSERT_EQ(ccw.rows, 2);
  EXPECT_EQ(ccw.at<uchar>(0, 0), 20);
  EXPECT_EQ(ccw.at<uchar>(1, 0), 10);

  cv::Mat upside = ImageNormalizer::applyOrientation(row, 3, angle, mirrored);
  EXPECT_EQ(angle, 180);
  EXPECT_EQ(upside.at<uchar>(0, 0), 20);
}

TEST(ImageNormalizerTest, EstimatesSkewOfRotatedBlock) {
  cv::Mat page(400, 400, CV_8UC1, cv::Scalar(255));
  cv::rectangle(page, cv::Rect(100, 180, 200, 40), cv::Scalar(0), cv::FILLED);

  // Counter-clockwise by 5 degrees: the block runs uphill to the right
  cv::Mat rotation = cv::getRotationMatrix2D(cv::Point2f(200, 200), 5.0, 1.0);
  cv::Mat uphill;
  cv::warpAffine(page, uphill, rotation, page.size(), cv::INTER_LINEAR,
                 cv::BORDER_CONSTANT, cv::Scalar(255));
  EXPECT_NEAR(ImageNormalizer::estimateSkew(uphill), -5.0, 1.0);

  rotation = cv::getRotationMatrix2D(cv::Point2f(200, 200), -5.0, 1.0);
  cv::Mat downhill;
  cv::warpAffine(page, downhill, rotation, page.size(), cv::INTER_LINEAR,
                 cv::BORDER_CONSTANT, cv::Scalar(255));
  EXPECT_NEAR(ImageNormalizer::estimateSkew(downhill), 5.0, 1.0);

  EXPECT_NEAR(ImageNormalizer::estimateSkew(page), 0.0, 0.5);
}

TEST(ImageNormalizerTest, BlankPageHasNoSkew) {
  cv::Mat blank(100, 100, CV_8UC1, cv::Scalar(255));
  EXPECT_DOUBLE_EQ(ImageNormalizer::estimateSkew(blank), 0.0);
}

TEST(ImageNormalizerTest, DeskewStraightensThePage) {
  for (double degrees : {6.0, -6.0}) {
    UploadedDocument document;
    document.contentType = "image/png";
    ASSERT_TRUE(cv::imencode(".png", rotatedBar(degrees), document.bytes));

    ImageNormalizer normalizer; // deskew on by default
    NormalizedImage image = normalizer.normalize(document);
    EXPECT_EQ(image.width, 300);
    EXPECT_EQ(image.height, 300);
    EXPECT_NEAR(image.deskewAngle, -degrees, 1.0) << degrees;
    EXPECT_NEAR(ImageNormalizer::estimateSkew(image.raster), 0.0, 0.5)
        << degrees;
  }
}

TEST(ImageNormalizerTest, DeskewIgnoresLargeAngles) {
  NormalizerOptions options;
  options.maxDeskewDegrees = 2.0;
  ImageNormalizer normalizer(options);

  UploadedDocument document;
  document.contentType = "image/png";
  ASSERT_TRUE(cv::imencode(".png", rotatedBar(8.0), document.bytes));

  EXPECT_DOUBLE_EQ(normalizer.normalize(document).deskewAngle, 0.0);
}

TEST(ImageNormalizerTest, DownscaleHalvesResolution) {
  ImageNormalizer normalizer(plainOptions());
  NormalizedImage image = normalizer.normalize(pngDocument(200, 100));

  NormalizedImage reduced = normalizer.downscale(image, 0.5);
  EXPECT_EQ(reduced.width, 100);
  EXPECT_EQ(reduced.height, 50);
  EXPECT_EQ(reduced.raster.cols, 100);
  EXPECT_EQ(reduced.raster.rows, 50);
  EXPECT_DOUBLE_EQ(reduced.scale, 0.5);

  // Source image is untouched
  EXPECT_EQ(image.width, 200);
  EXPECT_EQ(image.raster.cols, 200);
  EXPECT_NE(reduced.raster.data, image.raster.data);
}

TEST(ImageNormalizerTest, RendersFirstPdfPage) {
  NormalizerOptions options = plainOptions();
  options.pdfRenderDpi = 144.0;
  ImageNormalizer normalizer(options);

  UploadedDocument document;
  document.contentType = "application/pdf";
  document.bytes = minimalPdf(72, 36);

  NormalizedImage image = normalizer.normalize(document);
  EXPECT_EQ(image.width, 144);
  EXPECT_EQ(image.height, 72);
  EXPECT_EQ(image.colorMode, ColorMode::Gray);
}

TEST(ImageNormalizerTest, RendersEveryPdfPage) {
  NormalizerOptions options = plainOptions();
  options.pdfRenderDpi = 72.0;
  ImageNormalizer normalizer(options);

  UploadedDocument document;
  document.contentType = "application/pdf";
  document.bytes = pdfWithPages({"BT /F1 24 Tf 72 700 Td (Hello) Tj ET", ""},
                                612, 792);

  std::vector<NormalizedImage> pages = normalizer.normalizePages(document);
  ASSERT_EQ(pages.size(), 2u);
  EXPECT_EQ(pages[0].page, 0);
  EXPECT_EQ(pages[1].page, 1);
  EXPECT_EQ(pages[1].width, 612);
  EXPECT_EQ(pages[1].height, 792);

  // Born-digital text comes from the text layer, in raster coordinates
  ASSERT_EQ(pages[0].textLayer.size(), 1u);
  const RecognizedSpan &hello = pages[0].textLayer[0];
  EXPECT_EQ(hello.text, "Hello");
  EXPECT_EQ(hello.page, 0);
  EXPECT_DOUBLE_EQ(hello.confidence, 1.0);
  EXPECT_NEAR(hello.bbox.x, 72, 2);
  // Baseline 92 px from the top
  EXPECT_GT(hello.bbox.y, 50);
  EXPECT_LT(hello.bbox.y + hello.bbox.height, 110);

  // The blank page has nothing to read and goes to recognition
  EXPECT_TRUE(pages[1].textLayer.empty());

  // normalize() is the first page
  EXPECT_EQ(normalizer.normalize(document).textLayer.size(), 1u);
}

TEST(ImageNormalizerTest, PdfPagesAreLimited) {
  NormalizerOptions options = plainOptions();
  options.pdfRenderDpi = 72.0;
  options.maxPdfPages = 2;
  options.pdfTextLayer = false;
  ImageNormalizer normalizer(options);

  UploadedDocument document;
  document.contentType = "application/pdf";
  document.bytes = pdfWithPages(
      {"BT /F1 24 Tf 20 40 Td (One) Tj ET", "BT /F1 24 Tf 20 40 Td (Two) Tj ET",
       "BT /F1 24 Tf 20 40 Td (Three) Tj ET"},
      200, 100);

  std::vector<NormalizedImage> pages = normalizer.normalizePages(document);
  ASSERT_EQ(pages.size(), 2u);
  EXPECT_TRUE(pages[0].textLayer.empty());
  EXPECT_TRUE(pages[1].textLayer.empty());
}

TEST(ImageNormalizerTest, GarbagePdfIsDecodeError) {
  ImageNormalizer normalizer(plainOptions());
  UploadedDocument document;
  document.contentType = "application/pdf";
  std::string garbage = "%PDF-1.4\nthis is not really a pdf";
  document.bytes.assign(garbage.begin(), garbage.end());

  EXPECT_EQ(normalizeError(normalizer, document), ErrorKind::DecodeError);
}
