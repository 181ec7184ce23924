#include "scantext/ImageNormalizer.hpp"

#include "scantext/ExifOrientation.hpp"
#include "scantext/ExtractionError.hpp"
#include "scantext/Logger.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <climits>
#include <cmath>
#include <memory>
#include <string>
#include <utility>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace scantext {

namespace {

const char *kTag = "Normalizer";

// Skews smaller than this are scanner noise, not worth a resample
const double kMinDeskewDegrees = 0.5;

// Fewer foreground pixels than this give no usable skew estimate
const int kMinSkewPixels = 64;

cv::Mat toBgr(const poppler::image &popplerImage) {
  int width = popplerImage.width();
  int height = popplerImage.height();
  cv::Mat mat;

  switch (popplerImage.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is stored as BGRA bytes on little-endian hosts
    cv::Mat bgra(height, width, CV_8UC4,
                 const_cast<char *>(popplerImage.const_data()),
                 popplerImage.bytes_per_row());
    cv::cvtColor(bgra, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    cv::Mat rgb(height, width, CV_8UC3,
                const_cast<char *>(popplerImage.const_data()),
                popplerImage.bytes_per_row());
    cv::cvtColor(rgb, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    cv::Mat gray(height, width, CV_8UC1,
                 const_cast<char *>(popplerImage.const_data()),
                 popplerImage.bytes_per_row());
    cv::cvtColor(gray, mat, cv::COLOR_GRAY2BGR);
    break;
  }
  default:
    throw ExtractionError(ErrorKind::DecodeError,
                          "Unsupported PDF render format");
  }
  return mat;
}

/**
 * @brief Read the embedded text of a born-digital page as spans
 *
 * text_list() boxes are in points with a top-left origin; they are scaled to
 * the rendered raster and clamped to it.
 */
std::vector<RecognizedSpan> readTextLayer(const poppler::page &page,
                                          int pageIndex, double scale,
                                          int width, int height) {
  std::vector<RecognizedSpan> spans;

  for (poppler::text_box &textBox : page.text_list()) {
    poppler::byte_array textBytes = textBox.text().to_utf8();
    std::string text(textBytes.begin(), textBytes.end());
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
      continue;
    }

    poppler::rectf box = textBox.bbox();
    int left = static_cast<int>(std::floor(box.x() * scale));
    int top = static_cast<int>(std::floor(box.y() * scale));
    int right = static_cast<int>(std::ceil((box.x() + box.width()) * scale));
    int bottom = static_cast<int>(std::ceil((box.y() + box.height()) * scale));

    BoundingBox bbox;
    bbox.x = left;
    bbox.y = top;
    bbox.width = right - left;
    bbox.height = bottom - top;
    bbox = clampToImage(bbox, width, height);
    if (bbox.width <= 0 || bbox.height <= 0) {
      continue;
    }

    RecognizedSpan span;
    span.text = text;
    span.bbox = bbox;
    span.confidence = 1.0;
    span.page = pageIndex;
    spans.push_back(span);
  }

  return spans;
}

} // anonymous namespace

ImageNormalizer::ImageNormalizer() : m_options() {}

ImageNormalizer::ImageNormalizer(const NormalizerOptions &options)
    : m_options(options) {}

const NormalizerOptions &ImageNormalizer::getOptions() const {
  return m_options;
}

std::vector<NormalizedImage>
ImageNormalizer::normalizePages(const UploadedDocument &document) const {
  DocumentFormat format = resolveFormat(document.contentType, document.bytes);
  if (format == DocumentFormat::Unknown) {
    std::string declared =
        document.contentType.empty() ? "(none)" : document.contentType;
    throw ExtractionError(ErrorKind::UnsupportedFormat,
                          "Unsupported content type: " + declared);
  }

  if (document.bytes.empty()) {
    throw ExtractionError(ErrorKind::DecodeError, "Upload is empty");
  }

  std::vector<NormalizedImage> pages;

  if (format == DocumentFormat::Pdf) {
    std::vector<RenderedPage> rendered = renderPdfPages(document.bytes);
    for (size_t i = 0; i < rendered.size(); ++i) {
      NormalizedImage page;
      page.page = static_cast<int>(i);
      page.textLayer = std::move(rendered[i].textLayer);
      // Text layer boxes are in page coordinates, so those pages stay upright
      bool allowDeskew = page.textLayer.empty();
      pages.push_back(finishPage(rendered[i].raster, allowDeskew,
                                 std::move(page)));
    }
  } else {
    // imdecode ignores the declared type
    DocumentFormat sniffed = sniffFormat(document.bytes);
    if (sniffed != format) {
      throw ExtractionError(ErrorKind::DecodeError,
                            "Content is not " + toString(format) + " data" +
                                (sniffed == DocumentFormat::Unknown
                                     ? std::string()
                                     : " (looks like " + toString(sniffed) +
                                           ")"));
    }

    cv::Mat decoded = decodeRaster(format, document.bytes);

    NormalizedImage page;

    // Orientation from embedded metadata; untouched when there is none
    cv::Mat oriented = decoded;
    if (format == DocumentFormat::Jpeg || format == DocumentFormat::Tiff) {
      std::optional<int> orientation = readExifOrientation(document.bytes);
      if (orientation) {
        oriented = applyOrientation(decoded, *orientation, page.rotationAngle,
                                    page.mirrored);
        logDebug(kTag, "Applied EXIF orientation ", *orientation, " (",
                 page.rotationAngle, " deg",
                 page.mirrored ? ", mirrored" : "", ")");
      }
    }

    pages.push_back(finishPage(oriented, true, std::move(page)));
  }

  logDebug(kTag, "Normalized ", toString(format), " upload of ",
           document.size(), " bytes to ", pages.size(), " page(s), first ",
           pages.front().width, "x", pages.front().height);
  return pages;
}

NormalizedImage
ImageNormalizer::normalize(const UploadedDocument &document) const {
  std::vector<NormalizedImage> pages = normalizePages(document);
  return std::move(pages.front());
}

NormalizedImage ImageNormalizer::finishPage(const cv::Mat &oriented,
                                            bool allowDeskew,
                                            NormalizedImage result) const {
  cv::Mat working = m_options.grayscale ? toGray(oriented) : oriented;

  if (m_options.deskew && allowDeskew) {
    working = deskew(working, result.deskewAngle);
  }

  working = denoise(working);
  result.denoised = true;

  if (m_options.binarize) {
    cv::Mat gray = working.channels() == 1 ? working : toGray(working);
    cv::adaptiveThreshold(gray, working, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY, 11, 2);
  }

  result.raster = working;
  result.width = working.cols;
  result.height = working.rows;
  result.colorMode = working.channels() == 1 ? ColorMode::Gray : ColorMode::Color;
  result.scale = 1.0;
  return result;
}

NormalizedImage ImageNormalizer::downscale(const NormalizedImage &image,
                                           double factor) const {
  NormalizedImage result = image;
  if (image.raster.empty() || factor <= 0.0 || factor >= 1.0) {
    result.raster = image.raster.clone();
    return result;
  }

  int width = std::max(1, static_cast<int>(std::lround(image.width * factor)));
  int height =
      std::max(1, static_cast<int>(std::lround(image.height * factor)));

  cv::resize(image.raster, result.raster, cv::Size(width, height), 0, 0,
             cv::INTER_AREA);
  result.width = result.raster.cols;
  result.height = result.raster.rows;
  result.scale = image.scale * factor;

  logDebug(kTag, "Downscaled ", image.width, "x", image.height, " to ",
           result.width, "x", result.height);
  return result;
}

cv::Mat ImageNormalizer::applyOrientation(const cv::Mat &image, int orientation,
                                          int &rotationAngle, bool &mirrored) {
  cv::Mat rotated;
  rotationAngle = 0;
  mirrored = false;

  switch (orientation) {
  case 2:
    mirrored = true;
    rotated = image;
    break;
  case 3:
    rotationAngle = 180;
    cv::rotate(image, rotated, cv::ROTATE_180);
    break;
  case 4:
    // Vertical flip: rotate 180 then mirror
    rotationAngle = 180;
    mirrored = true;
    cv::rotate(image, rotated, cv::ROTATE_180);
    break;
  case 5:
    // Transpose: rotate 90 clockwise then mirror
    rotationAngle = 90;
    mirrored = true;
    cv::rotate(image, rotated, cv::ROTATE_90_CLOCKWISE);
    break;
  case 6:
    rotationAngle = 90;
    cv::rotate(image, rotated, cv::ROTATE_90_CLOCKWISE);
    break;
  case 7:
    // Transverse: rotate 90 counter-clockwise then mirror
    rotationAngle = 270;
    mirrored = true;
    cv::rotate(image, rotated, cv::ROTATE_90_COUNTERCLOCKWISE);
    break;
  case 8:
    rotationAngle = 270;
    cv::rotate(image, rotated, cv::ROTATE_90_COUNTERCLOCKWISE);
    break;
  case 1:
  default:
    return image;
  }

  if (mirrored) {
    cv::Mat flipped;
    cv::flip(rotated, flipped, 1);
    return flipped;
  }
  return rotated;
}

double ImageNormalizer::estimateSkew(const cv::Mat &gray) {
  if (gray.empty() || gray.channels() != 1) {
    return 0.0;
  }

  cv::Mat binary;
  cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

  std::vector<cv::Point> points;
  cv::findNonZero(binary, points);
  if (static_cast<int>(points.size()) < kMinSkewPixels) {
    return 0.0;
  }

  cv::RotatedRect box = cv::minAreaRect(points);

  // Measure an edge from the corner points rather than trusting box.angle,
  // whose range and sign changed between OpenCV releases. Image y grows
  // downwards, so a downhill edge has a positive angle.
  cv::Point2f corners[4];
  box.points(corners);
  double angle = std::atan2(corners[1].y - corners[0].y,
                            corners[1].x - corners[0].x) *
                 180.0 / CV_PI;

  // Either edge of the box will do; fold to the nearest axis
  while (angle > 45.0) {
    angle -= 90.0;
  }
  while (angle < -45.0) {
    angle += 90.0;
  }
  return angle;
}

cv::Mat ImageNormalizer::decodeRaster(
    DocumentFormat format, const std::vector<unsigned char> &bytes) const {
  cv::Mat decoded;
  try {
    // Orientation is handled explicitly so it can be recorded
    decoded = cv::imdecode(bytes, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
  } catch (const cv::Exception &e) {
    throw ExtractionError(ErrorKind::DecodeError,
                          std::string("Failed to decode ") + toString(format) +
                              " data: " + e.what());
  }

  if (decoded.empty()) {
    throw ExtractionError(ErrorKind::DecodeError,
                          "Failed to decode " + toString(format) + " data");
  }
  return decoded;
}

std::vector<ImageNormalizer::RenderedPage> ImageNormalizer::renderPdfPages(
    const std::vector<unsigned char> &bytes) const {
  if (bytes.size() > static_cast<size_t>(INT_MAX)) {
    throw ExtractionError(ErrorKind::DecodeError, "PDF is too large to load");
  }

  // Poppler reads the buffer in place; bytes outlives doc
  std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
      reinterpret_cast<const char *>(bytes.data()),
      static_cast<int>(bytes.size())));

  if (!doc) {
    throw ExtractionError(ErrorKind::DecodeError, "Failed to load PDF data");
  }

  if (doc->is_locked()) {
    throw ExtractionError(ErrorKind::DecodeError, "PDF is password protected");
  }

  int pageCount = doc->pages();
  if (pageCount < 1) {
    throw ExtractionError(ErrorKind::DecodeError, "PDF has no pages");
  }

  int pagesToRender = std::min(pageCount, m_options.maxPdfPages);
  if (pagesToRender < pageCount) {
    logWarning(kTag, "PDF has ", pageCount, " pages, processing the first ",
               pagesToRender);
  }

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  const double dpi = m_options.pdfRenderDpi;
  std::vector<RenderedPage> pages;

  for (int index = 0; index < pagesToRender; ++index) {
    std::unique_ptr<poppler::page> page(doc->create_page(index));
    if (!page) {
      throw ExtractionError(ErrorKind::DecodeError,
                            "Failed to open PDF page " +
                                std::to_string(index + 1));
    }

    poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
    if (!popplerImage.is_valid()) {
      throw ExtractionError(ErrorKind::DecodeError,
                            "Failed to render PDF page " +
                                std::to_string(index + 1));
    }

    RenderedPage rendered;
    rendered.raster = toBgr(popplerImage);
    if (m_options.pdfTextLayer) {
      rendered.textLayer = readTextLayer(*page, index, dpi / 72.0,
                                         rendered.raster.cols,
                                         rendered.raster.rows);
    }

    logDebug(kTag, "Rendered PDF page ", index + 1, " of ", pageCount, " at ",
             dpi, " dpi: ", rendered.raster.cols, "x", rendered.raster.rows,
             ", ", rendered.textLayer.size(), " text layer boxes");
    pages.push_back(std::move(rendered));
  }

  return pages;
}

cv::Mat ImageNormalizer::toGray(const cv::Mat &image) const {
  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }
  return gray;
}

cv::Mat ImageNormalizer::deskew(const cv::Mat &image,
                                double &appliedAngle) const {
  appliedAngle = 0.0;

  cv::Mat gray = image.channels() == 1 ? image : toGray(image);
  double angle = estimateSkew(gray);
  double magnitude = std::abs(angle);

  if (magnitude < kMinDeskewDegrees || magnitude > m_options.maxDeskewDegrees) {
    return image;
  }

  cv::Point2f center(image.cols / 2.0f, image.rows / 2.0f);
  cv::Mat rotation = cv::getRotationMatrix2D(center, angle, 1.0);
  cv::Mat rotated;
  cv::warpAffine(image, rotated, rotation, image.size(), cv::INTER_CUBIC,
                 cv::BORDER_REPLICATE);

  appliedAngle = angle;
  logDebug(kTag, "Deskewed by ", angle, " degrees");
  return rotated;
}

cv::Mat ImageNormalizer::denoise(const cv::Mat &image) const {
  cv::Mat blurred;
  cv::GaussianBlur(image, blurred, cv::Size(3, 3), 0);
  return blurred;
}

} // namespace scantext
