#ifndef SCANTEXT_TYPES_HPP
#define SCANTEXT_TYPES_HPP

#include <opencv2/core.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scantext {

/**
 * @brief Outcome of one extraction request
 */
enum class ExtractionStatus {
  Success,        ///< Spans recognized normally (possibly after a retry)
  PartialFailure, ///< Degraded: the engine timed out on both attempts
  Failure         ///< Terminal failure, no spans
};

/**
 * @brief Error taxonomy surfaced at the orchestrator boundary
 */
enum class ErrorKind {
  UnsupportedFormat, ///< Declared content type is not a recognized format
  DecodeError,       ///< Bytes could not be decoded as the declared format
  EngineTimeout,     ///< Recognition exceeded its time budget
  PartialFailure,    ///< Timed out again on the reduced-resolution retry
  EngineError,       ///< The recognition engine reported a fatal error
  PayloadTooLarge,   ///< Upload exceeds max_upload_bytes
  ServiceBusy        ///< Worker pool refused admission
};

/**
 * @brief Pipeline states of the extraction orchestrator
 */
enum class PipelineState { Received, Normalizing, Recognizing, Assembled, Failed };

/**
 * @brief Pixel layout of a normalized raster
 */
enum class ColorMode { Gray, Color };

/**
 * @brief Raw upload as received from the boundary
 */
struct UploadedDocument {
  std::vector<unsigned char> bytes; ///< Raw payload, never mutated
  std::string contentType;          ///< Declared media type
  std::string fileName;             ///< Optional client-side file name

  std::size_t size() const { return bytes.size(); }
};

/**
 * @brief Axis-aligned rectangle in normalized-image pixel coordinates
 */
struct BoundingBox {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool operator==(const BoundingBox &other) const {
    return x == other.x && y == other.y && width == other.width &&
           height == other.height;
  }
  bool operator!=(const BoundingBox &other) const { return !(*this == other); }
};

/**
 * @brief One recognized piece of text
 */
struct RecognizedSpan {
  std::string text;
  BoundingBox bbox;
  double confidence = 0.0; ///< In [0, 1]
  int order = 0;           ///< Reading-order index, equals sequence position
  int page = 0;            ///< Zero-based page the span was found on
};

/**
 * @brief Canonical raster produced by the ImageNormalizer
 *
 * Owned by a single request. The raster shares no data with any other
 * request's image.
 */
struct NormalizedImage {
  cv::Mat raster;                       ///< 8-bit gray or BGR pixels
  int width = 0;                        ///< Raster width in pixels
  int height = 0;                       ///< Raster height in pixels
  ColorMode colorMode = ColorMode::Gray; ///< Pixel layout of raster
  int rotationAngle = 0;  ///< Clockwise rotation applied from metadata
  bool mirrored = false;  ///< Whether a metadata flip was applied
  double deskewAngle = 0; ///< Deskew rotation in degrees (0 = none)
  bool denoised = false;  ///< Whether the denoise filter ran
  double scale = 1.0;     ///< Size relative to the first normalized image
  int page = 0;           ///< Zero-based page index, 0 for single images

  /// Spans read from an embedded PDF text layer; recognition is skipped when
  /// this is non-empty
  std::vector<RecognizedSpan> textLayer;
};

/**
 * @brief Assembled response of the extraction pipeline
 */
struct ExtractionResult {
  ExtractionStatus status = ExtractionStatus::Failure;
  std::vector<RecognizedSpan> spans; ///< Reading order; empty on Failure
  double meanConfidence = 0.0;
  double durationMs = 0.0;

  std::optional<ErrorKind> error; ///< Taxonomy member when not a clean Success
  std::string message;            ///< Human-readable summary
  std::string fullText;           ///< Span texts joined in reading order
  int attempts = 0;               ///< Engine attempts over all pages
  bool retried = false;           ///< Whether any reduced-resolution retry ran
  int imageWidth = 0;              ///< Size of the first page
  int imageHeight = 0;
  int pageCount = 0;               ///< Pages normalized (1 for single images)
  std::vector<PipelineState> states; ///< States visited, in order
};

std::string toString(ExtractionStatus status);
std::string toString(ErrorKind kind);
std::string toString(PipelineState state);

/**
 * @brief HTTP-equivalent status code for an error kind
 */
int httpStatusFor(ErrorKind kind);

/**
 * @brief Intersect a box with the image rectangle [0,width) x [0,height)
 * @return The clamped box; width/height are 0 when there is no overlap
 */
BoundingBox clampToImage(const BoundingBox &box, int width, int height);

} // namespace scantext

#endif // SCANTEXT_TYPES_HPP
