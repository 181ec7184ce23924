#ifndef SCANTEXT_SERVICE_CONFIG_HPP
#define SCANTEXT_SERVICE_CONFIG_HPP

#include <cstddef>
#include <string>

namespace scantext {

/**
 * @brief Options for the ImageNormalizer
 */
struct NormalizerOptions {
  bool grayscale = true;          ///< Convert the raster to 8-bit gray
  bool deskew = true;             ///< Straighten slightly rotated scans
  double maxDeskewDegrees = 15.0; ///< Larger estimated skews are ignored
  bool binarize = false;          ///< Adaptive threshold after denoising
  double pdfRenderDpi = 200.0;    ///< Resolution for rasterizing PDF pages
  int maxPdfPages = 10;           ///< Pages beyond this are not processed
  bool pdfTextLayer = true;       ///< Use embedded PDF text instead of OCR
};

/**
 * @brief Options for the Tesseract recognition engine
 */
struct EngineOptions {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu+eng")
  std::string tessDataPath;     ///< Path to tessdata (empty = TESSDATA_PREFIX)
  int pageSegMode = 3;          ///< tesseract::PageSegMode, 3 = PSM_AUTO
};

/**
 * @brief Configuration of one serving process
 *
 * Values are layered: defaults, then an optional JSON file, then SCANTEXT_*
 * environment variables, then command-line overrides applied by the caller.
 *
 * Example JSON file:
 * @code
 * {
 *   "max_upload_bytes": 10485760,
 *   "engine_timeout_ms": 20000,
 *   "request_timeout_ms": 60000,
 *   "confidence_threshold": 0.3,
 *   "worker_threads": 4,
 *   "engine": { "language": "eng+deu" },
 *   "normalizer": { "deskew": false }
 * }
 * @endcode
 */
struct ServiceConfig {
  std::size_t maxUploadBytes = 20 * 1024 * 1024;
  long engineTimeoutMs = 30000;
  long requestTimeoutMs = 90000;
  double confidenceThreshold = 0.0; ///< Spans below this are not returned
  std::size_t workerThreads = 0;    ///< 0 = hardware concurrency
  std::size_t maxQueuedJobs = 16;   ///< Pending jobs beyond this are refused
  double retryScale = 0.5;          ///< Resolution factor for timeout retry
  std::string logLevel = "info";

  NormalizerOptions normalizer;
  EngineOptions engine;

  /**
   * @brief Load a JSON configuration file on top of the defaults
   * @throws std::runtime_error if the file cannot be read or parsed
   */
  static ServiceConfig fromFile(const std::string &path);

  /**
   * @brief Parse JSON text on top of this configuration
   * @throws std::runtime_error on malformed JSON or mistyped values
   */
  void mergeJson(const std::string &text);

  /**
   * @brief Apply SCANTEXT_* and TESSDATA_PREFIX environment variables
   * @throws std::invalid_argument if a numeric variable is not a number
   */
  void applyEnvironment();

  /**
   * @brief Check ranges of every option
   * @throws std::invalid_argument naming the first offending option
   */
  void validate() const;

  /**
   * @brief Worker thread count with 0 resolved to the hardware concurrency
   *
   * The resolved count is at least 2, so a retry can start while the
   * abandoned first attempt still occupies a worker. An explicit count is
   * used as given.
   */
  std::size_t resolvedWorkerThreads() const;
};

} // namespace scantext

#endif // SCANTEXT_SERVICE_CONFIG_HPP
