#ifndef SCANTEXT_IMAGE_NORMALIZER_HPP
#define SCANTEXT_IMAGE_NORMALIZER_HPP

#include "scantext/ContentType.hpp"
#include "scantext/ServiceConfig.hpp"
#include "scantext/Types.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace scantext {

/**
 * @brief Decodes uploads into the canonical raster used for recognition
 *
 * The pipeline for one upload is:
 * - resolve the format from the declared content type (sniffing magic bytes
 *   for application/octet-stream), and check the bytes match it
 * - decode with OpenCV, or rasterize each page with Poppler for PDF, reading
 *   the embedded text layer of born-digital pages
 * - apply the embedded EXIF/TIFF orientation, if any
 * - convert to grayscale, deskew and denoise as configured
 *
 * The normalizer holds only its options; every call allocates its own output
 * and never touches the input bytes, so one instance may serve concurrent
 * requests.
 */
class ImageNormalizer {
public:
  ImageNormalizer();
  explicit ImageNormalizer(const NormalizerOptions &options);
  virtual ~ImageNormalizer() = default;

  /**
   * @brief Decode and normalize every page of an upload
   * @param document Uploaded bytes and declared content type
   * @return One image per page in page order; a single image for raster
   * formats, at most maxPdfPages for PDF
   * @throws ExtractionError UnsupportedFormat or DecodeError
   */
  virtual std::vector<NormalizedImage>
  normalizePages(const UploadedDocument &document) const;

  /**
   * @brief Decode and normalize the first page of an upload
   * @throws ExtractionError UnsupportedFormat or DecodeError
   */
  NormalizedImage normalize(const UploadedDocument &document) const;

  /**
   * @brief Produce a reduced-resolution copy for a recognition retry
   * @param image Image returned by normalize()
   * @param factor Scale factor in (0, 1)
   * @return Resampled image whose scale is image.scale * factor
   */
  virtual NormalizedImage downscale(const NormalizedImage &image,
                                    double factor) const;

  const NormalizerOptions &getOptions() const;

  /**
   * @brief Apply an EXIF orientation value (1..8) to a raster
   * @param image Decoded raster in stored orientation
   * @param orientation EXIF orientation value
   * @param rotationAngle Receives the clockwise rotation applied
   * @param mirrored Receives whether a horizontal flip was applied
   * @return The raster in display orientation
   */
  static cv::Mat applyOrientation(const cv::Mat &image, int orientation,
                                  int &rotationAngle, bool &mirrored);

  /**
   * @brief Estimate the skew of dark foreground content on a light page
   *
   * Positive angles mean the content runs downhill to the right. Rotating by
   * the returned angle with cv::getRotationMatrix2D straightens it.
   *
   * @param gray 8-bit single-channel image
   * @return Skew in degrees within [-45, 45]; 0 when there is too little
   * foreground to tell
   */
  static double estimateSkew(const cv::Mat &gray);

private:
  struct RenderedPage {
    cv::Mat raster;
    std::vector<RecognizedSpan> textLayer;
  };

  cv::Mat decodeRaster(DocumentFormat format,
                       const std::vector<unsigned char> &bytes) const;
  std::vector<RenderedPage>
  renderPdfPages(const std::vector<unsigned char> &bytes) const;
  NormalizedImage finishPage(const cv::Mat &oriented, bool allowDeskew,
                             NormalizedImage result) const;
  cv::Mat toGray(const cv::Mat &image) const;
  cv::Mat deskew(const cv::Mat &image, double &appliedAngle) const;
  cv::Mat denoise(const cv::Mat &image) const;

  NormalizerOptions m_options;
};

} // namespace scantext

#endif // SCANTEXT_IMAGE_NORMALIZER_HPP
