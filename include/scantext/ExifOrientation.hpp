#ifndef SCANTEXT_EXIF_ORIENTATION_HPP
#define SCANTEXT_EXIF_ORIENTATION_HPP

#include <cstddef>
#include <optional>
#include <vector>

namespace scantext {

/**
 * @brief Read the orientation tag (0x0112) embedded in an image
 *
 * Understands JPEG files carrying an APP1 "Exif" segment and bare TIFF
 * streams. Malformed or truncated metadata is treated as absent.
 *
 * @param bytes Encoded image
 * @return Orientation value 1..8, or std::nullopt when no valid tag exists
 */
std::optional<int> readExifOrientation(const std::vector<unsigned char> &bytes);

/**
 * @brief Read the orientation tag from a TIFF header and IFD0
 * @param data Start of the TIFF header ("II*\0" or "MM\0*")
 * @param size Bytes available from data
 */
std::optional<int> readTiffOrientation(const unsigned char *data,
                                       std::size_t size);

} // namespace scantext

#endif // SCANTEXT_EXIF_ORIENTATION_HPP
