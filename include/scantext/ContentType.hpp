#ifndef SCANTEXT_CONTENT_TYPE_HPP
#define SCANTEXT_CONTENT_TYPE_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace scantext {

/**
 * @brief Upload formats the normalizer can decode
 */
enum class DocumentFormat { Unknown, Png, Jpeg, Tiff, Bmp, Webp, Pnm, Pdf };

/**
 * @brief Lower-case a media type and strip its parameters
 *
 * "Image/PNG; charset=binary" becomes "image/png".
 */
std::string canonicalMediaType(const std::string &contentType);

/**
 * @brief Return a parameter of a media type ("boundary" of multipart types)
 * @return The unquoted value, or an empty string if absent
 */
std::string mediaTypeParameter(const std::string &contentType,
                               const std::string &name);

/**
 * @brief Map a declared media type to a format
 * @return DocumentFormat::Unknown for unrecognized types, including
 * application/octet-stream
 */
DocumentFormat formatFromMediaType(const std::string &contentType);

/**
 * @brief Identify a format from the leading magic bytes
 */
DocumentFormat sniffFormat(const std::vector<unsigned char> &bytes);

/**
 * @brief Resolve the format of an upload
 *
 * A declared image/document type selects the format (the normalizer checks
 * the bytes against it); application/octet-stream or an empty type falls
 * back to sniffing the magic bytes.
 */
DocumentFormat resolveFormat(const std::string &contentType,
                             const std::vector<unsigned char> &bytes);

/**
 * @brief Guess a media type from a file name extension
 * @return "application/octet-stream" when the extension is not known
 */
std::string mediaTypeForFileName(const std::string &fileName);

std::string toString(DocumentFormat format);

} // namespace scantext

#endif // SCANTEXT_CONTENT_TYPE_HPP
