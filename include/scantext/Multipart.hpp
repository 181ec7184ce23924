#ifndef SCANTEXT_MULTIPART_HPP
#define SCANTEXT_MULTIPART_HPP

#include <map>
#include <string>
#include <vector>

namespace scantext {

/**
 * @brief One part of a multipart/form-data body
 */
struct MultipartPart {
  std::map<std::string, std::string> headers; ///< Lower-case header names
  std::string name;                           ///< Form field name
  std::string fileName;    ///< Client file name, empty for plain fields
  std::string contentType; ///< Part media type, empty if not given
  std::vector<unsigned char> body;
};

/**
 * @brief Split a multipart/form-data body into its parts
 * @param body Raw request body
 * @param boundary Boundary parameter of the request content type
 * @return Parts in body order
 * @throws ExtractionError DecodeError when the body is not well formed
 */
std::vector<MultipartPart>
parseMultipart(const std::vector<unsigned char> &body,
               const std::string &boundary);

/**
 * @brief Pick the uploaded file: the first part with a file name, otherwise
 * the first part
 * @throws ExtractionError DecodeError if there are no parts
 */
const MultipartPart &selectUploadPart(const std::vector<MultipartPart> &parts);

} // namespace scantext

#endif // SCANTEXT_MULTIPART_HPP
