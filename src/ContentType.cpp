#include "scantext/ContentType.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>

namespace scantext {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string trim(const std::string &value) {
  size_t start = value.find_first_not_of(" \t\r\n");
  size_t end = value.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return value.substr(start, end - start + 1);
}

bool startsWith(const std::vector<unsigned char> &bytes, const char *magic,
                size_t length, size_t offset = 0) {
  if (bytes.size() < offset + length) {
    return false;
  }
  return std::memcmp(bytes.data() + offset, magic, length) == 0;
}

const std::map<std::string, DocumentFormat> &mediaTypes() {
  static const std::map<std::string, DocumentFormat> types = {
      {"image/png", DocumentFormat::Png},
      {"image/jpeg", DocumentFormat::Jpeg},
      {"image/jpg", DocumentFormat::Jpeg},
      {"image/pjpeg", DocumentFormat::Jpeg},
      {"image/tiff", DocumentFormat::Tiff},
      {"image/tif", DocumentFormat::Tiff},
      {"image/bmp", DocumentFormat::Bmp},
      {"image/x-ms-bmp", DocumentFormat::Bmp},
      {"image/webp", DocumentFormat::Webp},
      {"image/x-portable-anymap", DocumentFormat::Pnm},
      {"image/x-portable-bitmap", DocumentFormat::Pnm},
      {"image/x-portable-graymap", DocumentFormat::Pnm},
      {"image/x-portable-pixmap", DocumentFormat::Pnm},
      {"application/pdf", DocumentFormat::Pdf},
  };
  return types;
}

} // anonymous namespace

std::string canonicalMediaType(const std::string &contentType) {
  std::string type = contentType.substr(0, contentType.find(';'));
  return toLower(trim(type));
}

std::string mediaTypeParameter(const std::string &contentType,
                               const std::string &name) {
  const std::string wanted = toLower(name);
  size_t pos = contentType.find(';');

  while (pos != std::string::npos) {
    size_t next = contentType.find(';', pos + 1);
    std::string param = contentType.substr(
        pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);

    size_t eq = param.find('=');
    if (eq != std::string::npos && toLower(trim(param.substr(0, eq))) == wanted) {
      std::string value = trim(param.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      return value;
    }
    pos = next;
  }

  return "";
}

DocumentFormat formatFromMediaType(const std::string &contentType) {
  auto it = mediaTypes().find(canonicalMediaType(contentType));
  return it != mediaTypes().end() ? it->second : DocumentFormat::Unknown;
}

DocumentFormat sniffFormat(const std::vector<unsigned char> &bytes) {
  if (startsWith(bytes, "\x89PNG\r\n\x1a\n", 8)) {
    return DocumentFormat::Png;
  }
  if (startsWith(bytes, "\xff\xd8\xff", 3)) {
    return DocumentFormat::Jpeg;
  }
  if (startsWith(bytes, "II*\0", 4) || startsWith(bytes, "MM\0*", 4)) {
    return DocumentFormat::Tiff;
  }
  if (startsWith(bytes, "BM", 2)) {
    return DocumentFormat::Bmp;
  }
  if (startsWith(bytes, "RIFF", 4) && startsWith(bytes, "WEBP", 4, 8)) {
    return DocumentFormat::Webp;
  }
  if (startsWith(bytes, "%PDF-", 5)) {
    return DocumentFormat::Pdf;
  }
  // P1..P6 netpbm headers
  if (bytes.size() >= 3 && bytes[0] == 'P' && bytes[1] >= '1' &&
      bytes[1] <= '6' && std::isspace(bytes[2])) {
    return DocumentFormat::Pnm;
  }
  return DocumentFormat::Unknown;
}

DocumentFormat resolveFormat(const std::string &contentType,
                             const std::vector<unsigned char> &bytes) {
  std::string type = canonicalMediaType(contentType);
  if (type.empty() || type == "application/octet-stream") {
    return sniffFormat(bytes);
  }
  return formatFromMediaType(type);
}

std::string mediaTypeForFileName(const std::string &fileName) {
  size_t dot = fileName.find_last_of('.');
  if (dot == std::string::npos) {
    return "application/octet-stream";
  }

  static const std::map<std::string, std::string> extensions = {
      {"png", "image/png"},          {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"},        {"tif", "image/tiff"},
      {"tiff", "image/tiff"},        {"bmp", "image/bmp"},
      {"webp", "image/webp"},        {"pbm", "image/x-portable-bitmap"},
      {"pgm", "image/x-portable-graymap"},
      {"ppm", "image/x-portable-pixmap"},
      {"pnm", "image/x-portable-anymap"},
      {"pdf", "application/pdf"},    {"txt", "text/plain"},
  };

  auto it = extensions.find(toLower(fileName.substr(dot + 1)));
  return it != extensions.end() ? it->second : "application/octet-stream";
}

std::string toString(DocumentFormat format) {
  switch (format) {
  case DocumentFormat::Png:
    return "PNG";
  case DocumentFormat::Jpeg:
    return "JPEG";
  case DocumentFormat::Tiff:
    return "TIFF";
  case DocumentFormat::Bmp:
    return "BMP";
  case DocumentFormat::Webp:
    return "WEBP";
  case DocumentFormat::Pnm:
    return "PNM";
  case DocumentFormat::Pdf:
    return "PDF";
  case DocumentFormat::Unknown:
  default:
    return "unknown";
  }
}

} // namespace scantext
