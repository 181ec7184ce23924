#include "scantext/Multipart.hpp"

#include "scantext/ContentType.hpp"
#include "scantext/ExtractionError.hpp"

#include <algorithm>
#include <cctype>

namespace scantext {

namespace {

using Bytes = std::vector<unsigned char>;
using Iter = Bytes::const_iterator;

const std::string kCrlf = "\r\n";

Iter find(Iter begin, Iter end, const std::string &needle) {
  return std::search(begin, end, needle.begin(), needle.end());
}

bool startsWithAt(Iter pos, Iter end, const std::string &prefix) {
  if (static_cast<size_t>(end - pos) < prefix.size()) {
    return false;
  }
  return std::equal(prefix.begin(), prefix.end(), pos);
}

std::string trim(const std::string &value) {
  size_t start = value.find_first_not_of(" \t");
  size_t end = value.find_last_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }
  return value.substr(start, end - start + 1);
}

[[noreturn]] void malformed(const std::string &why) {
  throw ExtractionError(ErrorKind::DecodeError,
                        "Malformed multipart body: " + why);
}

void parseHeaders(const std::string &block, MultipartPart &part) {
  size_t pos = 0;
  while (pos < block.size()) {
    size_t end = block.find(kCrlf, pos);
    std::string line =
        block.substr(pos, end == std::string::npos ? std::string::npos
                                                   : end - pos);
    pos = end == std::string::npos ? block.size() : end + kCrlf.size();

    if (line.empty()) {
      continue;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      malformed("header line without ':'");
    }

    std::string name = trim(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    part.headers[name] = trim(line.substr(colon + 1));
  }

  auto disposition = part.headers.find("content-disposition");
  if (disposition != part.headers.end()) {
    part.name = mediaTypeParameter(disposition->second, "name");
    part.fileName = mediaTypeParameter(disposition->second, "filename");
  }

  auto type = part.headers.find("content-type");
  if (type != part.headers.end()) {
    part.contentType = type->second;
  }
}

} // anonymous namespace

std::vector<MultipartPart> parseMultipart(const Bytes &body,
                                          const std::string &boundary) {
  if (boundary.empty()) {
    malformed("missing boundary");
  }

  const std::string delimiter = "--" + boundary;
  const std::string bodyDelimiter = kCrlf + delimiter;

  std::vector<MultipartPart> parts;

  // Preamble is ignored; the first delimiter may start the body
  Iter pos = find(body.begin(), body.end(), delimiter);
  if (pos == body.end()) {
    malformed("boundary not found");
  }
  pos += delimiter.size();

  while (true) {
    if (startsWithAt(pos, body.end(), "--")) {
      return parts; // closing delimiter
    }
    if (!startsWithAt(pos, body.end(), kCrlf)) {
      malformed("expected line break after boundary");
    }
    pos += kCrlf.size();

    Iter headersEnd = find(pos, body.end(), kCrlf + kCrlf);
    MultipartPart part;
    Iter contentStart;
    if (startsWithAt(pos, body.end(), kCrlf)) {
      // No headers at all
      contentStart = pos + kCrlf.size();
    } else {
      if (headersEnd == body.end()) {
        malformed("unterminated part headers");
      }
      parseHeaders(std::string(pos, headersEnd), part);
      contentStart = headersEnd + 2 * kCrlf.size();
    }

    Iter contentEnd = find(contentStart, body.end(), bodyDelimiter);
    if (contentEnd == body.end()) {
      malformed("missing closing boundary");
    }

    part.body.assign(contentStart, contentEnd);
    parts.push_back(std::move(part));

    pos = contentEnd + bodyDelimiter.size();
  }
}

const MultipartPart &selectUploadPart(const std::vector<MultipartPart> &parts) {
  if (parts.empty()) {
    malformed("no parts");
  }

  for (const MultipartPart &part : parts) {
    if (!part.fileName.empty()) {
      return part;
    }
  }
  return parts.front();
}

} // namespace scantext
