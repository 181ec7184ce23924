#include "scantext/ExifOrientation.hpp"

#include <cstdint>
#include <cstring>

namespace scantext {

namespace {

const uint16_t kOrientationTag = 0x0112;
const uint16_t kTypeShort = 3;

uint16_t read16(const unsigned char *p, bool littleEndian) {
  return littleEndian ? static_cast<uint16_t>(p[0] | (p[1] << 8))
                      : static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t read32(const unsigned char *p, bool littleEndian) {
  if (littleEndian) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
  }
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

} // anonymous namespace

std::optional<int> readTiffOrientation(const unsigned char *data,
                                       std::size_t size) {
  if (data == nullptr || size < 8) {
    return std::nullopt;
  }

  bool littleEndian;
  if (data[0] == 'I' && data[1] == 'I') {
    littleEndian = true;
  } else if (data[0] == 'M' && data[1] == 'M') {
    littleEndian = false;
  } else {
    return std::nullopt;
  }

  if (read16(data + 2, littleEndian) != 42) {
    return std::nullopt;
  }

  uint32_t ifdOffset = read32(data + 4, littleEndian);
  if (ifdOffset < 8 || static_cast<std::size_t>(ifdOffset) + 2 > size) {
    return std::nullopt;
  }

  uint16_t entryCount = read16(data + ifdOffset, littleEndian);
  std::size_t entriesStart = static_cast<std::size_t>(ifdOffset) + 2;

  for (uint16_t i = 0; i < entryCount; ++i) {
    std::size_t entry = entriesStart + static_cast<std::size_t>(i) * 12;
    if (entry + 12 > size) {
      return std::nullopt;
    }

    if (read16(data + entry, littleEndian) != kOrientationTag) {
      continue;
    }

    uint16_t type = read16(data + entry + 2, littleEndian);
    uint32_t count = read32(data + entry + 4, littleEndian);
    if (type != kTypeShort || count < 1) {
      return std::nullopt;
    }

    // A single SHORT is stored left-justified in the value field
    uint16_t value = read16(data + entry + 8, littleEndian);
    if (value < 1 || value > 8) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  }

  return std::nullopt;
}

std::optional<int> readExifOrientation(const std::vector<unsigned char> &bytes) {
  const std::size_t size = bytes.size();
  const unsigned char *data = bytes.data();

  if (size >= 4 && ((data[0] == 'I' && data[1] == 'I') ||
                    (data[0] == 'M' && data[1] == 'M'))) {
    return readTiffOrientation(data, size);
  }

  if (size < 4 || data[0] != 0xFF || data[1] != 0xD8) {
    return std::nullopt;
  }

  // Walk JPEG marker segments until the start of scan
  std::size_t pos = 2;
  while (pos + 4 <= size) {
    if (data[pos] != 0xFF) {
      return std::nullopt;
    }

    unsigned char marker = data[pos + 1];
    if (marker == 0xFF) {
      ++pos; // fill byte
      continue;
    }
    if (marker == 0xDA || marker == 0xD9) {
      break;
    }
    if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
      pos += 2; // standalone markers carry no length
      continue;
    }

    std::size_t length = (static_cast<std::size_t>(data[pos + 2]) << 8) |
                         data[pos + 3];
    if (length < 2 || pos + 2 + length > size) {
      return std::nullopt;
    }

    const unsigned char *segment = data + pos + 4;
    std::size_t segmentSize = length - 2;
    if (marker == 0xE1 && segmentSize >= 6 &&
        std::memcmp(segment, "Exif\0\0", 6) == 0) {
      return readTiffOrientation(segment + 6, segmentSize - 6);
    }

    pos += 2 + length;
  }

  return std::nullopt;
}

} // namespace scantext
