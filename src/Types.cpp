#include "scantext/Types.hpp"

#include <algorithm>

namespace scantext {

std::string toString(ExtractionStatus status) {
  switch (status) {
  case ExtractionStatus::Success:
    return "Success";
  case ExtractionStatus::PartialFailure:
    return "PartialFailure";
  case ExtractionStatus::Failure:
  default:
    return "Failure";
  }
}

std::string toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnsupportedFormat:
    return "UnsupportedFormat";
  case ErrorKind::DecodeError:
    return "DecodeError";
  case ErrorKind::EngineTimeout:
    return "EngineTimeout";
  case ErrorKind::PartialFailure:
    return "PartialFailure";
  case ErrorKind::EngineError:
    return "EngineError";
  case ErrorKind::PayloadTooLarge:
    return "PayloadTooLarge";
  case ErrorKind::ServiceBusy:
  default:
    return "ServiceBusy";
  }
}

std::string toString(PipelineState state) {
  switch (state) {
  case PipelineState::Received:
    return "Received";
  case PipelineState::Normalizing:
    return "Normalizing";
  case PipelineState::Recognizing:
    return "Recognizing";
  case PipelineState::Assembled:
    return "Assembled";
  case PipelineState::Failed:
  default:
    return "Failed";
  }
}

int httpStatusFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnsupportedFormat:
    return 415;
  case ErrorKind::DecodeError:
    return 422;
  case ErrorKind::PayloadTooLarge:
    return 413;
  case ErrorKind::EngineTimeout:
  case ErrorKind::PartialFailure:
    return 504;
  case ErrorKind::ServiceBusy:
    return 503;
  case ErrorKind::EngineError:
  default:
    return 500;
  }
}

BoundingBox clampToImage(const BoundingBox &box, int width, int height) {
  int x1 = std::max(0, box.x);
  int y1 = std::max(0, box.y);
  int x2 = std::min(width, box.x + std::max(0, box.width));
  int y2 = std::min(height, box.y + std::max(0, box.height));

  BoundingBox clamped;
  clamped.x = std::min(x1, std::max(0, width));
  clamped.y = std::min(y1, std::max(0, height));
  clamped.width = std::max(0, x2 - x1);
  clamped.height = std::max(0, y2 - y1);
  return clamped;
}

} // namespace scantext
