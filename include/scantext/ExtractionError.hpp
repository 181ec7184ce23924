#ifndef SCANTEXT_EXTRACTION_ERROR_HPP
#define SCANTEXT_EXTRACTION_ERROR_HPP

#include "scantext/Types.hpp"

#include <stdexcept>
#include <string>

namespace scantext {

/**
 * @brief Exception thrown by pipeline stages, tagged with its taxonomy member
 *
 * Raised by the normalizer, the engine adapter and the worker pool. The
 * ExtractionOrchestrator catches it and folds it into an ExtractionResult.
 */
class ExtractionError : public std::runtime_error {
public:
  ExtractionError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), m_kind(kind) {}

  ErrorKind kind() const { return m_kind; }

private:
  ErrorKind m_kind;
};

} // namespace scantext

#endif // SCANTEXT_EXTRACTION_ERROR_HPP
