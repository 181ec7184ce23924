#ifndef SCANTEXT_REQUEST_HANDLER_HPP
#define SCANTEXT_REQUEST_HANDLER_HPP

#include "scantext/ExtractionOrchestrator.hpp"
#include "scantext/Types.hpp"
#include "scantext/WorkerPool.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace scantext {

/**
 * @brief An upload as handed over by the web framework binding
 */
struct UploadRequest {
  std::string contentType;         ///< Request Content-Type header
  std::vector<unsigned char> body; ///< Raw body, image bytes or multipart
  std::string fileName;            ///< Optional client file name
  std::optional<BoundingBox> roi;  ///< Optional region of interest
};

/**
 * @brief Serialized reply for the web framework binding
 */
struct HandlerResponse {
  int statusCode = 200;
  std::string contentType = "application/json";
  std::string body;
};

/**
 * @brief Boundary between the web framework and the extraction pipeline
 *
 * Unpacks raw or multipart uploads, runs the orchestrator synchronously and
 * serializes the result:
 * @code
 * {"status":"Success","mean_confidence":0.91,"duration_ms":84.2,
 *  "spans":[{"text":"Hello","bbox":{"x":12,"y":8,"w":60,"h":18},
 *            "confidence":0.93,"order":0}],
 *  "text":"Hello","message":"OK","attempts":1,"retried":false,
 *  "image":{"width":640,"height":480}}
 * @endcode
 * Failures add an "error" member naming the taxonomy entry. handle() never
 * throws.
 */
class RequestHandler {
public:
  /**
   * @param orchestrator Pipeline to run; must outlive the handler
   * @param pool Pool reported by health(); must outlive the handler
   */
  RequestHandler(ExtractionOrchestrator &orchestrator, const WorkerPool &pool);

  /**
   * @brief Process one upload
   */
  HandlerResponse handle(const UploadRequest &request);

  /**
   * @brief Liveness check with worker pool occupancy
   */
  HandlerResponse health() const;

  /**
   * @brief JSON payload of a result
   */
  static nlohmann::json toJson(const ExtractionResult &result);

  /**
   * @brief HTTP-equivalent status code of a result
   */
  static int statusCodeFor(const ExtractionResult &result);

private:
  HandlerResponse respond(const ExtractionResult &result) const;

  ExtractionOrchestrator &m_orchestrator;
  const WorkerPool &m_pool;
};

} // namespace scantext

#endif // SCANTEXT_REQUEST_HANDLER_HPP
