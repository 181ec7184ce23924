#include "scantext/RequestHandler.hpp"

#include "scantext/ContentType.hpp"
#include "scantext/ExtractionError.hpp"
#include "scantext/Logger.hpp"
#include "scantext/Multipart.hpp"

namespace scantext {

namespace {

const char *kTag = "RequestHandler";

ExtractionResult failedBeforePipeline(ErrorKind kind,
                                      const std::string &message) {
  ExtractionResult result;
  result.status = ExtractionStatus::Failure;
  result.error = kind;
  result.message = message;
  return result;
}

} // anonymous namespace

RequestHandler::RequestHandler(ExtractionOrchestrator &orchestrator,
                               const WorkerPool &pool)
    : m_orchestrator(orchestrator), m_pool(pool) {}

HandlerResponse RequestHandler::handle(const UploadRequest &request) {
  try {
    UploadedDocument document;

    if (canonicalMediaType(request.contentType) == "multipart/form-data") {
      const std::size_t limit = m_orchestrator.getConfig().maxUploadBytes;
      if (request.body.size() > limit) {
        return respond(failedBeforePipeline(
            ErrorKind::PayloadTooLarge,
            "Upload of " + std::to_string(request.body.size()) +
                " bytes exceeds the limit of " + std::to_string(limit) +
                " bytes"));
      }

      std::vector<MultipartPart> parts = parseMultipart(
          request.body, mediaTypeParameter(request.contentType, "boundary"));
      const MultipartPart &upload = selectUploadPart(parts);

      document.bytes = upload.body;
      document.contentType = upload.contentType;
      document.fileName =
          upload.fileName.empty() ? request.fileName : upload.fileName;
    } else {
      document.bytes = request.body;
      document.contentType = request.contentType;
      document.fileName = request.fileName;
    }

    logDebug(kTag, "Upload '", document.fileName, "' (",
             document.contentType.empty() ? "no type" : document.contentType,
             ", ", document.size(), " bytes)");

    return respond(m_orchestrator.extract(document, request.roi));
  } catch (const ExtractionError &e) {
    return respond(failedBeforePipeline(e.kind(), e.what()));
  } catch (const std::exception &e) {
    logError(kTag, "Unexpected failure: ", e.what());
    return respond(failedBeforePipeline(
        ErrorKind::EngineError, std::string("Internal error: ") + e.what()));
  }
}

HandlerResponse RequestHandler::health() const {
  nlohmann::json payload = {
      {"status", m_pool.isRunning() ? "ok" : "stopping"},
      {"workers", m_pool.threadCount()},
      {"active", m_pool.activeJobs()},
      {"queued", m_pool.queuedJobs()},
      {"max_queue", m_pool.maxQueued()},
  };

  HandlerResponse response;
  response.statusCode = m_pool.isRunning() ? 200 : 503;
  response.body = payload.dump();
  return response;
}

nlohmann::json RequestHandler::toJson(const ExtractionResult &result) {
  nlohmann::json spans = nlohmann::json::array();
  for (const RecognizedSpan &span : result.spans) {
    spans.push_back({
        {"text", span.text},
        {"bbox",
         {{"x", span.bbox.x},
          {"y", span.bbox.y},
          {"w", span.bbox.width},
          {"h", span.bbox.height}}},
        {"confidence", span.confidence},
        {"order", span.order},
        {"page", span.page},
    });
  }

  nlohmann::json payload = {
      {"status", toString(result.status)},
      {"mean_confidence", result.meanConfidence},
      {"duration_ms", result.durationMs},
      {"spans", spans},
      {"text", result.fullText},
      {"message", result.message},
      {"attempts", result.attempts},
      {"retried", result.retried},
      {"image", {{"width", result.imageWidth}, {"height", result.imageHeight}}},
      {"pages", result.pageCount},
  };

  if (result.error) {
    payload["error"] = toString(*result.error);
  }

  return payload;
}

int RequestHandler::statusCodeFor(const ExtractionResult &result) {
  if (result.status == ExtractionStatus::Success) {
    return 200;
  }
  if (result.error) {
    return httpStatusFor(*result.error);
  }
  return 500;
}

HandlerResponse RequestHandler::respond(const ExtractionResult &result) const {
  HandlerResponse response;
  response.statusCode = statusCodeFor(result);
  // Replace invalid UTF-8 from the engine rather than throwing
  response.body = toJson(result).dump(-1, ' ', false,
                                      nlohmann::json::error_handler_t::replace);
  return response;
}

} // namespace scantext
