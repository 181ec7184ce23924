#include "scantext/ServiceConfig.hpp"

#include "scantext/Logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace scantext {

namespace {

using json = nlohmann::json;

long parseLongEnv(const char *name, const char *value) {
  try {
    std::size_t consumed = 0;
    long parsed = std::stol(value, &consumed);
    if (consumed != std::string(value).size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string("Environment variable ") + name +
                                " is not an integer: " + value);
  }
}

double parseDoubleEnv(const char *name, const char *value) {
  try {
    std::size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed != std::string(value).size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string("Environment variable ") + name +
                                " is not a number: " + value);
  }
}

// Counts are read signed so that a negative value is rejected instead of
// wrapping around to a huge unsigned one
std::size_t countValue(const json &j, const char *key, std::size_t current) {
  if (!j.contains(key)) {
    return current;
  }
  const json &value = j.at(key);
  if (!value.is_number_integer()) {
    throw std::runtime_error(std::string("Invalid configuration: ") + key +
                             " must be an integer");
  }
  long long parsed = value.get<long long>();
  if (parsed < 0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + key +
                             " must be >= 0");
  }
  return static_cast<std::size_t>(parsed);
}

// Hardware concurrency is raised to this so that a reduced-resolution retry
// never queues behind the attempt it replaces
const std::size_t kMinAutoWorkerThreads = 2;

} // anonymous namespace

ServiceConfig ServiceConfig::fromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Could not open config file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  ServiceConfig config;
  config.mergeJson(buffer.str());
  logInfo("Config", "Loaded configuration from ", path);
  return config;
}

void ServiceConfig::mergeJson(const std::string &text) {
  try {
    json j = json::parse(text);
    if (!j.is_object()) {
      throw std::runtime_error("configuration root must be a JSON object");
    }

    maxUploadBytes = countValue(j, "max_upload_bytes", maxUploadBytes);
    engineTimeoutMs = j.value("engine_timeout_ms", engineTimeoutMs);
    requestTimeoutMs = j.value("request_timeout_ms", requestTimeoutMs);
    confidenceThreshold = j.value("confidence_threshold", confidenceThreshold);
    workerThreads = countValue(j, "worker_threads", workerThreads);
    maxQueuedJobs = countValue(j, "max_queued_jobs", maxQueuedJobs);
    retryScale = j.value("retry_scale", retryScale);
    logLevel = j.value("log_level", logLevel);

    if (j.contains("normalizer")) {
      const json &n = j.at("normalizer");
      normalizer.grayscale = n.value("grayscale", normalizer.grayscale);
      normalizer.deskew = n.value("deskew", normalizer.deskew);
      normalizer.maxDeskewDegrees =
          n.value("max_deskew_degrees", normalizer.maxDeskewDegrees);
      normalizer.binarize = n.value("binarize", normalizer.binarize);
      normalizer.pdfRenderDpi =
          n.value("pdf_render_dpi", normalizer.pdfRenderDpi);
      normalizer.maxPdfPages = n.value("max_pdf_pages", normalizer.maxPdfPages);
      normalizer.pdfTextLayer =
          n.value("pdf_text_layer", normalizer.pdfTextLayer);
    }

    if (j.contains("engine")) {
      const json &e = j.at("engine");
      engine.language = e.value("language", engine.language);
      engine.tessDataPath = e.value("tessdata_path", engine.tessDataPath);
      engine.pageSegMode = e.value("page_seg_mode", engine.pageSegMode);
    }
  } catch (const json::exception &e) {
    throw std::runtime_error(std::string("Invalid configuration: ") +
                             e.what());
  }
}

void ServiceConfig::applyEnvironment() {
  if (const char *v = std::getenv("SCANTEXT_MAX_UPLOAD_BYTES")) {
    long parsed = parseLongEnv("SCANTEXT_MAX_UPLOAD_BYTES", v);
    if (parsed < 0) {
      throw std::invalid_argument("SCANTEXT_MAX_UPLOAD_BYTES must be >= 0");
    }
    maxUploadBytes = static_cast<std::size_t>(parsed);
  }
  if (const char *v = std::getenv("SCANTEXT_ENGINE_TIMEOUT_MS")) {
    engineTimeoutMs = parseLongEnv("SCANTEXT_ENGINE_TIMEOUT_MS", v);
  }
  if (const char *v = std::getenv("SCANTEXT_REQUEST_TIMEOUT_MS")) {
    requestTimeoutMs = parseLongEnv("SCANTEXT_REQUEST_TIMEOUT_MS", v);
  }
  if (const char *v = std::getenv("SCANTEXT_CONFIDENCE_THRESHOLD")) {
    confidenceThreshold = parseDoubleEnv("SCANTEXT_CONFIDENCE_THRESHOLD", v);
  }
  if (const char *v = std::getenv("SCANTEXT_WORKER_THREADS")) {
    long parsed = parseLongEnv("SCANTEXT_WORKER_THREADS", v);
    if (parsed < 0) {
      throw std::invalid_argument("SCANTEXT_WORKER_THREADS must be >= 0");
    }
    workerThreads = static_cast<std::size_t>(parsed);
  }
  if (const char *v = std::getenv("SCANTEXT_MAX_QUEUED_JOBS")) {
    long parsed = parseLongEnv("SCANTEXT_MAX_QUEUED_JOBS", v);
    if (parsed < 0) {
      throw std::invalid_argument("SCANTEXT_MAX_QUEUED_JOBS must be >= 0");
    }
    maxQueuedJobs = static_cast<std::size_t>(parsed);
  }
  if (const char *v = std::getenv("SCANTEXT_LANGUAGE")) {
    engine.language = v;
  }
  if (const char *v = std::getenv("SCANTEXT_LOG_LEVEL")) {
    logLevel = v;
  }

  // Tesseract's own variable only fills an unset path
  if (engine.tessDataPath.empty()) {
    if (const char *v = std::getenv("TESSDATA_PREFIX")) {
      engine.tessDataPath = v;
    }
  }
}

void ServiceConfig::validate() const {
  if (maxUploadBytes == 0) {
    throw std::invalid_argument("max_upload_bytes must be positive");
  }
  if (engineTimeoutMs <= 0) {
    throw std::invalid_argument("engine_timeout_ms must be positive");
  }
  if (requestTimeoutMs <= 0) {
    throw std::invalid_argument("request_timeout_ms must be positive");
  }
  if (confidenceThreshold < 0.0 || confidenceThreshold > 1.0) {
    throw std::invalid_argument("confidence_threshold must be in [0, 1]");
  }
  if (retryScale <= 0.0 || retryScale >= 1.0) {
    throw std::invalid_argument("retry_scale must be in (0, 1)");
  }
  if (normalizer.maxDeskewDegrees < 0.0 || normalizer.maxDeskewDegrees > 45.0) {
    throw std::invalid_argument("max_deskew_degrees must be in [0, 45]");
  }
  if (normalizer.pdfRenderDpi < 36.0 || normalizer.pdfRenderDpi > 1200.0) {
    throw std::invalid_argument("pdf_render_dpi must be in [36, 1200]");
  }
  if (normalizer.maxPdfPages < 1) {
    throw std::invalid_argument("max_pdf_pages must be at least 1");
  }
  if (engine.language.empty()) {
    throw std::invalid_argument("language must not be empty");
  }
  if (engine.pageSegMode < 0 || engine.pageSegMode > 13) {
    throw std::invalid_argument("page_seg_mode must be in [0, 13]");
  }
  Logger::parseLevel(logLevel);
}

std::size_t ServiceConfig::resolvedWorkerThreads() const {
  if (workerThreads > 0) {
    return workerThreads;
  }
  std::size_t hardware = std::thread::hardware_concurrency();
  return std::max(hardware, kMinAutoWorkerThreads);
}

} // namespace scantext
