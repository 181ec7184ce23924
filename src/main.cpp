#include "scantext/ContentType.hpp"
#include "scantext/ExtractionOrchestrator.hpp"
#include "scantext/ImageNormalizer.hpp"
#include "scantext/Logger.hpp"
#include "scantext/OcrEngineAdapter.hpp"
#include "scantext/RequestHandler.hpp"
#include "scantext/ServiceConfig.hpp"
#include "scantext/TesseractEngine.hpp"
#include "scantext/WorkerPool.hpp"

#include <opencv2/core/version.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <file>... [options]\n"
      << "\nOptions:\n"
      << "  -c, --config <path>       JSON configuration file\n"
      << "  -l, --language <lang>     OCR language (default: eng)\n"
      << "  -t, --content-type <type> Declared media type for every file\n"
      << "      --confidence <val>    Drop spans below this confidence (0-1)\n"
      << "      --engine-timeout <ms> Per-attempt engine timeout\n"
      << "      --request-timeout <ms> Whole-request deadline\n"
      << "      --max-upload <bytes>  Reject larger uploads\n"
      << "      --workers <n>         Recognition threads\n"
      << "      --roi <x,y,w,h>       Restrict recognition to a region\n"
      << "      --log-level <level>   debug, info, warning, error or off\n"
      << "      --health              Print the health check and exit\n"
      << "  -h, --help                Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " scan.png\n"
      << "  " << programName << " invoice.pdf -l eng+deu --confidence 0.6\n"
      << "  " << programName << " photo.jpg --roi 0,0,800,200\n";
}

std::optional<scantext::BoundingBox> parseRoi(const std::string &text) {
  scantext::BoundingBox box;
  char c1 = 0, c2 = 0, c3 = 0;
  std::istringstream in(text);
  if (!(in >> box.x >> c1 >> box.y >> c2 >> box.width >> c3 >> box.height) ||
      c1 != ',' || c2 != ',' || c3 != ',' || box.width <= 0 ||
      box.height <= 0) {
    return std::nullopt;
  }
  return box;
}

bool readFile(const std::string &path, std::vector<unsigned char> &bytes) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return false;
  }
  bytes.assign(std::istreambuf_iterator<char>(file),
               std::istreambuf_iterator<char>());
  return !file.bad();
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::vector<std::string> files;
  std::string configPath;
  std::string contentType;
  std::optional<std::string> language;
  std::optional<std::string> logLevel;
  std::optional<double> confidence;
  std::optional<long> engineTimeout;
  std::optional<long> requestTimeout;
  std::optional<long> maxUpload;
  std::optional<long> workers;
  std::optional<scantext::BoundingBox> roi;
  bool healthOnly = false;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      auto next = [&](const char *option) -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(std::string(option) +
                                      " requires an argument");
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-c" || arg == "--config") {
        configPath = next("--config");
      } else if (arg == "-l" || arg == "--language") {
        language = next("--language");
      } else if (arg == "-t" || arg == "--content-type") {
        contentType = next("--content-type");
      } else if (arg == "--confidence") {
        confidence = std::stod(next("--confidence"));
      } else if (arg == "--engine-timeout") {
        engineTimeout = std::stol(next("--engine-timeout"));
      } else if (arg == "--request-timeout") {
        requestTimeout = std::stol(next("--request-timeout"));
      } else if (arg == "--max-upload") {
        maxUpload = std::stol(next("--max-upload"));
      } else if (arg == "--workers") {
        workers = std::stol(next("--workers"));
      } else if (arg == "--log-level") {
        logLevel = next("--log-level");
      } else if (arg == "--roi") {
        std::string value = next("--roi");
        roi = parseRoi(value);
        if (!roi) {
          throw std::invalid_argument("--roi expects x,y,w,h, got " + value);
        }
      } else if (arg == "--health") {
        healthOnly = true;
      } else if (!arg.empty() && arg[0] != '-') {
        files.push_back(arg);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (files.empty() && !healthOnly) {
    std::cerr << "Error: No input file provided\n";
    printUsage(argv[0]);
    return 1;
  }

  // Defaults, then file, then environment, then command line
  scantext::ServiceConfig config;
  try {
    if (!configPath.empty()) {
      config = scantext::ServiceConfig::fromFile(configPath);
    }
    config.applyEnvironment();

    if (language) {
      config.engine.language = *language;
    }
    if (logLevel) {
      config.logLevel = *logLevel;
    }
    if (confidence) {
      config.confidenceThreshold = *confidence;
    }
    if (engineTimeout) {
      config.engineTimeoutMs = *engineTimeout;
    }
    if (requestTimeout) {
      config.requestTimeoutMs = *requestTimeout;
    }
    if (maxUpload) {
      if (*maxUpload < 0) {
        throw std::invalid_argument("--max-upload must not be negative");
      }
      config.maxUploadBytes = static_cast<std::size_t>(*maxUpload);
    }
    if (workers) {
      if (*workers < 0) {
        throw std::invalid_argument("--workers must not be negative");
      }
      config.workerThreads = static_cast<std::size_t>(*workers);
    }

    config.validate();
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  }

  scantext::Logger::instance().setLevel(
      scantext::Logger::parseLevel(config.logLevel));

  // Display version info
  std::cerr << "=== ScanText ===\n"
            << "Tesseract version: "
            << scantext::TesseractEngine::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << config.engine.language << "\n"
            << "================\n";

  // Fail fast when tessdata is missing instead of failing every request
  try {
    scantext::TesseractEngine languageCheck(config.engine);
    std::cerr << "Available languages: ";
    auto languages = languageCheck.getAvailableLanguages();
    for (size_t i = 0; i < languages.size(); ++i) {
      std::cerr << languages[i];
      if (i < languages.size() - 1)
        std::cerr << ", ";
    }
    std::cerr << "\n\n";
  } catch (const std::exception &e) {
    std::cerr << "Failed to initialize OCR engine: " << e.what() << "\n"
              << "Make sure Tesseract is installed and tessdata is available.\n";
    return 1;
  }

  scantext::WorkerPool pool(config.resolvedWorkerThreads(),
                            config.maxQueuedJobs);
  scantext::ImageNormalizer normalizer(config.normalizer);
  scantext::OcrEngineAdapter adapter(
      pool, scantext::TesseractEngine::factory(config.engine));
  scantext::ExtractionOrchestrator orchestrator(normalizer, adapter, config);
  scantext::RequestHandler handler(orchestrator, pool);

  if (healthOnly) {
    scantext::HandlerResponse response = handler.health();
    std::cout << response.body << "\n";
    pool.shutdown();
    return response.statusCode == 200 ? 0 : 2;
  }

  int exitCode = 0;
  for (const std::string &path : files) {
    scantext::UploadRequest request;
    request.fileName = path;
    request.roi = roi;
    request.contentType =
        contentType.empty() ? scantext::mediaTypeForFileName(path) : contentType;

    if (!readFile(path, request.body)) {
      std::cerr << "Failed to read file: " << path << "\n";
      exitCode = 2;
      continue;
    }

    scantext::HandlerResponse response = handler.handle(request);
    std::cout << response.body << "\n";

    if (response.statusCode != 200) {
      std::cerr << path << ": HTTP " << response.statusCode << "\n";
      exitCode = 2;
    }
  }

  pool.shutdown();
  return exitCode;
}
