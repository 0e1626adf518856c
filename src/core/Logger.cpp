#include "Logger.h"
#include "Constants.h"

#include <cstdio>
#include <filesystem>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define access _access
#define W_OK 2
#else
#include <unistd.h>
#endif

std::shared_ptr<spdlog::logger> Log::s_Logger;

void Log::init(const std::string &logDir) {
  std::vector<spdlog::sink_ptr> sinks;

  // 1. Stderr Color Sink
  auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  consoleSink->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] %v%$");
  sinks.push_back(consoleSink);

  // 2. Rotating File Sink, only if the directory is usable
  std::filesystem::path logFile;
  std::error_code ec;
  if (!logDir.empty() && std::filesystem::exists(logDir, ec) &&
      access(logDir.c_str(), W_OK) == 0) {
    logFile = std::filesystem::path(logDir) / HamCall::LOG_FILE_NAME;
  }

  if (!logFile.empty()) {
    try {
      // 5MB per file, 3 rotated files max (15MB total)
      auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          logFile.string(), 5 * 1024 * 1024, 3);
      fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      sinks.push_back(fileSink);
    } catch (const spdlog::spdlog_ex &ex) {
      std::fprintf(stderr, "Log file sink failed: %s\n", ex.what());
    }
  }

  s_Logger =
      std::make_shared<spdlog::logger>("HAMCALL", sinks.begin(), sinks.end());
  // Default to WARN level
  s_Logger->set_level(spdlog::level::warn);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_I("Log", "Logger initialized with {} sinks", sinks.size());
}

bool Log::setLevelByName(const std::string &name) {
  if (name == "trace" || name == "TRACE") {
    setLevel(spdlog::level::trace);
  } else if (name == "debug" || name == "DEBUG") {
    setLevel(spdlog::level::debug);
  } else if (name == "info" || name == "INFO") {
    setLevel(spdlog::level::info);
  } else if (name == "warn" || name == "WARN") {
    setLevel(spdlog::level::warn);
  } else if (name == "error" || name == "ERROR") {
    setLevel(spdlog::level::err);
  } else {
    setLevel(spdlog::level::warn);
    return false;
  }
  return true;
}
