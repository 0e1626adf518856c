#pragma once

#include <fmt/format.h>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

class Log {
public:
  // Installs a stderr sink and, if logDir is writable, a rotating file sink.
  // Calls made before init() are dropped.
  static void init(const std::string &logDir = "");

  static std::shared_ptr<spdlog::logger> &get() { return s_Logger; }

  // Set log level at runtime
  static void setLevel(spdlog::level::level_enum level) {
    if (s_Logger) {
      s_Logger->set_level(level);
    }
  }

  // Accepts trace, debug, info, warn and error (either case). Unknown names
  // select warn and return false.
  static bool setLevelByName(const std::string &name);

  // Categorized logging: "[cat] message". f is a runtime format string, so a
  // bad placeholder throws fmt::format_error at the call site.
  template <typename... Args>
  static void t(const std::string &cat, const std::string &f, Args &&...args) {
    if (s_Logger && s_Logger->should_log(spdlog::level::trace)) {
      s_Logger->log(spdlog::level::trace, "[{}] {}", cat,
                    fmt::vformat(f, fmt::make_format_args(args...)));
    }
  }
  template <typename... Args>
  static void d(const std::string &cat, const std::string &f, Args &&...args) {
    if (s_Logger && s_Logger->should_log(spdlog::level::debug)) {
      s_Logger->log(spdlog::level::debug, "[{}] {}", cat,
                    fmt::vformat(f, fmt::make_format_args(args...)));
    }
  }
  template <typename... Args>
  static void i(const std::string &cat, const std::string &f, Args &&...args) {
    if (s_Logger && s_Logger->should_log(spdlog::level::info)) {
      s_Logger->log(spdlog::level::info, "[{}] {}", cat,
                    fmt::vformat(f, fmt::make_format_args(args...)));
    }
  }
  template <typename... Args>
  static void w(const std::string &cat, const std::string &f, Args &&...args) {
    if (s_Logger && s_Logger->should_log(spdlog::level::warn)) {
      s_Logger->log(spdlog::level::warn, "[{}] {}", cat,
                    fmt::vformat(f, fmt::make_format_args(args...)));
    }
  }
  template <typename... Args>
  static void e(const std::string &cat, const std::string &f, Args &&...args) {
    if (s_Logger && s_Logger->should_log(spdlog::level::err)) {
      s_Logger->log(spdlog::level::err, "[{}] {}", cat,
                    fmt::vformat(f, fmt::make_format_args(args...)));
    }
  }

#define LOG_T(cat, f, ...) ::Log::t(cat, f, ##__VA_ARGS__)
#define LOG_D(cat, f, ...) ::Log::d(cat, f, ##__VA_ARGS__)
#define LOG_I(cat, f, ...) ::Log::i(cat, f, ##__VA_ARGS__)
#define LOG_W(cat, f, ...) ::Log::w(cat, f, ##__VA_ARGS__)
#define LOG_E(cat, f, ...) ::Log::e(cat, f, ##__VA_ARGS__)

private:
  static std::shared_ptr<spdlog::logger> s_Logger;
};
