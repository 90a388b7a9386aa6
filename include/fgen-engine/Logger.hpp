#pragma once
#include "fgen-engine/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace fgen {

/// Centralized logging with device name and operation tag context
class FGEN_ENGINE_API EngineLogger {
public:
  static EngineLogger &instance();

  // Initialize with console and (unless log_file is empty) file sinks
  void init(const std::string &log_file = "fgen_engine.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Already initialized: only the level changes
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      // empty file name: console only
      if (!log_file.empty()) {
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ =
          std::make_shared<spdlog::logger>("fgen", sinks.begin(), sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("fgen")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      if (std::string(ex.what()).find("already exists") == std::string::npos) {
        fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
      }
    }
  }

  // Drop the logger from the spdlog registry so a later init() recreates
  // the sinks (tests use this between fixtures).
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("fgen");
    logger_.reset();
  }

  bool should_log(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ && logger_->should_log(level);
  }

  template <typename... Args>
  void trace(const std::string &device, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &device, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &device, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &device, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &device, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, device, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &device,
           const std::string &tag, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [device] [tag] message
    std::string prefix = fmt::format("[{}] [{}] ", device, tag);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

private:
  EngineLogger() = default;

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(device, tag, ...)                                            \
  fgen::EngineLogger::instance().trace(device, tag, __VA_ARGS__)
#define LOG_DEBUG(device, tag, ...)                                            \
  fgen::EngineLogger::instance().debug(device, tag, __VA_ARGS__)
#define LOG_INFO(device, tag, ...)                                             \
  fgen::EngineLogger::instance().info(device, tag, __VA_ARGS__)
#define LOG_WARN(device, tag, ...)                                             \
  fgen::EngineLogger::instance().warn(device, tag, __VA_ARGS__)
#define LOG_ERROR(device, tag, ...)                                            \
  fgen::EngineLogger::instance().error(device, tag, __VA_ARGS__)

/// Parse a textual level ("trace", "debug", "info", "warn", "error")
spdlog::level::level_enum parse_log_level(const std::string &level);

} // namespace fgen
