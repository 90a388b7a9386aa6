#include "fgen-engine/Logger.hpp"

namespace fgen {

// DLL-safe singleton implementation
EngineLogger &EngineLogger::instance() {
  static EngineLogger logger;
  return logger;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  return spdlog::level::info;
}

} // namespace fgen
