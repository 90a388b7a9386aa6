#pragma once
#include "fgen-engine/export.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <spdlog/common.h>
#include <string>
#include <vector>

namespace fgen {

/// Human-readable device status. Every report becomes the current status
/// and reaches the listeners; only the log line is de-duplicated, so a
/// message identical to the previous one on the same topic is not logged
/// again.
class FGEN_ENGINE_API StatusReporter {
public:
  using Listener = std::function<void(const std::string &status)>;

  explicit StatusReporter(std::string device_name);

  /// Returns true when the message was new for `topic` and was logged
  bool report(const std::string &topic, const std::string &message,
              spdlog::level::level_enum level = spdlog::level::info);

  /// Forget the last message of `topic` so the next one is logged again
  void clear_topic(const std::string &topic);

  std::string status() const;

  void add_listener(Listener listener);

  uint64_t logged_count() const;
  uint64_t suppressed_count() const;

private:
  std::string device_name_;

  mutable std::mutex mutex_;
  std::string status_;
  std::map<std::string, std::string> last_by_topic_;
  std::vector<Listener> listeners_;
  uint64_t logged_{0};
  uint64_t suppressed_{0};
};

} // namespace fgen
