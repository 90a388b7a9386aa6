#include "fgen-engine/engine/StatusReporter.hpp"
#include "fgen-engine/Logger.hpp"

namespace fgen {

StatusReporter::StatusReporter(std::string device_name)
    : device_name_(std::move(device_name)) {}

bool StatusReporter::report(const std::string &topic,
                            const std::string &message,
                            spdlog::level::level_enum level) {
  std::vector<Listener> listeners;
  bool repeated;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_by_topic_.find(topic);
    repeated = it != last_by_topic_.end() && it->second == message;
    last_by_topic_[topic] = message;
    status_ = message;
    if (repeated)
      suppressed_++;
    else
      logged_++;
    listeners = listeners_;
  }

  if (!repeated)
    EngineLogger::instance().log(level, device_name_, topic, "{}", message);

  for (const auto &listener : listeners)
    listener(message);
  return !repeated;
}

void StatusReporter::clear_topic(const std::string &topic) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_by_topic_.erase(topic);
}

std::string StatusReporter::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

void StatusReporter::add_listener(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

uint64_t StatusReporter::logged_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logged_;
}

uint64_t StatusReporter::suppressed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suppressed_;
}

} // namespace fgen
