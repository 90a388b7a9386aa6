#include "fgen-engine/engine/Poller.hpp"
#include "fgen-engine/Logger.hpp"

#include <algorithm>

namespace fgen {

Poller::Poller(std::string device_name, const ParameterSchema &schema,
               Dispatcher &dispatcher, double interval_seconds)
    : device_name_(std::move(device_name)), dispatcher_(dispatcher),
      interval_(clamp_interval(interval_seconds)) {
  for (const auto &entry : schema.entries()) {
    if (entry.descriptor->is_polled() && !entry.descriptor->is_local())
      items_.push_back(Item{entry.descriptor, entry.node, std::nullopt});
  }
}

Poller::~Poller() { stop(); }

double Poller::clamp_interval(double seconds) {
  return std::clamp(seconds, MIN_POLL_INTERVAL, MAX_POLL_INTERVAL);
}

void Poller::set_interval(double seconds) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interval_ = clamp_interval(seconds);
    wake_requested_ = true;
  }
  cv_.notify_all();
}

double Poller::interval() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return interval_;
}

std::chrono::duration<double>
Poller::period_for(const ParameterDescriptor &descriptor) const {
  double global = interval();
  double own = descriptor.poll_interval.value_or(0.0);
  if (own <= 0.0)
    return std::chrono::duration<double>(global);
  return std::chrono::duration<double>(std::min(own, global));
}

std::chrono::steady_clock::time_point
Poller::next_due(const Item &item) const {
  if (!item.last_polled)
    return std::chrono::steady_clock::now();
  return *item.last_polled +
         std::chrono::duration_cast<std::chrono::steady_clock::duration>(
             period_for(*item.descriptor));
}

void Poller::start() {
  stop();
  if (items_.empty()) {
    LOG_DEBUG(device_name_, "POLL", "Nothing to poll");
    return;
  }

  for (auto &item : items_)
    item.last_polled.reset();
  suspended_ = false;
  running_ = true;
  thread_ = std::thread([this]() { poll_loop(); });
  LOG_INFO(device_name_, "POLL", "Polling {} parameters every {} s",
           items_.size(), interval());
}

void Poller::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void Poller::poll_loop() {
  while (running_) {
    bool polled_any = false;
    for (auto &item : items_) {
      if (!running_)
        return;
      if (next_due(item) > std::chrono::steady_clock::now())
        continue;

      polled_any = true;
      auto result = dispatcher_.query(*item.descriptor, item.node);
      item.last_polled = std::chrono::steady_clock::now();
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.queries++;
        if (!result.success)
          stats_.failures++;
      }

      if (!result.success && result.error &&
          (is_transport_error(*result.error) ||
           *result.error == ErrorKind::NotConnected)) {
        LOG_WARN(device_name_, "POLL", "Polling suspended: {}",
                 result.error_message);
        suspended_ = true;
        return;
      }
    }
    if (polled_any) {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.cycles++;
    }

    auto wake = std::chrono::steady_clock::time_point::max();
    for (const auto &item : items_)
      wake = std::min(wake, next_due(item));

    std::unique_lock<std::mutex> lock(mutex_);
    // set_interval() also wakes us so new periods take effect at once
    cv_.wait_until(lock, wake, [this] { return !running_ || wake_requested_; });
    wake_requested_ = false;
  }
}

Poller::Stats Poller::get_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

} // namespace fgen
