#pragma once
#include "fgen-engine/ParameterSchema.hpp"
#include "fgen-engine/engine/Dispatcher.hpp"
#include "fgen-engine/export.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fgen {

constexpr double MIN_POLL_INTERVAL = 0.05;   // seconds
constexpr double MAX_POLL_INTERVAL = 1000.0; // seconds

/// Periodically queries every polled descriptor instance through the
/// Dispatcher. Stops polling by itself (suspended) on the first
/// transport-level error; the connection supervisor restarts it after
/// reconnecting.
class FGEN_ENGINE_API Poller {
public:
  Poller(std::string device_name, const ParameterSchema &schema,
         Dispatcher &dispatcher, double interval_seconds = 5.0);
  ~Poller();

  // Non-copyable
  Poller(const Poller &) = delete;
  Poller &operator=(const Poller &) = delete;

  /// First cycle runs immediately
  void start();

  /// Safe to call multiple times
  void stop();

  bool is_running() const { return running_ && !suspended_; }
  bool is_suspended() const { return suspended_; }

  /// Device-global interval, clamped to [MIN_POLL_INTERVAL, MAX_POLL_INTERVAL]
  void set_interval(double seconds);
  double interval() const;

  static double clamp_interval(double seconds);

  /// Effective period of one descriptor: the smaller of its own interval
  /// and the global one (0 means global)
  std::chrono::duration<double>
  period_for(const ParameterDescriptor &descriptor) const;

  size_t item_count() const { return items_.size(); }

  struct Stats {
    uint64_t cycles{0};
    uint64_t queries{0};
    uint64_t failures{0};
  };
  Stats get_stats() const;

private:
  struct Item {
    const ParameterDescriptor *descriptor;
    const ChannelNode *node;
    std::optional<std::chrono::steady_clock::time_point> last_polled;
  };

  void poll_loop();
  std::chrono::steady_clock::time_point next_due(const Item &item) const;

  std::string device_name_;
  Dispatcher &dispatcher_;
  std::vector<Item> items_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  double interval_;
  bool wake_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> suspended_{false};
  std::thread thread_;

  mutable std::mutex stats_mutex_;
  Stats stats_;
};

} // namespace fgen
