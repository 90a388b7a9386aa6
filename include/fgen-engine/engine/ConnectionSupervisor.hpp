#pragma once
#include "fgen-engine/engine/Dispatcher.hpp"
#include "fgen-engine/engine/Poller.hpp"
#include "fgen-engine/engine/StatusReporter.hpp"
#include "fgen-engine/export.h"
#include "fgen-engine/transport/Transport.hpp"
#include "fgen-engine/types.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fgen {

struct SupervisorOptions {
  std::chrono::milliseconds connection_timeout{10000};
  // Constant delay between attempts, no backoff growth
  std::chrono::milliseconds retry_interval{1000};
};

/// Owns the connection state machine of one device:
///
///   Disconnected -> Connecting -> Connected
///                      |   ^          |
///                      v   |          v
///                     Faulted <-------+
///
/// A background thread opens the transport, runs the connect-time sweep,
/// starts the poller and waits for a fault or a teardown request.
class FGEN_ENGINE_API ConnectionSupervisor {
public:
  using StateListener =
      std::function<void(ConnectionState state, const std::string &reason)>;
  using PostSweepHook = std::function<void()>;

  ConnectionSupervisor(std::string device_name, Dispatcher &dispatcher,
                       Poller &poller, transport::TransportFactory factory,
                       StatusReporter &status,
                       SupervisorOptions options = {});
  ~ConnectionSupervisor();

  // Non-copyable
  ConnectionSupervisor(const ConnectionSupervisor &) = delete;
  ConnectionSupervisor &operator=(const ConnectionSupervisor &) = delete;

  /// Returns immediately. Cancels a previous attempt; a live connection is
  /// torn down first. From a state listener the running loop restarts
  /// itself instead.
  void connect();

  /// Cancels polling and pending retries, closes the transport. From a
  /// state listener this only asks the loop to stop.
  void disconnect();

  ConnectionState state() const;

  /// Blocks until `target` is reached or the timeout expires
  bool wait_for_state(ConnectionState target,
                      std::chrono::milliseconds timeout) const;

  /// Invoked from the supervisor thread on every transition
  void add_state_listener(StateListener listener);

  /// Runs after a successful sweep, before the state becomes Connected
  void set_post_sweep_hook(PostSweepHook hook);

  /// Transport-level error seen while Connected; ignored in other states
  void report_fault(ErrorKind kind, const std::string &message);

  std::optional<SweepReport> last_sweep() const;

  struct Stats {
    uint64_t connect_attempts{0};
    uint64_t faults{0};
    uint64_t fault_messages_logged{0};
  };
  Stats get_stats() const;

private:
  void run();
  void run_attempts();
  void stop_thread();
  bool on_loop_thread() const;
  bool interrupted() const;
  bool interrupted_locked() const;
  void transition(ConnectionState next, const std::string &reason);
  void enter_fault(const std::string &message);
  void wait_for_retry();
  void teardown();

  std::string device_name_;
  Dispatcher &dispatcher_;
  Poller &poller_;
  transport::TransportFactory factory_;
  StatusReporter &status_;
  SupervisorOptions options_;

  // Serializes connect()/disconnect()
  std::mutex control_mutex_;
  std::thread thread_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  ConnectionState state_{ConnectionState::Disconnected};
  // Set by connect()/disconnect() from other threads; always wins
  bool cancel_{false};
  // Requests made from the loop thread itself (state listeners)
  bool restart_requested_{false};
  bool stop_requested_{false};
  std::thread::id loop_thread_;
  bool fault_pending_{false};
  std::string fault_message_;
  std::optional<SweepReport> last_sweep_;

  // Only touched by the supervisor thread
  std::string last_fault_message_;

  std::mutex listeners_mutex_;
  std::vector<StateListener> listeners_;
  PostSweepHook post_sweep_hook_;

  mutable std::mutex stats_mutex_;
  Stats stats_;
};

} // namespace fgen
