#include "fgen-engine/engine/ConnectionSupervisor.hpp"
#include "fgen-engine/Logger.hpp"

#include <fmt/format.h>

namespace fgen {

ConnectionSupervisor::ConnectionSupervisor(std::string device_name,
                                           Dispatcher &dispatcher,
                                           Poller &poller,
                                           transport::TransportFactory factory,
                                           StatusReporter &status,
                                           SupervisorOptions options)
    : device_name_(std::move(device_name)), dispatcher_(dispatcher),
      poller_(poller), factory_(std::move(factory)), status_(status),
      options_(options) {}

ConnectionSupervisor::~ConnectionSupervisor() { disconnect(); }

void ConnectionSupervisor::connect() {
  if (on_loop_thread()) {
    // Joining ourselves is impossible: the loop restarts on its own
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_requested_ = false;
      restart_requested_ = true;
    }
    cv_.notify_all();
    LOG_INFO(device_name_, "CONNECT", "Reconnect requested");
    return;
  }

  std::lock_guard<std::mutex> control(control_mutex_);
  stop_thread();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_ = false;
    restart_requested_ = false;
    stop_requested_ = false;
    fault_pending_ = false;
  }
  last_fault_message_.clear();

  LOG_INFO(device_name_, "CONNECT", "Connect requested");
  thread_ = std::thread([this]() { run(); });
}

void ConnectionSupervisor::disconnect() {
  if (on_loop_thread()) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      restart_requested_ = false;
      stop_requested_ = true;
    }
    cv_.notify_all();
    return;
  }

  std::lock_guard<std::mutex> control(control_mutex_);
  stop_thread();
  if (state() != ConnectionState::Disconnected)
    transition(ConnectionState::Disconnected, "Disconnected");
}

void ConnectionSupervisor::stop_thread() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable())
    thread_.join();
}

bool ConnectionSupervisor::on_loop_thread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loop_thread_ == std::this_thread::get_id();
}

bool ConnectionSupervisor::interrupted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return interrupted_locked();
}

bool ConnectionSupervisor::interrupted_locked() const {
  return cancel_ || stop_requested_ || restart_requested_;
}

ConnectionState ConnectionSupervisor::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool ConnectionSupervisor::wait_for_state(
    ConnectionState target, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return state_ == target; });
}

void ConnectionSupervisor::add_state_listener(StateListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

void ConnectionSupervisor::set_post_sweep_hook(PostSweepHook hook) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  post_sweep_hook_ = std::move(hook);
}

void ConnectionSupervisor::report_fault(ErrorKind kind,
                                        const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected || fault_pending_)
      return;
    fault_pending_ = true;
    fault_message_ = fmt::format("{}: {}", to_string(kind), message);
  }
  cv_.notify_all();
}

std::optional<SweepReport> ConnectionSupervisor::last_sweep() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sweep_;
}

ConnectionSupervisor::Stats ConnectionSupervisor::get_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void ConnectionSupervisor::transition(ConnectionState next,
                                      const std::string &reason) {
  ConnectionState previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = state_;
    state_ = next;
  }
  cv_.notify_all();

  // Retry churn stays at debug; faults are logged separately (deduplicated)
  bool quiet = next == ConnectionState::Connecting ||
               next == ConnectionState::Faulted;
  status_.report("state", fmt::format("{}: {}", to_string(next), reason),
                 quiet ? spdlog::level::debug : spdlog::level::info);
  LOG_DEBUG(device_name_, "STATE", "{} -> {}", to_string(previous),
            to_string(next));

  std::vector<StateListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (const auto &listener : listeners)
    listener(next, reason);
}

void ConnectionSupervisor::enter_fault(const std::string &message) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.faults++;
  }
  transition(ConnectionState::Faulted, message);

  // Identical consecutive faults (a dead instrument) are logged once
  if (message != last_fault_message_) {
    last_fault_message_ = message;
    status_.report("fault", message, spdlog::level::err);
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.fault_messages_logged++;
  }
}

void ConnectionSupervisor::wait_for_retry() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, options_.retry_interval,
               [this] { return interrupted_locked(); });
}

void ConnectionSupervisor::teardown() {
  poller_.stop();
  dispatcher_.detach_transport();
}

void ConnectionSupervisor::run() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_thread_ = std::this_thread::get_id();
  }

  for (;;) {
    run_attempts();
    teardown();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (restart_requested_ && !cancel_)
        continue;
    }

    transition(ConnectionState::Disconnected, "Disconnected");
    // A listener of the final transition may still ask for a restart
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_ || !restart_requested_) {
      loop_thread_ = std::thread::id();
      return;
    }
  }
}

void ConnectionSupervisor::run_attempts() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    restart_requested_ = false;
    stop_requested_ = false;
    fault_pending_ = false;
  }
  last_fault_message_.clear();

  while (!interrupted()) {
    transition(ConnectionState::Connecting, "Opening transport");
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      stats_.connect_attempts++;
    }

    std::unique_ptr<transport::Transport> link;
    try {
      link = factory_();
      if (!link) {
        throw TransportError(ErrorKind::ConnectionRefused,
                             "Transport factory returned no transport");
      }
      link->open(options_.connection_timeout);
    } catch (const TransportError &e) {
      enter_fault(e.what());
      wait_for_retry();
      continue;
    }

    if (interrupted()) {
      link->close();
      return;
    }

    std::string peer = link->describe();
    dispatcher_.attach_transport(std::move(link));

    SweepReport report = dispatcher_.run_connect_sweep();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_sweep_ = report;
    }
    if (report.transport_lost) {
      teardown();
      enter_fault(report.transport_message);
      wait_for_retry();
      continue;
    }
    if (interrupted())
      return;

    PostSweepHook hook;
    {
      std::lock_guard<std::mutex> lock(listeners_mutex_);
      hook = post_sweep_hook_;
    }
    if (hook) {
      try {
        hook();
      } catch (const std::exception &e) {
        LOG_WARN(device_name_, "CONNECT", "Post-connect step failed: {}",
                 e.what());
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      fault_pending_ = false;
    }
    transition(ConnectionState::Connected, fmt::format("Connected to {}", peer));
    // A later failure with the same text is news again
    last_fault_message_.clear();
    poller_.start();

    std::string fault;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return interrupted_locked() || fault_pending_; });
      if (interrupted_locked())
        return;
      fault = fault_message_;
      fault_pending_ = false;
    }

    teardown();
    enter_fault(fault);
    wait_for_retry();
  }
}

} // namespace fgen
