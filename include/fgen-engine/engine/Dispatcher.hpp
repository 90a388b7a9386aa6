#pragma once
#include "fgen-engine/Codec.hpp"
#include "fgen-engine/ParameterSchema.hpp"
#include "fgen-engine/ParameterValue.hpp"
#include "fgen-engine/engine/StatusReporter.hpp"
#include "fgen-engine/export.h"
#include "fgen-engine/transport/Transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fgen {

struct DispatcherOptions {
  std::chrono::milliseconds read_timeout{5000};
};

/// Outcome of the connect-time sweep
struct SweepReport {
  size_t attempted{0};
  size_t succeeded{0};
  std::vector<std::pair<std::string, ParameterResult>> failures;

  // Set when the link went away mid-sweep; remaining items were skipped
  bool transport_lost{false};
  std::string transport_message;
};

/// Serializes all wire traffic of one device. Every write, query and
/// read-back holds the execution lock for the whole exchange; parameter
/// values are kept under a separate lock so readers never wait on the
/// instrument.
class FGEN_ENGINE_API Dispatcher {
public:
  using FaultHandler = std::function<void(ErrorKind, const std::string &)>;
  using LiveOptionsProvider =
      std::function<std::vector<std::string>(const std::string &key)>;
  using MismatchListener = std::function<void(const std::string &value_key,
                                              const ParameterResult &result)>;

  Dispatcher(std::string device_name, const ParameterSchema &schema,
             StatusReporter &status, DispatcherOptions options = {});
  ~Dispatcher();

  // Non-copyable
  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;

  /// Take ownership of an opened transport
  void attach_transport(std::unique_ptr<transport::Transport> transport);

  /// Waits for the in-flight request, then closes the transport
  void detach_transport();

  bool has_transport() const { return attached_.load(); }

  /// Called (outside the execution lock) for every transport-level error
  void set_fault_handler(FaultHandler handler);
  void set_live_options_provider(LiveOptionsProvider provider);
  void add_mismatch_listener(MismatchListener listener);

  ParameterResult write(const ParameterDescriptor &descriptor,
                        const ChannelNode *node, const TypedValue &value);

  ParameterResult query(const ParameterDescriptor &descriptor,
                        const ChannelNode *node);

  /// Best-effort priming in schema declaration order
  SweepReport run_connect_sweep();

  std::optional<ParameterValue> value(const std::string &value_key) const;
  std::map<std::string, ParameterValue> values() const;

  /// Numeric view of a stored value (nullopt if unknown or not a number)
  std::optional<double> number_value(const std::string &value_key) const;

  struct Stats {
    uint64_t commands_sent{0};
    uint64_t queries_sent{0};
    uint64_t read_back_mismatches{0};
    uint64_t errors{0};
  };
  Stats get_stats() const;

  std::chrono::milliseconds read_timeout() const {
    return options_.read_timeout;
  }

private:
  ParameterResult write_local(const ParameterDescriptor &descriptor,
                              const std::string &key, const TypedValue &value,
                              const ValidationContext &context);
  ParameterResult query_local(const ParameterDescriptor &descriptor,
                              const std::string &key);

  // Both require exec_mutex_ held
  std::string exchange_query(const ParameterDescriptor &descriptor,
                             const std::optional<std::string> &channel);
  std::string read_reply();

  ParameterResult apply_reply(const ParameterDescriptor &descriptor,
                              const std::string &key,
                              const std::string &reply);
  ParameterResult verify_read_back(const ParameterDescriptor &descriptor,
                                   const std::string &key,
                                   const TypedValue &requested,
                                   const std::string &reply);

  void store(const std::string &key, const std::string &raw,
             const TypedValue &value);
  void set_pending(const std::string &key, bool pending);

  void report_failure(const std::string &key, const ParameterResult &result);
  void notify_fault(ErrorKind kind, const std::string &message);
  void notify_mismatch(const std::string &key, const ParameterResult &result);

  std::string device_name_;
  const ParameterSchema &schema_;
  StatusReporter &status_;
  DispatcherOptions options_;

  // Execution lock: transport and wire traffic
  std::mutex exec_mutex_;
  std::unique_ptr<transport::Transport> transport_;
  std::atomic<bool> attached_{false};

  // Value lock: snapshot reads
  mutable std::mutex values_mutex_;
  std::map<std::string, ParameterValue> values_;

  mutable std::mutex handlers_mutex_;
  FaultHandler fault_handler_;
  LiveOptionsProvider live_options_provider_;
  std::vector<MismatchListener> mismatch_listeners_;

  mutable std::mutex stats_mutex_;
  Stats stats_;
};

} // namespace fgen
