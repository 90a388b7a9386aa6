#pragma once
#include "fgen-engine/ParameterSchema.hpp"
#include "fgen-engine/ParameterValue.hpp"
#include "fgen-engine/engine/ConnectionSupervisor.hpp"
#include "fgen-engine/engine/Dispatcher.hpp"
#include "fgen-engine/engine/Poller.hpp"
#include "fgen-engine/engine/StatusReporter.hpp"
#include "fgen-engine/export.h"
#include "fgen-engine/transport/Transport.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fgen {

struct DeviceOptions {
  double polling_interval{5.0}; // seconds
  std::chrono::milliseconds connection_timeout{10000};
  std::chrono::milliseconds read_timeout{5000};
  std::chrono::milliseconds retry_interval{1000};
};

/// One supervised function generator: schema, parameter state, connection
/// and polling behind a single interface
class FGEN_ENGINE_API FunctionGenerator {
public:
  FunctionGenerator(std::string name, ParameterSchema schema,
                    transport::TransportFactory factory,
                    DeviceOptions options = {});
  ~FunctionGenerator();

  // Non-copyable
  FunctionGenerator(const FunctionGenerator &) = delete;
  FunctionGenerator &operator=(const FunctionGenerator &) = delete;

  /// Asynchronous; observe the outcome via state() or a state listener
  void connect();
  void disconnect();

  ConnectionState state() const { return supervisor_.state(); }
  std::string status() const { return status_.status(); }
  bool wait_for_state(ConnectionState target,
                      std::chrono::milliseconds timeout) const {
    return supervisor_.wait_for_state(target, timeout);
  }

  /// `key` is a parameter key, optionally qualified as "<channel>.<key>";
  /// `channel` is a node name or alias
  ParameterResult set_parameter(const std::string &key,
                                const std::optional<std::string> &channel,
                                const TypedValue &value);

  /// Last known value, no wire traffic (local parameters report their
  /// default until written)
  std::optional<ParameterValue>
  get_parameter(const std::string &key,
                const std::optional<std::string> &channel = std::nullopt);

  /// Fresh query
  ParameterResult
  read_parameter(const std::string &key,
                 const std::optional<std::string> &channel = std::nullopt);

  ParameterResult channel_on(const std::string &channel);
  ParameterResult channel_off(const std::string &channel);

  /// Ask the instrument for its stored waveforms and make them the valid
  /// options of the catalog target parameter
  ParameterResult refresh_catalog();

  std::vector<std::string> discovered_options(const std::string &key) const;

  void set_polling_interval(double seconds) { poller_.set_interval(seconds); }
  double polling_interval() const { return poller_.interval(); }

  void add_state_listener(ConnectionSupervisor::StateListener listener) {
    supervisor_.add_state_listener(std::move(listener));
  }
  void add_mismatch_listener(Dispatcher::MismatchListener listener) {
    dispatcher_.add_mismatch_listener(std::move(listener));
  }
  void add_status_listener(StatusReporter::Listener listener) {
    status_.add_listener(std::move(listener));
  }

  /// State, status, values, discovered options and statistics
  nlohmann::json snapshot() const;

  const ParameterSchema &schema() const { return schema_; }
  const std::string &name() const { return name_; }

  Dispatcher::Stats dispatcher_stats() const { return dispatcher_.get_stats(); }
  ConnectionSupervisor::Stats supervisor_stats() const {
    return supervisor_.get_stats();
  }
  Poller::Stats poller_stats() const { return poller_.get_stats(); }

private:
  struct Target {
    const ParameterDescriptor *descriptor{nullptr};
    const ChannelNode *node{nullptr};
    std::string error;
  };
  Target resolve(const std::string &key,
                 const std::optional<std::string> &channel) const;

  std::string name_;
  ParameterSchema schema_;

  mutable std::mutex options_mutex_;
  std::map<std::string, std::vector<std::string>> discovered_options_;

  StatusReporter status_;
  Dispatcher dispatcher_;
  Poller poller_;
  ConnectionSupervisor supervisor_;
};

} // namespace fgen
