#include "fgen-engine/engine/Dispatcher.hpp"
#include "fgen-engine/Logger.hpp"

#include <fmt/format.h>

namespace fgen {

Dispatcher::Dispatcher(std::string device_name, const ParameterSchema &schema,
                       StatusReporter &status, DispatcherOptions options)
    : device_name_(std::move(device_name)), schema_(schema), status_(status),
      options_(options) {}

Dispatcher::~Dispatcher() { detach_transport(); }

void Dispatcher::attach_transport(
    std::unique_ptr<transport::Transport> transport) {
  std::lock_guard<std::mutex> lock(exec_mutex_);
  if (transport_)
    transport_->close();
  transport_ = std::move(transport);
  attached_ = transport_ != nullptr;
}

void Dispatcher::detach_transport() {
  std::lock_guard<std::mutex> lock(exec_mutex_);
  attached_ = false;
  if (transport_) {
    transport_->close();
    transport_.reset();
    LOG_DEBUG(device_name_, "DISPATCH", "Transport detached");
  }
}

void Dispatcher::set_fault_handler(FaultHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  fault_handler_ = std::move(handler);
}

void Dispatcher::set_live_options_provider(LiveOptionsProvider provider) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  live_options_provider_ = std::move(provider);
}

void Dispatcher::add_mismatch_listener(MismatchListener listener) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  mismatch_listeners_.push_back(std::move(listener));
}

ParameterResult Dispatcher::write(const ParameterDescriptor &descriptor,
                                  const ChannelNode *node,
                                  const TypedValue &value) {
  const std::string key = ParameterSchema::value_key(descriptor, node);
  std::optional<std::string> channel;
  if (node)
    channel = node->alias;

  // Live state for cross-field and discovered-option rules
  std::vector<std::string> live;
  ValidationContext context;
  context.sibling_number = [this, node](const std::string &other) {
    return number_value(node ? node->name + "." + other : other);
  };
  auto option_rule = descriptor.find_policy<OptionSetRule>();
  if (option_rule && option_rule->live) {
    LiveOptionsProvider provider;
    {
      std::lock_guard<std::mutex> lock(handlers_mutex_);
      provider = live_options_provider_;
    }
    if (provider)
      live = provider(descriptor.key);
    context.live_options = &live;
  }

  if (descriptor.is_local())
    return write_local(descriptor, key, value, context);

  std::string token;
  std::string line;
  try {
    token = Codec::encode_value(descriptor, value, context);
    line = Codec::command_line(descriptor, channel, token);
  } catch (const CodecError &e) {
    auto result = ParameterResult::failure(e.kind(), e.what());
    report_failure(key, result);
    return result;
  }

  ParameterResult result;
  std::optional<std::pair<ErrorKind, std::string>> fault;

  set_pending(key, true);
  {
    std::lock_guard<std::mutex> lock(exec_mutex_);
    if (!transport_) {
      result = ParameterResult::failure(
          ErrorKind::NotConnected,
          fmt::format("Cannot set {}: device not connected", key));
    } else {
      try {
        LOG_TRACE(device_name_, "TX", "{}", Codec::trim_response(line));
        transport_->write(line);
        {
          std::lock_guard<std::mutex> stats_lock(stats_mutex_);
          stats_.commands_sent++;
        }

        if (descriptor.command_returns_response) {
          result = apply_reply(descriptor, key, read_reply());
        } else if (descriptor.command_read_back) {
          // Same exclusive hold: nothing may slip between write and query
          std::string reply = exchange_query(descriptor, channel);
          result = verify_read_back(descriptor, key, value, reply);
        } else {
          TypedValue stored = Codec::normalize(descriptor, value);
          store(key, token, stored);
          result = ParameterResult::ok(stored);
        }
      } catch (const TransportError &e) {
        if (e.kind() == ErrorKind::TransportTimeout)
          transport_->flush_input();
        result = ParameterResult::failure(e.kind(), e.what());
        fault = std::make_pair(e.kind(), std::string(e.what()));
      } catch (const CodecError &e) {
        result = ParameterResult::failure(e.kind(), e.what());
      }
    }
  }
  set_pending(key, false);

  if (!result.success)
    report_failure(key, result);
  if (result.read_back_mismatch())
    notify_mismatch(key, result);
  if (fault)
    notify_fault(fault->first, fault->second);
  return result;
}

ParameterResult Dispatcher::query(const ParameterDescriptor &descriptor,
                                  const ChannelNode *node) {
  const std::string key = ParameterSchema::value_key(descriptor, node);
  if (descriptor.is_local())
    return query_local(descriptor, key);

  std::optional<std::string> channel;
  if (node)
    channel = node->alias;

  ParameterResult result;
  std::optional<std::pair<ErrorKind, std::string>> fault;
  {
    std::lock_guard<std::mutex> lock(exec_mutex_);
    if (!transport_) {
      result = ParameterResult::failure(
          ErrorKind::NotConnected,
          fmt::format("Cannot query {}: device not connected", key));
    } else {
      try {
        result = apply_reply(descriptor, key,
                             exchange_query(descriptor, channel));
      } catch (const TransportError &e) {
        if (e.kind() == ErrorKind::TransportTimeout)
          transport_->flush_input();
        result = ParameterResult::failure(e.kind(), e.what());
        fault = std::make_pair(e.kind(), std::string(e.what()));
      } catch (const CodecError &e) {
        result = ParameterResult::failure(e.kind(), e.what());
      }
    }
  }

  if (!result.success)
    report_failure(key, result);
  if (fault)
    notify_fault(fault->first, fault->second);
  return result;
}

ParameterResult Dispatcher::write_local(const ParameterDescriptor &descriptor,
                                        const std::string &key,
                                        const TypedValue &value,
                                        const ValidationContext &context) {
  try {
    std::string token = Codec::encode_value(descriptor, value, context);
    TypedValue stored = Codec::normalize(descriptor, value);
    store(key, token, stored);
    LOG_DEBUG(device_name_, "LOCAL", "{} = {}", key, token);
    return ParameterResult::ok(stored);
  } catch (const CodecError &e) {
    auto result = ParameterResult::failure(e.kind(), e.what());
    report_failure(key, result);
    return result;
  }
}

ParameterResult Dispatcher::query_local(const ParameterDescriptor &descriptor,
                                        const std::string &key) {
  if (auto current = value(key))
    return ParameterResult::ok(current->value);
  if (!descriptor.default_value)
    return ParameterResult::ok(std::monostate{});

  try {
    TypedValue initial = Codec::parse_text(descriptor, *descriptor.default_value);
    store(key, *descriptor.default_value, initial);
    return ParameterResult::ok(initial);
  } catch (const CodecError &e) {
    auto result = ParameterResult::failure(e.kind(), e.what());
    report_failure(key, result);
    return result;
  }
}

std::string Dispatcher::exchange_query(const ParameterDescriptor &descriptor,
                                       const std::optional<std::string> &channel) {
  std::string line = Codec::build_query(descriptor, channel);
  LOG_TRACE(device_name_, "TX", "{}", Codec::trim_response(line));
  transport_->write(line);
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.queries_sent++;
  }
  return read_reply();
}

std::string Dispatcher::read_reply() {
  std::string reply = transport_->read_line(options_.read_timeout);
  LOG_TRACE(device_name_, "RX", "{}", reply);
  return reply;
}

ParameterResult Dispatcher::apply_reply(const ParameterDescriptor &descriptor,
                                        const std::string &key,
                                        const std::string &reply) {
  std::string trimmed = Codec::trim_response(reply);
  if (descriptor.ignore_response_containing &&
      trimmed.find(*descriptor.ignore_response_containing) !=
          std::string::npos) {
    // e.g. "No error": keep the last meaningful value
    auto current = value(key);
    return ParameterResult::ok(current ? current->value
                                       : TypedValue{std::monostate{}});
  }

  TypedValue decoded = Codec::decode(descriptor, trimmed);
  store(key, trimmed, decoded);
  return ParameterResult::ok(decoded);
}

ParameterResult
Dispatcher::verify_read_back(const ParameterDescriptor &descriptor,
                             const std::string &key,
                             const TypedValue &requested,
                             const std::string &reply) {
  std::string trimmed = Codec::trim_response(reply);
  TypedValue reported = Codec::decode(descriptor, trimmed);
  store(key, trimmed, reported);

  auto result = ParameterResult::ok(reported);
  TypedValue expected = Codec::normalize(descriptor, requested);
  if (!Codec::equivalent(descriptor, expected, reported)) {
    result.warning = ErrorKind::ReadBackMismatch;
    result.warning_message =
        fmt::format("Read-back mismatch on {}: requested {}, instrument "
                    "reports {}",
                    key, to_string(expected), to_string(reported));
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.read_back_mismatches++;
  }
  return result;
}

SweepReport Dispatcher::run_connect_sweep() {
  SweepReport report;
  LOG_INFO(device_name_, "SWEEP", "Connect-time sweep started");

  for (const auto &entry : schema_.entries()) {
    const auto &descriptor = *entry.descriptor;
    if (descriptor.is_local() ||
        (!descriptor.read_on_connect && !descriptor.write_on_connect))
      continue;

    const std::string key = ParameterSchema::value_key(descriptor, entry.node);
    report.attempted++;

    ParameterResult result;
    if (descriptor.write_on_connect) {
      try {
        result = write(descriptor, entry.node,
                       Codec::parse_text(descriptor,
                                         descriptor.default_value.value_or("")));
      } catch (const CodecError &e) {
        result = ParameterResult::failure(e.kind(), e.what());
      }
    } else {
      result = query(descriptor, entry.node);
    }

    if (result.success) {
      report.succeeded++;
      continue;
    }

    report.failures.emplace_back(key, result);
    if (result.error == ErrorKind::TransportClosed ||
        result.error == ErrorKind::NotConnected) {
      // Every remaining item would fail the same way
      report.transport_lost = true;
      report.transport_message = result.error_message;
      LOG_WARN(device_name_, "SWEEP", "Link lost at {}, skipping the rest",
               key);
      break;
    }
  }

  LOG_INFO(device_name_, "SWEEP", "Sweep done: {}/{} succeeded",
           report.succeeded, report.attempted);
  return report;
}

std::optional<ParameterValue>
Dispatcher::value(const std::string &value_key) const {
  std::lock_guard<std::mutex> lock(values_mutex_);
  auto it = values_.find(value_key);
  if (it == values_.end())
    return std::nullopt;
  return it->second;
}

std::map<std::string, ParameterValue> Dispatcher::values() const {
  std::lock_guard<std::mutex> lock(values_mutex_);
  return values_;
}

std::optional<double>
Dispatcher::number_value(const std::string &value_key) const {
  std::lock_guard<std::mutex> lock(values_mutex_);
  auto it = values_.find(value_key);
  if (it == values_.end())
    return std::nullopt;
  if (auto number = std::get_if<double>(&it->second.value))
    return *number;
  return std::nullopt;
}

Dispatcher::Stats Dispatcher::get_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void Dispatcher::store(const std::string &key, const std::string &raw,
                       const TypedValue &value) {
  std::lock_guard<std::mutex> lock(values_mutex_);
  auto &entry = values_[key];
  entry.raw = raw;
  entry.value = value;
  entry.last_updated = std::chrono::system_clock::now();
}

void Dispatcher::set_pending(const std::string &key, bool pending) {
  // Only known values carry the flag: a failed first write leaves no entry
  std::lock_guard<std::mutex> lock(values_mutex_);
  auto it = values_.find(key);
  if (it != values_.end())
    it->second.pending_write = pending;
}

void Dispatcher::report_failure(const std::string &key,
                                const ParameterResult &result) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.errors++;
  }
  if (!result.error)
    return;
  auto level = is_transport_error(*result.error) ? spdlog::level::err
                                                 : spdlog::level::warn;
  status_.report(key,
                 fmt::format("{}: {}", to_string(*result.error),
                             result.error_message),
                 level);
}

void Dispatcher::notify_fault(ErrorKind kind, const std::string &message) {
  FaultHandler handler;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handler = fault_handler_;
  }
  if (handler)
    handler(kind, message);
}

void Dispatcher::notify_mismatch(const std::string &key,
                                 const ParameterResult &result) {
  status_.report(key, result.warning_message, spdlog::level::warn);
  std::vector<MismatchListener> listeners;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    listeners = mismatch_listeners_;
  }
  for (const auto &listener : listeners)
    listener(key, result);
}

} // namespace fgen
