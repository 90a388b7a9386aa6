#include "fgen-engine/engine/FunctionGenerator.hpp"
#include "fgen-engine/Codec.hpp"
#include "fgen-engine/Logger.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fgen {

FunctionGenerator::FunctionGenerator(std::string name, ParameterSchema schema,
                                     transport::TransportFactory factory,
                                     DeviceOptions options)
    : name_(std::move(name)), schema_(std::move(schema)), status_(name_),
      dispatcher_(name_, schema_, status_,
                  DispatcherOptions{options.read_timeout}),
      poller_(name_, schema_, dispatcher_, options.polling_interval),
      supervisor_(name_, dispatcher_, poller_, std::move(factory), status_,
                  SupervisorOptions{options.connection_timeout,
                                    options.retry_interval}) {
  dispatcher_.set_fault_handler(
      [this](ErrorKind kind, const std::string &message) {
        supervisor_.report_fault(kind, message);
      });
  dispatcher_.set_live_options_provider(
      [this](const std::string &key) { return discovered_options(key); });

  const auto &catalog = schema_.catalog();
  if (catalog && catalog->refresh_on_connect) {
    supervisor_.set_post_sweep_hook([this]() {
      auto result = refresh_catalog();
      if (!result.success) {
        LOG_WARN(name_, "CATALOG", "Waveform catalog refresh failed: {}",
                 result.error_message);
      }
    });
  }

  LOG_INFO(name_, "DEVICE", "Created {} ({} channels, polling every {} s)",
           schema_.model(), schema_.channels().size(), poller_.interval());
}

FunctionGenerator::~FunctionGenerator() { supervisor_.disconnect(); }

void FunctionGenerator::connect() { supervisor_.connect(); }

void FunctionGenerator::disconnect() { supervisor_.disconnect(); }

FunctionGenerator::Target
FunctionGenerator::resolve(const std::string &key,
                           const std::optional<std::string> &channel) const {
  Target target;
  std::string param_key = key;
  std::optional<std::string> node_name = channel;

  // "channel_1.offset"
  auto dot = key.find('.');
  if (!node_name && dot != std::string::npos) {
    node_name = key.substr(0, dot);
    param_key = key.substr(dot + 1);
  }

  if (node_name) {
    target.node = schema_.find_channel(*node_name);
    if (!target.node) {
      target.error = fmt::format("Unknown channel '{}'", *node_name);
      return target;
    }
    target.descriptor = target.node->find(param_key);
    if (!target.descriptor) {
      target.error = fmt::format("Channel '{}' has no parameter '{}'",
                                 target.node->name, param_key);
    }
    return target;
  }

  target.descriptor = schema_.find_device_parameter(param_key);
  if (!target.descriptor) {
    target.error = fmt::format("Unknown parameter '{}'", param_key);
  }
  return target;
}

ParameterResult
FunctionGenerator::set_parameter(const std::string &key,
                                 const std::optional<std::string> &channel,
                                 const TypedValue &value) {
  auto target = resolve(key, channel);
  if (!target.descriptor)
    return ParameterResult::failure(ErrorKind::UnknownParameter, target.error);

  if (target.descriptor->read_only) {
    return ParameterResult::failure(
        ErrorKind::ReadOnly,
        fmt::format("{} is read-only",
                    ParameterSchema::value_key(*target.descriptor,
                                               target.node)));
  }

  LOG_DEBUG(name_, "SET", "{} <- {}",
            ParameterSchema::value_key(*target.descriptor, target.node),
            to_string(value));
  return dispatcher_.write(*target.descriptor, target.node, value);
}

std::optional<ParameterValue>
FunctionGenerator::get_parameter(const std::string &key,
                                 const std::optional<std::string> &channel) {
  auto target = resolve(key, channel);
  if (!target.descriptor)
    return std::nullopt;

  std::string value_key =
      ParameterSchema::value_key(*target.descriptor, target.node);
  auto current = dispatcher_.value(value_key);
  if (!current && target.descriptor->is_local()) {
    // Materializes the default without touching the wire
    auto result = dispatcher_.query(*target.descriptor, target.node);
    if (!result.success)
      return std::nullopt;
    current = dispatcher_.value(value_key);
  }
  return current;
}

ParameterResult
FunctionGenerator::read_parameter(const std::string &key,
                                  const std::optional<std::string> &channel) {
  auto target = resolve(key, channel);
  if (!target.descriptor)
    return ParameterResult::failure(ErrorKind::UnknownParameter, target.error);
  return dispatcher_.query(*target.descriptor, target.node);
}

ParameterResult FunctionGenerator::channel_on(const std::string &channel) {
  return set_parameter("outputState", channel, std::string("ON"));
}

ParameterResult FunctionGenerator::channel_off(const std::string &channel) {
  return set_parameter("outputState", channel, std::string("OFF"));
}

ParameterResult FunctionGenerator::refresh_catalog() {
  const auto &catalog = schema_.catalog();
  if (!catalog) {
    return ParameterResult::failure(
        ErrorKind::UnknownParameter,
        fmt::format("{} has no waveform catalog", schema_.model()));
  }

  const auto *path = schema_.find_device_parameter(catalog->path_key);
  const auto *request = schema_.find_device_parameter(catalog->query_key);
  const auto *target = schema_.find_device_parameter(catalog->target_key);

  auto path_value = dispatcher_.query(*path, nullptr);
  if (!path_value.success)
    return path_value;

  // The path needs explicit quotes on the wire
  auto result = dispatcher_.write(
      *request, nullptr, fmt::format("\"{}\"", to_string(path_value.value)));
  if (!result.success)
    return result;

  auto names = Codec::parse_catalog(to_string(result.value));
  if (names.empty()) {
    LOG_WARN(name_, "CATALOG", "No waveforms found under {}",
             to_string(path_value.value));
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(options_mutex_);
    discovered_options_[catalog->target_key] = names;
  }
  LOG_INFO(name_, "CATALOG", "Discovered {} waveforms", names.size());

  auto current = dispatcher_.value(catalog->target_key);
  bool still_valid =
      current && std::find(names.begin(), names.end(),
                           to_string(current->value)) != names.end();
  if (!still_valid) {
    auto selected = dispatcher_.write(*target, nullptr, names.front());
    if (!selected.success)
      return selected;
  }
  return result;
}

std::vector<std::string>
FunctionGenerator::discovered_options(const std::string &key) const {
  std::lock_guard<std::mutex> lock(options_mutex_);
  auto it = discovered_options_.find(key);
  if (it == discovered_options_.end())
    return {};
  return it->second;
}

nlohmann::json FunctionGenerator::snapshot() const {
  nlohmann::json j;
  j["name"] = name_;
  j["model"] = schema_.model();
  j["state"] = to_string(state());
  j["status"] = status();
  j["polling_interval"] = poller_.interval();

  nlohmann::json values = nlohmann::json::object();
  for (const auto &[key, value] : dispatcher_.values())
    values[key] = value.to_json();
  j["values"] = values;

  {
    std::lock_guard<std::mutex> lock(options_mutex_);
    j["discovered_options"] = discovered_options_;
  }

  auto d = dispatcher_.get_stats();
  auto s = supervisor_.get_stats();
  auto p = poller_.get_stats();
  j["stats"] = {{"commands_sent", d.commands_sent},
                {"queries_sent", d.queries_sent},
                {"read_back_mismatches", d.read_back_mismatches},
                {"errors", d.errors},
                {"connect_attempts", s.connect_attempts},
                {"faults", s.faults},
                {"fault_messages_logged", s.fault_messages_logged},
                {"poll_cycles", p.cycles},
                {"poll_queries", p.queries},
                {"poll_failures", p.failures}};
  return j;
}

} // namespace fgen
