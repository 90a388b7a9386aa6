#include "fgen-engine/ParameterSchema.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <set>
#include <stdexcept>

namespace fgen {

// ===== DescriptorBuilder =====

DescriptorBuilder::DescriptorBuilder(const std::string &key,
                                     const std::string &alias,
                                     ParameterKind kind) {
  descriptor_.key = key;
  descriptor_.display_name = key;
  descriptor_.alias_template = alias;
  descriptor_.kind = kind;
}

DescriptorBuilder DescriptorBuilder::enumeration(
    const std::string &key, const std::string &alias,
    std::vector<std::string> options) {
  DescriptorBuilder builder(key, alias, ParameterKind::Enum);
  builder.descriptor_.options = std::move(options);
  return builder;
}

DescriptorBuilder DescriptorBuilder::number(const std::string &key,
                                            const std::string &alias) {
  return DescriptorBuilder(key, alias, ParameterKind::Number);
}

DescriptorBuilder DescriptorBuilder::text(const std::string &key,
                                          const std::string &alias) {
  return DescriptorBuilder(key, alias, ParameterKind::FreeString);
}

DescriptorBuilder &DescriptorBuilder::displayed_name(const std::string &name) {
  descriptor_.display_name = name;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::description(const std::string &text) {
  descriptor_.description = text;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::unit(const std::string &unit) {
  descriptor_.unit = unit;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::range(std::optional<double> min,
                                            std::optional<double> max) {
  descriptor_.min = min;
  descriptor_.max = max;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::unit_suffix(const std::string &suffix) {
  descriptor_.command_format = fmt::format("{{alias}} {{value}} {}\n", suffix);
  return *this;
}

DescriptorBuilder &DescriptorBuilder::command_format(const std::string &format) {
  descriptor_.command_format = format;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::query_format(const std::string &format) {
  descriptor_.query_format = format;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::read_on_connect(bool enabled) {
  read_on_connect_ = enabled;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::write_on_connect(bool enabled) {
  descriptor_.write_on_connect = enabled;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::read_back(bool enabled) {
  read_back_ = enabled;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::polled(double seconds) {
  descriptor_.poll_interval = seconds;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::expert() {
  descriptor_.access_level = AccessLevel::Expert;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::read_only() {
  descriptor_.read_only = true;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::default_value(const std::string &value) {
  descriptor_.default_value = value;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::translate(
    const std::map<std::string, std::string> &human_to_device) {
  descriptor_.encode_map = human_to_device;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::bool_normalize(bool lenient) {
  bool_rule_ = BoolNormalizeRule{lenient};
  if (descriptor_.options.empty())
    descriptor_.options = {"ON", "OFF"};
  return *this;
}

DescriptorBuilder &
DescriptorBuilder::cross_field(const std::string &rule_name,
                               const std::string &other_key,
                               CrossFieldRule::Relation relation) {
  cross_rules_.push_back(CrossFieldRule{rule_name, other_key, relation});
  return *this;
}

DescriptorBuilder &DescriptorBuilder::live_options() {
  live_options_ = true;
  return *this;
}

DescriptorBuilder &DescriptorBuilder::returns_response() {
  descriptor_.command_returns_response = true;
  return *this;
}

DescriptorBuilder &
DescriptorBuilder::ignore_response_containing(const std::string &text) {
  descriptor_.ignore_response_containing = text;
  return *this;
}

ParameterDescriptor
DescriptorBuilder::build(const PolicyDefaults &defaults) const {
  ParameterDescriptor out = descriptor_;

  if (out.is_local()) {
    // Never on the wire
    out.read_on_connect = false;
    out.command_read_back = false;
  } else {
    out.read_on_connect = read_on_connect_.value_or(defaults.read_on_connect);
    out.command_read_back =
        !out.read_only && read_back_.value_or(defaults.command_read_back);
  }

  // Only translations onto legal tokens survive
  if (!out.options.empty()) {
    for (auto it = out.encode_map.begin(); it != out.encode_map.end();) {
      if (std::find(out.options.begin(), out.options.end(), it->second) ==
          out.options.end())
        it = out.encode_map.erase(it);
      else
        ++it;
    }
  }
  out.decode_map.clear();
  for (const auto &[human, token] : out.encode_map)
    out.decode_map[token] = human;

  out.policies.clear();
  if (live_options_)
    out.policies.emplace_back(OptionSetRule{{}, true});
  else if (out.kind == ParameterKind::Enum && !out.options.empty())
    out.policies.emplace_back(OptionSetRule{out.options, false});
  if (bool_rule_)
    out.policies.emplace_back(*bool_rule_);
  if (out.min || out.max)
    out.policies.emplace_back(NumericRangeRule{out.min, out.max});
  for (const auto &rule : cross_rules_)
    out.policies.emplace_back(rule);

  return out;
}

// ===== ParameterSchema::Builder =====

ParameterSchema::Builder::Builder(std::string model)
    : model_(std::move(model)) {}

ParameterSchema::Builder &
ParameterSchema::Builder::defaults(PolicyDefaults defaults) {
  defaults_ = defaults;
  return *this;
}

ParameterSchema::Builder &
ParameterSchema::Builder::add(const DescriptorBuilder &descriptor) {
  return add(descriptor.build(defaults_));
}

ParameterSchema::Builder &
ParameterSchema::Builder::add(ParameterDescriptor descriptor) {
  order_.emplace_back(false, device_parameters_.size());
  device_parameters_.push_back(std::move(descriptor));
  return *this;
}

ParameterSchema::Builder &ParameterSchema::Builder::add_channel(
    const std::string &name, const std::string &alias,
    const std::string &display_name,
    const std::vector<DescriptorBuilder> &parameters) {
  ChannelNode node;
  node.name = name;
  node.alias = alias;
  node.display_name = display_name.empty() ? name : display_name;
  for (const auto &p : parameters)
    node.parameters.push_back(p.build(defaults_));
  return add_channel(std::move(node));
}

ParameterSchema::Builder &ParameterSchema::Builder::add_channel(ChannelNode node) {
  order_.emplace_back(true, channels_.size());
  channels_.push_back(std::move(node));
  return *this;
}

ParameterSchema::Builder &ParameterSchema::Builder::catalog(CatalogSpec spec) {
  catalog_ = std::move(spec);
  return *this;
}

namespace {

void check_descriptor(const std::string &scope,
                      const ParameterDescriptor &descriptor,
                      const std::vector<ParameterDescriptor> &siblings) {
  if (descriptor.key.empty())
    throw std::invalid_argument(fmt::format("{}: empty parameter key", scope));

  // Inverse consistency of the translation tables
  for (const auto &[human, token] : descriptor.encode_map) {
    auto back = descriptor.decode_map.find(token);
    if (back == descriptor.decode_map.end() || back->second != human) {
      throw std::invalid_argument(fmt::format(
          "{}.{}: translation '{}' -> '{}' does not round-trip", scope,
          descriptor.key, human, token));
    }
  }
  for (const auto &[token, human] : descriptor.decode_map) {
    auto forward = descriptor.encode_map.find(human);
    if (forward == descriptor.encode_map.end() || forward->second != token) {
      throw std::invalid_argument(fmt::format(
          "{}.{}: device token '{}' has no matching encode entry", scope,
          descriptor.key, token));
    }
  }

  if (descriptor.min && descriptor.max && *descriptor.min > *descriptor.max) {
    throw std::invalid_argument(fmt::format("{}.{}: min {} exceeds max {}",
                                            scope, descriptor.key,
                                            *descriptor.min, *descriptor.max));
  }

  if (descriptor.write_on_connect && !descriptor.default_value) {
    throw std::invalid_argument(fmt::format(
        "{}.{}: write_on_connect requires a default value", scope,
        descriptor.key));
  }

  if (auto rule = descriptor.find_policy<CrossFieldRule>()) {
    bool found = false;
    for (const auto &sibling : siblings)
      found = found || sibling.key == rule->other_key;
    if (!found) {
      throw std::invalid_argument(fmt::format(
          "{}.{}: rule '{}' references unknown field '{}'", scope,
          descriptor.key, rule->name, rule->other_key));
    }
  }
}

void check_unique_keys(const std::string &scope,
                       const std::vector<ParameterDescriptor> &parameters) {
  std::set<std::string> keys;
  for (const auto &p : parameters) {
    if (!keys.insert(p.key).second) {
      throw std::invalid_argument(
          fmt::format("{}: duplicate parameter key '{}'", scope, p.key));
    }
  }
}

} // namespace

ParameterSchema ParameterSchema::Builder::build() const {
  if (model_.empty())
    throw std::invalid_argument("Schema needs a model name");

  check_unique_keys(model_, device_parameters_);
  for (const auto &p : device_parameters_) {
    if (p.is_channel_scoped()) {
      throw std::invalid_argument(fmt::format(
          "{}.{}: device-scoped alias '{}' contains {}", model_, p.key,
          p.alias_template, CHANNEL_PLACEHOLDER));
    }
    check_descriptor(model_, p, device_parameters_);
  }

  std::set<std::string> names;
  std::set<std::string> aliases;
  for (const auto &node : channels_) {
    if (node.name.empty() || node.alias.empty()) {
      throw std::invalid_argument(
          fmt::format("{}: channel nodes need a name and an alias", model_));
    }
    if (!names.insert(node.name).second) {
      throw std::invalid_argument(
          fmt::format("{}: duplicate channel name '{}'", model_, node.name));
    }
    if (!aliases.insert(node.alias).second) {
      throw std::invalid_argument(
          fmt::format("{}: duplicate channel alias '{}'", model_, node.alias));
    }
    std::string scope = fmt::format("{}.{}", model_, node.name);
    check_unique_keys(scope, node.parameters);
    for (const auto &p : node.parameters)
      check_descriptor(scope, p, node.parameters);
  }

  if (catalog_) {
    auto find = [this](const std::string &key) -> const ParameterDescriptor * {
      for (const auto &p : device_parameters_) {
        if (p.key == key)
          return &p;
      }
      return nullptr;
    };
    for (const auto &key :
         {catalog_->query_key, catalog_->path_key, catalog_->target_key}) {
      if (!find(key)) {
        throw std::invalid_argument(fmt::format(
            "{}: catalog references unknown device parameter '{}'", model_,
            key));
      }
    }
    auto target = find(catalog_->target_key);
    auto rule = target->find_policy<OptionSetRule>();
    if (!rule || !rule->live) {
      throw std::invalid_argument(
          fmt::format("{}: catalog target '{}' must use live options", model_,
                      catalog_->target_key));
    }
  }

  ParameterSchema schema;
  schema.model_ = model_;
  schema.device_parameters_ = device_parameters_;
  schema.channels_ = channels_;
  schema.order_ = order_;
  schema.catalog_ = catalog_;
  return schema;
}

// ===== ParameterSchema =====

std::vector<ParameterSchema::Entry> ParameterSchema::entries() const {
  std::vector<Entry> out;
  for (const auto &[is_channel, index] : order_) {
    if (is_channel) {
      const auto &node = channels_[index];
      for (const auto &p : node.parameters)
        out.push_back(Entry{&p, &node});
    } else {
      out.push_back(Entry{&device_parameters_[index], nullptr});
    }
  }
  return out;
}

const ParameterDescriptor *
ParameterSchema::find_device_parameter(const std::string &key) const {
  for (const auto &p : device_parameters_) {
    if (p.key == key)
      return &p;
  }
  return nullptr;
}

const ChannelNode *
ParameterSchema::find_channel(const std::string &name_or_alias) const {
  for (const auto &node : channels_) {
    if (node.name == name_or_alias || node.alias == name_or_alias)
      return &node;
  }
  return nullptr;
}

std::string ParameterSchema::value_key(const ParameterDescriptor &descriptor,
                                       const ChannelNode *node) {
  if (!node)
    return descriptor.key;
  return node->name + "." + descriptor.key;
}

nlohmann::json descriptor_to_json(const ParameterDescriptor &descriptor) {
  nlohmann::json j;
  j["key"] = descriptor.key;
  j["display_name"] = descriptor.display_name;
  if (descriptor.description)
    j["description"] = *descriptor.description;
  j["kind"] = to_string(descriptor.kind);
  if (!descriptor.options.empty())
    j["options"] = descriptor.options;
  if (descriptor.min)
    j["min"] = *descriptor.min;
  if (descriptor.max)
    j["max"] = *descriptor.max;
  if (descriptor.unit)
    j["unit"] = *descriptor.unit;
  j["alias"] = descriptor.alias_template;
  j["command_format"] = descriptor.command_format;
  j["query_format"] = descriptor.query_format;
  j["read_on_connect"] = descriptor.read_on_connect;
  j["write_on_connect"] = descriptor.write_on_connect;
  j["read_back"] = descriptor.command_read_back;
  if (descriptor.poll_interval)
    j["poll"] = *descriptor.poll_interval;
  j["access"] = to_string(descriptor.access_level);
  j["read_only"] = descriptor.read_only;
  if (descriptor.default_value)
    j["default"] = *descriptor.default_value;
  if (!descriptor.encode_map.empty())
    j["map"] = descriptor.encode_map;

  nlohmann::json rules = nlohmann::json::array();
  for (const auto &policy : descriptor.policies) {
    std::visit(
        [&rules](auto &&rule) {
          using T = std::decay_t<decltype(rule)>;
          if constexpr (std::is_same_v<T, OptionSetRule>) {
            rules.push_back({{"rule", "options"}, {"live", rule.live}});
          } else if constexpr (std::is_same_v<T, BoolNormalizeRule>) {
            rules.push_back(
                {{"rule", "bool"}, {"lenient", rule.lenient}});
          } else if constexpr (std::is_same_v<T, NumericRangeRule>) {
            rules.push_back({{"rule", "range"}});
          } else if constexpr (std::is_same_v<T, CrossFieldRule>) {
            rules.push_back(
                {{"rule", "cross_field"},
                 {"name", rule.name},
                 {"other", rule.other_key},
                 {"relation",
                  rule.relation == CrossFieldRule::Relation::NotGreaterThan
                      ? "le"
                      : "ge"}});
          }
        },
        policy);
  }
  j["rules"] = rules;
  return j;
}

nlohmann::json ParameterSchema::to_json() const {
  nlohmann::json j;
  j["model"] = model_;

  nlohmann::json params = nlohmann::json::array();
  for (const auto &p : device_parameters_)
    params.push_back(descriptor_to_json(p));
  j["parameters"] = params;

  nlohmann::json nodes = nlohmann::json::array();
  for (const auto &node : channels_) {
    nlohmann::json n;
    n["name"] = node.name;
    n["alias"] = node.alias;
    n["display_name"] = node.display_name;
    nlohmann::json node_params = nlohmann::json::array();
    for (const auto &p : node.parameters)
      node_params.push_back(descriptor_to_json(p));
    n["parameters"] = node_params;
    nodes.push_back(n);
  }
  j["channels"] = nodes;

  if (catalog_) {
    j["catalog"] = {{"query", catalog_->query_key},
                    {"path", catalog_->path_key},
                    {"target", catalog_->target_key},
                    {"refresh_on_connect", catalog_->refresh_on_connect}};
  }
  return j;
}

} // namespace fgen
