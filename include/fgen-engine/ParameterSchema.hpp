#pragma once
#include "fgen-engine/export.h"
#include "fgen-engine/types.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fgen {

/// Family-wide policy defaults applied where a descriptor does not say
/// otherwise
struct PolicyDefaults {
  bool read_on_connect{false};
  bool command_read_back{false};
};

/// Fluent construction of one ParameterDescriptor
class FGEN_ENGINE_API DescriptorBuilder {
public:
  static DescriptorBuilder enumeration(const std::string &key,
                                       const std::string &alias,
                                       std::vector<std::string> options);
  static DescriptorBuilder number(const std::string &key,
                                  const std::string &alias);
  static DescriptorBuilder text(const std::string &key,
                                const std::string &alias);

  DescriptorBuilder &displayed_name(const std::string &name);
  DescriptorBuilder &description(const std::string &text);
  DescriptorBuilder &unit(const std::string &unit);
  DescriptorBuilder &range(std::optional<double> min,
                           std::optional<double> max);

  // SET line becomes "{alias} {value} <suffix>\n"
  DescriptorBuilder &unit_suffix(const std::string &suffix);
  DescriptorBuilder &command_format(const std::string &format);
  DescriptorBuilder &query_format(const std::string &format);

  DescriptorBuilder &read_on_connect(bool enabled = true);
  DescriptorBuilder &write_on_connect(bool enabled = true);
  DescriptorBuilder &read_back(bool enabled = true);
  DescriptorBuilder &polled(double seconds = 0.0);
  DescriptorBuilder &expert();
  DescriptorBuilder &read_only();
  DescriptorBuilder &default_value(const std::string &value);

  /// Human-readable -> device token; entries whose token is not a legal
  /// option are dropped at build time
  DescriptorBuilder &
  translate(const std::map<std::string, std::string> &human_to_device);
  DescriptorBuilder &bool_normalize(bool lenient = false);
  DescriptorBuilder &cross_field(const std::string &rule_name,
                                 const std::string &other_key,
                                 CrossFieldRule::Relation relation);
  DescriptorBuilder &live_options();
  DescriptorBuilder &returns_response();
  DescriptorBuilder &ignore_response_containing(const std::string &text);

  const std::string &key() const { return descriptor_.key; }

  ParameterDescriptor build(const PolicyDefaults &defaults = {}) const;

private:
  DescriptorBuilder(const std::string &key, const std::string &alias,
                    ParameterKind kind);

  ParameterDescriptor descriptor_;
  std::optional<bool> read_on_connect_;
  std::optional<bool> read_back_;
  std::optional<BoolNormalizeRule> bool_rule_;
  std::vector<CrossFieldRule> cross_rules_;
  bool live_options_{false};
};

/// Immutable per-model description of every parameter and channel node.
/// Built once through ParameterSchema::Builder.
class FGEN_ENGINE_API ParameterSchema {
public:
  /// One descriptor instance: device-scoped entries carry no node
  struct Entry {
    const ParameterDescriptor *descriptor;
    const ChannelNode *node;
  };

  class FGEN_ENGINE_API Builder {
  public:
    explicit Builder(std::string model);

    /// Applies to descriptors added after this call
    Builder &defaults(PolicyDefaults defaults);

    Builder &add(const DescriptorBuilder &descriptor);
    Builder &add(ParameterDescriptor descriptor);

    Builder &add_channel(const std::string &name, const std::string &alias,
                         const std::string &display_name,
                         const std::vector<DescriptorBuilder> &parameters);
    Builder &add_channel(ChannelNode node);

    Builder &catalog(CatalogSpec spec);

    /// Throws std::invalid_argument on duplicate keys/aliases, misplaced
    /// {channel} placeholders, inconsistent translation tables or dangling
    /// cross-field and catalog references
    ParameterSchema build() const;

  private:
    std::string model_;
    PolicyDefaults defaults_;
    std::vector<ParameterDescriptor> device_parameters_;
    std::vector<ChannelNode> channels_;
    std::vector<std::pair<bool, size_t>> order_; // (is_channel, index)
    std::optional<CatalogSpec> catalog_;
  };

  const std::string &model() const { return model_; }
  const std::vector<ParameterDescriptor> &device_parameters() const {
    return device_parameters_;
  }
  const std::vector<ChannelNode> &channels() const { return channels_; }
  const std::optional<CatalogSpec> &catalog() const { return catalog_; }

  /// All descriptor instances in declaration order
  std::vector<Entry> entries() const;

  const ParameterDescriptor *
  find_device_parameter(const std::string &key) const;

  /// Lookup by node name ("channel_1") or alias ("1")
  const ChannelNode *find_channel(const std::string &name_or_alias) const;

  /// Key under which values of `descriptor` on `node` are stored
  static std::string value_key(const ParameterDescriptor &descriptor,
                               const ChannelNode *node);

  nlohmann::json to_json() const;

private:
  ParameterSchema() = default;

  std::string model_;
  std::vector<ParameterDescriptor> device_parameters_;
  std::vector<ChannelNode> channels_;
  std::vector<std::pair<bool, size_t>> order_;
  std::optional<CatalogSpec> catalog_;
};

nlohmann::json descriptor_to_json(const ParameterDescriptor &descriptor);

} // namespace fgen
