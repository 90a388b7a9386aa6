#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fgen {

enum class AccessLevel { Normal, Expert };

enum class ParameterKind { Enum, Number, FreeString };

enum class ConnectionState { Disconnected, Connecting, Connected, Faulted };

const char *to_string(AccessLevel level);
const char *to_string(ParameterKind kind);
const char *to_string(ConnectionState state);

/// Token must be one of a fixed option list, or of the device's discovered
/// catalog when `live` is set
struct OptionSetRule {
  std::vector<std::string> options;
  bool live{false};
};

/// ON/OFF switch. Strict accepts 0/1/"0"/"1"/"ON"/"OFF" only; lenient turns
/// anything that is not 0/"0"/"OFF" into "ON"
struct BoolNormalizeRule {
  bool lenient{false};
};

struct NumericRangeRule {
  std::optional<double> min;
  std::optional<double> max;
};

/// Bound against a sibling field of the same node. Accepted provisionally
/// while the sibling's value is unknown.
struct CrossFieldRule {
  enum class Relation { NotGreaterThan, NotLessThan };

  std::string name;
  std::string other_key;
  Relation relation{Relation::NotGreaterThan};
};

using ValidationPolicy = std::variant<OptionSetRule, BoolNormalizeRule,
                                      NumericRangeRule, CrossFieldRule>;

constexpr const char *DEFAULT_COMMAND_FORMAT = "{alias} {value}\n";
constexpr const char *DEFAULT_QUERY_FORMAT = "{alias}?\n";
constexpr const char *CHANNEL_PLACEHOLDER = "{channel}";

/// Immutable definition of one controllable/observable instrument value
struct ParameterDescriptor {
  std::string key;
  std::string display_name;
  std::optional<std::string> description;

  ParameterKind kind{ParameterKind::FreeString};
  std::vector<std::string> options;  // Enum
  std::optional<double> min;         // Number
  std::optional<double> max;         // Number
  std::optional<std::string> unit;   // display unit, e.g. "V"

  // Wire address; empty for parameters held by the engine only
  std::string alias_template;
  std::string command_format{DEFAULT_COMMAND_FORMAT};
  std::string query_format{DEFAULT_QUERY_FORMAT};

  bool read_on_connect{false};
  bool write_on_connect{false};
  bool command_read_back{false};
  bool command_returns_response{false};
  std::optional<double> poll_interval; // seconds, 0 = device interval
  AccessLevel access_level{AccessLevel::Normal};
  bool read_only{false};

  std::optional<std::string> default_value;
  std::optional<std::string> ignore_response_containing;

  // human-readable -> device token, and back
  std::map<std::string, std::string> encode_map;
  std::map<std::string, std::string> decode_map;

  std::vector<ValidationPolicy> policies;

  bool is_local() const { return alias_template.empty(); }
  bool is_polled() const { return poll_interval.has_value(); }
  bool is_channel_scoped() const {
    return alias_template.find(CHANNEL_PLACEHOLDER) != std::string::npos;
  }

  template <typename Rule> const Rule *find_policy() const {
    for (const auto &policy : policies) {
      if (auto rule = std::get_if<Rule>(&policy))
        return rule;
    }
    return nullptr;
  }
};

/// Group of descriptors sharing one {channel} substitution value
struct ChannelNode {
  std::string name;  // e.g. "channel_1"
  std::string alias; // e.g. "1"
  std::string display_name;
  std::vector<ParameterDescriptor> parameters;

  const ParameterDescriptor *find(const std::string &key) const {
    for (const auto &p : parameters) {
      if (p.key == key)
        return &p;
    }
    return nullptr;
  }
};

/// Model-level catalog discovery: `query_key` lists waveforms stored under
/// the path held by `path_key`, results feed `target_key`'s live options
struct CatalogSpec {
  std::string query_key;
  std::string path_key;
  std::string target_key;
  bool refresh_on_connect{true};
};

struct ValidationError {
  std::string path;
  std::string message;
  int line;
  int column;
};

struct ValidationResult {
  bool valid;
  std::vector<ValidationError> errors;
  std::vector<std::string> warnings;
};

} // namespace fgen
