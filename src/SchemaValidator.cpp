#include "fgen-engine/SchemaValidator.hpp"

#include <fmt/format.h>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace fgen {

static const std::set<std::string> PARAMETER_FIELDS = {
    "key",          "alias",          "kind",
    "options",      "min",            "max",
    "unit",         "unit_suffix",    "command_format",
    "query_format", "read_on_connect", "write_on_connect",
    "read_back",    "poll",           "access",
    "read_only",    "default",        "map",
    "bool_normalize", "cross_field",  "returns_response",
    "ignore_response_containing",     "display_name",
    "description",  "live_options"};

static std::string node_path(const std::vector<std::string> &path) {
  std::string out;
  for (const auto &p : path) {
    out += "/" + p;
  }
  return out.empty() ? "/" : out;
}

static void add_error(ValidationResult &result,
                      const std::vector<std::string> &path,
                      const std::string &msg, const YAML::Node &at = {}) {
  result.valid = false;
  int line = 0;
  int column = 0;
  if (at.IsDefined() && !at.IsNull()) {
    line = at.Mark().line + 1;
    column = at.Mark().column + 1;
  }
  result.errors.push_back({node_path(path), msg, line, column});
}

template <typename T>
static bool convertible(const YAML::Node &node) {
  try {
    node.as<T>();
    return true;
  } catch (const YAML::Exception &) {
    return false;
  }
}

static void validate_parameter(const YAML::Node &param,
                               const std::vector<std::string> &path,
                               bool channel_scope, ValidationResult &result) {
  if (!param.IsMap()) {
    add_error(result, path, "Parameter entry must be a map", param);
    return;
  }

  if (!param["key"] || !convertible<std::string>(param["key"])) {
    add_error(result, path, "Missing required field 'key'", param);
  }

  for (auto it = param.begin(); it != param.end(); ++it) {
    std::string field = it->first.as<std::string>();
    if (PARAMETER_FIELDS.find(field) == PARAMETER_FIELDS.end()) {
      result.warnings.push_back(
          fmt::format("{}: unknown field '{}' ignored", node_path(path), field));
    }
  }

  std::string kind = "string";
  if (param["kind"]) {
    kind = param["kind"].as<std::string>();
    if (kind != "enum" && kind != "number" && kind != "string") {
      add_error(result, path,
                "kind must be one of 'enum', 'number', 'string'",
                param["kind"]);
    }
  }

  if (param["alias"]) {
    std::string alias = param["alias"].as<std::string>();
    if (!channel_scope && alias.find(CHANNEL_PLACEHOLDER) != std::string::npos) {
      add_error(result, path,
                "Device-scoped alias must not contain {channel}",
                param["alias"]);
    }
  }

  bool has_bool_rule = param["bool_normalize"].IsDefined();
  if (kind == "enum" && !has_bool_rule) {
    if (!param["options"] || !param["options"].IsSequence() ||
        param["options"].size() == 0) {
      add_error(result, path, "enum parameters need a non-empty options list",
                param);
    }
  }
  if (param["options"] && !convertible<std::vector<std::string>>(param["options"])) {
    add_error(result, path, "options must be a sequence of strings",
              param["options"]);
  }

  for (const auto &bound : {"min", "max"}) {
    if (param[bound] && !convertible<double>(param[bound])) {
      add_error(result, path, std::string(bound) + " must be a number",
                param[bound]);
    }
  }
  if (param["min"] && param["max"] && convertible<double>(param["min"]) &&
      convertible<double>(param["max"]) &&
      param["min"].as<double>() > param["max"].as<double>()) {
    add_error(result, path, "min must not exceed max", param["min"]);
  }

  if (param["poll"] && (!convertible<double>(param["poll"]) ||
                        param["poll"].as<double>() < 0.0)) {
    add_error(result, path, "poll must be a non-negative number of seconds",
              param["poll"]);
  }

  if (param["access"]) {
    std::string access = param["access"].as<std::string>();
    if (access != "normal" && access != "expert") {
      add_error(result, path, "access must be 'normal' or 'expert'",
                param["access"]);
    }
  }

  if (has_bool_rule) {
    std::string mode = param["bool_normalize"].as<std::string>();
    if (mode != "strict" && mode != "lenient") {
      add_error(result, path, "bool_normalize must be 'strict' or 'lenient'",
                param["bool_normalize"]);
    }
  }

  if (param["map"] &&
      !convertible<std::map<std::string, std::string>>(param["map"])) {
    add_error(result, path, "map must map strings to strings", param["map"]);
  }

  if (param["cross_field"]) {
    const auto &rule = param["cross_field"];
    for (const auto &req : {"name", "other", "relation"}) {
      if (!rule[req]) {
        add_error(result, path,
                  std::string("Missing required cross_field field '") + req +
                      "'",
                  rule);
      }
    }
    if (rule["relation"]) {
      std::string relation = rule["relation"].as<std::string>();
      if (relation != "le" && relation != "ge") {
        add_error(result, path, "cross_field relation must be 'le' or 'ge'",
                  rule["relation"]);
      }
    }
  }

  for (const auto &flag :
       {"read_on_connect", "write_on_connect", "read_back", "read_only",
        "returns_response", "live_options"}) {
    if (param[flag] && !convertible<bool>(param[flag])) {
      add_error(result, path, std::string(flag) + " must be a boolean",
                param[flag]);
    }
  }

  if (param["write_on_connect"] && convertible<bool>(param["write_on_connect"]) &&
      param["write_on_connect"].as<bool>() && !param["default"]) {
    add_error(result, path, "write_on_connect requires a default", param);
  }
}

static void validate_parameter_list(const YAML::Node &list,
                                    std::vector<std::string> path,
                                    bool channel_scope,
                                    ValidationResult &result) {
  if (!list.IsSequence()) {
    add_error(result, path, "parameters must be a sequence", list);
    return;
  }
  std::set<std::string> keys;
  for (size_t i = 0; i < list.size(); ++i) {
    std::vector<std::string> entry_path = path;
    entry_path.push_back(std::to_string(i));
    validate_parameter(list[i], entry_path, channel_scope, result);
    if (list[i].IsMap() && list[i]["key"]) {
      std::string key = list[i]["key"].as<std::string>();
      if (!keys.insert(key).second) {
        add_error(result, entry_path, "Duplicate parameter key '" + key + "'",
                  list[i]["key"]);
      }
    }
  }
}

ValidationResult SchemaValidator::validate_model_node(const YAML::Node &doc) {
  ValidationResult result;
  result.valid = true;

  try {
    if (!doc.IsMap()) {
      add_error(result, {}, "Model document must be a map", doc);
      return result;
    }

    if (!doc["model"] || !convertible<std::string>(doc["model"])) {
      add_error(result, {}, "Missing required field 'model'", doc);
    }

    if (doc["defaults"]) {
      for (const auto &flag : {"read_on_connect", "read_back"}) {
        if (doc["defaults"][flag] && !convertible<bool>(doc["defaults"][flag])) {
          add_error(result, {"defaults"},
                    std::string(flag) + " must be a boolean",
                    doc["defaults"][flag]);
        }
      }
    }

    if (doc["parameters"]) {
      validate_parameter_list(doc["parameters"], {"parameters"}, false,
                              result);
    }

    if (doc["channel_groups"]) {
      if (!doc["channel_groups"].IsSequence()) {
        add_error(result, {"channel_groups"},
                  "channel_groups must be a sequence", doc["channel_groups"]);
      } else {
        for (size_t g = 0; g < doc["channel_groups"].size(); ++g) {
          const auto &group = doc["channel_groups"][g];
          std::vector<std::string> group_path = {"channel_groups",
                                                 std::to_string(g)};
          for (const auto &req : {"name", "count", "parameters"}) {
            if (!group[req]) {
              add_error(result, group_path,
                        std::string("Missing required channel_group field '") +
                            req + "'",
                        group);
            }
          }
          if (group["count"] && (!convertible<int>(group["count"]) ||
                                 group["count"].as<int>() < 1)) {
            add_error(result, group_path, "count must be a positive integer",
                      group["count"]);
          }
          if (group["first"] && !convertible<int>(group["first"])) {
            add_error(result, group_path, "first must be an integer",
                      group["first"]);
          }
          if (group["parameters"]) {
            group_path.push_back("parameters");
            validate_parameter_list(group["parameters"], group_path, true,
                                    result);
          }
        }
      }
    }

    if (doc["channels"]) {
      if (!doc["channels"].IsSequence()) {
        add_error(result, {"channels"}, "channels must be a sequence",
                  doc["channels"]);
      } else {
        for (size_t c = 0; c < doc["channels"].size(); ++c) {
          const auto &node = doc["channels"][c];
          std::vector<std::string> node_path_parts = {"channels",
                                                      std::to_string(c)};
          for (const auto &req : {"name", "alias", "parameters"}) {
            if (!node[req]) {
              add_error(result, node_path_parts,
                        std::string("Missing required channel field '") + req +
                            "'",
                        node);
            }
          }
          if (node["parameters"]) {
            node_path_parts.push_back("parameters");
            validate_parameter_list(node["parameters"], node_path_parts, true,
                                    result);
          }
        }
      }
    }

    if (!doc["parameters"] && !doc["channel_groups"] && !doc["channels"]) {
      result.warnings.push_back("Model declares no parameters");
    }

    if (doc["catalog"]) {
      for (const auto &req : {"query", "path", "target"}) {
        if (!doc["catalog"][req]) {
          add_error(result, {"catalog"},
                    std::string("Missing required catalog field '") + req +
                        "'",
                    doc["catalog"]);
        }
      }
    }

    // Cross-references and translation tables are checked by the builder
    if (result.valid) {
      try {
        build_model(doc);
      } catch (const std::invalid_argument &e) {
        add_error(result, {}, e.what());
      }
    }
  } catch (const YAML::Exception &e) {
    add_error(result, {}, std::string("YAML error: ") + e.what());
  }

  return result;
}

ValidationResult SchemaValidator::validate_model(const std::string &yaml_path) {
  try {
    YAML::Node doc = YAML::LoadFile(yaml_path);
    return validate_model_node(doc);
  } catch (const YAML::Exception &e) {
    ValidationResult result;
    result.valid = false;
    result.errors.push_back({"/", std::string("Cannot load YAML: ") + e.what(),
                             e.mark.line + 1, e.mark.column + 1});
    return result;
  }
}

static DescriptorBuilder parameter_from_yaml(const YAML::Node &p) {
  std::string key = p["key"].as<std::string>();
  std::string alias = p["alias"] ? p["alias"].as<std::string>() : "";
  std::string kind = p["kind"] ? p["kind"].as<std::string>() : "string";

  std::vector<std::string> options;
  if (p["options"])
    options = p["options"].as<std::vector<std::string>>();

  DescriptorBuilder b = kind == "enum"     ? DescriptorBuilder::enumeration(
                                               key, alias, options)
                        : kind == "number" ? DescriptorBuilder::number(key, alias)
                                           : DescriptorBuilder::text(key, alias);

  if (p["display_name"])
    b.displayed_name(p["display_name"].as<std::string>());
  if (p["description"])
    b.description(p["description"].as<std::string>());
  if (p["unit"])
    b.unit(p["unit"].as<std::string>());
  if (p["min"] || p["max"]) {
    std::optional<double> min;
    std::optional<double> max;
    if (p["min"])
      min = p["min"].as<double>();
    if (p["max"])
      max = p["max"].as<double>();
    b.range(min, max);
  }
  if (p["unit_suffix"])
    b.unit_suffix(p["unit_suffix"].as<std::string>());
  if (p["command_format"])
    b.command_format(p["command_format"].as<std::string>());
  if (p["query_format"])
    b.query_format(p["query_format"].as<std::string>());
  if (p["read_on_connect"])
    b.read_on_connect(p["read_on_connect"].as<bool>());
  if (p["write_on_connect"])
    b.write_on_connect(p["write_on_connect"].as<bool>());
  if (p["read_back"])
    b.read_back(p["read_back"].as<bool>());
  if (p["poll"])
    b.polled(p["poll"].as<double>());
  if (p["access"] && p["access"].as<std::string>() == "expert")
    b.expert();
  if (p["read_only"] && p["read_only"].as<bool>())
    b.read_only();
  if (p["default"])
    b.default_value(p["default"].as<std::string>());
  if (p["map"])
    b.translate(p["map"].as<std::map<std::string, std::string>>());
  if (p["bool_normalize"])
    b.bool_normalize(p["bool_normalize"].as<std::string>() == "lenient");
  if (p["cross_field"]) {
    const auto &rule = p["cross_field"];
    b.cross_field(rule["name"].as<std::string>(),
                  rule["other"].as<std::string>(),
                  rule["relation"].as<std::string>() == "ge"
                      ? CrossFieldRule::Relation::NotLessThan
                      : CrossFieldRule::Relation::NotGreaterThan);
  }
  if (p["live_options"] && p["live_options"].as<bool>())
    b.live_options();
  if (p["returns_response"] && p["returns_response"].as<bool>())
    b.returns_response();
  if (p["ignore_response_containing"])
    b.ignore_response_containing(
        p["ignore_response_containing"].as<std::string>());
  return b;
}

static std::vector<DescriptorBuilder>
parameters_from_yaml(const YAML::Node &list) {
  std::vector<DescriptorBuilder> out;
  for (const auto &p : list)
    out.push_back(parameter_from_yaml(p));
  return out;
}

ParameterSchema SchemaValidator::build_model(const YAML::Node &doc) {
  ParameterSchema::Builder builder(doc["model"].as<std::string>());

  PolicyDefaults defaults;
  if (doc["defaults"]) {
    const auto &d = doc["defaults"];
    defaults.read_on_connect =
        d["read_on_connect"] ? d["read_on_connect"].as<bool>() : false;
    defaults.command_read_back =
        d["read_back"] ? d["read_back"].as<bool>() : false;
  }
  builder.defaults(defaults);

  if (doc["parameters"]) {
    for (const auto &p : doc["parameters"])
      builder.add(parameter_from_yaml(p));
  }

  if (doc["channel_groups"]) {
    for (const auto &group : doc["channel_groups"]) {
      std::string name = group["name"].as<std::string>();
      int count = group["count"].as<int>();
      int first = group["first"] ? group["first"].as<int>() : 1;
      std::string display = group["display_name"]
                                ? group["display_name"].as<std::string>()
                                : name + " {n}";
      auto parameters = parameters_from_yaml(group["parameters"]);
      for (int n = first; n < first + count; ++n) {
        std::string label = display;
        auto pos = label.find("{n}");
        if (pos != std::string::npos)
          label.replace(pos, 3, std::to_string(n));
        builder.add_channel(name + "_" + std::to_string(n), std::to_string(n),
                            label, parameters);
      }
    }
  }

  if (doc["channels"]) {
    for (const auto &node : doc["channels"]) {
      builder.add_channel(node["name"].as<std::string>(),
                          node["alias"].as<std::string>(),
                          node["display_name"]
                              ? node["display_name"].as<std::string>()
                              : "",
                          parameters_from_yaml(node["parameters"]));
    }
  }

  if (doc["catalog"]) {
    const auto &c = doc["catalog"];
    builder.catalog(CatalogSpec{
        c["query"].as<std::string>(), c["path"].as<std::string>(),
        c["target"].as<std::string>(),
        c["refresh_on_connect"] ? c["refresh_on_connect"].as<bool>() : true});
  }

  return builder.build();
}

ParameterSchema SchemaValidator::load_model(const std::string &yaml_path) {
  auto result = validate_model(yaml_path);
  if (!result.valid) {
    std::string message = "Invalid model file " + yaml_path + ":";
    for (const auto &err : result.errors)
      message += "\n  - " + err.path + ": " + err.message;
    throw std::runtime_error(message);
  }
  return build_model(YAML::LoadFile(yaml_path));
}

} // namespace fgen
