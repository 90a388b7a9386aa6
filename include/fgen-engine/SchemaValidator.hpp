#pragma once
#include "fgen-engine/ParameterSchema.hpp"
#include "fgen-engine/export.h"
#include "fgen-engine/types.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

namespace fgen {

/// YAML instrument model files: validation with per-field diagnostics and
/// conversion into a ParameterSchema.
///
///   model: MyGenerator
///   defaults: {read_on_connect: true, read_back: true}
///   parameters:            # device-scoped
///     - {key: identification, alias: "*IDN", kind: string, read_only: true}
///   channel_groups:        # expands to channel_1..channel_<count>
///     - name: channel
///       count: 2
///       parameters:
///         - {key: offset, alias: "SOURce{channel}:VOLT:OFFS", kind: number}
class FGEN_ENGINE_API SchemaValidator {
public:
  static ValidationResult validate_model(const std::string &yaml_path);
  static ValidationResult validate_model_node(const YAML::Node &doc);

  /// Validate then build; throws std::runtime_error listing every error
  static ParameterSchema load_model(const std::string &yaml_path);

  /// Build without structural validation (std::invalid_argument or
  /// YAML::Exception on bad input)
  static ParameterSchema build_model(const YAML::Node &doc);
};

} // namespace fgen
