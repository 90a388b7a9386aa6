#pragma once
#include "fgen-engine/Errors.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace fgen {

/// Decoded value of a parameter: nothing yet, a number or a token/string
using TypedValue = std::variant<std::monostate, double, std::string>;

/// Text form used in logs, status messages and the CLI
std::string to_string(const TypedValue &value);

nlohmann::json typed_value_to_json(const TypedValue &value);

/// Accepts JSON numbers, strings and booleans (true -> 1, false -> 0)
TypedValue json_to_typed_value(const nlohmann::json &j);

/// Current known value for one descriptor instance
struct ParameterValue {
  std::string raw; // device string last seen
  TypedValue value;
  std::chrono::system_clock::time_point last_updated;
  bool pending_write{false};

  nlohmann::json to_json() const;
};

/// Outcome of a dispatcher write/query
struct ParameterResult {
  bool success{false};
  TypedValue value;

  // Error info
  std::optional<ErrorKind> error;
  std::string error_message;

  // Non-fatal: set on read-back mismatch
  std::optional<ErrorKind> warning;
  std::string warning_message;

  bool read_back_mismatch() const {
    return warning == ErrorKind::ReadBackMismatch;
  }

  static ParameterResult ok(TypedValue value) {
    ParameterResult result;
    result.success = true;
    result.value = std::move(value);
    return result;
  }

  static ParameterResult failure(ErrorKind kind, std::string message) {
    ParameterResult result;
    result.error = kind;
    result.error_message = std::move(message);
    return result;
  }

  nlohmann::json to_json() const;
};

} // namespace fgen
