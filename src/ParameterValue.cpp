#include "fgen-engine/ParameterValue.hpp"

#include <fmt/format.h>

namespace fgen {

std::string to_string(const TypedValue &value) {
  return std::visit(
      [](auto &&arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>)
          return "<unknown>";
        else if constexpr (std::is_same_v<T, double>)
          return fmt::format("{}", arg);
        else
          return arg;
      },
      value);
}

nlohmann::json typed_value_to_json(const TypedValue &value) {
  return std::visit(
      [](auto &&arg) -> nlohmann::json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else {
          return arg;
        }
      },
      value);
}

TypedValue json_to_typed_value(const nlohmann::json &j) {
  if (j.is_boolean())
    return j.get<bool>() ? 1.0 : 0.0;
  if (j.is_number())
    return j.get<double>();
  if (j.is_string())
    return j.get<std::string>();
  return std::monostate{};
}

nlohmann::json ParameterValue::to_json() const {
  nlohmann::json j;
  j["raw"] = raw;
  j["value"] = typed_value_to_json(value);
  j["pending_write"] = pending_write;
  j["last_updated_ms"] =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          last_updated.time_since_epoch())
          .count();
  return j;
}

nlohmann::json ParameterResult::to_json() const {
  nlohmann::json j;
  j["success"] = success;
  j["value"] = typed_value_to_json(value);
  if (error) {
    j["error"] = to_string(*error);
    j["error_message"] = error_message;
  }
  if (warning) {
    j["warning"] = to_string(*warning);
    j["warning_message"] = warning_message;
  }
  return j;
}

} // namespace fgen
