#include "fgen-engine/types.hpp"

namespace fgen {

const char *to_string(AccessLevel level) {
  return level == AccessLevel::Expert ? "expert" : "normal";
}

const char *to_string(ParameterKind kind) {
  switch (kind) {
  case ParameterKind::Enum:
    return "enum";
  case ParameterKind::Number:
    return "number";
  case ParameterKind::FreeString:
    return "string";
  }
  return "unknown";
}

const char *to_string(ConnectionState state) {
  switch (state) {
  case ConnectionState::Disconnected:
    return "Disconnected";
  case ConnectionState::Connecting:
    return "Connecting";
  case ConnectionState::Connected:
    return "Connected";
  case ConnectionState::Faulted:
    return "Faulted";
  }
  return "Unknown";
}

} // namespace fgen
