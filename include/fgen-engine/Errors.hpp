#pragma once
#include "fgen-engine/export.h"

#include <stdexcept>
#include <string>

namespace fgen {

/// Everything that can go wrong between a parameter request and the wire.
/// Transport-level kinds escalate to the connection supervisor, the rest
/// stay local to one parameter.
enum class ErrorKind {
  TransportTimeout,
  ConnectionRefused,
  TransportClosed,
  NotConnected,
  InvalidOption,
  MalformedResponse,
  ReadBackMismatch,
  UnknownParameter,
  ReadOnly
};

FGEN_ENGINE_API const char *to_string(ErrorKind kind);

/// True for errors that mean the link itself is unusable
FGEN_ENGINE_API bool is_transport_error(ErrorKind kind);

class FGEN_ENGINE_API EngineError : public std::runtime_error {
public:
  EngineError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

/// Raised by transports: open/read/write failures
class FGEN_ENGINE_API TransportError : public EngineError {
public:
  using EngineError::EngineError;
};

/// Raised by the codec: validation and decode failures
class FGEN_ENGINE_API CodecError : public EngineError {
public:
  using EngineError::EngineError;
};

} // namespace fgen
