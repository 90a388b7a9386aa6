#include "fgen-engine/Errors.hpp"

namespace fgen {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::TransportTimeout:
    return "TransportTimeout";
  case ErrorKind::ConnectionRefused:
    return "ConnectionRefused";
  case ErrorKind::TransportClosed:
    return "TransportClosed";
  case ErrorKind::NotConnected:
    return "NotConnected";
  case ErrorKind::InvalidOption:
    return "InvalidOption";
  case ErrorKind::MalformedResponse:
    return "MalformedResponse";
  case ErrorKind::ReadBackMismatch:
    return "ReadBackMismatch";
  case ErrorKind::UnknownParameter:
    return "UnknownParameter";
  case ErrorKind::ReadOnly:
    return "ReadOnly";
  }
  return "Unknown";
}

bool is_transport_error(ErrorKind kind) {
  return kind == ErrorKind::TransportTimeout ||
         kind == ErrorKind::ConnectionRefused ||
         kind == ErrorKind::TransportClosed;
}

} // namespace fgen
