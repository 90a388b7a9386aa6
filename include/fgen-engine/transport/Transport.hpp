#pragma once
#include "fgen-engine/Errors.hpp"
#include "fgen-engine/export.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace fgen {
namespace transport {

/// Point-to-point line-oriented byte stream to one instrument.
/// Failures throw TransportError with a transport-level ErrorKind.
class FGEN_ENGINE_API Transport {
public:
  virtual ~Transport() = default;

  /// Establish the link (ConnectionRefused / TransportTimeout)
  virtual void open(std::chrono::milliseconds timeout) = 0;

  virtual void close() = 0;

  virtual bool is_open() const = 0;

  virtual void write(const std::string &data) = 0;

  /// One line without its terminator (TransportTimeout / TransportClosed)
  virtual std::string read_line(std::chrono::milliseconds timeout) = 0;

  /// Discard anything received but not yet read
  virtual void flush_input() = 0;

  /// Peer description for logs, e.g. "10.0.0.5:5025"
  virtual std::string describe() const = 0;
};

/// Creates a fresh, unopened transport for every connection attempt
using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace transport
} // namespace fgen
