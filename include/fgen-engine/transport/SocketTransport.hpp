#pragma once
#include "fgen-engine/transport/Transport.hpp"

#include <cstdint>
#include <string>

namespace fgen {
namespace transport {

constexpr uint16_t DEFAULT_SCPI_PORT = 5025;

/// TCP line transport (raw SCPI socket)
class FGEN_ENGINE_API SocketTransport : public Transport {
public:
  SocketTransport(std::string host, uint16_t port = DEFAULT_SCPI_PORT);
  ~SocketTransport() override;

  SocketTransport(const SocketTransport &) = delete;
  SocketTransport &operator=(const SocketTransport &) = delete;

  void open(std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }
  void write(const std::string &data) override;
  std::string read_line(std::chrono::milliseconds timeout) override;
  void flush_input() override;
  std::string describe() const override;

  /// Factory for ConnectionSupervisor
  static TransportFactory factory(const std::string &host, uint16_t port);

private:
  int connect_one(const void *addr, unsigned addr_len,
                  std::chrono::milliseconds timeout, ErrorKind &failure,
                  std::string &message);
  bool extract_line(std::string &line);

  std::string host_;
  uint16_t port_;
  int fd_{-1};
  std::string rx_buffer_;
};

} // namespace transport
} // namespace fgen
