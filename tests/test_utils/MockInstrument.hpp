#pragma once
#include "fgen-engine/transport/Transport.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fgen {
namespace test {

/// In-memory SCPI instrument. "ADDR value" stores into a register map,
/// "ADDR?" replies with the stored value. Transports created through
/// transport_factory() share this state, so a test keeps its handle after
/// the engine takes ownership of the link.
class MockInstrument : public std::enable_shared_from_this<MockInstrument> {
public:
  MockInstrument();

  /// Register preset (address without "?")
  void set_register(const std::string &address, const std::string &value);
  std::string get_register(const std::string &address) const;
  bool has_register(const std::string &address) const;

  /// Reply to "ADDR?" with a fixed value whatever was written
  void set_override(const std::string &address, const std::string &reply);
  void clear_override(const std::string &address);

  /// Queries to this address are never answered
  void set_unresponsive(const std::string &address, bool late_reply = false);
  void clear_unresponsive(const std::string &address);

  void set_delay(const std::string &address, std::chrono::milliseconds delay);

  void set_refuse_connections(bool refuse);
  void set_open_timeout(bool timeout);

  /// Closes every live link; the next read or write fails TransportClosed
  void drop_connection();

  std::vector<std::string> trace() const;
  size_t count(const std::string &line_prefix) const;
  void clear_trace();

  size_t open_count() const { return open_count_.load(); }
  bool connected() const;

  transport::TransportFactory transport_factory();

  // Transport side
  uint64_t open(std::chrono::milliseconds timeout);
  void close_link(uint64_t generation);
  bool link_alive(uint64_t generation) const;
  void handle_line(const std::string &line, uint64_t generation);
  std::string next_reply(uint64_t generation);
  void flush();

private:
  static std::string address_of(const std::string &line, bool &is_query,
                                std::string &argument);

  mutable std::mutex mutex_;
  std::map<std::string, std::string> registers_;
  std::map<std::string, std::string> overrides_;
  std::map<std::string, bool> unresponsive_; // address -> late reply
  std::map<std::string, std::chrono::milliseconds> delays_;
  std::deque<std::string> pending_;
  std::deque<std::string> late_;
  std::vector<std::string> trace_;
  bool refuse_{false};
  bool open_timeout_{false};
  bool link_up_{false};
  uint64_t generation_{0};
  std::atomic<size_t> open_count_{0};
};

/// Transport bound to one MockInstrument connection
class MockTransport : public transport::Transport {
public:
  explicit MockTransport(std::shared_ptr<MockInstrument> instrument);

  void open(std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override;
  void write(const std::string &data) override;
  std::string read_line(std::chrono::milliseconds timeout) override;
  void flush_input() override;
  std::string describe() const override { return "mock"; }

private:
  void check_link() const;

  std::shared_ptr<MockInstrument> instrument_;
  bool open_{false};
  uint64_t generation_{0};
};

} // namespace test
} // namespace fgen
