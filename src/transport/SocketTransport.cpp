#include "fgen-engine/transport/SocketTransport.hpp"
#include "fgen-engine/Logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fgen {
namespace transport {

namespace {

constexpr std::chrono::milliseconds WRITE_TIMEOUT{5000};

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

} // namespace

SocketTransport::SocketTransport(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

SocketTransport::~SocketTransport() { close(); }

std::string SocketTransport::describe() const {
  return fmt::format("{}:{}", host_, port_);
}

TransportFactory SocketTransport::factory(const std::string &host,
                                          uint16_t port) {
  return [host, port]() -> std::unique_ptr<Transport> {
    return std::make_unique<SocketTransport>(host, port);
  };
}

int SocketTransport::connect_one(const void *addr, unsigned addr_len,
                                 std::chrono::milliseconds timeout,
                                 ErrorKind &failure, std::string &message) {
  const auto *sa = static_cast<const sockaddr *>(addr);
  int fd = ::socket(sa->sa_family, SOCK_STREAM, IPPROTO_TCP);
  if (fd < 0) {
    failure = ErrorKind::ConnectionRefused;
    message = fmt::format("Failed to create socket: {}", strerror(errno));
    return -1;
  }

  int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  if (::connect(fd, sa, static_cast<socklen_t>(addr_len)) < 0) {
    if (errno != EINPROGRESS) {
      failure = ErrorKind::ConnectionRefused;
      message = fmt::format("Connection to {} refused: {}", describe(),
                            strerror(errno));
      ::close(fd);
      return -1;
    }

    pollfd pfd{fd, POLLOUT, 0};
    int r = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (r == 0) {
      failure = ErrorKind::TransportTimeout;
      message = fmt::format("Connection to {} timed out after {} ms",
                            describe(), timeout.count());
      ::close(fd);
      return -1;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (r < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
        so_error != 0) {
      failure = ErrorKind::ConnectionRefused;
      message = fmt::format("Connection to {} refused: {}", describe(),
                            strerror(so_error != 0 ? so_error : errno));
      ::close(fd);
      return -1;
    }
  }

  int one = 1;
  setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return fd;
}

void SocketTransport::open(std::chrono::milliseconds timeout) {
  close();
  rx_buffer_.clear();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = nullptr;
  std::string port = std::to_string(port_);
  int rc = getaddrinfo(host_.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    throw TransportError(ErrorKind::ConnectionRefused,
                         fmt::format("Cannot resolve {}: {}", host_,
                                     gai_strerror(rc)));
  }

  // One budget for all resolved addresses
  auto deadline = std::chrono::steady_clock::now() + timeout;
  ErrorKind failure = ErrorKind::ConnectionRefused;
  std::string message = fmt::format("No address for {}", describe());
  for (addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
    int left = remaining_ms(deadline);
    if (left <= 0) {
      failure = ErrorKind::TransportTimeout;
      message = fmt::format("Connection to {} timed out after {} ms",
                            describe(), timeout.count());
      break;
    }
    int fd = connect_one(ai->ai_addr, ai->ai_addrlen,
                         std::chrono::milliseconds(left), failure, message);
    if (fd >= 0) {
      fd_ = fd;
      break;
    }
  }
  freeaddrinfo(results);

  if (fd_ < 0)
    throw TransportError(failure, message);

  LOG_DEBUG("TRANSPORT", "OPEN", "Connected to {}", describe());
}

void SocketTransport::close() {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
}

void SocketTransport::write(const std::string &data) {
  if (fd_ < 0)
    throw TransportError(ErrorKind::TransportClosed, "Socket is not open");

  auto deadline = std::chrono::steady_clock::now() + WRITE_TIMEOUT;
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent,
                       MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{fd_, POLLOUT, 0};
      if (::poll(&pfd, 1, remaining_ms(deadline)) <= 0) {
        throw TransportError(ErrorKind::TransportTimeout,
                             fmt::format("Write to {} timed out", describe()));
      }
      continue;
    }
    throw TransportError(ErrorKind::TransportClosed,
                         fmt::format("Write to {} failed: {}", describe(),
                                     strerror(errno)));
  }
}

bool SocketTransport::extract_line(std::string &line) {
  auto pos = rx_buffer_.find('\n');
  if (pos == std::string::npos)
    return false;
  line = rx_buffer_.substr(0, pos);
  rx_buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return true;
}

std::string SocketTransport::read_line(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    throw TransportError(ErrorKind::TransportClosed, "Socket is not open");

  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string line;
  char buf[4096];
  while (!extract_line(line)) {
    int wait_ms = remaining_ms(deadline);
    if (wait_ms <= 0) {
      throw TransportError(ErrorKind::TransportTimeout,
                           fmt::format("No reply from {} within {} ms",
                                       describe(), timeout.count()));
    }

    pollfd pfd{fd_, POLLIN, 0};
    int r = ::poll(&pfd, 1, wait_ms);
    if (r == 0)
      continue; // deadline check above reports the timeout
    if (r < 0) {
      if (errno == EINTR)
        continue;
      throw TransportError(ErrorKind::TransportClosed,
                           fmt::format("poll on {} failed: {}", describe(),
                                       strerror(errno)));
    }

    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n == 0) {
      throw TransportError(ErrorKind::TransportClosed,
                           fmt::format("{} closed the connection", describe()));
    }
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
        continue;
      throw TransportError(ErrorKind::TransportClosed,
                           fmt::format("Read from {} failed: {}", describe(),
                                       strerror(errno)));
    }
    rx_buffer_.append(buf, static_cast<size_t>(n));
  }
  return line;
}

void SocketTransport::flush_input() {
  rx_buffer_.clear();
  if (fd_ < 0)
    return;
  char buf[4096];
  while (::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT) > 0) {
  }
}

} // namespace transport
} // namespace fgen
