#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/socket.h>

#include "qf/unique_fd.hpp"

namespace qf {

enum class RecvStatus { Ok, Timeout, Error };

// Datagram transport owned by exactly one worker.
class Transport {
public:
  virtual ~Transport() = default;

  // false on any transport error
  virtual bool send(std::span<const std::uint8_t> payload) = 0;

  // Waits up to `timeout` for one datagram and stores it in `buf`.
  virtual RecvStatus recv(std::vector<std::uint8_t>& buf, std::chrono::milliseconds timeout) = 0;
};

struct ServerAddress {
  sockaddr_storage addr{};
  socklen_t        len{};
  int              family{};
  std::string      text;    // as given on the command line
};

// Numeric "ip:port" or "[ipv6]:port"; nullopt when unparsable.
std::optional<ServerAddress> parse_server_address(std::string_view text);

// UDP socket bound to an ephemeral local port and connected to the server.
// The constructor throws std::system_error when socket/bind/connect fails.
class UdpEndpoint final : public Transport {
public:
  explicit UdpEndpoint(const ServerAddress& server);

  bool send(std::span<const std::uint8_t> payload) override;
  RecvStatus recv(std::vector<std::uint8_t>& buf, std::chrono::milliseconds timeout) override;

private:
  UniqueFd fd_;
};

} // namespace qf
