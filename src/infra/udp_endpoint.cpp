#include "qf/endpoint.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

// POSIX networking
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

namespace qf
{
static constexpr std::size_t kMaxDatagram = 4096;

std::optional<ServerAddress> parse_server_address(std::string_view text)
{
    std::string host;
    std::string port;
    if (!text.empty() && text.front() == '[')
    {
        const auto close = text.find(']');
        if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':')
            return std::nullopt;
        host = std::string(text.substr(1, close - 1));
        port = std::string(text.substr(close + 2));
    }
    else
    {
        const auto colon = text.rfind(':');
        if (colon == std::string_view::npos) return std::nullopt;
        host = std::string(text.substr(0, colon));
        port = std::string(text.substr(colon + 1));
        // bare IPv6 literals must be bracketed
        if (host.find(':') != std::string::npos) return std::nullopt;
    }
    if (host.empty() || port.empty()) return std::nullopt;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo *res = nullptr;
    if (getaddrinfo(host.c_str(), port.c_str(), &hints, &res) != 0 || !res) return std::nullopt;

    ServerAddress out{};
    std::memcpy(&out.addr, res->ai_addr, res->ai_addrlen);
    out.len = static_cast<socklen_t>(res->ai_addrlen);
    out.family = res->ai_family;
    out.text = std::string(text);
    freeaddrinfo(res);
    return out;
}

static std::system_error socket_error(const char *what)
{
    return std::system_error(errno, std::generic_category(), what);
}

UdpEndpoint::UdpEndpoint(const ServerAddress &server)
{
    fd_.reset(::socket(server.family, SOCK_DGRAM, IPPROTO_UDP));
    if (!fd_) throw socket_error("socket");

    sockaddr_storage local{};
    socklen_t local_len = 0;
    if (server.family == AF_INET6)
    {
        auto *sin6 = reinterpret_cast<sockaddr_in6 *>(&local);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_addr = in6addr_any;
        sin6->sin6_port = 0;
        local_len = sizeof(sockaddr_in6);
    }
    else
    {
        auto *sin = reinterpret_cast<sockaddr_in *>(&local);
        sin->sin_family = AF_INET;
        sin->sin_addr.s_addr = htonl(INADDR_ANY);
        sin->sin_port = 0;
        local_len = sizeof(sockaddr_in);
    }

    if (::bind(fd_.get(), reinterpret_cast<const sockaddr *>(&local), local_len) < 0)
        throw socket_error("bind");
    if (::connect(fd_.get(), reinterpret_cast<const sockaddr *>(&server.addr), server.len) < 0)
        throw socket_error("connect");
}

bool UdpEndpoint::send(std::span<const std::uint8_t> payload)
{
    ssize_t n;
    do
    {
        n = ::send(fd_.get(), payload.data(), payload.size(), 0);
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(payload.size());
}

RecvStatus UdpEndpoint::recv(std::vector<std::uint8_t> &buf, std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0) return RecvStatus::Timeout;

    pollfd pfd{};
    pfd.fd = fd_.get();
    pfd.events = POLLIN;
    int rc;
    do
    {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) return RecvStatus::Timeout;
    if (rc < 0) return RecvStatus::Error;

    buf.resize(kMaxDatagram);
    ssize_t n;
    do
    {
        n = ::recv(fd_.get(), buf.data(), buf.size(), 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0)
    {
        buf.clear();
        return (errno == EAGAIN || errno == EWOULDBLOCK) ? RecvStatus::Timeout : RecvStatus::Error;
    }
    buf.resize(static_cast<std::size_t>(n));
    return RecvStatus::Ok;
}
} // namespace qf
