#include "triple/runtime/socket.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <string>
#include <system_error>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace triple::runtime::net
{
namespace
{

Error make_errno_error(const std::string& prefix, int err)
{
    std::error_code code(err, std::generic_category());
    std::string message = prefix;
    if (!prefix.empty()) {
        message += ": ";
    }
    message += code.message();
    return make_error(std::move(code), std::move(message));
}

int make_wake_fd()
{
    return ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
}

void signal_wake(int wake_fd)
{
    if (wake_fd < 0) {
        return;
    }
    std::uint64_t one = 1;
    while (::write(wake_fd, &one, sizeof(one)) < 0 && errno == EINTR) {
    }
}

// Waits for `events` on fd; false when woken through wake_fd.
Result<bool> wait_ready(int fd, int wake_fd, short events, int timeout_ms = -1)
{
    while (true) {
        struct pollfd fds[2];
        fds[0].fd = fd;
        fds[0].events = events;
        fds[0].revents = 0;
        fds[1].fd = wake_fd;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int rc = ::poll(fds, wake_fd >= 0 ? 2 : 1, timeout_ms);
        if (rc < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            return unexpected_result<bool>(make_errno_error("poll", err));
        }
        if (rc == 0) {
            return unexpected_result<bool>(ErrorCode::Timeout, "operation timed out");
        }
        if (wake_fd >= 0 && (fds[1].revents & POLLIN)) {
            return false;
        }
        if (fds[0].revents & POLLNVAL) {
            return unexpected_result<bool>(ErrorCode::TransportError, "invalid socket descriptor");
        }
        if (fds[0].revents & (events | POLLHUP | POLLERR)) {
            return true;
        }
    }
}

void set_cloexec(int fd)
{
    int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

Result<sockaddr_un> make_unix_address(const std::string& path)
{
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        return unexpected_result<sockaddr_un>(ErrorCode::ConfigError, "unix socket path too long: " + path);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
}

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { ::freeaddrinfo(info); }
};

Result<std::unique_ptr<addrinfo, AddrInfoDeleter>> resolve(const Address& address, bool passive)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) {
        hints.ai_flags = AI_PASSIVE;
    }
    addrinfo* result = nullptr;
    auto port = std::to_string(address.port);
    int rc = ::getaddrinfo(address.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        return unexpected_result<std::unique_ptr<addrinfo, AddrInfoDeleter>>(
            ErrorCode::ConnectionError, "resolve " + address.to_string() + ": " + ::gai_strerror(rc));
    }
    return std::unique_ptr<addrinfo, AddrInfoDeleter>(result);
}

// Non-blocking connect bounded by `timeout`; the socket is blocking again on success.
Result<void> connect_with_timeout(int fd, const sockaddr* addr, socklen_t len, std::chrono::milliseconds timeout)
{
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return unexpected_result(make_errno_error("fcntl", errno));
    }
    if (::connect(fd, addr, len) < 0) {
        int err = errno;
        if (err != EINPROGRESS) {
            return unexpected_result(make_errno_error("connect", err));
        }
        auto ready = wait_ready(fd, -1, POLLOUT, static_cast<int>(timeout.count()));
        if (!ready) {
            return std::unexpected(ready.error());
        }
        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
            return unexpected_result(make_errno_error("getsockopt", errno));
        }
        if (so_error != 0) {
            return unexpected_result(make_errno_error("connect", so_error));
        }
    }
    if (::fcntl(fd, F_SETFL, flags) < 0) {
        return unexpected_result(make_errno_error("fcntl", errno));
    }
    return {};
}

Result<std::shared_ptr<Socket>> wrap_fd(int fd)
{
    auto socket = std::make_shared<Socket>(fd);
    if (!socket->is_open()) {
        return unexpected_result<std::shared_ptr<Socket>>(make_errno_error("eventfd", errno));
    }
    return socket;
}

}  // namespace

std::string Address::to_string() const
{
    if (kind == Kind::Unix) {
        return "unix:" + path;
    }
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

Result<Address> parse_address(std::string_view text)
{
    constexpr std::string_view unix_prefix = "unix:";
    if (text.empty()) {
        return unexpected_result<Address>(ErrorCode::ConfigError, "empty address");
    }
    Address address;
    if (text.starts_with(unix_prefix)) {
        address.kind = Address::Kind::Unix;
        address.path = std::string(text.substr(unix_prefix.size()));
        if (address.path.empty()) {
            return unexpected_result<Address>(ErrorCode::ConfigError, "unix address without a path");
        }
        return address;
    }

    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return unexpected_result<Address>(ErrorCode::ConfigError, "address '" + std::string(text) + "' has no port");
    }
    auto host = text.substr(0, colon);
    auto port = text.substr(colon + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty() || port.empty()) {
        return unexpected_result<Address>(ErrorCode::ConfigError, "malformed address '" + std::string(text) + "'");
    }
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc{} || ptr != port.data() + port.size() || value > 65535) {
        return unexpected_result<Address>(ErrorCode::ConfigError, "invalid port in address '" + std::string(text) + "'");
    }
    address.kind = Address::Kind::Tcp;
    address.host = std::string(host);
    address.port = static_cast<std::uint16_t>(value);
    return address;
}

Socket::Socket(int fd)
    : fd_(fd)
{
    wake_fd_ = make_wake_fd();
    if (wake_fd_ < 0) {
        closed_.store(true, std::memory_order_release);
    }
}

Socket::~Socket()
{
    close();
    if (fd_ >= 0) {
        ::close(fd_);
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
}

void Socket::close()
{
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
    signal_wake(wake_fd_);
}

Result<std::size_t> Socket::read_some(std::span<std::uint8_t> buffer)
{
    while (true) {
        if (closed_.load(std::memory_order_acquire)) {
            return unexpected_result<std::size_t>(ErrorCode::Cancelled, "socket closed");
        }
        auto ready = wait_ready(fd_, wake_fd_, POLLIN);
        if (!ready) {
            return std::unexpected(ready.error());
        }
        if (!*ready) {
            return unexpected_result<std::size_t>(ErrorCode::Cancelled, "socket closed");
        }
        ssize_t rc = ::recv(fd_, buffer.data(), buffer.size(), 0);
        if (rc < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN) {
                continue;
            }
            return unexpected_result<std::size_t>(make_errno_error("read", err));
        }
        if (rc == 0) {
            return unexpected_result<std::size_t>(ErrorCode::TransportError, "peer closed connection");
        }
        return static_cast<std::size_t>(rc);
    }
}

Result<void> Socket::write_all(std::span<const std::uint8_t> data)
{
    std::lock_guard lock(write_mutex_);
    std::size_t written = 0;
    while (written < data.size()) {
        if (closed_.load(std::memory_order_acquire)) {
            return unexpected_result(ErrorCode::TransportError, "socket closed");
        }
        ssize_t rc = ::send(fd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (rc < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            return unexpected_result(make_errno_error("write", err));
        }
        written += static_cast<std::size_t>(rc);
    }
    return {};
}

Listener::Listener(int fd, int wake_fd, Address address)
    : fd_(fd)
    , wake_fd_(wake_fd)
    , address_(std::move(address))
{
}

Listener::~Listener()
{
    close();
    if (fd_ >= 0) {
        ::close(fd_);
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
    if (address_.kind == Address::Kind::Unix) {
        ::unlink(address_.path.c_str());
    }
}

void Listener::close()
{
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    signal_wake(wake_fd_);
}

Result<std::shared_ptr<Socket>> Listener::accept()
{
    while (true) {
        if (closed_.load(std::memory_order_acquire)) {
            return unexpected_result<std::shared_ptr<Socket>>(ErrorCode::Cancelled, "listener closed");
        }
        auto ready = wait_ready(fd_, wake_fd_, POLLIN);
        if (!ready) {
            return std::unexpected(ready.error());
        }
        if (!*ready) {
            return unexpected_result<std::shared_ptr<Socket>>(ErrorCode::Cancelled, "listener closed");
        }
        int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN || err == ECONNABORTED) {
                continue;
            }
            return unexpected_result<std::shared_ptr<Socket>>(make_errno_error("accept", err));
        }
        if (address_.kind == Address::Kind::Tcp) {
            int one = 1;
            ::setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        }
        return wrap_fd(client);
    }
}

Result<std::shared_ptr<Listener>> listen(const Address& address)
{
    int fd = -1;
    Address bound = address;

    if (address.kind == Address::Kind::Unix) {
        auto addr = make_unix_address(address.path);
        if (!addr) {
            return std::unexpected(addr.error());
        }
        fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return unexpected_result<std::shared_ptr<Listener>>(make_errno_error("socket", errno));
        }
        ::unlink(address.path.c_str());
        if (::bind(fd, reinterpret_cast<sockaddr*>(&*addr), sizeof(*addr)) < 0) {
            int err = errno;
            ::close(fd);
            return unexpected_result<std::shared_ptr<Listener>>(make_errno_error("bind " + address.to_string(), err));
        }
    } else {
        auto info = resolve(address, true);
        if (!info) {
            return std::unexpected(info.error());
        }
        int last_err = 0;
        for (auto* ai = info->get(); ai != nullptr; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) {
                last_err = errno;
                continue;
            }
            int one = 1;
            ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
            if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
                break;
            }
            last_err = errno;
            ::close(fd);
            fd = -1;
        }
        if (fd < 0) {
            return unexpected_result<std::shared_ptr<Listener>>(make_errno_error("bind " + address.to_string(), last_err));
        }
        sockaddr_storage storage{};
        socklen_t len = sizeof(storage);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&storage), &len) == 0) {
            if (storage.ss_family == AF_INET) {
                bound.port = ntohs(reinterpret_cast<sockaddr_in*>(&storage)->sin_port);
            } else if (storage.ss_family == AF_INET6) {
                bound.port = ntohs(reinterpret_cast<sockaddr_in6*>(&storage)->sin6_port);
            }
        }
    }

    if (::listen(fd, SOMAXCONN) < 0) {
        int err = errno;
        ::close(fd);
        return unexpected_result<std::shared_ptr<Listener>>(make_errno_error("listen", err));
    }
    int wake_fd = make_wake_fd();
    if (wake_fd < 0) {
        int err = errno;
        ::close(fd);
        return unexpected_result<std::shared_ptr<Listener>>(make_errno_error("eventfd", err));
    }
    return std::shared_ptr<Listener>(new Listener(fd, wake_fd, std::move(bound)));
}

Result<std::shared_ptr<Socket>> connect(const Address& address, std::chrono::milliseconds timeout)
{
    if (address.kind == Address::Kind::Unix) {
        auto addr = make_unix_address(address.path);
        if (!addr) {
            return std::unexpected(addr.error());
        }
        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return unexpected_result<std::shared_ptr<Socket>>(make_errno_error("socket", errno));
        }
        if (::connect(fd, reinterpret_cast<sockaddr*>(&*addr), sizeof(*addr)) < 0) {
            int err = errno;
            ::close(fd);
            return unexpected_result<std::shared_ptr<Socket>>(
                make_error(ErrorCode::ConnectionError, make_errno_error("connect " + address.to_string(), err).message));
        }
        return wrap_fd(fd);
    }

    auto info = resolve(address, false);
    if (!info) {
        return std::unexpected(info.error());
    }
    Error last = make_error(ErrorCode::ConnectionError, "no usable address for " + address.to_string());
    for (auto* ai = info->get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last = make_errno_error("socket", errno);
            continue;
        }
        set_cloexec(fd);
        auto res = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout);
        if (!res) {
            last = make_error(ErrorCode::ConnectionError, "connect " + address.to_string() + ": " + res.error().message);
            ::close(fd);
            continue;
        }
        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        return wrap_fd(fd);
    }
    return unexpected_result<std::shared_ptr<Socket>>(std::move(last));
}

Result<std::pair<std::shared_ptr<Socket>, std::shared_ptr<Socket>>> socket_pair()
{
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        return unexpected_result<std::pair<std::shared_ptr<Socket>, std::shared_ptr<Socket>>>(
            make_errno_error("socketpair", errno));
    }

    auto first = wrap_fd(fds[0]);
    if (!first) {
        ::close(fds[1]);
        return std::unexpected(first.error());
    }

    auto second = wrap_fd(fds[1]);
    if (!second) {
        return std::unexpected(second.error());
    }

    return std::make_pair(*first, *second);
}

}  // namespace triple::runtime::net
