#pragma once

#include "triple/runtime/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace triple::runtime::net
{

struct Address {
    enum class Kind { Tcp, Unix };

    Kind kind = Kind::Tcp;
    std::string host;
    std::uint16_t port = 0;
    std::string path;

    std::string to_string() const;
};

// "host:port", "[v6]:port" or "unix:/path". Anything else is a ConfigError.
Result<Address> parse_address(std::string_view text);

/**
 * @brief Connected stream socket.
 *
 * Reads and writes may run on different threads. close() wakes a blocked
 * reader, which then fails with Cancelled; the descriptor itself is released
 * by the destructor.
 */
class Socket
{
public:
    explicit Socket(int fd);
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    // Blocks until at least one byte is available.
    Result<std::size_t> read_some(std::span<std::uint8_t> buffer);
    Result<void> write_all(std::span<const std::uint8_t> data);
    void close();
    bool is_open() const { return !closed_.load(std::memory_order_acquire); }

private:
    int fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> closed_{false};
    std::mutex write_mutex_;
};

class Listener
{
public:
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Blocks until a peer connects or close() is called.
    Result<std::shared_ptr<Socket>> accept();
    void close();

    // Bound address; for TCP the port is the one actually assigned.
    const Address& address() const { return address_; }

private:
    friend Result<std::shared_ptr<Listener>> listen(const Address& address);
    Listener(int fd, int wake_fd, Address address);

    int fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> closed_{false};
    Address address_;
};

Result<std::shared_ptr<Listener>> listen(const Address& address);
Result<std::shared_ptr<Socket>> connect(const Address& address, std::chrono::milliseconds timeout);
Result<std::pair<std::shared_ptr<Socket>, std::shared_ptr<Socket>>> socket_pair();

}  // namespace triple::runtime::net
