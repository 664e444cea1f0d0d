#pragma once

#include "fts/core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fts::network {

using socket_t = int;
constexpr socket_t INVALID_SOCKET_VALUE = -1;

/**
 * @brief Blocking TCP socket (POSIX)
 *
 * Failures come back as IOFailure errors carrying the errno text; callers
 * decide what a failure means for them (the remote endpoint treats every
 * socket failure as transient).
 */
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    Result<void> create();
    Result<void> bind(const std::string& address, uint16_t port);
    Result<void> listen(int backlog = 16);
    Result<std::unique_ptr<Socket>> accept();

    /**
     * @brief Resolve host (name or IPv4 literal) and connect, giving up after timeout_ms
     *
     * Creates the socket when needed.
     */
    Result<void> connect(const std::string& host, uint16_t port, int timeout_ms);

    /// SO_RCVTIMEO / SO_SNDTIMEO; a timed-out call fails instead of blocking forever.
    Result<void> set_timeouts(int timeout_ms);
    Result<void> set_reuse_address(bool enable);

    /// Sends every byte or fails.
    Result<void> send_all(const std::vector<uint8_t>& data);

    /// Up to max_size bytes; an empty vector means the peer closed the connection.
    Result<std::vector<uint8_t>> receive(size_t max_size);

    /// Port the socket is bound to (useful after binding port 0).
    Result<uint16_t> local_port() const;

    void close();
    bool is_valid() const { return socket_ != INVALID_SOCKET_VALUE; }

    socket_t native_handle() const { return socket_; }

private:
    explicit Socket(socket_t socket);

    socket_t socket_;
};

} // namespace fts::network
