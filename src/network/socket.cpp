#include "fts/network/socket.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace fts::network {
namespace {

Error socket_error(const std::string& what) {
    return Error::io_failure(what + ": " + std::strerror(errno));
}

Result<void> set_blocking(socket_t fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return Err<void>(socket_error("Failed to get socket flags"));
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (fcntl(fd, F_SETFL, flags) == -1) {
        return Err<void>(socket_error("Failed to set socket flags"));
    }
    return Ok();
}

} // namespace

Socket::Socket() : socket_(INVALID_SOCKET_VALUE) {}

Socket::Socket(socket_t socket) : socket_(socket) {}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : socket_(other.socket_) {
    other.socket_ = INVALID_SOCKET_VALUE;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        other.socket_ = INVALID_SOCKET_VALUE;
    }
    return *this;
}

Result<void> Socket::create() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        return Err<void>(Error::invalid_operation("Socket already created"));
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(socket_error("Failed to create socket"));
    }

    spdlog::debug("Socket created: fd={}", socket_);
    return Ok();
}

Result<void> Socket::bind(const std::string& address, uint16_t port) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(Error::invalid_operation("Socket not created"));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) <= 0) {
        return Err<void>(Error::invalid_argument("Invalid address: " + address));
    }

    if (::bind(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Err<void>(socket_error("Failed to bind to " + address + ":" + std::to_string(port)));
    }

    spdlog::debug("Socket bound to {}:{}", address, port);
    return Ok();
}

Result<void> Socket::listen(int backlog) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(Error::invalid_operation("Socket not created"));
    }
    if (::listen(socket_, backlog) < 0) {
        return Err<void>(socket_error("Failed to listen"));
    }
    return Ok();
}

Result<std::unique_ptr<Socket>> Socket::accept() {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<std::unique_ptr<Socket>>(Error::invalid_operation("Socket not created"));
    }

    sockaddr_in client_addr{};
    socklen_t addr_len = sizeof(client_addr);
    socket_t client = ::accept(socket_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
    if (client == INVALID_SOCKET_VALUE) {
        return Err<std::unique_ptr<Socket>>(socket_error("Failed to accept connection"));
    }

    char addr_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_addr.sin_addr, addr_str, INET_ADDRSTRLEN);
    spdlog::debug("Accepted connection from {}:{}", addr_str, ntohs(client_addr.sin_port));

    return Ok(std::unique_ptr<Socket>(new Socket(client)));
}

Result<void> Socket::connect(const std::string& host, uint16_t port, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* resolved = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
        return Err<void>(Error::io_failure("Failed to resolve " + host + ": " + gai_strerror(rc)));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(resolved, &::freeaddrinfo);

    if (socket_ == INVALID_SOCKET_VALUE) {
        auto created = create();
        if (created.is_error()) {
            return created;
        }
    }

    auto nonblocking = set_blocking(socket_, false);
    if (nonblocking.is_error()) {
        return nonblocking;
    }

    if (::connect(socket_, resolved->ai_addr, resolved->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            return Err<void>(socket_error("Failed to connect to " + host + ":" + service));
        }

        pollfd pfd{};
        pfd.fd = socket_;
        pfd.events = POLLOUT;
        const int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready == 0) {
            return Err<void>(Error::io_failure("Timed out connecting to " + host + ":" + service));
        }
        if (ready < 0) {
            return Err<void>(socket_error("Failed waiting for connect to " + host + ":" + service));
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(socket_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            return Err<void>(socket_error("Failed to read connect status"));
        }
        if (so_error != 0) {
            return Err<void>(Error::io_failure("Failed to connect to " + host + ":" + service + ": " +
                                               std::strerror(so_error)));
        }
    }

    auto blocking = set_blocking(socket_, true);
    if (blocking.is_error()) {
        return blocking;
    }

    spdlog::debug("Connected to {}:{}", host, port);
    return Ok();
}

Result<void> Socket::set_timeouts(int timeout_ms) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(Error::invalid_operation("Socket not created"));
    }

    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return Err<void>(socket_error("Failed to set socket timeouts"));
    }
    return Ok();
}

Result<void> Socket::set_reuse_address(bool enable) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(Error::invalid_operation("Socket not created"));
    }

    int opt = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return Err<void>(socket_error("Failed to set SO_REUSEADDR"));
    }
    return Ok();
}

Result<void> Socket::send_all(const std::vector<uint8_t>& data) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(Error::invalid_operation("Socket not created"));
    }

    size_t offset = 0;
    while (offset < data.size()) {
        const auto sent = ::send(socket_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>(socket_error("Failed to send data"));
        }
        offset += static_cast<size_t>(sent);
    }
    return Ok();
}

Result<std::vector<uint8_t>> Socket::receive(size_t max_size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<std::vector<uint8_t>>(Error::invalid_operation("Socket not created"));
    }

    std::vector<uint8_t> buffer(max_size);
    while (true) {
        const auto received = ::recv(socket_, buffer.data(), max_size, 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return Err<std::vector<uint8_t>>(Error::io_failure("Timed out waiting for data"));
            }
            return Err<std::vector<uint8_t>>(socket_error("Failed to receive data"));
        }
        buffer.resize(static_cast<size_t>(received));
        return Ok(std::move(buffer));
    }
}

Result<uint16_t> Socket::local_port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return Err<uint16_t>(socket_error("Failed to read local address"));
    }
    return Ok(static_cast<uint16_t>(ntohs(addr.sin_port)));
}

void Socket::close() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        ::close(socket_);
        socket_ = INVALID_SOCKET_VALUE;
    }
}

} // namespace fts::network
