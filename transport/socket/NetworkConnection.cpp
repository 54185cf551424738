/**
 * \file NetworkConnection.cpp
 * \brief POSIX socket implementation of NetworkConnection.
 * \ingroup socket_backend
 */
#include "NetworkConnection.hpp"
#include "SocketAddress.hpp"
#include "transport/TransportErrors.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace transport {

namespace {

bool set_blocking(int fd, bool blocking) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, flags) == 0;
}

int poll_timeout(std::chrono::steady_clock::time_point deadline, bool has_deadline) {
    auto slice = NetworkConnection::kPollSlice;
    if (has_deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left < slice) slice = left;
        if (slice.count() < 0) slice = std::chrono::milliseconds(0);
    }
    return static_cast<int>(slice.count());
}

// Wait for an in-progress connect() to finish. Returns a cleared error on success.
std::error_code wait_connected(int fd, std::chrono::milliseconds timeout, const CancellationToken& cancel) {
    const bool has_deadline = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (cancel.is_cancelled()) return make_error_code(transport_errc::cancelled);
        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            return std::make_error_code(std::errc::timed_out);
        }
        pollfd pfd{fd, POLLOUT, 0};
        int rc = ::poll(&pfd, 1, poll_timeout(deadline, has_deadline));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return translate_errno(errno);
        }
        if (rc == 0) continue;
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            return translate_errno(errno);
        }
        if (so_error != 0) return translate_errno(so_error);
        return {};
    }
}

} // namespace

NetworkConnection::NetworkConnection(int fd, Endpoint endpoint, std::shared_ptr<Logger> logger)
    : fd_(fd), endpoint_(std::move(endpoint)), logger_(logger), disconnect_(logger) {
    if (fd_ < 0) {
        throw std::invalid_argument("NetworkConnection: invalid socket descriptor");
    }
}

NetworkConnection::~NetworkConnection() {
    ::close(fd_);
}

std::shared_ptr<NetworkConnection> NetworkConnection::connect(const Endpoint& endpoint,
                                                              const SocketConfiguration& config,
                                                              bool apply_receive_timeout,
                                                              std::error_code& error,
                                                              std::shared_ptr<Logger> logger,
                                                              const CancellationToken& cancel) {
    auto candidates = resolve_endpoint(endpoint, false, error);
    if (error) {
        if (logger) logger->error("NetworkConnection: cannot resolve " + endpoint.to_string() + ": " + error.message());
        return nullptr;
    }

    for (const auto& candidate : candidates) {
        int fd = ::socket(candidate.family, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
        if (fd < 0) {
            error = translate_errno(errno);
            continue;
        }
        if (!set_blocking(fd, false)) {
            error = translate_errno(errno);
            ::close(fd);
            continue;
        }
        int rc = ::connect(fd, candidate.addr(), candidate.length);
        if (rc < 0 && errno != EINPROGRESS) {
            error = translate_errno(errno);
            ::close(fd);
            continue;
        }
        error = rc == 0 ? std::error_code{} : wait_connected(fd, config.connect_timeout, cancel);
        if (!error && !set_blocking(fd, true)) {
            error = translate_errno(errno);
        }
        if (error) {
            ::close(fd);
            if (error == transport_errc::cancelled) break;
            continue;
        }

        auto connection = std::make_shared<NetworkConnection>(fd, endpoint, logger);
        connection->apply_configuration(config, apply_receive_timeout);
        if (logger) {
            logger->debug("NetworkConnection: connected to " + endpoint.to_string() +
                          " from " + connection->local_endpoint());
        }
        return connection;
    }

    if (logger && error != transport_errc::cancelled) {
        logger->error("NetworkConnection: connect to " + endpoint.to_string() + " failed: " + error.message());
    }
    return nullptr;
}

bool NetworkConnection::apply_configuration(const SocketConfiguration& config, bool apply_receive_timeout) {
    bool ok = true;
    ok &= set_int_option(IPPROTO_TCP, TCP_NODELAY, 1, "TCP_NODELAY");
    if (set_int_option(SOL_SOCKET, SO_SNDBUF, config.send_buffer_size, "SO_SNDBUF")) {
        send_buffer_size_ = config.send_buffer_size;
    } else {
        ok = false;
    }
    if (set_int_option(SOL_SOCKET, SO_RCVBUF, config.receive_buffer_size, "SO_RCVBUF")) {
        receive_buffer_size_ = config.receive_buffer_size;
    } else {
        ok = false;
    }
    if (set_timeout_option(SO_SNDTIMEO, config.send_timeout, "SO_SNDTIMEO")) {
        send_timeout_ms_ = config.send_timeout.count();
    } else {
        ok = false;
    }
    const auto receive_timeout = apply_receive_timeout ? config.receive_timeout : std::chrono::milliseconds(0);
    if (set_timeout_option(SO_RCVTIMEO, receive_timeout, "SO_RCVTIMEO")) {
        receive_timeout_ms_ = receive_timeout.count();
    } else {
        ok = false;
    }
    return ok;
}

void NetworkConnection::read(void* buffer, std::size_t size, std::size_t& bytes_read,
                             std::error_code& error, const CancellationToken& cancel) {
    bytes_read = 0;
    error.clear();
    const auto timeout = receive_timeout();
    const bool has_deadline = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (cancel.is_cancelled()) {
            error = make_error_code(transport_errc::cancelled);
            return;
        }
        if (closed_.load() || peer_closed_.load()) {
            error = make_error_code(transport_errc::connection_closed);
            return;
        }
        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            error = std::make_error_code(std::errc::timed_out);
            return;
        }

        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, poll_timeout(deadline, has_deadline));
        if (rc == 0) continue;
        if (rc < 0) {
            if (errno == EINTR) continue;
            error = translate_errno(errno);
            return;
        }
        if (pfd.revents & POLLNVAL) {
            error = make_error_code(transport_errc::connection_closed);
            return;
        }

        ssize_t n = ::recv(fd_, buffer, size, 0);
        if (n > 0) {
            bytes_read = static_cast<std::size_t>(n);
            return;
        }
        if (n == 0) {
            // Orderly shutdown from the peer, or our own close() shutting the socket down.
            peer_closed_ = true;
            error = make_error_code(transport_errc::connection_closed);
            mark_disconnected();
            return;
        }
        const int err = errno;
        if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK) continue;
        if (closed_.load()) {
            error = make_error_code(transport_errc::connection_closed);
            return;
        }
        error = translate_errno(err);
        mark_disconnected();
        return;
    }
}

void NetworkConnection::write(const void* buffer, std::size_t size, std::size_t& bytes_written,
                              std::error_code& error) {
    bytes_written = 0;
    error.clear();
    while (true) {
        if (closed_.load()) {
            error = make_error_code(transport_errc::connection_closed);
            return;
        }
        ssize_t n = ::send(fd_, buffer, size, MSG_NOSIGNAL);
        if (n >= 0) {
            bytes_written = static_cast<std::size_t>(n);
            return;
        }
        const int err = errno;
        if (err == EINTR) continue;
        if (err == EAGAIN || err == EWOULDBLOCK) {
            // SO_SNDTIMEO expired.
            error = std::make_error_code(std::errc::timed_out);
            return;
        }
        error = translate_errno(err);
        if (err == EPIPE || err == ECONNRESET || err == ENOTCONN) {
            peer_closed_ = true;
            mark_disconnected();
        }
        return;
    }
}

void NetworkConnection::close() {
    if (closed_.exchange(true)) return;
    // Wakes readers polling this socket; the descriptor itself is released in the destructor.
    ::shutdown(fd_, SHUT_RDWR);
    if (logger_) logger_->debug("NetworkConnection: closed " + endpoint_.to_string());
    mark_disconnected();
}

bool NetworkConnection::is_open() const {
    return !closed_.load() && !peer_closed_.load();
}

void NetworkConnection::on_disconnected(std::function<void()> callback) {
    disconnect_.subscribe(std::move(callback));
}

std::string NetworkConnection::local_endpoint() const {
    sockaddr_storage storage{};
    socklen_t len = sizeof(storage);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&storage), &len) < 0) return "";
    return format_sockaddr(reinterpret_cast<sockaddr*>(&storage));
}

std::string NetworkConnection::remote_endpoint() const {
    sockaddr_storage storage{};
    socklen_t len = sizeof(storage);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&storage), &len) < 0) return "";
    return format_sockaddr(reinterpret_cast<sockaddr*>(&storage));
}

bool NetworkConnection::no_delay() const {
    return get_int_option(IPPROTO_TCP, TCP_NODELAY) != 0;
}

int NetworkConnection::kernel_send_buffer_size() const {
    return get_int_option(SOL_SOCKET, SO_SNDBUF);
}

int NetworkConnection::kernel_receive_buffer_size() const {
    return get_int_option(SOL_SOCKET, SO_RCVBUF);
}

void NetworkConnection::mark_disconnected() {
    if (disconnect_.fire() && logger_) {
        logger_->debug("NetworkConnection: disconnected " + endpoint_.to_string());
    }
}

bool NetworkConnection::set_int_option(int level, int option, int value, const char* label) {
    if (::setsockopt(fd_, level, option, &value, sizeof(value)) < 0) {
        if (logger_) {
            logger_->warning(std::string("NetworkConnection: setsockopt ") + label + " failed: " +
                             std::strerror(errno));
        }
        return false;
    }
    return true;
}

bool NetworkConnection::set_timeout_option(int option, std::chrono::milliseconds timeout, const char* label) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd_, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
        if (logger_) {
            logger_->warning(std::string("NetworkConnection: setsockopt ") + label + " failed: " +
                             std::strerror(errno));
        }
        return false;
    }
    return true;
}

int NetworkConnection::get_int_option(int level, int option) const {
    int value = 0;
    socklen_t len = sizeof(value);
    if (::getsockopt(fd_, level, option, &value, &len) < 0) return -1;
    return value;
}

} // namespace transport
