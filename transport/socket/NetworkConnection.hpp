/**
 * \file NetworkConnection.hpp
 * \brief TCP implementation of IConnection on POSIX sockets.
 * \ingroup socket_backend
 * \details Wraps a connected stream socket, either handed over by
 * TcpAcceptLoop or produced by NetworkConnection::connect().
 */
#pragma once

#include "transport/connection/IConnection.hpp"
#include "transport/connection/DisconnectNotifier.hpp"
#include "transport/socket/SocketConfiguration.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <system_error>

class Logger;

namespace transport {

/** \brief Socket-backed connection.
 *  \ingroup socket_backend
 *  \details The descriptor stays open until destruction; close() only shuts the
 *  socket down. A reader blocked in poll() on another thread therefore never
 *  races with descriptor reuse.
 */
class NetworkConnection : public IConnection {
public:
    /** \brief Slice used by blocking waits to re-check cancellation. */
    static constexpr std::chrono::milliseconds kPollSlice{100};

    /**
     * \brief Take ownership of an already connected socket.
     * \param fd Connected socket descriptor (closed by the destructor).
     * \param endpoint Endpoint the socket was accepted on or connected to.
     * \param logger Optional logger for diagnostics.
     * \throws std::invalid_argument if \p fd is negative.
     */
    NetworkConnection(int fd, Endpoint endpoint, std::shared_ptr<Logger> logger = nullptr);

    ~NetworkConnection() override;

    NetworkConnection(const NetworkConnection&) = delete;
    NetworkConnection& operator=(const NetworkConnection&) = delete;

    /**
     * \brief Blocking client connect honouring `config.connect_timeout`.
     * \details Resolves the host, connects without blocking and polls for
     * completion in kPollSlice steps so \p cancel can interrupt it. On success
     * the socket configuration is applied (receive timeout only when
     * \p apply_receive_timeout).
     * \return Connected stream, or nullptr with \p error set.
     */
    static std::shared_ptr<NetworkConnection> connect(const Endpoint& endpoint,
                                                      const SocketConfiguration& config,
                                                      bool apply_receive_timeout,
                                                      std::error_code& error,
                                                      std::shared_ptr<Logger> logger = nullptr,
                                                      const CancellationToken& cancel = {});

    /**
     * \brief Apply TCP_NODELAY, buffer sizes and timeouts.
     * \param config Values to apply.
     * \param apply_receive_timeout false leaves the socket without a receive timeout.
     * \return true if every option was accepted by the kernel (failures are logged).
     */
    bool apply_configuration(const SocketConfiguration& config, bool apply_receive_timeout);

    // IConnection
    void read(void* buffer, std::size_t size, std::size_t& bytes_read,
              std::error_code& error, const CancellationToken& cancel) override;
    void write(const void* buffer, std::size_t size, std::size_t& bytes_written,
               std::error_code& error) override;
    void close() override;
    bool is_open() const override;
    void on_disconnected(std::function<void()> callback) override;
    const Endpoint& endpoint() const override { return endpoint_; }
    std::string local_endpoint() const override;
    std::string remote_endpoint() const override;
    std::string transport_name() const override { return "tcp"; }

    // === Socket diagnostics ===
    /** \brief TCP_NODELAY as reported by the kernel. */
    bool no_delay() const;
    /** \brief SO_SNDBUF value requested through apply_configuration() (0 if never applied). */
    int send_buffer_size() const { return send_buffer_size_.load(); }
    /** \brief SO_RCVBUF value requested through apply_configuration() (0 if never applied). */
    int receive_buffer_size() const { return receive_buffer_size_.load(); }
    /** \brief SO_SNDBUF as reported by the kernel (Linux reports twice the request). */
    int kernel_send_buffer_size() const;
    /** \brief SO_RCVBUF as reported by the kernel. */
    int kernel_receive_buffer_size() const;
    std::chrono::milliseconds send_timeout() const { return std::chrono::milliseconds(send_timeout_ms_.load()); }
    /** \brief Effective receive timeout; zero when the node type policy did not apply one. */
    std::chrono::milliseconds receive_timeout() const { return std::chrono::milliseconds(receive_timeout_ms_.load()); }

private:
    /** \brief Record a fatal stream condition and notify observers once. */
    void mark_disconnected();

    bool set_int_option(int level, int option, int value, const char* label);
    bool set_timeout_option(int option, std::chrono::milliseconds timeout, const char* label);
    int get_int_option(int level, int option) const;

    const int fd_;
    const Endpoint endpoint_;
    std::shared_ptr<Logger> logger_;
    DisconnectNotifier disconnect_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> peer_closed_{false};

    std::atomic<int> send_buffer_size_{0};
    std::atomic<int> receive_buffer_size_{0};
    std::atomic<long long> send_timeout_ms_{0};
    std::atomic<long long> receive_timeout_ms_{0};
};

} // namespace transport
