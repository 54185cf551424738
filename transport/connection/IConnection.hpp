/**
 * \file IConnection.hpp
 * \brief Transport-neutral connection interface.
 * \ingroup transport_connection
 * \details Accept loops, receive loops and the frame codec work only through
 * this interface, so the same logic runs over TCP sockets and in-process
 * virtual streams.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <system_error>

#include "cancellation.hpp"
#include "transport/endpoint/Endpoint.hpp"

namespace transport {

/**
 * \brief One established, bidirectional, ordered byte stream.
 * \ingroup transport_connection
 *
 * I/O never throws; failures are reported through \p error using the codes in
 * TransportErrors.hpp (end of stream is `transport_errc::connection_closed`,
 * cancellation is `transport_errc::cancelled`) or translated OS codes.
 */
struct IConnection {
    virtual ~IConnection() = default;

    /**
     * \brief Block until at least one byte is available, then read up to \p size bytes.
     * \param buffer Destination buffer.
     * \param size Maximum bytes to read (must be > 0).
     * \param bytes_read Out: bytes read; 0 whenever \p error is set.
     * \param error Cleared on success.
     * \param cancel Wakes the wait and fails it with `cancelled`.
     */
    virtual void read(void* buffer, std::size_t size, std::size_t& bytes_read,
                      std::error_code& error, const CancellationToken& cancel) = 0;

    /**
     * \brief Write some of \p size bytes; see write_all() for the looping form.
     */
    virtual void write(const void* buffer, std::size_t size, std::size_t& bytes_written,
                       std::error_code& error) = 0;

    /** \brief Close both directions. Idempotent; fires the disconnect notification. */
    virtual void close() = 0;

    /** \brief False once closed locally or once the peer's end of stream was observed. */
    virtual bool is_open() const = 0;

    /**
     * \brief Observe the one-shot disconnect event.
     * \details Each callback runs at most once. Subscribing after the event
     * already fired runs the callback immediately on the calling thread.
     */
    virtual void on_disconnected(std::function<void()> callback) = 0;

    /** \brief Endpoint this connection was accepted on or connected to. */
    virtual const Endpoint& endpoint() const = 0;

    virtual std::string local_endpoint() const = 0;
    virtual std::string remote_endpoint() const = 0;

    /** \brief Backend tag for diagnostics ("tcp", "virtual"). */
    virtual std::string transport_name() const = 0;
};

/**
 * \brief Write the whole buffer, looping over short writes.
 * \param error Set on the first failure; the remaining bytes are not sent.
 * \return Bytes written before success or failure.
 */
std::size_t write_all(IConnection& connection, const void* buffer, std::size_t size,
                      std::error_code& error);

/**
 * \brief Read exactly \p size bytes.
 * \details An end of stream after some but not all bytes is reported as
 * `connection_closed`, the same as an end of stream before the first byte.
 * \return Bytes read before success or failure.
 */
std::size_t read_exact(IConnection& connection, void* buffer, std::size_t size,
                       std::error_code& error, const CancellationToken& cancel);

} // namespace transport
