/**
 * \file TransportErrors.cpp
 * \brief Category implementation and errno translation.
 */
#include "TransportErrors.hpp"

#include <cerrno>

namespace transport {

namespace {

class TransportCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "transport"; }

    std::string message(int value) const override {
        switch (static_cast<transport_errc>(value)) {
            case transport_errc::connection_closed:  return "connection closed";
            case transport_errc::cancelled:          return "operation cancelled";
            case transport_errc::unknown_type:       return "no deserializer registered for message type";
            case transport_errc::malformed_payload:  return "message payload rejected by deserializer";
            case transport_errc::io_error:           return "transport I/O error";
            case transport_errc::protocol_error:     return "frame header violates the wire protocol";
            case transport_errc::frame_too_large:    return "frame payload exceeds the configured maximum";
            case transport_errc::already_bound:      return "accept loop already bound, unbind first";
            case transport_errc::already_registered: return "endpoint already has a registered accepter";
            case transport_errc::not_listening:      return "no accepter registered for endpoint";
            case transport_errc::invalid_transport:  return "endpoint transport not supported here";
            default:                                 return "unknown transport error";
        }
    }
};

} // namespace

const std::error_category& transport_category() noexcept {
    static const TransportCategory category;
    return category;
}

std::error_code make_error_code(transport_errc e) noexcept {
    return {static_cast<int>(e), transport_category()};
}

bool is_expected_shutdown(const std::error_code& ec) noexcept {
    return ec == transport_errc::connection_closed || ec == transport_errc::cancelled;
}

bool is_frame_recoverable(const std::error_code& ec) noexcept {
    return ec == transport_errc::unknown_type || ec == transport_errc::malformed_payload;
}

std::error_code translate_errno(int err) noexcept {
    switch (err) {
        case EINPROGRESS:
        case EALREADY:
            return std::make_error_code(std::errc::operation_in_progress);
        case EAGAIN:
#if defined(EWOULDBLOCK) && (EWOULDBLOCK != EAGAIN)
        case EWOULDBLOCK:
#endif
            return std::make_error_code(std::errc::resource_unavailable_try_again);
        case ECONNABORTED:
            return std::make_error_code(std::errc::connection_aborted);
        case ENETDOWN:
        case ENETUNREACH:
            return std::make_error_code(std::errc::network_unreachable);
        case ECONNREFUSED:
            return std::make_error_code(std::errc::connection_refused);
        case ETIMEDOUT:
            return std::make_error_code(std::errc::timed_out);
        case ECONNRESET:
            return std::make_error_code(std::errc::connection_reset);
        case EPIPE:
            return std::make_error_code(std::errc::broken_pipe);
        case EHOSTUNREACH:
            return std::make_error_code(std::errc::host_unreachable);
        case ENOTCONN:
            return std::make_error_code(std::errc::not_connected);
        case EADDRINUSE:
            return std::make_error_code(std::errc::address_in_use);
        case EADDRNOTAVAIL:
            return std::make_error_code(std::errc::address_not_available);
        case EBADF:
            return std::make_error_code(std::errc::bad_file_descriptor);
        case EINVAL:
            return std::make_error_code(std::errc::invalid_argument);
        case ENOMEM:
            return std::make_error_code(std::errc::not_enough_memory);
        case ENOBUFS:
            return std::make_error_code(std::errc::no_buffer_space);
        case EMFILE:
            return std::make_error_code(std::errc::too_many_files_open);
        case EISCONN:
            return std::make_error_code(std::errc::already_connected);
        default:
            return std::error_code(err, std::system_category());
    }
}

void throw_transport_error(transport_errc code, const std::string& what) {
    throw std::system_error(make_error_code(code), what);
}

} // namespace transport
