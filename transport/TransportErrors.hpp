/**
 * \file TransportErrors.hpp
 * \brief Error codes shared by the connection, frame and loop layers.
 * \ingroup transport_errors
 * \details Raw connection I/O reports these through `std::error_code&`
 * out-parameters; higher layers throw them as `std::system_error`.
 * Codes compare directly: `ec == transport::transport_errc::cancelled`.
 */
#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace transport {

/** \brief Transport failure taxonomy. */
enum class transport_errc {
    // Expected shutdown: loops exit quietly.
    connection_closed = 1,
    cancelled,
    // Per-frame: reported, loop continues.
    unknown_type,
    malformed_payload,
    // Connection-fatal: reported, loop exits.
    io_error,
    protocol_error,
    frame_too_large,
    // Configuration: thrown synchronously to the caller.
    already_bound,
    already_registered,
    not_listening,
    invalid_transport
};

/** \brief The "transport" error category singleton. */
const std::error_category& transport_category() noexcept;

std::error_code make_error_code(transport_errc e) noexcept;

/** \brief True for codes that mean the stream ended by request or by the peer. */
bool is_expected_shutdown(const std::error_code& ec) noexcept;

/** \brief True for per-frame failures that leave the connection usable. */
bool is_frame_recoverable(const std::error_code& ec) noexcept;

/** \brief Map a POSIX errno value to the closest portable `std::errc` code. */
std::error_code translate_errno(int err) noexcept;

/** \brief Throw `std::system_error` for \p code with context in the message. */
[[noreturn]] void throw_transport_error(transport_errc code, const std::string& what);

} // namespace transport

namespace std {
template <>
struct is_error_code_enum<transport::transport_errc> : true_type {};
} // namespace std
