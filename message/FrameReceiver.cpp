/**
 * \file message/FrameReceiver.cpp
 * \brief Header-then-payload frame assembly over IConnection::read.
 * \ingroup message_module
 */
#include "FrameReceiver.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/connection/IConnection.hpp"

#include <string>
#include <system_error>

namespace FrameMessenger::Messaging {

namespace {

using transport::transport_errc;

[[noreturn]] void throw_read_failure(const std::error_code& ec, const char* stage) {
    if (transport::is_expected_shutdown(ec)) {
        throw std::system_error(ec, std::string("FrameReceiver: ") + stage);
    }
    throw std::system_error(transport::make_error_code(transport_errc::io_error),
                            std::string("FrameReceiver: ") + stage + ": " + ec.message());
}

} // namespace

Frame FrameReceiver::receive(transport::IConnection& connection, const CancellationToken& cancel) const {
    Frame::HeaderBytes header_bytes{};
    std::error_code ec;
    transport::read_exact(connection, header_bytes.data(), header_bytes.size(), ec, cancel);
    if (ec) throw_read_failure(ec, "reading header");

    const FrameHeader header = Frame::decode_header(header_bytes);
    if (header.payload_length < 0) {
        throw std::system_error(transport::make_error_code(transport_errc::protocol_error),
                                "FrameReceiver: negative payload length " + std::to_string(header.payload_length) +
                                " for type " + std::to_string(header.type_id));
    }
    const auto length = static_cast<std::size_t>(header.payload_length);
    if (length > max_payload_size_) {
        throw std::system_error(transport::make_error_code(transport_errc::frame_too_large),
                                "FrameReceiver: payload of " + std::to_string(length) + " bytes exceeds limit " +
                                std::to_string(max_payload_size_));
    }

    std::vector<std::uint8_t> payload(length);
    if (length > 0) {
        transport::read_exact(connection, payload.data(), payload.size(), ec, cancel);
        if (ec) throw_read_failure(ec, "reading payload");
    }
    return Frame(header.type_id, std::move(payload));
}

} // namespace FrameMessenger::Messaging
