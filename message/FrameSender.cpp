/**
 * \file message/FrameSender.cpp
 * \brief Frame encoding onto IConnection::write.
 * \ingroup message_module
 */
#include "FrameSender.hpp"
#include "serialize/registry/SerializationRegistry.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/connection/IConnection.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace FrameMessenger::Messaging {

void FrameSender::send(transport::IConnection& connection, const Frame& frame) {
    send(connection, frame.type_id(), frame.payload());
}

void FrameSender::send(transport::IConnection& connection, std::uint16_t type_id,
                       std::span<const std::uint8_t> payload) {
    if (payload.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        throw std::length_error("FrameSender: payload exceeds protocol limits");
    }
    const auto header = Frame::encode_header(type_id, static_cast<std::int32_t>(payload.size()));
    std::vector<std::uint8_t> wire;
    wire.reserve(header.size() + payload.size());
    wire.insert(wire.end(), header.begin(), header.end());
    wire.insert(wire.end(), payload.begin(), payload.end());

    std::error_code ec;
    transport::write_all(connection, wire.data(), wire.size(), ec);
    if (!ec) return;
    if (ec == transport::transport_errc::connection_closed) {
        throw std::system_error(ec, "FrameSender: type_id=" + std::to_string(type_id));
    }
    throw std::system_error(transport::make_error_code(transport::transport_errc::io_error),
                            "FrameSender: type_id=" + std::to_string(type_id) + ": " + ec.message());
}

void FrameSender::send_message(transport::IConnection& connection, const SerializationRegistry& registry,
                               const IMessage& message) {
    const auto payload = registry.serialize(message);
    send(connection, message.message_type_id(), payload);
}

} // namespace FrameMessenger::Messaging
