/**
 * \file message/FrameSender.hpp
 * \brief Writes frames and serialized messages to a connection.
 * \ingroup message_module
 */
#pragma once

#include "message/Frame.hpp"

#include <cstdint>
#include <span>

namespace transport { struct IConnection; }

namespace FrameMessenger::Messaging {

class IMessage;
class SerializationRegistry;

/**
 * \brief Frame writer.
 * \ingroup message_module
 * \details Header and payload are written as one buffer. Callers sharing a
 * connection between threads must serialize their sends.
 */
class FrameSender {
public:
    /**
     * \brief Write \p frame completely.
     * \throws std::system_error `connection_closed` when the connection is closed,
     *  `io_error` for any other failure.
     */
    static void send(transport::IConnection& connection, const Frame& frame);

    /** \brief Same as send(), without building a Frame first. */
    static void send(transport::IConnection& connection, std::uint16_t type_id,
                     std::span<const std::uint8_t> payload);

    /**
     * \brief Serialize \p message through \p registry and send it.
     * \throws std::system_error `unknown_type` if no serializer is registered,
     *  plus the send() errors.
     */
    static void send_message(transport::IConnection& connection, const SerializationRegistry& registry,
                             const IMessage& message);

private:
    FrameSender() = delete;
};

} // namespace FrameMessenger::Messaging
