/**
 * @file serialize/registry/IMessage.hpp
 * @brief Base interface of every typed message carried in a frame.
 */
#pragma once

#include <cstdint>

namespace FrameMessenger::Messaging {

/**
 * @brief Application message with a wire type discriminator.
 *
 * The discriminator selects the serializer when sending and is written as the
 * frame's type_id; the receiver uses it to pick the deserializer.
 */
class IMessage {
public:
    virtual ~IMessage() = default;

    [[nodiscard]] virtual std::uint16_t message_type_id() const noexcept = 0;
};

} // namespace FrameMessenger::Messaging
