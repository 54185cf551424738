/**
 * @file serialize/registry/IMessageSerializer.hpp
 * @brief Serializer/deserializer interfaces and the typed codec adapter.
 */
#pragma once

#include "IMessage.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <vector>

namespace FrameMessenger::Messaging {

/** @brief Turns one message type into payload bytes. */
class IMessageSerializer {
public:
    virtual ~IMessageSerializer() = default;

    /** @throws std::invalid_argument if @p message is not of the expected type. */
    [[nodiscard]] virtual std::vector<std::uint8_t> serialize(const IMessage& message) const = 0;
};

/** @brief Rebuilds one message type from payload bytes. */
class IMessageDeserializer {
public:
    virtual ~IMessageDeserializer() = default;

    /**
     * @brief Parse @p payload.
     * @return The message, or nullptr if the bytes are not a valid encoding.
     * Throwing is also accepted as a rejection.
     */
    [[nodiscard]] virtual std::shared_ptr<IMessage> deserialize(std::span<const std::uint8_t> payload) const = 0;
};

/**
 * @brief Serializer and deserializer for a message type that knows its own encoding.
 *
 * @tparam MessageT Must derive from IMessage and provide
 *  `static constexpr std::uint16_t kTypeId`,
 *  `std::vector<std::uint8_t> encode() const` and
 *  `static std::shared_ptr<MessageT> decode(std::span<const std::uint8_t>)`.
 */
template <typename MessageT>
class MessageCodec : public IMessageSerializer, public IMessageDeserializer {
public:
    [[nodiscard]] std::vector<std::uint8_t> serialize(const IMessage& message) const override {
        const auto* typed = dynamic_cast<const MessageT*>(&message);
        if (!typed) {
            throw std::invalid_argument("MessageCodec: message type mismatch");
        }
        return typed->encode();
    }

    [[nodiscard]] std::shared_ptr<IMessage> deserialize(std::span<const std::uint8_t> payload) const override {
        return MessageT::decode(payload);
    }
};

} // namespace FrameMessenger::Messaging
