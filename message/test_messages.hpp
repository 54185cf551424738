// test_messages.hpp - message types shared by the unit tests
#pragma once

#include "message/TextMessage.hpp"
#include "serialize/registry/IMessage.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace FrameMessenger::Messaging::test_support {

/** \brief Fixed 4-byte little-endian counter; any other payload size is rejected. */
class CounterMessage : public IMessage {
public:
    static constexpr std::uint16_t kTypeId = 2;

    explicit CounterMessage(std::uint32_t value = 0) : value_(value) {}

    [[nodiscard]] std::uint16_t message_type_id() const noexcept override { return kTypeId; }
    [[nodiscard]] std::uint32_t value() const noexcept { return value_; }

    [[nodiscard]] std::vector<std::uint8_t> encode() const {
        return {static_cast<std::uint8_t>(value_ & 0xFF), static_cast<std::uint8_t>((value_ >> 8) & 0xFF),
                static_cast<std::uint8_t>((value_ >> 16) & 0xFF), static_cast<std::uint8_t>((value_ >> 24) & 0xFF)};
    }

    [[nodiscard]] static std::shared_ptr<CounterMessage> decode(std::span<const std::uint8_t> payload) {
        if (payload.size() != 4) return nullptr;
        const std::uint32_t v = static_cast<std::uint32_t>(payload[0]) |
                                (static_cast<std::uint32_t>(payload[1]) << 8) |
                                (static_cast<std::uint32_t>(payload[2]) << 16) |
                                (static_cast<std::uint32_t>(payload[3]) << 24);
        return std::make_shared<CounterMessage>(v);
    }

private:
    std::uint32_t value_;
};

/** \brief Type id that no test registers. */
constexpr std::uint16_t kUnregisteredTypeId = 0x7F7F;

} // namespace FrameMessenger::Messaging::test_support
