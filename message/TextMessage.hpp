/**
 * \file message/TextMessage.hpp
 * \brief UTF-8 text message used by the node binary.
 * \ingroup message_module
 */
#pragma once

#include "serialize/registry/IMessage.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace FrameMessenger::Messaging {

/** \brief Free-form text; the payload is the raw string bytes. */
class TextMessage : public IMessage {
public:
    static constexpr std::uint16_t kTypeId = 1;

    TextMessage() = default;
    explicit TextMessage(std::string text) : text_(std::move(text)) {}

    [[nodiscard]] std::uint16_t message_type_id() const noexcept override { return kTypeId; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    [[nodiscard]] std::vector<std::uint8_t> encode() const {
        return std::vector<std::uint8_t>(text_.begin(), text_.end());
    }

    [[nodiscard]] static std::shared_ptr<TextMessage> decode(std::span<const std::uint8_t> payload) {
        return std::make_shared<TextMessage>(std::string(payload.begin(), payload.end()));
    }

private:
    std::string text_;
};

} // namespace FrameMessenger::Messaging
