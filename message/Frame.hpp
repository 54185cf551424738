/**
 * \defgroup message_module Frame Module
 * \brief Wire framing shared by every connection backend.
 */

/**
 * \file message/Frame.hpp
 * \brief Frame value type and the little-endian header codec.
 * \ingroup message_module
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace FrameMessenger::Messaging {

/** \brief Decoded frame header. */
struct FrameHeader {
    std::uint16_t type_id;        ///< Message type discriminator
    std::int32_t payload_length;  ///< Bytes following the header; negative on the wire is a protocol error
};

/**
 * \brief One wire unit: a type discriminator and its payload.
 * \ingroup message_module
 *
 * Wire layout, little-endian, no padding:
 * | offset | width | field          |
 * |--------|-------|----------------|
 * | 0      | 2     | type_id        |
 * | 2      | 4     | payload_length |
 * | 6      | n     | payload        |
 */
class Frame {
public:
    static constexpr std::size_t kHeaderSize = 6;
    static constexpr std::size_t kDefaultMaxPayloadSize = 16u * 1024u * 1024u;

    using HeaderBytes = std::array<std::uint8_t, kHeaderSize>;

    Frame() = default;

    /**
     * \brief Construct a frame taking ownership of the payload.
     * \throws std::length_error if the payload does not fit the 32-bit length field.
     */
    Frame(std::uint16_t type_id, std::vector<std::uint8_t> payload)
        : type_id_(type_id), payload_(std::move(payload)) {
        if (payload_.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
            throw std::length_error("Frame payload exceeds protocol limits");
        }
    }

    [[nodiscard]] std::uint16_t type_id() const noexcept { return type_id_; }
    [[nodiscard]] std::size_t payload_size() const noexcept { return payload_.size(); }
    [[nodiscard]] std::span<const std::uint8_t> payload() const noexcept { return payload_; }

    /** \brief Move the payload out; the frame is left with an empty payload. */
    [[nodiscard]] std::vector<std::uint8_t> take_payload() noexcept { return std::move(payload_); }

    [[nodiscard]] HeaderBytes header_bytes() const noexcept {
        return encode_header(type_id_, static_cast<std::int32_t>(payload_.size()));
    }

    [[nodiscard]] static HeaderBytes encode_header(std::uint16_t type_id, std::int32_t payload_length) noexcept {
        const auto len = static_cast<std::uint32_t>(payload_length);
        return HeaderBytes{
            static_cast<std::uint8_t>(type_id & 0xFF),
            static_cast<std::uint8_t>((type_id >> 8) & 0xFF),
            static_cast<std::uint8_t>(len & 0xFF),
            static_cast<std::uint8_t>((len >> 8) & 0xFF),
            static_cast<std::uint8_t>((len >> 16) & 0xFF),
            static_cast<std::uint8_t>((len >> 24) & 0xFF),
        };
    }

    [[nodiscard]] static FrameHeader decode_header(std::span<const std::uint8_t, kHeaderSize> bytes) noexcept {
        const auto type_id = static_cast<std::uint16_t>(bytes[0] | (bytes[1] << 8));
        const std::uint32_t len = static_cast<std::uint32_t>(bytes[2]) |
                                  (static_cast<std::uint32_t>(bytes[3]) << 8) |
                                  (static_cast<std::uint32_t>(bytes[4]) << 16) |
                                  (static_cast<std::uint32_t>(bytes[5]) << 24);
        return FrameHeader{type_id, static_cast<std::int32_t>(len)};
    }

private:
    std::uint16_t type_id_{0};
    std::vector<std::uint8_t> payload_;
};

} // namespace FrameMessenger::Messaging
