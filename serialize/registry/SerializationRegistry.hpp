/**
 * @file serialize/registry/SerializationRegistry.hpp
 * @brief Maps frame type ids to message serializers and deserializers.
 */
#pragma once

#include "IMessage.hpp"
#include "IMessageSerializer.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

class Logger;

namespace FrameMessenger::Messaging {

/**
 * @brief Thread-safe type_id -> (serializer, deserializer) directory.
 *
 * Registration is additive: registering a type id again replaces the previous
 * entry, there is no removal apart from clear(). Lookups copy the entry out
 * under the lock and run the (de)serializer outside it.
 *
 * Can be used as a singleton via instance() or instantiated directly for testing.
 */
class SerializationRegistry {
public:
    explicit SerializationRegistry(std::shared_ptr<Logger> logger = nullptr);

    /** @brief Process-wide default registry. */
    static SerializationRegistry& instance();

    SerializationRegistry(const SerializationRegistry&) = delete;
    SerializationRegistry& operator=(const SerializationRegistry&) = delete;
    SerializationRegistry(SerializationRegistry&&) = delete;
    SerializationRegistry& operator=(SerializationRegistry&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /** @brief Register both directions for @p type_id (last writer wins). */
    void register_type(std::uint16_t type_id,
                       std::shared_ptr<IMessageSerializer> serializer,
                       std::shared_ptr<IMessageDeserializer> deserializer);

    void register_serializer(std::uint16_t type_id, std::shared_ptr<IMessageSerializer> serializer);
    void register_deserializer(std::uint16_t type_id, std::shared_ptr<IMessageDeserializer> deserializer);

    /** @brief Register MessageCodec<MessageT> under MessageT::kTypeId. */
    template <typename MessageT>
    void register_message_type() {
        auto codec = std::make_shared<MessageCodec<MessageT>>();
        register_type(MessageT::kTypeId, codec, codec);
    }

    // =========================================================================
    // Conversion
    // =========================================================================

    /**
     * @brief Build a message from a frame payload.
     * @throws std::system_error `unknown_type` if no deserializer is registered,
     *  `malformed_payload` if the deserializer throws or returns nullptr.
     */
    [[nodiscard]] std::shared_ptr<IMessage> deserialize(std::uint16_t type_id,
                                                        std::span<const std::uint8_t> payload) const;

    /**
     * @brief Encode @p message with the serializer registered for its type id.
     * @throws std::system_error `unknown_type` if none is registered.
     */
    [[nodiscard]] std::vector<std::uint8_t> serialize(const IMessage& message) const;

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] bool has_serializer(std::uint16_t type_id) const;
    [[nodiscard]] bool has_deserializer(std::uint16_t type_id) const;

    /** @brief Type ids with at least one direction registered. */
    [[nodiscard]] std::vector<std::uint16_t> type_ids() const;

    /** @brief Drop every entry (primarily for testing). */
    void clear();

    void set_logger(std::shared_ptr<Logger> logger);

private:
    struct Entry {
        std::shared_ptr<IMessageSerializer> serializer;
        std::shared_ptr<IMessageDeserializer> deserializer;
    };

    void log_debug(const std::string& message) const;

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::uint16_t, Entry> entries_;
};

} // namespace FrameMessenger::Messaging
