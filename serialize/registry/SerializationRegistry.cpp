/**
 * @file serialize/registry/SerializationRegistry.cpp
 * @brief Implementation of the message SerializationRegistry.
 */
#include "SerializationRegistry.hpp"
#include "transport/TransportErrors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

namespace FrameMessenger::Messaging {

using transport::transport_errc;

SerializationRegistry& SerializationRegistry::instance() {
    static SerializationRegistry instance;
    return instance;
}

SerializationRegistry::SerializationRegistry(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
}

void SerializationRegistry::register_type(std::uint16_t type_id,
                                          std::shared_ptr<IMessageSerializer> serializer,
                                          std::shared_ptr<IMessageDeserializer> deserializer) {
    if (!serializer || !deserializer) {
        throw std::invalid_argument("SerializationRegistry: null serializer or deserializer");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[type_id] = Entry{std::move(serializer), std::move(deserializer)};
    log_debug("Registered type_id=" + std::to_string(type_id));
}

void SerializationRegistry::register_serializer(std::uint16_t type_id,
                                                std::shared_ptr<IMessageSerializer> serializer) {
    if (!serializer) throw std::invalid_argument("SerializationRegistry: null serializer");
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[type_id].serializer = std::move(serializer);
}

void SerializationRegistry::register_deserializer(std::uint16_t type_id,
                                                  std::shared_ptr<IMessageDeserializer> deserializer) {
    if (!deserializer) throw std::invalid_argument("SerializationRegistry: null deserializer");
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[type_id].deserializer = std::move(deserializer);
}

std::shared_ptr<IMessage> SerializationRegistry::deserialize(std::uint16_t type_id,
                                                             std::span<const std::uint8_t> payload) const {
    std::shared_ptr<IMessageDeserializer> deserializer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(type_id);
        if (it != entries_.end()) deserializer = it->second.deserializer;
    }
    if (!deserializer) {
        throw std::system_error(transport::make_error_code(transport_errc::unknown_type),
                                "no deserializer for type_id=" + std::to_string(type_id));
    }

    // Deserializers run outside the lock.
    std::shared_ptr<IMessage> message;
    try {
        message = deserializer->deserialize(payload);
    } catch (const std::exception& e) {
        throw std::system_error(transport::make_error_code(transport_errc::malformed_payload),
                                "type_id=" + std::to_string(type_id) + ": " + e.what());
    } catch (...) {
        throw std::system_error(transport::make_error_code(transport_errc::malformed_payload),
                                "type_id=" + std::to_string(type_id) + ": deserializer threw an unknown exception");
    }
    if (!message) {
        throw std::system_error(transport::make_error_code(transport_errc::malformed_payload),
                                "type_id=" + std::to_string(type_id) + ": " +
                                std::to_string(payload.size()) + " payload bytes rejected");
    }
    return message;
}

std::vector<std::uint8_t> SerializationRegistry::serialize(const IMessage& message) const {
    const auto type_id = message.message_type_id();
    std::shared_ptr<IMessageSerializer> serializer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(type_id);
        if (it != entries_.end()) serializer = it->second.serializer;
    }
    if (!serializer) {
        throw std::system_error(transport::make_error_code(transport_errc::unknown_type),
                                "no serializer for type_id=" + std::to_string(type_id));
    }
    return serializer->serialize(message);
}

bool SerializationRegistry::has_serializer(std::uint16_t type_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(type_id);
    return it != entries_.end() && it->second.serializer != nullptr;
}

bool SerializationRegistry::has_deserializer(std::uint16_t type_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(type_id);
    return it != entries_.end() && it->second.deserializer != nullptr;
}

std::vector<std::uint16_t> SerializationRegistry::type_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::uint16_t> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void SerializationRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void SerializationRegistry::set_logger(std::shared_ptr<Logger> logger) {
    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = std::move(logger);
}

void SerializationRegistry::log_debug(const std::string& message) const {
    if (logger_) {
        logger_->debug("[SerializationRegistry] " + message);
    }
}

} // namespace FrameMessenger::Messaging
