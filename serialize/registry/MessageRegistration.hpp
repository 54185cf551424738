/**
 * @file serialize/registry/MessageRegistration.hpp
 * @brief Self-registration helper for message types.
 *
 * Provides the REGISTER_MESSAGE_TYPE macro so a message type can add itself to
 * SerializationRegistry::instance() during static initialization.
 */
#pragma once

#include "SerializationRegistry.hpp"

namespace FrameMessenger::Messaging {

/**
 * @brief Registers MessageT with the global registry from its constructor.
 *
 * Create a static instance to register before main() runs.
 */
template <typename MessageT>
class MessageRegistration {
public:
    MessageRegistration() {
        SerializationRegistry::instance().register_message_type<MessageT>();
    }
};

} // namespace FrameMessenger::Messaging

/**
 * @def REGISTER_MESSAGE_TYPE
 * @brief Register a message type (see MessageCodec for its requirements).
 *
 * Usage, in a source file linked into the executable:
 * @code
 * REGISTER_MESSAGE_TYPE(FrameMessenger::Messaging::TextMessage);
 * @endcode
 */
#define MESSAGE_REG_CONCAT_IMPL(a, b) a##b
#define MESSAGE_REG_CONCAT(a, b) MESSAGE_REG_CONCAT_IMPL(a, b)

#define REGISTER_MESSAGE_TYPE(type) \
    static ::FrameMessenger::Messaging::MessageRegistration<type> \
        MESSAGE_REG_CONCAT(_message_registration_, __COUNTER__)
