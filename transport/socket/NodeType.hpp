/**
 * \file NodeType.hpp
 * \brief Messaging node roles and the socket policy derived from them.
 * \ingroup socket_backend
 */
#pragma once

#include <optional>
#include <string>

namespace transport {

/** \brief Role of the node owning a connection. */
enum class NodeType {
    Requester,
    Responder,
    Publisher,
    Subscriber,
    ServiceQueue,
    ServiceQueueReader,
    ServiceQueueWriter
};

/**
 * \brief Whether sockets of this node type get the configured receive timeout.
 * \details Only roles that wait for an answer with a deadline (a requester
 * awaiting its response, a queue reader awaiting a work item) apply it. Server
 * roles and streaming roles wait indefinitely for the next frame.
 */
bool node_type_has_receive_timeout(NodeType type) noexcept;

std::string to_string(NodeType type);

/** \brief Case-insensitive parse of the names produced by to_string(). */
std::optional<NodeType> parse_node_type(const std::string& text);

} // namespace transport
