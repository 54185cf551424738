/**
 * \file node/NodeOptions.hpp
 * \brief Options of the frame-messenger node binary.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/** \brief What the node does once started. */
enum class NodeRole {
    Server,   ///< Bind and echo every message back on its connection.
    Client,   ///< Connect, send `count` messages and wait for the echoes.
    Loopback  ///< Server and client in one process (the only useful mode for inproc).
};

/** \brief Aggregated node configuration. */
struct NodeOptions {
    NodeRole role{NodeRole::Loopback};
    std::string transport{"tcp"};      ///< "tcp" or "inproc".
    std::string host{"127.0.0.1"};     ///< TCP host to bind or connect.
    int port{5555};                    ///< TCP port (0 = ephemeral when binding).
    std::string name{"frame-messenger"}; ///< Virtual endpoint name.
    std::string node_type{"responder"};  ///< See transport::parse_node_type().
    int count{10};                     ///< Messages sent by the client.
    std::size_t max_frame_size{16u * 1024u * 1024u};
};

namespace node_opts {

/**
 * \brief Register node options (JSON section "node", flags in group "Node").
 * \details Safe to call multiple times.
 */
void register_options();

/** \brief Snapshot of the parsed node options. */
NodeOptions get_node_options();

NodeRole parse_role(const std::string& text);

std::string to_string(NodeRole role);

} // namespace node_opts
