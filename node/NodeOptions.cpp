// NodeOptions.cpp - Node options provider with auto-registration
#include "NodeOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace {
    std::mutex g_node_opts_mtx;
    std::string g_role = "loopback";
    std::string g_transport = "tcp";
    std::string g_host = "127.0.0.1";
    int g_port = 5555;
    std::string g_name = "frame-messenger";
    std::string g_node_type = "responder";
    int g_count = 10;
    std::size_t g_max_frame_size = 16u * 1024u * 1024u;
    std::atomic<bool> g_node_registered{false};

    void read_string(const nlohmann::json& section, const char* key, std::string& out) {
        if (section.contains(key) && section[key].is_string()) {
            out = section[key].get<std::string>();
        }
    }

    template <typename T>
    void read_number(const nlohmann::json& section, const char* key, T& out) {
        if (section.contains(key) && section[key].is_number_integer()) {
            out = section[key].get<T>();
        }
    }
}

namespace node_opts {

void register_options() {
    bool expected = false;
    if (!g_node_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        {
            std::lock_guard<std::mutex> lk(g_node_opts_mtx);
            if (j.contains("node") && j["node"].is_object()) {
                const auto& nj = j["node"];
                read_string(nj, "role", g_role);
                read_string(nj, "transport", g_transport);
                read_string(nj, "host", g_host);
                read_number(nj, "port", g_port);
                read_string(nj, "name", g_name);
                read_string(nj, "node_type", g_node_type);
                read_number(nj, "count", g_count);
                read_number(nj, "max_frame_size", g_max_frame_size);
            }
        }

        app.add_option("--role", g_role, "server, client or loopback (default loopback)")
            ->check(CLI::IsMember({"server", "client", "loopback"}, CLI::ignore_case))->group("Node");
        app.add_option("--transport", g_transport, "tcp or inproc (default tcp)")
            ->check(CLI::IsMember({"tcp", "inproc"}, CLI::ignore_case))->group("Node");
        app.add_option("--host", g_host, "Host to bind or connect (default 127.0.0.1)")->group("Node");
        app.add_option("--port", g_port, "TCP port, 0 = ephemeral for servers (default 5555)")
            ->check(CLI::Range(0, 65535))->group("Node");
        app.add_option("--name", g_name, "Endpoint name for the inproc transport")->group("Node");
        app.add_option("--node-type", g_node_type,
                       "Node type deciding the receive timeout policy (default responder)")->group("Node");
        app.add_option("--count", g_count, "Messages sent by the client (default 10)")
            ->check(CLI::PositiveNumber)->group("Node");
        app.add_option("--max-frame-size", g_max_frame_size, "Largest accepted frame payload in bytes")
            ->check(CLI::PositiveNumber)->group("Node");
    });
}

NodeOptions get_node_options() {
    std::lock_guard<std::mutex> lk(g_node_opts_mtx);
    NodeOptions opts;
    opts.role = parse_role(g_role);
    opts.transport = g_transport;
    opts.host = g_host;
    opts.port = g_port;
    opts.name = g_name;
    opts.node_type = g_node_type;
    opts.count = g_count;
    opts.max_frame_size = g_max_frame_size;
    return opts;
}

NodeRole parse_role(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "server") return NodeRole::Server;
    if (lower == "client") return NodeRole::Client;
    if (lower == "loopback") return NodeRole::Loopback;
    throw std::invalid_argument("unknown node role '" + text + "'");
}

std::string to_string(NodeRole role) {
    switch (role) {
        case NodeRole::Server: return "server";
        case NodeRole::Client: return "client";
        case NodeRole::Loopback: return "loopback";
        default: return "unknown";
    }
}

} // namespace node_opts

// Static auto-registration object
namespace {
    struct NodeOptsAutoReg {
        NodeOptsAutoReg() { node_opts::register_options(); }
    };
    [[maybe_unused]] static NodeOptsAutoReg s_node_auto_reg;
}
