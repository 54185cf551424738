// nodeMain.cpp - frame-messenger node: echo server, client, or both in one process.
#include "NodeOptions.hpp"
#include "message/FrameSender.hpp"
#include "message/TextMessage.hpp"
#include "options/Options.hpp"
#include "serialize/registry/MessageRegistration.hpp"
#include "session/ReceiveLoop.hpp"
#include "transport/ConnectionFactory.hpp"
#include "transport/accept/TcpAcceptLoop.hpp"
#include "transport/socket/SocketConfigurationOptions.hpp"
#include "transport/virtual/VirtualTransportRegistry.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using FrameMessenger::Messaging::FrameReceiver;
using FrameMessenger::Messaging::FrameSender;
using FrameMessenger::Messaging::IMessage;
using FrameMessenger::Messaging::SerializationRegistry;
using FrameMessenger::Messaging::TextMessage;

REGISTER_MESSAGE_TYPE(TextMessage);

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

/** \brief Accepts connections and echoes every message back to its sender. */
class EchoServer {
public:
    EchoServer(transport::VirtualTransportRegistry& virtual_registry, std::size_t max_frame_size,
               std::shared_ptr<Logger> logger)
        : virtual_registry_(virtual_registry), receiver_(max_frame_size), logger_(std::move(logger)) {}

    ~EchoServer() { stop(); }

    /** \return Endpoint actually bound (ephemeral TCP port resolved). */
    transport::Endpoint start(const transport::Endpoint& endpoint, transport::NodeType node_type,
                              const transport::SocketConfiguration& config) {
        accept_loop_ = transport::ConnectionFactory::create_accept_loop(endpoint.transport(), virtual_registry_, logger_);
        accept_loop_->bind(endpoint, node_type, config,
            [this](const std::shared_ptr<transport::IConnection>& connection, const transport::SocketConfiguration&) {
                on_client_connected(connection);
            },
            [this](const std::shared_ptr<transport::IConnection>& connection) {
                logger_->info("EchoServer: client disconnected " + connection->remote_endpoint());
            });
        if (auto* tcp = dynamic_cast<transport::TcpAcceptLoop*>(accept_loop_.get())) {
            return endpoint.with_port(tcp->local_port());
        }
        return endpoint;
    }

    void stop() {
        if (accept_loop_) {
            accept_loop_->unbind(true);
            accept_loop_.reset();
        }
        std::vector<std::unique_ptr<session::ReceiveLoop>> loops;
        {
            std::lock_guard<std::mutex> lock(loops_mtx_);
            loops.swap(loops_);
        }
        for (auto& loop : loops) loop->dispose();
        loops.clear();
    }

private:
    void on_client_connected(const std::shared_ptr<transport::IConnection>& connection) {
        logger_->info("EchoServer: client connected " + connection->remote_endpoint() + " over " +
                      connection->transport_name());
        session::ReceiveLoopCallbacks callbacks;
        callbacks.on_message_received = [](const std::shared_ptr<transport::IConnection>& conn,
                                           const std::shared_ptr<IMessage>& message) {
            FrameSender::send_message(*conn, SerializationRegistry::instance(), *message);
        };
        callbacks.on_socket_exception = [this](const std::shared_ptr<transport::IConnection>& conn,
                                               const std::system_error& error) {
            logger_->warning("EchoServer: " + conn->remote_endpoint() + ": " + error.what());
        };
        auto loop = std::make_unique<session::ReceiveLoop>(connection, SerializationRegistry::instance(),
                                                           std::move(callbacks), logger_, receiver_);
        loop->start();
        std::lock_guard<std::mutex> lock(loops_mtx_);
        loops_.push_back(std::move(loop));
    }

    transport::VirtualTransportRegistry& virtual_registry_;
    FrameReceiver receiver_;
    std::shared_ptr<Logger> logger_;
    std::unique_ptr<transport::IAcceptLoop> accept_loop_;
    std::mutex loops_mtx_;
    std::vector<std::unique_ptr<session::ReceiveLoop>> loops_;
};

/** \brief Sends `count` text messages and waits for every echo. \return true if all came back. */
static bool run_client(const transport::Endpoint& endpoint, transport::NodeType node_type,
                       const transport::SocketConfiguration& config, const NodeOptions& opts,
                       transport::VirtualTransportRegistry& virtual_registry, std::shared_ptr<Logger> logger) {
    auto connection = transport::ConnectionFactory::connect(endpoint, config, node_type, virtual_registry, logger);
    logger->info("Client: connected to " + endpoint.to_string() + " from " + connection->local_endpoint());

    std::mutex mtx;
    std::condition_variable cv;
    int echoes = 0;

    session::ReceiveLoopCallbacks callbacks;
    callbacks.on_message_received = [&](const std::shared_ptr<transport::IConnection>&,
                                        const std::shared_ptr<IMessage>& message) {
        if (auto text = std::dynamic_pointer_cast<TextMessage>(message)) {
            logger->debug("Client: echo '" + text->text() + "'");
        }
        std::lock_guard<std::mutex> lock(mtx);
        ++echoes;
        cv.notify_all();
    };
    callbacks.on_socket_exception = [&](const std::shared_ptr<transport::IConnection>&, const std::system_error& error) {
        logger->warning(std::string("Client: ") + error.what());
    };
    session::ReceiveLoop loop(connection, SerializationRegistry::instance(), std::move(callbacks), logger,
                              FrameReceiver(opts.max_frame_size));
    loop.start();

    for (int i = 0; i < opts.count && !shutdown_requested.load(std::memory_order_relaxed); ++i) {
        FrameSender::send_message(*connection, SerializationRegistry::instance(),
                                  TextMessage("message #" + std::to_string(i + 1)));
    }

    bool complete = false;
    {
        std::unique_lock<std::mutex> lock(mtx);
        complete = cv.wait_for(lock, std::chrono::seconds(10), [&]() { return echoes >= opts.count; });
    }
    loop.stop(true);
    loop.dispose();
    logger->info("Client: received " + std::to_string(echoes) + "/" + std::to_string(opts.count) + " echoes");
    return complete;
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("node");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Info);
    logger->add_sink(stdout_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---
        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }

        if (auto config_file = shared_opts::Options::get_config_file()) {
            logger->info("Loaded config from " + config_file->string());
        }
        const NodeOptions opts = node_opts::get_node_options();
        const auto socket_config = transport::socket_opts::get_socket_configuration();
        const auto node_type = transport::parse_node_type(opts.node_type);
        if (!node_type) {
            logger->error("Unknown node type '" + opts.node_type + "'");
            return 2;
        }
        const transport::Endpoint endpoint = opts.transport == "inproc"
            ? transport::Endpoint::virtual_endpoint(opts.name)
            : transport::Endpoint::tcp(opts.host, static_cast<std::uint16_t>(opts.port));

        if (opts.role == NodeRole::Client && endpoint.is_virtual()) {
            logger->error("The inproc transport has no peer outside this process; use --role loopback");
            return 2;
        }

        // --- Stage 3: Bring up the requested role ---
        logger->info("Node starting as " + node_opts::to_string(opts.role) + " on " + endpoint.to_string());
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        auto& virtual_registry = transport::VirtualTransportRegistry::instance();
        std::optional<EchoServer> server;
        transport::Endpoint target = endpoint;
        if (opts.role != NodeRole::Client) {
            server.emplace(virtual_registry, opts.max_frame_size, logger);
            target = server->start(endpoint, *node_type, socket_config);
            logger->info("Echo server listening on " + target.to_string());
        }

        int rc = 0;
        if (opts.role == NodeRole::Server) {
            while (!shutdown_requested.load(std::memory_order_relaxed)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        } else {
            // The client side of a loopback waits for replies with a deadline.
            const auto client_type = opts.role == NodeRole::Loopback ? transport::NodeType::Requester : *node_type;
            if (!run_client(target, client_type, socket_config, opts, virtual_registry, logger)) {
                logger->error("Not every message was echoed back");
                rc = 4;
            }
        }

        // --- Stage 4: Clean shutdown ---
        if (server) server->stop();
        logger->info("Node shut down");
        return rc;

    } catch (const std::exception& e) {
        logger->error("Exception in node main: " + std::string(e.what()));
        return 1;
    }
}
