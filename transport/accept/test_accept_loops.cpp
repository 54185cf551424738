#include "transport/accept/TcpAcceptLoop.hpp"
#include "transport/accept/VirtualAcceptLoop.hpp"
#include "transport/ConnectionFactory.hpp"
#include "transport/socket/NetworkConnection.hpp"
#include "transport/virtual/VirtualTransportRegistry.hpp"
#include "transport/TransportErrors.hpp"
#include "logger.hpp"
#include "testUtils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace transport;
using namespace std::chrono_literals;
using test_utils::wait_until;

namespace {

std::error_code error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::system_error& e) {
        return e.code();
    }
    return {};
}

/** Records what an accept loop hands to its handlers. */
struct AcceptRecorder {
    std::mutex mutex;
    std::vector<std::shared_ptr<IConnection>> accepted;
    std::vector<SocketConfiguration> configs;
    std::atomic<int> disconnects{0};

    ClientConnectedHandler on_connected() {
        return [this](const std::shared_ptr<IConnection>& conn, const SocketConfiguration& config) {
            std::lock_guard<std::mutex> lock(mutex);
            accepted.push_back(conn);
            configs.push_back(config);
        };
    }

    ClientDisconnectedHandler on_disconnected() {
        return [this](const std::shared_ptr<IConnection>&) { ++disconnects; };
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return accepted.size();
    }

    std::shared_ptr<IConnection> at(std::size_t i) {
        std::lock_guard<std::mutex> lock(mutex);
        return accepted.at(i);
    }
};

} // namespace

TEST(TcpAcceptLoopTest, AcceptedConnectionCarriesConfigurationAndDisconnectsOnce) {
    AcceptRecorder recorder;
    TcpAcceptLoop loop;

    SocketConfiguration config;
    config.send_buffer_size = 16384;
    config.receive_buffer_size = 16384;
    loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, config, recorder.on_connected(),
              recorder.on_disconnected());
    ASSERT_TRUE(loop.is_bound());
    ASSERT_NE(loop.local_port(), 0);
    ASSERT_TRUE(loop.bound_endpoint());
    EXPECT_EQ(loop.bound_endpoint()->port(), loop.local_port());

    std::error_code ec;
    auto client = NetworkConnection::connect(*loop.bound_endpoint(), SocketConfiguration::defaults(), true, ec);
    ASSERT_TRUE(client) << ec.message();
    ASSERT_TRUE(wait_until([&]() { return recorder.count() == 1; }));

    auto server = std::dynamic_pointer_cast<NetworkConnection>(recorder.at(0));
    ASSERT_TRUE(server);
    EXPECT_EQ(server->send_buffer_size(), 16384);
    EXPECT_EQ(server->receive_buffer_size(), 16384);
    EXPECT_TRUE(server->no_delay());
    // Responders never get a receive timeout.
    EXPECT_EQ(server->receive_timeout(), 0ms);
    EXPECT_EQ(recorder.configs.at(0), config);

    client->close();
    char byte = 0;
    std::size_t n = 0;
    server->read(&byte, 1, n, ec, {});
    EXPECT_EQ(ec, transport_errc::connection_closed);
    server->close();
    EXPECT_EQ(recorder.disconnects.load(), 1);

    loop.unbind(true);
    EXPECT_FALSE(loop.is_bound());
    EXPECT_EQ(loop.local_port(), 0);
}

TEST(TcpAcceptLoopTest, RequesterPolicyAppliesReceiveTimeout) {
    AcceptRecorder recorder;
    TcpAcceptLoop loop;
    SocketConfiguration config;
    config.receive_timeout = 1234ms;
    loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Requester, config, recorder.on_connected());

    std::error_code ec;
    auto client = NetworkConnection::connect(*loop.bound_endpoint(), config, false, ec);
    ASSERT_TRUE(client);
    ASSERT_TRUE(wait_until([&]() { return recorder.count() == 1; }));
    auto server = std::dynamic_pointer_cast<NetworkConnection>(recorder.at(0));
    ASSERT_TRUE(server);
    EXPECT_EQ(server->receive_timeout(), 1234ms);
}

TEST(TcpAcceptLoopTest, BindRejectsSecondBindAndVirtualEndpoints) {
    TcpAcceptLoop loop;
    EXPECT_EQ(error_of([&]() {
                  loop.bind(Endpoint::virtual_endpoint("x"), NodeType::Responder, SocketConfiguration::defaults());
              }),
              transport_errc::invalid_transport);
    EXPECT_FALSE(loop.is_bound());

    loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults());
    EXPECT_EQ(error_of([&]() {
                  loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults());
              }),
              transport_errc::already_bound);
    EXPECT_TRUE(loop.is_bound());
}

TEST(TcpAcceptLoopTest, UnbindIsIdempotentAndAllowsRebind) {
    TcpAcceptLoop loop;
    loop.unbind(true);

    loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults());
    loop.unbind(true);
    loop.unbind(true);
    EXPECT_FALSE(loop.is_bound());

    AcceptRecorder recorder;
    loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults(),
              recorder.on_connected());
    std::error_code ec;
    auto client = NetworkConnection::connect(*loop.bound_endpoint(), SocketConfiguration::defaults(), false, ec);
    ASSERT_TRUE(client);
    EXPECT_TRUE(wait_until([&]() { return recorder.count() == 1; }));
}

TEST(TcpAcceptLoopTest, UnbindStopsAcceptingNewConnections) {
    TcpAcceptLoop loop;
    loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults());
    const auto endpoint = *loop.bound_endpoint();
    loop.unbind(true);

    std::error_code ec;
    auto client = NetworkConnection::connect(endpoint, SocketConfiguration::defaults(), false, ec);
    EXPECT_FALSE(client);
    EXPECT_TRUE(ec);
}

TEST(TcpAcceptLoopTest, ThrowingConnectHandlerDoesNotStopTheLoop) {
    auto sink = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("accept-test");
    logger->add_sink(sink);

    std::atomic<int> calls{0};
    TcpAcceptLoop loop(logger);
    loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults(),
              [&](const std::shared_ptr<IConnection>&, const SocketConfiguration&) {
                  if (++calls == 1) throw std::runtime_error("handler failure");
              });

    std::error_code ec;
    auto first = NetworkConnection::connect(*loop.bound_endpoint(), SocketConfiguration::defaults(), false, ec);
    ASSERT_TRUE(first);
    auto second = NetworkConnection::connect(*loop.bound_endpoint(), SocketConfiguration::defaults(), false, ec);
    ASSERT_TRUE(second);

    EXPECT_TRUE(wait_until([&]() { return calls.load() == 2; }));
    EXPECT_EQ(sink->count_containing("handler failure", LogLevel::Error), 1u);
    EXPECT_TRUE(loop.is_bound());
}

TEST(TcpAcceptLoopTest, UnbindFromConnectHandlerDoesNotDeadlock) {
    TcpAcceptLoop loop;
    std::atomic<bool> returned{false};
    loop.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults(),
              [&](const std::shared_ptr<IConnection>&, const SocketConfiguration&) {
                  loop.unbind(true);
                  returned = true;
              });

    std::error_code ec;
    auto client = NetworkConnection::connect(*loop.bound_endpoint(), SocketConfiguration::defaults(), false, ec);
    ASSERT_TRUE(client);
    EXPECT_TRUE(wait_until([&]() { return returned.load(); }));
    EXPECT_FALSE(loop.is_bound());
}

TEST(TcpAcceptLoopTest, ConnectHandlerMayDestroyTheLoop) {
    auto sink = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("accept-test");
    logger->add_sink(sink);

    auto loop = std::make_unique<TcpAcceptLoop>(logger);
    std::atomic<bool> destroyed{false};
    loop->bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults(),
               [&](const std::shared_ptr<IConnection>&, const SocketConfiguration&) {
                   loop.reset();
                   destroyed = true;
               });
    const auto endpoint = *loop->bound_endpoint();

    std::error_code ec;
    auto client = NetworkConnection::connect(endpoint, SocketConfiguration::defaults(), false, ec);
    ASSERT_TRUE(client) << ec.message();
    ASSERT_TRUE(wait_until([&]() { return destroyed.load(); }));
    // The detached thread still finishes its exit path.
    EXPECT_TRUE(wait_until([&]() { return sink->count_containing("accept loop exited") == 1; }));

    EXPECT_TRUE(wait_until([&]() {
        auto late = NetworkConnection::connect(endpoint, SocketConfiguration::defaults(), false, ec);
        return !late && ec == std::errc::connection_refused;
    }));
}

TEST(TcpAcceptLoopTest, TransientAcceptErrorsAreClassified) {
    EXPECT_TRUE(is_transient_accept_error(ECONNABORTED));
    EXPECT_TRUE(is_transient_accept_error(EMFILE));
    EXPECT_TRUE(is_transient_accept_error(EINTR));
    EXPECT_FALSE(is_transient_accept_error(EBADF));
    EXPECT_FALSE(is_transient_accept_error(EINVAL));
}

TEST(VirtualAcceptLoopTest, FactoryConnectReachesTheLoop) {
    VirtualTransportRegistry registry;
    AcceptRecorder recorder;
    auto loop = ConnectionFactory::create_accept_loop(TransportKind::Virtual, registry);
    const auto ep = Endpoint::virtual_endpoint("factory");
    loop->bind(ep, NodeType::Responder, SocketConfiguration::defaults(), recorder.on_connected(),
               recorder.on_disconnected());
    EXPECT_TRUE(loop->is_bound());
    EXPECT_TRUE(registry.is_registered(ep));

    auto client = ConnectionFactory::connect(ep, SocketConfiguration::defaults(), NodeType::Requester, registry);
    ASSERT_TRUE(client);
    ASSERT_TRUE(wait_until([&]() { return recorder.count() == 1; }));
    auto server = recorder.at(0);
    EXPECT_EQ(server->transport_name(), "virtual");

    std::error_code ec;
    write_all(*client, "abc", 3, ec);
    ASSERT_FALSE(ec);
    char in[3] = {};
    read_exact(*server, in, 3, ec, {});
    ASSERT_FALSE(ec);
    EXPECT_EQ(std::string(in, 3), "abc");

    client->close();
    std::size_t n = 0;
    server->read(in, 1, n, ec, {});
    EXPECT_EQ(ec, transport_errc::connection_closed);
    EXPECT_EQ(recorder.disconnects.load(), 1);

    loop->unbind(true);
    EXPECT_FALSE(loop->is_bound());
    EXPECT_FALSE(registry.is_registered(ep));
    EXPECT_EQ(error_of([&]() {
                  ConnectionFactory::connect(ep, SocketConfiguration::defaults(), NodeType::Requester, registry);
              }),
              transport_errc::not_listening);
}

TEST(VirtualAcceptLoopTest, BindRejectsTakenNamesAndTcpEndpoints) {
    VirtualTransportRegistry registry;
    VirtualAcceptLoop first(registry);
    VirtualAcceptLoop second(registry);
    const auto ep = Endpoint::virtual_endpoint("taken");

    first.bind(ep, NodeType::Responder, SocketConfiguration::defaults());
    EXPECT_EQ(error_of([&]() { second.bind(ep, NodeType::Responder, SocketConfiguration::defaults()); }),
              transport_errc::already_registered);
    EXPECT_FALSE(second.is_bound());
    EXPECT_EQ(error_of([&]() { first.bind(ep, NodeType::Responder, SocketConfiguration::defaults()); }),
              transport_errc::already_bound);
    EXPECT_EQ(error_of([&]() {
                  second.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults());
              }),
              transport_errc::invalid_transport);

    first.unbind(true);
    EXPECT_NO_THROW(second.bind(ep, NodeType::Responder, SocketConfiguration::defaults()));
    EXPECT_TRUE(second.bound_endpoint() == ep);
}

TEST(VirtualAcceptLoopTest, UnbindTwiceAndRebind) {
    VirtualTransportRegistry registry;
    VirtualAcceptLoop loop(registry);
    const auto ep = Endpoint::virtual_endpoint("rebind");
    loop.bind(ep, NodeType::Responder, SocketConfiguration::defaults());
    loop.unbind(true);
    loop.unbind(true);
    EXPECT_FALSE(loop.is_bound());

    AcceptRecorder recorder;
    loop.bind(ep, NodeType::Responder, SocketConfiguration::defaults(), recorder.on_connected());
    auto client = registry.connect(ep);
    EXPECT_TRUE(wait_until([&]() { return recorder.count() == 1; }));
}

TEST(VirtualAcceptLoopTest, ConnectHandlerMayDestroyTheLoop) {
    auto sink = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("accept-test");
    logger->add_sink(sink);

    VirtualTransportRegistry registry;
    const auto ep = Endpoint::virtual_endpoint("self-destruct");
    auto loop = std::make_unique<VirtualAcceptLoop>(registry, logger);
    std::atomic<bool> destroyed{false};
    loop->bind(ep, NodeType::Responder, SocketConfiguration::defaults(),
               [&](const std::shared_ptr<IConnection>&, const SocketConfiguration&) {
                   loop.reset();
                   destroyed = true;
               });

    auto client = registry.connect(ep);
    ASSERT_TRUE(client);
    ASSERT_TRUE(wait_until([&]() { return destroyed.load(); }));
    EXPECT_TRUE(wait_until([&]() { return sink->count_containing("accept loop exited") == 1; }));

    EXPECT_FALSE(registry.is_registered(ep));
    EXPECT_EQ(error_of([&]() { registry.connect(ep); }), transport_errc::not_listening);
}

TEST(ConnectionFactoryTest, TcpConnectFailureThrowsSystemError) {
    std::uint16_t port = 0;
    {
        TcpAcceptLoop listener;
        listener.bind(Endpoint::tcp("127.0.0.1", 0), NodeType::Responder, SocketConfiguration::defaults());
        port = listener.local_port();
    }
    EXPECT_EQ(error_of([&]() {
                  ConnectionFactory::connect(Endpoint::tcp("127.0.0.1", port), SocketConfiguration::defaults(),
                                             NodeType::Requester);
              }),
              std::errc::connection_refused);
}

TEST(ConnectionFactoryTest, TcpAcceptLoopFromFactory) {
    VirtualTransportRegistry registry;
    auto loop = ConnectionFactory::create_accept_loop(TransportKind::Tcp, registry);
    ASSERT_TRUE(dynamic_cast<TcpAcceptLoop*>(loop.get()));
}
