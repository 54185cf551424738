#include "transport/virtual/VirtualTransportRegistry.hpp"
#include "transport/virtual/VirtualConnection.hpp"
#include "transport/TransportErrors.hpp"
#include "cancellation.hpp"
#include "testUtils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <numeric>
#include <thread>
#include <vector>

using namespace transport;
using namespace std::chrono_literals;

namespace {

std::error_code error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::system_error& e) {
        return e.code();
    }
    return {};
}

struct ConnectedPair {
    std::shared_ptr<VirtualConnection> connector;
    std::shared_ptr<VirtualConnection> accepter;
};

ConnectedPair connect_through(VirtualTransportRegistry& registry, const Endpoint& ep) {
    auto pending = registry.register_accepter(ep);
    ConnectedPair pair;
    pair.connector = registry.connect(ep);
    auto accepted = pending->try_pop();
    if (accepted) pair.accepter = *accepted;
    return pair;
}

} // namespace

TEST(VirtualTransportRegistryTest, ConnectHandsTheAccepterEndToTheListener) {
    VirtualTransportRegistry registry;
    auto ep = Endpoint::virtual_endpoint("pairing");
    auto pair = connect_through(registry, ep);
    ASSERT_TRUE(pair.connector);
    ASSERT_TRUE(pair.accepter);
    EXPECT_EQ(pair.connector->endpoint(), ep);
    EXPECT_EQ(pair.accepter->endpoint(), ep);
    EXPECT_EQ(pair.connector->transport_name(), "virtual");
    EXPECT_EQ(pair.connector->remote_endpoint(), pair.accepter->local_endpoint());
    EXPECT_EQ(pair.accepter->remote_endpoint(), pair.connector->local_endpoint());

    std::error_code ec;
    write_all(*pair.connector, "ping", 4, ec);
    ASSERT_FALSE(ec);
    char in[4] = {};
    read_exact(*pair.accepter, in, 4, ec, {});
    ASSERT_FALSE(ec);
    EXPECT_EQ(std::string(in, 4), "ping");

    write_all(*pair.accepter, "pong", 4, ec);
    ASSERT_FALSE(ec);
    read_exact(*pair.connector, in, 4, ec, {});
    ASSERT_FALSE(ec);
    EXPECT_EQ(std::string(in, 4), "pong");
}

TEST(VirtualTransportRegistryTest, SecondRegistrationIsRejected) {
    VirtualTransportRegistry registry;
    auto ep = Endpoint::virtual_endpoint("dup");
    auto queue = registry.register_accepter(ep);
    EXPECT_EQ(error_of([&]() { registry.register_accepter(ep); }), transport_errc::already_registered);
    EXPECT_TRUE(registry.is_registered(ep));
}

TEST(VirtualTransportRegistryTest, ConnectWithoutListenerFails) {
    VirtualTransportRegistry registry;
    EXPECT_EQ(error_of([&]() { registry.connect(Endpoint::virtual_endpoint("nobody")); }),
              transport_errc::not_listening);
}

TEST(VirtualTransportRegistryTest, TcpEndpointsAreRejected) {
    VirtualTransportRegistry registry;
    auto tcp = Endpoint::tcp("127.0.0.1", 1);
    EXPECT_EQ(error_of([&]() { registry.register_accepter(tcp); }), transport_errc::invalid_transport);
    EXPECT_EQ(error_of([&]() { registry.connect(tcp); }), transport_errc::invalid_transport);
}

TEST(VirtualTransportRegistryTest, UnregisterStopsNewConnectsButKeepsEstablishedOnes) {
    VirtualTransportRegistry registry;
    auto ep = Endpoint::virtual_endpoint("lifecycle");
    auto pair = connect_through(registry, ep);
    ASSERT_TRUE(pair.accepter);

    EXPECT_TRUE(registry.unregister_accepter(ep));
    EXPECT_FALSE(registry.unregister_accepter(ep));
    EXPECT_FALSE(registry.is_registered(ep));
    EXPECT_EQ(error_of([&]() { registry.connect(ep); }), transport_errc::not_listening);

    std::error_code ec;
    write_all(*pair.connector, "still", 5, ec);
    ASSERT_FALSE(ec);
    char in[5] = {};
    read_exact(*pair.accepter, in, 5, ec, {});
    ASSERT_FALSE(ec);
    EXPECT_EQ(std::string(in, 5), "still");

    // The name can be taken again.
    EXPECT_NO_THROW(registry.register_accepter(ep));
}

TEST(VirtualTransportRegistryTest, UnclaimedConnectionsAreClosedOnUnregister) {
    VirtualTransportRegistry registry;
    auto ep = Endpoint::virtual_endpoint("orphan");
    auto pending = registry.register_accepter(ep);
    auto connector = registry.connect(ep);
    registry.unregister_accepter(ep);

    char byte = 0;
    std::size_t n = 0;
    std::error_code ec;
    connector->read(&byte, 1, n, ec, {});
    EXPECT_EQ(ec, transport_errc::connection_closed);
    EXPECT_FALSE(connector->is_open());
}

TEST(VirtualTransportRegistryTest, RegisteredEndpointsListsCurrentListeners) {
    VirtualTransportRegistry registry;
    auto a = registry.register_accepter(Endpoint::virtual_endpoint("a"));
    auto b = registry.register_accepter(Endpoint::virtual_endpoint("b"));
    EXPECT_EQ(registry.registered_endpoints().size(), 2u);
    registry.unregister_accepter(Endpoint::virtual_endpoint("a"));
    auto remaining = registry.registered_endpoints();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining.front(), Endpoint::virtual_endpoint("b"));
}

TEST(VirtualConnectionTest, ByteOrderIsPreservedAcrossArbitraryReadSizes) {
    auto pair = VirtualConnection::create_pair(Endpoint::virtual_endpoint("order"));
    auto writer = pair.first;
    auto reader = pair.second;

    std::vector<std::uint8_t> sent(10000);
    std::iota(sent.begin(), sent.end(), 0);

    std::thread producer([writer, &sent]() {
        std::error_code ec;
        std::size_t offset = 0;
        std::size_t step = 1;
        while (offset < sent.size()) {
            const std::size_t n = std::min(step, sent.size() - offset);
            write_all(*writer, sent.data() + offset, n, ec);
            if (ec) return;
            offset += n;
            step = step % 97 + 13;
        }
    });

    std::vector<std::uint8_t> received;
    std::uint8_t buffer[61];
    std::size_t want = 7;
    while (received.size() < sent.size()) {
        std::size_t n = 0;
        std::error_code ec;
        reader->read(buffer, std::min<std::size_t>(want, sizeof(buffer)), n, ec, {});
        ASSERT_FALSE(ec) << ec.message();
        received.insert(received.end(), buffer, buffer + n);
        want = want % 53 + 5;
    }
    producer.join();
    EXPECT_EQ(received, sent);
}

TEST(VirtualConnectionTest, PeerCloseDeliversBufferedDataThenEndOfStream) {
    auto pair = VirtualConnection::create_pair(Endpoint::virtual_endpoint("eof"));
    auto connector = pair.first;
    auto accepter = pair.second;

    int connector_events = 0;
    int accepter_events = 0;
    connector->on_disconnected([&]() { ++connector_events; });
    accepter->on_disconnected([&]() { ++accepter_events; });

    std::error_code ec;
    write_all(*connector, "bye", 3, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(accepter->pending_chunks(), 1u);
    connector->close();
    connector->close();
    EXPECT_FALSE(connector->is_open());
    EXPECT_EQ(connector_events, 1);

    char in[3] = {};
    read_exact(*accepter, in, 3, ec, {});
    ASSERT_FALSE(ec);
    EXPECT_EQ(std::string(in, 3), "bye");
    EXPECT_EQ(accepter_events, 0);

    std::size_t n = 0;
    accepter->read(in, 1, n, ec, {});
    EXPECT_EQ(ec, transport_errc::connection_closed);
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(accepter_events, 1);
    EXPECT_FALSE(accepter->is_open());
}

TEST(VirtualConnectionTest, WriteToClosedPeerFails) {
    auto pair = VirtualConnection::create_pair(Endpoint::virtual_endpoint("write-closed"));
    pair.second->close();

    std::size_t n = 0;
    std::error_code ec;
    pair.first->write("x", 1, n, ec);
    EXPECT_EQ(ec, transport_errc::connection_closed);
    EXPECT_EQ(n, 0u);
}

TEST(VirtualConnectionTest, OperationsOnLocallyClosedEndFail) {
    auto pair = VirtualConnection::create_pair(Endpoint::virtual_endpoint("local-closed"));
    pair.first->close();

    char byte = 0;
    std::size_t n = 0;
    std::error_code ec;
    pair.first->read(&byte, 1, n, ec, {});
    EXPECT_EQ(ec, transport_errc::connection_closed);
    pair.first->write("x", 1, n, ec);
    EXPECT_EQ(ec, transport_errc::connection_closed);
}

TEST(VirtualConnectionTest, CancellationInterruptsBlockedRead) {
    auto pair = VirtualConnection::create_pair(Endpoint::virtual_endpoint("cancel"));
    auto reader = pair.second;
    CancellationSource source;

    std::error_code result;
    std::thread blocked([reader, &result, token = source.token()]() {
        char byte = 0;
        std::size_t n = 0;
        reader->read(&byte, 1, n, result, token);
    });

    std::this_thread::sleep_for(50ms);
    const auto started = std::chrono::steady_clock::now();
    source.cancel();
    blocked.join();
    EXPECT_EQ(result, transport_errc::cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
    // Cancellation is not a disconnect.
    EXPECT_TRUE(reader->is_open());
}

TEST(VirtualConnectionTest, LocalCloseWakesBlockedRead) {
    auto pair = VirtualConnection::create_pair(Endpoint::virtual_endpoint("close-wakes"));
    auto reader = pair.second;

    std::error_code result;
    std::thread blocked([reader, &result]() {
        char byte = 0;
        std::size_t n = 0;
        reader->read(&byte, 1, n, result, {});
    });

    std::this_thread::sleep_for(50ms);
    reader->close();
    blocked.join();
    EXPECT_EQ(result, transport_errc::connection_closed);
}

TEST(VirtualConnectionTest, ConcurrentConnectsYieldDistinctPairs) {
    VirtualTransportRegistry registry;
    auto ep = Endpoint::virtual_endpoint("fan-in");
    auto pending = registry.register_accepter(ep);

    constexpr int kClients = 8;
    std::vector<std::shared_ptr<VirtualConnection>> connectors(kClients);
    std::vector<std::thread> threads;
    for (int i = 0; i < kClients; ++i) {
        threads.emplace_back([&, i]() {
            connectors[i] = registry.connect(ep);
            std::error_code ec;
            std::uint8_t id = static_cast<std::uint8_t>(i);
            write_all(*connectors[i], &id, 1, ec);
        });
    }
    for (auto& t : threads) t.join();

    std::vector<bool> seen(kClients, false);
    for (int i = 0; i < kClients; ++i) {
        auto accepted = pending->try_pop();
        ASSERT_TRUE(accepted);
        std::uint8_t id = 0;
        std::error_code ec;
        read_exact(**accepted, &id, 1, ec, {});
        ASSERT_FALSE(ec);
        ASSERT_LT(id, kClients);
        EXPECT_FALSE(seen[id]);
        seen[id] = true;
    }
    EXPECT_FALSE(pending->try_pop());
}
