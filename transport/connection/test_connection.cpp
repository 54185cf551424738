#include "transport/connection/DisconnectNotifier.hpp"
#include "transport/connection/IConnection.hpp"
#include "transport/virtual/VirtualConnection.hpp"
#include "transport/TransportErrors.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace transport;

TEST(DisconnectNotifierTest, FiresOnceForEverySubscriber) {
    DisconnectNotifier notifier;
    int a = 0;
    int b = 0;
    notifier.subscribe([&]() { ++a; });
    notifier.subscribe([&]() { ++b; });

    EXPECT_TRUE(notifier.fire());
    EXPECT_FALSE(notifier.fire());
    EXPECT_TRUE(notifier.fired());
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);
}

TEST(DisconnectNotifierTest, LateSubscriberRunsImmediately) {
    DisconnectNotifier notifier;
    notifier.fire();
    bool called = false;
    notifier.subscribe([&]() { called = true; });
    EXPECT_TRUE(called);
}

TEST(DisconnectNotifierTest, ConcurrentFireNotifiesExactlyOnce) {
    DisconnectNotifier notifier;
    std::atomic<int> calls{0};
    notifier.subscribe([&]() { ++calls; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() { notifier.fire(); });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(calls.load(), 1);
}

TEST(DisconnectNotifierTest, ThrowingSubscriberIsLoggedAndOthersStillRun) {
    auto sink = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("test");
    logger->add_sink(sink);

    DisconnectNotifier notifier(logger);
    bool second = false;
    notifier.subscribe([]() { throw std::runtime_error("boom"); });
    notifier.subscribe([&]() { second = true; });
    notifier.fire();

    EXPECT_TRUE(second);
    EXPECT_EQ(sink->count_containing("boom", LogLevel::Error), 1u);
}

TEST(DisconnectNotifierTest, NonStandardThrowIsLoggedAndOthersStillRun) {
    auto sink = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("test");
    logger->add_sink(sink);

    DisconnectNotifier notifier(logger);
    bool second = false;
    notifier.subscribe([]() { throw 42; });
    notifier.subscribe([&]() { second = true; });
    EXPECT_NO_THROW(notifier.fire());

    EXPECT_TRUE(second);
    EXPECT_EQ(sink->count_containing("unknown exception", LogLevel::Error), 1u);
}

TEST(TransportErrorsTest, CodesCompareAndClassify) {
    std::error_code ec = transport_errc::cancelled;
    EXPECT_EQ(ec, transport_errc::cancelled);
    EXPECT_EQ(ec.category().name(), std::string("transport"));
    EXPECT_TRUE(is_expected_shutdown(ec));
    EXPECT_TRUE(is_expected_shutdown(transport_errc::connection_closed));
    EXPECT_FALSE(is_expected_shutdown(transport_errc::io_error));

    EXPECT_TRUE(is_frame_recoverable(transport_errc::unknown_type));
    EXPECT_TRUE(is_frame_recoverable(transport_errc::malformed_payload));
    EXPECT_FALSE(is_frame_recoverable(transport_errc::frame_too_large));
}

TEST(TransportErrorsTest, ErrnoTranslatesToPortableCodes) {
    EXPECT_EQ(translate_errno(ECONNRESET), std::errc::connection_reset);
    EXPECT_EQ(translate_errno(ECONNREFUSED), std::errc::connection_refused);
    EXPECT_EQ(translate_errno(EPIPE), std::errc::broken_pipe);
}

TEST(TransportErrorsTest, ThrowHelperCarriesCodeAndContext) {
    try {
        throw_transport_error(transport_errc::not_listening, "inproc://x");
        FAIL() << "expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), transport_errc::not_listening);
        EXPECT_NE(std::string(e.what()).find("inproc://x"), std::string::npos);
    }
}

TEST(ConnectionHelpersTest, ReadExactAssemblesAcrossChunks) {
    auto [client, server] = VirtualConnection::create_pair(Endpoint::virtual_endpoint("helpers"));

    std::error_code ec;
    const char first[] = "abc";
    const char second[] = "defg";
    EXPECT_EQ(write_all(*client, first, 3, ec), 3u);
    ASSERT_FALSE(ec);
    EXPECT_EQ(write_all(*client, second, 4, ec), 4u);
    ASSERT_FALSE(ec);

    char buffer[7] = {};
    EXPECT_EQ(read_exact(*server, buffer, sizeof(buffer), ec, {}), 7u);
    ASSERT_FALSE(ec);
    EXPECT_EQ(std::string(buffer, 7), "abcdefg");
}

TEST(ConnectionHelpersTest, ReadExactReportsEndOfStreamMidBuffer) {
    auto [client, server] = VirtualConnection::create_pair(Endpoint::virtual_endpoint("helpers-eof"));

    std::error_code ec;
    write_all(*client, "xy", 2, ec);
    ASSERT_FALSE(ec);
    client->close();

    char buffer[4] = {};
    EXPECT_EQ(read_exact(*server, buffer, sizeof(buffer), ec, {}), 2u);
    EXPECT_EQ(ec, transport_errc::connection_closed);
}
