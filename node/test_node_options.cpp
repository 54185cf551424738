#include "node/NodeOptions.hpp"
#include "options/Options.hpp"
#include "testUtils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using shared_opts::Options;

TEST(NodeOptionsTest, RoleParsingIsCaseInsensitive) {
    EXPECT_EQ(node_opts::parse_role("Server"), NodeRole::Server);
    EXPECT_EQ(node_opts::parse_role("client"), NodeRole::Client);
    EXPECT_EQ(node_opts::parse_role("LOOPBACK"), NodeRole::Loopback);
    EXPECT_THROW(node_opts::parse_role("broker"), std::invalid_argument);
    EXPECT_EQ(node_opts::to_string(NodeRole::Server), "server");
}

TEST(NodeOptionsTest, DefaultsThenCommandLineOverrides) {
    node_opts::register_options();
    std::string err;

    test_utils::Argv bare({"node"});
    ASSERT_EQ(Options::load_and_parse(bare.argc(), bare.argv(), err), Options::ParseResult::Ok) << err;
    auto defaults = node_opts::get_node_options();
    EXPECT_EQ(defaults.role, NodeRole::Loopback);
    EXPECT_EQ(defaults.transport, "tcp");
    EXPECT_EQ(defaults.port, 5555);
    EXPECT_EQ(defaults.count, 10);

    test_utils::Argv args({"node", "--role", "server", "--transport", "inproc", "--name", "bench",
                           "--count", "3", "--port", "0"});
    ASSERT_EQ(Options::load_and_parse(args.argc(), args.argv(), err), Options::ParseResult::Ok) << err;
    auto opts = node_opts::get_node_options();
    EXPECT_EQ(opts.role, NodeRole::Server);
    EXPECT_EQ(opts.transport, "inproc");
    EXPECT_EQ(opts.name, "bench");
    EXPECT_EQ(opts.count, 3);
    EXPECT_EQ(opts.port, 0);
}

TEST(NodeOptionsTest, InvalidValuesAreRejected) {
    node_opts::register_options();
    std::string err;
    test_utils::Argv bad_role({"node", "--role", "broker"});
    EXPECT_EQ(Options::load_and_parse(bad_role.argc(), bad_role.argv(), err), Options::ParseResult::Error);

    test_utils::Argv bad_count({"node", "--count", "0"});
    EXPECT_EQ(Options::load_and_parse(bad_count.argc(), bad_count.argv(), err), Options::ParseResult::Error);
}
