#include <gtest/gtest.h>
#include "../../src/cli/command_line.h"

#include <cstdlib>
#include <vector>

using namespace SyncBench;

class CommandLineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("SYNCBENCH_NET_FACT");
        Configuration::getInstance().reset();
    }

    CommandLine Parse(std::vector<const char*> args) {
        args.insert(args.begin(), "syncbench");
        return ParseCommandLine(static_cast<int>(args.size()), args.data(), Configuration::getInstance());
    }
};

TEST_F(CommandLineTest, PositionalsDefineTheCluster) {
    CommandLine cmd = Parse({"5", "3", "--seed", "11", "-s", "rehash"});
    ASSERT_EQ(cmd.status, ParseStatus::kRun);
    ASSERT_EQ(cmd.strategies.size(), 1u);
    EXPECT_EQ(cmd.strategies[0], Strategy::kRehash);

    Configuration& config = Configuration::getInstance();
    EXPECT_EQ(config.getDataCount(), 5u);
    EXPECT_EQ(config.getNetFact(), 3u);
    EXPECT_EQ(config.config().simulation.seed.get(), 11u);
}

TEST_F(CommandLineTest, DefaultRunsBothStrategies) {
    CommandLine cmd = Parse({"5", "3"});
    ASSERT_EQ(cmd.status, ParseStatus::kRun);
    EXPECT_EQ(cmd.strategies, (std::vector<Strategy>{Strategy::kBloom, Strategy::kRehash}));
}

TEST_F(CommandLineTest, RejectsExtraPositional) {
    EXPECT_EQ(Parse({"5", "3", "7"}).status, ParseStatus::kError);
}

TEST_F(CommandLineTest, RejectsMissingPositional) {
    EXPECT_EQ(Parse({"5"}).status, ParseStatus::kError);
}

TEST_F(CommandLineTest, RejectsUnknownStrategy) {
    EXPECT_EQ(Parse({"5", "3", "--strategy", "gossip"}).status, ParseStatus::kError);
}

TEST_F(CommandLineTest, PositionalBeatsEnvironment) {
    setenv("SYNCBENCH_NET_FACT", "40", 1);
    ASSERT_EQ(Parse({"5", "3"}).status, ParseStatus::kRun);
    EXPECT_EQ(Configuration::getInstance().getNetFact(), 3u);
}

TEST_F(CommandLineTest, HelpShortCircuits) {
    CommandLine cmd = Parse({"--help"});
    EXPECT_EQ(cmd.status, ParseStatus::kHelp);
    EXPECT_NE(cmd.help.find("<data_count> <net_fact>"), std::string::npos);
}
