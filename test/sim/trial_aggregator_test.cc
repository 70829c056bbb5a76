#include <gtest/gtest.h>
#include "../../src/sim/result_writer.h"
#include "../../src/sim/suite.h"
#include "../../src/sim/trial_aggregator.h"
#include "../../src/sim/trial_stats.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace SyncBench;

TEST(TrialStatsTest, MeanAndSampleStddev) {
    auto s = TrialStats::ComputeSummary({2, 4, 4, 4, 5, 5, 7, 9});
    EXPECT_EQ(s.count, 8u);
    EXPECT_DOUBLE_EQ(s.mean, 5.0);
    // sum of squared deviations is 32, over n - 1 = 7
    EXPECT_NEAR(s.stddev, 2.13808993529939, 1e-9);
    EXPECT_DOUBLE_EQ(s.min, 2.0);
    EXPECT_DOUBLE_EQ(s.max, 9.0);
}

TEST(TrialStatsTest, DegenerateInputs) {
    auto empty = TrialStats::ComputeSummary({});
    EXPECT_EQ(empty.count, 0u);
    EXPECT_DOUBLE_EQ(empty.mean, 0.0);

    auto single = TrialStats::ComputeSummary({3.5});
    EXPECT_DOUBLE_EQ(single.mean, 3.5);
    EXPECT_DOUBLE_EQ(single.stddev, 0.0);

    auto flat = TrialStats::ComputeSummary({2, 2, 2});
    EXPECT_DOUBLE_EQ(flat.stddev, 0.0);
}

class TrialAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.runner.data_count = 5;
        options_.runner.net_fact = 3;
        options_.runner.max_rounds = 50;
        options_.warmup_trials = 1;
        options_.measured_trials = 4;
    }

    TrialOptions options_;
};

TEST_F(TrialAggregatorTest, ReportsEveryMeasuredTrial) {
    for (Strategy strategy : {Strategy::kBloom, Strategy::kRehash}) {
        std::ostringstream progress;
        TrialAggregator aggregator(options_, 42, progress);
        auto report = aggregator.Run(strategy);

        ASSERT_TRUE(report.has_value());
        EXPECT_EQ(report->strategy, strategy);
        EXPECT_EQ(report->seed, 42u);
        EXPECT_EQ(report->rounds.count, 4u);
        EXPECT_EQ(report->mib_transferred.count, 4u);
        EXPECT_EQ(report->seconds.count, 4u);
        EXPECT_GE(report->rounds.mean, 1.0);
        EXPECT_GT(report->mib_transferred.mean, 0.0);

        const std::string name = StrategyName(strategy);
        EXPECT_EQ(progress.str(), name + " warmup ." + name + " test ....done.\n");
    }
}

TEST_F(TrialAggregatorTest, SeedReproducesResults) {
    std::ostringstream sink;
    auto a = TrialAggregator(options_, 7, sink).Run(Strategy::kBloom);
    auto b = TrialAggregator(options_, 7, sink).Run(Strategy::kBloom);
    ASSERT_TRUE(a && b);
    EXPECT_DOUBLE_EQ(a->rounds.mean, b->rounds.mean);
    EXPECT_DOUBLE_EQ(a->mib_transferred.mean, b->mib_transferred.mean);
    EXPECT_DOUBLE_EQ(a->mib_transferred.stddev, b->mib_transferred.stddev);
}

TEST_F(TrialAggregatorTest, RoundCeilingAbortsWithoutReport) {
    options_.runner.data_count = 50;
    options_.runner.max_rounds = 1;
    // one-byte filters saturate immediately, so nothing ever moves
    options_.reconciler.filter_bits_override = 8;
    std::ostringstream progress;
    TrialAggregator aggregator(options_, 1, progress);
    EXPECT_FALSE(aggregator.Run(Strategy::kBloom).has_value());
    EXPECT_EQ(progress.str().find("done."), std::string::npos);
}

TEST(TrialSummaryTest, FormatMatchesReportLine) {
    TrialReport report;
    report.strategy = Strategy::kRehash;
    report.rounds.mean = 2.0;
    report.rounds.stddev = 0.0;
    report.mib_transferred.mean = 0.01234;
    report.mib_transferred.stddev = 0.001;
    report.seconds.mean = 0.5;
    report.seconds.stddev = 0.01;
    EXPECT_EQ(TrialAggregator::FormatSummary(report),
              "rehash iterations: 2.0±0.0000, MiB transferred: 0.0123±0.0010 in 0.5000±0.0100 s");
}

class SuiteTest : public ::testing::Test {
protected:
    void SetUp() override {
        result_dir_ = ::testing::TempDir() + "syncbench_suite_test";
        std::filesystem::remove_all(result_dir_);

        options_.trials.runner.data_count = 5;
        options_.trials.runner.net_fact = 3;
        options_.trials.runner.max_rounds = 50;
        options_.trials.warmup_trials = 1;
        options_.trials.measured_trials = 3;
        options_.seed = 99;
        options_.result_dir = result_dir_;
    }

    void TearDown() override {
        std::filesystem::remove_all(result_dir_);
    }

    std::vector<std::string> ReadLines(const std::string& path) {
        std::vector<std::string> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::string result_dir_;
    SuiteOptions options_;
};

TEST_F(SuiteTest, PrintsHeaderProgressAndSummary) {
    std::ostringstream out;
    ASSERT_TRUE(RunSuite(Strategy::kRehash, options_, out));
    const std::string text = out.str();
    EXPECT_EQ(text.rfind("running with 5 ops / 3x3 nodes\n", 0), 0u);
    EXPECT_NE(text.find("rehash warmup ."), std::string::npos);
    EXPECT_NE(text.find("rehash iterations: "), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(result_dir_));
}

TEST_F(SuiteTest, RecordsCsvRowPerStrategy) {
    options_.record_results = true;
    std::ostringstream out;
    ASSERT_TRUE(RunSuite(Strategy::kBloom, options_, out));
    ASSERT_TRUE(RunSuite(Strategy::kRehash, options_, out));

    auto lines = ReadLines(result_dir_ + "/result.csv");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].rfind("timestamp,strategy,data_count,net_fact,seed", 0), 0u);
    EXPECT_NE(lines[1].find(",bloom,5,3,99,1,3,"), std::string::npos);
    EXPECT_NE(lines[2].find(",rehash,5,3,99,1,3,"), std::string::npos);
}

TEST_F(SuiteTest, WriterWithoutReportWritesOnlyHeader) {
    {
        ResultWriter writer(options_.trials, true, result_dir_);
        EXPECT_EQ(writer.result_path(), result_dir_ + "/result.csv");
    }
    auto lines = ReadLines(result_dir_ + "/result.csv");
    EXPECT_EQ(lines.size(), 1u);
}

TEST(SuiteConfigTest, OptionsFollowConfiguration) {
    Configuration& config = Configuration::getInstance();
    config.reset();
    config.config().simulation.seed.set(5);
    config.config().simulation.max_rounds.set(12);
    config.config().trials.measured.set(2);

    SuiteOptions options = SuiteOptionsFromConfig(config.config());
    EXPECT_EQ(options.seed, 5u);
    EXPECT_EQ(options.trials.runner.max_rounds, 12u);
    EXPECT_EQ(options.trials.measured_trials, 2u);
    EXPECT_EQ(options.trials.warmup_trials, 3u);
    EXPECT_DOUBLE_EQ(options.trials.reconciler.fp_rate, 0.01);

    config.config().simulation.seed.set(0);
    EXPECT_NE(SuiteOptionsFromConfig(config.config()).seed, 0u);
    config.reset();
}

TEST(SuiteEntryPointTest, BloomAndRehashSuitesUseConfiguration) {
    Configuration& config = Configuration::getInstance();
    config.reset();
    config.config().simulation.seed.set(17);
    config.config().simulation.max_rounds.set(50);
    config.config().trials.warmup.set(1);
    config.config().trials.measured.set(2);

    std::ostringstream bloom_out;
    EXPECT_TRUE(RunBloomSuite(5, 3, bloom_out));
    EXPECT_EQ(bloom_out.str().rfind("running with 5 ops / 3x3 nodes\n", 0), 0u);
    EXPECT_NE(bloom_out.str().find("bloom warmup .bloom test ..done.\n"), std::string::npos);
    EXPECT_NE(bloom_out.str().find("bloom iterations: "), std::string::npos);

    std::ostringstream rehash_out;
    EXPECT_TRUE(RunRehashSuite(4, 2, rehash_out));
    EXPECT_EQ(rehash_out.str().rfind("running with 4 ops / 2x2 nodes\n", 0), 0u);
    EXPECT_NE(rehash_out.str().find("rehash iterations: "), std::string::npos);

    // same configured seed, same output
    std::ostringstream again;
    EXPECT_TRUE(RunRehashSuite(4, 2, again));
    const std::string first = rehash_out.str();
    const std::string second = again.str();
    EXPECT_EQ(first.substr(0, first.find(" in ")), second.substr(0, second.find(" in ")));
    config.reset();
}

TEST(SuiteEntryPointTest, RoundCeilingFailsSuite) {
    Configuration& config = Configuration::getInstance();
    config.reset();
    config.config().simulation.seed.set(1);
    config.config().simulation.max_rounds.set(1);
    config.config().trials.warmup.set(0);
    config.config().trials.measured.set(1);
    // spokes only see the hub in a round, so four nodes never converge in one

    std::ostringstream out;
    EXPECT_FALSE(RunBloomSuite(50, 4, out));
    EXPECT_EQ(out.str().find("iterations:"), std::string::npos);
    config.reset();
}
