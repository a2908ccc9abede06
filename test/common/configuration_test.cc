#include <gtest/gtest.h>
#include "common/configuration.h"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <cxxopts.hpp>

using namespace Replibench;

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("REPLIBENCH_CONCURRENCY");
        unsetenv("REPLIBENCH_SEPARATE");
    }

    Configuration config_;
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    EXPECT_TRUE(config_.validate());
    RunParameters p = config_.BuildRunParameters();
    EXPECT_EQ(p.protocol, Protocol::kAbd);
    EXPECT_EQ(p.batch_size, 1);
    EXPECT_EQ(p.concurrency, 1);
    EXPECT_DOUBLE_EQ(p.read_ratio(), 0.5);
}

TEST_F(ConfigurationTest, LoadsNestedYaml) {
    const char* yaml = R"(
replibench:
  server:
    address: "10.0.0.7"
    port: 7100
  benchmark:
    duration_s: 30
    throttle: 5000
    key_space: 100
    write_ratio: 0.1
    conflicts: 25
    concurrency: 8
    distribution: "zipfan"
    zipfian_theta: 0.8
  batch_size: 10
  buffer_size: 64
  client:
    id: 3
    protocol: "epaxos"
    start_range: 1000
    separate: true
)";
    ASSERT_TRUE(config_.loadFromString(yaml));
    ASSERT_TRUE(config_.validate());

    RunParameters p = config_.BuildRunParameters();
    EXPECT_EQ(p.server_address, "10.0.0.7");
    EXPECT_EQ(p.server_port, 7100);
    EXPECT_EQ(p.duration_s, 30);
    EXPECT_EQ(p.request_count, 5000);
    EXPECT_EQ(p.key_space, 100);
    EXPECT_DOUBLE_EQ(p.write_ratio, 0.1);
    EXPECT_EQ(p.conflicts, 25);
    EXPECT_EQ(p.concurrency, 8);
    EXPECT_EQ(p.distribution, "zipfan");
    EXPECT_DOUBLE_EQ(p.zipfian_theta, 0.8);
    EXPECT_EQ(p.batch_size, 10);
    EXPECT_EQ(p.buffer_size, 64u);
    EXPECT_EQ(p.client_id, 3);
    EXPECT_EQ(p.protocol, Protocol::kFastPath);
    EXPECT_EQ(p.start_range, 1000);
    EXPECT_TRUE(p.separate);
}

TEST_F(ConfigurationTest, AcceptsShortBenchmarkNames) {
    const char* json = R"({"benchmark": {"T": 5, "Throttle": 200, "K": 50, "W": 1.0, "Conflicts": 10}, "BatchSize": 4})";
    ASSERT_TRUE(config_.loadFromString(json));

    RunParameters p = config_.BuildRunParameters();
    EXPECT_EQ(p.duration_s, 5);
    EXPECT_EQ(p.request_count, 200);
    EXPECT_EQ(p.key_space, 50);
    EXPECT_DOUBLE_EQ(p.read_ratio(), 0.0);
    EXPECT_EQ(p.conflicts, 10);
    EXPECT_EQ(p.batch_size, 4);
}

TEST_F(ConfigurationTest, RejectsConflictsOutOfRange) {
    ASSERT_TRUE(config_.loadFromString("benchmark:\n  conflicts: 101\n"));
    EXPECT_FALSE(config_.validate());
    ASSERT_EQ(config_.getValidationErrors().size(), 1u);

    ASSERT_TRUE(config_.loadFromString("benchmark:\n  conflicts: -1\n"));
    EXPECT_FALSE(config_.validate());
}

TEST_F(ConfigurationTest, RejectsZipfianThetaOutOfRange) {
    ASSERT_TRUE(config_.loadFromString("benchmark:\n  distribution: zipfan\n  zipfian_theta: 1.0\n"));
    EXPECT_FALSE(config_.validate());
    ASSERT_EQ(config_.getValidationErrors().size(), 1u);
    EXPECT_NE(config_.getValidationErrors()[0].find("theta"), std::string::npos);

    ASSERT_TRUE(config_.loadFromString("benchmark:\n  distribution: zipfian\n  zipfian_theta: 0\n"));
    EXPECT_FALSE(config_.validate());

    ASSERT_TRUE(config_.loadFromString("benchmark:\n  distribution: zipfan\n  zipfian_theta: 0.5\n"));
    EXPECT_TRUE(config_.validate());

    // Theta is irrelevant to the uniform distribution.
    ASSERT_TRUE(config_.loadFromString("benchmark:\n  distribution: uniform\n  zipfian_theta: 1.5\n"));
    EXPECT_TRUE(config_.validate());
}

TEST_F(ConfigurationTest, RejectsBadBatchAndConcurrency) {
    ASSERT_TRUE(config_.loadFromString("batch_size: 0\nbenchmark:\n  concurrency: 0\n"));
    EXPECT_FALSE(config_.validate());
    EXPECT_EQ(config_.getValidationErrors().size(), 2u);
}

TEST_F(ConfigurationTest, RejectsUnknownProtocol) {
    ASSERT_TRUE(config_.loadFromString("client:\n  protocol: raft\n"));
    EXPECT_FALSE(config_.validate());
    EXPECT_THROW(config_.BuildRunParameters(), std::invalid_argument);
}

TEST_F(ConfigurationTest, MalformedYamlFailsToLoad) {
    EXPECT_FALSE(config_.loadFromString("benchmark: [unclosed"));
    EXPECT_FALSE(config_.loadFromString("- just\n- a list\n"));
    EXPECT_FALSE(config_.loadFromFile("/nonexistent/replibench.yaml"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config_.loadFromString("benchmark:\n  concurrency: 2\n"));
    setenv("REPLIBENCH_CONCURRENCY", "16", 1);
    setenv("REPLIBENCH_SEPARATE", "yes", 1);

    RunParameters p = config_.BuildRunParameters();
    EXPECT_EQ(p.concurrency, 16);
    EXPECT_TRUE(p.separate);
}

TEST_F(ConfigurationTest, CommandLineOverridesFile) {
    ASSERT_TRUE(config_.loadFromString("client:\n  id: 1\n  protocol: abd\n"));

    cxxopts::Options options("test", "test");
    options.add_options()
        ("id", "", cxxopts::value<int>())
        ("sr", "", cxxopts::value<int>())
        ("sport", "", cxxopts::value<int>())
        ("saddr", "", cxxopts::value<std::string>())
        ("sp", "", cxxopts::value<bool>()->implicit_value("true"))
        ("algo", "", cxxopts::value<std::string>())
        ("record_results", "");
    std::vector<std::string> args = {"test", "--id", "7", "--sr", "500", "--sport", "9000", "--algo", "epaxos", "--sp"};
    std::vector<char*> ptrs;
    for (auto& a : args) ptrs.push_back(a.data());
    int argc = static_cast<int>(ptrs.size());
    char** argv = ptrs.data();
    auto result = options.parse(argc, argv);
    config_.overrideFromCommandLine(result);

    RunParameters p = config_.BuildRunParameters();
    EXPECT_EQ(p.client_id, 7);
    EXPECT_EQ(p.start_range, 500);
    EXPECT_EQ(p.server_port, 9000);
    EXPECT_EQ(p.protocol, Protocol::kFastPath);
    EXPECT_TRUE(p.separate);
    EXPECT_FALSE(p.record_results);
}

TEST_F(ConfigurationTest, ParseProtocolNames) {
    EXPECT_EQ(ParseProtocol("ABD"), Protocol::kAbd);
    EXPECT_EQ(ParseProtocol("epaxos"), Protocol::kFastPath);
    EXPECT_EQ(ParseProtocol("fastpath"), Protocol::kFastPath);
    EXPECT_THROW(ParseProtocol("paxos"), std::invalid_argument);
}
