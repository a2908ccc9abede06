#include <gtest/gtest.h>
#include "bench_runner.h"
#include "fast_path_client.h"

#include <chrono>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include <sys/socket.h>

using namespace Replibench;
using namespace std::chrono_literals;

namespace {

// Replica stand-in: answers every Propose with one ProposeReply echoing its
// command id and timestamp, optionally after a delay.
class FakeFastPathReplica {
public:
    explicit FakeFastPathReplica(int fd, std::chrono::milliseconds reply_delay = 0ms)
        : conn_(fd), reply_delay_(reply_delay) {
        thread_ = std::thread([this]() { Serve(); });
    }
    ~FakeFastPathReplica() {
        if (thread_.joinable()) thread_.join();
    }

    void Join() { thread_.join(); }

    std::vector<wire::ProposeMessage> received;
    int64_t replied = 0;

private:
    void Serve() {
        wire::ProposeMessage msg;
        while (wire::ReadPropose(conn_.input(), &msg) == wire::ReadStatus::kOk) {
            received.push_back(msg);
            if (reply_delay_ > 0ms) {
                std::this_thread::sleep_for(reply_delay_);
            }
            wire::ProposeReply reply;
            reply.ok = 1;
            reply.command_id = msg.command_id;
            reply.value = msg.command.value;
            reply.timestamp = msg.timestamp;
            if (!wire::WriteProposeReply(reply, conn_.output()) || !conn_.Flush()) {
                return;
            }
            replied++;
        }
    }

    Connection conn_;
    std::chrono::milliseconds reply_delay_;
    std::thread thread_;
};

wire::ProposeReply MakeReply(int32_t command_id) {
    wire::ProposeReply reply;
    reply.ok = 1;
    reply.command_id = command_id;
    reply.timestamp = MakeTimestamp();
    return reply;
}

} // namespace

class FastPathClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.client_id = 0;
        params_.protocol = Protocol::kFastPath;
        params_.batch_size = 5;
        params_.concurrency = 2;
        params_.request_count = 20;
        params_.duration_s = 2;
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds_), 0);
    }

    RunParameters params_;
    int fds_[2];
};

TEST_F(FastPathClientTest, EndToEndEveryProposeIsAcknowledged) {
    auto replica = std::make_unique<FakeFastPathReplica>(fds_[1]);

    BenchRunner runner(params_);
    RunReport report = runner.Run(std::make_unique<Connection>(fds_[0]));
    replica->Join();

    EXPECT_EQ(report.ack_num, 20);
    EXPECT_EQ(report.throughput, 10);
    // Replies do not tell reads from writes; every ack counts as a read.
    EXPECT_EQ(report.read_num, report.ack_num);
    EXPECT_EQ(report.non_read_num, 0);
    EXPECT_EQ(report.decode_failures, 0);
    EXPECT_EQ(report.outstanding_batches, 0u);
    EXPECT_EQ(runner.summary().latencies.size(), 20u);

    ASSERT_EQ(replica->received.size(), 20u);
    for (size_t begin = 0; begin < 20; begin += 5) {
        std::set<int64_t> timestamps;
        for (size_t i = begin; i < begin + 5; i++) {
            EXPECT_EQ(replica->received[i].command_id, static_cast<int32_t>(i));
            timestamps.insert(replica->received[i].timestamp);
        }
        EXPECT_EQ(timestamps.size(), 1u) << "batch starting at " << begin;
    }
}

TEST_F(FastPathClientTest, TruncatedReplyIsCountedAndSkipped) {
    CountLedger ledger(2);
    RunDeadline deadline = RunDeadline::StartingNow(300ms);
    auto client = std::make_unique<Connection>(fds_[0]);
    {
        Connection replica(fds_[1]);
        ASSERT_TRUE(wire::WriteProposeReply(MakeReply(0), replica.output()));
        ASSERT_TRUE(wire::WriteProposeReply(MakeReply(1), replica.output()));
        ASSERT_TRUE(replica.Flush());
        const char partial[] = {1, 2, 0, 0};
        ASSERT_EQ(send(fds_[1], partial, sizeof(partial), 0), static_cast<ssize_t>(sizeof(partial)));
    }

    ASSERT_TRUE(ledger.Reserve(3, deadline));
    FastPathResponseCollector collector(params_, &ledger, deadline, client.get());
    Summary s = collector.Run();

    EXPECT_EQ(s.ack_num, 2);
    EXPECT_EQ(s.latencies.size(), 2u);
    EXPECT_EQ(s.decode_failures, 1);
    EXPECT_EQ(s.outstanding_batches, 0u);
}

TEST_F(FastPathClientTest, ClosedStreamStopsCollector) {
    CountLedger ledger(2);
    RunDeadline deadline = RunDeadline::StartingNow(30s);
    auto client = std::make_unique<Connection>(fds_[0]);
    {
        Connection replica(fds_[1]);
        ASSERT_TRUE(wire::WriteProposeReply(MakeReply(0), replica.output()));
        ASSERT_TRUE(replica.Flush());
    }

    ASSERT_TRUE(ledger.Reserve(5, deadline));
    FastPathResponseCollector collector(params_, &ledger, deadline, client.get());

    auto start = std::chrono::steady_clock::now();
    Summary s = collector.Run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(s.ack_num, 1);
    EXPECT_EQ(s.decode_failures, 0);
    EXPECT_EQ(ledger.Outstanding(), 0u);
}

TEST_F(FastPathClientTest, BlockedReadEndsWhenConnectionShutsDown) {
    CountLedger ledger(4);
    RunDeadline deadline = RunDeadline::StartingNow(30s);
    auto client = std::make_unique<Connection>(fds_[0]);
    Connection replica(fds_[1]);
    for (int32_t id = 0; id < 5; id++) {
        ASSERT_TRUE(wire::WriteProposeReply(MakeReply(id), replica.output()));
    }
    ASSERT_TRUE(replica.Flush());

    // Two batches announced, only the first one answered.
    ASSERT_TRUE(ledger.Reserve(5, deadline));
    ASSERT_TRUE(ledger.Reserve(5, deadline));

    std::thread closer([&]() {
        std::this_thread::sleep_for(200ms);
        client->Shutdown();
    });
    FastPathResponseCollector collector(params_, &ledger, deadline, client.get());
    Summary s = collector.Run();
    closer.join();

    EXPECT_EQ(s.ack_num, 5);
    EXPECT_EQ(s.latencies.size(), 5u);
    EXPECT_EQ(ledger.Outstanding(), 0u);
}

TEST_F(FastPathClientTest, EndToEndStopsWhenRunTimeElapses) {
    params_.batch_size = 1;
    params_.concurrency = 2;
    params_.request_count = 10000;
    params_.duration_s = 1;
    auto replica = std::make_unique<FakeFastPathReplica>(fds_[1], 5ms);

    BenchRunner runner(params_);
    auto start = std::chrono::steady_clock::now();
    RunReport report = runner.Run(std::make_unique<Connection>(fds_[0]));
    auto elapsed = std::chrono::steady_clock::now() - start;
    replica->Join();

    EXPECT_GE(elapsed, 900ms);
    EXPECT_LT(elapsed, std::chrono::seconds(params_.duration_s) + BenchRunner::kShutdownGrace + 1s);

    EXPECT_LT(runner.issued_operations(), params_.request_count);
    EXPECT_GT(report.ack_num, 0);
    EXPECT_LE(report.ack_num, replica->replied);
    EXPECT_LE(report.ack_num, runner.issued_operations());
    EXPECT_EQ(runner.summary().latencies.size(), static_cast<size_t>(report.ack_num));
}
