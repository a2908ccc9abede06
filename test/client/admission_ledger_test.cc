#include <gtest/gtest.h>
#include "admission_ledger.h"
#include "response_queue.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace Replibench;
using namespace std::chrono_literals;

class AdmissionLedgerTest : public ::testing::Test {
protected:
    static RunDeadline Deadline(std::chrono::milliseconds ms) {
        return RunDeadline::StartingNow(ms);
    }
};

TEST_F(AdmissionLedgerTest, PermitLedgerBlocksAtCapacity) {
    PermitLedger ledger(2);
    RunDeadline deadline = Deadline(5s);

    ASSERT_TRUE(ledger.Reserve(1, deadline));
    ASSERT_TRUE(ledger.Reserve(1, deadline));
    EXPECT_EQ(ledger.Outstanding(), 2u);

    std::atomic<bool> admitted{false};
    std::thread waiter([&]() {
        admitted = ledger.Reserve(1, deadline);
    });
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(admitted.load());

    ledger.Release(1);
    waiter.join();
    EXPECT_TRUE(admitted.load());
    EXPECT_EQ(ledger.Outstanding(), 2u);
}

TEST_F(AdmissionLedgerTest, PermitLedgerGivesUpAtDeadline) {
    PermitLedger ledger(1);
    RunDeadline deadline = Deadline(100ms);
    ASSERT_TRUE(ledger.Reserve(1, deadline));

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ledger.Reserve(1, deadline));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
    EXPECT_EQ(ledger.Outstanding(), 1u);
}

TEST_F(AdmissionLedgerTest, PermitLedgerNeverExceedsCapacity) {
    PermitLedger ledger(3);
    RunDeadline deadline = Deadline(5s);
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 6; t++) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 50; i++) {
                ASSERT_TRUE(ledger.Reserve(1, deadline));
                int now = ++in_flight;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::yield();
                --in_flight;
                ledger.Release(1);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(ledger.Outstanding(), 0u);
}

TEST_F(AdmissionLedgerTest, ReleaseBeyondOutstandingIsClamped) {
    PermitLedger ledger(2);
    ASSERT_TRUE(ledger.Reserve(1, Deadline(1s)));
    ledger.Release(5);
    EXPECT_EQ(ledger.Outstanding(), 0u);
}

TEST_F(AdmissionLedgerTest, CountLedgerAnnouncesInOrder) {
    CountLedger ledger(4);
    RunDeadline deadline = Deadline(5s);

    ASSERT_TRUE(ledger.Reserve(3, deadline));
    ASSERT_TRUE(ledger.Reserve(1, deadline));
    EXPECT_EQ(ledger.Outstanding(), 4u);
    EXPECT_EQ(ledger.PendingAnnouncements(), 2u);

    EXPECT_EQ(ledger.Claim(deadline), std::optional<size_t>(3));
    ledger.Release(3);
    EXPECT_EQ(ledger.Claim(deadline), std::optional<size_t>(1));
    EXPECT_EQ(ledger.Outstanding(), 1u);
    ledger.Release(1);
    EXPECT_EQ(ledger.Outstanding(), 0u);
}

TEST_F(AdmissionLedgerTest, CountLedgerBoundsPendingAnnouncements) {
    CountLedger ledger(1);
    RunDeadline deadline = Deadline(5s);
    ASSERT_TRUE(ledger.Reserve(10, deadline));

    std::atomic<bool> announced{false};
    std::thread issuer([&]() {
        announced = ledger.Reserve(10, deadline);
    });
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(announced.load());

    EXPECT_EQ(ledger.Claim(deadline), std::optional<size_t>(10));
    issuer.join();
    EXPECT_TRUE(announced.load());
}

TEST_F(AdmissionLedgerTest, CountLedgerClaimTimesOut) {
    CountLedger ledger(2);
    EXPECT_FALSE(ledger.Claim(Deadline(50ms)).has_value());
}

TEST_F(AdmissionLedgerTest, PacingIntervalNeverZero) {
    RunParameters params;
    params.duration_s = 10;
    params.request_count = 999;
    params.batch_size = 10;
    // 999 / 10 + 1 = 100 batches over 10 s
    EXPECT_EQ(PacingTimer::BatchInterval(params), 100ms);

    params.duration_s = 1;
    params.request_count = 1000000000000LL;
    params.batch_size = 1;
    EXPECT_EQ(PacingTimer::BatchInterval(params), PacingTimer::kMinInterval);

    params.request_count = 0;
    EXPECT_EQ(PacingTimer::BatchInterval(params), 1s);
}

TEST_F(AdmissionLedgerTest, PacingTimerTicksPeriodically) {
    RunDeadline deadline = Deadline(5s);
    auto start = RunDeadline::Clock::now();
    PacingTimer timer(20ms, start);

    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(timer.WaitForTick(deadline));
    }
    auto elapsed = RunDeadline::Clock::now() - start;
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 1s);
}

TEST_F(AdmissionLedgerTest, PacingTimerDropsMissedTicks) {
    RunDeadline deadline = Deadline(5s);
    auto start = RunDeadline::Clock::now();
    PacingTimer timer(20ms, start);

    std::this_thread::sleep_for(110ms);
    // One tick was buffered; the other missed ones are gone.
    auto before = RunDeadline::Clock::now();
    ASSERT_TRUE(timer.WaitForTick(deadline));
    EXPECT_LT(RunDeadline::Clock::now() - before, 5ms);
    ASSERT_TRUE(timer.WaitForTick(deadline));
    EXPECT_GE(RunDeadline::Clock::now() - start, 120ms);
}

TEST_F(AdmissionLedgerTest, PacingTimerStopsAtDeadline) {
    RunDeadline deadline = Deadline(30ms);
    PacingTimer timer(1s, RunDeadline::Clock::now());
    auto start = RunDeadline::Clock::now();
    EXPECT_FALSE(timer.WaitForTick(deadline));
    EXPECT_LT(RunDeadline::Clock::now() - start, 500ms);
}

TEST_F(AdmissionLedgerTest, ResponseQueueHandsOverEvents) {
    ResponseQueue queue(2);
    RunDeadline deadline = Deadline(5s);

    std::thread producer([&]() {
        for (int64_t tid = 1; tid <= 5; tid++) {
            wire::Response resp;
            resp.tid = tid;
            ASSERT_TRUE(queue.Push(DecodeEvent::Decoded(resp)));
        }
        ASSERT_TRUE(queue.Push(DecodeEvent::Failed()));
    });

    for (int64_t tid = 1; tid <= 5; tid++) {
        auto ev = queue.Pop(deadline);
        ASSERT_TRUE(ev.has_value());
        EXPECT_EQ(ev->kind, DecodeEvent::Kind::kDecoded);
        EXPECT_EQ(ev->response.tid, tid);
    }
    auto failed = queue.Pop(deadline);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->kind, DecodeEvent::Kind::kDecodeFailed);
    producer.join();

    EXPECT_FALSE(queue.Pop(Deadline(20ms)).has_value());
}

TEST_F(AdmissionLedgerTest, ClosedResponseQueueReleasesProducer) {
    ResponseQueue queue(1);
    ASSERT_TRUE(queue.Push(DecodeEvent::Failed()));

    std::atomic<bool> pushed{true};
    std::thread producer([&]() {
        pushed = queue.Push(DecodeEvent::Failed());
    });
    std::this_thread::sleep_for(20ms);
    queue.Close();
    producer.join();
    EXPECT_FALSE(pushed.load());
}
