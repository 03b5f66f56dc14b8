#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

#include <spindle/batch/batch_accumulator.h>

using namespace spindle::batch;

namespace {

FileOutcome outcome(std::size_t index, FileStatus status) {
    FileOutcome out;
    out.filePath = "f" + std::to_string(index) + ".tap";
    out.index = index;
    out.status = status;
    return out;
}

} // namespace

TEST(BatchAccumulatorTest, CountsAddUpAndOutcomesAreSortedByDiscovery) {
    BatchAccumulator acc(4);
    acc.record(outcome(2, FileStatus::Failed));
    acc.record(outcome(0, FileStatus::Updated));
    acc.record(outcome(3, FileStatus::Skipped));
    acc.record(outcome(1, FileStatus::Updated));

    auto summary = acc.finalize(false);
    EXPECT_EQ(summary.discovered, 4u);
    EXPECT_EQ(summary.total, 4u);
    EXPECT_EQ(summary.updatedCount, 2u);
    EXPECT_EQ(summary.skippedCount, 1u);
    EXPECT_EQ(summary.failedCount, 1u);
    EXPECT_FALSE(summary.cancelled);
    ASSERT_EQ(summary.outcomes.size(), 4u);
    for (std::size_t i = 0; i < summary.outcomes.size(); ++i) {
        EXPECT_EQ(summary.outcomes[i].index, i);
    }
}

TEST(BatchAccumulatorTest, CancelledRunReportsFewerThanDiscovered) {
    BatchAccumulator acc(5);
    acc.record(outcome(0, FileStatus::Updated));
    auto summary = acc.finalize(true);
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.discovered, 5u);
    EXPECT_EQ(summary.total, 1u);
}

TEST(BatchAccumulatorTest, SnapshotAndProgressEvents) {
    std::vector<ProgressEvent> events;
    BatchAccumulator acc(2, [&](const ProgressEvent& e) { events.push_back(e); });

    acc.record(outcome(1, FileStatus::Skipped));
    auto mid = acc.snapshot();
    EXPECT_EQ(mid.completed, 1u);
    EXPECT_EQ(mid.skipped, 1u);
    EXPECT_EQ(mid.discovered, 2u);

    acc.record(outcome(0, FileStatus::Updated));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].completed, 1u);
    EXPECT_EQ(events[1].completed, 2u);
    EXPECT_EQ(events[1].status, FileStatus::Updated);
    EXPECT_EQ(events[1].discovered, 2u);
}

TEST(BatchAccumulatorTest, ThrowingCallbackDoesNotLoseOutcome) {
    BatchAccumulator acc(1, [](const ProgressEvent&) { throw std::runtime_error("boom"); });
    EXPECT_NO_THROW(acc.record(outcome(0, FileStatus::Updated)));
    EXPECT_EQ(acc.finalize(false).updatedCount, 1u);
}

TEST(BatchAccumulatorTest, ConcurrentRecordersAreSerialized) {
    constexpr std::size_t kThreads = 8;
    constexpr std::size_t kPerThread = 250;
    std::size_t lastCompleted = 0;
    bool monotonic = true;
    BatchAccumulator acc(kThreads * kPerThread, [&](const ProgressEvent& e) {
        if (e.completed != lastCompleted + 1)
            monotonic = false;
        lastCompleted = e.completed;
    });

    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < kThreads; ++t) {
        threads.emplace_back([&acc, t]() {
            for (std::size_t i = 0; i < kPerThread; ++i) {
                acc.record(outcome(t * kPerThread + i, FileStatus::Updated));
            }
        });
    }
    for (auto& th : threads)
        th.join();

    EXPECT_TRUE(monotonic);
    auto summary = acc.finalize(false);
    EXPECT_EQ(summary.total, kThreads * kPerThread);
    EXPECT_EQ(summary.updatedCount, summary.total);
    EXPECT_EQ(summary.outcomes.back().index, kThreads * kPerThread - 1);
}
