// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/batch.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace pubbatch::test {

namespace {

Message make_message(const std::string& payload) {
    return MessageBuilder::build(payload, Attributes{});
}

Thresholds thresholds(size_t max_count, size_t max_bytes) {
    Thresholds t;
    t.max_count = max_count;
    t.max_bytes = max_bytes;
    return t;
}

}  // namespace

// =============================================================================
// Thresholds
// =============================================================================

TEST(ThresholdsTest, DefaultsAreValid) {
    Thresholds t;
    EXPECT_EQ(t.max_bytes, 1000000u);
    EXPECT_EQ(t.max_count, 100u);
    EXPECT_EQ(t.max_delay, std::chrono::seconds(5));
    EXPECT_NO_THROW(t.validate());
}

TEST(ThresholdsTest, RejectsZeroCount) {
    EXPECT_THROW(BatchAccumulator{thresholds(0, 100)}, ConfigError);
}

TEST(ThresholdsTest, RejectsZeroBytes) {
    EXPECT_THROW(BatchAccumulator{thresholds(10, 0)}, ConfigError);
}

TEST(ThresholdsTest, RejectsNonPositiveDelay) {
    Thresholds t;
    t.max_delay = std::chrono::milliseconds(0);
    EXPECT_THROW(t.validate(), ConfigError);
}

TEST(ThresholdsTest, RejectsDelayAboveLimit) {
    Thresholds t;
    t.max_delay = Thresholds::kMaxDelayLimit;
    EXPECT_NO_THROW(t.validate());

    t.max_delay = Thresholds::kMaxDelayLimit + std::chrono::milliseconds(1);
    EXPECT_THROW(t.validate(), ConfigError);

    t.max_delay = std::chrono::milliseconds::max();
    EXPECT_THROW(t.validate(), ConfigError);
}

// =============================================================================
// BatchAccumulator
// =============================================================================

class BatchAccumulatorTest : public ::testing::Test {
protected:
    BatchAccumulator accumulator_{thresholds(3, 1000000)};
};

TEST_F(BatchAccumulatorTest, InitiallyEmpty) {
    EXPECT_TRUE(accumulator_.empty());
    EXPECT_EQ(accumulator_.current().message_count(), 0u);
    EXPECT_EQ(accumulator_.current().total_byte_size(), 0u);
}

TEST_F(BatchAccumulatorTest, BelowThresholdsAccepted) {
    EXPECT_EQ(accumulator_.append(make_message("a")), AppendResult::Accepted);
    EXPECT_EQ(accumulator_.append(make_message("b")), AppendResult::Accepted);
    EXPECT_EQ(accumulator_.current().message_count(), 2u);
}

TEST_F(BatchAccumulatorTest, CountThresholdSignalsFull) {
    accumulator_.append(make_message("a"));
    accumulator_.append(make_message("b"));
    AppendResult result = accumulator_.append(make_message("c"));

    EXPECT_EQ(result, AppendResult::CountReached);
    EXPECT_TRUE(is_full(result));
}

TEST_F(BatchAccumulatorTest, TotalsAreExact) {
    auto a = make_message("alpha");
    auto b = make_message("beta");
    size_t expected = a.byte_size() + b.byte_size();

    accumulator_.append(std::move(a));
    accumulator_.append(std::move(b));

    EXPECT_EQ(accumulator_.current().total_byte_size(), expected);
}

TEST_F(BatchAccumulatorTest, PreservesInsertionOrder) {
    accumulator_.append(make_message("1"));
    accumulator_.append(make_message("2"));
    accumulator_.append(make_message("3"));

    auto batch = accumulator_.take();
    ASSERT_EQ(batch->message_count(), 3u);
    EXPECT_EQ(batch->messages()[0].payload(), "1");
    EXPECT_EQ(batch->messages()[1].payload(), "2");
    EXPECT_EQ(batch->messages()[2].payload(), "3");
}

TEST_F(BatchAccumulatorTest, TakeInstallsFreshBatch) {
    accumulator_.append(make_message("a"));
    uint64_t first_id = accumulator_.current().id();

    auto batch = accumulator_.take();
    EXPECT_EQ(batch->id(), first_id);
    EXPECT_TRUE(accumulator_.empty());
    EXPECT_NE(accumulator_.current().id(), first_id);
}

TEST_F(BatchAccumulatorTest, CreatedAtSetByFirstAppend) {
    auto before = std::chrono::steady_clock::now();
    accumulator_.append(make_message("a"));
    auto created = accumulator_.current().created_at();
    EXPECT_GE(created, before);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    accumulator_.append(make_message("b"));
    EXPECT_EQ(accumulator_.current().created_at(), created);
}

TEST(BatchAccumulatorBytesTest, ByteThresholdSignalsFull) {
    auto probe = make_message(std::string(40, 'x'));
    BatchAccumulator accumulator(thresholds(100, probe.byte_size() * 2));

    EXPECT_EQ(accumulator.append(make_message(std::string(40, 'x'))), AppendResult::Accepted);
    EXPECT_EQ(accumulator.append(make_message(std::string(40, 'x'))), AppendResult::BytesReached);
}

TEST(BatchAccumulatorBytesTest, OversizedMessageStillAppended) {
    BatchAccumulator accumulator(thresholds(100, 10));

    AppendResult result = accumulator.append(make_message(std::string(500, 'x')));
    EXPECT_EQ(result, AppendResult::BytesReached);
    EXPECT_EQ(accumulator.current().message_count(), 1u);
    EXPECT_EQ(accumulator.current().messages()[0].payload().size(), 500u);
}

}  // namespace pubbatch::test
