// tests/data/test_market_data_feed.cpp
#include <gtest/gtest.h>
#include <thread>
#include "core/test_base.hpp"
#include "papertrade/data/market_data_feed.hpp"

using namespace papertrade;
using namespace papertrade::testing;

class MarketDataFeedTest : public TestBase {
protected:
    ReplayMarketDataFeed feed_{"BTCUSDT"};
};

TEST_F(MarketDataFeedTest, EmptyFeedHasNoSample) {
    EXPECT_FALSE(feed_.next_sample(Timeframe::SECOND_1).has_value());
    EXPECT_EQ(feed_.pending(Timeframe::SECOND_1), 0u);
}

TEST_F(MarketDataFeedTest, SamplesAreHandedOutOnceInOrder) {
    auto samples = make_series({100.0, 101.0, 102.0}, Timeframe::SECOND_1);
    ASSERT_TRUE(feed_.push_all(samples).is_ok());
    EXPECT_EQ(feed_.pending(Timeframe::SECOND_1), 3u);

    for (double expected : {100.0, 101.0, 102.0}) {
        auto sample = feed_.next_sample(Timeframe::SECOND_1);
        ASSERT_TRUE(sample.has_value());
        EXPECT_DOUBLE_EQ(sample->close, expected);
    }
    EXPECT_FALSE(feed_.next_sample(Timeframe::SECOND_1).has_value());
    EXPECT_EQ(feed_.history_size(Timeframe::SECOND_1), 3u);
}

TEST_F(MarketDataFeedTest, TimeframesAreIndependent) {
    ASSERT_TRUE(feed_.push(make_series({100.0}, Timeframe::MINUTE_5)[0]).is_ok());

    EXPECT_FALSE(feed_.next_sample(Timeframe::SECOND_1).has_value());
    EXPECT_TRUE(feed_.next_sample(Timeframe::MINUTE_5).has_value());
}

TEST_F(MarketDataFeedTest, RejectsOutOfOrderSample) {
    auto samples = make_series({100.0, 101.0}, Timeframe::MINUTE_1);
    ASSERT_TRUE(feed_.push(samples[1]).is_ok());

    auto result = feed_.push(samples[0]);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);

}

TEST_F(MarketDataFeedTest, AcceptsRepeatedTimestamp) {
    auto samples = make_series({100.0, 101.0}, Timeframe::SECOND_1);
    PriceSample repeat = samples[1];
    repeat.close = 101.5;
    repeat.high = 102.0;

    ASSERT_TRUE(feed_.push_all(samples).is_ok());
    ASSERT_TRUE(feed_.push(repeat).is_ok());
    EXPECT_EQ(feed_.pending(Timeframe::SECOND_1), 3u);

    feed_.next_sample(Timeframe::SECOND_1);
    feed_.next_sample(Timeframe::SECOND_1);
    auto last = feed_.next_sample(Timeframe::SECOND_1);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->timestamp, samples[1].timestamp);
    EXPECT_DOUBLE_EQ(last->close, 101.5);

    // Older than the latest is still rejected
    EXPECT_TRUE(feed_.push(samples[0]).is_error());
}

TEST_F(MarketDataFeedTest, RejectsMalformedSample) {
    PriceSample bad(test_epoch(), 100.0, 99.0, 101.0, 100.0, 10.0, Timeframe::MINUTE_1);
    EXPECT_TRUE(feed_.push(bad).is_error());

    PriceSample zero(test_epoch(), 0.0, 0.0, 0.0, 0.0, 0.0, Timeframe::MINUTE_1);
    EXPECT_TRUE(feed_.push(zero).is_error());
}

TEST_F(MarketDataFeedTest, LoadHistoryDoesNotQueueLiveSamples) {
    ASSERT_TRUE(feed_.load_history(make_series({1.0, 2.0, 3.0}, Timeframe::HOUR_1)).is_ok());
    EXPECT_EQ(feed_.history_size(Timeframe::HOUR_1), 3u);
    EXPECT_FALSE(feed_.next_sample(Timeframe::HOUR_1).has_value());
}

TEST_F(MarketDataFeedTest, HistoricalRangeIsInclusive) {
    auto samples = make_series({1.0, 2.0, 3.0, 4.0, 5.0}, Timeframe::MINUTE_5);
    ASSERT_TRUE(feed_.load_history(samples).is_ok());

    auto range = feed_.historical_range(Timeframe::MINUTE_5, samples[1].timestamp,
                                        samples[3].timestamp);
    ASSERT_TRUE(range.is_ok());
    ASSERT_EQ(range.value().size(), 3u);
    EXPECT_DOUBLE_EQ(range.value().front().close, 2.0);
    EXPECT_DOUBLE_EQ(range.value().back().close, 4.0);

    auto all = feed_.historical_range(Timeframe::MINUTE_5, Timestamp::min(), Timestamp::max());
    ASSERT_TRUE(all.is_ok());
    EXPECT_EQ(all.value().size(), 5u);
}

TEST_F(MarketDataFeedTest, MissingHistoryIsDataNotFound) {
    auto range = feed_.historical_range(Timeframe::DAILY, Timestamp::min(), Timestamp::max());
    ASSERT_TRUE(range.is_error());
    EXPECT_EQ(range.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(MarketDataFeedTest, ConcurrentProducerAndConsumer) {
    auto samples = make_series(std::vector<double>(500, 100.0), Timeframe::SECOND_1);
    size_t consumed = 0;

    std::thread producer([&]() {
        for (const auto& s : samples) {
            ASSERT_TRUE(feed_.push(s).is_ok());
        }
    });
    std::thread reader([&]() {
        for (int i = 0; i < 200; ++i) {
            auto range = feed_.historical_range(Timeframe::SECOND_1, Timestamp::min(),
                                                Timestamp::max());
            (void)range;
        }
    });
    while (consumed < samples.size()) {
        if (feed_.next_sample(Timeframe::SECOND_1)) {
            ++consumed;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    reader.join();

    EXPECT_EQ(consumed, samples.size());
    EXPECT_EQ(feed_.history_size(Timeframe::SECOND_1), samples.size());
}
