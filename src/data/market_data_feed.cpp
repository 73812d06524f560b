// src/data/market_data_feed.cpp
#include "papertrade/data/market_data_feed.hpp"
#include <algorithm>
#include <cmath>
#include "papertrade/core/logger.hpp"

namespace papertrade {

ReplayMarketDataFeed::ReplayMarketDataFeed(std::string symbol) : symbol_(std::move(symbol)) {}

Result<void> ReplayMarketDataFeed::validate_unsafe(const PriceSample& sample) const {
    if (!std::isfinite(sample.close) || sample.close <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Sample close price must be positive",
                                "ReplayMarketDataFeed");
    }
    if (sample.high < sample.low) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Sample high is below low",
                                "ReplayMarketDataFeed");
    }

    auto it = history_.find(sample.timeframe);
    if (it != history_.end() && !it->second.empty() &&
        sample.timestamp < it->second.back().timestamp) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Out of order sample for timeframe " +
                                    timeframe_to_string(sample.timeframe),
                                "ReplayMarketDataFeed");
    }
    return Result<void>();
}

Result<void> ReplayMarketDataFeed::push(const PriceSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto valid = validate_unsafe(sample);
    if (valid.is_error()) {
        return valid;
    }
    history_[sample.timeframe].push_back(sample);
    pending_[sample.timeframe].push_back(sample);
    return Result<void>();
}

Result<void> ReplayMarketDataFeed::push_all(const std::vector<PriceSample>& samples) {
    for (const auto& sample : samples) {
        auto result = push(sample);
        if (result.is_error()) {
            return result;
        }
    }
    return Result<void>();
}

Result<void> ReplayMarketDataFeed::load_history(const std::vector<PriceSample>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sample : samples) {
        auto valid = validate_unsafe(sample);
        if (valid.is_error()) {
            return valid;
        }
        history_[sample.timeframe].push_back(sample);
    }
    DEBUG("Loaded " << samples.size() << " historical samples for " << symbol_);
    return Result<void>();
}

std::optional<PriceSample> ReplayMarketDataFeed::next_sample(Timeframe timeframe) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(timeframe);
    if (it == pending_.end() || it->second.empty()) {
        return std::nullopt;
    }
    PriceSample sample = it->second.front();
    it->second.pop_front();
    return sample;
}

Result<std::vector<PriceSample>> ReplayMarketDataFeed::historical_range(
    Timeframe timeframe, const Timestamp& start, const Timestamp& end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(timeframe);
    if (it == history_.end() || it->second.empty()) {
        return make_error<std::vector<PriceSample>>(
            ErrorCode::DATA_NOT_FOUND,
            "No history for " + symbol_ + " " + timeframe_to_string(timeframe),
            "ReplayMarketDataFeed");
    }

    const auto& samples = it->second;
    auto first = std::lower_bound(
        samples.begin(), samples.end(), start,
        [](const PriceSample& s, const Timestamp& ts) { return s.timestamp < ts; });
    auto last = std::upper_bound(
        first, samples.end(), end,
        [](const Timestamp& ts, const PriceSample& s) { return ts < s.timestamp; });

    return std::vector<PriceSample>(first, last);
}

size_t ReplayMarketDataFeed::pending(Timeframe timeframe) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(timeframe);
    return it == pending_.end() ? 0 : it->second.size();
}

size_t ReplayMarketDataFeed::history_size(Timeframe timeframe) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(timeframe);
    return it == history_.end() ? 0 : it->second.size();
}

}  // namespace papertrade
