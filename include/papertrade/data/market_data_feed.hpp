// include/papertrade/data/market_data_feed.hpp
#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"

namespace papertrade {

/**
 * @brief Source of price observations for a single instrument
 * Implementations must be safe to call from the decision loop and the
 * optimization scheduler at the same time
 */
class MarketDataFeed {
public:
    virtual ~MarketDataFeed() = default;

    /**
     * @brief Next unseen live sample for a timeframe
     * @param timeframe Timeframe of the requested sample
     * @return The sample, or nullopt when nothing new is available
     */
    virtual std::optional<PriceSample> next_sample(Timeframe timeframe) = 0;

    /**
     * @brief Historical samples in [start, end], ordered by timestamp
     * @param timeframe Timeframe to read
     * @param start Inclusive start of the range
     * @param end Inclusive end of the range
     * @return Samples, or DATA_NOT_FOUND when the timeframe has no history
     */
    virtual Result<std::vector<PriceSample>> historical_range(Timeframe timeframe,
                                                              const Timestamp& start,
                                                              const Timestamp& end) const = 0;

    /**
     * @brief Instrument this feed serves
     */
    virtual const std::string& symbol() const = 0;
};

/**
 * @brief In-memory feed replaying pushed or preloaded samples
 *
 * Live samples are queued per timeframe by push() and handed out once by
 * next_sample(). Every pushed sample is also appended to the history used
 * by historical_range(). Samples older than the latest one already
 * recorded for a timeframe are rejected; a repeated timestamp is kept.
 */
class ReplayMarketDataFeed : public MarketDataFeed {
public:
    explicit ReplayMarketDataFeed(std::string symbol = "BTCUSDT");

    std::optional<PriceSample> next_sample(Timeframe timeframe) override;

    Result<std::vector<PriceSample>> historical_range(Timeframe timeframe, const Timestamp& start,
                                                      const Timestamp& end) const override;

    const std::string& symbol() const override {
        return symbol_;
    }

    /**
     * @brief Queue a live sample
     * @return INVALID_DATA if the sample is malformed or out of order
     */
    Result<void> push(const PriceSample& sample);

    /**
     * @brief Queue a batch of live samples in order
     * Stops at the first rejected sample
     */
    Result<void> push_all(const std::vector<PriceSample>& samples);

    /**
     * @brief Add samples to history only, without queueing them for live use
     */
    Result<void> load_history(const std::vector<PriceSample>& samples);

    size_t pending(Timeframe timeframe) const;
    size_t history_size(Timeframe timeframe) const;

private:
    Result<void> validate_unsafe(const PriceSample& sample) const;

    std::string symbol_;
    std::map<Timeframe, std::deque<PriceSample>> pending_;
    std::map<Timeframe, std::vector<PriceSample>> history_;
    mutable std::mutex mutex_;
};

}  // namespace papertrade
