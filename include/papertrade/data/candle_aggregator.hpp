// include/papertrade/data/candle_aggregator.hpp
#pragma once

#include <optional>
#include <vector>
#include "papertrade/core/types.hpp"

namespace papertrade {

/**
 * @brief Builds candles of a longer timeframe from a stream of shorter ones
 *
 * Buckets are aligned to the epoch, so a 5m candle always starts on a
 * multiple of five minutes UTC and carries that start as its timestamp.
 * A candle is emitted as soon as the source sample that ends its bucket
 * arrives. If the stream skips ahead, the candle being built is emitted
 * with whatever it has before the new bucket starts.
 */
class CandleAggregator {
public:
    CandleAggregator(Timeframe source, Timeframe target);

    /**
     * @brief True when target candles can be built from source samples
     */
    static bool can_aggregate(Timeframe source, Timeframe target);

    /**
     * @brief Start of the candle of this timeframe containing ts
     */
    static Timestamp bucket_start(const Timestamp& ts, Timeframe timeframe);

    /**
     * @brief Fold one source sample in
     * @return Completed target candles, oldest first; the sample itself
     * when source and target are equal
     */
    std::vector<PriceSample> add(const PriceSample& sample);

    /**
     * @brief Switch to a new target timeframe, dropping the partial candle
     */
    void reset(Timeframe target);

    /**
     * @brief Resume from a saved partial candle
     */
    void restore(Timeframe target, std::optional<PriceSample> partial);

    Timeframe source() const {
        return source_;
    }

    Timeframe target() const {
        return target_;
    }

    const std::optional<PriceSample>& partial() const {
        return partial_;
    }

private:
    Timeframe source_;
    Timeframe target_;
    std::optional<PriceSample> partial_;
};

}  // namespace papertrade
