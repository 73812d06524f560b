// src/data/candle_aggregator.cpp
#include "papertrade/data/candle_aggregator.hpp"
#include <algorithm>
#include "papertrade/core/logger.hpp"

namespace papertrade {

CandleAggregator::CandleAggregator(Timeframe source, Timeframe target)
    : source_(source), target_(target) {}

bool CandleAggregator::can_aggregate(Timeframe source, Timeframe target) {
    const auto source_length = timeframe_duration(source).count();
    const auto target_length = timeframe_duration(target).count();
    return target_length >= source_length && target_length % source_length == 0;
}

Timestamp CandleAggregator::bucket_start(const Timestamp& ts, Timeframe timeframe) {
    const auto length =
        std::chrono::duration_cast<Timestamp::duration>(timeframe_duration(timeframe));
    return ts - (ts.time_since_epoch() % length);
}

std::vector<PriceSample> CandleAggregator::add(const PriceSample& sample) {
    if (target_ == source_) {
        return {sample};
    }

    std::vector<PriceSample> completed;
    const Timestamp start = bucket_start(sample.timestamp, target_);

    if (partial_) {
        if (start < partial_->timestamp) {
            DEBUG("Ignoring sample older than the " << timeframe_to_string(target_)
                                                   << " candle being built");
            return completed;
        }
        if (start > partial_->timestamp) {
            // The stream moved on before the closing sample of this bucket arrived
            completed.push_back(*partial_);
            partial_.reset();
        }
    }

    if (!partial_) {
        partial_ = PriceSample(start, sample.open, sample.high, sample.low, sample.close,
                               sample.volume, target_);
    } else {
        partial_->high = std::max(partial_->high, sample.high);
        partial_->low = std::min(partial_->low, sample.low);
        partial_->close = sample.close;
        partial_->volume += sample.volume;
    }

    if (sample.timestamp + timeframe_duration(source_) >= start + timeframe_duration(target_)) {
        completed.push_back(*partial_);
        partial_.reset();
    }
    return completed;
}

void CandleAggregator::reset(Timeframe target) {
    target_ = target;
    partial_.reset();
}

void CandleAggregator::restore(Timeframe target, std::optional<PriceSample> partial) {
    target_ = target;
    partial_ = std::move(partial);
}

}  // namespace papertrade
