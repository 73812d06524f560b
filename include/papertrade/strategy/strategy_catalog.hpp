// include/papertrade/strategy/strategy_catalog.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <random>
#include <vector>
#include "papertrade/strategy/types.hpp"

namespace papertrade {

/**
 * @brief Source of strategy candidates
 *
 * Hands out the default population and derives new parameter sets from
 * existing strategies. Every strategy it creates gets the next discovery
 * sequence number, so a catalog seeded the same way produces the same
 * sequence of candidates.
 */
class StrategyCatalog {
public:
    explicit StrategyCatalog(uint64_t seed = 42);

    /**
     * @brief Standard parameter sets for one timeframe
     * RSI, MACD, SMA/EMA crossovers, Bollinger reversion and momentum
     */
    std::vector<Strategy> default_population(Timeframe timeframe);

    /**
     * @brief Derive neighbouring parameter sets from a strategy
     * @param base Strategy to perturb
     * @param count Number of variants requested
     * @return Valid variants whose ids differ from base, possibly fewer
     * than count when perturbations collide or fail validation
     */
    std::vector<Strategy> perturb(const Strategy& base, size_t count);

    uint64_t next_sequence() const {
        return next_seq_.load();
    }

    /**
     * @brief Keep issued sequence numbers above a restored strategy's
     */
    void observe_sequence(uint64_t seq);

private:
    StrategyParams perturb_params(const StrategyParams& params);

    std::mt19937_64 rng_;
    std::atomic<uint64_t> next_seq_{1};
};

}  // namespace papertrade
