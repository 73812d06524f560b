// include/papertrade/live/active_strategy_slot.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>
#include "papertrade/core/types.hpp"
#include "papertrade/strategy/types.hpp"

namespace papertrade {

/**
 * @brief Lock-free holder of an immutable value shared between threads
 *
 * Readers take a shared_ptr once and keep using it even if a writer
 * swaps in a new value meanwhile. Writers either store unconditionally
 * or compare-and-swap against the value they based their decision on.
 */
template <typename T>
class SwappableSlot {
public:
    using Ptr = std::shared_ptr<const T>;

    SwappableSlot() = default;
    explicit SwappableSlot(Ptr initial) : current_(std::move(initial)) {}

    SwappableSlot(const SwappableSlot&) = delete;
    SwappableSlot& operator=(const SwappableSlot&) = delete;

    Ptr load() const {
        return std::atomic_load(&current_);
    }

    void store(Ptr value) {
        std::atomic_store(&current_, std::move(value));
        swaps_.fetch_add(1);
    }

    /**
     * @brief Replace the value only if it is still expected
     * @param expected Value the caller observed; updated to the current
     * value when the swap fails
     * @return true if desired was installed
     */
    bool compare_and_swap(Ptr& expected, Ptr desired) {
        if (std::atomic_compare_exchange_strong(&current_, &expected, std::move(desired))) {
            swaps_.fetch_add(1);
            return true;
        }
        return false;
    }

    /**
     * @brief Number of successful stores and swaps
     */
    uint64_t generation() const {
        return swaps_.load();
    }

private:
    Ptr current_;
    std::atomic<uint64_t> swaps_{0};
};

/**
 * @brief The strategy the decision loop trades, with the evidence it was
 * chosen on
 */
struct ActiveStrategy {
    Strategy strategy;
    double score{0.0};
    std::vector<EquityPoint> backtest_curve;
    double backtest_win_rate{0.0};
    Timestamp activated_at;
};

using ActiveStrategySlot = SwappableSlot<ActiveStrategy>;

}  // namespace papertrade
