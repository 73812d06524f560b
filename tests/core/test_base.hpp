// tests/core/test_base.hpp
#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <vector>
#include "papertrade/core/logger.hpp"
#include "papertrade/core/state_manager.hpp"
#include "papertrade/core/types.hpp"

namespace papertrade {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        StateManager::reset_instance();
        if (!Logger::instance().is_initialized()) {
            LoggerConfig config;
            config.min_level = LogLevel::ERR;
            config.destination = LogDestination::CONSOLE;
            Logger::instance().initialize(config);
        }
    }

    void TearDown() override {
        StateManager::reset_instance();
    }
};

/**
 * @brief Fixed start time shared by generated series
 */
inline Timestamp test_epoch() {
    return from_epoch_ms(1704067200000LL);  // 2024-01-01 00:00:00 UTC
}

inline std::chrono::seconds timeframe_step(Timeframe tf) {
    return timeframe_duration(tf);
}

/**
 * @brief Candles whose open/high/low hug the given closes
 */
inline std::vector<PriceSample> make_series(const std::vector<double>& closes, Timeframe tf,
                                            Timestamp start = test_epoch()) {
    std::vector<PriceSample> samples;
    samples.reserve(closes.size());
    double prev = closes.empty() ? 0.0 : closes.front();
    for (size_t i = 0; i < closes.size(); ++i) {
        double close = closes[i];
        double high = std::max(prev, close) * 1.001;
        double low = std::min(prev, close) * 0.999;
        samples.emplace_back(start + timeframe_step(tf) * static_cast<int>(i), prev, high, low,
                             close, 1000.0 + static_cast<double>(i % 7) * 100.0, tf);
        prev = close;
    }
    return samples;
}

/**
 * @brief Oscillating series with drift, enough structure to trigger most strategies
 */
inline std::vector<PriceSample> make_wave_series(size_t count, Timeframe tf,
                                                 double base = 100.0, double drift = 0.0005,
                                                 Timestamp start = test_epoch()) {
    std::vector<double> closes;
    closes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        double t = static_cast<double>(i);
        closes.push_back(base * (1.0 + drift * t) *
                         (1.0 + 0.03 * std::sin(t / 6.0) + 0.01 * std::sin(t / 1.7)));
    }
    return make_series(closes, tf, start);
}

}  // namespace testing
}  // namespace papertrade
