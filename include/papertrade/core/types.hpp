// include/papertrade/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace papertrade {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for position sizes, fractional units allowed
 */
using Quantity = double;

/**
 * @brief Equity curve point (timestamp, portfolio value)
 */
using EquityPoint = std::pair<Timestamp, double>;

/**
 * @brief Candle timeframe
 * Each timeframe is an independent ordered sequence over the same instrument
 */
enum class Timeframe {
    SECOND_1,  // live ticks
    MINUTE_1,
    MINUTE_5,
    MINUTE_15,
    HOUR_1,
    HOUR_4,
    DAILY
};

inline std::string timeframe_to_string(Timeframe tf) {
    switch (tf) {
        case Timeframe::SECOND_1:
            return "1s";
        case Timeframe::MINUTE_1:
            return "1m";
        case Timeframe::MINUTE_5:
            return "5m";
        case Timeframe::MINUTE_15:
            return "15m";
        case Timeframe::HOUR_1:
            return "1h";
        case Timeframe::HOUR_4:
            return "4h";
        case Timeframe::DAILY:
            return "1d";
        default:
            return "1d";
    }
}

/**
 * @brief Parse a timeframe suffix ("5m", "1h", ...)
 * @return Parsed timeframe, or nullopt if unknown
 */
inline std::optional<Timeframe> timeframe_from_string(const std::string& s) {
    if (s == "1s")
        return Timeframe::SECOND_1;
    if (s == "1m")
        return Timeframe::MINUTE_1;
    if (s == "5m")
        return Timeframe::MINUTE_5;
    if (s == "15m")
        return Timeframe::MINUTE_15;
    if (s == "1h")
        return Timeframe::HOUR_1;
    if (s == "4h")
        return Timeframe::HOUR_4;
    if (s == "1d")
        return Timeframe::DAILY;
    return std::nullopt;
}

/**
 * @brief Length of one candle
 */
inline std::chrono::seconds timeframe_duration(Timeframe tf) {
    switch (tf) {
        case Timeframe::SECOND_1:
            return std::chrono::seconds(1);
        case Timeframe::MINUTE_1:
            return std::chrono::seconds(60);
        case Timeframe::MINUTE_5:
            return std::chrono::seconds(300);
        case Timeframe::MINUTE_15:
            return std::chrono::seconds(900);
        case Timeframe::HOUR_1:
            return std::chrono::seconds(3600);
        case Timeframe::HOUR_4:
            return std::chrono::seconds(14400);
        default:
            return std::chrono::seconds(86400);
    }
}

/**
 * @brief OHLCV observation for one timeframe
 * Immutable once recorded
 */
struct PriceSample {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    Timeframe timeframe{Timeframe::MINUTE_5};

    PriceSample() = default;
    PriceSample(Timestamp ts, Price o, Price h, Price l, Price c, double v, Timeframe tf)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), timeframe(tf) {}
};

/**
 * @brief Directional view of a signal or position
 */
enum class Direction { LONG, SHORT, FLAT };

inline std::string direction_to_string(Direction d) {
    switch (d) {
        case Direction::LONG:
            return "LONG";
        case Direction::SHORT:
            return "SHORT";
        default:
            return "FLAT";
    }
}

inline Direction direction_from_string(const std::string& s) {
    if (s == "LONG")
        return Direction::LONG;
    if (s == "SHORT")
        return Direction::SHORT;
    return Direction::FLAT;
}

/**
 * @brief +1 for long, -1 for short, 0 for flat
 */
inline double direction_sign(Direction d) {
    switch (d) {
        case Direction::LONG:
            return 1.0;
        case Direction::SHORT:
            return -1.0;
        default:
            return 0.0;
    }
}

/**
 * @brief What the signal asks for: a new entry or closing the open position
 */
enum class SignalIntent { ENTRY, CLOSE };

/**
 * @brief Output of a strategy evaluation
 * "No signal" is FLAT with zero confidence
 */
struct Signal {
    Direction direction{Direction::FLAT};
    double confidence{0.0};  // [0, 1]
    std::string strategy_id;
    Timestamp timestamp;
    SignalIntent intent{SignalIntent::ENTRY};
    std::string reason;

    bool is_flat() const {
        return direction == Direction::FLAT;
    }

    static Signal none(std::string strategy_id, Timestamp ts) {
        Signal s;
        s.strategy_id = std::move(strategy_id);
        s.timestamp = ts;
        return s;
    }
};

/**
 * @brief Order action understood by the ledger
 */
enum class OrderAction { OPEN, CLOSE };

/**
 * @brief Bounded order produced by risk sizing and consumed by the ledger
 */
struct Order {
    OrderAction action{OrderAction::OPEN};
    Direction direction{Direction::FLAT};
    double size_fraction{0.0};  // fraction of equity at sizing time
    double notional{0.0};       // size_fraction * equity
    Quantity quantity{0.0};     // notional / entry_price
    Price stop_loss{0.0};
    Price take_profit{0.0};
    Price entry_price{0.0};
    Timestamp opened_at;
    std::string strategy_id;
};

/**
 * @brief Why a position was closed
 */
enum class ExitReason { STOP_LOSS, TAKE_PROFIT, SIGNAL_CLOSE, MANUAL };

inline std::string exit_reason_to_string(ExitReason r) {
    switch (r) {
        case ExitReason::STOP_LOSS:
            return "STOP_LOSS";
        case ExitReason::TAKE_PROFIT:
            return "TAKE_PROFIT";
        case ExitReason::SIGNAL_CLOSE:
            return "SIGNAL_CLOSE";
        default:
            return "MANUAL";
    }
}

inline ExitReason exit_reason_from_string(const std::string& s) {
    if (s == "STOP_LOSS")
        return ExitReason::STOP_LOSS;
    if (s == "TAKE_PROFIT")
        return ExitReason::TAKE_PROFIT;
    if (s == "SIGNAL_CLOSE")
        return ExitReason::SIGNAL_CLOSE;
    return ExitReason::MANUAL;
}

/**
 * @brief Closed position record, append-only in the trade history
 */
struct Trade {
    Direction direction{Direction::FLAT};
    Price entry_price{0.0};
    Price exit_price{0.0};
    Timestamp entry_time;
    Timestamp exit_time;
    double size_fraction{0.0};
    double notional{0.0};
    Quantity quantity{0.0};
    double realized_pnl{0.0};  // net of fees
    double fees{0.0};
    std::string strategy_id;
    ExitReason exit_reason{ExitReason::MANUAL};

    std::chrono::seconds duration() const {
        return std::chrono::duration_cast<std::chrono::seconds>(exit_time - entry_time);
    }

    bool is_win() const {
        return realized_pnl > 0.0;
    }
};

/**
 * @brief Convert a timestamp to milliseconds since epoch for serialization
 */
inline int64_t to_epoch_ms(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

}  // namespace papertrade
