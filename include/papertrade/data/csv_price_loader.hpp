// include/papertrade/data/csv_price_loader.hpp
#pragma once

#include <string>
#include <vector>
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"

namespace papertrade {

/**
 * @brief Reads OHLCV candles from CSV files
 *
 * Expected header: timestamp,open,high,low,close,volume. Extra columns
 * are ignored. Timestamps are either "YYYY-MM-DD HH:MM:SS" in UTC or
 * integer milliseconds since epoch.
 */
class CsvPriceLoader {
public:
    /**
     * @brief Load all rows of a file
     * @param path CSV file path
     * @param timeframe Timeframe assigned to every loaded sample
     * @return Samples sorted by timestamp, duplicates dropped
     */
    static Result<std::vector<PriceSample>> load(const std::string& path, Timeframe timeframe);

    /**
     * @brief Parse CSV text already in memory
     */
    static Result<std::vector<PriceSample>> parse(const std::string& content,
                                                  Timeframe timeframe);
};

}  // namespace papertrade
