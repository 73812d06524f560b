// src/data/csv_price_loader.cpp
#include "papertrade/data/csv_price_loader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include "papertrade/core/logger.hpp"
#include "papertrade/core/time_utils.hpp"

namespace papertrade {

namespace {

std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        field.erase(std::remove(field.begin(), field.end(), '\r'), field.end());
        field.erase(0, field.find_first_not_of(" \t\""));
        auto last = field.find_last_not_of(" \t\"");
        field.erase(last == std::string::npos ? 0 : last + 1);
        fields.push_back(field);
    }
    return fields;
}

std::optional<Timestamp> parse_time_field(const std::string& text) {
    const bool epoch_ms = !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (epoch_ms) {
        try {
            return from_epoch_ms(std::stoll(text));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return core::parse_timestamp(text);
}

}  // namespace

Result<std::vector<PriceSample>> CsvPriceLoader::load(const std::string& path,
                                                      Timeframe timeframe) {
    if (!std::filesystem::exists(path)) {
        return make_error<std::vector<PriceSample>>(ErrorCode::FILE_NOT_FOUND,
                                                    "Price file not found: " + path,
                                                    "CsvPriceLoader");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<std::vector<PriceSample>>(ErrorCode::FILE_IO_ERROR,
                                                    "Failed to open price file: " + path,
                                                    "CsvPriceLoader");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto result = parse(buffer.str(), timeframe);
    if (result.is_ok()) {
        INFO("Loaded " << result.value().size() << " " << timeframe_to_string(timeframe)
                       << " candles from " << path);
    }
    return result;
}

Result<std::vector<PriceSample>> CsvPriceLoader::parse(const std::string& content,
                                                       Timeframe timeframe) {
    std::istringstream in(content);
    std::string line;

    if (!std::getline(in, line)) {
        return make_error<std::vector<PriceSample>>(ErrorCode::INVALID_DATA, "Empty CSV input",
                                                    "CsvPriceLoader");
    }

    std::unordered_map<std::string, size_t> columns;
    auto header = split_row(line);
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    for (const char* name : {"timestamp", "open", "high", "low", "close", "volume"}) {
        if (!columns.count(name)) {
            return make_error<std::vector<PriceSample>>(
                ErrorCode::INVALID_DATA, std::string("Missing CSV column: ") + name,
                "CsvPriceLoader");
        }
    }

    std::vector<PriceSample> samples;
    size_t row = 1;
    while (std::getline(in, line)) {
        ++row;
        if (line.empty() || line == "\r") {
            continue;
        }
        auto fields = split_row(line);
        if (fields.size() < header.size()) {
            return make_error<std::vector<PriceSample>>(
                ErrorCode::INVALID_DATA, "Short row " + std::to_string(row), "CsvPriceLoader");
        }

        auto ts = parse_time_field(fields[columns["timestamp"]]);
        if (!ts) {
            return make_error<std::vector<PriceSample>>(
                ErrorCode::INVALID_DATA,
                "Bad timestamp on row " + std::to_string(row) + ": " +
                    fields[columns["timestamp"]],
                "CsvPriceLoader");
        }

        try {
            samples.emplace_back(*ts, std::stod(fields[columns["open"]]),
                                 std::stod(fields[columns["high"]]),
                                 std::stod(fields[columns["low"]]),
                                 std::stod(fields[columns["close"]]),
                                 std::stod(fields[columns["volume"]]), timeframe);
        } catch (const std::exception& e) {
            return make_error<std::vector<PriceSample>>(
                ErrorCode::INVALID_DATA,
                "Bad number on row " + std::to_string(row) + ": " + e.what(), "CsvPriceLoader");
        }
    }

    std::stable_sort(samples.begin(), samples.end(),
                     [](const PriceSample& a, const PriceSample& b) {
                         return a.timestamp < b.timestamp;
                     });
    samples.erase(std::unique(samples.begin(), samples.end(),
                              [](const PriceSample& a, const PriceSample& b) {
                                  return a.timestamp == b.timestamp;
                              }),
                  samples.end());

    return samples;
}

}  // namespace papertrade
