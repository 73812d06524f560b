// tests/engine/test_engine_config.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "core/test_base.hpp"
#include "papertrade/engine/engine_config.hpp"

using namespace papertrade;
using namespace papertrade::testing;

class EngineConfigTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        dir_ = std::filesystem::temp_directory_path() / "papertrade_engine_config_test";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
        TestBase::TearDown();
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    RiskPolicy policy = config.resolved_policy();
    EXPECT_DOUBLE_EQ(policy.starting_balance, 100000.0);
    EXPECT_DOUBLE_EQ(policy.max_position_fraction, 0.20);
}

TEST_F(EngineConfigTest, ProfilePresetWithOverrides) {
    EngineConfig config;
    config.risk_profile = RiskProfile::CONSERVATIVE;
    config.risk_overrides = {{"fee_rate", 0.001}, {"stop_loss_pct", 0.01}};

    RiskPolicy policy = config.resolved_policy();
    EXPECT_DOUBLE_EQ(policy.starting_balance, 200000.0);
    EXPECT_DOUBLE_EQ(policy.max_position_fraction, 0.10);
    EXPECT_DOUBLE_EQ(policy.min_confidence, 0.8);
    EXPECT_DOUBLE_EQ(policy.fee_rate, 0.001);
    EXPECT_DOUBLE_EQ(policy.stop_loss_pct, 0.01);
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(EngineConfigTest, LoadsFromFile) {
    auto path = write("engine.json", R"({
        "symbol": "ETHUSDT",
        "risk_profile": "AGGRESSIVE",
        "decision_loop": {"timeframe": "1m", "tick_interval": 0.5},
        "scheduler": {"timeframes": ["15m", "1h"], "optimization_period": 300},
        "historical_data": {"15m": "data/ETHUSDT_15m.csv"},
        "state_file": "state/eth.json"
    })");

    EngineConfig config;
    auto result = config.load_from_file(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    EXPECT_EQ(config.symbol, "ETHUSDT");
    EXPECT_EQ(config.risk_profile, RiskProfile::AGGRESSIVE);
    EXPECT_EQ(config.decision_loop.timeframe, Timeframe::MINUTE_1);
    EXPECT_EQ(config.scheduler.timeframes,
              (std::vector<Timeframe>{Timeframe::MINUTE_15, Timeframe::HOUR_1}));
    EXPECT_DOUBLE_EQ(config.scheduler.optimization_period, 300.0);
    EXPECT_DOUBLE_EQ(config.scheduler.discovery_period, 1800.0);
    ASSERT_EQ(config.historical_data.count(Timeframe::MINUTE_15), 1u);
    EXPECT_EQ(config.historical_data.at(Timeframe::MINUTE_15), "data/ETHUSDT_15m.csv");
    EXPECT_EQ(config.state_file, "state/eth.json");

    EngineConfig copy;
    copy.from_json(config.to_json());
    EXPECT_EQ(copy.symbol, "ETHUSDT");
    EXPECT_EQ(copy.historical_data, config.historical_data);
    EXPECT_EQ(copy.scheduler.timeframes, config.scheduler.timeframes);
    EXPECT_TRUE(copy.initial_strategy.is_null());
}

TEST_F(EngineConfigTest, UnknownNamesAreConfigurationErrors) {
    EngineConfig config;
    auto profile = config.load_from_file(write("profile.json", R"({"risk_profile": "YOLO"})"));
    ASSERT_TRUE(profile.is_error());
    EXPECT_EQ(profile.error()->code(), ErrorCode::INVALID_CONFIGURATION);

    EngineConfig other;
    auto timeframe =
        other.load_from_file(write("timeframe.json", R"({"historical_data": {"2h": "x.csv"}})"));
    ASSERT_TRUE(timeframe.is_error());
    EXPECT_EQ(timeframe.error()->code(), ErrorCode::INVALID_CONFIGURATION);
}

TEST_F(EngineConfigTest, InvalidRiskOverrides) {
    EngineConfig config;
    config.risk_overrides = {{"max_position_fraction", 1.5}};
    auto out_of_range = config.validate();
    ASSERT_TRUE(out_of_range.is_error());
    EXPECT_EQ(out_of_range.error()->code(), ErrorCode::INVALID_CONFIGURATION);

    config.risk_overrides = {{"fee_rate", "cheap"}};
    auto wrong_type = config.validate();
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error()->code(), ErrorCode::INVALID_CONFIGURATION);

    config.risk_overrides = {{"stop_mode", "TRAILING"}};
    auto unknown_mode = config.validate();
    ASSERT_TRUE(unknown_mode.is_error());
    EXPECT_EQ(unknown_mode.error()->code(), ErrorCode::INVALID_CONFIGURATION);

    config.risk_overrides = nlohmann::json::array({1, 2});
    EXPECT_EQ(config.validate().error()->code(), ErrorCode::INVALID_CONFIGURATION);
}

TEST_F(EngineConfigTest, InvalidSections) {
    EngineConfig config;
    config.symbol = "";
    EXPECT_TRUE(config.validate().is_error());

    config = EngineConfig{};
    config.decision_loop.tick_interval = 0.0;
    EXPECT_EQ(config.validate().error()->code(), ErrorCode::INVALID_CONFIGURATION);

    config = EngineConfig{};
    config.scheduler.promotion_threshold = -0.1;
    EXPECT_TRUE(config.validate().is_error());

    config = EngineConfig{};
    config.monitor.alert_threshold = 0.0;
    EXPECT_TRUE(config.validate().is_error());
}

TEST_F(EngineConfigTest, TimeframesMustBeBuildableFromLiveSamples) {
    EngineConfig config;
    config.decision_loop.timeframe = Timeframe::HOUR_1;
    config.scheduler.timeframes = {Timeframe::HOUR_4, Timeframe::MINUTE_5};
    auto finer = config.validate();
    ASSERT_TRUE(finer.is_error());
    EXPECT_EQ(finer.error()->code(), ErrorCode::INVALID_CONFIGURATION);

    config.scheduler.timeframes = {Timeframe::HOUR_1, Timeframe::HOUR_4, Timeframe::DAILY};
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(EngineConfigTest, InitialStrategy) {
    EngineConfig config;
    auto none = config.resolved_initial_strategy();
    ASSERT_TRUE(none.is_ok());
    EXPECT_FALSE(none.value().has_value());

    config.initial_strategy = {{"timeframe", "15m"}, {"params", {{"family", "RSI"}, {"period", 10}}}};
    ASSERT_TRUE(config.validate().is_ok());
    auto resolved = config.resolved_initial_strategy();
    ASSERT_TRUE(resolved.is_ok()) << resolved.error()->to_string();
    ASSERT_TRUE(resolved.value().has_value());
    EXPECT_EQ(resolved.value()->timeframe, Timeframe::MINUTE_15);
    EXPECT_EQ(resolved.value()->family(), StrategyFamily::RSI);

    EngineConfig copy;
    copy.from_json(config.to_json());
    EXPECT_EQ(copy.initial_strategy, config.initial_strategy);

    config.initial_strategy = {{"timeframe", "15m"}, {"params", {{"family", "ELLIOTT"}}}};
    auto unknown = config.validate();
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::INVALID_CONFIGURATION);

    config.decision_loop.timeframe = Timeframe::HOUR_1;
    config.scheduler.timeframes = {Timeframe::HOUR_1};
    config.initial_strategy = {{"timeframe", "15m"}, {"params", {{"family", "RSI"}, {"period", 10}}}};
    auto too_fine = config.validate();
    ASSERT_TRUE(too_fine.is_error());
    EXPECT_EQ(too_fine.error()->code(), ErrorCode::INVALID_CONFIGURATION);
}
