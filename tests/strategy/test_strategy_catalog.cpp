// tests/strategy/test_strategy_catalog.cpp
#include <gtest/gtest.h>
#include <set>
#include "core/test_base.hpp"
#include "papertrade/strategy/strategy_catalog.hpp"

using namespace papertrade;
using namespace papertrade::testing;

class StrategyCatalogTest : public TestBase {};

TEST_F(StrategyCatalogTest, DefaultPopulationIsValidAndUnique) {
    StrategyCatalog catalog;
    auto population = catalog.default_population(Timeframe::MINUTE_5);

    ASSERT_EQ(population.size(), 13u);
    std::set<std::string> ids;
    std::set<StrategyFamily> families;
    uint64_t last_seq = 0;
    for (const auto& s : population) {
        EXPECT_TRUE(validate_params(s.params).is_ok()) << s.id;
        EXPECT_EQ(s.timeframe, Timeframe::MINUTE_5);
        EXPECT_GT(s.discovery_seq, last_seq);
        last_seq = s.discovery_seq;
        ids.insert(s.id);
        families.insert(s.family());
    }
    EXPECT_EQ(ids.size(), population.size());
    EXPECT_EQ(families.size(), 5u);
    EXPECT_EQ(population.front().name, "RSI_Momentum");
}

TEST_F(StrategyCatalogTest, PerturbProducesDistinctValidVariants) {
    StrategyCatalog catalog;
    auto base = make_strategy(MacdParams{12, 26, 9}, Timeframe::MINUTE_5, 0).value();

    auto variants = catalog.perturb(base, 4);
    EXPECT_LE(variants.size(), 4u);
    EXPECT_FALSE(variants.empty());

    std::set<std::string> ids;
    for (const auto& v : variants) {
        EXPECT_NE(v.id, base.id);
        EXPECT_TRUE(validate_params(v.params).is_ok());
        EXPECT_EQ(v.family(), StrategyFamily::MACD);
        EXPECT_EQ(v.timeframe, base.timeframe);
        EXPECT_EQ(v.version, base.version + 1);
        ids.insert(v.id);
    }
    EXPECT_EQ(ids.size(), variants.size());
}

TEST_F(StrategyCatalogTest, SameSeedSameCandidates) {
    StrategyCatalog first(7);
    StrategyCatalog second(7);
    auto base = make_strategy(RsiParams{14, 30.0, 70.0}, Timeframe::HOUR_1).value();

    auto a = first.perturb(base, 5);
    auto b = second.perturb(base, 5);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].id, b[i].id);
        EXPECT_EQ(a[i].discovery_seq, b[i].discovery_seq);
    }
}

TEST_F(StrategyCatalogTest, SequenceNumbersNeverRepeat) {
    StrategyCatalog catalog;
    auto population = catalog.default_population(Timeframe::MINUTE_5);
    uint64_t next = catalog.next_sequence();
    EXPECT_GT(next, population.back().discovery_seq);

    catalog.observe_sequence(100);
    EXPECT_EQ(catalog.next_sequence(), 101u);

    // Lower observations leave the counter alone
    catalog.observe_sequence(5);
    EXPECT_EQ(catalog.next_sequence(), 101u);

    auto variants = catalog.perturb(population.front(), 1);
    ASSERT_EQ(variants.size(), 1u);
    EXPECT_EQ(variants.front().discovery_seq, 101u);
}
