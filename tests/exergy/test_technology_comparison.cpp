#include <gtest/gtest.h>
#include "execo/exergy.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace execo;
using namespace execo::exergy;

static TechnologySpec tech(std::string name, std::string source) {
    return TechnologySpec{.name = std::move(name), .source = std::move(source)};
}

TEST(TechnologyComparison, RenewablesRankAboveCoal) {
    const std::vector<TechnologySpec> techs = {
        tech("Coal plant", "coal"),
        tech("Solar farm", "solar"),
        tech("Wind farm", "wind"),
    };
    const auto cmp = compare_technologies(techs);
    ASSERT_EQ(cmp.ranking.size(), 3u);
    EXPECT_EQ(cmp.ranking[0].technology, "Wind farm");   // 0.88
    EXPECT_EQ(cmp.ranking[1].technology, "Solar farm");  // 0.85
    EXPECT_EQ(cmp.ranking[2].technology, "Coal plant");
    ASSERT_TRUE(cmp.best_technology.has_value());
    EXPECT_EQ(*cmp.best_technology, "Wind farm");
}

TEST(TechnologyComparison, SortedDescending) {
    std::vector<TechnologySpec> techs;
    for (const char* s : {"coal", "oil", "gas", "biomass", "nuclear",
                          "hydro", "wind", "solar", "geothermal"}) {
        techs.push_back(tech(s, s));
    }
    const auto cmp = compare_technologies(techs);
    for (std::size_t i = 1; i < cmp.ranking.size(); ++i) {
        EXPECT_GE(cmp.ranking[i - 1].second_law_efficiency,
                  cmp.ranking[i].second_law_efficiency);
    }
}

TEST(TechnologyComparison, TiesKeepInputOrder) {
    const std::vector<TechnologySpec> techs = {
        tech("first", "unknown-a"),
        tech("second", "unknown-b"),
        tech("third", "unknown-c"),
    };
    const auto cmp = compare_technologies(techs);
    EXPECT_EQ(cmp.ranking[0].technology, "first");
    EXPECT_EQ(cmp.ranking[1].technology, "second");
    EXPECT_EQ(cmp.ranking[2].technology, "third");
}

TEST(TechnologyComparison, EmptyInput) {
    const std::vector<TechnologySpec> none;
    const auto cmp = compare_technologies(none);
    EXPECT_TRUE(cmp.ranking.empty());
    EXPECT_FALSE(cmp.best_technology.has_value());
}

TEST(TechnologyComparison, EndUseAffectsRanking) {
    auto heat = tech("Solar thermal", "solar");
    heat.end_use = EndUse::LowTempHeat;
    const std::vector<TechnologySpec> techs = {heat, tech("Coal plant", "coal")};
    const auto cmp = compare_technologies(techs);
    // 0.85 × 0.2 = 0.17 < 0.3019
    EXPECT_EQ(*cmp.best_technology, "Coal plant");
}

TEST(TechnologyComparison, SummaryCarriesSource) {
    const std::vector<TechnologySpec> techs = {tech("Dam", "hydro")};
    const auto cmp = compare_technologies(techs);
    EXPECT_EQ(cmp.ranking[0].source, "hydro");
    EXPECT_NEAR(cmp.ranking[0].thermodynamic_perfection, 87.0, 1e-9);
    EXPECT_NE(cmp.to_string().find("Best: Dam"), std::string::npos);
}
