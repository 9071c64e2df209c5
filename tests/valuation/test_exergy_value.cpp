#include <gtest/gtest.h>
#include "execo/valuation.hpp"

#include <string>

using namespace execo;
using namespace execo::valuation;

// ─── Premium classes ─────────────────────────────────────────────────────────

TEST(PremiumClass_Classify, CleanFossilOther) {
    EXPECT_EQ(classify_premium("solar"), PremiumClass::Clean);
    EXPECT_EQ(classify_premium("Geothermal"), PremiumClass::Clean);
    EXPECT_EQ(classify_premium("NUCLEAR"), PremiumClass::Clean);
    EXPECT_EQ(classify_premium("coal"), PremiumClass::Fossil);
    EXPECT_EQ(classify_premium("gas"), PremiumClass::Fossil);
    EXPECT_EQ(classify_premium("biomass"), PremiumClass::Other);
    EXPECT_EQ(classify_premium("hydrogen"), PremiumClass::Other);
}

TEST(PremiumClass_Factor, Values) {
    EXPECT_DOUBLE_EQ(premium_factor(PremiumClass::Clean), 3.0);
    EXPECT_DOUBLE_EQ(premium_factor(PremiumClass::Fossil), 1.0);
    EXPECT_DOUBLE_EQ(premium_factor(PremiumClass::Other), 1.5);
}

// ─── compute_exergy_value ────────────────────────────────────────────────────

TEST(ExergyValue_Compute, SolarAtDefaultPrice) {
    const auto v = compute_exergy_value(100'000.0, "solar");
    EXPECT_DOUBLE_EQ(v.annual_production_mwh, 100'000.0);
    EXPECT_DOUBLE_EQ(v.nominal_value, 5'000'000.0);
    EXPECT_NEAR(v.exergy_efficiency, 0.85, 1e-12);
    EXPECT_NEAR(v.exergy_adjusted_value, 4'250'000.0, 1e-6);
    EXPECT_DOUBLE_EQ(v.premium_factor, 3.0);
    EXPECT_DOUBLE_EQ(v.true_value, 15'000'000.0);
    EXPECT_EQ(v.premium_class, PremiumClass::Clean);
}

TEST(ExergyValue_Compute, CoalAtCustomPrice) {
    const auto v = compute_exergy_value(1000.0, "coal", 80.0);
    EXPECT_DOUBLE_EQ(v.nominal_value, 80'000.0);
    EXPECT_NEAR(v.exergy_efficiency, 0.32 / 1.06, 1e-12);
    EXPECT_NEAR(v.exergy_adjusted_value, 80'000.0 * 0.32 / 1.06, 1e-6);
    EXPECT_DOUBLE_EQ(v.true_value, 80'000.0);
}

TEST(ExergyValue_Compute, CleanPremiumExceedsFossil) {
    const auto clean  = compute_exergy_value(50'000.0, "wind");
    const auto fossil = compute_exergy_value(50'000.0, "gas");
    EXPECT_GT(clean.true_value, fossil.true_value);
    EXPECT_GT(clean.premium_factor, fossil.premium_factor);
}

TEST(ExergyValue_Compute, BiomassIsOtherPremiumButFuelExergy) {
    const auto v = compute_exergy_value(1000.0, "biomass");
    EXPECT_DOUBLE_EQ(v.premium_factor, 1.5);
    EXPECT_NEAR(v.exergy_efficiency, 0.20 / 1.06, 1e-12);
}

TEST(ExergyValue_Compute, ZeroProduction) {
    const auto v = compute_exergy_value(0.0, "solar");
    EXPECT_DOUBLE_EQ(v.nominal_value, 0.0);
    EXPECT_DOUBLE_EQ(v.exergy_efficiency, 0.0);
    EXPECT_DOUBLE_EQ(v.true_value, 0.0);
}

// ─── Insight text ────────────────────────────────────────────────────────────

TEST(ExergyValue_Insight, CleanSourceNamesMultiplier) {
    const auto v = compute_exergy_value(1000.0, "solar");
    EXPECT_EQ(v.insight(),
              "This solar project delivers 3.0x more thermodynamic value than "
              "equivalent fossil fuel generation.");
}

TEST(ExergyValue_Insight, OtherSourcesSuggestCleanAlternatives) {
    EXPECT_EQ(compute_exergy_value(1000.0, "coal").insight(),
              "Consider the thermodynamic advantage of clean alternatives.");
    EXPECT_EQ(compute_exergy_value(1000.0, "biomass").insight(),
              "Consider the thermodynamic advantage of clean alternatives.");
}

// ─── assess_project ──────────────────────────────────────────────────────────

TEST(ProjectAssessment, UsesProjectProductionAndPrice) {
    finance::ProjectAssumptions a;
    a.capacity_mw               = 100.0;
    a.capacity_factor           = 0.25;
    a.electricity_price_per_mwh = 60.0;

    const auto assessment = assess_project(a, "wind");
    EXPECT_DOUBLE_EQ(assessment.financials.annual_production_mwh, 219'000.0);
    EXPECT_DOUBLE_EQ(assessment.exergy_value.annual_production_mwh, 219'000.0);
    EXPECT_DOUBLE_EQ(assessment.exergy_value.nominal_value, 219'000.0 * 60.0);
    EXPECT_NE(assessment.to_string().find("wind"), std::string::npos);
}

TEST(ProjectAssessment, InvalidAssumptionsThrow) {
    finance::ProjectAssumptions a;
    a.capacity_factor = 0.0;
    EXPECT_THROW((void)assess_project(a, "solar"), ValidationError);
}
