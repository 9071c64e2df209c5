#include <gtest/gtest.h>
#include "execo/assumptions_loader.hpp"
#include "execo/log.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace execo;
using namespace execo::core;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Silence the loader's warnings for the duration of a test.
class AssumptionsLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = log_level();
        set_log_level(LogLevel::Off);
    }
    void TearDown() override { set_log_level(saved_); }

private:
    LogLevel saved_ = LogLevel::Warn;
};

static const std::string kValidCsv =
    "key,value\n"
    "# Mesa solar, phase 1\n"
    "project_name,Mesa Solar\n"
    "technology_type,solar_pv\n"
    "capacity_mw,150\n"
    "capacity_factor,0.27\n"
    "capex_per_kw,950.5\n"
    "project_lifetime_years,30\n"
    "discount_rate,0.07\n"
    "carbon_credit_per_ton,25\n"
    "carbon_intensity_avoided,0.45\n";

// ─── parse_number ────────────────────────────────────────────────────────────

TEST(AssumptionsLoader_ParseNumber, Accepts) {
    EXPECT_DOUBLE_EQ(*AssumptionsLoader::parse_number("42"), 42.0);
    EXPECT_DOUBLE_EQ(*AssumptionsLoader::parse_number(" -0.5 "), -0.5);
    EXPECT_DOUBLE_EQ(*AssumptionsLoader::parse_number("+1e3"), 1000.0);
}

TEST(AssumptionsLoader_ParseNumber, Rejects) {
    EXPECT_FALSE(AssumptionsLoader::parse_number("").has_value());
    EXPECT_FALSE(AssumptionsLoader::parse_number("abc").has_value());
    EXPECT_FALSE(AssumptionsLoader::parse_number("12abc").has_value());
    EXPECT_FALSE(AssumptionsLoader::parse_number("nan").has_value());
    EXPECT_FALSE(AssumptionsLoader::parse_number("inf").has_value());
    EXPECT_FALSE(AssumptionsLoader::parse_number("1e400").has_value());
}

// ─── parse_csv_string ────────────────────────────────────────────────────────

TEST_F(AssumptionsLoaderTest, ParsesAllKnownKeys) {
    const auto loaded = AssumptionsLoader::parse_csv_string(kValidCsv);
    const auto& a = loaded.assumptions;

    EXPECT_TRUE(loaded.skipped.empty());
    EXPECT_EQ(a.project_name, "Mesa Solar");
    EXPECT_EQ(a.technology_type, "solar_pv");
    EXPECT_DOUBLE_EQ(a.capacity_mw, 150.0);
    EXPECT_DOUBLE_EQ(a.capacity_factor, 0.27);
    EXPECT_DOUBLE_EQ(a.capex_per_kw, 950.5);
    EXPECT_EQ(a.project_lifetime_years, 30);
    EXPECT_DOUBLE_EQ(a.discount_rate, 0.07);
    EXPECT_DOUBLE_EQ(a.carbon_credit_per_ton, 25.0);
    EXPECT_DOUBLE_EQ(a.carbon_intensity_avoided, 0.45);
}

TEST_F(AssumptionsLoaderTest, MissingKeysKeepDefaults) {
    const auto loaded = AssumptionsLoader::parse_csv_string("key,value\ncapacity_mw,10\n");
    EXPECT_DOUBLE_EQ(loaded.assumptions.capacity_mw, 10.0);
    EXPECT_DOUBLE_EQ(loaded.assumptions.installation_factor, 1.2);
    EXPECT_DOUBLE_EQ(loaded.assumptions.tax_rate, 0.21);
    EXPECT_FALSE(loaded.assumptions.annual_production_mwh.has_value());
}

TEST_F(AssumptionsLoaderTest, HeaderOnlyGivesDefaults) {
    const auto loaded = AssumptionsLoader::parse_csv_string("key,value\n");
    EXPECT_TRUE(loaded.skipped.empty());
    EXPECT_EQ(loaded.assumptions.project_name, "Unnamed Project");
}

TEST_F(AssumptionsLoaderTest, CommentsBeforeHeader) {
    const auto loaded = AssumptionsLoader::parse_csv_string(
        "# generated\n\nkey,value\ncapacity_mw,42\n");
    EXPECT_DOUBLE_EQ(loaded.assumptions.capacity_mw, 42.0);
    EXPECT_TRUE(loaded.skipped.empty());
}

TEST_F(AssumptionsLoaderTest, CrLfAndWhitespace) {
    const auto loaded = AssumptionsLoader::parse_csv_string(
        "key,value\r\n  capacity_mw , 75 \r\n");
    EXPECT_DOUBLE_EQ(loaded.assumptions.capacity_mw, 75.0);
}

TEST_F(AssumptionsLoaderTest, ProductionOverride) {
    const auto loaded = AssumptionsLoader::parse_csv_string(
        "key,value\nannual_production_mwh,123456\n");
    ASSERT_TRUE(loaded.assumptions.annual_production_mwh.has_value());
    EXPECT_DOUBLE_EQ(*loaded.assumptions.annual_production_mwh, 123456.0);
}

TEST_F(AssumptionsLoaderTest, BadRowsSkippedWithLineNumbers) {
    const auto loaded = AssumptionsLoader::parse_csv_string(
        "key,value\n"                 // 1
        "capacity_mw,abc\n"           // 2 not a number
        "no_comma_here\n"             // 3
        "warp_factor,9\n"             // 4 unknown key
        "project_lifetime_years,2.5\n"  // 5 not whole
        "capex_per_kw,800\n");        // 6 ok

    ASSERT_EQ(loaded.skipped.size(), 4u);
    EXPECT_EQ(loaded.skipped[0].line_number, 2u);
    EXPECT_EQ(loaded.skipped[1].line_number, 3u);
    EXPECT_EQ(loaded.skipped[2].line_number, 4u);
    EXPECT_NE(loaded.skipped[2].reason.find("warp_factor"), std::string::npos);
    EXPECT_EQ(loaded.skipped[3].line_number, 5u);

    EXPECT_DOUBLE_EQ(loaded.assumptions.capacity_mw, 100.0);  // default kept
    EXPECT_EQ(loaded.assumptions.project_lifetime_years, 25);
    EXPECT_DOUBLE_EQ(loaded.assumptions.capex_per_kw, 800.0);
}

TEST_F(AssumptionsLoaderTest, ValueMayContainCommas) {
    const auto loaded = AssumptionsLoader::parse_csv_string(
        "key,value\nproject_name,Mesa, Phase 2\n");
    EXPECT_EQ(loaded.assumptions.project_name, "Mesa, Phase 2");
}

TEST_F(AssumptionsLoaderTest, RangesAreNotCheckedHere) {
    const auto loaded = AssumptionsLoader::parse_csv_string(
        "key,value\ncapacity_factor,1.5\n");
    EXPECT_TRUE(loaded.skipped.empty());
    EXPECT_DOUBLE_EQ(loaded.assumptions.capacity_factor, 1.5);
    EXPECT_TRUE(finance::validate(loaded.assumptions).has_value());
}

// ─── apply ───────────────────────────────────────────────────────────────────

TEST(AssumptionsLoader_Apply, ReturnsReasonOnFailure) {
    finance::ProjectAssumptions a;
    EXPECT_FALSE(AssumptionsLoader::apply(a, "tax_rate", "0.3").has_value());
    EXPECT_DOUBLE_EQ(a.tax_rate, 0.3);

    const auto reason = AssumptionsLoader::apply(a, "tax_rate", "thirty");
    ASSERT_TRUE(reason.has_value());
    EXPECT_NE(reason->find("thirty"), std::string::npos);
    EXPECT_DOUBLE_EQ(a.tax_rate, 0.3);
}

// ─── load_csv ────────────────────────────────────────────────────────────────

TEST_F(AssumptionsLoaderTest, MissingFile_Nullopt) {
    EXPECT_FALSE(AssumptionsLoader::load_csv("/nonexistent/execo/assumptions.csv")
                     .has_value());
}

TEST_F(AssumptionsLoaderTest, LoadsFromDisk) {
    const std::string path = ::testing::TempDir() + "execo_assumptions_test.csv";
    {
        std::ofstream out(path);
        out << kValidCsv;
    }
    const auto loaded = AssumptionsLoader::load_csv(path);
    std::remove(path.c_str());

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->assumptions.project_name, "Mesa Solar");
    EXPECT_DOUBLE_EQ(loaded->assumptions.capacity_mw, 150.0);
}
