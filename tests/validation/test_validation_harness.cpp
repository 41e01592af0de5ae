#include <gtest/gtest.h>
#include "ssz/validation.hpp"
#include "ssz/golden_dataset.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ssz;
using namespace ssz::validation;

namespace {

std::string failures_text(const std::vector<ValidationOutcome>& outcomes) {
    std::string out;
    for (const auto& o : outcomes) {
        if (!o.passed) out += o.id + ": " + o.diagnosis + "\n";
    }
    return out;
}

bool has_id(const std::vector<ValidationOutcome>& outcomes, const std::string& id) {
    return std::any_of(outcomes.begin(), outcomes.end(),
                       [&](const ValidationOutcome& o) { return o.id == id; });
}

} // namespace

// ─── Category Runs ────────────────────────────────────────────────────────────

TEST(ValidationHarness, CoreFormulaChecks_AllPass) {
    const ValidationHarness h;
    const auto out = h.run_core_formula_checks();
    EXPECT_FALSE(out.empty());
    EXPECT_TRUE(std::all_of(out.begin(), out.end(),
                            [](const auto& o) { return o.category == CheckCategory::CoreFormula; }));
    EXPECT_EQ(summarize(out).failed, 0u) << failures_text(out);
}

TEST(ValidationHarness, PhysicalLimitChecks_AllPass) {
    const auto out = ValidationHarness{}.run_physical_limit_checks();
    EXPECT_TRUE(has_id(out, "limits.d_ssz_at_horizon"));
    EXPECT_TRUE(has_id(out, "limits.z_gr_undefined_inside_horizon"));
    EXPECT_EQ(summarize(out).failed, 0u) << failures_text(out);
}

TEST(ValidationHarness, NumericalStabilityChecks_AllPass) {
    const auto out = ValidationHarness{}.run_numerical_stability_checks();
    EXPECT_TRUE(has_id(out, "stability.parallel_batch_order"));
    EXPECT_EQ(summarize(out).failed, 0u) << failures_text(out);
}

TEST(ValidationHarness, RegimeContinuityChecks_AllPass) {
    const auto out = ValidationHarness{}.run_regime_continuity_checks();
    EXPECT_TRUE(has_id(out, "continuity.c0_lower"));
    EXPECT_TRUE(has_id(out, "continuity.c1_upper"));
    EXPECT_TRUE(has_id(out, "continuity.c2_bounded"));
    EXPECT_EQ(summarize(out).failed, 0u) << failures_text(out);
}

TEST(ValidationHarness, ExperimentalChecks_AllPass) {
    const auto out = ValidationHarness{}.run_experimental_checks();
    EXPECT_TRUE(has_id(out, "experiment.gps_clock_drift"));
    EXPECT_TRUE(has_id(out, "experiment.pound_rebka"));
    EXPECT_TRUE(has_id(out, "experiment.ppn.solar_deflection"));
    EXPECT_TRUE(has_id(out, "experiment.ppn.mercury_precession"));
    EXPECT_TRUE(has_id(out, "experiment.ppn.shapiro_cassini"));
    EXPECT_EQ(summarize(out).failed, 0u) << failures_text(out);
}

TEST(ValidationHarness, CoreFormulaChecks_CombinedIdentityExact) {
    const auto out = ValidationHarness{}.run_core_formula_checks();
    const auto it = std::find_if(out.begin(), out.end(), [](const auto& o) {
        return o.id == "core.z_combined_identity";
    });
    ASSERT_NE(it, out.end());
    EXPECT_TRUE(it->passed) << it->diagnosis;
    EXPECT_EQ(it->computed, 0.0);
}

TEST(ValidationHarness, IdsAreUnique) {
    const auto out = ValidationHarness{}.run_property_checks();
    std::set<std::string> ids;
    for (const auto& o : out) {
        EXPECT_TRUE(ids.insert(o.id).second) << "duplicate id " << o.id;
    }
}

// ─── Golden Regression ────────────────────────────────────────────────────────

TEST(ValidationHarness, GoldenRegression_ShippedCatalogue_AllPass) {
    const auto golden = core::GoldenDataset::load_csv(SSZ_GOLDEN_DATASET_PATH);
    ASSERT_TRUE(golden.has_value());
    const auto out = ValidationHarness{}.run_golden_regression(*golden);
    // row_count + one per row + three split checks
    EXPECT_EQ(out.size(), golden->size() + 4);
    EXPECT_EQ(summarize(out).failed, 0u) << failures_text(out);
}

TEST(ValidationHarness, GoldenRegression_TamperedRow_Fails) {
    auto golden = core::GoldenDataset::load_csv(SSZ_GOLDEN_DATASET_PATH);
    ASSERT_TRUE(golden.has_value());
    ASSERT_FALSE(golden->empty());
    (*golden)[0].z_ssz *= 1.01;
    const auto out = ValidationHarness{}.run_golden_regression(*golden);
    const std::string id = "golden." + (*golden)[0].name;
    const auto it = std::find_if(out.begin(), out.end(),
                                 [&](const ValidationOutcome& o) { return o.id == id; });
    ASSERT_NE(it, out.end());
    EXPECT_FALSE(it->passed);
    EXPECT_NE(it->diagnosis.find("z_ssz off"), std::string::npos);
    EXPECT_EQ(summarize(out).failed, 1u);
}

TEST(ValidationHarness, GoldenRegression_Empty_CountFails) {
    const auto out = ValidationHarness{}.run_golden_regression({});
    ASSERT_TRUE(has_id(out, "golden.row_count"));
    EXPECT_GT(summarize(out).failed, 0u);
}

TEST(ValidationHarness, GoldenRegression_RejectedRowRecorded) {
    core::GoldenRecord bad;
    bad.name      = "broken";
    bad.mass_msun = -1.0;
    bad.radius_m  = 1e4;
    const std::vector<core::GoldenRecord> golden{bad};
    const auto out = ValidationHarness{}.run_golden_regression(golden);
    const auto it = std::find_if(out.begin(), out.end(),
                                 [](const ValidationOutcome& o) { return o.id == "golden.broken"; });
    ASSERT_NE(it, out.end());
    EXPECT_FALSE(it->passed);
}

// ─── Entry Points ─────────────────────────────────────────────────────────────

TEST(ValidationHarness, RunAll_ShippedCatalogue_AllPass) {
    const auto report = ValidationHarness{}.run_all(SSZ_GOLDEN_DATASET_PATH);
    EXPECT_TRUE(report.summary.all_passed()) << failures_text(report.outcomes);
    EXPECT_EQ(report.summary.total, report.outcomes.size());
    EXPECT_DOUBLE_EQ(report.summary.rate(), 1.0);
    EXPECT_TRUE(report.failures().empty());
    const std::string text = report.to_string();
    EXPECT_NE(text.find("GoldenRegression"), std::string::npos);
    EXPECT_NE(text.find("Pass rate: 100.0%"), std::string::npos);
}

TEST(ValidationHarness, RunAll_MissingFile_Throws) {
    EXPECT_THROW((void)ValidationHarness{}.run_all("/nonexistent/golden.csv"),
                 std::runtime_error);
}

TEST(ValidationHarness, PerturbedConstants_ReportedNotThrown) {
    RunConfig cfg;
    cfg.constants.phi = 1.5;
    const ValidationHarness h{cfg};
    std::vector<ValidationOutcome> out;
    ASSERT_NO_THROW(out = h.run_core_formula_checks());
    EXPECT_TRUE(has_id(out, "core.phi_value"));
    EXPECT_GT(summarize(out).failed, 0u);
}

// ─── Summaries ────────────────────────────────────────────────────────────────

TEST(ValidationSummary, EmptyRun_NotAllPassed) {
    const auto s = summarize({});
    EXPECT_EQ(s.total, 0u);
    EXPECT_DOUBLE_EQ(s.rate(), 0.0);
    EXPECT_FALSE(s.all_passed());
}

TEST(ValidationSummary, CountsPassAndFail) {
    std::vector<ValidationOutcome> v{
        {"a", CheckCategory::CoreFormula, true, 0, 0, 0, ""},
        {"b", CheckCategory::CoreFormula, false, 1, 2, 0, "bad"},
        {"c", CheckCategory::PhysicalLimits, true, 0, 0, 0, ""},
    };
    const auto s = summarize(v);
    EXPECT_EQ(s.passed, 2u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_NEAR(s.rate(), 2.0 / 3.0, 1e-12);
    EXPECT_NE(s.to_string().find("Failed: 1"), std::string::npos);
}
