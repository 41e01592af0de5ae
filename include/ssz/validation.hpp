#pragma once

/// @file include/ssz/validation.hpp
/// @brief Validation harness: invariant, boundary, experimental and golden checks.
///
/// # Module: Validation Harness
///
/// ## Responsibility
/// Run a fixed catalogue of checks against the public engine API and record
/// one `ValidationOutcome` per check:
///   - CoreFormula            closed-form identities and constants
///   - PhysicalLimits         horizon values, bounds, weak-field contract
///   - NumericalStability     sweeps, monotonicity, determinism, tie policy
///   - RegimeContinuity       classifier boundaries, C0/C1 of the Ξ blend
///   - ExperimentalCrossCheck GPS, Pound–Rebka, NIST, neutron stars, ...
///   - GoldenRegression       row-by-row diff against the reference catalogue
///
/// ## Guarantees
/// - A failing check is data, never an exception: every check runs
/// - An exception escaping a single check is recorded as that check's failure
/// - Only `run_all(path)` throws, and only when the golden file is missing
///
/// ## NOT Responsible For
/// - Writing reports to disk (callers format `ValidationReport::to_string`)

#include "ssz/config.hpp"
#include "ssz/golden_dataset.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace ssz::validation {

// ─── Outcome Types ────────────────────────────────────────────────────────────

enum class CheckCategory {
    CoreFormula,
    PhysicalLimits,
    NumericalStability,
    RegimeContinuity,
    ExperimentalCrossCheck,
    GoldenRegression,
};

[[nodiscard]] const char* to_string(CheckCategory c) noexcept;

/// Result of one check.
struct ValidationOutcome {
    std::string   id;         ///< Stable dotted identifier, e.g. "limits.d_ssz_at_horizon"
    CheckCategory category;
    bool          passed;
    double        expected;
    double        computed;
    double        tolerance;
    std::string   diagnosis;  ///< What was compared, and why it failed if it did
};

struct ValidationSummary {
    std::size_t total  = 0;
    std::size_t passed = 0;
    std::size_t failed = 0;

    /// passed / total, 0 for an empty run.
    [[nodiscard]] double rate() const noexcept;
    [[nodiscard]] bool all_passed() const noexcept { return failed == 0 && total > 0; }
    [[nodiscard]] std::string to_string() const;
};

struct ValidationReport {
    std::vector<ValidationOutcome> outcomes;
    ValidationSummary              summary;

    [[nodiscard]] std::vector<ValidationOutcome> failures() const;

    /// Category-grouped detail lines followed by the summary.
    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] ValidationSummary
summarize(std::span<const ValidationOutcome> outcomes) noexcept;

// ─── ValidationHarness ────────────────────────────────────────────────────────

class ValidationHarness {
public:
    explicit ValidationHarness(RunConfig config = RunConfig{});

    [[nodiscard]] std::vector<ValidationOutcome> run_core_formula_checks() const;
    [[nodiscard]] std::vector<ValidationOutcome> run_physical_limit_checks() const;
    [[nodiscard]] std::vector<ValidationOutcome> run_numerical_stability_checks() const;
    [[nodiscard]] std::vector<ValidationOutcome> run_regime_continuity_checks() const;
    [[nodiscard]] std::vector<ValidationOutcome> run_experimental_checks() const;

    /// Every category except the golden regression.
    [[nodiscard]] std::vector<ValidationOutcome> run_property_checks() const;

    /// Recompute each golden row and diff redshifts, regime and winner;
    /// then check the catalogue size and the 46 / 1 / 0 winner split.
    [[nodiscard]] std::vector<ValidationOutcome>
    run_golden_regression(std::span<const core::GoldenRecord> golden) const;

    /// Property checks plus golden regression against `golden`.
    [[nodiscard]] ValidationReport
    run(std::span<const core::GoldenRecord> golden) const;

    /// Load the golden CSV and run everything.
    ///
    /// # Throws
    /// `std::runtime_error` if `golden_path` cannot be opened.
    [[nodiscard]] ValidationReport run_all(const std::string& golden_path) const;

private:
    RunConfig config_;
};

} // namespace ssz::validation
