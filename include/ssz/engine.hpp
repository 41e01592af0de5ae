#pragma once

/// @file include/ssz/engine.hpp
/// @brief Object orchestrator: public API of the SSZ calculation engine.
///
/// # Module: Object Orchestrator
///
/// ## Responsibility
/// For one `CelestialObject` and a frozen `RunConfig`:
///   validate → r_s, x → regime → Ξ, D_SSZ, D_GR → redshift components
///   (regime-gated correction) → optional residuals and winner.
/// For a batch: the same, element-wise, output order = input order.
///
/// ## Usage
/// ```cpp
/// ssz::core::Engine engine{ssz::RunConfig{}};
/// ssz::CelestialObject psr{.name = "PSR_J0740+6620", .mass_msun = 2.08,
///                          .radius_m = 13.7e3, .z_obs = 0.35};
/// if (auto r = engine.compute(psr)) fmt::print("{}\n", r->to_string());
/// ```
///
/// ## Guarantees
/// - `decide_winner` is the only place a winner is computed
/// - A batch always yields one outcome per input row; invalid rows carry an
///   `InputError` instead of being dropped
/// - `compute_batch_parallel` returns exactly what `compute_batch` returns
/// - The engine holds no mutable state; all methods are const
///
/// ## NOT Responsible For
/// - Reading input files (see golden_dataset.hpp)
/// - Aggregate statistics (see statistics.hpp)

#include "ssz/config.hpp"
#include "ssz/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ssz::core {

// ─── ComputeOutcome ───────────────────────────────────────────────────────────

/// One batch row: either a result or the reason the input was rejected.
struct ComputeOutcome {
    std::string                      name;
    std::optional<CalculationResult> result;
    std::optional<InputError>        error;

    [[nodiscard]] bool ok() const noexcept { return result.has_value(); }
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// Construct with a frozen run configuration.
    explicit Engine(RunConfig config = RunConfig{});

    [[nodiscard]] const RunConfig& config() const noexcept { return config_; }

    /// Check an input record against the boundary rules.
    ///
    /// Rejects: empty name, mass ≤ 0 (or overflowing in kg), radius ≤ 0 (or non-finite),
    /// |velocity| ≥ c, non-finite observed redshift. A NaN velocity is
    /// accepted and later treated as zero.
    ///
    /// # Returns
    /// `nullopt` when the object is valid, otherwise a descriptive error.
    [[nodiscard]] static std::optional<InputError>
    validate(const CelestialObject& obj, const PhysicalConstants& k);

    /// Compute all derived quantities for one object.
    ///
    /// # Returns
    /// `nullopt` if the object fails `validate` or the config is invalid.
    /// Degenerate geometry (r ≤ r_s) is not an error: the affected redshift
    /// fields are NaN.
    [[nodiscard]] std::optional<CalculationResult>
    compute(const CelestialObject& obj) const noexcept;

    /// As `compute`, but keeps the rejection reason.
    [[nodiscard]] ComputeOutcome compute_checked(const CelestialObject& obj) const;

    /// Element-wise map over `objects`, sequentially.
    [[nodiscard]] std::vector<ComputeOutcome>
    compute_batch(std::span<const CelestialObject> objects) const;

    /// Element-wise map over `objects` on `threads` workers
    /// (0 = hardware concurrency). Output order matches input order.
    /// An exception from any worker is rethrown once all workers have joined.
    [[nodiscard]] std::vector<ComputeOutcome>
    compute_batch_parallel(std::span<const CelestialObject> objects,
                           unsigned threads = 0) const;

    /// Pick the model whose absolute residual is smaller.
    ///
    /// ε = 1e-12 · max(|res_ssz|, |res_gr|, 1e-20); a difference of absolute
    /// residuals within ε is a Tie. A non-finite residual always loses to a
    /// finite one; two non-finite residuals tie.
    [[nodiscard]] static Winner
    decide_winner(double residual_ssz, double residual_gr) noexcept;

    /// Residuals of both models against `z_obs`, plus the winner.
    [[nodiscard]] static Observation
    observe(double z_ssz_total, double z_grsr, double z_obs) noexcept;

private:
    /// Core computation for an already-validated object.
    [[nodiscard]] CalculationResult evaluate(const CelestialObject& obj) const;

    /// Emit one stderr line per rejected row when `config_.verbose` is set.
    void report_rejections(const std::vector<ComputeOutcome>& outcomes) const;

    RunConfig config_;
};

} // namespace ssz::core
