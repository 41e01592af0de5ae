#pragma once

/// @file include/ssz/segment_density.hpp
/// @brief Segment density Ξ(r): weak, strong and blended formulas.
///
/// # Module: Segment Density
///
/// ## Responsibility
/// Evaluate the dimensionless segment density of the SSZ model as a function
/// of radius r and Schwarzschild radius r_s:
///
///   Ξ_weak(r)   = r_s / (2r)
///   Ξ_strong(r) = ξ_max · (1 − e^(−φ·r/r_s))
///   Ξ_blend(r)  = (1 − h(t))·Ξ_strong + h(t)·Ξ_weak,
///                 t = (r/r_s − x_lo) / (x_hi − x_lo),  h(t) = 6t⁵ − 15t⁴ + 10t³
///
/// The blend is C⁰ and C¹ at both zone edges (h(0) = h'(0) = h'(1) = 0,
/// h(1) = 1). Second-derivative continuity is not guaranteed.
///
/// ## Guarantees
/// - Ξ ≥ 0 for every valid input
/// - `nullopt` (never a default value) for r_s ≤ 0, r ≤ 0, or non-finite input
/// - Static methods only, no state, noexcept
///
/// ## NOT Responsible For
/// - Turning Ξ into a clock rate (see dilation.hpp)
/// - Choosing a regime label (see regime.hpp)

#include "ssz/config.hpp"
#include "ssz/constants.hpp"
#include "ssz/types.hpp"

#include <optional>

namespace ssz::density {

class SegmentDensity {
public:
    SegmentDensity() = delete;

    // ── Pure Formulas ─────────────────────────────────────────────────────────

    /// Ξ_weak = r_s / (2r). Monotonically decreasing in r.
    [[nodiscard]] static std::optional<double>
    weak(double r, double r_s) noexcept;

    /// Ξ_strong = ξ_max · (1 − e^(−φ·r/r_s)).
    ///
    /// At r = r_s this is ξ_max · (1 − e^(−φ)) ≈ 0.802 for ξ_max = 1.
    [[nodiscard]] static std::optional<double>
    strong(double r, double r_s,
           double phi    = constants::PHI,
           double xi_max = constants::XI_MAX) noexcept;

    // ── Blend ─────────────────────────────────────────────────────────────────

    /// Quintic smoothstep h(t) = 6t⁵ − 15t⁴ + 10t³, with t clamped to [0, 1].
    [[nodiscard]] static double blend_weight(double t) noexcept;

    /// h'(t) = 30t²(1 − t)², zero outside (0, 1).
    [[nodiscard]] static double blend_weight_derivative(double t) noexcept;

    /// Strong formula for x ≤ x_lo, weak for x ≥ x_hi, quintic blend between.
    [[nodiscard]] static std::optional<double>
    blended(double r, double r_s,
            const ModelParameters& params, double phi) noexcept;

    // ── Dispatch ──────────────────────────────────────────────────────────────

    /// Evaluate Ξ with the formula selected by `mode`. Auto → blended.
    [[nodiscard]] static std::optional<double>
    evaluate(double r, double r_s, XiMode mode, const RunConfig& config) noexcept;

    /// Analytic dΞ/dr for the selected formula [1/m].
    ///
    /// Inside the blend zone this includes the h'(t)·(Ξ_weak − Ξ_strong) term.
    [[nodiscard]] static std::optional<double>
    derivative(double r, double r_s, XiMode mode, const RunConfig& config) noexcept;

private:
    /// r and r_s both finite and strictly positive.
    [[nodiscard]] static bool valid_geometry(double r, double r_s) noexcept;
};

} // namespace ssz::density
