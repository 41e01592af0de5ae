#pragma once

/// @file include/ssz/dilation.hpp
/// @brief Time dilation D(r): SSZ model versus the GR baseline.
///
/// # Module: Time Dilation
///
/// ## Responsibility
///   D_SSZ(r) = 1 / (1 + Ξ(r))          finite everywhere, in (0, 1]
///   D_GR(r)  = √(1 − r_s/r)           r > r_s, and 0 at or inside r_s
///
/// plus the derived comparisons: the SSZ/GR dilation difference, the dual
/// velocity pair (v_esc · v_fall = c²), and the mass-independent crossing
/// point of the two dilation curves.
///
/// ## Guarantees
/// - D_SSZ · (1 + Ξ) = 1 up to rounding
/// - D_GR never takes the square root of a negative number: r_s/r is clamped
///   to [0, 0.9999999] before use
/// - Invalid geometry (r ≤ 0, r_s ≤ 0, non-finite) returns `nullopt`
///
/// ## NOT Responsible For
/// - Redshift (see redshift.hpp)

#include "ssz/config.hpp"
#include "ssz/types.hpp"

#include <optional>

namespace ssz::dilation {

// ─── Result Types ─────────────────────────────────────────────────────────────

/// SSZ and GR clock rates at the same radius.
struct DilationComparison {
    double d_ssz;
    double d_gr;
    double delta;      ///< d_ssz − d_gr
    double delta_pct;  ///< 100 · delta / d_gr, NaN where d_gr = 0
};

/// Escape velocity and its dual, whose product is c².
struct DualVelocity {
    double v_esc;    ///< c·√(r_s/r)  [m/s]
    double v_fall;   ///< c² / v_esc  [m/s]
    double product;  ///< v_esc · v_fall
};

/// Crossing of D_SSZ (strong formula) and D_GR.
struct IntersectionPoint {
    double r_star;  ///< Crossing radius [m]
    double r_s;     ///< Schwarzschild radius of the mass [m]
    double d_ssz;   ///< D_SSZ(r*)
    double d_gr;    ///< D_GR(r*)
};

// ─── TimeDilation ─────────────────────────────────────────────────────────────

class TimeDilation {
public:
    TimeDilation() = delete;

    /// D_SSZ = 1 / (1 + Ξ) with Ξ from the selected formula.
    [[nodiscard]] static std::optional<double>
    ssz(double r, double r_s, XiMode mode, const RunConfig& config) noexcept;

    /// D_SSZ from an already-evaluated Ξ ≥ 0.
    [[nodiscard]] static double from_xi(double xi) noexcept;

    /// D_GR = √(1 − r_s/r); 0 for r ≤ r_s.
    [[nodiscard]] static std::optional<double>
    gr(double r, double r_s) noexcept;

    /// Side-by-side SSZ and GR dilation.
    [[nodiscard]] static std::optional<DilationComparison>
    compare(double r, double r_s, XiMode mode, const RunConfig& config) noexcept;

    /// v_esc = c·√(r_s/r), v_fall = c²/v_esc.
    [[nodiscard]] static std::optional<DualVelocity>
    dual_velocity(double r, double r_s, double c) noexcept;

    /// D_SSZ(strong) and D_GR at r* = 1.386562·r_s for the given mass.
    [[nodiscard]] static std::optional<IntersectionPoint>
    universal_intersection(double mass_kg, const RunConfig& config) noexcept;
};

} // namespace ssz::dilation
