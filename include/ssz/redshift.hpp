#pragma once

/// @file include/ssz/redshift.hpp
/// @brief Redshift composition: GR gravitational, SR Doppler, SSZ corrections.
///
/// # Module: Redshift Composition
///
/// ## Responsibility
///   z_gr      = 1/√(1 − r_s/r) − 1
///   z_sr      = γ(v_total)·(1 + β_los) − 1
///   z_comb    = (1 + z_a)(1 + z_b) − 1
///   Δ(M)      = (A·e^(−α·r_s) + B) · norm(log10 M)            [%]
///   z_ssz     = z_gr · (1 + Δ/100)                             (DeltaM mode)
///   z_geom    = 1/√(1 − β_eff·φ/2) − 1,  β_eff = 2G·M(1+Δ/100)/(r c²)
///                                                              (GeometricHint)
///
/// The Δ(M) correction is forced to zero in the weak regime, and geometric
/// hint mode is bypassed there too, so weak-field SSZ redshift equals GR.
///
/// ## Guarantees
/// - Degenerate geometry yields quiet NaN rather than throwing, so batch rows
///   keep flowing
/// - All functions are pure and noexcept
///
/// ## NOT Responsible For
/// - Choosing the regime (see regime.hpp)
/// - Residuals and winner selection (see engine.hpp)

#include "ssz/config.hpp"
#include "ssz/types.hpp"

#include <optional>

namespace ssz::redshift {

// ─── Geometry ─────────────────────────────────────────────────────────────────

/// r_s = 2GM/c². `nullopt` for non-positive or non-finite mass.
[[nodiscard]] std::optional<double>
schwarzschild_radius(double mass_kg, const PhysicalConstants& k) noexcept;

// ─── GR and SR Components ────────────────────────────────────────────────────

/// z_gr from a known r_s. NaN when r ≤ r_s, r ≤ 0 or r_s ≤ 0.
[[nodiscard]] double gravitational_from_rs(double r, double r_s) noexcept;

/// z_gr for mass M at radius r. NaN when M ≤ 0, r ≤ 0 or r ≤ r_s.
[[nodiscard]] double
gravitational(double mass_kg, double r, const PhysicalConstants& k) noexcept;

/// z_sr = γ·(1 + v_los/c) − 1, γ from |v_total|.
///
/// A non-finite velocity counts as zero. |v_total| ≥ c yields NaN.
[[nodiscard]] double doppler(double v_total, double v_los, double c) noexcept;

/// (1 + z_a)(1 + z_b) − 1, evaluated as z_a + z_b + z_a·z_b so that a zero
/// component returns the other one bit for bit.
[[nodiscard]] double combined(double z_a, double z_b) noexcept;

/// As above, with an absent component treated as zero.
[[nodiscard]] double combined(std::optional<double> z_a,
                              std::optional<double> z_b) noexcept;

// ─── Mass Correction ──────────────────────────────────────────────────────────

/// log10(M/kg) mapped linearly onto [0, 1] over the configured range.
[[nodiscard]] double
mass_normalization(double mass_kg, const ModelParameters& p) noexcept;

/// Un-normalised A·e^(−α·r_s) + B [%].
[[nodiscard]] double delta_m_raw(double r_s, const ModelParameters& p) noexcept;

/// Normalised Δ(M) [%], exactly 0 when `regime` is Weak.
[[nodiscard]] double delta_m_percent(double mass_kg, double r_s, Regime regime,
                                     const ModelParameters& p) noexcept;

/// z_gr · (1 + Δ/100).
[[nodiscard]] double ssz_gravitational(double z_gr, double delta_pct) noexcept;

/// Geometric-hint redshift with effective mass M·(1 + Δ/100).
/// NaN when the radicand is non-positive or inputs are invalid.
[[nodiscard]] double geometric_hint(double mass_kg, double r, double delta_pct,
                                    const PhysicalConstants& k) noexcept;

// ─── Composition ──────────────────────────────────────────────────────────────

/// Every redshift component for one emitter.
struct RedshiftBreakdown {
    double z_gr;
    double z_sr;
    double z_grsr;
    double z_ssz_grav;
    double z_ssz_total;
    double delta_m_pct;  ///< Correction actually applied [%]
};

/// Compose all components for mass M at radius r moving at v_total.
///
/// `regime` gates the correction: in Regime::Weak the SSZ gravitational
/// redshift is z_gr itself whatever `config.redshift_mode` says.
[[nodiscard]] RedshiftBreakdown
compose(double mass_kg, double r, double r_s, double v_total, Regime regime,
        const RunConfig& config) noexcept;

} // namespace ssz::redshift
