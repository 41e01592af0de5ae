#pragma once

/// @file include/ssz/regime.hpp
/// @brief Regime classifier: normalised radius → one of five ordered zones.
///
/// # Module: Regime Classifier
///
/// ## Responsibility
/// Map x = r / r_s onto
///
///   very_close (x < 1.8) → blended (1.8 ≤ x ≤ 2.2) → photon_sphere (2.2 < x ≤ 3.0)
///   → strong (3.0 < x ≤ 10.0) → weak (x > 10.0)
///
/// and report which correction logic each zone enables.
///
/// ## Guarantees
/// - Total: every finite x lands in exactly one zone
/// - Lower boundary of each later zone is closed (x = 1.8 is blended)
/// - r_s ≤ 0 or non-finite input classifies as weak
/// - Pure, noexcept

#include "ssz/config.hpp"
#include "ssz/types.hpp"

namespace ssz::regime {

/// Correction switches attached to a regime.
struct RegimeInfo {
    bool use_delta_m;    ///< Apply Δ(M) to the GR redshift
    bool use_geom_hint;  ///< Geometric-hint mode permitted
    bool use_blending;   ///< Ξ evaluated inside the blend zone
};

/// Classify a normalised radius with explicit boundaries.
[[nodiscard]] Regime classify(double x, const ModelParameters& params) noexcept;

/// Classify a normalised radius with the canonical boundaries.
[[nodiscard]] Regime classify(double x) noexcept;

/// Classify from r and r_s. r_s ≤ 0 yields Regime::Weak.
[[nodiscard]] Regime classify(double r, double r_s,
                              const ModelParameters& params) noexcept;

/// Correction switches for a regime. Only the weak regime disables Δ(M).
[[nodiscard]] RegimeInfo regime_info(Regime r) noexcept;

} // namespace ssz::regime
