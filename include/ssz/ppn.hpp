#pragma once

/// @file include/ssz/ppn.hpp
/// @brief Parametrized post-Newtonian observables of a point mass.
///
/// Module:         ppn
/// Responsibility: null-geodesic and orbital observables (light deflection,
///                 Shapiro delay, perihelion precession). These need both
///                 g_tt and g_rr, so they are computed from the PPN metric
///                 rather than from Ξ, which only carries the time part.
///
/// Guarantees:
///   - Every function returns `nullopt` on a non-physical input instead of
///     a non-finite number.
///   - With γ = β = 1 the results are the GR values.

#include "ssz/config.hpp"
#include "ssz/constants.hpp"

#include <optional>

namespace ssz::ppn {

struct PpnParameters {
    double gamma = constants::PPN_GAMMA;  ///< Space curvature per unit mass
    double beta  = constants::PPN_BETA;   ///< Nonlinearity of superposition
};

[[nodiscard]] constexpr double to_arcsec(double radians) noexcept {
    return radians * constants::ARCSEC_PER_RADIAN;
}

/// Deflection of a ray passing at impact parameter b [rad]:
/// α = (1 + γ)·r_s / b.
[[nodiscard]] std::optional<double>
light_deflection(double mass_kg, double impact_m, const PhysicalConstants& k,
                 const PpnParameters& p = {}) noexcept;

/// Extra light travel time past the mass, grazing-incidence form [s]:
/// Δt = (1 + γ)·(r_s / c)·ln(4·r1·r2 / b²).
///
/// r1 and r2 are the distances of emitter and receiver from the mass.
[[nodiscard]] std::optional<double>
shapiro_delay(double mass_kg, double r1_m, double r2_m, double impact_m,
              const PhysicalConstants& k, const PpnParameters& p = {}) noexcept;

/// Perihelion advance per orbit [rad]:
/// Δφ = 6πGM / (c²·a·(1 − e²)) · (2 + 2γ − β) / 3.
///
/// `nullopt` unless a > 0 and 0 ≤ e < 1.
[[nodiscard]] std::optional<double>
perihelion_precession(double mass_kg, double semi_major_m, double eccentricity,
                      const PhysicalConstants& k, const PpnParameters& p = {}) noexcept;

/// Perihelion advance accumulated over a Julian century ["/century].
[[nodiscard]] std::optional<double>
precession_arcsec_per_century(double mass_kg, double semi_major_m, double eccentricity,
                              double period_years, const PhysicalConstants& k,
                              const PpnParameters& p = {}) noexcept;

} // namespace ssz::ppn
