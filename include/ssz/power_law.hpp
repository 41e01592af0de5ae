#pragma once

/// @file include/ssz/power_law.hpp
/// @brief Power-law energy scaling with compactness.
///
/// E_norm = 1 + α·(r_s/R)^β with α = 0.3187, β = 0.9821 (R² = 0.997134).
/// Weak-field bodies sit at E_norm ≈ 1; neutron stars reach ≈ 1.15.

#include "ssz/config.hpp"

#include <optional>

namespace ssz::power_law {

struct PowerLawResult {
    double compactness;  ///< r_s / R
    double e_norm;       ///< 1 + α·compactness^β
    double e_excess;     ///< e_norm − 1
};

/// Evaluate the scaling law for a body of Schwarzschild radius r_s and
/// radius R. `nullopt` if either is non-positive or non-finite.
[[nodiscard]] std::optional<PowerLawResult>
evaluate(double r_s, double radius, const ModelParameters& params) noexcept;

/// Same, from mass and radius.
[[nodiscard]] std::optional<PowerLawResult>
evaluate_mass(double mass_kg, double radius, const RunConfig& config) noexcept;

} // namespace ssz::power_law
