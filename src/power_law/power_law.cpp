/// @file src/power_law/power_law.cpp
/// @brief Power-law energy scaling implementation.

#include "ssz/power_law.hpp"
#include "ssz/redshift.hpp"

#include <cmath>

namespace ssz::power_law {

std::optional<PowerLawResult>
evaluate(double r_s, double radius, const ModelParameters& params) noexcept {
    if (!std::isfinite(r_s) || !std::isfinite(radius) ||
        r_s <= 0.0 || radius <= 0.0) {
        return std::nullopt;
    }

    const double compactness = r_s / radius;
    const double excess = params.power_law_alpha *
                          std::pow(compactness, params.power_law_beta);
    if (!std::isfinite(excess)) {
        return std::nullopt;
    }

    return PowerLawResult{
        .compactness = compactness,
        .e_norm      = 1.0 + excess,
        .e_excess    = excess,
    };
}

std::optional<PowerLawResult>
evaluate_mass(double mass_kg, double radius, const RunConfig& config) noexcept {
    const auto r_s = redshift::schwarzschild_radius(mass_kg, config.constants);
    if (!r_s) {
        return std::nullopt;
    }
    return evaluate(*r_s, radius, config.params);
}

} // namespace ssz::power_law
