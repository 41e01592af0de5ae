/// @file src/core/config.cpp
/// @brief RunConfig validation and mode labels.

#include "ssz/config.hpp"

#include <cmath>

namespace ssz {

namespace {

bool finite_positive(double v) noexcept {
    return std::isfinite(v) && v > 0.0;
}

} // anonymous namespace

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(XiMode m) noexcept {
    switch (m) {
        case XiMode::Auto:   return "auto";
        case XiMode::Weak:   return "weak";
        case XiMode::Strong: return "strong";
    }
    return "Unknown";
}

const char* to_string(RedshiftMode m) noexcept {
    switch (m) {
        case RedshiftMode::DeltaM:        return "delta_m";
        case RedshiftMode::GeometricHint: return "geometric_hint";
        case RedshiftMode::Uncorrected:   return "uncorrected";
    }
    return "Unknown";
}

// ─── Validation ───────────────────────────────────────────────────────────────

bool PhysicalConstants::is_valid() const noexcept {
    return finite_positive(g) && finite_positive(c) &&
           finite_positive(m_sun) && finite_positive(phi);
}

bool ModelParameters::is_valid() const noexcept {
    if (!finite_positive(blend_lower) || !finite_positive(xi_max)) return false;
    if (!(blend_upper > blend_lower) || !std::isfinite(blend_upper)) return false;

    // Regime ladder must be strictly increasing.
    if (!finite_positive(very_close_max))       return false;
    if (!(blended_max > very_close_max))        return false;
    if (!(photon_sphere_max > blended_max))     return false;
    if (!(strong_max > photon_sphere_max))      return false;
    if (!std::isfinite(strong_max))             return false;

    if (!std::isfinite(delta_m_a) || !std::isfinite(delta_m_alpha) ||
        !std::isfinite(delta_m_b)) {
        return false;
    }
    if (!(log_mass_max > log_mass_min) || !std::isfinite(log_mass_max)) return false;

    return std::isfinite(power_law_alpha) && std::isfinite(power_law_beta);
}

} // namespace ssz
