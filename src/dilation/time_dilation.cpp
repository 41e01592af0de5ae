/// @file src/dilation/time_dilation.cpp
/// @brief Time dilation implementation.

#include "ssz/dilation.hpp"
#include "ssz/constants.hpp"
#include "ssz/redshift.hpp"
#include "ssz/segment_density.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ssz::dilation {

using density::SegmentDensity;

// ─── SSZ ──────────────────────────────────────────────────────────────────────

double TimeDilation::from_xi(double xi) noexcept {
    return 1.0 / (1.0 + xi);
}

std::optional<double>
TimeDilation::ssz(double r, double r_s, XiMode mode,
                  const RunConfig& config) noexcept {
    const auto xi = SegmentDensity::evaluate(r, r_s, mode, config);
    if (!xi) {
        return std::nullopt;
    }
    return from_xi(*xi);
}

// ─── GR ───────────────────────────────────────────────────────────────────────

std::optional<double>
TimeDilation::gr(double r, double r_s) noexcept {
    if (!std::isfinite(r) || !std::isfinite(r_s) || r <= 0.0 || r_s <= 0.0) {
        return std::nullopt;
    }
    if (r <= r_s) {
        return 0.0;
    }
    const double ratio = std::clamp(r_s / r, 0.0, constants::GR_RATIO_CLAMP);
    return std::sqrt(1.0 - ratio);
}

// ─── Comparisons ──────────────────────────────────────────────────────────────

std::optional<DilationComparison>
TimeDilation::compare(double r, double r_s, XiMode mode,
                      const RunConfig& config) noexcept {
    const auto d_ssz = ssz(r, r_s, mode, config);
    const auto d_gr  = gr(r, r_s);
    if (!d_ssz || !d_gr) {
        return std::nullopt;
    }

    const double delta = *d_ssz - *d_gr;
    const double pct   = *d_gr > 0.0
                           ? 100.0 * delta / *d_gr
                           : std::numeric_limits<double>::quiet_NaN();

    return DilationComparison{
        .d_ssz     = *d_ssz,
        .d_gr      = *d_gr,
        .delta     = delta,
        .delta_pct = pct,
    };
}

std::optional<DualVelocity>
TimeDilation::dual_velocity(double r, double r_s, double c) noexcept {
    if (!std::isfinite(r) || !std::isfinite(r_s) || !std::isfinite(c) ||
        r <= 0.0 || r_s <= 0.0 || c <= 0.0) {
        return std::nullopt;
    }

    const double v_esc  = c * std::sqrt(r_s / r);
    const double v_fall = (c * c) / v_esc;
    return DualVelocity{
        .v_esc   = v_esc,
        .v_fall  = v_fall,
        .product = v_esc * v_fall,
    };
}

std::optional<IntersectionPoint>
TimeDilation::universal_intersection(double mass_kg,
                                     const RunConfig& config) noexcept {
    const auto r_s = redshift::schwarzschild_radius(mass_kg, config.constants);
    if (!r_s) {
        return std::nullopt;
    }

    const double r_star = constants::INTERSECTION_R_OVER_RS * *r_s;
    const auto d_ssz = ssz(r_star, *r_s, XiMode::Strong, config);
    const auto d_gr  = gr(r_star, *r_s);
    if (!d_ssz || !d_gr) {
        return std::nullopt;
    }

    return IntersectionPoint{
        .r_star = r_star,
        .r_s    = *r_s,
        .d_ssz  = *d_ssz,
        .d_gr   = *d_gr,
    };
}

} // namespace ssz::dilation
