/// @file src/density/segment_density.cpp
/// @brief Segment density Ξ(r) implementation.

#include "ssz/segment_density.hpp"

#include <algorithm>
#include <cmath>

namespace ssz::density {

// ─── Validation ───────────────────────────────────────────────────────────────

bool SegmentDensity::valid_geometry(double r, double r_s) noexcept {
    return std::isfinite(r) && std::isfinite(r_s) && r > 0.0 && r_s > 0.0;
}

// ─── Pure Formulas ────────────────────────────────────────────────────────────

std::optional<double>
SegmentDensity::weak(double r, double r_s) noexcept {
    if (!valid_geometry(r, r_s)) {
        return std::nullopt;
    }
    return r_s / (2.0 * r);
}

std::optional<double>
SegmentDensity::strong(double r, double r_s, double phi, double xi_max) noexcept {
    if (!valid_geometry(r, r_s) || !std::isfinite(phi) || !std::isfinite(xi_max) ||
        xi_max <= 0.0) {
        return std::nullopt;
    }
    // -expm1(-u) == 1 - e^(-u), exact for small u.
    return xi_max * -std::expm1(-phi * r / r_s);
}

// ─── Blend ────────────────────────────────────────────────────────────────────

double SegmentDensity::blend_weight(double t) noexcept {
    t = std::clamp(t, 0.0, 1.0);
    // Horner form of 6t⁵ − 15t⁴ + 10t³.
    return t * t * t * (t * (6.0 * t - 15.0) + 10.0);
}

double SegmentDensity::blend_weight_derivative(double t) noexcept {
    if (t <= 0.0 || t >= 1.0) {
        return 0.0;
    }
    const double u = t * (1.0 - t);
    return 30.0 * u * u;
}

std::optional<double>
SegmentDensity::blended(double r, double r_s,
                        const ModelParameters& params, double phi) noexcept {
    if (!valid_geometry(r, r_s) || !(params.blend_upper > params.blend_lower)) {
        return std::nullopt;
    }

    const double x = r / r_s;
    if (x <= params.blend_lower) {
        return strong(r, r_s, phi, params.xi_max);
    }
    if (x >= params.blend_upper) {
        return weak(r, r_s);
    }

    const auto xs = strong(r, r_s, phi, params.xi_max);
    const auto xw = weak(r, r_s);
    if (!xs || !xw) {
        return std::nullopt;
    }

    const double t = (x - params.blend_lower) / (params.blend_upper - params.blend_lower);
    const double h = blend_weight(t);
    return (1.0 - h) * *xs + h * *xw;
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

std::optional<double>
SegmentDensity::evaluate(double r, double r_s, XiMode mode,
                         const RunConfig& config) noexcept {
    switch (mode) {
        case XiMode::Weak:
            return weak(r, r_s);
        case XiMode::Strong:
            return strong(r, r_s, config.constants.phi, config.params.xi_max);
        case XiMode::Auto:
            return blended(r, r_s, config.params, config.constants.phi);
    }
    return std::nullopt;
}

std::optional<double>
SegmentDensity::derivative(double r, double r_s, XiMode mode,
                           const RunConfig& config) noexcept {
    if (!valid_geometry(r, r_s)) {
        return std::nullopt;
    }

    const double phi    = config.constants.phi;
    const double xi_max = config.params.xi_max;

    const auto d_weak = [&]() { return -r_s / (2.0 * r * r); };
    const auto d_strong = [&]() {
        return xi_max * (phi / r_s) * std::exp(-phi * r / r_s);
    };

    switch (mode) {
        case XiMode::Weak:
            return d_weak();
        case XiMode::Strong:
            return d_strong();
        case XiMode::Auto:
            break;
    }

    const ModelParameters& p = config.params;
    if (!(p.blend_upper > p.blend_lower)) {
        return std::nullopt;
    }

    const double x = r / r_s;
    if (x <= p.blend_lower) {
        return d_strong();
    }
    if (x >= p.blend_upper) {
        return d_weak();
    }

    const auto xs = strong(r, r_s, phi, xi_max);
    const auto xw = weak(r, r_s);
    if (!xs || !xw) {
        return std::nullopt;
    }

    const double width = p.blend_upper - p.blend_lower;
    const double t     = (x - p.blend_lower) / width;
    const double h     = blend_weight(t);
    // dt/dr = 1 / (width · r_s)
    const double dh_dr = blend_weight_derivative(t) / (width * r_s);

    return (1.0 - h) * d_strong() + h * d_weak() + dh_dr * (*xw - *xs);
}

} // namespace ssz::density
