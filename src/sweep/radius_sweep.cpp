/// @file src/sweep/radius_sweep.cpp
/// @brief Eigen array sweeps over normalised radius.

#include "ssz/sweep.hpp"
#include "ssz/constants.hpp"
#include "ssz/regime.hpp"
#include "ssz/segment_density.hpp"

#include <algorithm>
#include <cmath>

namespace ssz::sweep {

namespace {

[[nodiscard]] bool valid_radii(const RadiusArray& x) {
    return x.size() > 0 && x.allFinite() && (x > 0.0).all();
}

} // anonymous namespace

// ─── Grids ────────────────────────────────────────────────────────────────────

RadiusArray linspace(double lo, double hi, Eigen::Index n) {
    if (n <= 0) {
        return RadiusArray{};
    }
    return RadiusArray::LinSpaced(n, lo, hi);
}

RadiusArray logspace(double lo_exp, double hi_exp, Eigen::Index n) {
    if (n <= 0) {
        return RadiusArray{};
    }
    const RadiusArray e = RadiusArray::LinSpaced(n, lo_exp, hi_exp);
    return e.unaryExpr([](double v) { return std::pow(10.0, v); });
}

// ─── Ξ and D ──────────────────────────────────────────────────────────────────

std::optional<RadiusArray>
xi(const RadiusArray& x, XiMode mode, const RunConfig& config) {
    if (!valid_radii(x)) {
        return std::nullopt;
    }

    const double phi    = config.constants.phi;
    const double xi_max = config.params.xi_max;

    const RadiusArray weak   = 0.5 * x.inverse();
    const RadiusArray strong = xi_max * (1.0 - (-phi * x).exp());

    switch (mode) {
        case XiMode::Weak:   return weak;
        case XiMode::Strong: return strong;
        case XiMode::Auto:   break;
    }

    const double lo = config.params.blend_lower;
    const double hi = config.params.blend_upper;
    if (!(hi > lo)) {
        return std::nullopt;
    }

    // h = 0 below the zone and 1 above it, so one expression covers all x.
    const RadiusArray h = ((x - lo) / (hi - lo)).unaryExpr([](double t) {
        return density::SegmentDensity::blend_weight(t);
    });
    return ((1.0 - h) * strong + h * weak).eval();
}

std::optional<RadiusArray>
dilation_ssz(const RadiusArray& x, XiMode mode, const RunConfig& config) {
    auto v = xi(x, mode, config);
    if (!v) {
        return std::nullopt;
    }
    return (1.0 + *v).inverse().eval();
}

std::optional<RadiusArray> dilation_gr(const RadiusArray& x) {
    if (!valid_radii(x)) {
        return std::nullopt;
    }
    return x.unaryExpr([](double v) {
        if (v <= 1.0) return 0.0;
        return std::sqrt(1.0 - std::min(1.0 / v, constants::GR_RATIO_CLAMP));
    }).eval();
}

// ─── Regimes ──────────────────────────────────────────────────────────────────

RegimeArray classify(const RadiusArray& x, const ModelParameters& params) {
    RegimeArray out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        out(i) = static_cast<int>(regime::classify(x(i), params));
    }
    return out;
}

std::optional<double>
max_identity_error(const RadiusArray& x, XiMode mode, const RunConfig& config) {
    const auto v = xi(x, mode, config);
    if (!v) {
        return std::nullopt;
    }
    const RadiusArray d = (1.0 + *v).inverse();
    return (d * (1.0 + *v) - 1.0).abs().maxCoeff();
}

} // namespace ssz::sweep
