/// @file src/regime/regime_classifier.cpp
/// @brief Regime classifier implementation.

#include "ssz/regime.hpp"

#include <cmath>

namespace ssz {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Regime r) noexcept {
    switch (r) {
        case Regime::VeryClose:    return "very_close";
        case Regime::Blended:      return "blended";
        case Regime::PhotonSphere: return "photon_sphere";
        case Regime::Strong:       return "strong";
        case Regime::Weak:         return "weak";
    }
    return "Unknown";
}

std::optional<Regime> parse_regime(std::string_view label) noexcept {
    for (Regime r : {Regime::VeryClose, Regime::Blended, Regime::PhotonSphere,
                     Regime::Strong, Regime::Weak}) {
        if (label == to_string(r)) {
            return r;
        }
    }
    return std::nullopt;
}

namespace regime {

// ─── classify ─────────────────────────────────────────────────────────────────

Regime classify(double x, const ModelParameters& params) noexcept {
    if (!std::isfinite(x)) {
        return Regime::Weak;
    }
    if (x < params.very_close_max)     return Regime::VeryClose;
    if (x <= params.blended_max)       return Regime::Blended;
    if (x <= params.photon_sphere_max) return Regime::PhotonSphere;
    if (x <= params.strong_max)        return Regime::Strong;
    return Regime::Weak;
}

Regime classify(double x) noexcept {
    return classify(x, ModelParameters{});
}

Regime classify(double r, double r_s, const ModelParameters& params) noexcept {
    // A massless or undefined source has no strong field anywhere.
    if (!std::isfinite(r_s) || r_s <= 0.0 || !std::isfinite(r)) {
        return Regime::Weak;
    }
    return classify(r / r_s, params);
}

// ─── regime_info ──────────────────────────────────────────────────────────────

RegimeInfo regime_info(Regime r) noexcept {
    switch (r) {
        case Regime::VeryClose:
        case Regime::PhotonSphere:
        case Regime::Strong:
            return RegimeInfo{.use_delta_m = true, .use_geom_hint = true,
                              .use_blending = false};
        case Regime::Blended:
            return RegimeInfo{.use_delta_m = true, .use_geom_hint = true,
                              .use_blending = true};
        case Regime::Weak:
            break;
    }
    return RegimeInfo{.use_delta_m = false, .use_geom_hint = false,
                      .use_blending = false};
}

} // namespace regime

} // namespace ssz
