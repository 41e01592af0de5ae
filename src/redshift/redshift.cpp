/// @file src/redshift/redshift.cpp
/// @brief Redshift composition implementation.

#include "ssz/redshift.hpp"
#include "ssz/regime.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ssz::redshift {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

} // anonymous namespace

// ─── Geometry ─────────────────────────────────────────────────────────────────

std::optional<double>
schwarzschild_radius(double mass_kg, const PhysicalConstants& k) noexcept {
    if (!std::isfinite(mass_kg) || mass_kg <= 0.0) {
        return std::nullopt;
    }
    return 2.0 * k.g * mass_kg / (k.c * k.c);
}

// ─── GR and SR Components ────────────────────────────────────────────────────

double gravitational_from_rs(double r, double r_s) noexcept {
    if (!std::isfinite(r) || !std::isfinite(r_s) || r <= 0.0 || r_s <= 0.0) {
        return NaN;
    }
    // At or inside the horizon GR has no static emitter.
    if (r <= r_s) {
        return NaN;
    }
    return 1.0 / std::sqrt(1.0 - r_s / r) - 1.0;
}

double gravitational(double mass_kg, double r, const PhysicalConstants& k) noexcept {
    const auto r_s = schwarzschild_radius(mass_kg, k);
    if (!r_s) {
        return NaN;
    }
    return gravitational_from_rs(r, *r_s);
}

double doppler(double v_total, double v_los, double c) noexcept {
    if (!std::isfinite(c) || c <= 0.0) {
        return NaN;
    }
    if (!std::isfinite(v_total)) v_total = 0.0;
    if (!std::isfinite(v_los))   v_los   = 0.0;

    if (v_total == 0.0 && v_los == 0.0) {
        return 0.0;
    }

    const double beta = std::abs(v_total) / c;
    if (beta >= 1.0) {
        return NaN;
    }

    const double gamma    = 1.0 / std::sqrt(1.0 - beta * beta);
    const double beta_los = v_los / c;
    return gamma * (1.0 + beta_los) - 1.0;
}

double combined(double z_a, double z_b) noexcept {
    // Expanded form keeps combined(z, 0) == z exactly.
    return z_a + z_b + z_a * z_b;
}

double combined(std::optional<double> z_a, std::optional<double> z_b) noexcept {
    return combined(z_a.value_or(0.0), z_b.value_or(0.0));
}

// ─── Mass Correction ──────────────────────────────────────────────────────────

double mass_normalization(double mass_kg, const ModelParameters& p) noexcept {
    if (!std::isfinite(mass_kg) || mass_kg <= 0.0) {
        return 0.0;
    }
    const double span = p.log_mass_max - p.log_mass_min;
    if (!(span > 0.0)) {
        return 0.0;
    }
    const double norm = (std::log10(mass_kg) - p.log_mass_min) / span;
    return std::clamp(norm, 0.0, 1.0);
}

double delta_m_raw(double r_s, const ModelParameters& p) noexcept {
    if (!std::isfinite(r_s) || r_s < 0.0) {
        return 0.0;
    }
    return p.delta_m_a * std::exp(-p.delta_m_alpha * r_s) + p.delta_m_b;
}

double delta_m_percent(double mass_kg, double r_s, Regime regime,
                       const ModelParameters& p) noexcept {
    if (!regime::regime_info(regime).use_delta_m) {
        return 0.0;
    }
    return delta_m_raw(r_s, p) * mass_normalization(mass_kg, p);
}

double ssz_gravitational(double z_gr, double delta_pct) noexcept {
    return z_gr * (1.0 + delta_pct / 100.0);
}

double geometric_hint(double mass_kg, double r, double delta_pct,
                      const PhysicalConstants& k) noexcept {
    if (!std::isfinite(mass_kg) || !std::isfinite(r) ||
        mass_kg <= 0.0 || r <= 0.0) {
        return NaN;
    }

    const double m_eff  = mass_kg * (1.0 + delta_pct / 100.0);
    const double beta   = 2.0 * k.g * m_eff / (r * k.c * k.c);
    const double factor = 1.0 - beta * k.phi / 2.0;
    if (factor <= 0.0) {
        return NaN;
    }
    return 1.0 / std::sqrt(factor) - 1.0;
}

// ─── Composition ──────────────────────────────────────────────────────────────

RedshiftBreakdown
compose(double mass_kg, double r, double r_s, double v_total, Regime regime,
        const RunConfig& config) noexcept {
    const PhysicalConstants& k = config.constants;
    const ModelParameters&   p = config.params;

    RedshiftBreakdown out{};
    out.z_gr   = gravitational_from_rs(r, r_s);
    out.z_sr   = doppler(v_total, 0.0, k.c);
    out.z_grsr = combined(out.z_gr, out.z_sr);

    if (regime == Regime::Weak) {
        // Weak-field contract: SSZ gravitational redshift is GR's, untouched.
        out.delta_m_pct = 0.0;
        out.z_ssz_grav  = out.z_gr;
    } else {
        switch (config.redshift_mode) {
            case RedshiftMode::DeltaM:
                out.delta_m_pct = delta_m_percent(mass_kg, r_s, regime, p);
                out.z_ssz_grav  = ssz_gravitational(out.z_gr, out.delta_m_pct);
                break;
            case RedshiftMode::GeometricHint:
                out.delta_m_pct = delta_m_raw(r_s, p);
                out.z_ssz_grav  = geometric_hint(mass_kg, r, out.delta_m_pct, k);
                break;
            case RedshiftMode::Uncorrected:
                out.delta_m_pct = 0.0;
                out.z_ssz_grav  = out.z_gr;
                break;
        }
    }

    out.z_ssz_total = combined(out.z_ssz_grav, out.z_sr);
    return out;
}

} // namespace ssz::redshift
