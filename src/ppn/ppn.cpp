/// @file src/ppn/ppn.cpp
/// @brief PPN observables implementation.

#include "ssz/ppn.hpp"
#include "ssz/redshift.hpp"

#include <cmath>
#include <numbers>

namespace ssz::ppn {

namespace {

bool positive(double v) noexcept {
    return std::isfinite(v) && v > 0.0;
}

/// The result if finite, otherwise nullopt.
std::optional<double> finite_or_none(double v) noexcept {
    if (!std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

} // anonymous namespace

std::optional<double>
light_deflection(double mass_kg, double impact_m, const PhysicalConstants& k,
                 const PpnParameters& p) noexcept {
    if (!positive(impact_m)) {
        return std::nullopt;
    }
    const auto r_s = redshift::schwarzschild_radius(mass_kg, k);
    if (!r_s) {
        return std::nullopt;
    }
    return finite_or_none((1.0 + p.gamma) * *r_s / impact_m);
}

std::optional<double>
shapiro_delay(double mass_kg, double r1_m, double r2_m, double impact_m,
              const PhysicalConstants& k, const PpnParameters& p) noexcept {
    if (!positive(r1_m) || !positive(r2_m) || !positive(impact_m)) {
        return std::nullopt;
    }
    const auto r_s = redshift::schwarzschild_radius(mass_kg, k);
    if (!r_s) {
        return std::nullopt;
    }
    const double argument = 4.0 * r1_m * r2_m / (impact_m * impact_m);
    return finite_or_none((1.0 + p.gamma) * (*r_s / k.c) * std::log(argument));
}

std::optional<double>
perihelion_precession(double mass_kg, double semi_major_m, double eccentricity,
                      const PhysicalConstants& k, const PpnParameters& p) noexcept {
    if (!positive(mass_kg) || !positive(semi_major_m) ||
        !std::isfinite(eccentricity) || eccentricity < 0.0 || eccentricity >= 1.0) {
        return std::nullopt;
    }
    const double factor = (2.0 + 2.0 * p.gamma - p.beta) / 3.0;
    const double base   = 6.0 * std::numbers::pi * k.g * mass_kg /
                          (k.c * k.c * semi_major_m * (1.0 - eccentricity * eccentricity));
    return finite_or_none(base * factor);
}

std::optional<double>
precession_arcsec_per_century(double mass_kg, double semi_major_m, double eccentricity,
                              double period_years, const PhysicalConstants& k,
                              const PpnParameters& p) noexcept {
    if (!positive(period_years)) {
        return std::nullopt;
    }
    const auto per_orbit = perihelion_precession(mass_kg, semi_major_m, eccentricity, k, p);
    if (!per_orbit) {
        return std::nullopt;
    }
    return finite_or_none(to_arcsec(*per_orbit) * 100.0 / period_years);
}

} // namespace ssz::ppn
