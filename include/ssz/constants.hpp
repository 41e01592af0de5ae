#pragma once

#include <cstddef>

/// @file include/ssz/constants.hpp
/// @brief Physical constants and canonical model parameters for the SSZ engine.
///
/// These are the compile-time defaults. At run time every engine call reads
/// them through a `RunConfig` snapshot (see config.hpp), never directly.

namespace ssz::constants {

// ─── Physical Constants (CODATA 2018 / IAU) ──────────────────────────────────

/// Newtonian gravitational constant [m³ kg⁻¹ s⁻²].
static constexpr double G = 6.67430e-11;

/// Speed of light in vacuum [m/s] (exact by SI definition).
static constexpr double C = 299792458.0;

/// Nominal solar mass [kg].
static constexpr double M_SUN = 1.98847e30;

/// Nominal solar radius [m].
static constexpr double R_SUN = 6.9634e8;

/// Golden ratio φ = (1 + √5) / 2.
static constexpr double PHI = 1.6180339887498948482;

// ─── Reference Bodies ─────────────────────────────────────────────────────────

static constexpr double M_EARTH = 5.972e24;
static constexpr double R_EARTH = 6.371e6;

/// GPS orbital altitude above the surface [m].
static constexpr double GPS_ALTITUDE = 20200e3;

static constexpr double SECONDS_PER_DAY = 86400.0;

// ─── Segment Density ──────────────────────────────────────────────────────────

/// Lower edge of the strong→weak blend zone, in units of r_s.
static constexpr double BLEND_LOWER = 1.8;

/// Upper edge of the strong→weak blend zone, in units of r_s.
static constexpr double BLEND_UPPER = 2.2;

/// Ξ saturation ceiling of the strong-field formula.
static constexpr double XI_MAX = 1.0;

/// Ξ_strong at r = r_s: 1 − e^(−φ) ≈ 0.8017.
static constexpr double XI_AT_HORIZON = 0.80171184713779377;

/// D_SSZ at r = r_s: 1 / (2 − e^(−φ)) ≈ 0.5550.
static constexpr double D_SSZ_AT_HORIZON = 0.55502770966878183;

// ─── Regime Boundaries (x = r / r_s) ─────────────────────────────────────────

static constexpr double REGIME_VERY_CLOSE_MAX   = 1.8;
static constexpr double REGIME_BLENDED_MAX      = 2.2;
static constexpr double REGIME_PHOTON_SPHERE_MAX = 3.0;
static constexpr double REGIME_STRONG_MAX       = 10.0;

// ─── Mass-Dependent Correction Δ(M) ──────────────────────────────────────────

/// Δ(M) = (A·e^(−α·r_s) + B) · norm(log10 M)  [percent]
static constexpr double DELTA_M_A     = 98.01;
static constexpr double DELTA_M_ALPHA = 2.7177e4;
static constexpr double DELTA_M_B     = 1.96;

/// log10(M / kg) range over which Δ(M) is normalised to [0, 1].
static constexpr double LOG_MASS_MIN = 10.0;
static constexpr double LOG_MASS_MAX = 42.0;

// ─── Power-Law Energy Scaling ─────────────────────────────────────────────────

/// E_norm = 1 + α·(r_s/R)^β, fitted over 49 compact objects.
static constexpr double POWER_LAW_ALPHA     = 0.3187;
static constexpr double POWER_LAW_BETA      = 0.9821;
static constexpr double POWER_LAW_R_SQUARED = 0.997134;

// ─── Parametrized Post-Newtonian ──────────────────────────────────────────────

/// Space-curvature parameter γ. SSZ matches GR in the weak field.
static constexpr double PPN_GAMMA = 1.0;

/// Nonlinearity parameter β.
static constexpr double PPN_BETA = 1.0;

/// Astronomical unit [m] (IAU 2012, exact).
static constexpr double AU = 1.495978707e11;

/// Arcseconds per radian, 648000 / π.
static constexpr double ARCSEC_PER_RADIAN = 206264.80624709636;

// ─── Universal Intersection ──────────────────────────────────────────────────

/// D_SSZ(strong) and D_GR cross at r*/r_s, independent of mass.
static constexpr double INTERSECTION_R_OVER_RS = 1.386562;
static constexpr double INTERSECTION_D_STAR    = 0.528007;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Relative epsilon used by the SSZ/GR winner decision.
static constexpr double WINNER_REL_EPSILON = 1e-12;

/// Lower floor of the winner epsilon scale.
static constexpr double WINNER_ABS_FLOOR = 1e-20;

/// Upper bound on D_GR's r_s/r ratio so the radicand stays positive.
static constexpr double GR_RATIO_CLAMP = 0.9999999;

/// Number of objects in the shipped regression catalogue.
static constexpr std::size_t GOLDEN_OBJECT_COUNT = 47;

} // namespace ssz::constants
