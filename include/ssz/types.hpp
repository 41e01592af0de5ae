#pragma once

/// @file include/ssz/types.hpp
/// @brief Shared value types for the segmented-spacetime (SSZ) engine.
///
/// Input records, result records, the closed enums that replace string-typed
/// mode switches, and the Eigen array aliases used for vectorised sweeps.

#include <Eigen/Dense>

#include <optional>
#include <string>
#include <string_view>

namespace ssz {

// ─── Array Aliases ────────────────────────────────────────────────────────────

/// Dynamic column of doubles used for radius sweeps (elementwise math).
using RadiusArray = Eigen::ArrayXd;

/// Dynamic column of integer regime codes produced by a classification sweep.
using RegimeArray = Eigen::ArrayXi;

// ─── Regime ───────────────────────────────────────────────────────────────────

/// Discrete zone of normalised radius x = r / r_s, ordered inner to outer.
enum class Regime {
    VeryClose,     ///< x < 1.8
    Blended,       ///< 1.8 ≤ x ≤ 2.2
    PhotonSphere,  ///< 2.2 < x ≤ 3.0
    Strong,        ///< 3.0 < x ≤ 10.0
    Weak,          ///< x > 10.0 (also r_s ≤ 0)
};

/// Snake-case label ("very_close", "photon_sphere", ...).
[[nodiscard]] const char* to_string(Regime r) noexcept;

/// Inverse of `to_string(Regime)`. `nullopt` for an unknown label.
[[nodiscard]] std::optional<Regime> parse_regime(std::string_view label) noexcept;

// ─── Modes ────────────────────────────────────────────────────────────────────

/// Which segment-density formula to evaluate.
enum class XiMode {
    Auto,    ///< Strong inside, weak outside, quintic blend in between
    Weak,    ///< Ξ = r_s / (2r) everywhere
    Strong,  ///< Ξ = 1 − e^(−φ·r/r_s) everywhere
};

[[nodiscard]] const char* to_string(XiMode m) noexcept;

/// How the SSZ gravitational redshift is formed outside the weak regime.
enum class RedshiftMode {
    DeltaM,         ///< z_gr · (1 + Δ(M)/100) for fixed-radius surfaces
    GeometricHint,  ///< 1/√(1 − βφ/2) − 1 with Δ-inflated mass, orbiting sources
    Uncorrected,    ///< z_gr, no model correction
};

[[nodiscard]] const char* to_string(RedshiftMode m) noexcept;

// ─── Winner ───────────────────────────────────────────────────────────────────

/// Outcome of the SSZ-vs-GR comparison against an observed redshift.
enum class Winner {
    SSZ,
    GR,
    Tie,
};

/// "SSZ", "GR" or "TIE".
[[nodiscard]] const char* to_string(Winner w) noexcept;

/// Accepts "SSZ", "GR", "TIE" and the legacy alias "SEG" (= SSZ).
[[nodiscard]] std::optional<Winner> parse_winner(std::string_view label) noexcept;

// ─── Input Record ─────────────────────────────────────────────────────────────

/// One astronomical body handed to the engine. Immutable once constructed.
struct CelestialObject {
    std::string           name;               ///< Required, non-empty
    double                mass_msun   = 0.0;  ///< Mass [M☉], > 0
    double                radius_m    = 0.0;  ///< Emission radius [m], > 0
    double                velocity_mps = 0.0; ///< Total speed [m/s], |v| < c
    std::optional<double> z_obs;              ///< Observed redshift, enables comparison
};

/// Why a `CelestialObject` was rejected at the engine boundary.
enum class InputErrorKind {
    EmptyName,
    NonPositiveMass,
    NonPositiveRadius,
    SuperluminalVelocity,
    NonFiniteObservation,
    InvalidConfiguration,
};

[[nodiscard]] const char* to_string(InputErrorKind k) noexcept;

/// Descriptive rejection of an input record.
struct InputError {
    InputErrorKind kind;
    std::string    message;
};

// ─── Result Record ────────────────────────────────────────────────────────────

/// Observation-dependent fields. Present as a group or not at all.
struct Observation {
    double z_obs;         ///< Observed redshift
    double residual_ssz;  ///< z_ssz_total − z_obs
    double residual_gr;   ///< z_grsr − z_obs
    Winner winner;        ///< Closer model, or Tie within ε
};

/// All derived quantities for one object.
struct CalculationResult {
    std::string name;
    Regime      regime;
    double      mass_kg;
    double      radius_m;
    double      r_s;          ///< Schwarzschild radius [m]
    double      x;            ///< r / r_s
    double      xi;           ///< Segment density Ξ(r)
    double      d_ssz;        ///< 1 / (1 + Ξ)
    double      d_gr;         ///< √(1 − r_s/r), 0 at or inside r_s
    double      z_gr;         ///< GR gravitational redshift (NaN at/inside r_s)
    double      z_sr;         ///< Special-relativistic Doppler redshift
    double      z_grsr;       ///< (1 + z_gr)(1 + z_sr) − 1
    double      z_ssz_grav;   ///< Corrected gravitational redshift
    double      z_ssz_total;  ///< (1 + z_ssz_grav)(1 + z_sr) − 1
    double      delta_m_pct;  ///< Applied Δ(M) [%], 0 in the weak regime
    std::optional<Observation> observation;

    /// One-line human-readable summary.
    [[nodiscard]] std::string to_string() const;
};

} // namespace ssz
