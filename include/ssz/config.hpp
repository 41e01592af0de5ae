#pragma once

/// @file include/ssz/config.hpp
/// @brief Run configuration: frozen physical constants and model parameters.
///
/// # Module: Run Configuration
///
/// ## Responsibility
/// Bundle every tunable number the engine reads into a value object that is
/// created once per batch and passed explicitly into each call.
///
/// ## Usage
/// ```cpp
/// ssz::RunConfig cfg;                       // canonical values
/// cfg.redshift_mode = ssz::RedshiftMode::GeometricHint;
/// ssz::core::Engine engine{cfg};
/// ```
///
/// ## Guarantees
/// - Plain aggregates: copying a RunConfig snapshots it
/// - No process-wide mutable state; defaults come from constants.hpp
///
/// ## NOT Responsible For
/// - Reading configuration from files or the environment

#include "ssz/constants.hpp"
#include "ssz/types.hpp"

#include <string>

namespace ssz {

/// Version tag recorded with every run configuration.
inline constexpr const char* RUN_CONFIG_VERSION = "ssz-core/1.0";

// ─── PhysicalConstants ────────────────────────────────────────────────────────

struct PhysicalConstants {
    double g     = constants::G;      ///< Gravitational constant [m³ kg⁻¹ s⁻²]
    double c     = constants::C;      ///< Speed of light [m/s]
    double m_sun = constants::M_SUN;  ///< Reference (solar) mass [kg]
    double phi   = constants::PHI;    ///< Golden ratio

    /// All fields finite and strictly positive.
    [[nodiscard]] bool is_valid() const noexcept;
};

// ─── ModelParameters ──────────────────────────────────────────────────────────

struct ModelParameters {
    // Segment density blend zone, in units of r_s.
    double blend_lower = constants::BLEND_LOWER;
    double blend_upper = constants::BLEND_UPPER;
    double xi_max      = constants::XI_MAX;

    // Regime boundaries, in units of r_s.
    double very_close_max    = constants::REGIME_VERY_CLOSE_MAX;
    double blended_max       = constants::REGIME_BLENDED_MAX;
    double photon_sphere_max = constants::REGIME_PHOTON_SPHERE_MAX;
    double strong_max        = constants::REGIME_STRONG_MAX;

    // Δ(M) mass correction.
    double delta_m_a     = constants::DELTA_M_A;
    double delta_m_alpha = constants::DELTA_M_ALPHA;
    double delta_m_b     = constants::DELTA_M_B;
    double log_mass_min  = constants::LOG_MASS_MIN;
    double log_mass_max  = constants::LOG_MASS_MAX;

    // Power-law energy scaling.
    double power_law_alpha = constants::POWER_LAW_ALPHA;
    double power_law_beta  = constants::POWER_LAW_BETA;

    /// Boundaries strictly increasing, blend zone non-empty, all finite.
    [[nodiscard]] bool is_valid() const noexcept;
};

// ─── RunConfig ────────────────────────────────────────────────────────────────

/// Frozen configuration for one batch.
struct RunConfig {
    std::string       version       = RUN_CONFIG_VERSION;
    PhysicalConstants constants{};
    ModelParameters   params{};
    XiMode            xi_mode       = XiMode::Auto;
    RedshiftMode      redshift_mode = RedshiftMode::DeltaM;

    /// If true, the engine reports rejected rows on stderr.
    bool verbose = false;

    [[nodiscard]] bool is_valid() const noexcept {
        return !version.empty() && constants.is_valid() && params.is_valid();
    }
};

} // namespace ssz
