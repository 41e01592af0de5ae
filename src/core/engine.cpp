/// @file src/core/engine.cpp
/// @brief Object orchestrator implementation.

#include "ssz/engine.hpp"
#include "ssz/dilation.hpp"
#include "ssz/redshift.hpp"
#include "ssz/regime.hpp"
#include "ssz/segment_density.hpp"
#include "ssz/constants.hpp"
#include "ssz/parallel.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <thread>
#include <utility>

namespace ssz {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Winner w) noexcept {
    switch (w) {
        case Winner::SSZ: return "SSZ";
        case Winner::GR:  return "GR";
        case Winner::Tie: return "TIE";
    }
    return "Unknown";
}

std::optional<Winner> parse_winner(std::string_view label) noexcept {
    if (label == "SSZ" || label == "SEG") return Winner::SSZ;
    if (label == "GR")                    return Winner::GR;
    if (label == "TIE")                   return Winner::Tie;
    return std::nullopt;
}

const char* to_string(InputErrorKind k) noexcept {
    switch (k) {
        case InputErrorKind::EmptyName:            return "EmptyName";
        case InputErrorKind::NonPositiveMass:      return "NonPositiveMass";
        case InputErrorKind::NonPositiveRadius:    return "NonPositiveRadius";
        case InputErrorKind::SuperluminalVelocity: return "SuperluminalVelocity";
        case InputErrorKind::NonFiniteObservation: return "NonFiniteObservation";
        case InputErrorKind::InvalidConfiguration: return "InvalidConfiguration";
    }
    return "Unknown";
}

std::string CalculationResult::to_string() const {
    std::string out = fmt::format(
        "{:<24} regime={:<13} x={:9.4f}  Xi={:.6f}  D_ssz={:.6f}  D_gr={:.6f}  "
        "z_gr={:.6e}  z_sr={:.6e}  z_ssz={:.6e}  dM={:.4f}%",
        name, ssz::to_string(regime), x, xi, d_ssz, d_gr,
        z_gr, z_sr, z_ssz_total, delta_m_pct);

    if (observation) {
        out += fmt::format("  z_obs={:.6e}  res_ssz={:+.3e}  res_gr={:+.3e}  winner={}",
                           observation->z_obs, observation->residual_ssz,
                           observation->residual_gr,
                           ssz::to_string(observation->winner));
    }
    return out;
}

namespace core {

// ─── Construction ─────────────────────────────────────────────────────────────

Engine::Engine(RunConfig config) : config_(std::move(config)) {}

// ─── Validation ───────────────────────────────────────────────────────────────

std::optional<InputError>
Engine::validate(const CelestialObject& obj, const PhysicalConstants& k) {
    if (obj.name.empty()) {
        return InputError{InputErrorKind::EmptyName, "object name must not be empty"};
    }
    if (!std::isfinite(obj.mass_msun) || obj.mass_msun <= 0.0) {
        return InputError{InputErrorKind::NonPositiveMass,
            fmt::format("'{}': mass must be a positive number of solar masses, got {}",
                        obj.name, obj.mass_msun)};
    }
    if (!std::isfinite(obj.mass_msun * k.m_sun)) {
        return InputError{InputErrorKind::NonPositiveMass,
            fmt::format("'{}': mass of {} solar masses overflows in kg",
                        obj.name, obj.mass_msun)};
    }
    if (!std::isfinite(obj.radius_m) || obj.radius_m <= 0.0) {
        return InputError{InputErrorKind::NonPositiveRadius,
            fmt::format("'{}': radius must be positive, got {} m",
                        obj.name, obj.radius_m)};
    }
    // NaN velocity means "absent"; anything else must stay below c.
    if (!std::isnan(obj.velocity_mps) && std::abs(obj.velocity_mps) >= k.c) {
        return InputError{InputErrorKind::SuperluminalVelocity,
            fmt::format("'{}': |velocity| = {} m/s is not below c = {} m/s",
                        obj.name, std::abs(obj.velocity_mps), k.c)};
    }
    if (obj.z_obs && !std::isfinite(*obj.z_obs)) {
        return InputError{InputErrorKind::NonFiniteObservation,
            fmt::format("'{}': observed redshift must be finite", obj.name)};
    }
    return std::nullopt;
}

// ─── Winner ───────────────────────────────────────────────────────────────────

Winner Engine::decide_winner(double residual_ssz, double residual_gr) noexcept {
    const double a = std::abs(residual_ssz);
    const double b = std::abs(residual_gr);

    const bool a_ok = std::isfinite(a);
    const bool b_ok = std::isfinite(b);
    if (!a_ok && !b_ok) return Winner::Tie;
    if (!a_ok)          return Winner::GR;
    if (!b_ok)          return Winner::SSZ;

    const double eps = constants::WINNER_REL_EPSILON *
                       std::max({a, b, constants::WINNER_ABS_FLOOR});
    if (std::abs(a - b) <= eps) {
        return Winner::Tie;
    }
    return a < b ? Winner::SSZ : Winner::GR;
}

Observation Engine::observe(double z_ssz_total, double z_grsr, double z_obs) noexcept {
    const double res_ssz = z_ssz_total - z_obs;
    const double res_gr  = z_grsr - z_obs;
    return Observation{
        .z_obs        = z_obs,
        .residual_ssz = res_ssz,
        .residual_gr  = res_gr,
        .winner       = decide_winner(res_ssz, res_gr),
    };
}

// ─── Single Object ────────────────────────────────────────────────────────────

CalculationResult Engine::evaluate(const CelestialObject& obj) const {
    const PhysicalConstants& k = config_.constants;

    const double mass_kg = obj.mass_msun * k.m_sun;
    const double r       = obj.radius_m;
    const double v       = std::isnan(obj.velocity_mps) ? 0.0 : obj.velocity_mps;

    // validate() guarantees a positive finite mass, so r_s exists.
    const double r_s = redshift::schwarzschild_radius(mass_kg, k)
                           .value_or(std::numeric_limits<double>::quiet_NaN());
    const Regime regime = regime::classify(r, r_s, config_.params);

    const double xi = density::SegmentDensity::evaluate(r, r_s, config_.xi_mode, config_)
                          .value_or(std::numeric_limits<double>::quiet_NaN());
    const double d_gr = dilation::TimeDilation::gr(r, r_s)
                            .value_or(std::numeric_limits<double>::quiet_NaN());

    const auto z = redshift::compose(mass_kg, r, r_s, v, regime, config_);

    CalculationResult result{
        .name        = obj.name,
        .regime      = regime,
        .mass_kg     = mass_kg,
        .radius_m    = r,
        .r_s         = r_s,
        .x           = r / r_s,
        .xi          = xi,
        .d_ssz       = dilation::TimeDilation::from_xi(xi),
        .d_gr        = d_gr,
        .z_gr        = z.z_gr,
        .z_sr        = z.z_sr,
        .z_grsr      = z.z_grsr,
        .z_ssz_grav  = z.z_ssz_grav,
        .z_ssz_total = z.z_ssz_total,
        .delta_m_pct = z.delta_m_pct,
        .observation = std::nullopt,
    };

    if (obj.z_obs) {
        result.observation = observe(result.z_ssz_total, result.z_grsr, *obj.z_obs);
    }
    return result;
}

std::optional<CalculationResult>
Engine::compute(const CelestialObject& obj) const noexcept {
    if (!config_.is_valid() || validate(obj, config_.constants)) {
        return std::nullopt;
    }
    return evaluate(obj);
}

ComputeOutcome Engine::compute_checked(const CelestialObject& obj) const {
    ComputeOutcome out{.name = obj.name, .result = std::nullopt, .error = std::nullopt};

    if (!config_.is_valid()) {
        out.error = InputError{InputErrorKind::InvalidConfiguration,
            fmt::format("run configuration '{}' is invalid", config_.version)};
        return out;
    }
    if (auto err = validate(obj, config_.constants)) {
        out.error = std::move(err);
        return out;
    }

    out.result = evaluate(obj);
    return out;
}

// ─── Batch ────────────────────────────────────────────────────────────────────

void Engine::report_rejections(const std::vector<ComputeOutcome>& outcomes) const {
    if (!config_.verbose) {
        return;
    }
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].error) {
            fmt::print(stderr, "[ssz] row {} rejected ({}): {}\n", i,
                       ssz::to_string(outcomes[i].error->kind),
                       outcomes[i].error->message);
        }
    }
}

std::vector<ComputeOutcome>
Engine::compute_batch(std::span<const CelestialObject> objects) const {
    std::vector<ComputeOutcome> outcomes;
    outcomes.reserve(objects.size());
    for (const auto& obj : objects) {
        outcomes.push_back(compute_checked(obj));
    }
    report_rejections(outcomes);
    return outcomes;
}

std::vector<ComputeOutcome>
Engine::compute_batch_parallel(std::span<const CelestialObject> objects,
                               unsigned threads) const {
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    const std::size_t n = objects.size();
    const std::size_t workers = std::min<std::size_t>(threads, n);
    if (workers <= 1) {
        return compute_batch(objects);
    }

    // Each worker fills its own contiguous slice of pre-sized slots.
    std::vector<ComputeOutcome> outcomes(n);
    parallel_for(n, workers, [this, objects, &outcomes](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            outcomes[i] = compute_checked(objects[i]);
        }
    });

    report_rejections(outcomes);
    return outcomes;
}

} // namespace core

} // namespace ssz
