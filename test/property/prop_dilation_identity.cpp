/**
 * @file  prop_dilation_identity.cpp
 * @brief Property: ∀ r > 0, r_s > 0, mode: D_SSZ · (1 + Ξ) = 1 and D_SSZ ∈ (0, 1]
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_dilation_identity
 *
 * Mathematical basis:
 *   D_SSZ is defined as 1 / (1 + Ξ) with Ξ ≥ 0 in every formula mode, so the
 *   product D·(1 + Ξ) is exactly one up to rounding and D never leaves (0, 1].
 *   Unlike D_GR, D_SSZ stays finite and positive at and inside r = r_s.
 *
 * A failure would indicate:
 *   • A negative Ξ escaping one of the formula branches.
 *   • The blend weight leaving [0, 1] near the zone edges.
 *   • Overflow in the strong-field exponential for extreme r/r_s.
 */

#include <rapidcheck.h>
#include <cmath>

#include "ssz/dilation.hpp"
#include "ssz/segment_density.hpp"

using namespace ssz;
using ssz::density::SegmentDensity;
using ssz::dilation::TimeDilation;

namespace {

/// Map an arbitrary double to a ratio x = r / r_s in [1e-4, 1e6].
double to_ratio(double raw) {
    if (!std::isfinite(raw)) raw = 0.0;
    const double e = std::tanh(raw) * 5.0 + 1.0;  // exponent in [-4, 6]
    return std::pow(10.0, e);
}

XiMode to_mode(int raw) {
    switch (((raw % 3) + 3) % 3) {
        case 0:  return XiMode::Auto;
        case 1:  return XiMode::Weak;
        default: return XiMode::Strong;
    }
}

} // namespace

int main() {
    const RunConfig cfg{};

    // ── Property 1: identity D·(1 + Ξ) = 1 ───────────────────────────────────
    rc::check(
        "dilation_identity: D_SSZ * (1 + Xi) == 1 for every mode",
        [&cfg](double raw_x, double raw_rs, int raw_mode) {
            const double x   = to_ratio(raw_x);
            const double r_s = 1.0 + std::abs(std::fmod(std::isfinite(raw_rs) ? raw_rs : 0.0, 1e9));
            const XiMode mode = to_mode(raw_mode);

            const auto xi = SegmentDensity::evaluate(x * r_s, r_s, mode, cfg);
            const auto d  = TimeDilation::ssz(x * r_s, r_s, mode, cfg);
            RC_ASSERT(xi.has_value());
            RC_ASSERT(d.has_value());
            RC_ASSERT(*xi >= 0.0);
            RC_ASSERT(std::abs(*d * (1.0 + *xi) - 1.0) < 1e-12);
        }
    );

    // ── Property 2: D_SSZ ∈ (0, 1] everywhere, including inside r_s ─────────
    rc::check(
        "dilation_identity: D_SSZ in (0, 1]",
        [&cfg](double raw_x) {
            const double x = to_ratio(raw_x);
            const auto d = TimeDilation::ssz(x, 1.0, XiMode::Auto, cfg);
            RC_ASSERT(d.has_value());
            RC_ASSERT(std::isfinite(*d));
            RC_ASSERT(*d > 0.0);
            RC_ASSERT(*d <= 1.0);
        }
    );

    // ── Property 3: D_GR ∈ [0, 1), zero at or inside the horizon ────────────
    rc::check(
        "dilation_identity: D_GR in [0, 1) and 0 for r <= r_s",
        [](double raw_x) {
            const double x = to_ratio(raw_x);
            const auto d = TimeDilation::gr(x, 1.0);
            RC_ASSERT(d.has_value());
            RC_ASSERT(*d >= 0.0);
            RC_ASSERT(*d < 1.0);
            if (x <= 1.0) {
                RC_ASSERT(*d == 0.0);
            }
        }
    );

    return 0;
}
