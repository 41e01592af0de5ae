/**
 * @file  prop_winner_symmetry.cpp
 * @brief Property: ∀ residuals a, b: winner(a, b) mirrors winner(b, a)
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_winner_symmetry
 *
 * The SSZ-vs-GR decision compares |a| against |b| with a relative tolerance
 * ε = 1e-12 · max(|a|, |b|, 1e-20). Swapping the arguments must swap SSZ and
 * GR and leave Tie fixed; flipping signs must change nothing.
 */

#include <rapidcheck.h>
#include <cmath>

#include "ssz/engine.hpp"

using namespace ssz;
using ssz::core::Engine;

namespace {

Winner mirror(Winner w) {
    switch (w) {
        case Winner::SSZ: return Winner::GR;
        case Winner::GR:  return Winner::SSZ;
        case Winner::Tie: return Winner::Tie;
    }
    return Winner::Tie;
}

} // namespace

int main() {
    // ── Property 1: swap symmetry ────────────────────────────────────────────
    rc::check(
        "winner_symmetry: decide(a, b) == mirror(decide(b, a))",
        [](double a, double b) {
            RC_ASSERT(Engine::decide_winner(a, b) == mirror(Engine::decide_winner(b, a)));
        }
    );

    // ── Property 2: sign invariance ─────────────────────────────────────────
    rc::check(
        "winner_symmetry: only magnitudes matter",
        [](double a, double b) {
            RC_ASSERT(Engine::decide_winner(a, b) == Engine::decide_winner(-a, b));
            RC_ASSERT(Engine::decide_winner(a, b) == Engine::decide_winner(a, -b));
        }
    );

    // ── Property 3: equal magnitude always ties ─────────────────────────────
    rc::check(
        "winner_symmetry: |a| == |b| is a tie",
        [](double a) {
            RC_ASSERT(Engine::decide_winner(a, a) == Winner::Tie);
            RC_ASSERT(Engine::decide_winner(a, -a) == Winner::Tie);
        }
    );

    // ── Property 4: observation at the midpoint ties ────────────────────────
    rc::check(
        "winner_symmetry: z_obs halfway between predictions is a tie",
        [](double raw_lo, double raw_gap) {
            if (!std::isfinite(raw_lo))  raw_lo  = 0.0;
            if (!std::isfinite(raw_gap)) raw_gap = 1.0;
            // Dyadic values keep the midpoint exact.
            const double lo  = std::ldexp(std::round(std::tanh(raw_lo) * 1024.0), -10);
            const double gap = std::ldexp(std::round(std::abs(std::tanh(raw_gap)) * 1024.0) + 2.0, -10);
            const double hi  = lo + gap;
            const double mid = lo + gap / 2.0;
            RC_ASSERT(Engine::observe(hi, lo, mid).winner == Winner::Tie);
            RC_ASSERT(Engine::observe(lo, hi, mid).winner == Winner::Tie);
        }
    );

    return 0;
}
