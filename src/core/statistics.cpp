/// @file src/core/statistics.cpp
/// @brief Batch statistics implementation.

#include "ssz/statistics.hpp"

#include <fmt/format.h>

#include <cmath>
#include <vector>

namespace ssz::stats {

// ─── residual_stats ───────────────────────────────────────────────────────────

std::optional<ResidualStats>
residual_stats(std::span<const double> residuals) noexcept {
    ResidualStats s;
    double sum = 0.0;
    double abs_sum = 0.0;
    for (double r : residuals) {
        if (!std::isfinite(r)) continue;
        sum += r;
        abs_sum += std::abs(r);
        ++s.count;
    }
    if (s.count == 0) {
        return std::nullopt;
    }

    const double n = static_cast<double>(s.count);
    s.mean     = sum / n;
    s.mean_abs = abs_sum / n;

    // Population variance (n denominator), second pass for stability.
    double sq_sum = 0.0;
    for (double r : residuals) {
        if (!std::isfinite(r)) continue;
        const double d = r - s.mean;
        sq_sum += d * d;
    }
    s.std_dev = std::sqrt(sq_sum / n);
    return s;
}

// ─── summarize ────────────────────────────────────────────────────────────────

BatchSummary summarize(std::span<const core::ComputeOutcome> outcomes) noexcept {
    BatchSummary out;
    out.total = outcomes.size();

    std::vector<double> res_ssz;
    std::vector<double> res_gr;
    res_ssz.reserve(outcomes.size());
    res_gr.reserve(outcomes.size());

    for (const auto& o : outcomes) {
        if (!o.result) {
            ++out.rejected;
            continue;
        }
        ++out.computed;
        ++out.regime_counts[static_cast<std::size_t>(o.result->regime)];

        const auto& obs = o.result->observation;
        if (!obs) continue;

        ++out.with_observation;
        res_ssz.push_back(obs->residual_ssz);
        res_gr.push_back(obs->residual_gr);

        switch (obs->winner) {
            case Winner::SSZ: ++out.ssz_wins; break;
            case Winner::GR:  ++out.gr_wins;  break;
            case Winner::Tie: ++out.ties;     break;
        }
    }

    const std::size_t decided = out.ssz_wins + out.gr_wins;
    if (decided > 0) {
        out.ssz_win_rate = static_cast<double>(out.ssz_wins) / static_cast<double>(decided);
    }

    if (auto s = residual_stats(res_ssz)) out.residual_ssz = *s;
    if (auto s = residual_stats(res_gr))  out.residual_gr  = *s;

    return out;
}

// ─── BatchSummary::to_string ──────────────────────────────────────────────────

std::string BatchSummary::to_string() const {
    std::string out = fmt::format(
        "Objects: {} ({} computed, {} rejected, {} with observation)\n"
        "Winners: SSZ={}  GR={}  TIE={}  SSZ win rate={}\n"
        "Residual SSZ: mean={:+.4e}  std={:.4e}  MAE={:.4e}\n"
        "Residual GR : mean={:+.4e}  std={:.4e}  MAE={:.4e}\n"
        "Regimes:",
        total, computed, rejected, with_observation,
        ssz_wins, gr_wins, ties,
        ssz_win_rate ? fmt::format("{:.1f}%", 100.0 * *ssz_win_rate) : std::string{"n/a"},
        residual_ssz.mean, residual_ssz.std_dev, residual_ssz.mean_abs,
        residual_gr.mean, residual_gr.std_dev, residual_gr.mean_abs);

    for (Regime r : {Regime::VeryClose, Regime::Blended, Regime::PhotonSphere,
                     Regime::Strong, Regime::Weak}) {
        out += fmt::format(" {}={}", ssz::to_string(r), count(r));
    }
    return out;
}

} // namespace ssz::stats
