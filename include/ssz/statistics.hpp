#pragma once

/// @file include/ssz/statistics.hpp
/// @brief Aggregate statistics over a batch of engine outcomes.
///
/// # Module: Batch Statistics
///
/// ## Responsibility
/// Count SSZ / GR / TIE wins, summarise the residuals of both models, and
/// tally objects per regime. Reads results, never modifies them.
///
/// ## Guarantees
/// - Non-finite residuals are excluded from the residual statistics
/// - Rejected rows are counted, never silently ignored
/// - noexcept aggregation; `to_string` formats with {fmt}

#include "ssz/engine.hpp"
#include "ssz/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace ssz::stats {

/// Number of `Regime` enumerators.
inline constexpr std::size_t REGIME_COUNT = 5;

/// Distribution summary for one model's residuals.
struct ResidualStats {
    std::size_t count    = 0;
    double      mean     = 0.0;
    double      std_dev  = 0.0;  ///< Population standard deviation
    double      mean_abs = 0.0;  ///< Mean absolute residual
};

struct BatchSummary {
    std::size_t total            = 0;  ///< Input rows
    std::size_t computed         = 0;  ///< Rows with a result
    std::size_t rejected         = 0;  ///< Rows with an InputError
    std::size_t with_observation = 0;  ///< Results carrying an Observation

    std::size_t ssz_wins = 0;
    std::size_t gr_wins  = 0;
    std::size_t ties     = 0;

    /// ssz_wins / (ssz_wins + gr_wins); `nullopt` when no decided comparison.
    std::optional<double> ssz_win_rate;

    ResidualStats residual_ssz;
    ResidualStats residual_gr;

    /// Object count per regime, indexed by `static_cast<size_t>(Regime)`.
    std::array<std::size_t, REGIME_COUNT> regime_counts{};

    [[nodiscard]] std::size_t count(Regime r) const noexcept {
        return regime_counts[static_cast<std::size_t>(r)];
    }

    [[nodiscard]] std::string to_string() const;
};

/// Residual statistics over the finite entries of `residuals`.
/// `nullopt` if there are none.
[[nodiscard]] std::optional<ResidualStats>
residual_stats(std::span<const double> residuals) noexcept;

/// Aggregate a batch produced by `Engine::compute_batch`.
[[nodiscard]] BatchSummary
summarize(std::span<const core::ComputeOutcome> outcomes) noexcept;

} // namespace ssz::stats
