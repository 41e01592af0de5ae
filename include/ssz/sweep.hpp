#pragma once

/// @file include/ssz/sweep.hpp
/// @brief Vectorised sweeps of Ξ, D and regime over normalised radius.
///
/// # Module: Radius Sweeps
///
/// ## Responsibility
/// Evaluate the scalar kernels element-wise over an Eigen array of
/// x = r / r_s. Ξ and D depend on r and r_s only through x, so sweeps are
/// expressed in units of r_s.
///
/// ## Guarantees
/// - Element i of every output corresponds to element i of the input
/// - Same formulas as segment_density.hpp / dilation.hpp / regime.hpp
/// - `nullopt` if any x is non-finite or ≤ 0
///
/// ## NOT Responsible For
/// - Plotting or writing sweep tables

#include "ssz/config.hpp"
#include "ssz/types.hpp"

#include <optional>

namespace ssz::sweep {

/// n points evenly spaced on [lo, hi].
[[nodiscard]] RadiusArray linspace(double lo, double hi, Eigen::Index n);

/// n points evenly spaced in log10 between 10^lo_exp and 10^hi_exp.
[[nodiscard]] RadiusArray logspace(double lo_exp, double hi_exp, Eigen::Index n);

/// Ξ(x) with the selected formula.
[[nodiscard]] std::optional<RadiusArray>
xi(const RadiusArray& x, XiMode mode, const RunConfig& config);

/// D_SSZ(x) = 1 / (1 + Ξ(x)).
[[nodiscard]] std::optional<RadiusArray>
dilation_ssz(const RadiusArray& x, XiMode mode, const RunConfig& config);

/// D_GR(x) = √(1 − 1/x), 0 for x ≤ 1.
[[nodiscard]] std::optional<RadiusArray> dilation_gr(const RadiusArray& x);

/// Regime code per element (`static_cast<int>(Regime)`).
[[nodiscard]] RegimeArray classify(const RadiusArray& x, const ModelParameters& params);

/// max |D_SSZ·(1 + Ξ) − 1| over the sweep.
[[nodiscard]] std::optional<double>
max_identity_error(const RadiusArray& x, XiMode mode, const RunConfig& config);

} // namespace ssz::sweep
