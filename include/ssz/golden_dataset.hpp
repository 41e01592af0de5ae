#pragma once

/// @file include/ssz/golden_dataset.hpp
/// @brief CSV loader for the reference ("golden") regression catalogue.
///
/// # Module: GoldenDataset
///
/// ## Responsibility
/// Parse the tabular reference file consumed by the validation harness into
/// `GoldenRecord`s. Malformed rows are skipped; the loader never crashes on
/// bad input.
///
/// ## Expected CSV Format
/// ```
/// case,regime,x,M_msun,r_m,v_tot,z_obs,z_ssz,z_grsr,winner
/// PSR_J0740+6620,photon_sphere,2.23,2.08,1.3698e4,0,0.3517,0.3508,0.3464,SSZ
/// ```
/// Columns are located by header name, in any order. Required: `case`,
/// `M_msun`, `r_m`, `z_obs`, `z_ssz` (alias `z_seg`), `z_grsr`, `winner`.
/// Optional: `v_tot` (empty → 0), `regime`, `x`. Lines starting with `#` are
/// comments. Winner labels: SSZ, GR, TIE (legacy SEG = SSZ).
///
/// ## Guarantees
/// - Never throws; `load_csv` returns `nullopt` only if the file cannot be read
/// - Does not modify any file or external state
///
/// ## NOT Responsible For
/// - Deciding what a missing file means (the harness treats it as fatal)

#include "ssz/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ssz::core {

/// One reference row: object inputs plus the reference model outputs.
struct GoldenRecord {
    std::string           name;
    std::optional<Regime> regime;        ///< Reference regime label, if given
    std::optional<double> x;             ///< Reference r / r_s, if given
    double                mass_msun    = 0.0;
    double                radius_m     = 0.0;
    double                velocity_mps = 0.0;
    double                z_obs        = 0.0;
    double                z_ssz        = 0.0;  ///< Reference SSZ total redshift
    double                z_grsr       = 0.0;  ///< Reference GR×SR redshift
    Winner                winner       = Winner::Tie;

    /// Engine input for this row (observation attached).
    [[nodiscard]] CelestialObject to_object() const;
};

class GoldenDataset {
public:
    /// Load records from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the header is missing a required column
    [[nodiscard]] static std::optional<std::vector<GoldenRecord>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse records from CSV text (first non-comment line is the header).
    [[nodiscard]] static std::vector<GoldenRecord>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Convert rows to engine inputs, preserving order.
    [[nodiscard]] static std::vector<CelestialObject>
    to_objects(std::span<const GoldenRecord> records);

private:
    /// Column index per field; -1 when the column is absent.
    struct ColumnMap {
        int name = -1, regime = -1, x = -1, mass = -1, radius = -1,
            velocity = -1, z_obs = -1, z_ssz = -1, z_grsr = -1, winner = -1;

        [[nodiscard]] bool complete() const noexcept;
    };

    [[nodiscard]] static ColumnMap parse_header(const std::string& line) noexcept;

    /// Parse one data row. `nullopt` if malformed or non-finite.
    [[nodiscard]] static std::optional<GoldenRecord>
    parse_row(const std::string& line, const ColumnMap& cols) noexcept;
};

} // namespace ssz::core
