/// @file src/core/golden_dataset.cpp
/// @brief CSV loader for the golden regression catalogue.

#include "ssz/golden_dataset.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>

namespace ssz::core {

namespace {

/// Split on commas and trim surrounding whitespace from each field.
std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        if (first == std::string::npos) {
            fields.emplace_back();
        } else {
            fields.push_back(token.substr(first, last - first + 1));
        }
    }
    // "a,b," has an empty trailing field that getline does not report.
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

/// Strict finite double: the whole token must be consumed.
std::optional<double> parse_double(const std::string& token) noexcept {
    if (token.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const double val = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(val)) {
            return std::nullopt;
        }
        return val;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

const std::string* field_at(const std::vector<std::string>& f, int idx) noexcept {
    if (idx < 0 || static_cast<std::size_t>(idx) >= f.size()) {
        return nullptr;
    }
    return &f[static_cast<std::size_t>(idx)];
}

bool is_blank_or_comment(const std::string& line) noexcept {
    const auto first = line.find_first_not_of(" \t\r\n");
    return first == std::string::npos || line[first] == '#';
}

} // anonymous namespace

// ─── GoldenRecord ─────────────────────────────────────────────────────────────

CelestialObject GoldenRecord::to_object() const {
    return CelestialObject{
        .name         = name,
        .mass_msun    = mass_msun,
        .radius_m     = radius_m,
        .velocity_mps = velocity_mps,
        .z_obs        = z_obs,
    };
}

// ─── Header ───────────────────────────────────────────────────────────────────

bool GoldenDataset::ColumnMap::complete() const noexcept {
    return name >= 0 && mass >= 0 && radius >= 0 && z_obs >= 0 &&
           z_ssz >= 0 && z_grsr >= 0 && winner >= 0;
}

GoldenDataset::ColumnMap
GoldenDataset::parse_header(const std::string& line) noexcept {
    ColumnMap cols;
    try {
        const auto names = split_fields(line);
        for (std::size_t i = 0; i < names.size(); ++i) {
            const std::string& n = names[i];
            const int idx = static_cast<int>(i);
            if (n == "case" || n == "name")        cols.name     = idx;
            else if (n == "regime")                cols.regime   = idx;
            else if (n == "x")                     cols.x        = idx;
            else if (n == "M_msun")                cols.mass     = idx;
            else if (n == "r_m")                   cols.radius   = idx;
            else if (n == "v_tot")                 cols.velocity = idx;
            else if (n == "z_obs")                 cols.z_obs    = idx;
            else if (n == "z_ssz" || n == "z_seg") cols.z_ssz    = idx;
            else if (n == "z_grsr")                cols.z_grsr   = idx;
            else if (n == "winner")                cols.winner   = idx;
        }
    } catch (const std::exception&) {
        return ColumnMap{};
    }
    return cols;
}

// ─── Rows ─────────────────────────────────────────────────────────────────────

std::optional<GoldenRecord>
GoldenDataset::parse_row(const std::string& line, const ColumnMap& cols) noexcept {
    try {
        const auto f = split_fields(line);

        const auto* name = field_at(f, cols.name);
        if (name == nullptr || name->empty()) {
            return std::nullopt;
        }

        const auto number = [&](int idx) -> std::optional<double> {
            const auto* tok = field_at(f, idx);
            return tok ? parse_double(*tok) : std::nullopt;
        };

        const auto mass   = number(cols.mass);
        const auto radius = number(cols.radius);
        const auto z_obs  = number(cols.z_obs);
        const auto z_ssz  = number(cols.z_ssz);
        const auto z_grsr = number(cols.z_grsr);
        if (!mass || !radius || !z_obs || !z_ssz || !z_grsr) {
            return std::nullopt;
        }

        const auto* winner_tok = field_at(f, cols.winner);
        const auto winner = winner_tok ? parse_winner(*winner_tok) : std::nullopt;
        if (!winner) {
            return std::nullopt;
        }

        GoldenRecord rec;
        rec.name      = *name;
        rec.mass_msun = *mass;
        rec.radius_m  = *radius;
        rec.z_obs     = *z_obs;
        rec.z_ssz     = *z_ssz;
        rec.z_grsr    = *z_grsr;
        rec.winner    = *winner;

        // Velocity may be blank (absent → 0) but not garbage.
        if (const auto* v = field_at(f, cols.velocity); v && !v->empty()) {
            const auto vel = parse_double(*v);
            if (!vel) {
                return std::nullopt;
            }
            rec.velocity_mps = *vel;
        }

        if (const auto* reg = field_at(f, cols.regime); reg && !reg->empty()) {
            rec.regime = parse_regime(*reg);
        }
        rec.x = number(cols.x);

        return rec;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ─── parse_csv_string ─────────────────────────────────────────────────────────

std::vector<GoldenRecord>
GoldenDataset::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<GoldenRecord> records;
    try {
        std::istringstream stream(csv_content);
        std::string line;
        std::optional<ColumnMap> cols;

        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (is_blank_or_comment(line)) {
                continue;
            }

            if (!cols) {
                cols = parse_header(line);
                if (!cols->complete()) {
                    return {};
                }
                continue;
            }

            if (auto rec = parse_row(line, *cols)) {
                records.push_back(std::move(*rec));
            }
        }
    } catch (const std::exception&) {
        return records;
    }
    return records;
}

// ─── load_csv ─────────────────────────────────────────────────────────────────

std::optional<std::vector<GoldenRecord>>
GoldenDataset::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        std::ostringstream contents;
        contents << file.rdbuf();
        return parse_csv_string(contents.str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ─── to_objects ───────────────────────────────────────────────────────────────

std::vector<CelestialObject>
GoldenDataset::to_objects(std::span<const GoldenRecord> records) {
    std::vector<CelestialObject> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        out.push_back(r.to_object());
    }
    return out;
}

} // namespace ssz::core
