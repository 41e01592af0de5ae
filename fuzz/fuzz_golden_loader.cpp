/**
 * @file  fuzz_golden_loader.cpp
 * @brief libFuzzer target for the golden CSV loader feeding the engine
 *
 * Build:
 *   cmake -DSSZ_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_golden_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_golden_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed row has a non-empty name and finite numeric fields.
 *   3. Every row either computes or carries an InputError, never both.
 *   4. A computed result has D_SSZ ∈ (0, 1] and Δ(M) ≥ 0.
 *
 * Fuzzer strategy:
 *   Input is handed to GoldenDataset::parse_csv_string() unchanged, so the
 *   parser sees binary garbage, missing headers, CRLF, "nan"/"inf" tokens,
 *   trailing commas and very long lines.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "ssz/engine.hpp"
#include "ssz/golden_dataset.hpp"

using namespace ssz;
using namespace ssz::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{reinterpret_cast<const char*>(data), size};

    const auto rows = GoldenDataset::parse_csv_string(input);
    for (const auto& r : rows) {
        // Invariant 2
        assert(!r.name.empty());
        assert(std::isfinite(r.mass_msun));
        assert(std::isfinite(r.radius_m));
        assert(std::isfinite(r.z_obs));
        assert(std::isfinite(r.z_ssz));
        assert(std::isfinite(r.z_grsr));
    }

    const Engine engine;
    const auto objects  = GoldenDataset::to_objects(rows);
    const auto outcomes = engine.compute_batch(objects);
    assert(outcomes.size() == rows.size());

    for (const auto& o : outcomes) {
        // Invariant 3
        assert(o.result.has_value() != o.error.has_value());
        if (!o.result) continue;

        // Invariant 4
        assert(o.result->d_ssz > 0.0);
        assert(o.result->d_ssz <= 1.0);
        assert(o.result->delta_m_pct >= 0.0);
    }

    return 0;
}
