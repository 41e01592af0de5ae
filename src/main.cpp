/// @file src/main.cpp
/// @brief SSZ CLI entry point.
///
/// Usage:
///   ssz --validate <golden.csv>                         Run the validation harness
///   ssz --batch <golden.csv>                            Compute every catalogue row
///   ssz --object <name> <M_msun> <r_m> [v_mps] [z_obs]  Compute one object
///   ssz --help                                          Print usage

#include "ssz/engine.hpp"
#include "ssz/golden_dataset.hpp"
#include "ssz/statistics.hpp"
#include "ssz/validation.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  ssz --validate <golden.csv>                         Run all validation checks\n"
        "  ssz --batch <golden.csv>                            SSZ vs GR for every row\n"
        "  ssz --object <name> <M_msun> <r_m> [v_mps] [z_obs]  Single object\n"
        "  ssz --help                                          Show this help\n"
        "\n"
        "Golden CSV columns (header required):\n"
        "  case,regime,x,M_msun,r_m,v_tot,z_obs,z_ssz,z_grsr,winner\n"
    );
}

/// Strict numeric argument. `nullopt` if any trailing characters remain.
std::optional<double> parse_arg(const std::string& s) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// Run the full harness. Returns 0 when every check passes, 1 otherwise.
int run_validate(const std::string& filepath) {
    const ssz::validation::ValidationHarness harness{ssz::RunConfig{}};
    try {
        const auto report = harness.run_all(filepath);
        fmt::print("{}", report.to_string());
        if (!report.summary.all_passed()) {
            fmt::print(stderr, "Validation failed: {} of {} checks\n",
                       report.summary.failed, report.summary.total);
            return 1;
        }
        return 0;
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}

/// Compute every row of a catalogue and print per-row results and a summary.
int run_batch(const std::string& filepath) {
    const auto records = ssz::core::GoldenDataset::load_csv(filepath);
    if (!records) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    if (records->empty()) {
        fmt::print(stderr, "Error: no valid rows loaded from '{}'\n", filepath);
        return 1;
    }

    ssz::RunConfig cfg;
    cfg.verbose = true;
    const ssz::core::Engine engine{cfg};

    const auto objects  = ssz::core::GoldenDataset::to_objects(*records);
    const auto outcomes = engine.compute_batch_parallel(objects);

    fmt::print("Loaded {} rows from '{}' (config {})\n", records->size(), filepath,
               cfg.version);
    for (const auto& o : outcomes) {
        if (o.result) {
            fmt::print("{}\n", o.result->to_string());
        } else {
            fmt::print("{:<24} rejected: {}\n", o.name,
                       o.error ? o.error->message : std::string{"unknown"});
        }
    }
    fmt::print("\n{}\n", ssz::stats::summarize(outcomes).to_string());
    return 0;
}

/// Compute one object from command-line values.
int run_object(int argc, char* argv[]) {
    if (argc < 5) {
        fmt::print(stderr, "Error: --object requires <name> <M_msun> <r_m>\n");
        print_usage();
        return 1;
    }

    const auto mass   = parse_arg(argv[3]);
    const auto radius = parse_arg(argv[4]);
    const auto vel    = argc > 5 ? parse_arg(argv[5]) : std::optional<double>{0.0};
    const auto z_obs  = argc > 6 ? parse_arg(argv[6]) : std::nullopt;
    if (!mass || !radius || !vel || (argc > 6 && !z_obs)) {
        fmt::print(stderr, "Error: numeric arguments could not be parsed\n");
        return 1;
    }

    const ssz::CelestialObject obj{
        .name         = argv[2],
        .mass_msun    = *mass,
        .radius_m     = *radius,
        .velocity_mps = *vel,
        .z_obs        = z_obs,
    };

    const ssz::core::Engine engine{ssz::RunConfig{}};
    const auto outcome = engine.compute_checked(obj);
    if (!outcome.result) {
        fmt::print(stderr, "Error: {}\n",
                   outcome.error ? outcome.error->message : std::string{"rejected"});
        return 1;
    }

    fmt::print("{}\n", outcome.result->to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--validate" || mode == "--batch") {
        if (argc < 3) {
            fmt::print(stderr, "Error: {} requires a CSV file path\n", mode);
            print_usage();
            return 1;
        }
        return mode == "--validate" ? run_validate(std::string(argv[2]))
                                    : run_batch(std::string(argv[2]));
    }

    if (mode == "--object") {
        return run_object(argc, argv);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
