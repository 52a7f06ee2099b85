/**
 * claro_ensemble: Batch of independent simulation runs.
 *
 * Reads a scenario JSON (base config + named variants), runs every variant
 * for N seeds, writes one CSV per run and a JSON summary.
 *
 * Usage:
 *   claro_ensemble --scenario <path> [--runs N] [--seed S]
 *                  [--output-dir <dir>] [--summary <path>]
 *                  [--verbose] [--progress]
 */

#include "ensemble/ensemble_runner.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --scenario <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --scenario <path>    Scenario JSON file (required)\n"
              << "  --runs N             Runs per variant (default: scenario or 10)\n"
              << "  --seed S             Base RNG seed (default: scenario or 123)\n"
              << "  --output-dir <dir>   Directory for per-run CSV files (default: none)\n"
              << "  --summary <path>     Summary JSON file (default: stdout)\n"
              << "  --verbose            Progress to stderr\n"
              << "  --progress           JSON-Lines progress to stderr\n"
              << "  --help               Show this message\n";
}

int main(int argc, char* argv[]) {
    claro::ensemble::EnsembleConfig config;
    bool runs_set = false, seed_set = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--scenario" && i + 1 < argc) {
                config.scenario_path = argv[++i];
            } else if (arg == "--runs" && i + 1 < argc) {
                config.num_runs = std::stoi(argv[++i]);
                runs_set = true;
            } else if (arg == "--seed" && i + 1 < argc) {
                config.base_seed = std::stoi(argv[++i]);
                seed_set = true;
            } else if (arg == "--output-dir" && i + 1 < argc) {
                config.output_dir = argv[++i];
            } else if (arg == "--summary" && i + 1 < argc) {
                config.summary_path = argv[++i];
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--progress") {
                config.progress = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (config.scenario_path.empty()) {
        std::cerr << "Error: --scenario is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    claro::ensemble::Scenario scenario;
    try {
        scenario = claro::ensemble::ScenarioParser::parse_file(config.scenario_path);
    } catch (const std::exception& e) {
        std::cerr << "Error loading scenario: " << e.what() << "\n";
        return 1;
    }

    if (!runs_set && scenario.num_runs) config.num_runs = *scenario.num_runs;
    if (!seed_set && scenario.base_seed) config.base_seed = *scenario.base_seed;

    if (config.num_runs < 1) {
        std::cerr << "Error: --runs must be >= 1\n";
        return 1;
    }

    std::vector<std::string> variant_names;
    for (const auto& v : scenario.variants) variant_names.push_back(v.name);

    if (config.verbose) {
        std::cerr << "=== CLARO Ensemble ===\n"
                  << "Scenario: " << config.scenario_path << "\n"
                  << "Variants: " << variant_names.size() << "\n"
                  << "Runs per variant: " << config.num_runs << "\n"
                  << "Base seed: " << config.base_seed << "\n"
                  << "Output dir: " << (config.output_dir.empty() ? "(none)" : config.output_dir) << "\n"
                  << "Summary: " << (config.summary_path.empty() ? "stdout" : config.summary_path)
                  << "\n\n";
    }

    claro::ensemble::EnsembleRunner runner(config);

    claro::ensemble::EnsembleRunner::ProgressCallback progress_cb = nullptr;
    if (config.progress) {
        progress_cb = [](int completed, int total) {
            std::cerr << "{\"type\":\"run_complete\",\"run\":" << completed
                      << ",\"total\":" << total << "}\n" << std::flush;
        };
    }

    auto t_start = std::chrono::steady_clock::now();
    auto results = runner.run(scenario, progress_cb);
    auto t_end = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    int errors = 0;
    for (const auto& r : results) {
        if (!r.error.empty()) errors++;
    }

    if (config.verbose) {
        std::cerr << "\n=== Results ===\n"
                  << "Completed: " << results.size() << " runs in " << elapsed << "s\n"
                  << "Errors: " << errors << "\n";
    }

    if (config.summary_path.empty()) {
        claro::ensemble::write_summary_json(results, config.num_runs, config.base_seed,
                                            variant_names, std::cout);
    } else {
        std::ofstream out(config.summary_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot open summary file: " << config.summary_path << "\n";
            return 1;
        }
        claro::ensemble::write_summary_json(results, config.num_runs, config.base_seed,
                                            variant_names, out);
        if (config.verbose) {
            std::cerr << "Summary written to: " << config.summary_path << "\n";
        }
    }

    if (config.progress) {
        std::cerr << "{\"type\":\"done\",\"runs\":" << results.size()
                  << ",\"errors\":" << errors << ",\"elapsed\":" << elapsed << "}\n"
                  << std::flush;
    }

    return errors == 0 ? 0 : 2;
}
