/**
 * claro_sim: Generate a synthetic building-energy dataset.
 *
 * Runs the mechanistic simulator once and writes one CSV row per grid point.
 * Parameters come from defaults, an optional JSON config file, then CLI
 * flags (later sources win).
 *
 * Usage:
 *   claro_sim [--config <json>] [--seed S] [--days N] [--freq-minutes F]
 *             [--start <iso>] [--output <csv>] [--verbose]
 */

#include "io/json_reader.hpp"
#include "model/record_writer.hpp"
#include "model/simulator.hpp"
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>      JSON file of SimConfig overrides\n"
              << "  --seed S             RNG seed (default: 123)\n"
              << "  --days N             Horizon in days (default: 60)\n"
              << "  --freq-minutes F     Grid step in minutes, divides 1440 (default: 60)\n"
              << "  --start <iso>        Grid origin (default: 2025-01-01T00:00:00)\n"
              << "  --output <path>      Output CSV file (default: stdout)\n"
              << "  --verbose            Progress to stderr\n"
              << "  --help               Show this message\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string output_path;
    std::string start_text;
    std::optional<int> seed, days, freq;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoi(argv[++i]);
            } else if (arg == "--days" && i + 1 < argc) {
                days = std::stoi(argv[++i]);
            } else if (arg == "--freq-minutes" && i + 1 < argc) {
                freq = std::stoi(argv[++i]);
            } else if (arg == "--start" && i + 1 < argc) {
                start_text = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
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

    try {
        claro::model::SimConfig cfg;
        std::optional<claro::Timestamp> start;

        if (!config_path.empty()) {
            claro::JsonValue root = claro::JsonReader::parse_file(config_path);
            cfg = claro::model::apply_overrides(cfg, root);
            start = claro::model::read_start(root);
        }
        if (seed) cfg.seed = *seed;
        if (days) cfg.n_days = *days;
        if (freq) cfg.freq_minutes = *freq;

        if (!start_text.empty()) {
            auto parsed = claro::TimeUtils::parse_iso8601(start_text);
            if (!parsed || parsed->utc_offset_minutes) {
                std::cerr << "Error: --start must be a naive ISO-8601 timestamp: "
                          << start_text << "\n";
                return 1;
            }
            start = parsed->wall_clock;
        }

        cfg.validate();

        if (verbose) {
            std::cerr << "=== CLARO Simulator ===\n"
                      << "Seed: " << cfg.seed << "\n"
                      << "Days: " << cfg.n_days << "\n"
                      << "Step: " << cfg.freq_minutes << " min (" << cfg.n_steps() << " steps)\n"
                      << "Start: " << claro::TimeUtils::format_iso8601(
                             start.value_or(claro::model::default_start())) << "\n"
                      << "Inertia phi: " << cfg.inertia_phi << "\n"
                      << "Noise sigma: " << cfg.noise_sigma << "\n"
                      << "Output: " << (output_path.empty() ? "stdout" : output_path)
                      << "\n\n";
        }

        auto t_start = std::chrono::steady_clock::now();
        auto records = claro::model::simulate(cfg, start);
        auto t_end = std::chrono::steady_clock::now();

        if (output_path.empty()) {
            claro::model::write_records_csv(records, std::cout);
        } else {
            claro::model::write_records_csv(records, output_path);
        }

        if (verbose) {
            double elapsed = std::chrono::duration<double>(t_end - t_start).count();
            std::cerr << "Simulated " << records.size() << " records in " << elapsed << "s\n";
            if (!output_path.empty()) {
                std::cerr << "Written to: " << output_path << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
