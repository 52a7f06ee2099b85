/**
 * claro_features: Build the model-ready analytical table.
 *
 * Reads a simulated (or real) measurement CSV, derives comfort pressure,
 * resamples, appends Y lags, drops incomplete rows and writes the result.
 *
 * Usage:
 *   claro_features --input <csv> --output <csv> [--freq 1H] [--lags 1,24]
 *                  [--no-lags] [--comfort-low L] [--comfort-high H]
 *                  [--utc-offset +HH:MM] [--verbose]
 */

#include "features/feature_builder.hpp"
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <path> --output <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --input <path>       Input CSV (timestamp, Y_kwh, X1_occupancy,\n"
              << "                       X2_temp_out, X3_open required)\n"
              << "  --output <path>      Output CSV (required)\n"
              << "  --freq F             Resample frequency, e.g. 15min, 1H, D (default: 1H)\n"
              << "  --lags L             Comma-separated Y lags in steps (default: 1,24)\n"
              << "  --no-lags            Do not add Y lag columns\n"
              << "  --comfort-low T      Lower comfort bound, deg C (default: 20)\n"
              << "  --comfort-high T     Upper comfort bound, deg C (default: 23)\n"
              << "  --utc-offset O       Target fixed offset, e.g. +01:00 (default: none)\n"
              << "  --verbose            Progress to stderr\n"
              << "  --help               Show this message\n";
}

int main(int argc, char* argv[]) {
    claro::features::FeatureConfig cfg;
    std::string input_path;
    std::string output_path;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--freq" && i + 1 < argc) {
                cfg.freq = argv[++i];
            } else if (arg == "--lags" && i + 1 < argc) {
                cfg.y_lags = claro::features::parse_lag_list(argv[++i]);
            } else if (arg == "--no-lags") {
                cfg.add_y_lags = false;
            } else if (arg == "--comfort-low" && i + 1 < argc) {
                cfg.comfort_low = std::stod(argv[++i]);
            } else if (arg == "--comfort-high" && i + 1 < argc) {
                cfg.comfort_high = std::stod(argv[++i]);
            } else if (arg == "--utc-offset" && i + 1 < argc) {
                std::string text = argv[++i];
                cfg.utc_offset_minutes = claro::TimeUtils::parse_utc_offset(text);
                if (!cfg.utc_offset_minutes) {
                    std::cerr << "Error: invalid --utc-offset: " << text << "\n";
                    return 1;
                }
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid argument (" << e.what() << ")\n";
        return 1;
    }

    if (input_path.empty() || output_path.empty()) {
        std::cerr << "Error: --input and --output are required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        if (verbose) {
            std::cerr << "=== CLARO Feature Builder ===\n"
                      << "Input: " << input_path << "\n"
                      << "Frequency: " << cfg.freq << "\n"
                      << "Comfort band: [" << cfg.comfort_low << ", " << cfg.comfort_high << "]\n"
                      << "Lags: ";
            if (cfg.add_y_lags) {
                for (size_t i = 0; i < cfg.y_lags.size(); i++) {
                    std::cerr << (i ? "," : "") << cfg.y_lags[i];
                }
            } else {
                std::cerr << "none";
            }
            std::cerr << "\nOutput: " << output_path << "\n\n";
        }

        auto table = claro::features::build_features(input_path, output_path, cfg);

        if (verbose) {
            std::cerr << "Wrote " << table.rows() << " rows x "
                      << (table.columns.size() + 1) << " columns\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
