#include "ensemble/ensemble_runner.hpp"
#include "model/record_writer.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace claro::ensemble {

EnsembleRunner::EnsembleRunner(const EnsembleConfig& config)
    : config_(config) {}

std::vector<RunSummary> EnsembleRunner::run(const Scenario& scenario,
                                            ProgressCallback on_progress) {
    std::vector<RunSummary> results;
    const int total = config_.num_runs * static_cast<int>(scenario.variants.size());
    results.reserve(static_cast<size_t>(std::max(total, 0)));

    int completed = 0;
    for (const auto& variant : scenario.variants) {
        for (int i = 0; i < config_.num_runs; i++) {
            int32_t seed = run_seed(config_.base_seed, i);

            if (config_.verbose) {
                std::cerr << "Run " << (completed + 1) << "/" << total
                          << " (variant=" << variant.name << ", seed=" << seed << ")..."
                          << std::flush;
            }

            results.push_back(run_single(scenario, variant, i, seed));
            completed++;

            if (config_.verbose) {
                const RunSummary& r = results.back();
                if (r.error.empty()) {
                    std::cerr << " done (records=" << r.n_records
                              << ", mean Y=" << r.y_mean << " kWh)\n";
                } else {
                    std::cerr << " FAILED: " << r.error << "\n";
                }
            }

            if (on_progress) {
                on_progress(completed, total);
            }
        }
    }

    return results;
}

std::string EnsembleRunner::run_output_path(const std::string& variant, int32_t seed) const {
    std::filesystem::path p(config_.output_dir);
    p /= variant + "_seed" + std::to_string(seed) + ".csv";
    return p.string();
}

RunSummary EnsembleRunner::run_single(const Scenario& scenario, const Variant& variant,
                                      int run_index, int32_t seed) {
    RunSummary result;
    result.variant = variant.name;
    result.run_index = run_index;
    result.seed = seed;

    try {
        claro::model::SimConfig cfg = claro::model::apply_overrides(scenario.base, variant.overrides);
        cfg.seed = seed;

        auto records = claro::model::simulate(cfg, scenario.start);
        summarize_records(records, result);

        if (!config_.output_dir.empty()) {
            result.output_path = run_output_path(variant.name, seed);
            claro::model::write_records_csv(records, result.output_path);
        }
    } catch (const std::exception& e) {
        result.error = std::string("Run error: ") + e.what();
    }

    return result;
}

int32_t run_seed(int32_t base_seed, int run_index) {
    uint32_t s = static_cast<uint32_t>(base_seed) + static_cast<uint32_t>(run_index);
    return static_cast<int32_t>(s);
}

void summarize_records(const std::vector<claro::model::SimulationRecord>& records,
                       RunSummary& summary) {
    summary.n_records = records.size();
    if (records.empty()) return;

    double y_sum = 0.0, m_sum = 0.0;
    int open_steps = 0;
    summary.y_min = records.front().y_kwh;
    summary.y_max = records.front().y_kwh;

    for (const auto& r : records) {
        y_sum += r.y_kwh;
        m_sum += r.m1_activation;
        open_steps += r.x3_open;
        summary.y_min = std::min(summary.y_min, r.y_kwh);
        summary.y_max = std::max(summary.y_max, r.y_kwh);
    }

    const double n = static_cast<double>(records.size());
    summary.y_mean = y_sum / n;
    summary.y_total = y_sum;
    summary.activation_mean = m_sum / n;
    summary.open_fraction = open_steps / n;
}

} // namespace claro::ensemble
