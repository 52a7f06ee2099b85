/**
 * EnsembleRunner: Batch of independent simulations.
 *
 * For every scenario variant, runs num_runs simulations with seeds
 * base_seed, base_seed + 1, ... Each run builds its config from the base
 * plus the variant overrides and owns its own RNG, so runs never share
 * random state and any single run can be reproduced from (variant, seed).
 * The same seed list is used for every variant.
 */

#ifndef CLARO_ENSEMBLE_ENSEMBLE_RUNNER_HPP
#define CLARO_ENSEMBLE_ENSEMBLE_RUNNER_HPP

#include "ensemble/ensemble_results.hpp"
#include "ensemble/scenario.hpp"
#include "model/simulator.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace claro::ensemble {

struct EnsembleConfig {
    int num_runs = 10;
    int32_t base_seed = 123;
    std::string scenario_path;
    std::string output_dir;         // empty = no per-run CSV files
    std::string summary_path;       // empty = stdout
    bool verbose = false;
    bool progress = false;
};

class EnsembleRunner {
public:
    using ProgressCallback = std::function<void(int completed, int total)>;

    explicit EnsembleRunner(const EnsembleConfig& config);

    /**
     * Run all variants x seeds. Per-run failures are captured in
     * RunSummary::error and do not stop the batch.
     */
    std::vector<RunSummary> run(const Scenario& scenario,
                                ProgressCallback on_progress = nullptr);

    /** Output path of one run's CSV ("<dir>/<variant>_seed<seed>.csv"). */
    std::string run_output_path(const std::string& variant, int32_t seed) const;

private:
    EnsembleConfig config_;

    RunSummary run_single(const Scenario& scenario, const Variant& variant,
                          int run_index, int32_t seed);
};

/**
 * Seed of run run_index: base_seed + run_index, wrapping modulo 2^32 so
 * every 32-bit base seed is valid.
 */
int32_t run_seed(int32_t base_seed, int run_index);

/**
 * Aggregate statistics of one run's records into summary.
 */
void summarize_records(const std::vector<claro::model::SimulationRecord>& records,
                       RunSummary& summary);

} // namespace claro::ensemble

#endif // CLARO_ENSEMBLE_ENSEMBLE_RUNNER_HPP
