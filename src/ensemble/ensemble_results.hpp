/**
 * Ensemble results: per-run summaries and their JSON serialization.
 *
 * Format: { "config": {...}, "runs": [...] }
 */

#ifndef CLARO_ENSEMBLE_ENSEMBLE_RESULTS_HPP
#define CLARO_ENSEMBLE_ENSEMBLE_RESULTS_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace claro::ensemble {

struct RunSummary {
    std::string variant;
    int run_index = 0;
    int32_t seed = 0;
    size_t n_records = 0;
    double y_mean = 0.0;
    double y_min = 0.0;
    double y_max = 0.0;
    double y_total = 0.0;
    double activation_mean = 0.0;
    double open_fraction = 0.0;
    std::string output_path;        // empty when no CSV was written
    std::string error;              // empty = success
};

void write_summary_json(const std::vector<RunSummary>& results,
                        int num_runs, int32_t base_seed,
                        const std::vector<std::string>& variant_names,
                        std::ostream& out);

} // namespace claro::ensemble

#endif // CLARO_ENSEMBLE_ENSEMBLE_RESULTS_HPP
