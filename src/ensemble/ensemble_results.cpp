#include "ensemble/ensemble_results.hpp"
#include "io/json_writer.hpp"

namespace claro::ensemble {

void write_summary_json(const std::vector<RunSummary>& results,
                        int num_runs, int32_t base_seed,
                        const std::vector<std::string>& variant_names,
                        std::ostream& out) {
    claro::JsonWriter w(out);

    w.begin_object();

    // ── config ──
    w.key("config").begin_object();
    w.kv("numRuns", num_runs);
    w.kv("baseSeed", base_seed);
    w.key("variants").begin_array();
    for (const auto& name : variant_names) w.value(name);
    w.end_array();
    w.end_object();

    // ── runs ──
    w.key("runs").begin_array();

    for (const auto& run : results) {
        w.begin_object();

        w.kv("variant", run.variant);
        w.kv("runIndex", run.run_index);
        w.kv("seed", run.seed);

        if (run.error.empty()) {
            w.key("error").null_value();
        } else {
            w.kv("error", run.error);
        }

        w.kv("records", run.n_records);
        w.kv("yMean", run.y_mean);
        w.kv("yMin", run.y_min);
        w.kv("yMax", run.y_max);
        w.kv("yTotal", run.y_total);
        w.kv("activationMean", run.activation_mean);
        w.kv("openFraction", run.open_fraction);

        if (run.output_path.empty()) {
            w.key("output").null_value();
        } else {
            w.kv("output", run.output_path);
        }

        w.end_object();
    }

    w.end_array();

    w.end_object();
    out << '\n';
}

} // namespace claro::ensemble
