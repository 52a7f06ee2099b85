/**
 * Scenario: Ensemble definition parsed from JSON.
 *
 * {
 *   "runs": 20,                      (optional)
 *   "base_seed": 1000,               (optional)
 *   "start": "2025-09-01T00:00:00",  (optional)
 *   "config": { ...SimConfig overrides... },
 *   "variants": [
 *     { "name": "vacation", "overrides": { "academic_intensity": 0.6 } },
 *     { "name": "exams",    "overrides": { "academic_intensity": 1.2 } }
 *   ]
 * }
 *
 * Without "variants" a single variant named "baseline" is run.
 */

#ifndef CLARO_ENSEMBLE_SCENARIO_HPP
#define CLARO_ENSEMBLE_SCENARIO_HPP

#include "core/time_utils.hpp"
#include "io/json_reader.hpp"
#include "model/sim_config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace claro::ensemble {

struct Variant {
    std::string name;
    claro::JsonValue overrides = claro::JsonValue::make_object();
};

struct Scenario {
    claro::model::SimConfig base;
    std::vector<Variant> variants;
    std::optional<Timestamp> start;
    std::optional<int> num_runs;
    std::optional<int32_t> base_seed;
};

class ScenarioParser {
public:
    /**
     * Build a Scenario from its JSON document. The base config is validated;
     * variant overrides are only checked when their runs execute.
     * @throws std::invalid_argument on malformed content
     */
    static Scenario parse(const claro::JsonValue& root);

    /**
     * @throws std::runtime_error on file/JSON errors
     * @throws std::invalid_argument on malformed content
     */
    static Scenario parse_file(const std::string& path);
};

} // namespace claro::ensemble

#endif // CLARO_ENSEMBLE_SCENARIO_HPP
