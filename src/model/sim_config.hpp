/**
 * SimConfig: Parameters of the building-energy mechanism.
 *
 * Causal structure the parameters act on:
 *   C1 (academic intensity) -> X1 occupancy, X3 regime
 *   X1, X2, X3, X5          -> M1 activation
 *   M1, X2, X3, X4, X6      -> Y energy
 *
 * Plain value struct; callers fill it in (or load it from JSON) and the
 * simulator validates it once before stepping.
 */

#ifndef CLARO_MODEL_SIM_CONFIG_HPP
#define CLARO_MODEL_SIM_CONFIG_HPP

#include "core/time_utils.hpp"
#include "io/json_reader.hpp"
#include "model/signals.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace claro::model {

struct SimConfig {
    // Time grid
    int32_t seed = 123;
    int freq_minutes = 60;              // 60 = hourly; must divide 1440
    int n_days = 60;

    // X4: structural building factor (baseline shifter, >1 = more demanding)
    double building_factor_x4 = 1.10;

    // Baseline consumption (kWh per interval)
    double base_kwh_when_closed = 8.0;
    double base_kwh_when_open = 18.0;

    // Signal -> M1 activation
    double occ_to_activation = 0.020;
    double temp_to_activation = 0.060;
    double regime_to_activation = 0.35;

    // M1 / pressure -> kWh
    double activation_to_kwh = 35.0;
    double direct_temp_to_kwh = 0.50;

    // X6: inertia, 0 = no memory, 1 = full memory
    double inertia_phi = 0.75;

    double noise_sigma = 2.5;

    // C1 proxy: 0.6 vacation, 1.0 normal, 1.2 exams
    double academic_intensity = 1.0;

    // Comfort band used for X2 pressure at generation time
    double comfort_low = kDefaultComfortLow;
    double comfort_high = kDefaultComfortHigh;

    /** Grid points per day (1440 / freq_minutes). */
    int steps_per_day() const { return 1440 / freq_minutes; }

    /** Total grid length (n_days * steps_per_day). */
    int64_t n_steps() const {
        return static_cast<int64_t>(n_days) * steps_per_day();
    }

    /**
     * Check every documented range.
     * @throws std::invalid_argument naming the first offending field
     */
    void validate() const;
};

/**
 * Apply the members of a JSON object onto a copy of base.
 * Keys are SimConfig field names; unknown keys and non-numeric values are
 * rejected. Does not validate ranges.
 * @throws std::invalid_argument on unknown keys or wrong value types
 */
SimConfig apply_overrides(const SimConfig& base, const claro::JsonValue& obj);

/**
 * Grid origin from the optional "start" member of a config object.
 * @return empty when the key is absent
 * @throws std::invalid_argument if "start" is not a naive ISO-8601 string
 */
std::optional<Timestamp> read_start(const claro::JsonValue& obj);

/**
 * Load a SimConfig from a JSON file (flat object of overrides on defaults).
 * The optional "start" key is ignored here; tools read it separately.
 * @throws std::runtime_error on file/parse errors
 * @throws std::invalid_argument on invalid keys or ranges
 */
SimConfig load_sim_config(const std::string& path);

} // namespace claro::model

#endif // CLARO_MODEL_SIM_CONFIG_HPP
