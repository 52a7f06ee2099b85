#include "model/simulator.hpp"
#include "model/signals.hpp"
#include <algorithm>

namespace claro::model {

Timestamp default_start() {
    CivilTime ct;
    ct.year = 2025;
    ct.month = 1;
    ct.day = 1;
    return Timestamp::from_civil(ct);
}

std::vector<Timestamp> generate_time_index(const Timestamp& start, int64_t n_steps,
                                           int step_minutes) {
    std::vector<Timestamp> times;
    if (n_steps <= 0) return times;

    times.reserve(static_cast<size_t>(n_steps));
    for (int64_t i = 0; i < n_steps; i++) {
        times.push_back(start.plus_minutes(i * step_minutes));
    }
    return times;
}

double baseline_target_kwh(const SimConfig& cfg, int open_regime,
                           double activation, double pressure) {
    double baseline = open_regime == 1 ? cfg.base_kwh_when_open : cfg.base_kwh_when_closed;
    baseline *= cfg.building_factor_x4;  // X4 baseline shift

    return baseline + cfg.activation_to_kwh * activation + cfg.direct_temp_to_kwh * pressure;
}

SimulationRecord simulate_step(const SimConfig& cfg, const Timestamp& ts,
                               double y_prev, SimRNG& rng) {
    SimulationRecord rec;
    rec.timestamp = ts;

    // X3 regime, X2 environment
    rec.x3_open = simulate_open_regime(ts);
    rec.x2_temp_out = simulate_outdoor_temp(ts);
    rec.x2_temp_pressure = temp_pressure(rec.x2_temp_out, cfg.comfort_low, cfg.comfort_high);

    // X1 human use (first draw of the step, open steps only)
    rec.x1_occupancy = simulate_occupancy(ts, rec.x3_open, cfg.academic_intensity, rng);

    // X5 availability, shifted by X4
    rec.x4_building_factor = cfg.building_factor_x4;
    rec.x5_availability = (0.7 + 0.3 * rec.x3_open) * cfg.building_factor_x4;

    // M1 activation
    double activation = (cfg.regime_to_activation * rec.x3_open +
                         cfg.occ_to_activation * rec.x1_occupancy +
                         cfg.temp_to_activation * rec.x2_temp_pressure) * rec.x5_availability;
    rec.m1_activation = clamp(activation, 0.0, kMaxActivation);

    double y_det = baseline_target_kwh(cfg, rec.x3_open, rec.m1_activation, rec.x2_temp_pressure);

    // X6 inertia + noise (second draw of the step)
    double noise = rng.gaussian(0.0, cfg.noise_sigma);
    double y = cfg.inertia_phi * y_prev + (1.0 - cfg.inertia_phi) * y_det + noise;
    rec.y_kwh = std::max(0.0, y);

    return rec;
}

std::vector<SimulationRecord> simulate(const SimConfig& cfg, std::optional<Timestamp> start) {
    cfg.validate();

    SimRNG rng(cfg.seed);
    const std::vector<Timestamp> times =
        generate_time_index(start.value_or(default_start()), cfg.n_steps(), cfg.freq_minutes);

    std::vector<SimulationRecord> rows;
    rows.reserve(times.size());

    double y_prev = cfg.base_kwh_when_closed;
    for (const auto& ts : times) {
        rows.push_back(simulate_step(cfg, ts, y_prev, rng));
        y_prev = rows.back().y_kwh;
    }

    return rows;
}

} // namespace claro::model
