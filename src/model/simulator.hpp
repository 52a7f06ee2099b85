/**
 * Simulator: Recurrence engine for the synthetic building-energy series.
 *
 * Steps an ordered time grid; each step combines the signal generators, the
 * previous step's energy (inertia) and Gaussian noise. All randomness comes
 * from one SimRNG owned by the run and consumed in a fixed order per step:
 * occupancy draw (open steps only), then energy noise draw.
 */

#ifndef CLARO_MODEL_SIMULATOR_HPP
#define CLARO_MODEL_SIMULATOR_HPP

#include "core/sim_rng.hpp"
#include "core/time_utils.hpp"
#include "model/sim_config.hpp"
#include <optional>
#include <vector>

namespace claro::model {

struct SimulationRecord {
    Timestamp timestamp;
    double x1_occupancy = 0.0;
    double x2_temp_out = 0.0;
    double x2_temp_pressure = 0.0;
    int x3_open = 0;
    double x4_building_factor = 0.0;
    double x5_availability = 0.0;
    double m1_activation = 0.0;
    double y_kwh = 0.0;
};

/** 2025-01-01T00:00:00, the grid origin when none is given. */
Timestamp default_start();

/**
 * start, start + step, ..., n_steps points.
 */
std::vector<Timestamp> generate_time_index(const Timestamp& start, int64_t n_steps,
                                           int step_minutes);

/**
 * Deterministic energy target before inertia and noise.
 */
double baseline_target_kwh(const SimConfig& cfg, int open_regime,
                           double activation, double pressure);

/**
 * One step of the recurrence at ts, given the previous step's energy.
 * Does not validate cfg.
 */
SimulationRecord simulate_step(const SimConfig& cfg, const Timestamp& ts,
                               double y_prev, SimRNG& rng);

/**
 * Full run over the grid starting at start (default_start() if empty).
 * The first step's previous energy is cfg.base_kwh_when_closed.
 * @throws std::invalid_argument if cfg fails validation
 */
std::vector<SimulationRecord> simulate(const SimConfig& cfg,
                                       std::optional<Timestamp> start = std::nullopt);

} // namespace claro::model

#endif // CLARO_MODEL_SIMULATOR_HPP
