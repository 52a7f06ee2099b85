/**
 * Signal generators: exogenous and mediating inputs of the energy model.
 *
 * All functions are pure functions of their arguments. simulate_occupancy is
 * the only one that touches randomness, and only through the stream passed
 * in by the caller.
 */

#ifndef CLARO_MODEL_SIGNALS_HPP
#define CLARO_MODEL_SIGNALS_HPP

#include "core/sim_rng.hpp"
#include "core/time_utils.hpp"

namespace claro::model {

// Occupancy is clamped into [0, kMaxOccupancy]
constexpr double kMaxOccupancy = 220.0;

// Activation (M1) is clamped into [0, kMaxActivation]
constexpr double kMaxActivation = 2.0;

constexpr double kDefaultComfortLow = 20.0;
constexpr double kDefaultComfortHigh = 23.0;

inline double clamp(double x, double lo, double hi) {
    return x < lo ? lo : (x > hi ? hi : x);
}

/**
 * X2: outdoor temperature in deg C.
 * Baseline 8.0 + yearly sine (amplitude seasonal_amp, phase doy/365)
 * + daily sine (amplitude daily_amp, coolest ~05:00, warmest ~15:00).
 */
double simulate_outdoor_temp(const Timestamp& ts,
                             double seasonal_amp = 9.0,
                             double daily_amp = 3.5);

/**
 * X3: open/closed regime, 1 = open.
 * Weekdays open on [08:00, 22:00), weekends on [10:00, 18:00).
 */
int simulate_open_regime(const Timestamp& ts);

/**
 * X1: occupancy intensity in [0, 220].
 * Returns exactly 0 when closed, without drawing from rng. When open, a
 * bimodal daily profile (peaks 13:00 and 18:00) scaled by weekday multiplier
 * and 180 * academic_intensity, plus N(0, 8) noise, then clamped.
 */
double simulate_occupancy(const Timestamp& ts, int open_regime,
                          double academic_intensity, SimRNG& rng);

/**
 * Comfort pressure: distance of temp_out outside [comfort_low, comfort_high],
 * 0 inside the band. Shared by the simulator and the feature builder.
 */
double temp_pressure(double temp_out,
                     double comfort_low = kDefaultComfortLow,
                     double comfort_high = kDefaultComfortHigh);

} // namespace claro::model

#endif // CLARO_MODEL_SIGNALS_HPP
