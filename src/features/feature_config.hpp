/**
 * FeatureConfig: Parameters of the model-ready table build.
 */

#ifndef CLARO_FEATURES_FEATURE_CONFIG_HPP
#define CLARO_FEATURES_FEATURE_CONFIG_HPP

#include "model/signals.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace claro::features {

struct FeatureConfig {
    // Target resampling frequency, pandas-style ("1H", "15min", "30T", "D")
    std::string freq = "1H";

    // Fixed target offset from UTC; empty = keep naive times, normalize
    // offset-aware input to UTC
    std::optional<int> utc_offset_minutes;

    // Comfort band for X2 pressure at fitting time
    double comfort_low = claro::model::kDefaultComfortLow;
    double comfort_high = claro::model::kDefaultComfortHigh;

    bool add_y_lags = true;
    std::vector<int> y_lags = {1, 24};  // in resampled steps (hours for "1H")

    /**
     * @throws std::invalid_argument on a bad frequency, band or lag
     */
    void validate() const;
};

/**
 * Parse a frequency string into seconds.
 * Form: optional positive integer multiplier followed by a unit:
 *   S/s/sec, T/min, H/h, D/d.
 * @throws std::invalid_argument on anything else
 */
int64_t parse_frequency(const std::string& freq);

/**
 * Parse a comma-separated lag list such as "1,24".
 * @throws std::invalid_argument on non-integer or non-positive entries
 */
std::vector<int> parse_lag_list(const std::string& text);

} // namespace claro::features

#endif // CLARO_FEATURES_FEATURE_CONFIG_HPP
