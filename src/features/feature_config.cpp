#include "features/feature_config.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace claro::features {

void FeatureConfig::validate() const {
    parse_frequency(freq);

    if (!std::isfinite(comfort_low) || !std::isfinite(comfort_high)) {
        throw std::invalid_argument("FeatureConfig comfort band must be finite");
    }
    if (comfort_low > comfort_high) {
        throw std::invalid_argument("FeatureConfig.comfort_low must be <= comfort_high");
    }
    if (utc_offset_minutes && std::abs(*utc_offset_minutes) >= 24 * 60) {
        throw std::invalid_argument("FeatureConfig.utc_offset_minutes out of range");
    }
    if (add_y_lags) {
        for (int lag : y_lags) {
            if (lag < 1) {
                throw std::invalid_argument("FeatureConfig.y_lags entries must be >= 1 (got " +
                                            std::to_string(lag) + ")");
            }
        }
    }
}

int64_t parse_frequency(const std::string& freq) {
    size_t pos = 0;
    while (pos < freq.size() && std::isdigit(static_cast<unsigned char>(freq[pos]))) pos++;

    int64_t mult = 1;
    if (pos > 0) {
        if (pos > 9) throw std::invalid_argument("frequency multiplier too large: '" + freq + "'");
        mult = std::stoll(freq.substr(0, pos));
        if (mult <= 0) throw std::invalid_argument("frequency must be positive: '" + freq + "'");
    }

    const std::string unit = freq.substr(pos);
    int64_t unit_s = 0;
    if (unit == "S" || unit == "s" || unit == "sec")         unit_s = 1;
    else if (unit == "T" || unit == "min")                   unit_s = 60;
    else if (unit == "H" || unit == "h")                     unit_s = 3600;
    else if (unit == "D" || unit == "d")                     unit_s = 86400;
    else {
        throw std::invalid_argument("unsupported frequency '" + freq +
                                    "' (expected e.g. 30S, 15min, 15T, 1H, D)");
    }

    return mult * unit_s;
}

std::vector<int> parse_lag_list(const std::string& text) {
    std::vector<int> lags;
    std::stringstream ss(text);
    std::string item;

    while (std::getline(ss, item, ',')) {
        size_t used = 0;
        int lag = 0;
        try {
            lag = std::stoi(item, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid lag '" + item + "'");
        }
        if (used != item.size() || lag < 1) {
            throw std::invalid_argument("invalid lag '" + item + "'");
        }
        lags.push_back(lag);
    }

    if (lags.empty()) throw std::invalid_argument("empty lag list");
    return lags;
}

} // namespace claro::features
