#include "model/sim_config.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace claro::model {

namespace {

void require_finite(const char* name, double v) {
    if (!std::isfinite(v)) {
        throw std::invalid_argument(std::string("SimConfig.") + name + " must be finite");
    }
}

void require_non_negative(const char* name, double v) {
    require_finite(name, v);
    if (v < 0.0) {
        std::ostringstream ss;
        ss << "SimConfig." << name << " must be >= 0 (got " << v << ")";
        throw std::invalid_argument(ss.str());
    }
}

int32_t to_int(const std::string& key, double v) {
    if (!std::isfinite(v) || v != std::floor(v) ||
        v < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
        v > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        throw std::invalid_argument("config key '" + key + "' must be an integer");
    }
    return static_cast<int32_t>(v);
}

}  // anonymous namespace

void SimConfig::validate() const {
    if (freq_minutes <= 0) {
        throw std::invalid_argument("SimConfig.freq_minutes must be > 0 (got " +
                                    std::to_string(freq_minutes) + ")");
    }
    if (1440 % freq_minutes != 0) {
        throw std::invalid_argument("SimConfig.freq_minutes must divide 1440 (got " +
                                    std::to_string(freq_minutes) + ")");
    }
    if (n_days < 0) {
        throw std::invalid_argument("SimConfig.n_days must be >= 0 (got " +
                                    std::to_string(n_days) + ")");
    }

    require_non_negative("building_factor_x4", building_factor_x4);
    require_non_negative("base_kwh_when_closed", base_kwh_when_closed);
    require_non_negative("base_kwh_when_open", base_kwh_when_open);
    require_non_negative("occ_to_activation", occ_to_activation);
    require_non_negative("temp_to_activation", temp_to_activation);
    require_non_negative("regime_to_activation", regime_to_activation);
    require_non_negative("activation_to_kwh", activation_to_kwh);
    require_non_negative("direct_temp_to_kwh", direct_temp_to_kwh);
    require_non_negative("noise_sigma", noise_sigma);
    require_non_negative("academic_intensity", academic_intensity);

    require_finite("inertia_phi", inertia_phi);
    if (inertia_phi < 0.0 || inertia_phi > 1.0) {
        std::ostringstream ss;
        ss << "SimConfig.inertia_phi must be in [0, 1] (got " << inertia_phi << ")";
        throw std::invalid_argument(ss.str());
    }

    require_finite("comfort_low", comfort_low);
    require_finite("comfort_high", comfort_high);
    if (comfort_low > comfort_high) {
        throw std::invalid_argument("SimConfig.comfort_low must be <= comfort_high");
    }
}

SimConfig apply_overrides(const SimConfig& base, const claro::JsonValue& obj) {
    if (!obj.is_object()) {
        throw std::invalid_argument("config overrides must be a JSON object");
    }

    SimConfig cfg = base;

    for (const auto& [key, val] : obj.as_object()) {
        if (key == "start") continue;  // consumed by the tools

        if (!val.is_number()) {
            throw std::invalid_argument("config key '" + key + "' must be a number");
        }
        double v = val.as_number();

        if      (key == "seed")                 cfg.seed = to_int(key, v);
        else if (key == "freq_minutes")         cfg.freq_minutes = to_int(key, v);
        else if (key == "n_days")               cfg.n_days = to_int(key, v);
        else if (key == "building_factor_x4")   cfg.building_factor_x4 = v;
        else if (key == "base_kwh_when_closed") cfg.base_kwh_when_closed = v;
        else if (key == "base_kwh_when_open")   cfg.base_kwh_when_open = v;
        else if (key == "occ_to_activation")    cfg.occ_to_activation = v;
        else if (key == "temp_to_activation")   cfg.temp_to_activation = v;
        else if (key == "regime_to_activation") cfg.regime_to_activation = v;
        else if (key == "activation_to_kwh")    cfg.activation_to_kwh = v;
        else if (key == "direct_temp_to_kwh")   cfg.direct_temp_to_kwh = v;
        else if (key == "inertia_phi")          cfg.inertia_phi = v;
        else if (key == "noise_sigma")          cfg.noise_sigma = v;
        else if (key == "academic_intensity")   cfg.academic_intensity = v;
        else if (key == "comfort_low")          cfg.comfort_low = v;
        else if (key == "comfort_high")         cfg.comfort_high = v;
        else {
            throw std::invalid_argument("unknown config key '" + key + "'");
        }
    }

    return cfg;
}

std::optional<Timestamp> read_start(const claro::JsonValue& obj) {
    if (!obj.has("start")) return std::nullopt;

    const claro::JsonValue& v = obj["start"];
    auto parsed = v.is_string() ? TimeUtils::parse_iso8601(v.as_string()) : std::nullopt;
    if (!parsed || parsed->utc_offset_minutes) {
        throw std::invalid_argument("config key 'start' must be a naive ISO-8601 timestamp");
    }
    return parsed->wall_clock;
}

SimConfig load_sim_config(const std::string& path) {
    claro::JsonValue root = claro::JsonReader::parse_file(path);
    SimConfig cfg = apply_overrides(SimConfig{}, root);
    cfg.validate();
    return cfg;
}

} // namespace claro::model
