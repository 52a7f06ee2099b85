#include "ensemble/scenario.hpp"
#include <cmath>
#include <set>
#include <stdexcept>

namespace claro::ensemble {

namespace {

int require_int(const claro::JsonValue& v, const std::string& what) {
    if (!v.is_number() || v.as_number() != std::floor(v.as_number()) ||
        std::abs(v.as_number()) > 2147483647.0) {
        throw std::invalid_argument("scenario '" + what + "' must be an integer");
    }
    return static_cast<int>(v.as_number());
}

}  // anonymous namespace

Scenario ScenarioParser::parse(const claro::JsonValue& root) {
    if (!root.is_object()) {
        throw std::invalid_argument("scenario must be a JSON object");
    }

    for (const auto& [key, val] : root.as_object()) {
        (void)val;
        if (key != "runs" && key != "base_seed" && key != "start" &&
            key != "config" && key != "variants") {
            throw std::invalid_argument("unknown scenario key '" + key + "'");
        }
    }

    Scenario sc;

    if (root.has("runs")) {
        int runs = require_int(root["runs"], "runs");
        if (runs < 1) throw std::invalid_argument("scenario 'runs' must be >= 1");
        sc.num_runs = runs;
    }
    if (root.has("base_seed")) {
        sc.base_seed = require_int(root["base_seed"], "base_seed");
    }

    sc.start = claro::model::read_start(root);

    if (root["config"].has("start")) {
        throw std::invalid_argument("'start' belongs at the top level of a scenario, not in 'config'");
    }
    if (root.has("config")) {
        sc.base = claro::model::apply_overrides(sc.base, root["config"]);
    }
    sc.base.validate();

    const auto& variants = root["variants"];
    if (variants.is_null()) {
        sc.variants.push_back(Variant{"baseline", claro::JsonValue::make_object()});
        return sc;
    }
    if (!variants.is_array() || variants.size() == 0) {
        throw std::invalid_argument("scenario 'variants' must be a non-empty array");
    }

    std::set<std::string> seen;
    for (const auto& def : variants.as_array()) {
        Variant v;
        v.name = def["name"].get_string("");
        if (v.name.empty()) {
            throw std::invalid_argument("every variant needs a non-empty 'name'");
        }
        if (v.name.find_first_of("/\\") != std::string::npos || v.name == "." || v.name == "..") {
            throw std::invalid_argument("variant name '" + v.name + "' must not be a path");
        }
        if (!seen.insert(v.name).second) {
            throw std::invalid_argument("duplicate variant name '" + v.name + "'");
        }

        const auto& ov = def["overrides"];
        if (!ov.is_null()) {
            if (!ov.is_object()) {
                throw std::invalid_argument("variant '" + v.name + "' overrides must be an object");
            }
            if (ov.has("start")) {
                throw std::invalid_argument("variant '" + v.name + "' cannot override 'start'");
            }
            v.overrides = ov;
        }
        sc.variants.push_back(std::move(v));
    }

    return sc;
}

Scenario ScenarioParser::parse_file(const std::string& path) {
    return parse(claro::JsonReader::parse_file(path));
}

} // namespace claro::ensemble
