#include "core/sim_rng.hpp"
#include "io/json_reader.hpp"
#include "model/record_writer.hpp"
#include "model/signals.hpp"
#include "model/simulator.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using claro::SimRNG;
using claro::Timestamp;
using claro::TimeUtils;
namespace model = claro::model;

namespace {

model::SimConfig smallConfig() {
    model::SimConfig cfg;
    cfg.n_days = 14;
    return cfg;
}

void runGridSize() {
    model::SimConfig cfg;   // 60 days hourly
    auto rows = model::simulate(cfg);
    REQUIRE(rows.size() == 1440u, "60 days hourly = 1440 records, got " << rows.size());

    REQUIRE(rows.front().timestamp == model::default_start(), "default start");
    REQUIRE(TimeUtils::format_iso8601(rows.front().timestamp) == "2025-01-01T00:00:00",
            "default start is 2025-01-01T00:00:00");
    for (size_t i = 1; i < rows.size(); i++) {
        REQUIRE(rows[i].timestamp.seconds() - rows[i - 1].timestamp.seconds() == 3600,
                "strictly increasing, exactly one step apart at " << i);
    }

    model::SimConfig q = smallConfig();
    q.freq_minutes = 15;
    q.n_days = 2;
    REQUIRE(model::simulate(q).size() == 192u, "2 days at 15 min");

    model::SimConfig zero = smallConfig();
    zero.n_days = 0;
    REQUIRE(model::simulate(zero).empty(), "zero days = no records");
    claro_test::pass("time grid size");
}

void runDeterminism() {
    model::SimConfig cfg = smallConfig();
    Timestamp start = Timestamp::from_civil({2025, 3, 10, 6, 0, 0});

    auto a = model::simulate(cfg, start);
    auto b = model::simulate(cfg, start);
    REQUIRE(a.size() == b.size(), "same length");
    for (size_t i = 0; i < a.size(); i++) {
        REQUIRE(a[i].timestamp == b[i].timestamp &&
                a[i].x1_occupancy == b[i].x1_occupancy &&
                a[i].x2_temp_out == b[i].x2_temp_out &&
                a[i].x2_temp_pressure == b[i].x2_temp_pressure &&
                a[i].x3_open == b[i].x3_open &&
                a[i].x4_building_factor == b[i].x4_building_factor &&
                a[i].x5_availability == b[i].x5_availability &&
                a[i].m1_activation == b[i].m1_activation &&
                a[i].y_kwh == b[i].y_kwh,
                "record " << i << " identical");
    }

    std::ostringstream sa, sb;
    model::write_records_csv(a, sa);
    model::write_records_csv(b, sb);
    REQUIRE(sa.str() == sb.str(), "byte-identical CSV");

    model::SimConfig other = cfg;
    other.seed = cfg.seed + 1;
    auto c = model::simulate(other, start);
    bool differs = false;
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i].y_kwh != c[i].y_kwh) differs = true;
    }
    REQUIRE(differs, "different seed gives a different series");
    claro_test::pass("determinism");
}

void runRecordInvariants() {
    model::SimConfig cfg;
    cfg.n_days = 90;
    cfg.academic_intensity = 1.2;
    auto rows = model::simulate(cfg);

    int open_count = 0;
    for (const auto& r : rows) {
        REQUIRE(r.x1_occupancy >= 0.0 && r.x1_occupancy <= 220.0, "occupancy in [0,220]");
        if (r.x3_open == 0) REQUIRE(r.x1_occupancy == 0.0, "closed -> zero occupancy");
        REQUIRE(r.x3_open == 0 || r.x3_open == 1, "regime is binary");
        REQUIRE(r.m1_activation >= 0.0 && r.m1_activation <= 2.0, "activation in [0,2]");
        REQUIRE(r.y_kwh >= 0.0, "energy non-negative");
        REQUIRE(r.x2_temp_pressure >= 0.0, "pressure non-negative");
        REQUIRE(r.x4_building_factor == cfg.building_factor_x4, "building factor echo");
        REQUIRE(r.x3_open == model::simulate_open_regime(r.timestamp), "regime matches schedule");
        claro_test::requireClose("availability", r.x5_availability,
                                 (0.7 + 0.3 * r.x3_open) * cfg.building_factor_x4, 1e-12);
        claro_test::requireClose("pressure", r.x2_temp_pressure,
                                 model::temp_pressure(r.x2_temp_out), 1e-12);
        open_count += r.x3_open;
    }
    REQUIRE(open_count > 0 && open_count < static_cast<int>(rows.size()), "both regimes occur");

    // Large noise still never goes negative
    model::SimConfig noisy = smallConfig();
    noisy.noise_sigma = 40.0;
    for (const auto& r : model::simulate(noisy)) {
        REQUIRE(r.y_kwh >= 0.0, "energy floored at 0");
    }

    // Strong coefficients saturate activation at 2
    model::SimConfig hot = smallConfig();
    hot.occ_to_activation = 1.0;
    bool saturated = false;
    for (const auto& r : model::simulate(hot)) {
        REQUIRE(r.m1_activation <= 2.0, "activation clamp");
        if (r.m1_activation == 2.0) saturated = true;
    }
    REQUIRE(saturated, "activation reaches the clamp");
    claro_test::pass("record invariants");
}

// Replays the draw order: occupancy draw (open steps only), then noise draw.
void runInertiaFull() {
    model::SimConfig cfg = smallConfig();
    cfg.inertia_phi = 1.0;
    auto rows = model::simulate(cfg);

    SimRNG replay(cfg.seed);
    double y_prev = cfg.base_kwh_when_closed;
    for (size_t i = 0; i < rows.size(); i++) {
        if (model::simulate_open_regime(rows[i].timestamp) == 1) {
            replay.gaussian(0.0, 8.0);
        }
        double noise = replay.gaussian(0.0, cfg.noise_sigma);
        double expected = std::max(0.0, y_prev + noise);
        REQUIRE(rows[i].y_kwh == expected, "phi=1: y = y_prev + noise at step " << i);
        y_prev = rows[i].y_kwh;
    }
    claro_test::pass("inertia phi = 1");
}

void runInertiaNone() {
    model::SimConfig cfg = smallConfig();
    cfg.inertia_phi = 0.0;
    auto rows = model::simulate(cfg);

    SimRNG replay(cfg.seed);
    for (size_t i = 0; i < rows.size(); i++) {
        const auto& r = rows[i];
        if (r.x3_open == 1) replay.gaussian(0.0, 8.0);
        double noise = replay.gaussian(0.0, cfg.noise_sigma);
        double target = model::baseline_target_kwh(cfg, r.x3_open, r.m1_activation,
                                                   r.x2_temp_pressure);
        REQUIRE(r.y_kwh == std::max(0.0, target + noise),
                "phi=0: y = target + noise at step " << i);
    }

    // Independent of history: any y_prev gives the same output
    Timestamp ts = Timestamp::from_civil({2025, 1, 8, 12, 0, 0});
    SimRNG r1(77), r2(77);
    auto a = model::simulate_step(cfg, ts, 0.0, r1);
    auto b = model::simulate_step(cfg, ts, 500.0, r2);
    REQUIRE(a.y_kwh == b.y_kwh, "phi=0 ignores y_prev");
    claro_test::pass("inertia phi = 0");
}

void runNoiselessSteadyState() {
    model::SimConfig cfg = smallConfig();
    cfg.noise_sigma = 0.0;
    cfg.inertia_phi = 0.5;
    auto rows = model::simulate(cfg);

    double y_prev = cfg.base_kwh_when_closed;
    for (const auto& r : rows) {
        double target = model::baseline_target_kwh(cfg, r.x3_open, r.m1_activation,
                                                   r.x2_temp_pressure);
        claro_test::requireClose("noiseless recurrence", r.y_kwh,
                                 0.5 * y_prev + 0.5 * target, 1e-9);
        y_prev = r.y_kwh;
    }
    claro_test::pass("noiseless recurrence");
}

void runStepDrawOrder() {
    model::SimConfig cfg = smallConfig();
    SimRNG rng(cfg.seed);

    Timestamp closed = Timestamp::from_civil({2025, 1, 1, 2, 0, 0});
    model::simulate_step(cfg, closed, 8.0, rng);
    REQUIRE(rng.draws() == 2, "closed step: noise draw only");

    Timestamp open = Timestamp::from_civil({2025, 1, 1, 12, 0, 0});
    model::simulate_step(cfg, open, 8.0, rng);
    REQUIRE(rng.draws() == 6, "open step: occupancy + noise draws");
    claro_test::pass("per-step draw order");
}

void runPrefixStability() {
    // Draws for step N depend only on steps <= N, so a longer horizon
    // extends the series without changing its prefix.
    model::SimConfig shortCfg = smallConfig();
    model::SimConfig longCfg = shortCfg;
    longCfg.n_days = shortCfg.n_days + 7;

    auto s = model::simulate(shortCfg);
    auto l = model::simulate(longCfg);
    for (size_t i = 0; i < s.size(); i++) {
        REQUIRE(s[i].y_kwh == l[i].y_kwh, "prefix identical at " << i);
    }
    claro_test::pass("horizon prefix stability");
}

void runConfigValidation() {
    auto expectInvalid = [](model::SimConfig cfg, const char* what) {
        REQUIRE_THROWS(model::simulate(cfg), std::invalid_argument, what);
    };

    model::SimConfig c;
    c.inertia_phi = 1.5;     expectInvalid(c, "phi > 1");
    c = {}; c.inertia_phi = -0.1;  expectInvalid(c, "phi < 0");
    c = {}; c.freq_minutes = -60;  expectInvalid(c, "negative freq");
    c = {}; c.freq_minutes = 0;    expectInvalid(c, "zero freq");
    c = {}; c.freq_minutes = 7;    expectInvalid(c, "freq not dividing 1440");
    c = {}; c.n_days = -1;         expectInvalid(c, "negative days");
    c = {}; c.activation_to_kwh = -1.0;  expectInvalid(c, "negative coefficient");
    c = {}; c.noise_sigma = -2.0;  expectInvalid(c, "negative sigma");
    c = {}; c.comfort_low = 25.0;  expectInvalid(c, "inverted comfort band");
    c = {}; c.building_factor_x4 = std::nan("");  expectInvalid(c, "NaN factor");

    model::SimConfig ok;
    ok.inertia_phi = 1.0;
    ok.validate();
    ok.inertia_phi = 0.0;
    ok.validate();
    claro_test::pass("config validation");
}

void runConfigOverrides() {
    auto root = claro::JsonReader::parse(
        R"({"seed": 7, "n_days": 3, "inertia_phi": 0.2, "start": "2025-02-01"})");
    model::SimConfig cfg = model::apply_overrides(model::SimConfig{}, root);
    REQUIRE(cfg.seed == 7 && cfg.n_days == 3, "integer overrides");
    claro_test::requireClose("phi override", cfg.inertia_phi, 0.2, 0.0);
    claro_test::requireClose("untouched default", cfg.noise_sigma, 2.5, 0.0);

    REQUIRE_THROWS(model::apply_overrides(model::SimConfig{},
                       claro::JsonReader::parse(R"({"inertia": 0.5})")),
                   std::invalid_argument, "unknown key rejected");
    REQUIRE_THROWS(model::apply_overrides(model::SimConfig{},
                       claro::JsonReader::parse(R"({"n_days": 2.5})")),
                   std::invalid_argument, "fractional integer rejected");
    REQUIRE_THROWS(model::apply_overrides(model::SimConfig{},
                       claro::JsonReader::parse(R"({"noise_sigma": "big"})")),
                   std::invalid_argument, "string value rejected");

    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "claro_test_config.json";
    {
        std::ofstream f(path);
        f << R"({"start": "2025-09-01", "n_days": 10, "academic_intensity": 0.6})";
    }
    model::SimConfig loaded = model::load_sim_config(path.string());
    REQUIRE(loaded.n_days == 10, "loaded from file");
    claro_test::requireClose("loaded intensity", loaded.academic_intensity, 0.6, 0.0);

    {
        std::ofstream f(path);
        f << R"({"inertia_phi": 3})";
    }
    REQUIRE_THROWS(model::load_sim_config(path.string()), std::invalid_argument,
                   "file values are range-checked");
    fs::remove(path);
    REQUIRE_THROWS(model::load_sim_config(path.string()), std::runtime_error, "missing file");
    claro_test::pass("config overrides");
}

void runStartKey() {
    using claro::JsonReader;
    REQUIRE(!model::read_start(JsonReader::parse(R"({"n_days": 2})")), "absent start");
    auto start = model::read_start(JsonReader::parse(R"({"start": "2025-09-01"})"));
    REQUIRE(start && claro::TimeUtils::format_iso8601(*start) == "2025-09-01T00:00:00",
            "date-only start");

    REQUIRE_THROWS(model::read_start(JsonReader::parse(R"({"start": 5})")),
                   std::invalid_argument, "numeric start rejected");
    REQUIRE_THROWS(model::read_start(JsonReader::parse(R"({"start": null})")),
                   std::invalid_argument, "null start rejected");
    REQUIRE_THROWS(model::read_start(JsonReader::parse(R"({"start": "yesterday"})")),
                   std::invalid_argument, "unparseable start rejected");
    REQUIRE_THROWS(model::read_start(JsonReader::parse(
                       R"({"start": "2025-09-01T00:00:00+01:00"})")),
                   std::invalid_argument, "offset-aware start rejected");

    model::SimConfig defaults;
    REQUIRE(defaults.comfort_low == model::kDefaultComfortLow &&
            defaults.comfort_high == model::kDefaultComfortHigh,
            "comfort band defaults shared with the feature builder");
    claro_test::pass("start key + comfort defaults");
}

void runCsvOutput() {
    model::SimConfig cfg = smallConfig();
    cfg.n_days = 1;
    auto rows = model::simulate(cfg);

    std::ostringstream out;
    model::write_records_csv(rows, out);
    std::istringstream in(out.str());

    std::string header;
    std::getline(in, header);
    REQUIRE(header == "timestamp,X1_occupancy,X2_temp_out,X2_temp_pressure,X3_open,"
                      "X4_building_factor,X5_availability,M1_activation,Y_kwh",
            "header order: " << header);

    std::string first;
    std::getline(in, first);
    REQUIRE(first.rfind("2025-01-01T00:00:00,0.0,", 0) == 0, "first row: " << first);
    REQUIRE(first.find(",0.0,1.1,0.77,") != std::string::npos,
            "closed regime, factor and availability: " << first);

    size_t lines = 1;
    std::string line;
    while (std::getline(in, line)) lines++;
    REQUIRE(lines == rows.size(), "one line per record");

    // Predetermined schema: zero records still produce the header
    std::ostringstream empty;
    model::write_records_csv({}, empty);
    REQUIRE(empty.str() == header + "\n", "header-only output for zero records");
    claro_test::pass("simulator CSV output");
}

}  // namespace

int main() {
    runGridSize();
    runDeterminism();
    runRecordInvariants();
    runInertiaFull();
    runInertiaNone();
    runNoiselessSteadyState();
    runStepDrawOrder();
    runPrefixStability();
    runConfigValidation();
    runConfigOverrides();
    runStartKey();
    runCsvOutput();
    return 0;
}
