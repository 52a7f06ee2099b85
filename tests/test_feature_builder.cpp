#include "features/feature_builder.hpp"
#include "model/record_writer.hpp"
#include "model/simulator.hpp"
#include "test_support.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using claro::CsvReader;
using claro::CsvTable;
using claro::Timestamp;
using claro::TimeUtils;
namespace features = claro::features;
namespace model = claro::model;

namespace {

const char* kHeader = "timestamp,Y_kwh,X1_occupancy,X2_temp_out,X3_open\n";

CsvTable tableFrom(const std::string& text) {
    std::istringstream in(text);
    return CsvReader::read(in);
}

features::FeatureConfig noLags() {
    features::FeatureConfig cfg;
    cfg.add_y_lags = false;
    return cfg;
}

void runSimulatorRoundTrip() {
    model::SimConfig sim;   // 60 days hourly
    auto records = model::simulate(sim);

    std::stringstream csv;
    model::write_records_csv(records, csv);
    CsvTable input = CsvReader::read(csv);
    REQUIRE(input.rows.size() == 1440u, "simulator rows read back");

    auto table = features::build_feature_table(input, features::FeatureConfig{});
    REQUIRE(table.rows() == 1440u - 24u, "24 leading rows dropped by lag 24, got " << table.rows());
    REQUIRE(TimeUtils::format_iso8601(table.index.front()) == "2025-01-02T00:00:00",
            "first kept row is start + 24h");

    const std::vector<std::string> expected = {
        "Y_kwh", "X1_occupancy_proxy", "X2_temp_out", "X2_temp_pressure", "X3_open",
        "Y_lag_1", "Y_lag_24"
    };
    REQUIRE(table.columns == expected, "output columns and order");

    const auto& y = table.column("Y_kwh");
    const auto& lag1 = table.column("Y_lag_1");
    const auto& lag24 = table.column("Y_lag_24");
    for (size_t i = 1; i < table.rows(); i++) {
        REQUIRE(lag1[i] == y[i - 1], "Y_lag_1 equals previous Y at row " << i);
    }
    for (size_t i = 24; i < table.rows(); i++) {
        REQUIRE(lag24[i] == y[i - 24], "Y_lag_24 equals Y one day earlier at row " << i);
    }

    // Values match the simulator (rounded to 4 places in the CSV)
    for (size_t i = 0; i < table.rows(); i++) {
        const auto& rec = records[i + 24];
        REQUIRE(table.index[i] == rec.timestamp, "aligned timestamps");
        claro_test::requireClose("Y", y[i], rec.y_kwh, 6e-5);
        claro_test::requireClose("pressure", table.column("X2_temp_pressure")[i],
                                 rec.x2_temp_pressure, 1e-3);
        REQUIRE(table.column("X3_open")[i] == rec.x3_open, "regime preserved");
    }
    claro_test::pass("simulator -> features round trip");
}

void runResampleMean() {
    // 15-minute data into hourly means
    std::string text = kHeader;
    text += "2025-01-01 10:00,10,100,18,1\n";
    text += "2025-01-01 10:15,20,110,18,1\n";
    text += "2025-01-01 10:30,30,120,20,1\n";
    text += "2025-01-01 10:45,40,130,26,1\n";
    text += "2025-01-01 11:00,50,0,22,0\n";
    auto table = features::build_feature_table(tableFrom(text), noLags());

    REQUIRE(table.rows() == 2, "two hourly bins, got " << table.rows());
    REQUIRE(TimeUtils::format_iso8601(table.index[0]) == "2025-01-01T10:00:00", "bin label");
    claro_test::requireClose("Y mean", table.column("Y_kwh")[0], 25.0, 1e-12);
    claro_test::requireClose("occ mean", table.column("X1_occupancy_proxy")[0], 115.0, 1e-12);
    claro_test::requireClose("temp mean", table.column("X2_temp_out")[0], 20.5, 1e-12);
    // Pressure is averaged per row (2, 2, 0, 3), not computed from the mean temperature
    claro_test::requireClose("pressure mean", table.column("X2_temp_pressure")[0], 1.75, 1e-12);
    claro_test::requireClose("open mean", table.column("X3_open")[0], 1.0, 0.0);
    claro_test::requireClose("second bin", table.column("Y_kwh")[1], 50.0, 0.0);
    claro_test::pass("resample to hourly mean");
}

void runEmptyBinsAndLags() {
    // Hours 00, 01, 03 present; 02 is an empty bin
    std::string text = kHeader;
    text += "2025-01-01T00:00:00,1,0,21,0\n";
    text += "2025-01-01T01:00:00,2,0,21,0\n";
    text += "2025-01-01T03:00:00,4,0,21,0\n";
    text += "2025-01-01T04:00:00,5,0,21,0\n";

    features::FeatureConfig cfg = noLags();
    auto resampled = features::resample_mean(features::standardize(tableFrom(text), cfg), 3600);
    REQUIRE(resampled.rows() == 5, "gap bin emitted before dropping");
    REQUIRE(std::isnan(resampled.column("Y_kwh")[2]), "empty bin is NaN");

    cfg.add_y_lags = true;
    cfg.y_lags = {1};
    auto table = features::build_feature_table(tableFrom(text), cfg);
    // Row 0 has no lag; row 2 is empty; row 3's lag points at the empty bin
    REQUIRE(table.rows() == 2, "rows 01:00 and 04:00 survive, got " << table.rows());
    REQUIRE(TimeUtils::format_iso8601(table.index[0]) == "2025-01-01T01:00:00", "01:00 kept");
    REQUIRE(TimeUtils::format_iso8601(table.index[1]) == "2025-01-01T04:00:00", "04:00 kept");
    claro_test::requireClose("lag across gap", table.column("Y_lag_1")[1], 4.0, 0.0);
    claro_test::pass("empty bins + lag alignment on the grid");
}

void runUnsortedAndNonNumeric() {
    std::string text = kHeader;
    text += "2025-01-01T02:00:00,3,0,21,0\n";
    text += "2025-01-01T00:00:00,1,0,21,0\n";
    text += "2025-01-01T01:00:00,n/a,0,21,0\n";
    auto table = features::build_feature_table(tableFrom(text), noLags());

    REQUIRE(table.rows() == 2, "non-numeric Y row dropped, got " << table.rows());
    REQUIRE(table.index[0] < table.index[1], "sorted by time");
    claro_test::requireClose("first Y", table.column("Y_kwh")[0], 1.0, 0.0);
    claro_test::requireClose("second Y", table.column("Y_kwh")[1], 3.0, 0.0);
    claro_test::pass("sorting + non-numeric cells");
}

void runTimestampErrors() {
    std::string text = kHeader;
    text += "2025-01-01T00:00:00,1,0,21,0\n";
    text += "yesterday,1,0,21,0\n";
    text += "2025-01-01T02:00:00,1,0,21,0\n";
    text += "2025-13-01T00:00:00,1,0,21,0\n";

    try {
        features::build_feature_table(tableFrom(text), noLags());
        REQUIRE(false, "bad timestamps should throw");
    } catch (const features::TimestampParseError& e) {
        REQUIRE(e.column() == "timestamp", "column named");
        REQUIRE(e.bad_rows().size() == 2, "every bad row collected");
        REQUIRE(e.bad_rows()[0].first == 2 && e.bad_rows()[0].second == "yesterday",
                "first bad row is data row 2");
        REQUIRE(e.bad_rows()[1].first == 4, "second bad row is data row 4");
        std::string msg = e.what();
        REQUIRE(msg.find("yesterday") != std::string::npos, "message shows raw text: " << msg);
    }

    // More than five failures: message is capped, list is not
    std::string many = kHeader;
    for (int i = 0; i < 8; i++) many += "bad" + std::to_string(i) + ",1,0,21,0\n";
    try {
        features::build_feature_table(tableFrom(many), noLags());
        REQUIRE(false, "should throw");
    } catch (const features::TimestampParseError& e) {
        REQUIRE(e.bad_rows().size() == 8, "all eight collected");
        std::string msg = e.what();
        REQUIRE(msg.find("bad4") != std::string::npos && msg.find("bad5") == std::string::npos,
                "first five shown: " << msg);
    }
    claro_test::pass("timestamp parse errors");
}

void runMissingColumn() {
    auto t = tableFrom("timestamp,Y_kwh,X2_temp_out,X3_open\n2025-01-01,1,20,0\n");
    try {
        features::build_feature_table(t, noLags());
        REQUIRE(false, "missing column should throw");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("X1_occupancy") != std::string::npos, "names the column: " << msg);
    }
    claro_test::pass("missing required column");
}

void runUtcOffsets() {
    std::string text = kHeader;
    text += "2025-03-01T10:00:00+01:00,1,0,21,0\n";
    text += "2025-03-01T10:00:00Z,2,0,21,0\n";

    // No target offset, differing offsets: normalized to UTC
    auto utc = features::build_feature_table(tableFrom(text), noLags());
    REQUIRE(utc.rows() == 2 && utc.utc_offset_minutes && *utc.utc_offset_minutes == 0,
            "mixed offsets labelled +00:00");
    REQUIRE(TimeUtils::format_iso8601(utc.index[0]) == "2025-03-01T09:00:00", "+01:00 -> UTC");

    // No target offset, one shared offset: kept as written
    std::string same = kHeader;
    same += "2025-03-01T10:00:00+02:00,1,0,21,0\n";
    same += "2025-03-01T11:00:00+02:00,2,0,21,0\n";
    auto kept = features::build_feature_table(tableFrom(same), noLags());
    REQUIRE(kept.utc_offset_minutes && *kept.utc_offset_minutes == 120, "shared offset kept");
    REQUIRE(TimeUtils::format_iso8601(kept.index[0]) == "2025-03-01T10:00:00",
            "wall clock unchanged");
    std::ostringstream kept_out;
    features::write_feature_csv(kept, kept_out);
    REQUIRE(kept_out.str().find("\n2025-03-01 10:00:00+02:00,") != std::string::npos,
            "offset written back: " << kept_out.str());

    // Naive and aware values in one column
    std::string mixed = kHeader;
    mixed += "2025-03-01T10:00:00,1,0,21,0\n";
    mixed += "2025-03-01T11:00:00+02:00,2,0,21,0\n";
    try {
        features::build_feature_table(tableFrom(mixed), noLags());
        REQUIRE(false, "mixed naive/aware should throw");
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("row 1") != std::string::npos && msg.find("row 2") != std::string::npos,
                "names both kinds: " << msg);
    }

    // Target offset +02:00: converted and labelled
    features::FeatureConfig cfg = noLags();
    cfg.utc_offset_minutes = 120;
    auto local = features::build_feature_table(tableFrom(text), cfg);
    REQUIRE(TimeUtils::format_iso8601(local.index[0]) == "2025-03-01T11:00:00", "UTC -> +02:00");
    REQUIRE(TimeUtils::format_iso8601(local.index[1]) == "2025-03-01T12:00:00", "Z -> +02:00");

    std::ostringstream out;
    features::write_feature_csv(local, out);
    std::istringstream lines(out.str());
    std::string header, first;
    std::getline(lines, header);
    std::getline(lines, first);
    REQUIRE(header == "timestamp,Y_kwh,X1_occupancy_proxy,X2_temp_out,X2_temp_pressure,X3_open",
            "feature header: " << header);
    REQUIRE(first == "2025-03-01 11:00:00+02:00,1.0,0.0,21.0,0.0,0.0", "offset row: " << first);
    claro_test::pass("UTC offset handling");
}

void runComfortBand() {
    std::string text = kHeader;
    text += "2025-01-01T00:00:00,1,0,18,0\n";
    features::FeatureConfig cfg = noLags();
    cfg.comfort_low = 19.0;
    cfg.comfort_high = 24.0;
    auto table = features::build_feature_table(tableFrom(text), cfg);
    claro_test::requireClose("custom band", table.column("X2_temp_pressure")[0], 1.0, 1e-12);
    claro_test::pass("configurable comfort band");
}

void runFrequencyAndLagParsing() {
    REQUIRE(features::parse_frequency("1H") == 3600, "1H");
    REQUIRE(features::parse_frequency("H") == 3600, "H");
    REQUIRE(features::parse_frequency("15min") == 900, "15min");
    REQUIRE(features::parse_frequency("30T") == 1800, "30T");
    REQUIRE(features::parse_frequency("D") == 86400, "D");
    REQUIRE(features::parse_frequency("10s") == 10, "10s");
    REQUIRE_THROWS(features::parse_frequency("0H"), std::invalid_argument, "zero multiplier");
    REQUIRE_THROWS(features::parse_frequency("1W"), std::invalid_argument, "unknown unit");
    REQUIRE_THROWS(features::parse_frequency(""), std::invalid_argument, "empty");

    REQUIRE((features::parse_lag_list("1,24") == std::vector<int>{1, 24}), "1,24");
    REQUIRE_THROWS(features::parse_lag_list("1,x"), std::invalid_argument, "non-integer lag");
    REQUIRE_THROWS(features::parse_lag_list("0"), std::invalid_argument, "zero lag");

    features::FeatureConfig bad;
    bad.freq = "fortnight";
    REQUIRE_THROWS(bad.validate(), std::invalid_argument, "bad freq rejected");
    claro_test::pass("frequency + lag parsing");
}

void runFilePipeline() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "claro_test_features";
    fs::remove_all(dir);

    model::SimConfig sim;
    sim.n_days = 3;
    model::write_records_csv(model::simulate(sim), (dir / "raw.csv").string());

    auto table = features::build_features((dir / "raw.csv").string(),
                                          (dir / "out" / "features.csv").string());
    REQUIRE(table.rows() == 72u - 24u, "3 days minus lag warm-up");
    REQUIRE(fs::exists(dir / "out" / "features.csv"), "output directory created");

    auto back = CsvReader::read_file((dir / "out" / "features.csv").string());
    REQUIRE(back.rows.size() == table.rows(), "written row count");
    REQUIRE(back.rows[0][0] == "2025-01-02 00:00:00", "space-separated naive timestamp");

    REQUIRE_THROWS(features::build_features((dir / "missing.csv").string(),
                                            (dir / "x.csv").string()),
                   std::runtime_error, "missing input file");
    fs::remove_all(dir);
    claro_test::pass("file pipeline");
}

}  // namespace

int main() {
    runSimulatorRoundTrip();
    runResampleMean();
    runEmptyBinsAndLags();
    runUnsortedAndNonNumeric();
    runTimestampErrors();
    runMissingColumn();
    runUtcOffsets();
    runComfortBand();
    runFrequencyAndLagParsing();
    runFilePipeline();
    return 0;
}
