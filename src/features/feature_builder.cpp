#include "features/feature_builder.hpp"
#include "io/csv_writer.hpp"
#include "model/signals.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <numeric>

namespace claro::features {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// Upper bound on resampled rows; guards against e.g. "1S" over decades
constexpr int64_t kMaxResampledRows = 50'000'000;

// Data rows listed in a TimestampParseError message
constexpr size_t kMaxReportedRows = 5;

std::string build_parse_message(const std::string& column,
                                const std::vector<std::pair<size_t, std::string>>& bad) {
    std::string msg = "Unparseable timestamps found in column '" + column + "' (" +
                      std::to_string(bad.size()) + " row" + (bad.size() == 1 ? "" : "s") +
                      "). Example rows:";
    for (size_t i = 0; i < bad.size() && i < kMaxReportedRows; i++) {
        msg += "\n  row " + std::to_string(bad[i].first) + ": '" + bad[i].second + "'";
    }
    if (bad.size() > kMaxReportedRows) {
        msg += "\n  ... " + std::to_string(bad.size() - kMaxReportedRows) + " more";
    }
    return msg;
}

double parse_cell(const std::string& raw) {
    size_t b = 0, e = raw.size();
    while (b < e && std::isspace(static_cast<unsigned char>(raw[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(raw[e - 1]))) e--;
    if (b == e) return NaN;

    std::string s = raw.substr(b, e - b);
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return NaN;
    return v;
}

size_t require_column(const CsvTable& table, const std::string& name) {
    auto idx = table.column_index(name);
    if (!idx) {
        throw std::runtime_error("input table is missing required column '" + name + "'");
    }
    return *idx;
}

std::vector<double> numeric_column(const CsvTable& table, size_t col,
                                   const std::vector<size_t>& order) {
    std::vector<double> out;
    out.reserve(order.size());
    for (size_t r : order) out.push_back(parse_cell(table.rows[r][col]));
    return out;
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// TimestampParseError / FeatureTable
// ═══════════════════════════════════════════════════════════════

TimestampParseError::TimestampParseError(const std::string& column,
                                         std::vector<std::pair<size_t, std::string>> bad_rows)
    : std::runtime_error(build_parse_message(column, bad_rows)),
      column_(column),
      bad_rows_(std::move(bad_rows)) {}

const std::vector<double>& FeatureTable::column(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); i++) {
        if (columns[i] == name) return values[i];
    }
    throw std::out_of_range("FeatureTable has no column '" + name + "'");
}

void FeatureTable::add_column(const std::string& name, std::vector<double> data) {
    if (data.size() != rows()) {
        throw std::logic_error("FeatureTable: column '" + name + "' has " +
                               std::to_string(data.size()) + " rows, table has " +
                               std::to_string(rows()));
    }
    columns.push_back(name);
    values.push_back(std::move(data));
}

// ═══════════════════════════════════════════════════════════════
// Pipeline stages
// ═══════════════════════════════════════════════════════════════

TimestampColumn parse_timestamp_column(const CsvTable& table,
                                       const std::string& column,
                                       const FeatureConfig& cfg) {
    size_t col = require_column(table, column);

    std::vector<ParsedTimestamp> parsed_rows;
    parsed_rows.reserve(table.rows.size());
    std::vector<std::pair<size_t, std::string>> bad;

    // First data row of each kind, for the mixed-kind error
    size_t first_naive = 0, first_aware = 0;
    std::optional<int> shared_offset;
    bool offsets_differ = false;

    for (size_t r = 0; r < table.rows.size(); r++) {
        const std::string& raw = table.rows[r][col];
        auto parsed = TimeUtils::parse_iso8601(raw);
        if (!parsed) {
            bad.emplace_back(r + 1, raw);
            continue;
        }

        if (!parsed->utc_offset_minutes) {
            if (first_naive == 0) first_naive = r + 1;
        } else {
            if (first_aware == 0) first_aware = r + 1;
            if (!shared_offset) {
                shared_offset = parsed->utc_offset_minutes;
            } else if (*shared_offset != *parsed->utc_offset_minutes) {
                offsets_differ = true;
            }
        }
        parsed_rows.push_back(*parsed);
    }

    if (!bad.empty()) throw TimestampParseError(column, std::move(bad));
    if (first_naive != 0 && first_aware != 0) {
        throw std::runtime_error("column '" + column + "' mixes naive (row " +
                                 std::to_string(first_naive) + ") and offset-aware (row " +
                                 std::to_string(first_aware) + ") timestamps");
    }

    TimestampColumn out;
    if (cfg.utc_offset_minutes) {
        out.utc_offset_minutes = cfg.utc_offset_minutes;
    } else if (first_aware != 0) {
        out.utc_offset_minutes = offsets_differ ? 0 : *shared_offset;
    }

    out.times.reserve(parsed_rows.size());
    for (const auto& p : parsed_rows) {
        if (!p.utc_offset_minutes) {
            // Naive: taken as local to the target offset (if any)
            out.times.push_back(p.wall_clock);
        } else {
            out.times.push_back(p.to_utc().plus_minutes(*out.utc_offset_minutes));
        }
    }
    return out;
}

FeatureTable standardize(const CsvTable& table, const FeatureConfig& cfg) {
    const size_t c_y = require_column(table, "Y_kwh");
    const size_t c_occ = require_column(table, "X1_occupancy");
    const size_t c_temp = require_column(table, "X2_temp_out");
    const size_t c_open = require_column(table, "X3_open");

    TimestampColumn parsed = parse_timestamp_column(table, "timestamp", cfg);
    const std::vector<Timestamp>& ts = parsed.times;

    std::vector<size_t> order(ts.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&ts](size_t a, size_t b) { return ts[a] < ts[b]; });

    FeatureTable out;
    out.utc_offset_minutes = parsed.utc_offset_minutes;
    out.index.reserve(order.size());
    for (size_t r : order) out.index.push_back(ts[r]);

    out.add_column("Y_kwh", numeric_column(table, c_y, order));
    out.add_column("X1_occupancy_proxy", numeric_column(table, c_occ, order));

    std::vector<double> temp = numeric_column(table, c_temp, order);
    std::vector<double> pressure(temp.size());
    for (size_t i = 0; i < temp.size(); i++) {
        pressure[i] = std::isnan(temp[i])
            ? NaN
            : claro::model::temp_pressure(temp[i], cfg.comfort_low, cfg.comfort_high);
    }
    out.add_column("X2_temp_out", std::move(temp));
    out.add_column("X2_temp_pressure", std::move(pressure));

    // Regime flag is integral before averaging
    std::vector<double> open = numeric_column(table, c_open, order);
    for (double& v : open) {
        if (!std::isnan(v)) v = std::trunc(v);
    }
    out.add_column("X3_open", std::move(open));

    return out;
}

FeatureTable resample_mean(const FeatureTable& in, int64_t freq_seconds) {
    if (freq_seconds <= 0) {
        throw std::invalid_argument("resample frequency must be positive");
    }

    FeatureTable out;
    out.columns = in.columns;
    out.utc_offset_minutes = in.utc_offset_minutes;
    out.values.assign(in.columns.size(), {});
    if (in.rows() == 0) return out;

    const int64_t first = in.index.front().seconds();
    const int64_t origin = floor_div(first, TimeUtils::SECONDS_PER_DAY) * TimeUtils::SECONDS_PER_DAY;
    const int64_t first_bin = floor_div(first - origin, freq_seconds);
    const int64_t last_bin = floor_div(in.index.back().seconds() - origin, freq_seconds);
    const int64_t n_bins = last_bin - first_bin + 1;

    if (n_bins > kMaxResampledRows) {
        throw std::runtime_error("resampling would produce " + std::to_string(n_bins) +
                                 " rows; choose a coarser frequency");
    }

    const size_t nb = static_cast<size_t>(n_bins);
    out.index.reserve(nb);
    for (int64_t b = first_bin; b <= last_bin; b++) {
        out.index.push_back(Timestamp(origin + b * freq_seconds));
    }

    for (size_t c = 0; c < in.columns.size(); c++) {
        std::vector<double> sum(nb, 0.0);
        std::vector<size_t> count(nb, 0);

        for (size_t r = 0; r < in.rows(); r++) {
            double v = in.values[c][r];
            if (std::isnan(v)) continue;
            size_t b = static_cast<size_t>(
                floor_div(in.index[r].seconds() - origin, freq_seconds) - first_bin);
            sum[b] += v;
            count[b]++;
        }

        std::vector<double>& col = out.values[c];
        col.resize(nb);
        for (size_t b = 0; b < nb; b++) {
            col[b] = count[b] > 0 ? sum[b] / static_cast<double>(count[b]) : NaN;
        }
    }

    return out;
}

void add_lags(FeatureTable& table, const std::string& source,
              const std::vector<int>& lags, const std::string& prefix) {
    const std::vector<double> src = table.column(source);
    const size_t n = table.rows();

    for (int lag : lags) {
        if (lag < 1) {
            throw std::invalid_argument("lag must be >= 1 (got " + std::to_string(lag) + ")");
        }
        const size_t k = static_cast<size_t>(lag);

        std::vector<double> shifted(n, NaN);
        for (size_t i = k; i < n; i++) shifted[i] = src[i - k];
        table.add_column(prefix + std::to_string(lag), std::move(shifted));
    }
}

FeatureTable drop_incomplete(const FeatureTable& in) {
    FeatureTable out;
    out.columns = in.columns;
    out.utc_offset_minutes = in.utc_offset_minutes;
    out.values.assign(in.columns.size(), {});

    for (size_t r = 0; r < in.rows(); r++) {
        bool complete = true;
        for (size_t c = 0; c < in.columns.size() && complete; c++) {
            if (std::isnan(in.values[c][r])) complete = false;
        }
        if (!complete) continue;

        out.index.push_back(in.index[r]);
        for (size_t c = 0; c < in.columns.size(); c++) {
            out.values[c].push_back(in.values[c][r]);
        }
    }

    return out;
}

FeatureTable build_feature_table(const CsvTable& table, const FeatureConfig& cfg) {
    cfg.validate();

    FeatureTable out = resample_mean(standardize(table, cfg), parse_frequency(cfg.freq));
    if (cfg.add_y_lags) {
        add_lags(out, "Y_kwh", cfg.y_lags);
    }
    return drop_incomplete(out);
}

void write_feature_csv(const FeatureTable& table, std::ostream& out) {
    std::vector<std::string> header;
    header.reserve(table.columns.size() + 1);
    header.push_back("timestamp");
    header.insert(header.end(), table.columns.begin(), table.columns.end());

    claro::CsvWriter w(out);
    w.write_header(header);

    const std::string suffix = table.utc_offset_minutes
        ? TimeUtils::format_utc_offset(*table.utc_offset_minutes)
        : std::string();

    for (size_t r = 0; r < table.rows(); r++) {
        w.field(TimeUtils::format_iso8601(table.index[r], ' ') + suffix);
        for (size_t c = 0; c < table.columns.size(); c++) {
            w.field(table.values[c][r]);
        }
        w.end_row();
    }
}

FeatureTable build_features(const std::string& path_in, const std::string& path_out,
                            const FeatureConfig& cfg) {
    CsvTable input = CsvReader::read_file(path_in);
    FeatureTable table = build_feature_table(input, cfg);

    std::ofstream out = claro::open_output_file(path_out);
    write_feature_csv(table, out);
    out.flush();
    if (!out) {
        throw std::runtime_error("Error writing " + path_out);
    }
    return table;
}

} // namespace claro::features
