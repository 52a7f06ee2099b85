/**
 * FeatureBuilder: Turn a measurement table (simulated or real) into a
 * model-ready analytical table.
 *
 * Pipeline:
 *   read CSV -> parse timestamps -> standardize columns + X2 pressure
 *   -> resample (mean) -> Y lags -> drop incomplete rows -> write CSV
 *
 * Input columns required: timestamp, Y_kwh, X1_occupancy, X2_temp_out, X3_open.
 * Output columns: timestamp, Y_kwh, X1_occupancy_proxy, X2_temp_out,
 *                 X2_temp_pressure, X3_open, Y_lag_<k>...
 */

#ifndef CLARO_FEATURES_FEATURE_BUILDER_HPP
#define CLARO_FEATURES_FEATURE_BUILDER_HPP

#include "core/time_utils.hpp"
#include "features/feature_config.hpp"
#include "io/csv_reader.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace claro::features {

/**
 * Raised when one or more timestamp cells cannot be parsed.
 * bad_rows holds (1-based data row number, raw text) for every failure.
 */
class TimestampParseError : public std::runtime_error {
public:
    TimestampParseError(const std::string& column,
                        std::vector<std::pair<size_t, std::string>> bad_rows);

    const std::string& column() const { return column_; }
    const std::vector<std::pair<size_t, std::string>>& bad_rows() const { return bad_rows_; }

private:
    std::string column_;
    std::vector<std::pair<size_t, std::string>> bad_rows_;
};

/**
 * Timestamp-indexed numeric table. Column-major; missing values are NaN.
 */
struct FeatureTable {
    std::vector<Timestamp> index;
    std::vector<std::string> columns;
    std::vector<std::vector<double>> values;   // values[col][row]

    // Set when timestamps are wall-clock at a fixed UTC offset
    std::optional<int> utc_offset_minutes;

    size_t rows() const { return index.size(); }

    /** @throws std::out_of_range if the column does not exist */
    const std::vector<double>& column(const std::string& name) const;

    /** Append a column; must have rows() entries. */
    void add_column(const std::string& name, std::vector<double> data);
};

/**
 * Parsed timestamp column. utc_offset_minutes is the fixed offset the
 * wall-clock times are expressed in (empty for naive times).
 */
struct TimestampColumn {
    std::vector<Timestamp> times;
    std::optional<int> utc_offset_minutes;
};

/**
 * Parse the timestamp column and resolve offsets.
 *
 * With cfg.utc_offset_minutes set, aware values are converted to it and
 * naive values are taken as local to it. Without it, a column sharing one
 * offset keeps that offset; mixed offsets are normalized to UTC (+00:00).
 * @throws TimestampParseError listing all unparseable rows
 * @throws std::runtime_error if naive and offset-aware values are mixed
 */
TimestampColumn parse_timestamp_column(const CsvTable& table,
                                       const std::string& column,
                                       const FeatureConfig& cfg);

/**
 * Sorted, standardized table (before resampling):
 * Y_kwh, X1_occupancy_proxy, X2_temp_out, X2_temp_pressure, X3_open.
 * @throws std::runtime_error on a missing required column
 * @throws TimestampParseError on unparseable timestamps
 */
FeatureTable standardize(const CsvTable& table, const FeatureConfig& cfg);

/**
 * Mean of each column over fixed bins of freq_seconds, anchored at midnight
 * of the first timestamp's day. Every bin between the first and last
 * occupied bin is emitted; a column with no values in a bin is NaN.
 */
FeatureTable resample_mean(const FeatureTable& in, int64_t freq_seconds);

/**
 * Append "<prefix><k>" = source shifted by k rows, for each lag k.
 */
void add_lags(FeatureTable& table, const std::string& source,
              const std::vector<int>& lags, const std::string& prefix = "Y_lag_");

/**
 * Remove every row containing a NaN.
 */
FeatureTable drop_incomplete(const FeatureTable& in);

/**
 * Whole in-memory pipeline.
 */
FeatureTable build_feature_table(const CsvTable& table, const FeatureConfig& cfg);

/**
 * Write the table with a leading "timestamp" column at full precision.
 */
void write_feature_csv(const FeatureTable& table, std::ostream& out);

/**
 * File-to-file pipeline; returns the table written.
 * @throws std::runtime_error / TimestampParseError / std::invalid_argument
 */
FeatureTable build_features(const std::string& path_in, const std::string& path_out,
                            const FeatureConfig& cfg = FeatureConfig{});

} // namespace claro::features

#endif // CLARO_FEATURES_FEATURE_BUILDER_HPP
