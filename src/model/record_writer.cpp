#include "model/record_writer.hpp"
#include "io/csv_writer.hpp"
#include <stdexcept>

namespace claro::model {

const std::vector<std::string>& simulation_columns() {
    static const std::vector<std::string> kColumns = {
        "timestamp",
        "X1_occupancy",
        "X2_temp_out",
        "X2_temp_pressure",
        "X3_open",
        "X4_building_factor",
        "X5_availability",
        "M1_activation",
        "Y_kwh",
    };
    return kColumns;
}

void write_records_csv(const std::vector<SimulationRecord>& records, std::ostream& out) {
    claro::CsvWriter w(out);
    w.write_header(simulation_columns());

    for (const auto& r : records) {
        w.field(TimeUtils::format_iso8601(r.timestamp))
         .field(r.x1_occupancy, 3)
         .field(r.x2_temp_out, 3)
         .field(r.x2_temp_pressure, 3)
         .field(static_cast<double>(r.x3_open), 1)
         .field(r.x4_building_factor, 3)
         .field(r.x5_availability, 3)
         .field(r.m1_activation, 4)
         .field(r.y_kwh, 4)
         .end_row();
    }
}

void write_records_csv(const std::vector<SimulationRecord>& records, const std::string& path) {
    std::ofstream out = claro::open_output_file(path);
    write_records_csv(records, out);
    out.flush();
    if (!out) {
        throw std::runtime_error("Error writing " + path);
    }
}

} // namespace claro::model
