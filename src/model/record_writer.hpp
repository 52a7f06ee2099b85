/**
 * Record writer: CSV serialization of simulator output.
 *
 * Column order is fixed:
 *   timestamp, X1_occupancy, X2_temp_out, X2_temp_pressure, X3_open,
 *   X4_building_factor, X5_availability, M1_activation, Y_kwh
 * Values are rounded for readability only (3 places, 4 for M1 and Y).
 */

#ifndef CLARO_MODEL_RECORD_WRITER_HPP
#define CLARO_MODEL_RECORD_WRITER_HPP

#include "model/simulator.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace claro::model {

const std::vector<std::string>& simulation_columns();

void write_records_csv(const std::vector<SimulationRecord>& records, std::ostream& out);

/**
 * Write to path, creating parent directories.
 * @throws std::runtime_error if the file cannot be written
 */
void write_records_csv(const std::vector<SimulationRecord>& records, const std::string& path);

} // namespace claro::model

#endif // CLARO_MODEL_RECORD_WRITER_HPP
