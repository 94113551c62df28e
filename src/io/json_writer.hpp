#ifndef HOMECALC_IO_JSON_WRITER_HPP
#define HOMECALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "../params.hpp"
#include "../simulation.hpp"

namespace homecalc {
namespace io {

struct JsonWriteOptions {
    bool include_monthly;       // Emit the monthly series (can be large)
    bool include_parameters;    // Echo the parameter record
    bool pretty_print;

    JsonWriteOptions() : include_monthly(true), include_parameters(true), pretty_print(true) {}
};

// Build the output document: parameters, summary, comparison, yearly, monthly
nlohmann::ordered_json simulation_result_to_json(const SimulationResult& result,
                                                 const SimulationParams& params,
                                                 const JsonWriteOptions& options = JsonWriteOptions());

// Write SimulationResult to JSON format
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  const SimulationParams& params,
                                  const JsonWriteOptions& options = JsonWriteOptions());

// Write SimulationResult to JSON file; throws std::runtime_error if the file cannot be opened
void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  const SimulationParams& params,
                                  const JsonWriteOptions& options = JsonWriteOptions());

} // namespace io
} // namespace homecalc

#endif // HOMECALC_IO_JSON_WRITER_HPP
