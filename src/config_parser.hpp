#ifndef HOMECALC_CONFIG_PARSER_HPP
#define HOMECALC_CONFIG_PARSER_HPP

#include "params.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace homecalc {

/**
 * @brief Exception thrown when a parameter file cannot be read or decoded
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses simulation parameters from a JSON string
 *
 * Keys that are absent keep their default value. Layout:
 * @code
 * {
 *   "years": 10,
 *   "investment_return_rate": 7.0,
 *   "inflation_rate": 3.0,
 *   "capital_gains_tax_rate": 30.0,
 *   "budget": { "strategy": "salary_based", "monthly_salary": 5000,
 *               "salary_growth_rate": 3.0, "housing_budget_percent": 40,
 *               "housing_budget_percent_annual_increase": 0.0,
 *               "pay_down_mortgage_early": false },
 *   "home": { "price": 500000, "down_payment_percent": 20, ... },
 *   "rent_out": { "enabled": false, "monthly_income": 800 },
 *   "mortgage1": { "interest_rate": 6.5, "term_years": 30 },
 *   "mortgage2": { "enabled": false, "amount": 50000, "interest_rate": 8.0, "term_years": 15 },
 *   "pmi_monthly": 0,
 *   "subsidized_loan": { "enabled": false, "amount": 60000, "term_years": 20 },
 *   "rent": { "monthly_rent": 2500, "insurance_monthly": 20 }
 * }
 * @endcode
 *
 * @param json_string JSON document
 * @return Parsed and validated parameters
 * @throws ConfigParseError if the JSON is malformed or a value has the wrong type
 * @throws ParamsValidationError if the resulting parameters are invalid
 */
SimulationParams parse_params_from_string(const std::string& json_string);

/**
 * @brief Parses simulation parameters from a JSON file
 *
 * @param file_path Path to the JSON parameter file
 * @return Parsed and validated parameters
 * @throws ConfigParseError if the file cannot be read or decoded
 * @throws ParamsValidationError if the resulting parameters are invalid
 */
SimulationParams parse_params_from_file(const std::string& file_path);

/**
 * @brief Parses already-decoded JSON into parameters (no validation)
 *
 * @throws ConfigParseError on wrong value types or an unknown budget strategy
 */
SimulationParams params_from_json(const nlohmann::json& j);

/**
 * @brief Serializes parameters in the layout accepted by parse_params_from_string
 */
nlohmann::ordered_json params_to_json(const SimulationParams& params);

} // namespace homecalc

#endif // HOMECALC_CONFIG_PARSER_HPP
