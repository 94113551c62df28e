#include "json_writer.hpp"
#include "../comparison.hpp"
#include "../config_parser.hpp"
#include <fstream>
#include <stdexcept>

namespace homecalc {
namespace io {

using ordered_json = nlohmann::ordered_json;

namespace {

ordered_json summary_to_json(const SimulationSummary& s) {
    ordered_json j;
    j["final_net_worth_buy"] = s.final_net_worth_buy;
    j["final_net_worth_rent"] = s.final_net_worth_rent;
    j["total_interest_paid"] = s.total_interest_paid;
    j["total_rent_paid"] = s.total_rent_paid;
    j["total_principal_paid"] = s.total_principal_paid;
    j["initial_outlay"] = s.initial_outlay;
    return j;
}

ordered_json comparison_to_json(const ScenarioComparison& c) {
    ordered_json j;
    j["preferred"] = to_string(c.preferred);
    j["net_worth_difference"] = c.net_worth_difference;
    if (c.breakeven_year) {
        j["breakeven_year"] = *c.breakeven_year;
    } else {
        j["breakeven_year"] = nullptr;
    }
    j["buy_leads_at_end"] = c.buy_leads_at_end;
    return j;
}

ordered_json yearly_to_json(const YearlyRecord& y) {
    ordered_json j;
    j["year"] = y.year;
    j["home_value"] = y.home_value;
    j["mortgage_balance"] = y.mortgage_balance;
    j["equity"] = y.equity;
    j["buy_cash_flow"] = y.buy_cash_flow;
    j["buy_portfolio"] = y.buy_portfolio;
    j["buy_net_worth"] = y.buy_net_worth;
    j["yearly_interest_paid"] = y.yearly_interest_paid;
    j["yearly_principal_paid"] = y.yearly_principal_paid;
    j["rent_cost"] = y.rent_cost;
    j["yearly_rent_paid"] = y.yearly_rent_paid;
    j["rent_portfolio"] = y.rent_portfolio;
    j["rent_net_worth"] = y.rent_net_worth;
    return j;
}

ordered_json monthly_to_json(const MonthlyRecord& m) {
    ordered_json j;
    j["month"] = m.month;
    j["interest_paid"] = m.interest_paid;
    j["principal_paid"] = m.principal_paid;
    j["balance"] = m.balance;
    j["primary_balance"] = m.primary_balance;
    j["secondary_balance"] = m.secondary_balance;
    j["subsidized_balance"] = m.subsidized_balance;
    j["net_buy_cost"] = m.net_buy_cost;
    j["rent_cost"] = m.rent_cost;
    j["budget"] = m.budget;
    j["extra_principal_secondary"] = m.extra_principal_secondary;
    j["extra_principal_primary"] = m.extra_principal_primary;
    j["buy_contribution"] = m.buy_contribution;
    j["rent_contribution"] = m.rent_contribution;
    return j;
}

} // anonymous namespace

ordered_json simulation_result_to_json(const SimulationResult& result,
                                       const SimulationParams& params,
                                       const JsonWriteOptions& options) {
    ordered_json doc;

    if (options.include_parameters) {
        doc["parameters"] = params_to_json(params);
    }

    doc["summary"] = summary_to_json(result.summary);
    doc["comparison"] = comparison_to_json(compare_scenarios(result));

    ordered_json yearly = ordered_json::array();
    for (const auto& y : result.yearly) {
        yearly.push_back(yearly_to_json(y));
    }
    doc["yearly"] = std::move(yearly);

    if (options.include_monthly) {
        ordered_json monthly = ordered_json::array();
        for (const auto& m : result.monthly) {
            monthly.push_back(monthly_to_json(m));
        }
        doc["monthly"] = std::move(monthly);
    }

    return doc;
}

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  const SimulationParams& params,
                                  const JsonWriteOptions& options) {
    const ordered_json doc = simulation_result_to_json(result, params, options);
    os << doc.dump(options.pretty_print ? 2 : -1) << "\n";
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  const SimulationParams& params,
                                  const JsonWriteOptions& options) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_simulation_result_json(file, result, params, options);
}

} // namespace io
} // namespace homecalc
