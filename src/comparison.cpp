#include "comparison.hpp"
#include <cmath>

namespace homecalc {

std::string to_string(PreferredScenario scenario) {
    switch (scenario) {
        case PreferredScenario::Buy: return "buy";
        case PreferredScenario::Rent: return "rent";
        case PreferredScenario::Tie: return "tie";
    }
    return "tie";
}

ScenarioComparison::ScenarioComparison()
    : preferred(PreferredScenario::Tie),
      net_worth_difference(0.0),
      buy_leads_at_end(false) {}

ScenarioComparison compare_scenarios(const SimulationResult& result) {
    ScenarioComparison cmp;
    if (result.yearly.empty()) {
        return cmp;
    }

    cmp.net_worth_difference =
        result.summary.final_net_worth_buy - result.summary.final_net_worth_rent;

    if (std::abs(cmp.net_worth_difference) < TIE_TOLERANCE) {
        cmp.preferred = PreferredScenario::Tie;
    } else if (cmp.net_worth_difference > 0.0) {
        cmp.preferred = PreferredScenario::Buy;
        cmp.buy_leads_at_end = true;
    } else {
        cmp.preferred = PreferredScenario::Rent;
    }

    for (const auto& year : result.yearly) {
        if (year.buy_net_worth >= year.rent_net_worth) {
            cmp.breakeven_year = year.year;
            break;
        }
    }

    return cmp;
}

} // namespace homecalc
