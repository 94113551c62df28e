#ifndef HOMECALC_COMPARISON_HPP
#define HOMECALC_COMPARISON_HPP

#include "simulation.hpp"
#include <optional>
#include <string>

namespace homecalc {

enum class PreferredScenario {
    Buy,
    Rent,
    Tie
};

std::string to_string(PreferredScenario scenario);

// Final net worth differences below this count as a tie
constexpr double TIE_TOLERANCE = 0.01;

// Head-to-head reading of a finished simulation
struct ScenarioComparison {
    PreferredScenario preferred;
    double net_worth_difference;        // Final buy - final rent
    std::optional<int> breakeven_year;  // First year buying is at least as good
    bool buy_leads_at_end;

    ScenarioComparison();
};

// Derived from the yearly series and summary only; an empty result is a tie
// with no breakeven year.
ScenarioComparison compare_scenarios(const SimulationResult& result);

} // namespace homecalc

#endif // HOMECALC_COMPARISON_HPP
