#ifndef HOMECALC_SIMULATION_HPP
#define HOMECALC_SIMULATION_HPP

#include "params.hpp"
#include <vector>

namespace homecalc {

// One simulated month (1-based)
struct MonthlyRecord {
    int month;
    double interest_paid;               // Primary + secondary interest
    double principal_paid;              // Mandatory + accelerated, all three loans
    double balance;                     // Aggregate loan balance after this month

    // Per-instrument balances after this month
    double primary_balance;
    double secondary_balance;
    double subsidized_balance;

    // Cash-flow detail
    double net_buy_cost;                // Mandatory outflow net of tax shield and sub-let income
    double rent_cost;                   // Rent + renter's insurance
    double budget;                      // Spending ceiling applied to both scenarios
    double extra_principal_secondary;
    double extra_principal_primary;
    double buy_contribution;            // Signed flow into the buy-side portfolio
    double rent_contribution;           // Signed flow into the rent-side portfolio

    MonthlyRecord();
};

// Snapshot taken at the end of each simulated year (1-based)
struct YearlyRecord {
    int year;

    // Buy scenario
    double home_value;
    double mortgage_balance;            // All three loans
    double equity;                      // home_value - mortgage_balance
    double buy_cash_flow;               // Net buy cost + extra principal, last month of the year
    double buy_portfolio;               // After capital-gains tax
    double buy_net_worth;               // Equity - selling costs + buy_portfolio
    double yearly_interest_paid;
    double yearly_principal_paid;

    // Rent scenario
    double rent_cost;                   // Rent + insurance, last month of the year
    double yearly_rent_paid;            // Rent paid over the year
    double rent_portfolio;              // After capital-gains tax
    double rent_net_worth;

    YearlyRecord();
};

struct SimulationSummary {
    double final_net_worth_buy;
    double final_net_worth_rent;
    double total_interest_paid;
    double total_rent_paid;
    double total_principal_paid;
    double initial_outlay;              // Down payment + closing costs

    SimulationSummary();
};

struct SimulationResult {
    std::vector<MonthlyRecord> monthly;
    std::vector<YearlyRecord> yearly;
    SimulationSummary summary;
};

// Run the rent-vs-buy projection month by month over params.years.
//
// Each month:
//   1. Split the mandatory payment of every active loan into interest/principal
//   2. Net housing costs: payments + property tax + maintenance + insurance + PMI,
//      less the tax shield on interest and property tax, less net sub-let income
//   3. Set the budget (salary share, or the higher of the two scenario costs)
//      and route the buy surplus: extra principal on secondary then primary
//      (salary budget with early paydown only), the rest to the buy portfolio.
//      The rent surplus always goes to the rent portfolio.
//   4. Advance balances, compound both portfolios and index home value, rent,
//      insurance, sub-let income and salary
// Every 12th month a tax-adjusted net worth snapshot is recorded.
//
// Variable costs use the home value at the start of the month. The function is
// pure: identical params always produce an identical result. A horizon of zero
// or less produces empty series and a summary holding only the initial outlay.
SimulationResult run_simulation(const SimulationParams& params);

// Monthly multiplier equivalent to an annual rate in percent: (1 + r)^(1/12)
double monthly_growth_factor(double annual_rate_percent);

} // namespace homecalc

#endif // HOMECALC_SIMULATION_HPP
