#ifndef HOMECALC_PARAMS_HPP
#define HOMECALC_PARAMS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace homecalc {

// How the monthly housing budget is set
enum class BudgetStrategy {
    AutoMatch = 0,      // Budget = max(net buy cost, rent cost) every month
    SalaryBased = 1     // Budget = salary * housing allocation percent
};

std::string to_string(BudgetStrategy strategy);

// Accepts "auto_match" or "salary_based"; throws std::invalid_argument otherwise
BudgetStrategy parse_budget_strategy(const std::string& value);

// One debt instrument as configured by the user
struct LoanTerms {
    double amount;          // Principal (primary mortgage: 0 means derive from residual)
    double interest_rate;   // Annual nominal rate in percent
    int term_years;         // Amortization term

    LoanTerms();
    LoanTerms(double amount_value, double rate_percent, int term);
};

// Thrown by the config layer when a parameter record fails validation
class ParamsValidationError : public std::runtime_error {
public:
    explicit ParamsValidationError(const std::vector<std::string>& errors);

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;
};

// Input record for one rent-vs-buy run. All rates are annual percentages.
// The default constructor yields the reference configuration.
struct SimulationParams {
    // General
    int years;
    double investment_return_rate;
    double inflation_rate;
    double capital_gains_tax_rate;

    // Budget strategy
    BudgetStrategy budget_strategy;
    double monthly_salary;
    double salary_growth_rate;
    double housing_budget_percent;
    double housing_budget_percent_annual_increase;  // Percentage points per year, capped at 100
    bool pay_down_mortgage_early;                    // Only honoured with SalaryBased

    // Home purchase
    double home_price;
    double down_payment_percent;
    double closing_costs_percent;
    double selling_costs_percent;
    double home_appreciation_rate;
    double property_tax_rate;           // Percent of current home value per year
    double home_insurance_yearly;       // Currency per year, indexed by inflation
    double maintenance_cost_percent;    // Percent of current home value per year
    double marginal_tax_rate;

    // Sub-letting part of the home
    bool rent_out_part;
    double rent_out_income;             // Monthly gross

    // Debt instruments
    LoanTerms mortgage1;
    bool use_mortgage2;
    LoanTerms mortgage2;
    double pmi_monthly;

    bool use_subsidized_loan;
    double subsidized_loan_amount;
    int subsidized_loan_term_years;

    // Rent scenario
    double monthly_rent;
    double rent_insurance_monthly;

    SimulationParams();

    bool uses_salary_budget() const { return budget_strategy == BudgetStrategy::SalaryBased; }

    double down_payment_amount() const;
    double closing_costs_amount() const;
    // Cash needed on day one: down payment plus closing costs
    double initial_outlay() const;
    // max(0, home price - down payment)
    double financed_amount() const;
    // years * 12, capped at MAX_HORIZON_YEARS; 0 for a non-positive horizon
    int total_months() const;

    bool operator==(const SimulationParams& other) const;
};

// Longest horizon accepted by validate_params. total_months() never exceeds it.
constexpr int MAX_HORIZON_YEARS = 100;

// Checks the preconditions the engine relies on: finite, non-negative numbers,
// share-of-a-whole percentages within [0, 100], horizon within bounds.
// Returns one message per violation; an empty vector means the record is valid.
std::vector<std::string> validate_params(const SimulationParams& params);

} // namespace homecalc

#endif // HOMECALC_PARAMS_HPP
