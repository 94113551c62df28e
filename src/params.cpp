#include "params.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace homecalc {

// ============================================================================
// BudgetStrategy
// ============================================================================

std::string to_string(BudgetStrategy strategy) {
    switch (strategy) {
        case BudgetStrategy::AutoMatch: return "auto_match";
        case BudgetStrategy::SalaryBased: return "salary_based";
    }
    return "auto_match";
}

BudgetStrategy parse_budget_strategy(const std::string& value) {
    if (value == "auto_match") return BudgetStrategy::AutoMatch;
    if (value == "salary_based") return BudgetStrategy::SalaryBased;
    throw std::invalid_argument("Unknown budget strategy: " + value +
                                " (expected auto_match or salary_based)");
}

// ============================================================================
// LoanTerms
// ============================================================================

LoanTerms::LoanTerms() : amount(0.0), interest_rate(0.0), term_years(0) {}

LoanTerms::LoanTerms(double amount_value, double rate_percent, int term)
    : amount(amount_value), interest_rate(rate_percent), term_years(term) {}

// ============================================================================
// ParamsValidationError
// ============================================================================

namespace {

std::string join_errors(const std::vector<std::string>& errors) {
    std::ostringstream oss;
    oss << "Invalid simulation parameters (" << errors.size() << " error"
        << (errors.size() == 1 ? "" : "s") << ")";
    for (const auto& e : errors) {
        oss << "\n  - " << e;
    }
    return oss.str();
}

} // anonymous namespace

ParamsValidationError::ParamsValidationError(const std::vector<std::string>& errors)
    : std::runtime_error(join_errors(errors)), errors_(errors) {}

// ============================================================================
// SimulationParams
// ============================================================================

SimulationParams::SimulationParams()
    : years(10),
      investment_return_rate(7.0),
      inflation_rate(3.0),
      capital_gains_tax_rate(30.0),
      budget_strategy(BudgetStrategy::AutoMatch),
      monthly_salary(5000.0),
      salary_growth_rate(3.0),
      housing_budget_percent(40.0),
      housing_budget_percent_annual_increase(0.0),
      pay_down_mortgage_early(false),
      home_price(500000.0),
      down_payment_percent(20.0),
      closing_costs_percent(3.0),
      selling_costs_percent(6.0),
      home_appreciation_rate(4.0),
      property_tax_rate(1.2),
      home_insurance_yearly(1200.0),
      maintenance_cost_percent(1.0),
      marginal_tax_rate(25.0),
      rent_out_part(false),
      rent_out_income(800.0),
      mortgage1(0.0, 6.5, 30),
      use_mortgage2(false),
      mortgage2(50000.0, 8.0, 15),
      pmi_monthly(0.0),
      use_subsidized_loan(false),
      subsidized_loan_amount(60000.0),
      subsidized_loan_term_years(20),
      monthly_rent(2500.0),
      rent_insurance_monthly(20.0) {}

double SimulationParams::down_payment_amount() const {
    return home_price * (down_payment_percent / 100.0);
}

double SimulationParams::closing_costs_amount() const {
    return home_price * (closing_costs_percent / 100.0);
}

double SimulationParams::initial_outlay() const {
    return down_payment_amount() + closing_costs_amount();
}

double SimulationParams::financed_amount() const {
    return std::max(0.0, home_price - down_payment_amount());
}

int SimulationParams::total_months() const {
    return years > 0 ? std::min(years, MAX_HORIZON_YEARS) * 12 : 0;
}

namespace {

bool same_terms(const LoanTerms& a, const LoanTerms& b) {
    return a.amount == b.amount &&
           a.interest_rate == b.interest_rate &&
           a.term_years == b.term_years;
}

} // anonymous namespace

bool SimulationParams::operator==(const SimulationParams& other) const {
    return years == other.years &&
           investment_return_rate == other.investment_return_rate &&
           inflation_rate == other.inflation_rate &&
           capital_gains_tax_rate == other.capital_gains_tax_rate &&
           budget_strategy == other.budget_strategy &&
           monthly_salary == other.monthly_salary &&
           salary_growth_rate == other.salary_growth_rate &&
           housing_budget_percent == other.housing_budget_percent &&
           housing_budget_percent_annual_increase == other.housing_budget_percent_annual_increase &&
           pay_down_mortgage_early == other.pay_down_mortgage_early &&
           home_price == other.home_price &&
           down_payment_percent == other.down_payment_percent &&
           closing_costs_percent == other.closing_costs_percent &&
           selling_costs_percent == other.selling_costs_percent &&
           home_appreciation_rate == other.home_appreciation_rate &&
           property_tax_rate == other.property_tax_rate &&
           home_insurance_yearly == other.home_insurance_yearly &&
           maintenance_cost_percent == other.maintenance_cost_percent &&
           marginal_tax_rate == other.marginal_tax_rate &&
           rent_out_part == other.rent_out_part &&
           rent_out_income == other.rent_out_income &&
           same_terms(mortgage1, other.mortgage1) &&
           use_mortgage2 == other.use_mortgage2 &&
           same_terms(mortgage2, other.mortgage2) &&
           pmi_monthly == other.pmi_monthly &&
           use_subsidized_loan == other.use_subsidized_loan &&
           subsidized_loan_amount == other.subsidized_loan_amount &&
           subsidized_loan_term_years == other.subsidized_loan_term_years &&
           monthly_rent == other.monthly_rent &&
           rent_insurance_monthly == other.rent_insurance_monthly;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

void check_amount(std::vector<std::string>& errors, const std::string& name, double value) {
    if (!std::isfinite(value)) {
        errors.push_back(name + " must be a finite number");
    } else if (value < 0.0) {
        errors.push_back(name + " must be non-negative");
    }
}

void check_percent(std::vector<std::string>& errors, const std::string& name, double value) {
    check_amount(errors, name, value);
    if (std::isfinite(value) && value > 100.0) {
        errors.push_back(name + " must not exceed 100");
    }
}

void check_term(std::vector<std::string>& errors, const std::string& name, int value) {
    if (value < 0) {
        errors.push_back(name + " must be non-negative");
    }
}

} // anonymous namespace

std::vector<std::string> validate_params(const SimulationParams& p) {
    std::vector<std::string> errors;

    if (p.years < 0) {
        errors.push_back("years must be non-negative");
    } else if (p.years > MAX_HORIZON_YEARS) {
        errors.push_back("years must not exceed " + std::to_string(MAX_HORIZON_YEARS));
    }

    check_amount(errors, "investment_return_rate", p.investment_return_rate);
    check_amount(errors, "inflation_rate", p.inflation_rate);
    check_percent(errors, "capital_gains_tax_rate", p.capital_gains_tax_rate);

    check_amount(errors, "monthly_salary", p.monthly_salary);
    check_amount(errors, "salary_growth_rate", p.salary_growth_rate);
    check_percent(errors, "housing_budget_percent", p.housing_budget_percent);
    check_amount(errors, "housing_budget_percent_annual_increase",
                 p.housing_budget_percent_annual_increase);

    check_amount(errors, "home_price", p.home_price);
    check_percent(errors, "down_payment_percent", p.down_payment_percent);
    check_percent(errors, "closing_costs_percent", p.closing_costs_percent);
    check_percent(errors, "selling_costs_percent", p.selling_costs_percent);
    check_amount(errors, "home_appreciation_rate", p.home_appreciation_rate);
    check_amount(errors, "property_tax_rate", p.property_tax_rate);
    check_amount(errors, "home_insurance_yearly", p.home_insurance_yearly);
    check_amount(errors, "maintenance_cost_percent", p.maintenance_cost_percent);
    check_percent(errors, "marginal_tax_rate", p.marginal_tax_rate);

    check_amount(errors, "rent_out_income", p.rent_out_income);

    check_amount(errors, "mortgage1.amount", p.mortgage1.amount);
    check_amount(errors, "mortgage1.interest_rate", p.mortgage1.interest_rate);
    check_term(errors, "mortgage1.term_years", p.mortgage1.term_years);
    check_amount(errors, "mortgage2.amount", p.mortgage2.amount);
    check_amount(errors, "mortgage2.interest_rate", p.mortgage2.interest_rate);
    check_term(errors, "mortgage2.term_years", p.mortgage2.term_years);
    check_amount(errors, "pmi_monthly", p.pmi_monthly);

    check_amount(errors, "subsidized_loan_amount", p.subsidized_loan_amount);
    check_term(errors, "subsidized_loan_term_years", p.subsidized_loan_term_years);

    check_amount(errors, "monthly_rent", p.monthly_rent);
    check_amount(errors, "rent_insurance_monthly", p.rent_insurance_monthly);

    return errors;
}

} // namespace homecalc
