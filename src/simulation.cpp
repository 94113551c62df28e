#include "simulation.hpp"
#include "allocation.hpp"
#include "loan.hpp"
#include "portfolio.hpp"
#include <algorithm>
#include <cmath>

namespace homecalc {

// ============================================================================
// Record constructors
// ============================================================================

MonthlyRecord::MonthlyRecord()
    : month(0), interest_paid(0.0), principal_paid(0.0), balance(0.0),
      primary_balance(0.0), secondary_balance(0.0), subsidized_balance(0.0),
      net_buy_cost(0.0), rent_cost(0.0), budget(0.0),
      extra_principal_secondary(0.0), extra_principal_primary(0.0),
      buy_contribution(0.0), rent_contribution(0.0) {}

YearlyRecord::YearlyRecord()
    : year(0), home_value(0.0), mortgage_balance(0.0), equity(0.0),
      buy_cash_flow(0.0), buy_portfolio(0.0), buy_net_worth(0.0),
      yearly_interest_paid(0.0), yearly_principal_paid(0.0),
      rent_cost(0.0), yearly_rent_paid(0.0), rent_portfolio(0.0), rent_net_worth(0.0) {}

SimulationSummary::SimulationSummary()
    : final_net_worth_buy(0.0), final_net_worth_rent(0.0), total_interest_paid(0.0),
      total_rent_paid(0.0), total_principal_paid(0.0), initial_outlay(0.0) {}

double monthly_growth_factor(double annual_rate_percent) {
    return std::pow(1.0 + annual_rate_percent / 100.0, 1.0 / 12.0);
}

// ============================================================================
// Engine
// ============================================================================

namespace {

// Quantities that drift by a fixed monthly multiplier
struct IndexedValues {
    double home_value;
    double rent;
    double rent_insurance;
    double sublet_income;
    double salary;
};

struct GrowthFactors {
    double appreciation;
    double inflation;
    double salary;
};

// Everything decided for one month before any state is advanced
struct MonthFlows {
    DebtService primary;
    DebtService secondary;
    DebtService subsidized;
    double net_buy_cost;
    double rent_cost;
    double budget;
    double extra_secondary;
    double extra_primary;
    double buy_contribution;
    double rent_contribution;
};

MonthFlows compute_month_flows(const SimulationParams& p,
                               const LoanStack& loans,
                               const IndexedValues& idx,
                               double housing_percent,
                               int month) {
    MonthFlows f;

    // Debt service
    f.primary = service_debt(loans.primary);
    f.secondary = service_debt(loans.secondary);
    f.subsidized = service_debt(loans.subsidized);

    // Variable costs key off the start-of-month home value
    const double property_tax = idx.home_value * (p.property_tax_rate / 100.0) / 12.0;
    const double maintenance = idx.home_value * (p.maintenance_cost_percent / 100.0) / 12.0;
    const double insurance = p.home_insurance_yearly *
        std::pow(1.0 + p.inflation_rate / 100.0, (month - 1) / 12.0) / 12.0;

    const double marginal = p.marginal_tax_rate / 100.0;
    const double tax_shield = (f.primary.interest + f.secondary.interest + property_tax) * marginal;

    double net_sublet_income = 0.0;
    if (p.rent_out_part) {
        net_sublet_income = idx.sublet_income - idx.sublet_income * marginal;
    }

    // Fixed amortized payments are charged every month, including the final
    // short month and after a loan is repaid.
    const double debt_payments = loans.primary.payment + loans.secondary.payment +
                                 loans.subsidized.payment;
    const double gross_cost = debt_payments + property_tax + maintenance + insurance + p.pmi_monthly;
    f.net_buy_cost = gross_cost - tax_shield - net_sublet_income;
    f.rent_cost = idx.rent + idx.rent_insurance;

    if (p.uses_salary_budget()) {
        f.budget = idx.salary * (housing_percent / 100.0);
    } else {
        f.budget = std::max(f.net_buy_cost, f.rent_cost);
    }

    // Buy surplus: secondary before primary before the portfolio.
    // The subsidized loan costs nothing, so it is never accelerated.
    const double buy_surplus = f.budget - f.net_buy_cost;
    f.extra_secondary = 0.0;
    f.extra_primary = 0.0;
    f.buy_contribution = buy_surplus;

    if (buy_surplus > 0.0 && p.uses_salary_budget() && p.pay_down_mortgage_early) {
        const std::vector<AllocationTarget> targets = {
            AllocationTarget("secondary", loans.secondary.balance - f.secondary.principal),
            AllocationTarget("primary", loans.primary.balance - f.primary.principal),
        };
        const SurplusAllocation allocation = allocate_in_priority_order(buy_surplus, targets);
        f.extra_secondary = allocation.allocated[0];
        f.extra_primary = allocation.allocated[1];
        f.buy_contribution = allocation.remainder;
    }

    f.rent_contribution = f.budget - f.rent_cost;
    return f;
}

} // anonymous namespace

SimulationResult run_simulation(const SimulationParams& p) {
    SimulationResult result;
    result.summary.initial_outlay = p.initial_outlay();

    const int total_months = p.total_months();
    if (total_months == 0) {
        return result;
    }

    LoanStack loans = stack_loans(p);

    Portfolio buy_portfolio;
    Portfolio rent_portfolio(p.initial_outlay());

    IndexedValues idx;
    idx.home_value = p.home_price;
    idx.rent = p.monthly_rent;
    idx.rent_insurance = p.rent_insurance_monthly;
    idx.sublet_income = p.rent_out_part ? p.rent_out_income : 0.0;
    idx.salary = p.monthly_salary;

    const GrowthFactors growth = {
        monthly_growth_factor(p.home_appreciation_rate),
        monthly_growth_factor(p.inflation_rate),
        monthly_growth_factor(p.salary_growth_rate),
    };
    const double monthly_return = p.investment_return_rate / 100.0 / 12.0;

    double housing_percent = p.housing_budget_percent;

    double total_interest = 0.0;
    double total_principal = 0.0;
    double total_rent = 0.0;
    double year_interest = 0.0;
    double year_principal = 0.0;
    double year_rent = 0.0;

    result.monthly.reserve(static_cast<size_t>(total_months));
    result.yearly.reserve(static_cast<size_t>(total_months / 12));

    for (int month = 1; month <= total_months; ++month) {
        const MonthFlows f = compute_month_flows(p, loans, idx, housing_percent, month);

        // --- Advance loans ---
        const double primary_principal = f.primary.principal + f.extra_primary;
        const double secondary_principal = f.secondary.principal + f.extra_secondary;
        apply_principal(loans.primary, primary_principal);
        apply_principal(loans.secondary, secondary_principal);
        apply_principal(loans.subsidized, f.subsidized.principal);

        const double month_interest = f.primary.interest + f.secondary.interest;
        const double month_principal = primary_principal + secondary_principal + f.subsidized.principal;

        total_interest += month_interest;
        total_principal += month_principal;
        total_rent += idx.rent;
        year_interest += month_interest;
        year_principal += month_principal;
        year_rent += idx.rent;

        // --- Advance portfolios ---
        buy_portfolio.advance_month(monthly_return, f.buy_contribution);
        rent_portfolio.advance_month(monthly_return, f.rent_contribution);

        MonthlyRecord rec;
        rec.month = month;
        rec.interest_paid = month_interest;
        rec.principal_paid = month_principal;
        rec.balance = loans.total_balance();
        rec.primary_balance = loans.primary.balance;
        rec.secondary_balance = loans.secondary.balance;
        rec.subsidized_balance = loans.subsidized.balance;
        rec.net_buy_cost = f.net_buy_cost;
        rec.rent_cost = f.rent_cost;
        rec.budget = f.budget;
        rec.extra_principal_secondary = f.extra_secondary;
        rec.extra_principal_primary = f.extra_primary;
        rec.buy_contribution = f.buy_contribution;
        rec.rent_contribution = f.rent_contribution;
        result.monthly.push_back(rec);

        // --- Index values for next month ---
        idx.home_value *= growth.appreciation;
        idx.rent *= growth.inflation;
        idx.rent_insurance *= growth.inflation;
        idx.sublet_income *= growth.inflation;
        idx.salary *= growth.salary;

        if (month % 12 != 0) {
            continue;
        }

        // --- Year-end snapshot ---
        if (p.housing_budget_percent_annual_increase != 0.0) {
            housing_percent = std::min(100.0, housing_percent + p.housing_budget_percent_annual_increase);
        }

        const double debt = loans.total_balance();
        const double selling_costs = idx.home_value * (p.selling_costs_percent / 100.0);
        const double buy_after_tax = buy_portfolio.after_tax_value(p.capital_gains_tax_rate);
        const double rent_after_tax = rent_portfolio.after_tax_value(p.capital_gains_tax_rate);

        YearlyRecord yr;
        yr.year = month / 12;
        yr.home_value = idx.home_value;
        yr.mortgage_balance = debt;
        yr.equity = idx.home_value - debt;
        yr.buy_cash_flow = f.net_buy_cost + f.extra_primary + f.extra_secondary;
        yr.buy_portfolio = buy_after_tax;
        yr.buy_net_worth = (idx.home_value - debt - selling_costs) + buy_after_tax;
        yr.yearly_interest_paid = year_interest;
        yr.yearly_principal_paid = year_principal;
        yr.rent_cost = f.rent_cost;
        yr.yearly_rent_paid = year_rent;
        yr.rent_portfolio = rent_after_tax;
        yr.rent_net_worth = rent_after_tax;
        result.yearly.push_back(yr);

        year_interest = 0.0;
        year_principal = 0.0;
        year_rent = 0.0;
    }

    result.summary.total_interest_paid = total_interest;
    result.summary.total_principal_paid = total_principal;
    result.summary.total_rent_paid = total_rent;
    if (!result.yearly.empty()) {
        result.summary.final_net_worth_buy = result.yearly.back().buy_net_worth;
        result.summary.final_net_worth_rent = result.yearly.back().rent_net_worth;
    }

    return result;
}

} // namespace homecalc
