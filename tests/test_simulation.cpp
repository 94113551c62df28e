#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/simulation.hpp"
#include "../src/loan.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using namespace homecalc;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

namespace {

// Static world: no growth anywhere, interest-free primary mortgage
SimulationParams make_flat_params() {
    SimulationParams p;
    p.years = 10;
    p.investment_return_rate = 0.0;
    p.inflation_rate = 0.0;
    p.capital_gains_tax_rate = 0.0;
    p.budget_strategy = BudgetStrategy::AutoMatch;
    p.salary_growth_rate = 0.0;
    p.home_price = 300000.0;
    p.down_payment_percent = 20.0;
    p.closing_costs_percent = 3.0;
    p.selling_costs_percent = 6.0;
    p.home_appreciation_rate = 0.0;
    p.property_tax_rate = 1.2;
    p.home_insurance_yearly = 1200.0;
    p.maintenance_cost_percent = 1.0;
    p.marginal_tax_rate = 0.0;
    p.mortgage1 = LoanTerms(0.0, 0.0, 30);
    p.monthly_rent = 2500.0;
    p.rent_insurance_monthly = 20.0;
    return p;
}

// Large salary budget with a small secondary mortgage
SimulationParams make_paydown_params() {
    SimulationParams p;
    p.years = 10;
    p.budget_strategy = BudgetStrategy::SalaryBased;
    p.monthly_salary = 10000.0;
    p.housing_budget_percent = 40.0;
    p.pay_down_mortgage_early = true;
    p.home_price = 200000.0;
    p.down_payment_percent = 20.0;
    p.mortgage1 = LoanTerms(0.0, 5.0, 30);
    p.use_mortgage2 = true;
    p.mortgage2 = LoanTerms(1000.0, 5.0, 10);
    return p;
}

} // anonymous namespace

// ============================================================================
// Shape
// ============================================================================

TEST_CASE("Simulation produces one record per month and per year", "[simulation]") {
    SimulationParams p;
    p.years = 7;

    SimulationResult result = run_simulation(p);

    REQUIRE(result.monthly.size() == 84);
    REQUIRE(result.yearly.size() == 7);
    for (size_t i = 0; i < result.monthly.size(); ++i) {
        REQUIRE(result.monthly[i].month == static_cast<int>(i) + 1);
    }
    for (size_t i = 0; i < result.yearly.size(); ++i) {
        REQUIRE(result.yearly[i].year == static_cast<int>(i) + 1);
    }
}

TEST_CASE("Zero horizon yields empty series", "[simulation][edge]") {
    SimulationParams p;
    p.years = 0;

    SimulationResult result = run_simulation(p);

    REQUIRE(result.monthly.empty());
    REQUIRE(result.yearly.empty());
    REQUIRE(result.summary.final_net_worth_buy == 0.0);
    REQUIRE(result.summary.final_net_worth_rent == 0.0);
    REQUIRE(result.summary.total_interest_paid == 0.0);
    REQUIRE(result.summary.total_principal_paid == 0.0);
    REQUIRE(result.summary.total_rent_paid == 0.0);
    REQUIRE(result.summary.initial_outlay == Approx(p.initial_outlay()));
}

TEST_CASE("Simulation is deterministic", "[simulation]") {
    SimulationParams p;
    p.use_mortgage2 = true;
    p.use_subsidized_loan = true;

    SimulationResult a = run_simulation(p);
    SimulationResult b = run_simulation(p);

    REQUIRE(a.monthly.size() == b.monthly.size());
    for (size_t i = 0; i < a.monthly.size(); ++i) {
        REQUIRE(a.monthly[i].balance == b.monthly[i].balance);
        REQUIRE(a.monthly[i].net_buy_cost == b.monthly[i].net_buy_cost);
        REQUIRE(a.monthly[i].buy_contribution == b.monthly[i].buy_contribution);
        REQUIRE(a.monthly[i].rent_contribution == b.monthly[i].rent_contribution);
    }
    REQUIRE(a.summary.final_net_worth_buy == b.summary.final_net_worth_buy);
    REQUIRE(a.summary.final_net_worth_rent == b.summary.final_net_worth_rent);
}

TEST_CASE("monthly_growth_factor compounds to the annual rate", "[simulation]") {
    REQUIRE(monthly_growth_factor(0.0) == 1.0);
    REQUIRE(std::pow(monthly_growth_factor(4.0), 12) == Approx(1.04));
    REQUIRE(std::pow(monthly_growth_factor(12.0), 12) == Approx(1.12));
}

// ============================================================================
// Loan balances
// ============================================================================

TEST_CASE("Opening balance equals the financed amount", "[simulation][loan]") {
    SimulationParams p;
    p.use_mortgage2 = true;
    p.use_subsidized_loan = true;

    SimulationResult result = run_simulation(p);
    const MonthlyRecord& first = result.monthly.front();

    REQUIRE(first.balance + first.principal_paid == Approx(p.financed_amount()));
    REQUIRE(first.primary_balance + first.secondary_balance + first.subsidized_balance ==
            Approx(first.balance));
}

TEST_CASE("Principal paid reconciles with the balance drop", "[simulation][loan]") {
    SimulationParams p = make_paydown_params();
    p.use_subsidized_loan = true;
    p.subsidized_loan_amount = 20000.0;

    SimulationResult result = run_simulation(p);

    double principal_sum = 0.0;
    for (const auto& m : result.monthly) {
        principal_sum += m.principal_paid;
    }

    const double final_balance = result.monthly.back().balance;
    REQUIRE_THAT(principal_sum, WithinAbs(p.financed_amount() - final_balance, 0.05));
    REQUIRE(result.summary.total_principal_paid == Approx(principal_sum));

    double yearly_sum = 0.0;
    for (const auto& y : result.yearly) {
        yearly_sum += y.yearly_principal_paid;
    }
    REQUIRE(yearly_sum == Approx(principal_sum));
}

TEST_CASE("Balances never increase and never go negative", "[simulation][loan]") {
    SimulationParams p;
    p.years = 30;
    p.use_mortgage2 = true;
    p.use_subsidized_loan = true;

    SimulationResult result = run_simulation(p);

    double previous = p.financed_amount();
    for (const auto& m : result.monthly) {
        REQUIRE(m.balance <= previous + 1e-9);
        REQUIRE(m.primary_balance >= 0.0);
        REQUIRE(m.secondary_balance >= 0.0);
        REQUIRE(m.subsidized_balance >= 0.0);
        previous = m.balance;
    }

    // 30-year primary, shorter secondary and subsidized loans: all retired at the horizon
    REQUIRE(result.monthly.back().balance == 0.0);
}

TEST_CASE("Equity grows every year when the home does not depreciate", "[simulation]") {
    SimulationParams p;
    p.years = 15;

    SimulationResult result = run_simulation(p);

    for (size_t i = 1; i < result.yearly.size(); ++i) {
        REQUIRE(result.yearly[i].equity > result.yearly[i - 1].equity);
    }
    for (const auto& y : result.yearly) {
        REQUIRE(y.equity == Approx(y.home_value - y.mortgage_balance));
    }
}

// ============================================================================
// Static world
// ============================================================================

TEST_CASE("Interest-free loan in a static world", "[simulation][static]") {
    SimulationParams p = make_flat_params();
    SimulationResult result = run_simulation(p);

    const double payment = 240000.0 / 360.0;
    const double expected_net_cost = payment + 300.0 + 250.0 + 100.0;

    SECTION("Every month repays a fixed slice with no interest") {
        for (const auto& m : result.monthly) {
            REQUIRE(m.interest_paid == 0.0);
            REQUIRE(m.principal_paid == Approx(payment));
            REQUIRE(m.net_buy_cost == Approx(expected_net_cost));
            REQUIRE(m.rent_cost == Approx(2520.0));
            REQUIRE(m.budget == Approx(2520.0));
            REQUIRE(m.buy_contribution == Approx(2520.0 - expected_net_cost));
            REQUIRE(m.rent_contribution == Approx(0.0).margin(1e-9));
        }
    }

    SECTION("Final year snapshot") {
        const YearlyRecord& last = result.yearly.back();
        REQUIRE(last.home_value == Approx(300000.0));
        REQUIRE(last.mortgage_balance == Approx(160000.0));
        REQUIRE(last.equity == Approx(140000.0));
        REQUIRE(last.buy_portfolio == Approx(120.0 * (2520.0 - expected_net_cost)));
        REQUIRE(last.buy_net_worth == Approx(140000.0 - 18000.0 + 120.0 * (2520.0 - expected_net_cost)));

        // Renter keeps the down payment and closing costs invested, at zero return
        REQUIRE(last.rent_portfolio == Approx(69000.0));
        REQUIRE(last.rent_net_worth == Approx(69000.0));
    }

    SECTION("Summary totals") {
        REQUIRE(result.summary.total_interest_paid == 0.0);
        REQUIRE(result.summary.total_principal_paid == Approx(80000.0));
        REQUIRE(result.summary.total_rent_paid == Approx(300000.0));
        REQUIRE(result.summary.initial_outlay == Approx(69000.0));
        REQUIRE(result.summary.final_net_worth_rent == Approx(69000.0));
        REQUIRE(result.yearly.front().yearly_rent_paid == Approx(30000.0));
    }
}

TEST_CASE("Early paydown has no effect with the auto-match budget", "[simulation][budget]") {
    SimulationParams p = make_flat_params();
    p.pay_down_mortgage_early = true;

    SimulationResult with = run_simulation(p);
    p.pay_down_mortgage_early = false;
    SimulationResult without = run_simulation(p);

    for (size_t i = 0; i < with.monthly.size(); ++i) {
        REQUIRE(with.monthly[i].extra_principal_primary == 0.0);
        REQUIRE(with.monthly[i].extra_principal_secondary == 0.0);
        REQUIRE(with.monthly[i].balance == without.monthly[i].balance);
    }
    REQUIRE(with.summary.final_net_worth_buy == without.summary.final_net_worth_buy);
}

// ============================================================================
// Cost components
// ============================================================================

TEST_CASE("Home insurance is indexed to inflation by elapsed months", "[simulation][costs]") {
    SimulationParams p = make_flat_params();
    p.inflation_rate = 12.0;
    p.down_payment_percent = 100.0;
    p.property_tax_rate = 0.0;
    p.maintenance_cost_percent = 0.0;

    SimulationResult result = run_simulation(p);

    REQUIRE(result.monthly[0].net_buy_cost == Approx(100.0));
    REQUIRE(result.monthly[6].net_buy_cost == Approx(100.0 * std::sqrt(1.12)));
    REQUIRE(result.monthly[12].net_buy_cost == Approx(112.0));
    REQUIRE(result.monthly[24].net_buy_cost == Approx(100.0 * 1.12 * 1.12));
}

TEST_CASE("Rent is indexed monthly to inflation", "[simulation][costs]") {
    SimulationParams p = make_flat_params();
    p.inflation_rate = 12.0;

    SimulationResult result = run_simulation(p);

    REQUIRE(result.monthly[0].rent_cost == Approx(2520.0));
    REQUIRE(result.monthly[12].rent_cost == Approx(2520.0 * 1.12));
    REQUIRE(result.yearly[0].rent_cost == Approx(2520.0 * std::pow(monthly_growth_factor(12.0), 11)));
}

TEST_CASE("Tax shield covers interest and property tax", "[simulation][costs]") {
    SimulationParams p = make_flat_params();
    p.mortgage1 = LoanTerms(0.0, 6.0, 30);

    SimulationResult untaxed = run_simulation(p);
    p.marginal_tax_rate = 25.0;
    SimulationResult taxed = run_simulation(p);

    const double first_interest = 240000.0 * 0.06 / 12.0;
    REQUIRE(taxed.monthly[0].interest_paid == Approx(first_interest));
    REQUIRE(untaxed.monthly[0].net_buy_cost - taxed.monthly[0].net_buy_cost ==
            Approx((first_interest + 300.0) * 0.25));
}

TEST_CASE("Sub-let income is netted of tax", "[simulation][costs]") {
    SimulationParams p = make_flat_params();
    p.marginal_tax_rate = 25.0;

    SimulationResult base = run_simulation(p);
    p.rent_out_part = true;
    p.rent_out_income = 800.0;
    SimulationResult sublet = run_simulation(p);

    REQUIRE(base.monthly[0].net_buy_cost - sublet.monthly[0].net_buy_cost == Approx(600.0));
}

TEST_CASE("PMI is added to the buy cost", "[simulation][costs]") {
    SimulationParams p = make_flat_params();

    SimulationResult base = run_simulation(p);
    p.pmi_monthly = 85.0;
    SimulationResult with_pmi = run_simulation(p);

    REQUIRE(with_pmi.monthly[0].net_buy_cost - base.monthly[0].net_buy_cost == Approx(85.0));
}

// ============================================================================
// Budget
// ============================================================================

TEST_CASE("Housing budget share steps up yearly and caps at 100", "[simulation][budget]") {
    SimulationParams p = make_flat_params();
    p.years = 5;
    p.budget_strategy = BudgetStrategy::SalaryBased;
    p.monthly_salary = 5000.0;
    p.housing_budget_percent = 40.0;
    p.housing_budget_percent_annual_increase = 30.0;

    SimulationResult result = run_simulation(p);

    REQUIRE(result.monthly[0].budget == Approx(2000.0));
    REQUIRE(result.monthly[11].budget == Approx(2000.0));
    REQUIRE(result.monthly[12].budget == Approx(3500.0));
    REQUIRE(result.monthly[24].budget == Approx(5000.0));
    REQUIRE(result.monthly[36].budget == Approx(5000.0));
}

TEST_CASE("Salary budget shortfall is withdrawn from the portfolios", "[simulation][budget]") {
    SimulationParams p = make_flat_params();
    p.budget_strategy = BudgetStrategy::SalaryBased;
    p.monthly_salary = 2000.0;
    p.housing_budget_percent = 50.0;  // 1000 budget, below both scenario costs

    SimulationResult result = run_simulation(p);
    const MonthlyRecord& first = result.monthly.front();

    REQUIRE(first.budget == Approx(1000.0));
    REQUIRE(first.buy_contribution == Approx(1000.0 - first.net_buy_cost));
    REQUIRE(first.buy_contribution < 0.0);
    REQUIRE(first.rent_contribution == Approx(1000.0 - 2520.0));
}

TEST_CASE("Surplus retires the secondary mortgage before the primary", "[simulation][paydown]") {
    SimulationParams p = make_paydown_params();
    SimulationResult result = run_simulation(p);

    const MonthlyRecord& first = result.monthly.front();
    REQUIRE(first.extra_principal_secondary > 0.0);
    REQUIRE(first.secondary_balance == 0.0);
    REQUIRE(first.extra_principal_primary > 0.0);
    REQUIRE_THAT(first.buy_contribution, WithinAbs(0.0, 1e-9));

    SECTION("Nothing reaches the portfolio while debt remains") {
        for (const auto& m : result.monthly) {
            if (m.balance > 0.0) {
                REQUIRE_THAT(m.buy_contribution, WithinAbs(0.0, 1e-9));
            }
        }
    }

    SECTION("Once debt-free, interest stops but the fixed payments are still charged") {
        const LoanStack loans = stack_loans(p);
        const double fixed_payments = loans.primary.payment + loans.secondary.payment;

        auto paid_off = std::find_if(result.monthly.begin(), result.monthly.end(),
                                     [](const MonthlyRecord& m) { return m.balance == 0.0; });
        REQUIRE(paid_off != result.monthly.end());

        for (auto it = paid_off + 1; it != result.monthly.end(); ++it) {
            REQUIRE(it->interest_paid == 0.0);
            REQUIRE(it->principal_paid == 0.0);
            REQUIRE(it->extra_principal_primary == 0.0);
            REQUIRE(it->net_buy_cost > fixed_payments);
            REQUIRE(it->buy_contribution > 0.0);
            REQUIRE(it->buy_contribution == Approx(it->budget - it->net_buy_cost));
        }
        REQUIRE(result.yearly.back().buy_portfolio > 0.0);
    }
}

TEST_CASE("Early paydown lowers total interest", "[simulation][paydown]") {
    SimulationParams p = make_paydown_params();

    SimulationResult accelerated = run_simulation(p);
    p.pay_down_mortgage_early = false;
    SimulationResult scheduled = run_simulation(p);

    REQUIRE(accelerated.summary.total_interest_paid < scheduled.summary.total_interest_paid);
    REQUIRE(accelerated.monthly.back().balance < scheduled.monthly.back().balance);
}

// ============================================================================
// Capital-gains tax
// ============================================================================

TEST_CASE("Capital-gains tax is levied on unrealized gains at each snapshot", "[simulation][tax]") {
    SimulationParams p;
    p.years = 12;
    p.capital_gains_tax_rate = 0.0;

    SimulationResult untaxed = run_simulation(p);
    p.capital_gains_tax_rate = 30.0;
    SimulationResult taxed = run_simulation(p);

    // Cash flows do not depend on the tax rate
    double rent_principal = p.initial_outlay();
    double buy_principal = 0.0;
    for (int m = 0; m < 12 * p.years; ++m) {
        REQUIRE(taxed.monthly[m].rent_contribution == untaxed.monthly[m].rent_contribution);
        rent_principal += taxed.monthly[m].rent_contribution;
        buy_principal += taxed.monthly[m].buy_contribution;
    }

    const YearlyRecord& gross = untaxed.yearly.back();
    const YearlyRecord& net = taxed.yearly.back();

    const double rent_gain = gross.rent_portfolio - rent_principal;
    REQUIRE(rent_gain > 0.0);
    REQUIRE(net.rent_portfolio == Approx(gross.rent_portfolio - rent_gain * 0.30));
    REQUIRE(net.rent_net_worth == Approx(net.rent_portfolio));

    const double buy_gain = gross.buy_portfolio - buy_principal;
    if (buy_gain > 0.0) {
        REQUIRE(net.buy_portfolio == Approx(gross.buy_portfolio - buy_gain * 0.30));
    } else {
        REQUIRE(net.buy_portfolio == Approx(gross.buy_portfolio));
    }

    // Home equity is not subject to the portfolio tax
    REQUIRE(net.buy_net_worth - net.buy_portfolio == Approx(gross.buy_net_worth - gross.buy_portfolio));
}

TEST_CASE("Buy net worth deducts selling costs", "[simulation]") {
    SimulationParams p;
    SimulationResult result = run_simulation(p);

    for (const auto& y : result.yearly) {
        const double selling = y.home_value * 0.06;
        REQUIRE(y.buy_net_worth == Approx(y.equity - selling + y.buy_portfolio));
    }
}

TEST_CASE("Equity never falls in a static world while debt remains", "[simulation][static]") {
    SimulationParams p = make_flat_params();
    p.use_mortgage2 = true;
    p.mortgage2 = LoanTerms(30000.0, 0.0, 5);
    p.years = 12;

    SimulationResult result = run_simulation(p);

    for (size_t i = 1; i < result.yearly.size(); ++i) {
        REQUIRE(result.yearly[i].equity >= result.yearly[i - 1].equity);
    }
}

TEST_CASE("A retired secondary mortgage keeps its payment in the buy cost", "[simulation][static]") {
    SimulationParams p = make_flat_params();
    p.use_mortgage2 = true;
    p.mortgage2 = LoanTerms(30000.0, 0.0, 5);  // 500 per month for 60 months
    p.years = 12;

    SimulationResult result = run_simulation(p);

    const double primary_payment = 210000.0 / 360.0;
    const double expected_net_cost = primary_payment + 500.0 + 300.0 + 250.0 + 100.0;

    const MonthlyRecord& first = result.monthly[0];
    const MonthlyRecord& last_secondary = result.monthly[59];
    const MonthlyRecord& after = result.monthly[60];

    REQUIRE(result.monthly[58].secondary_balance == Approx(500.0));
    REQUIRE(last_secondary.secondary_balance == 0.0);
    REQUIRE(after.principal_paid == Approx(primary_payment));

    REQUIRE(first.net_buy_cost == Approx(expected_net_cost));
    REQUIRE(last_secondary.net_buy_cost == Approx(expected_net_cost));
    REQUIRE(after.net_buy_cost == Approx(expected_net_cost));
    REQUIRE(result.monthly.back().net_buy_cost == Approx(expected_net_cost));
    REQUIRE(after.buy_contribution == Approx(first.buy_contribution));
}

// ============================================================================
// Reference values
// ============================================================================

TEST_CASE("Reference parameters reproduce known final net worth", "[simulation][reference]") {
    SimulationParams p;

    SECTION("Ten years, no loan retired inside the horizon") {
        SimulationResult result = run_simulation(p);
        REQUIRE_THAT(result.summary.final_net_worth_buy, WithinAbs(356624.92, 0.05));
        REQUIRE_THAT(result.summary.final_net_worth_rent, WithinAbs(226950.65, 0.05));
    }

    SECTION("Twenty years with the secondary mortgage retired in year fifteen") {
        p.years = 20;
        p.use_mortgage2 = true;

        SimulationResult result = run_simulation(p);
        REQUIRE(result.monthly[179].secondary_balance == 0.0);
        REQUIRE_THAT(result.summary.final_net_worth_buy, WithinAbs(841654.47, 0.05));
        REQUIRE_THAT(result.summary.final_net_worth_rent, WithinAbs(467141.19, 0.05));
    }
}

TEST_CASE("Horizon is capped at the longest supported length", "[simulation][edge]") {
    SimulationParams p;
    p.years = std::numeric_limits<int>::max();

    SimulationResult result = run_simulation(p);

    REQUIRE(result.monthly.size() == static_cast<size_t>(MAX_HORIZON_YEARS * 12));
    REQUIRE(result.yearly.size() == static_cast<size_t>(MAX_HORIZON_YEARS));
    REQUIRE(result.yearly.back().year == MAX_HORIZON_YEARS);
}
