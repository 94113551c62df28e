#include "loan.hpp"
#include <algorithm>
#include <cmath>

namespace homecalc {

double amortized_payment(double principal, double annual_rate_percent, int term_years) {
    if (principal <= 0.0 || term_years <= 0) {
        return 0.0;
    }

    const int num_payments = term_years * 12;
    if (annual_rate_percent == 0.0) {
        return principal / num_payments;
    }

    const double r = annual_rate_percent / 100.0 / 12.0;
    const double growth = std::pow(1.0 + r, num_payments);
    return principal * r * growth / (growth - 1.0);
}

// ============================================================================
// LoanState
// ============================================================================

LoanState::LoanState() : balance(0.0), payment(0.0), annual_rate(0.0) {}

LoanState::LoanState(double principal, double annual_rate_percent, int term_years)
    : balance(std::max(0.0, principal)),
      payment(amortized_payment(principal, annual_rate_percent, term_years)),
      annual_rate(annual_rate_percent) {}

double LoanStack::total_balance() const {
    return subsidized.balance + secondary.balance + primary.balance;
}

// ============================================================================
// Loan stacking
// ============================================================================

LoanStack stack_loans(const SimulationParams& params) {
    const double residual = params.financed_amount();

    double subsidized_amount = params.use_subsidized_loan ? params.subsidized_loan_amount : 0.0;
    subsidized_amount = std::clamp(subsidized_amount, 0.0, residual);

    double secondary_amount = params.use_mortgage2 ? params.mortgage2.amount : 0.0;
    secondary_amount = std::clamp(secondary_amount, 0.0, residual - subsidized_amount);

    const double primary_amount = std::max(0.0, residual - subsidized_amount - secondary_amount);

    LoanStack stack;
    stack.subsidized = LoanState(subsidized_amount, 0.0, params.subsidized_loan_term_years);
    stack.secondary = LoanState(secondary_amount, params.mortgage2.interest_rate,
                                params.mortgage2.term_years);
    stack.primary = LoanState(primary_amount, params.mortgage1.interest_rate,
                              params.mortgage1.term_years);
    return stack;
}

// ============================================================================
// Monthly debt service
// ============================================================================

DebtService service_debt(const LoanState& loan) {
    if (!loan.is_active()) {
        return DebtService();
    }

    const double interest = loan.balance * loan.monthly_rate();
    // A payment below the interest (zero-term loan) amortizes negatively
    double principal = loan.payment - interest;

    // Final payment
    if (principal > loan.balance) {
        principal = loan.balance;
    }
    return DebtService(interest, principal);
}

void apply_principal(LoanState& loan, double principal) {
    loan.balance -= principal;
    if (loan.balance < BALANCE_EPSILON) {
        loan.balance = 0.0;
    }
}

} // namespace homecalc
