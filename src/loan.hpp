#ifndef HOMECALC_LOAN_HPP
#define HOMECALC_LOAN_HPP

#include "params.hpp"

namespace homecalc {

// Balances below this are treated as fully repaid
constexpr double BALANCE_EPSILON = 0.01;

// Fixed monthly payment of a fully amortizing loan:
//   payment = P * r * (1+r)^n / ((1+r)^n - 1),  r = annual/12, n = years * 12
// A zero rate falls back to straight-line P / n.
// Non-positive principal or term yields 0.
double amortized_payment(double principal, double annual_rate_percent, int term_years);

// Outstanding state of one debt instrument. The payment is fixed at setup.
struct LoanState {
    double balance;
    double payment;
    double annual_rate;     // Percent

    LoanState();
    LoanState(double principal, double annual_rate_percent, int term_years);

    double monthly_rate() const { return annual_rate / 100.0 / 12.0; }
    bool is_active() const { return balance > 0.0; }
};

// Interest/principal split of one month's mandatory payment
struct DebtService {
    double interest;
    double principal;

    DebtService() : interest(0.0), principal(0.0) {}
    DebtService(double interest_value, double principal_value)
        : interest(interest_value), principal(principal_value) {}

    double total() const { return interest + principal; }
};

// The three instruments, stacked by priority.
// Invariant: subsidized + secondary + primary == financed amount at setup.
struct LoanStack {
    LoanState subsidized;   // Zero interest, drawn first
    LoanState secondary;    // Drawn second, capped by what remains
    LoanState primary;      // Absorbs the remainder

    double total_balance() const;
};

// Allocate max(0, price - down payment) across the instruments:
// subsidized first (capped at the residual), secondary next (capped at what
// the subsidized loan left), primary takes the rest. The configured primary
// amount is never used; it is always derived.
LoanStack stack_loans(const SimulationParams& params);

// Mandatory split for the current month. A repaid loan owes nothing; a final
// payment larger than the balance is clamped to the balance. A payment below
// the interest yields negative principal, so the balance grows.
DebtService service_debt(const LoanState& loan);

// Reduce the balance by a principal repayment, snapping to zero below
// BALANCE_EPSILON. The balance never goes negative. Negative principal adds
// to the balance.
void apply_principal(LoanState& loan, double principal);

} // namespace homecalc

#endif // HOMECALC_LOAN_HPP
