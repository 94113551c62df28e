#ifndef HOMECALC_PORTFOLIO_HPP
#define HOMECALC_PORTFOLIO_HPP

namespace homecalc {

// Investment account compounding monthly with signed contributions.
// A negative contribution is a withdrawal that funds a monthly shortfall.
// Contributed principal is tracked so the unrealized gain can be taxed as if
// the account were liquidated at any snapshot.
class Portfolio {
public:
    Portfolio();
    explicit Portfolio(double initial_deposit);

    // Compound one month at monthly_rate, then add the contribution
    void advance_month(double monthly_rate, double contribution);

    double market_value() const { return market_value_; }
    double principal() const { return principal_; }

    // market value - contributed principal (negative when under water)
    double unrealized_gain() const;

    // Tax on the unrealized gain at rate_percent. Losses are not offset: 0 when
    // the account is at or below its principal.
    double capital_gains_tax(double rate_percent) const;

    // Liquidation value net of capital-gains tax
    double after_tax_value(double rate_percent) const;

private:
    double market_value_;
    double principal_;
};

} // namespace homecalc

#endif // HOMECALC_PORTFOLIO_HPP
