#include "portfolio.hpp"

namespace homecalc {

Portfolio::Portfolio() : market_value_(0.0), principal_(0.0) {}

Portfolio::Portfolio(double initial_deposit)
    : market_value_(initial_deposit), principal_(initial_deposit) {}

void Portfolio::advance_month(double monthly_rate, double contribution) {
    market_value_ = market_value_ * (1.0 + monthly_rate) + contribution;
    principal_ += contribution;
}

double Portfolio::unrealized_gain() const {
    return market_value_ - principal_;
}

double Portfolio::capital_gains_tax(double rate_percent) const {
    if (market_value_ <= principal_) {
        return 0.0;
    }
    return unrealized_gain() * (rate_percent / 100.0);
}

double Portfolio::after_tax_value(double rate_percent) const {
    return market_value_ - capital_gains_tax(rate_percent);
}

} // namespace homecalc
