#include <qp/instruments/equity_future.hpp>
#include <qp/core/errors.hpp>

#include <cmath>

namespace qp {
namespace instruments {

EquityFuture::EquityFuture(double spot, double rate, double dividend_yield, double maturity)
  : spot_(spot), rate_(rate), dividend_yield_(dividend_yield), maturity_(maturity) {
  if (!(spot_ > 0.0)) {
    throw core::DomainError("EquityFuture: spot must be > 0");
  }
  if (!(maturity_ > 0.0)) {
    throw core::DomainError("EquityFuture: maturity must be > 0");
  }
}

double EquityFuture::price() const noexcept {
  return spot_ * std::exp((rate_ - dividend_yield_) * maturity_);
}

double EquityFuture::long_value(double t, double spot_t, const curves::TermStructure& curve) const {
  if (t < 0.0 || t > maturity_) {
    throw core::DomainError("EquityFuture::long_value: t must be in [0, maturity]");
  }
  if (!(spot_t > 0.0)) {
    throw core::DomainError("EquityFuture::long_value: spot_t must be > 0");
  }
  const double tau = maturity_ - t;
  return spot_t * std::exp(-dividend_yield_ * tau) - price() * curve.discount_factor(tau);
}

} // namespace instruments
} // namespace qp
