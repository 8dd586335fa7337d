#include <qp/instruments/coupon_bond.hpp>
#include <qp/core/errors.hpp>

#include <cmath>
#include <string>

namespace qp {
namespace instruments {

CouponBond::CouponBond(double nominal, double coupon_rate, double maturity, int frequency)
  : nominal_(nominal), coupon_rate_(coupon_rate), maturity_(maturity), frequency_(frequency) {
  if (frequency_ < 1) {
    throw core::ValidationError("CouponBond: frequency must be >= 1 (got "
                                + std::to_string(frequency_) + ")");
  }
  if (!(nominal_ > 0.0)) {
    throw core::ValidationError("CouponBond: nominal must be > 0");
  }
  if (!(coupon_rate_ >= 0.0)) {
    throw core::ValidationError("CouponBond: coupon_rate must be >= 0");
  }
  if (!(maturity_ > 0.0) || !std::isfinite(maturity_)) {
    throw core::ValidationError("CouponBond: maturity must be > 0");
  }

  const double f = static_cast<double>(frequency_);
  // 1e-9 : maturity * f entier aux arrondis près (ex. 0.3 * 10)
  const long n = static_cast<long>(std::floor(maturity_ * f + 1e-9));
  if (n < 1) {
    throw core::ValidationError("CouponBond: empty schedule (maturity < 1 / frequency)");
  }

  const double coupon = nominal_ * coupon_rate_ / f;
  cashflows_.reserve(static_cast<std::size_t>(n));
  for (long i = 1; i <= n; ++i) {
    cashflows_.push_back(Cashflow{static_cast<double>(i) / f, coupon});
  }
  cashflows_.back().amount += nominal_;
}

double CouponBond::price(const curves::TermStructure& curve, double t) const {
  double pv = 0.0;
  for (const auto& cf : cashflows_) {
    if (cf.time < t) continue; // déjà payé
    pv += cf.amount * curve.discount_factor(cf.time - t);
  }
  return pv;
}

double CouponBond::duration(const curves::TermStructure& curve) const {
  double num = 0.0, den = 0.0;
  for (const auto& cf : cashflows_) {
    const double pv = cf.amount * curve.discount_factor(cf.time);
    num += cf.time * pv;
    den += pv;
  }
  return num / den;
}

double CouponBond::convexity(const curves::TermStructure& curve) const {
  const double inv_f = 1.0 / static_cast<double>(frequency_);
  double num = 0.0, den = 0.0;
  for (const auto& cf : cashflows_) {
    const double pv = cf.amount * curve.discount_factor(cf.time);
    num += pv * cf.time * (cf.time + inv_f);
    den += pv;
  }
  return num / den;
}

std::vector<double> CouponBond::price_shift_profile(const curves::TermStructure& curve,
                                                    const std::vector<double>& shifts) const {
  std::vector<double> out;
  out.reserve(shifts.size());
  for (double s : shifts) {
    out.push_back(price(curve.shift_rate(-s)));
  }
  return out;
}

} // namespace instruments
} // namespace qp
