#include <qp/instruments/interest_rate_swap.hpp>
#include <qp/core/errors.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>
#include <utility>

namespace qp {
namespace instruments {

std::vector<double> make_payment_times(double maturity, int payments_per_year) {
  if (payments_per_year < 1) {
    throw core::ValidationError("make_payment_times: payments_per_year must be >= 1");
  }
  const double f = static_cast<double>(payments_per_year);
  const long n = (maturity > 0.0) ? static_cast<long>(std::floor(maturity * f + 1e-9)) : 0;
  if (n < 1) {
    throw core::ValidationError("make_payment_times: empty schedule");
  }
  std::vector<double> out;
  out.reserve(static_cast<std::size_t>(n));
  for (long i = 1; i <= n; ++i) {
    out.push_back(std::round(static_cast<double>(i) / f * 1e6) / 1e6);
  }
  return out;
}

InterestRateSwap::InterestRateSwap(double notional, double fixed_rate, std::vector<double> payment_times)
  : notional_(notional), fixed_rate_(fixed_rate), times_(std::move(payment_times)) {
  if (!(notional_ > 0.0)) {
    throw core::ValidationError("InterestRateSwap: notional must be > 0");
  }
  if (times_.empty()) {
    throw core::ValidationError("InterestRateSwap: empty payment schedule");
  }
  for (std::size_t i = 0; i < times_.size(); ++i) {
    if (!std::isfinite(times_[i]) || !(times_[i] > 0.0)) {
      throw core::ValidationError("InterestRateSwap: payment time " + std::to_string(i) + " must be > 0");
    }
    if (i > 0 && !(times_[i] > times_[i - 1])) {
      throw core::ValidationError("InterestRateSwap: payment times must be strictly increasing");
    }
  }
}

std::size_t InterestRateSwap::first_remaining(double t) const {
  const auto it = std::lower_bound(times_.begin(), times_.end(), t);
  return static_cast<std::size_t>(std::distance(times_.begin(), it));
}

double InterestRateSwap::annuity(const curves::TermStructure& curve, double t) const {
  const std::size_t i0 = first_remaining(t);
  double acc = 0.0;
  for (std::size_t i = i0; i < times_.size(); ++i) {
    double prev = (i == 0) ? 0.0 : times_[i - 1];
    if (i == i0) prev = std::max(prev, t); // période entamée : accrual depuis t
    acc += (times_[i] - prev) * curve.discount_factor(times_[i] - t);
  }
  return acc;
}

double InterestRateSwap::floating_annuity(const curves::TermStructure& curve, double t) const {
  const std::size_t i0 = first_remaining(t);
  if (i0 == times_.size()) return 0.0;
  const double start = (i0 == 0) ? 0.0 : times_[i0 - 1];
  const double s = std::max(0.0, start - t);
  return curve.discount_factor(s) - curve.discount_factor(times_.back() - t);
}

double InterestRateSwap::pv_fixed_leg(const curves::TermStructure& curve, double t) const {
  return notional_ * fixed_rate_ * annuity(curve, t);
}

double InterestRateSwap::pv_floating_leg(const curves::TermStructure& curve, double t) const {
  return notional_ * floating_annuity(curve, t);
}

double InterestRateSwap::swap_rate(const curves::TermStructure& curve, double t) const {
  const double a = annuity(curve, t);
  if (!(a > 0.0)) {
    throw core::DomainError("InterestRateSwap::swap_rate: zero annuity (no remaining payment)");
  }
  return floating_annuity(curve, t) / a;
}

double InterestRateSwap::price(const curves::TermStructure& curve, double t) const {
  return pv_floating_leg(curve, t) - pv_fixed_leg(curve, t);
}

} // namespace instruments
} // namespace qp
