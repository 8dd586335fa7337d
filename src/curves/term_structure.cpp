#include <qp/curves/term_structure.hpp>
#include <qp/core/errors.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>
#include <utility>

namespace qp {
namespace curves {

TermStructure::TermStructure(std::vector<double> maturities, std::vector<double> rates)
    : maturities_(std::move(maturities)), rates_(std::move(rates)) {
  if (maturities_.size() != rates_.size()) {
    throw core::ValidationError("TermStructure: maturities and rates must have the same length ("
                                + std::to_string(maturities_.size()) + " vs "
                                + std::to_string(rates_.size()) + ")");
  }
  if (maturities_.empty()) {
    throw core::ValidationError("TermStructure: at least one point is required");
  }
  for (std::size_t i = 0; i < maturities_.size(); ++i) {
    if (!std::isfinite(maturities_[i]) || !std::isfinite(rates_[i])) {
      throw core::ValidationError("TermStructure: non-finite point at index " + std::to_string(i));
    }
    if (maturities_[i] <= 0.0) {
      throw core::ValidationError("TermStructure: maturities must be > 0");
    }
    if (i > 0 && maturities_[i] <= maturities_[i - 1]) {
      throw core::ValidationError("TermStructure: maturities must be strictly increasing");
    }
  }
}

std::size_t TermStructure::segment(double t) const {
  const auto it = std::upper_bound(maturities_.begin(), maturities_.end(), t);
  return static_cast<std::size_t>(std::distance(maturities_.begin(), it)) - 1;
}

double TermStructure::zero_rate(double t) const {
  const auto lb = std::lower_bound(maturities_.begin(), maturities_.end(), t);
  if (lb != maturities_.end() && *lb == t) {
    return rates_[static_cast<std::size_t>(std::distance(maturities_.begin(), lb))];
  }

  const double t0 = maturities_.front();
  if (t < t0) {
    return rates_.front() * t / t0;
  }
  if (t >= maturities_.back()) {
    return rates_.back();
  }

  const std::size_t i = segment(t);
  const double t1 = maturities_[i], t2 = maturities_[i + 1];
  const double w  = (t - t1) / (t2 - t1);
  return rates_[i] + w * (rates_[i + 1] - rates_[i]);
}

double TermStructure::discount_factor(double t) const {
  return std::exp(-zero_rate(t) * t);
}

double TermStructure::forward_rate(double t1, double t2) const {
  if (t1 < 0.0 || !(t2 > t1)) {
    throw core::DomainError("TermStructure::forward_rate: requires 0 <= t1 < t2");
  }
  return (zero_rate(t2) * t2 - zero_rate(t1) * t1) / (t2 - t1);
}

double TermStructure::instantaneous_forward(double t) const {
  const double t0 = maturities_.front();
  if (t < t0) {
    // r(t) = r0 t / t0  =>  f(t) = 2 r0 t / t0
    return 2.0 * rates_.front() * t / t0;
  }
  if (t >= maturities_.back()) {
    return rates_.back();
  }
  const std::size_t i = segment(t);
  const double slope = (rates_[i + 1] - rates_[i]) / (maturities_[i + 1] - maturities_[i]);
  return zero_rate(t) + t * slope;
}

TermStructure TermStructure::shift_rate(double delta) const {
  std::vector<double> mats, rs;
  mats.reserve(maturities_.size());
  rs.reserve(rates_.size());
  for (std::size_t i = 0; i < maturities_.size(); ++i) {
    const double shifted = rates_[i] - delta;
    // tout choc non nul supprime les noeuds négatifs ; shift_rate(0) == identité
    if (delta != 0.0 && shifted < 0.0) continue;
    mats.push_back(maturities_[i]);
    rs.push_back(shifted);
  }
  if (mats.empty()) {
    throw core::DomainError("TermStructure::shift_rate: every knot would become negative");
  }
  return TermStructure(std::move(mats), std::move(rs));
}

TermStructure TermStructure::shift_time(double delta) const {
  const double t_max = maturities_.back();
  std::vector<double> mats, rs;
  for (double m : maturities_) {
    const double s = m - delta;
    if (s < 0.0 || s >= t_max) continue;
    mats.push_back(m);
    rs.push_back(zero_rate(s));
  }
  if (mats.empty()) {
    throw core::DomainError("TermStructure::shift_time: no knot left in [0, last maturity)");
  }
  return TermStructure(std::move(mats), std::move(rs));
}

} // namespace curves
} // namespace qp
