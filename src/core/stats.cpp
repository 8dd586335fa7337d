#include <qp/core/stats.hpp>

#include <cmath>
#include <limits>

namespace qp {
namespace core {

void RunningStats::add(double x) noexcept {
  // Welford : une passe, stable
  n_ += 1;
  const double delta = x - mean_;
  mean_ += delta / static_cast<double>(n_);
  m2_   += delta * (x - mean_);
}

double RunningStats::variance() const noexcept {
  if (n_ < 2) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return m2_ / static_cast<double>(n_ - 1);
}

double RunningStats::std_error() const noexcept {
  if (n_ == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return std::sqrt(variance() / static_cast<double>(n_));
}

ConfidenceInterval confidence_interval_95(double mean, double std_error) noexcept {
  static constexpr double Z95 = 1.959963984540054;
  const double half = Z95 * std_error;
  return { mean - half, mean + half };
}

} // namespace core
} // namespace qp
