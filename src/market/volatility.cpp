#include <qp/market/volatility.hpp>
#include <qp/core/errors.hpp>
#include <qp/core/stats.hpp>

#include <cmath>

namespace qp::market {

double realized_volatility(const std::vector<double>& closes, double periods_per_year) {
  if (closes.size() < 3) {
    throw core::DomainError("realized_volatility: at least 3 closes are required");
  }
  if (!(periods_per_year > 0.0)) {
    throw core::DomainError("realized_volatility: periods_per_year must be > 0");
  }

  core::RunningStats acc;
  for (std::size_t i = 0; i < closes.size(); ++i) {
    if (!(closes[i] > 0.0)) {
      throw core::DomainError("realized_volatility: closes must be > 0");
    }
    if (i > 0) acc.add(closes[i] / closes[i - 1] - 1.0);
  }
  return std::sqrt(acc.variance() * periods_per_year);
}

} // namespace qp::market
