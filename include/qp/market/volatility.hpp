#pragma once
#include <vector>

namespace qp::market {

// Volatilité réalisée annualisée : écart-type d'échantillon des rendements simples
// c_i / c_{i-1} - 1, multiplié par sqrt(periods_per_year).
// @throws core::DomainError moins de 3 clôtures, clôture <= 0, periods_per_year <= 0.
double realized_volatility(const std::vector<double>& closes, double periods_per_year = 252.0);

} // namespace qp::market
