#pragma once
/**
 * @file market_data.hpp
 * @brief État de marché scalaire d'un sous-jacent actions.
 *
 * - S0   : spot (> 0).
 * - r    : taux sans risque continu (décimal, peut être négatif).
 * - q    : taux de dividende continu.
 * - repo : coût d'emprunt du titre ; s'ajoute à q dans le coût de portage.
 *
 * Sous Q : dS/S = (r - q - repo) dt + sigma dW.
 */

#include <qp/core/errors.hpp>

namespace qp {
namespace market {

struct MarketData {
public:
  const double S0;
  const double r;
  const double q;
  const double repo;

  /// @throws core::DomainError si S0 <= 0.
  MarketData(double S0, double r, double q = 0.0, double repo = 0.0)
      : S0(S0), r(r), q(q), repo(repo) {
    if (!(S0 > 0.0)) {
      throw core::DomainError("MarketData: S0 must be > 0");
    }
  }

  /// @brief Rendement total retiré du drift (dividende + repo).
  double carry_yield() const noexcept { return q + repo; }
};

} // namespace market
} // namespace qp
