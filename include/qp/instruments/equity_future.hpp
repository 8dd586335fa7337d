#pragma once
/**
 * @file equity_future.hpp
 * @brief Future sur action, prix par coût de portage.
 *
 *   F = S0 * exp((r - q) * T)
 *   V_long(t) = S_t * exp(-q (T - t)) - F * DF(T - t)
 */

#include <qp/curves/term_structure.hpp>

namespace qp {
namespace instruments {

class EquityFuture {
public:
  /// @throws core::DomainError si spot <= 0 ou maturity <= 0.
  EquityFuture(double spot, double rate, double dividend_yield, double maturity);

  double price() const noexcept;

  /// @brief Valeur d'une position longue en t (0 <= t <= T) au spot S_t.
  /// @throws core::DomainError si t hors [0, T] ou spot_t <= 0.
  double long_value(double t, double spot_t, const curves::TermStructure& curve) const;

  double spot() const noexcept { return spot_; }
  double rate() const noexcept { return rate_; }
  double dividend_yield() const noexcept { return dividend_yield_; }
  double maturity() const noexcept { return maturity_; }

private:
  double spot_;
  double rate_;
  double dividend_yield_;
  double maturity_;
};

} // namespace instruments
} // namespace qp
