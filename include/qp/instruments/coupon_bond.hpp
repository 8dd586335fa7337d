#pragma once
/**
 * @file coupon_bond.hpp
 * @brief Obligation à coupons fixes, valorisée sur une courbe zéro-coupon.
 *
 * # Échéancier
 * n = floor(maturity * frequency) coupons de nominal * coupon_rate / frequency
 * aux dates i / frequency (i = 1..n), le dernier flux incluant le remboursement du nominal.
 *
 * # Mesures
 *   price(t)  = Σ_{t_i >= t} cf_i DF(t_i - t)
 *   duration  = Σ t_i cf_i DF(t_i) / Σ cf_i DF(t_i)                    (Macaulay)
 *   convexity = Σ cf_i DF(t_i) t_i (t_i + 1/f) / Σ cf_i DF(t_i)
 */

#include <qp/curves/term_structure.hpp>

#include <vector>

namespace qp {
namespace instruments {

struct Cashflow {
  double time;   ///< années
  double amount; ///< montant (coupon, + nominal au dernier flux)
};

class CouponBond {
public:
  /// @throws core::ValidationError si nominal <= 0, coupon_rate < 0, maturity <= 0,
  ///         frequency < 1 ou échéancier vide (maturity < 1 / frequency).
  CouponBond(double nominal, double coupon_rate, double maturity, int frequency);

  const std::vector<Cashflow>& cashflows() const noexcept { return cashflows_; }

  /// @brief Valeur en t : les flux strictement antérieurs à t sont déjà payés.
  double price(const curves::TermStructure& curve, double t = 0.0) const;
  double duration(const curves::TermStructure& curve) const;
  double convexity(const curves::TermStructure& curve) const;

  /// @brief Prix sous curve.shift_rate(-s) pour chaque choc parallèle s (s > 0 : hausse des taux).
  std::vector<double> price_shift_profile(const curves::TermStructure& curve,
                                          const std::vector<double>& shifts) const;

  double nominal() const noexcept { return nominal_; }
  double coupon_rate() const noexcept { return coupon_rate_; }
  double maturity() const noexcept { return maturity_; }
  int frequency() const noexcept { return frequency_; }

private:
  double nominal_;
  double coupon_rate_;
  double maturity_;
  int frequency_;
  std::vector<Cashflow> cashflows_;
};

} // namespace instruments
} // namespace qp
