#pragma once
/**
 * @file interest_rate_swap.hpp
 * @brief Swap de taux payeur fixe / receveur variable, valorisation mono-courbe.
 *
 * Pour une date d'évaluation t, seuls les paiements t_i >= t restent dus.
 * accrual_i = t_i - t_{i-1} (t_0 = 0), ramené à t_i - t pour la période entamée ;
 * DF'(u) = DF(u - t).
 *
 *   PV fixe     = N * K * Σ accrual_i DF'(t_i)
 *   PV variable = N * (DF'(s) - DF'(t_N))        (télescopage)
 *   swap_rate   = (DF'(s) - DF'(t_N)) / Σ accrual_i DF'(t_i)
 *   price       = PV variable - PV fixe
 *
 * s est le début de la période d'accrual du premier paiement restant (ramené à t s'il
 * est déjà passé) : à t = 0, DF'(s) = DF(0) = 1. Les deux jambes couvrent la même
 * période, la valeur est continue au passage d'une date de paiement.
 */

#include <qp/curves/term_structure.hpp>

#include <cstddef>
#include <vector>

namespace qp {
namespace instruments {

/// @brief Échéancier régulier i / f, i = 1..floor(maturity * f), arrondi à 1e-6.
/// @throws core::ValidationError si f < 1 ou échéancier vide.
std::vector<double> make_payment_times(double maturity, int payments_per_year);

class InterestRateSwap {
public:
  /// @throws core::ValidationError si notional <= 0, payment_times vide,
  ///         non strictement croissant ou non strictement positif.
  InterestRateSwap(double notional, double fixed_rate, std::vector<double> payment_times);

  double pv_fixed_leg(const curves::TermStructure& curve, double t = 0.0) const;
  double pv_floating_leg(const curves::TermStructure& curve, double t = 0.0) const;

  /// @brief Σ accrual_i DF'(t_i) sur les paiements restants (0 s'il n'en reste aucun).
  double annuity(const curves::TermStructure& curve, double t = 0.0) const;

  /// @throws core::DomainError si l'annuité est nulle (plus aucun paiement restant).
  double swap_rate(const curves::TermStructure& curve, double t = 0.0) const;

  double price(const curves::TermStructure& curve, double t = 0.0) const;

  double notional() const noexcept { return notional_; }
  double fixed_rate() const noexcept { return fixed_rate_; }
  const std::vector<double>& payment_times() const noexcept { return times_; }

private:
  // Indice du premier paiement t_i >= t (times_.size() si aucun).
  std::size_t first_remaining(double t) const;

  double floating_annuity(const curves::TermStructure& curve, double t) const;

  double notional_;
  double fixed_rate_;
  std::vector<double> times_;
};

} // namespace instruments
} // namespace qp
