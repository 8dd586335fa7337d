#pragma once
/**
 * @file term_structure.hpp
 * @brief Courbe zéro-coupon immuable (taux continus annualisés, en décimal).
 *
 * # Interpolation de r(t)
 * - t égal à un noeud        : taux stocké, exactement.
 * - t < t_0                  : r(t) = r_0 * t / t_0 (taux proportionnel au temps, pas plat).
 * - t > t_N                  : plat au dernier taux.
 * - t_i < t < t_{i+1}        : linéaire en taux, w = (t - t_i) / (t_{i+1} - t_i).
 *
 * DF(t) = exp(-r(t) * t).
 *
 * # Transformations
 * Les transformations renvoient une nouvelle courbe ; l'instance n'est jamais modifiée.
 * - shift_rate(d) : r_i - d. Pour d > 0, les noeuds qui deviendraient négatifs sont
 *   supprimés. Si plus aucun noeud ne reste : DomainError.
 * - shift_time(d) : noeuds conservés t_i, taux ré-échantillonnés r(t_i - d), pour les
 *   seuls noeuds tels que t_i - d est dans [0, t_N). Courbe vide : DomainError.
 *
 * # Thread-safety
 * Aucune donnée mutable : partage libre entre threads.
 */

#include <cstddef>
#include <vector>

namespace qp {
namespace curves {

class TermStructure {
public:
  /// @throws core::ValidationError tailles différentes, courbe vide,
  ///         maturités non strictement croissantes / non positives, valeurs non finies.
  TermStructure(std::vector<double> maturities, std::vector<double> rates);

  double zero_rate(double t) const;
  double discount_factor(double t) const;

  /// @brief Taux forward continu entre t1 et t2 : (r2 t2 - r1 t1) / (t2 - t1).
  /// @throws core::DomainError si t1 < 0 ou t2 <= t1.
  double forward_rate(double t1, double t2) const;

  /// @brief f(t) = r(t) + t r'(t), r' = dérivée à droite de la règle d'interpolation.
  double instantaneous_forward(double t) const;

  TermStructure shift_rate(double delta) const;
  TermStructure shift_time(double delta) const;

  const std::vector<double>& maturities() const noexcept { return maturities_; }
  const std::vector<double>& rates() const noexcept { return rates_; }
  std::size_t size() const noexcept { return maturities_.size(); }

private:
  // Indice i du segment [t_i, t_{i+1}) contenant t ; suppose t_0 <= t < t_N.
  std::size_t segment(double t) const;

  std::vector<double> maturities_;
  std::vector<double> rates_;
};

} // namespace curves
} // namespace qp
