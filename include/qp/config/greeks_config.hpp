#pragma once
/**
 * @file greeks_config.hpp
 * @brief Différences finies centrées pour les Greeks Monte Carlo (bump & reprice).
 *
 * # Bumps (absolus)
 *   delta = [V(S+h) - V(S-h)] / 2h
 *   gamma = [V(S+h) - 2V(S) + V(S-h)] / h^2
 *   vega  = [V(sigma+h) - V(sigma-h)] / 2h
 *   rho   = [V(r+h) - V(r-h)] / 2h
 * Défaut h = 1e-4 sur chaque paramètre.
 *
 * # Variance
 * - use_crn = true  : les prix "base" et "bumpés" réutilisent les mêmes tirages
 *   (Common Random Numbers) ; le bruit d'échantillonnage s'annule dans la différence.
 * - use_crn = false : chaque prix bumpé est resimulé avec de nouveaux tirages du flux.
 *   Variance de l'estimateur en O(1 / (n h^2)) : à réserver aux comparaisons.
 */

namespace qp {
namespace config {

struct GreeksConfig {
  double bump_spot = 1e-4;
  double bump_vol  = 1e-4;
  double bump_rate = 1e-4;
  bool   use_crn   = true;
};

} // namespace config
} // namespace qp
