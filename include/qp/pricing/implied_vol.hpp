#pragma once
/**
 * @file implied_vol.hpp
 * @brief Inversion prix -> volatilité implicite par la méthode de Brent.
 *
 * On cherche sigma dans [sigma_lo, sigma_hi] tel que
 *    model.price(option, sigma) - market_price = 0.
 *
 * Si f(sigma_lo) et f(sigma_hi) sont de même signe (prix hors bornes de
 * non-arbitrage), aucune racine n'est encadrée : le solveur renvoie la
 * sentinelle {NaN, 0, false} au lieu de lever une exception.
 */

#include <qp/market/option.hpp>
#include <qp/pricing/analytic_bs.hpp>

#include <functional>

namespace qp {
namespace pricing {

struct IvResult {
  double sigma;     // solution (NaN si échec)
  int    iters;     // itérations de Brent effectuées
  bool   converged; // true si tolérance atteinte

  bool has_solution() const noexcept { return converged; }
};

struct IvConfig {
  double sigma_lo  = 1e-6;
  double sigma_hi  = 5.0;
  double tol       = 1e-8;  // tolérance absolue sur sigma et sur f(sigma)
  int    max_iters = 100;
};

/// @brief Racine de f dans [a, b] (Brent 1973 : IQI / sécante / bisection).
/// Sentinelle {NaN, 0, false} si [a, b] n'encadre pas de racine.
IvResult brent_solve(const std::function<double(double)>& f,
                     double a, double b, double tol, int max_iters);

/// @brief Volatilité implicite d'une option européenne sous le modèle analytique
///        (S0, r, q, repo du modèle ; sa propre sigma est ignorée).
IvResult implied_vol(const AnalyticBs& model,
                     const market::Option& opt,
                     double market_price,
                     const IvConfig& cfg = IvConfig{});

} // namespace pricing
} // namespace qp
