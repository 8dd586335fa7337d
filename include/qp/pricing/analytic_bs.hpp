#pragma once
/**
 * @file analytic_bs.hpp
 * @brief Formules fermées Black–Scholes avec coût de portage (dividende + repo).
 *
 * # Notations (c = q + repo)
 * d1 = [ ln(S0/K) + (r - c + 0.5*sigma^2) T ] / (sigma * sqrt(T))
 * d2 = d1 - sigma * sqrt(T)
 *
 *   Call = S0 e^{-qT} N(d1) - K e^{-rT} N(d2)
 *   Put  = K e^{-rT} N(-d2) - S0 e^{-qT} N(-d1)
 *
 *   Delta call = e^{-qT} N(d1)        Delta put = e^{-qT} (N(d1) - 1)
 *   Gamma      = e^{-qT} n(d1) / (S0 sigma sqrt(T))
 *   Vega       = S0 e^{-qT} n(d1) sqrt(T)
 *   Rho call   = K T e^{-rT} N(d2)    Rho put   = -K T e^{-rT} N(-d2)
 *
 * Le repo ne déplace que d1 (drift) ; la jambe spot est actualisée au dividende.
 * Sans dividende on retrouve Delta call = N(d1).
 * La parité C - P = S0 e^{-qT} - K e^{-rT} tient à la précision machine.
 * Avec repo != 0, delta / gamma / vega ne sont plus les dérivées exactes du prix.
 */

#include <qp/market/market_data.hpp>
#include <qp/market/option.hpp>

namespace qp {
namespace pricing {

/**
 * @brief Prix d'un call européen (fonction libre, sans validation).
 *
 * Cas limites :
 * - T == 0     : max(S0 - K, 0)
 * - sigma == 0 : e^{-rT} * max(S0 e^{(r-q)T} - K, 0)
 */
double price_call_bs(double S0, double K, double r, double q, double sigma, double T) noexcept;

/// @brief Pendant put de price_call_bs (mêmes cas limites).
double price_put_bs(double S0, double K, double r, double q, double sigma, double T) noexcept;

/// @return call - put - (S0 e^{-qT} - K e^{-rT}), ≈ 0 sans frictions.
double put_call_parity_gap(double call, double put,
                           double S0, double K, double r, double q, double T) noexcept;

/**
 * @brief Modèle analytique sans état : paramètres de marché + volatilité fixés à la construction.
 *
 * Chaque méthode est une fonction pure de ces paramètres et de l'option.
 * Les surcharges prenant sigma servent à l'inversion de volatilité.
 *
 * @throws core::DomainError (méthodes de pricing) si sigma <= 0 ou T <= 0.
 */
class AnalyticBs {
public:
  AnalyticBs(market::MarketData mkt, double sigma) noexcept
    : mkt_(mkt), sigma_(sigma) {}

  double d1(const market::Option& opt) const { return d1(opt, sigma_); }
  double d1(const market::Option& opt, double sigma) const;
  double d2(const market::Option& opt) const { return d2(opt, sigma_); }
  double d2(const market::Option& opt, double sigma) const;

  double price(const market::Option& opt) const { return price(opt, sigma_); }
  double price(const market::Option& opt, double sigma) const;

  double delta(const market::Option& opt) const;
  double gamma(const market::Option& opt) const;
  double vega(const market::Option& opt) const { return vega(opt, sigma_); }
  double vega(const market::Option& opt, double sigma) const;
  double rho(const market::Option& opt) const;

  const market::MarketData& market() const noexcept { return mkt_; }
  double sigma() const noexcept { return sigma_; }

private:
  market::MarketData mkt_;
  double sigma_;
};

} // namespace pricing
} // namespace qp
