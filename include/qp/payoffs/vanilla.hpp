#pragma once
/**
 * @file vanilla.hpp
 * @brief Payoffs d'options vanille européennes.
 *
 * - Call : max(S_T - K, 0).
 * - Put  : max(K - S_T, 0).
 *
 * Continus en S_T, non dérivables en S_T = K : le delta est discontinu au strike,
 * ce qui borne la précision des différences finies Monte Carlo sur gamma.
 */

#include <algorithm>
#include <qp/market/option.hpp>

namespace qp {
namespace payoffs {

inline double payoff_call(double ST, double K) noexcept {
  return std::max(ST - K, 0.0);
}

inline double payoff_put(double ST, double K) noexcept {
  return std::max(K - ST, 0.0);
}

/// @brief Payoff selon la variante de l'option (switch exhaustif sur OptionType).
inline double payoff(const market::Option& opt, double ST) noexcept {
  switch (opt.type) {
    case market::OptionType::Call: return payoff_call(ST, opt.K);
    case market::OptionType::Put:  return payoff_put(ST, opt.K);
  }
  return 0.0;
}

} // namespace payoffs
} // namespace qp
