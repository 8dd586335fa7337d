#pragma once
/**
 * @file option.hpp
 * @brief Option vanille européenne : valeur immuable (strike, maturité, variante).
 *
 * # Domaine valide
 * - K > 0, T > 0 (années fractionnelles).
 *
 * # Variante
 * La variante est une étiquette explicite (OptionType). Payoff, prix et delta
 * dispatchent dessus via un switch exhaustif (voir payoffs/vanilla.hpp).
 */

#include <qp/core/errors.hpp>

namespace qp {
namespace market {

enum class OptionType {
  Call, ///< max(S_T - K, 0)
  Put   ///< max(K - S_T, 0)
};

inline const char* to_string(OptionType t) noexcept {
  switch (t) {
    case OptionType::Call: return "Call";
    case OptionType::Put:  return "Put";
  }
  return "?";
}

struct Option {
public:
  const double K;        ///< Strike (> 0).
  const double T;        ///< Maturité en années (> 0).
  const OptionType type;

  /// @throws core::DomainError si K <= 0 ou T <= 0.
  Option(double K, double T, OptionType type)
      : K(K), T(T), type(type) {
    if (!(K > 0.0)) {
      throw core::DomainError("Option: K must be > 0");
    }
    if (!(T > 0.0)) {
      throw core::DomainError("Option: T must be > 0");
    }
  }

  bool is_call() const noexcept { return type == OptionType::Call; }
};

} // namespace market
} // namespace qp
