#pragma once
/**
 * @file gbm.hpp
 * @brief Dynamique Black–Scholes (GBM) sous la mesure risque-neutre Q.
 *
 *    dS_t / S_t = (r - q) dt + sigma dW_t
 *
 * Pas exact vers la maturité :
 *    S_T = S0 * exp( (r - q - 0.5*sigma^2) * T + sigma * sqrt(T) * Z ),  Z ~ N(0,1)
 *
 * Ici q est le rendement total retiré du drift (dividende + repo).
 *
 * # Tests
 *    E[S_T]   = S0 * exp((r - q) T)
 *    Var[S_T] = E[S_T]^2 * (exp(sigma^2 T) - 1)
 */

#include <qp/core/normal_rng.hpp>

namespace qp {
namespace models {

struct GbmParams {
  double r;
  double q;
  double sigma; ///< >= 0
};

class Gbm {
public:
  /// @throws core::DomainError si sigma < 0.
  explicit Gbm(GbmParams p);

  const GbmParams& params() const noexcept { return params_; }

  /// @brief S_T pour un tirage Z donné (utile pour rejouer les mêmes tirages).
  double terminal(double S0, double T, double Z) const noexcept;

  /// @brief S_T avec un tirage pris dans rng.
  double sample_ST(double S0, double T, core::NormalRng& rng) const;

private:
  GbmParams params_;
};

} // namespace models
} // namespace qp
