#include <qp/models/gbm.hpp>
#include <qp/core/errors.hpp>

#include <cmath>

namespace qp {
namespace models {

Gbm::Gbm(GbmParams p) : params_(p) {
  if (p.sigma < 0.0) {
    throw core::DomainError("Gbm: sigma must be >= 0");
  }
}

double Gbm::terminal(double S0, double T, double Z) const noexcept {
  if (T == 0.0) {
    return S0;
  }
  const double mu  = (params_.r - params_.q - 0.5 * params_.sigma * params_.sigma) * T;
  const double vol = params_.sigma * std::sqrt(T);
  return S0 * std::exp(mu + vol * Z);
}

double Gbm::sample_ST(double S0, double T, core::NormalRng& rng) const {
  return terminal(S0, T, rng.sample());
}

} // namespace models
} // namespace qp
