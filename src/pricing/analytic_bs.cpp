#include <qp/pricing/analytic_bs.hpp>
#include <qp/core/errors.hpp>
#include <qp/core/normal_dist.hpp>

#include <cmath>

namespace qp {
namespace pricing {

using core::norm_cdf;
using core::norm_pdf;

namespace {

inline double pospart(double x) noexcept {
  return (x > 0.0) ? x : 0.0;
}

inline void check_domain(double sigma, double T) {
  if (!(sigma > 0.0)) {
    throw core::DomainError("AnalyticBs: sigma must be > 0");
  }
  if (!(T > 0.0)) {
    throw core::DomainError("AnalyticBs: maturity must be > 0");
  }
}

} // unnamed namespace

double price_call_bs(double S0, double K, double r, double q, double sigma, double T) noexcept {
  if (T == 0.0) {
    return pospart(S0 - K);
  }
  if (sigma == 0.0) {
    const double ST = S0 * std::exp((r - q) * T); // trajectoire déterministe
    return std::exp(-r * T) * pospart(ST - K);
  }
  if (S0 == 0.0) {
    return 0.0;
  }

  const double sigSqrtT = sigma * std::sqrt(T);
  const double df       = std::exp(-r * T);
  const double disc_q   = std::exp(-q * T);
  const double d1 = (std::log(S0 / K) + (r - q + 0.5 * sigma * sigma) * T) / sigSqrtT;
  const double d2 = d1 - sigSqrtT;

  return disc_q * S0 * norm_cdf(d1) - df * K * norm_cdf(d2);
}

double price_put_bs(double S0, double K, double r, double q, double sigma, double T) noexcept {
  if (T == 0.0) {
    return pospart(K - S0);
  }
  if (sigma == 0.0) {
    const double ST = S0 * std::exp((r - q) * T);
    return std::exp(-r * T) * pospart(K - ST);
  }
  if (S0 == 0.0) {
    return std::exp(-r * T) * K;
  }

  const double sigSqrtT = sigma * std::sqrt(T);
  const double df       = std::exp(-r * T);
  const double disc_q   = std::exp(-q * T);
  const double d1 = (std::log(S0 / K) + (r - q + 0.5 * sigma * sigma) * T) / sigSqrtT;
  const double d2 = d1 - sigSqrtT;

  return df * K * norm_cdf(-d2) - disc_q * S0 * norm_cdf(-d1);
}

double put_call_parity_gap(double call, double put,
                           double S0, double K, double r, double q, double T) noexcept {
  return call - put - (S0 * std::exp(-q * T) - K * std::exp(-r * T));
}

// --- AnalyticBs -------------------------------------------------------------

double AnalyticBs::d1(const market::Option& opt, double sigma) const {
  check_domain(sigma, opt.T);
  const double c = mkt_.carry_yield();
  return (std::log(mkt_.S0 / opt.K) + (mkt_.r - c + 0.5 * sigma * sigma) * opt.T)
         / (sigma * std::sqrt(opt.T));
}

double AnalyticBs::d2(const market::Option& opt, double sigma) const {
  return d1(opt, sigma) - sigma * std::sqrt(opt.T);
}

// Le repo n'entre que dans d1 ; la jambe spot est actualisée au seul dividende.
double AnalyticBs::price(const market::Option& opt, double sigma) const {
  const double dd1    = d1(opt, sigma);
  const double dd2    = dd1 - sigma * std::sqrt(opt.T);
  const double disc_q = std::exp(-mkt_.q * opt.T);
  const double df     = std::exp(-mkt_.r * opt.T);
  switch (opt.type) {
    case market::OptionType::Call:
      return disc_q * mkt_.S0 * norm_cdf(dd1) - df * opt.K * norm_cdf(dd2);
    case market::OptionType::Put:
      return df * opt.K * norm_cdf(-dd2) - disc_q * mkt_.S0 * norm_cdf(-dd1);
  }
  return 0.0;
}

double AnalyticBs::delta(const market::Option& opt) const {
  const double disc_q = std::exp(-mkt_.q * opt.T);
  const double nd1 = norm_cdf(d1(opt));
  return opt.is_call() ? disc_q * nd1 : disc_q * (nd1 - 1.0);
}

double AnalyticBs::gamma(const market::Option& opt) const {
  const double disc_q = std::exp(-mkt_.q * opt.T);
  return disc_q * norm_pdf(d1(opt)) / (mkt_.S0 * sigma_ * std::sqrt(opt.T));
}

double AnalyticBs::vega(const market::Option& opt, double sigma) const {
  const double disc_q = std::exp(-mkt_.q * opt.T);
  return mkt_.S0 * disc_q * norm_pdf(d1(opt, sigma)) * std::sqrt(opt.T);
}

double AnalyticBs::rho(const market::Option& opt) const {
  const double KTdf = opt.K * opt.T * std::exp(-mkt_.r * opt.T);
  const double dd2  = d2(opt);
  switch (opt.type) {
    case market::OptionType::Call: return  KTdf * norm_cdf(dd2);
    case market::OptionType::Put:  return -KTdf * norm_cdf(-dd2);
  }
  return 0.0;
}

} // namespace pricing
} // namespace qp
