#include <qp/pricing/mc_pricer.hpp>

#include <qp/core/errors.hpp>
#include <qp/core/stats.hpp>
#include <qp/models/gbm.hpp>
#include <qp/payoffs/vanilla.hpp>

#include <algorithm> // std::max
#include <chrono>
#include <cmath>

namespace qp {
namespace pricing {

McPricer::McPricer(market::MarketData mkt, double sigma,
                   config::McConfig cfg, config::GreeksConfig gcfg)
  : mkt_(mkt), sigma_(sigma), cfg_(cfg), gcfg_(gcfg), rng_(cfg.seed) {
  if (cfg_.n_paths == 0) {
    throw core::ValidationError("McPricer: n_paths must be >= 1");
  }
  if (!(sigma_ >= 0.0)) {
    throw core::DomainError("McPricer: sigma must be >= 0");
  }
}

void McPricer::draw_block() {
  const std::size_t n = cfg_.use_antithetic
                          ? std::max<std::size_t>(1, cfg_.n_paths / 2)
                          : cfg_.n_paths;
  rng_.sample_block(z_, n);
}

MonteCarloResult McPricer::evaluate(const market::Option& opt, const McOverrides& ov) const {
  const auto t0 = std::chrono::steady_clock::now();

  const double S0    = ov.spot.value_or(mkt_.S0);
  const double r     = ov.rate.value_or(mkt_.r);
  const double sigma = ov.vol.value_or(sigma_);
  const double T     = ov.maturity.value_or(opt.T);

  if (!(S0 > 0.0)) {
    throw core::DomainError("McPricer: spot must be > 0");
  }
  if (!(T > 0.0)) {
    throw core::DomainError("McPricer: maturity must be > 0");
  }

  const models::Gbm model(models::GbmParams{r, mkt_.carry_yield(), sigma});
  const double df = std::exp(-r * T);

  core::RunningStats acc;
  if (cfg_.use_antithetic) {
    // unité statistique = la paire (Z, -Z)
    for (const double z : z_) {
      const double xp = df * payoffs::payoff(opt, model.terminal(S0, T,  z));
      const double xm = df * payoffs::payoff(opt, model.terminal(S0, T, -z));
      acc.add(0.5 * (xp + xm));
    }
  } else {
    for (const double z : z_) {
      acc.add(df * payoffs::payoff(opt, model.terminal(S0, T, z)));
    }
  }

  const double se = acc.std_error();
  const auto ci = core::confidence_interval_95(acc.mean(), se);

  MonteCarloResult res{};
  res.price       = acc.mean();
  res.std_error   = se;
  res.ci_low      = ci.low;
  res.ci_high     = ci.high;
  res.n_effective = cfg_.use_antithetic ? 2 * z_.size() : z_.size();
  res.elapsed_ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - t0).count();
  return res;
}

MonteCarloResult McPricer::price_european(const market::Option& opt, const McOverrides& ov) {
  draw_block();
  return evaluate(opt, ov);
}

double McPricer::price(const market::Option& opt, const McOverrides& ov) {
  return price_european(opt, ov).price;
}

std::vector<double> McPricer::reprice(const market::Option& opt,
                                      const std::vector<McOverrides>& scenarios) {
  std::vector<double> out;
  out.reserve(scenarios.size());
  if (gcfg_.use_crn) {
    draw_block();
    for (const auto& ov : scenarios) out.push_back(evaluate(opt, ov).price);
  } else {
    for (const auto& ov : scenarios) out.push_back(price_european(opt, ov).price);
  }
  return out;
}

// ============================================================================
// Greeks (différences centrées, bumps absolus)
// ============================================================================

double McPricer::delta(const market::Option& opt) {
  const double h = gcfg_.bump_spot;
  McOverrides up, dn;
  up.spot = mkt_.S0 + h;
  dn.spot = mkt_.S0 - h;
  const auto v = reprice(opt, {up, dn});
  return (v[0] - v[1]) / (2.0 * h);
}

double McPricer::gamma(const market::Option& opt) {
  const double h = gcfg_.bump_spot;
  McOverrides up, mid, dn;
  up.spot = mkt_.S0 + h;
  dn.spot = mkt_.S0 - h;
  const auto v = reprice(opt, {up, mid, dn});
  return (v[0] - 2.0 * v[1] + v[2]) / (h * h);
}

double McPricer::vega(const market::Option& opt) {
  const double h = gcfg_.bump_vol;
  // clamp à 0 : le pas effectif est recalculé
  const double sig_p = sigma_ + h;
  const double sig_m = std::max(0.0, sigma_ - h);
  McOverrides up, dn;
  up.vol = sig_p;
  dn.vol = sig_m;
  const auto v = reprice(opt, {up, dn});
  return (v[0] - v[1]) / (sig_p - sig_m);
}

double McPricer::rho(const market::Option& opt) {
  const double h = gcfg_.bump_rate;
  McOverrides up, dn;
  up.rate = mkt_.r + h;
  dn.rate = mkt_.r - h;
  const auto v = reprice(opt, {up, dn});
  return (v[0] - v[1]) / (2.0 * h);
}

} // namespace pricing
} // namespace qp
