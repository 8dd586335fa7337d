#include <qp/pricing/mc_pricer.hpp>
#include <qp/pricing/analytic_bs.hpp>
#include <qp/market/market_data.hpp>
#include <qp/market/option.hpp>
#include <qp/config/mc_config.hpp>
#include <qp/config/greeks_config.hpp>
#include <qp/core/errors.hpp>

#include <cassert>
#include <cmath>
#include <iostream>

using qp::market::MarketData;
using qp::market::Option;
using qp::market::OptionType;
using qp::config::McConfig;
using qp::config::GreeksConfig;
using qp::pricing::McPricer;
using qp::pricing::AnalyticBs;

int main() {
  const MarketData mkt(100.0, 0.02);
  const double sigma = 0.20;
  const Option call(100.0, 1.0, OptionType::Call);
  const AnalyticBs bs(mkt, sigma);
  const double ref = bs.price(call);

  // 1) Convergence vers le prix analytique (4 erreurs standard)
  {
    McPricer mc(mkt, sigma, McConfig(200'000, 42));
    const auto res = mc.price_european(call);
    assert(res.n_effective == 200'000);
    assert(res.std_error > 0.0);
    assert(res.ci_low < res.price && res.price < res.ci_high);
    assert(std::abs(res.price - ref) < 4.0 * res.std_error);
  }

  // 2) L'erreur standard décroît en 1/sqrt(n)
  {
    McPricer small(mkt, sigma, McConfig(10'000, 5));
    McPricer large(mkt, sigma, McConfig(160'000, 5));
    const auto rs = small.price_european(call);
    const auto rl = large.price_european(call);
    assert(rl.std_error < 0.5 * rs.std_error);
    assert(std::abs(rl.price - ref) < 4.0 * rl.std_error);
  }

  // 3) Reproductibilité : même graine => mêmes prix ; le flux avance entre deux appels
  {
    McPricer a(mkt, sigma, McConfig(20'000, 123));
    McPricer b(mkt, sigma, McConfig(20'000, 123));
    const double pa1 = a.price(call);
    const double pb1 = b.price(call);
    assert(pa1 == pb1);
    const double pa2 = a.price(call);
    assert(pa2 != pa1);
    assert(b.price(call) == pa2);
  }

  // 4) Put avec dividende et repo, antithétique
  {
    const MarketData m2(95.0, 0.03, 0.01, 0.005);
    const Option put(100.0, 0.5, OptionType::Put);
    McPricer mc(m2, 0.3, McConfig(100'000, 9, /*use_antithetic=*/true));
    const auto res = mc.price_european(put);
    assert(res.n_effective == 100'000);
    // le GBM retire q + repo du drift : référence avec le portage total en dividende
    const AnalyticBs ref(MarketData(95.0, 0.03, m2.carry_yield()), 0.3);
    assert(std::abs(res.price - ref.price(put)) < 4.0 * res.std_error);
  }

  // 5) Surcharges ponctuelles : l'état de base n'est pas modifié
  {
    McPricer mc(mkt, sigma, McConfig(50'000, 3));
    qp::pricing::McOverrides ov;
    ov.spot = 110.0;
    ov.maturity = 2.0;
    const auto res = mc.price_european(call, ov);
    const double ref_ov = AnalyticBs(MarketData(110.0, 0.02), sigma).price(Option(100.0, 2.0, OptionType::Call));
    assert(std::abs(res.price - ref_ov) < 4.0 * res.std_error);
    assert(mc.market().S0 == 100.0);
  }

  // 6) Greeks avec tirages communs (défaut) vs analytiques
  {
    McPricer mc(mkt, sigma, McConfig(100'000, 7));
    assert(mc.gcfg().use_crn);
    const double d = mc.delta(call);
    const double g = mc.gamma(call);
    const double v = mc.vega(call);
    const double r = mc.rho(call);
    std::cout << "MC greeks: delta=" << d << " gamma=" << g
              << " vega=" << v << " rho=" << r << "\n";
    assert(std::abs(d - bs.delta(call)) < 0.01);
    assert(std::abs(v - bs.vega(call))  < 1.0);
    assert(std::abs(r - bs.rho(call))   < 1.0);
    // 2e différence d'un payoff convexe sur les mêmes tirages : >= 0
    assert(std::isfinite(g) && g >= 0.0);

    const Option put(100.0, 1.0, OptionType::Put);
    assert(std::abs(mc.delta(put) - bs.delta(put)) < 0.01);
  }

  // 7) Rééchantillonnage indépendant par bump : estimateur bruité mais défini
  {
    GreeksConfig g;
    g.use_crn = false;
    McPricer mc(mkt, sigma, McConfig(5'000, 7), g);
    assert(std::isfinite(mc.delta(call)));
    assert(std::isfinite(mc.vega(call)));
  }

  // 8) Validation
  {
    bool threw = false;
    try { McPricer bad(mkt, sigma, McConfig(0, 1)); } catch (const qp::core::ValidationError&) { threw = true; }
    assert(threw);

    threw = false;
    try { McPricer bad(mkt, -0.1); } catch (const qp::core::DomainError&) { threw = true; }
    assert(threw);

    threw = false;
    McPricer mc(mkt, sigma, McConfig(100, 1));
    qp::pricing::McOverrides ov;
    ov.spot = -1.0;
    try { (void)mc.price(call, ov); } catch (const qp::core::DomainError&) { threw = true; }
    assert(threw);
  }

  std::cout << "McPricer OK. analytic=" << ref << "\n";
  return 0;
}
