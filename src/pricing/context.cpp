#include <qp/pricing/context.hpp>
#include <qp/core/errors.hpp>

#include <utility>

namespace qp {
namespace pricing {

PricingContext::PricingContext(curves::TermStructure curve,
                               double spot, double dividend, double repo, double sigma,
                               config::McConfig mc, config::GreeksConfig greeks)
  : curve_(std::move(curve)), spot_(spot), dividend_(dividend), repo_(repo),
    sigma_(sigma), mc_(mc), greeks_(greeks) {
  if (!(spot_ > 0.0)) {
    throw core::DomainError("PricingContext: spot must be > 0");
  }
  if (!(sigma_ > 0.0)) {
    throw core::DomainError("PricingContext: sigma must be > 0");
  }
}

market::MarketData PricingContext::market_for(double T) const {
  return market::MarketData(spot_, rate_for(T), dividend_, repo_);
}

AnalyticBs PricingContext::analytic_for(const market::Option& opt) const {
  return AnalyticBs(market_for(opt.T), sigma_);
}

McPricer PricingContext::monte_carlo_for(const market::Option& opt) const {
  return McPricer(market_for(opt.T), sigma_, mc_, greeks_);
}

instruments::EquityFuture PricingContext::future_for(double T) const {
  return instruments::EquityFuture(spot_, rate_for(T), dividend_, T);
}

} // namespace pricing
} // namespace qp
