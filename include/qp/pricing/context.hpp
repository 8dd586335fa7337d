#pragma once
/**
 * @file context.hpp
 * @brief Contexte de pricing explicite : courbe + état actions + configurations.
 *
 * Construit une fois par l'appelant puis passé par référence ; il fabrique à la
 * demande des modèles sans état. Aucun cache, aucune instance globale.
 *
 * Le taux d'un modèle est le taux zéro de la courbe à la maturité de l'option.
 */

#include <qp/config/greeks_config.hpp>
#include <qp/config/mc_config.hpp>
#include <qp/curves/term_structure.hpp>
#include <qp/instruments/equity_future.hpp>
#include <qp/market/market_data.hpp>
#include <qp/market/option.hpp>
#include <qp/pricing/analytic_bs.hpp>
#include <qp/pricing/mc_pricer.hpp>

namespace qp {
namespace pricing {

class PricingContext {
public:
  /// @throws core::DomainError si spot <= 0 ou sigma <= 0.
  PricingContext(curves::TermStructure curve,
                 double spot, double dividend, double repo, double sigma,
                 config::McConfig mc = config::McConfig{},
                 config::GreeksConfig greeks = config::GreeksConfig{});

  double rate_for(double T) const { return curve_.zero_rate(T); }

  /// @brief (S0, r(T), q, repo)
  market::MarketData market_for(double T) const;

  AnalyticBs analytic_for(const market::Option& opt) const;

  /// @brief Chaque appel renvoie un pricer neuf (flux repartant de McConfig::seed).
  McPricer monte_carlo_for(const market::Option& opt) const;

  /// @brief Future de maturité T, portage au taux de la courbe (dividende seul).
  instruments::EquityFuture future_for(double T) const;

  const curves::TermStructure& curve() const noexcept { return curve_; }
  double spot() const noexcept { return spot_; }
  double dividend() const noexcept { return dividend_; }
  double repo() const noexcept { return repo_; }
  double sigma() const noexcept { return sigma_; }

private:
  curves::TermStructure curve_;
  double spot_;
  double dividend_;
  double repo_;
  double sigma_;
  config::McConfig mc_;
  config::GreeksConfig greeks_;
};

} // namespace pricing
} // namespace qp
