#pragma once
/**
 * @file mc_pricer.hpp
 * @brief Pricing Monte Carlo d'une option européenne sous GBM, et Greeks par bump & reprice.
 *
 * # Principe
 * - Pas exact vers S_T (européen : pas de discrétisation).
 * - Payoff actualisé par exp(-r T), accumulé en streaming (RunningStats).
 * - IC 95 % : moyenne ± 1.96 * std_error.
 *
 * # État
 * Le pricer possède un flux N(0,1) privé, initialisé depuis McConfig::seed.
 * Chaque prix consomme des tirages : deux appels successifs donnent deux
 * estimations différentes, deux pricers de même graine la même suite d'estimations.
 *
 * # Greeks
 * Différences finies centrées (voir config/greeks_config.hpp). Avec use_crn,
 * un seul bloc de tirages est rejoué pour tous les scénarios bumpés.
 */

#include <qp/config/greeks_config.hpp>
#include <qp/config/mc_config.hpp>
#include <qp/core/normal_rng.hpp>
#include <qp/market/market_data.hpp>
#include <qp/market/option.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace qp {
namespace pricing {

/// @brief Résultat d'un run Monte Carlo.
struct MonteCarloResult {
  double price;            ///< Estimation du prix actualisé.
  double std_error;        ///< Erreur standard empirique.
  double ci_low;           ///< Borne basse de l'IC 95 %.
  double ci_high;          ///< Borne haute de l'IC 95 %.
  std::size_t n_effective; ///< Trajectoires physiques simulées.
  long long elapsed_ms;    ///< Durée (millisecondes).
};

/// @brief Surcharges ponctuelles des paramètres d'un run (scénarios bumpés).
struct McOverrides {
  std::optional<double> spot;
  std::optional<double> rate;
  std::optional<double> vol;
  std::optional<double> maturity;
};

class McPricer {
public:
  /// @throws core::ValidationError si n_paths == 0 ; core::DomainError si sigma < 0.
  McPricer(market::MarketData mkt, double sigma,
           config::McConfig cfg = config::McConfig{},
           config::GreeksConfig gcfg = config::GreeksConfig{});

  /**
   * @brief Prix européen avec erreur standard et IC.
   * @throws core::DomainError si un paramètre surchargé sort du domaine
   *         (spot <= 0, maturité <= 0, vol < 0).
   */
  MonteCarloResult price_european(const market::Option& opt,
                                  const McOverrides& ov = McOverrides{});

  /// @brief Raccourci : price_european(opt, ov).price
  double price(const market::Option& opt, const McOverrides& ov = McOverrides{});

  double delta(const market::Option& opt);
  double gamma(const market::Option& opt);
  double vega (const market::Option& opt);
  double rho  (const market::Option& opt);

  const market::MarketData&   market() const noexcept { return mkt_; }
  double                      sigma()  const noexcept { return sigma_; }
  const config::McConfig&     config() const noexcept { return cfg_; }
  const config::GreeksConfig& gcfg()   const noexcept { return gcfg_; }

private:
  // Remplit z_ avec un nouveau bloc (n_paths, ou n_paths/2 paires si antithétique).
  void draw_block();

  // Évalue le prix sur le bloc courant z_ (aucun tirage consommé).
  MonteCarloResult evaluate(const market::Option& opt, const McOverrides& ov) const;

  // Prix de chaque scénario : bloc partagé (CRN) ou bloc neuf par scénario.
  std::vector<double> reprice(const market::Option& opt,
                              const std::vector<McOverrides>& scenarios);

  market::MarketData   mkt_;
  double               sigma_;
  config::McConfig     cfg_;
  config::GreeksConfig gcfg_;
  core::NormalRng      rng_;
  std::vector<double>  z_;
};

} // namespace pricing
} // namespace qp
