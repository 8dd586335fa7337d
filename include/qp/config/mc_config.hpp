#pragma once
/**
 * @file mc_config.hpp
 * @brief Configuration d'un run Monte Carlo européen.
 *
 * # Contenu
 * - n_paths        : nombre de trajectoires physiques simulées par prix (>= 1).
 * - seed           : graine du flux privé du pricer.
 * - use_antithetic : si true, paires (Z, -Z) ; l'unité statistique devient la paire
 *                    et n_paths/2 tirages sont consommés.
 *
 * La config est une valeur : le pricer la copie à la construction.
 */

#include <cstddef>
#include <cstdint>

namespace qp {
namespace config {

struct McConfig {
  std::size_t   n_paths;
  std::uint64_t seed;
  bool          use_antithetic;

  McConfig(std::size_t n_paths = 100'000,
           std::uint64_t seed = 42ULL,
           bool use_antithetic = false) noexcept
      : n_paths(n_paths), seed(seed), use_antithetic(use_antithetic) {}
};

} // namespace config
} // namespace qp
