#pragma once
/**
 * @file normal_rng.hpp
 * @brief Flux privé de tirages N(0,1), reconstructible depuis sa graine.
 *
 * # Reproductibilité
 * Deux instances construites avec la même graine produisent la même séquence.
 * La copie ne copie que la graine : la copie redémarre la séquence au début.
 *
 * # Concurrence
 * Un flux par pricer (et donc par thread). Une même instance n'est pas thread-safe.
 */

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

namespace qp {
namespace core {

class NormalRng {
public:
  /// @brief Graine par défaut documentée (voir .cpp).
  NormalRng();
  explicit NormalRng(std::uint64_t seed);

  /// @brief Un tirage N(0,1).
  double sample() noexcept;

  /// @brief Remplace le contenu de out par n tirages consécutifs du flux.
  void sample_block(std::vector<double>& out, std::size_t n);

  std::uint64_t seed() const noexcept { return seed_; }

  // Copie "seed-only" ; déplacement = transfert de l'état.
  NormalRng(const NormalRng&);
  NormalRng& operator=(const NormalRng&);
  NormalRng(NormalRng&&) noexcept;
  NormalRng& operator=(NormalRng&&) noexcept;
  ~NormalRng() noexcept;

private:
  struct Impl;                 // cache <random> hors de l'API
  std::unique_ptr<Impl> pimpl_;
  std::uint64_t seed_;
};

} // namespace core
} // namespace qp
