#include <qp/core/normal_rng.hpp>

#include <algorithm>
#include <random>
#include <utility>

namespace qp {
namespace core {

// Graine par défaut : partie fractionnaire du nombre d'or sur 64 bits.
static constexpr std::uint64_t kGoldenSeed = 0x9E3779B97F4A7C15ULL;

struct NormalRng::Impl {
  std::mt19937_64 eng;  // flux 64 bits
  std::normal_distribution<double> nd{0.0, 1.0};

  explicit Impl(std::uint64_t seed) : eng(seed) {}
};

NormalRng::NormalRng() : NormalRng(kGoldenSeed) {}

NormalRng::NormalRng(std::uint64_t seed)
    : pimpl_(std::make_unique<Impl>(seed)), seed_(seed) {}

NormalRng::NormalRng(const NormalRng& rhs)
    : NormalRng(rhs.seed_) {}

// Copy-and-swap : l'état courant du moteur source n'est jamais recopié.
NormalRng& NormalRng::operator=(const NormalRng& rhs) {
  NormalRng fresh(rhs.seed_);
  std::swap(pimpl_, fresh.pimpl_);
  seed_ = fresh.seed_;
  return *this;
}

NormalRng::NormalRng(NormalRng&&) noexcept = default;
NormalRng& NormalRng::operator=(NormalRng&&) noexcept = default;
NormalRng::~NormalRng() noexcept = default;

double NormalRng::sample() noexcept {
  Impl& st = *pimpl_;
  return st.nd(st.eng);
}

void NormalRng::sample_block(std::vector<double>& out, std::size_t n) {
  Impl& st = *pimpl_;
  out.resize(n);
  std::generate(out.begin(), out.end(), [&st] { return st.nd(st.eng); });
}

} // namespace core
} // namespace qp
