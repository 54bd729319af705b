#include "core/rng.hpp"

#include <cmath>
#include <numbers>

namespace rsa::core {

namespace {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;
constexpr std::uint64_t kSeedSalt = 0xa0761d6478bd642fULL;
constexpr double kTwoToMinus53 = 1.0 / 9007199254740992.0;

std::uint64_t MixSplit64(std::uint64_t state) {
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

} // namespace

Rng::Rng(const std::uint64_t seed) {
  Reseed(seed);
}

void Rng::Reseed(const std::uint64_t seed) {
  seed_ = seed;
  // Salting keeps seed 0 and small consecutive seeds well separated.
  state_ = MixSplit64(seed ^ kSeedSalt);
  has_spare_normal_ = false;
  spare_normal_ = 0.0;
}

std::uint64_t Rng::NextU64() {
  state_ += kSplitMixIncrement;
  return MixSplit64(state_);
}

double Rng::Uniform() {
  return static_cast<double>(NextU64() >> 11U) * kTwoToMinus53;
}

double Rng::Normal() {
  if (has_spare_normal_) {
    has_spare_normal_ = false;
    return spare_normal_;
  }

  // 1 - U keeps the radius argument in (0, 1] so log() stays finite.
  const double u1 = 1.0 - Uniform();
  const double u2 = Uniform();
  const double radius = std::sqrt(-2.0 * std::log(u1));
  const double theta = 2.0 * std::numbers::pi * u2;

  spare_normal_ = radius * std::sin(theta);
  has_spare_normal_ = true;
  return radius * std::cos(theta);
}

std::size_t Rng::UniformIndex(const std::size_t n) {
  if (n <= 1U) {
    return 0U;
  }
  const auto index = static_cast<std::size_t>(Uniform() * static_cast<double>(n));
  return index < n ? index : n - 1U;
}

} // namespace rsa::core
