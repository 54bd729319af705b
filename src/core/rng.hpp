#pragma once

#include <cstddef>
#include <cstdint>

namespace rsa::core {

// Seedable pseudo-random source owned by one controller instance.
//
// Contract:
// - same seed => bit-identical sequences on every platform (no reliance on
//   implementation-defined std:: distributions).
// - never shared between controllers; callers pass it by reference.
class Rng {
public:
  explicit Rng(std::uint64_t seed = 1);

  void Reseed(std::uint64_t seed);
  std::uint64_t Seed() const {
    return seed_;
  }

  std::uint64_t NextU64();

  // Uniform double in [0, 1).
  double Uniform();

  // Standard normal sample (Box-Muller; the paired sample is cached).
  double Normal();

  // Uniform index in [0, n). `n` must be > 0.
  std::size_t UniformIndex(std::size_t n);

private:
  std::uint64_t seed_ = 1;
  std::uint64_t state_ = 0;
  bool has_spare_normal_ = false;
  double spare_normal_ = 0.0;
};

} // namespace rsa::core
