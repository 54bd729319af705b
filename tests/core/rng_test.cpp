#include "core/rng.hpp"

#include <catch2/catch.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

TEST_CASE("Equal seeds give identical streams", "[core][rng]") {
  rsa::core::Rng a(1234);
  rsa::core::Rng b(1234);
  for (int i = 0; i < 100; ++i) {
    REQUIRE(a.NextU64() == b.NextU64());
    REQUIRE(a.Normal() == b.Normal());
  }

  rsa::core::Rng c(1235);
  rsa::core::Rng d(1234);
  bool differs = false;
  for (int i = 0; i < 10; ++i) {
    differs = differs || c.NextU64() != d.NextU64();
  }
  REQUIRE(differs);
}

TEST_CASE("Reseeding restarts the stream", "[core][rng]") {
  rsa::core::Rng rng(9);
  std::vector<std::uint64_t> first;
  for (int i = 0; i < 5; ++i) {
    first.push_back(rng.NextU64());
  }
  static_cast<void>(rng.Normal());
  rng.Reseed(9);
  REQUIRE(rng.Seed() == 9U);
  for (const std::uint64_t expected : first) {
    REQUIRE(rng.NextU64() == expected);
  }
}

TEST_CASE("Samples stay in range and have the right moments", "[core][rng]") {
  rsa::core::Rng rng(77);
  double uniform_sum = 0.0;
  double normal_sum = 0.0;
  double normal_sq = 0.0;
  constexpr int kSamples = 200000;
  for (int i = 0; i < kSamples; ++i) {
    const double u = rng.Uniform();
    REQUIRE(u >= 0.0);
    REQUIRE(u < 1.0);
    uniform_sum += u;
    const double z = rng.Normal();
    normal_sum += z;
    normal_sq += z * z;
    REQUIRE(rng.UniformIndex(7) < 7U);
  }
  REQUIRE(uniform_sum / kSamples == Catch::Detail::Approx(0.5).margin(0.01));
  REQUIRE(normal_sum / kSamples == Catch::Detail::Approx(0.0).margin(0.01));
  REQUIRE(normal_sq / kSamples == Catch::Detail::Approx(1.0).margin(0.02));
}
