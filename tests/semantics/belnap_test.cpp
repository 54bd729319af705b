#include "semantics/belnap.hpp"

#include <catch2/catch.hpp>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace {

using rsa::semantics::BelnapValue;
using rsa::semantics::kAllBelnapValues;
using BinaryOp = std::function<BelnapValue(BelnapValue, BelnapValue)>;

std::vector<std::pair<std::string, BinaryOp>> AllBinaryOps() {
  return {
      {"and", rsa::semantics::And},
      {"or", rsa::semantics::Or},
      {"consensus", rsa::semantics::Consensus},
      {"gullibility", rsa::semantics::Gullibility},
  };
}

} // namespace

TEST_CASE("Belnap values map to (truth, falsity) supports", "[semantics][belnap]") {
  using rsa::semantics::FromSupports;
  REQUIRE(FromSupports(false, false) == BelnapValue::kUnknown);
  REQUIRE(FromSupports(true, false) == BelnapValue::kTrue);
  REQUIRE(FromSupports(false, true) == BelnapValue::kFalse);
  REQUIRE(FromSupports(true, true) == BelnapValue::kContradictory);

  for (const BelnapValue v : kAllBelnapValues) {
    REQUIRE(FromSupports(rsa::semantics::HasTruthSupport(v),
                         rsa::semantics::HasFalsitySupport(v)) == v);
  }
}

TEST_CASE("Belnap truth-order tables", "[semantics][belnap]") {
  using rsa::semantics::And;
  using rsa::semantics::Not;
  using rsa::semantics::Or;

  REQUIRE(And(BelnapValue::kTrue, BelnapValue::kFalse) == BelnapValue::kFalse);
  REQUIRE(And(BelnapValue::kUnknown, BelnapValue::kContradictory) == BelnapValue::kFalse);
  REQUIRE(And(BelnapValue::kTrue, BelnapValue::kUnknown) == BelnapValue::kUnknown);
  REQUIRE(Or(BelnapValue::kUnknown, BelnapValue::kContradictory) == BelnapValue::kTrue);
  REQUIRE(Or(BelnapValue::kFalse, BelnapValue::kContradictory) == BelnapValue::kContradictory);

  REQUIRE(Not(BelnapValue::kTrue) == BelnapValue::kFalse);
  REQUIRE(Not(BelnapValue::kFalse) == BelnapValue::kTrue);
  REQUIRE(Not(BelnapValue::kUnknown) == BelnapValue::kUnknown);
  REQUIRE(Not(BelnapValue::kContradictory) == BelnapValue::kContradictory);
}

TEST_CASE("Belnap knowledge-order tables", "[semantics][belnap]") {
  using rsa::semantics::Consensus;
  using rsa::semantics::Gullibility;

  REQUIRE(Consensus(BelnapValue::kTrue, BelnapValue::kFalse) == BelnapValue::kUnknown);
  REQUIRE(Consensus(BelnapValue::kContradictory, BelnapValue::kTrue) == BelnapValue::kTrue);
  REQUIRE(Gullibility(BelnapValue::kTrue, BelnapValue::kFalse) == BelnapValue::kContradictory);
  REQUIRE(Gullibility(BelnapValue::kUnknown, BelnapValue::kFalse) == BelnapValue::kFalse);
}

TEST_CASE("Belnap binary operators are commutative, associative and idempotent",
          "[semantics][belnap][laws]") {
  for (const auto& [name, op] : AllBinaryOps()) {
    INFO("operator " << name);
    for (const BelnapValue a : kAllBelnapValues) {
      REQUIRE(op(a, a) == a);
      for (const BelnapValue b : kAllBelnapValues) {
        REQUIRE(op(a, b) == op(b, a));
        for (const BelnapValue c : kAllBelnapValues) {
          REQUIRE(op(a, op(b, c)) == op(op(a, b), c));
        }
      }
    }
  }
}

TEST_CASE("Belnap absorption, double negation and De Morgan hold",
          "[semantics][belnap][laws]") {
  using namespace rsa::semantics;
  for (const BelnapValue a : kAllBelnapValues) {
    REQUIRE(Not(Not(a)) == a);
    for (const BelnapValue b : kAllBelnapValues) {
      REQUIRE(And(a, Or(a, b)) == a);
      REQUIRE(Or(a, And(a, b)) == a);
      REQUIRE(Consensus(a, Gullibility(a, b)) == a);
      REQUIRE(Gullibility(a, Consensus(a, b)) == a);

      REQUIRE(Not(And(a, b)) == Or(Not(a), Not(b)));
      REQUIRE(Not(Or(a, b)) == And(Not(a), Not(b)));
      // Negation is monotone in the knowledge order.
      REQUIRE(Not(Consensus(a, b)) == Consensus(Not(a), Not(b)));
      REQUIRE(Not(Gullibility(a, b)) == Gullibility(Not(a), Not(b)));
    }
  }
}

TEST_CASE("Every Belnap binary operator distributes over every other",
          "[semantics][belnap][laws]") {
  const auto ops = AllBinaryOps();
  std::size_t checked_pairs = 0;
  for (const auto& [outer_name, outer] : ops) {
    for (const auto& [inner_name, inner] : ops) {
      if (outer_name == inner_name) {
        continue;
      }
      INFO(outer_name << " over " << inner_name);
      for (const BelnapValue a : kAllBelnapValues) {
        for (const BelnapValue b : kAllBelnapValues) {
          for (const BelnapValue c : kAllBelnapValues) {
            REQUIRE(outer(a, inner(b, c)) == inner(outer(a, b), outer(a, c)));
          }
        }
      }
      ++checked_pairs;
    }
  }
  REQUIRE(checked_pairs == 12U);
}

TEST_CASE("Belnap values parse and print", "[semantics][belnap]") {
  BelnapValue parsed = BelnapValue::kUnknown;
  std::string error;
  for (const BelnapValue v : kAllBelnapValues) {
    REQUIRE(rsa::semantics::ParseBelnapValue(rsa::semantics::ToString(v), parsed, error));
    REQUIRE(parsed == v);
  }
  REQUIRE(rsa::semantics::ParseBelnapValue("both", parsed, error));
  REQUIRE(parsed == BelnapValue::kContradictory);
  REQUIRE(rsa::semantics::ParseBelnapValue("neither", parsed, error));
  REQUIRE(parsed == BelnapValue::kUnknown);
  REQUIRE_FALSE(rsa::semantics::ParseBelnapValue("maybe", parsed, error));
  REQUIRE(error.find("maybe") != std::string::npos);
}
