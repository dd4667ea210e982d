#include "CogniaExceptions.h"
#include "FeatureMatrix.h"
#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();
}

TEST_CASE("FeatureMatrix construction", "[matrix]")
{
  SECTION("Valid grid keeps label order")
  {
    FeatureMatrix m({"a", "b", "c"}, {{1.0, 0.2, -0.5}, {0.2, 1.0, NaN}, {-0.5, NaN, 1.0}});
    CHECK(m.size() == 3);
    CHECK_FALSE(m.empty());
    CHECK(m.labels()[2] == "c");
    CHECK(m.at(0, 2) == Approx(-0.5));
    CHECK(std::isnan(m.at(1, 2)));
  }

  SECTION("Empty matrix is allowed")
  {
    FeatureMatrix m({}, {});
    CHECK(m.empty());
    CHECK(FeatureMatrix().size() == 0);
  }

  SECTION("Non-square grid throws")
  {
    CHECK_THROWS_AS(FeatureMatrix({"a", "b"}, {{1.0, 0.1}, {0.1}}), Cognia::InvalidInputShapeException);
  }

  SECTION("Label count mismatch throws")
  {
    CHECK_THROWS_AS(FeatureMatrix({"a"}, {{1.0, 0.1}, {0.1, 1.0}}), Cognia::InvalidInputShapeException);
  }

  SECTION("Duplicate labels throw")
  {
    CHECK_THROWS_AS(FeatureMatrix({"a", "a"}, {{1.0, 0.1}, {0.1, 1.0}}), Cognia::InvalidInputShapeException);
  }

  SECTION("Asymmetric grid throws")
  {
    CHECK_THROWS_AS(FeatureMatrix({"a", "b"}, {{1.0, 0.1}, {0.3, 1.0}}), Cognia::InvalidInputShapeException);
    CHECK_THROWS_AS(FeatureMatrix({"a", "b"}, {{1.0, NaN}, {0.3, 1.0}}), Cognia::InvalidInputShapeException);
  }

  SECTION("Non-unit diagonal throws")
  {
    CHECK_THROWS_AS(FeatureMatrix({"a", "b"}, {{0.9, 0.1}, {0.1, 1.0}}), Cognia::InvalidInputShapeException);
  }

  SECTION("Tiny asymmetry within tolerance is accepted")
  {
    CHECK_NOTHROW(FeatureMatrix({"a", "b"}, {{1.0, 0.5}, {0.5 + 1e-12, 1.0}}));
  }
}

TEST_CASE("FeatureMatrix from mapping", "[matrix]")
{
  FeatureMatrix::Mapping mapping{
    {"x", {{"x", 1.0}, {"y", 0.8}}},
    {"y", {{"x", 0.8}, {"y", 1.0}}},
  };

  SECTION("Order argument fixes row order")
  {
    auto const m = FeatureMatrix::fromMapping({"y", "x"}, mapping);
    CHECK(m.labels() == std::vector<std::string>{"y", "x"});
    CHECK(m.at(0, 1) == Approx(0.8));
  }

  SECTION("Missing cell throws")
  {
    mapping["y"].erase("x");
    mapping["y"]["z"] = 0.0;
    CHECK_THROWS_AS(FeatureMatrix::fromMapping({"x", "y"}, mapping), Cognia::InvalidInputShapeException);
  }

  SECTION("Order naming an unknown feature throws")
  {
    CHECK_THROWS_AS(FeatureMatrix::fromMapping({"x", "q"}, mapping), Cognia::InvalidInputShapeException);
  }
}
