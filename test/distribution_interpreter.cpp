#include "CogniaExceptions.h"
#include "DistributionInterpreter.h"
#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

using Catch::Matchers::Contains;

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();

ShapeInterpretation one(double skew, double kurt)
{
  auto const out = DistributionInterpreter::interpret({{"x", skew, kurt}});
  REQUIRE(out.size() == 1);
  return out[0];
}
} // namespace

TEST_CASE("Shape classification", "[interpret]")
{
  SECTION("Symmetric with moderate tails")
  {
    auto const r = one(0.0, 0.0);
    CHECK(r.skewShape == SkewShape::Symmetric);
    CHECK(r.tailShape == TailShape::Moderate);
    CHECK_THAT(r.narrative, Contains("approximately symmetric"));
    CHECK_THAT(r.narrative, Contains("moderate tails"));
  }

  SECTION("Right skew with heavy tails")
  {
    auto const r = one(1.2, 2.5);
    CHECK(r.skewShape == SkewShape::RightSkewed);
    CHECK(r.tailShape == TailShape::Heavy);
    CHECK_THAT(r.narrative, Contains("right-skewed"));
    CHECK_THAT(r.narrative, Contains("heavy tails"));
  }

  SECTION("Left skew with light tails")
  {
    auto const r = one(-0.8, -1.5);
    CHECK(r.skewShape == SkewShape::LeftSkewed);
    CHECK(r.tailShape == TailShape::Light);
    CHECK_THAT(r.narrative, Contains("left-skewed"));
    CHECK_THAT(r.narrative, Contains("light tails"));
  }

  SECTION("Boundaries fall outside the moderate band")
  {
    CHECK(one(0.5, 0.0).skewShape == SkewShape::RightSkewed);
    CHECK(one(-0.5, 0.0).skewShape == SkewShape::LeftSkewed);
    CHECK(one(0.0, 1.0).tailShape == TailShape::Heavy);
    CHECK(one(0.0, -1.0).tailShape == TailShape::Light);
    CHECK(one(0.4999, 0.9999).skewShape == SkewShape::Symmetric);
    CHECK(one(0.4999, 0.9999).tailShape == TailShape::Moderate);
  }

  SECTION("Skew sentence comes before the kurtosis sentence")
  {
    auto const r = one(0.0, 0.0);
    CHECK(r.narrative ==
          "The distribution is approximately symmetric. "
          "The distribution has moderate tails, similar to a normal distribution.");
  }

  SECTION("Non-finite values are undefined, never left-skewed")
  {
    auto const r = one(NaN, NaN);
    CHECK(r.skewShape == SkewShape::Undefined);
    CHECK(r.tailShape == TailShape::Undefined);
    CHECK_THAT(r.narrative, Contains("insufficient data"));
    CHECK_THAT(r.narrative, !Contains("left-skewed"));
    CHECK(std::isnan(r.skewness));
    CHECK(std::isnan(r.kurtosis));

    CHECK(one(std::numeric_limits<double>::infinity(), 0.0).skewShape == SkewShape::Undefined);
  }

  SECTION("Values are rounded but classified unrounded")
  {
    auto const r = one(0.49951, -0.99951);
    CHECK(r.skewness == Approx(0.5));
    CHECK(r.kurtosis == Approx(-1.0));
    CHECK(r.skewShape == SkewShape::Symmetric);
    CHECK(r.tailShape == TailShape::Moderate);
    CHECK(one(1.23456, 2.0).skewness == Approx(1.235));
  }
}

TEST_CASE("interpret over many columns", "[interpret]")
{
  SECTION("Order preserved, one output per input")
  {
    auto const out = DistributionInterpreter::interpret({{"b", 2.0, 0.0}, {"a", 0.0, 3.0}, {"c", -1.0, -2.0}});
    REQUIRE(out.size() == 3);
    CHECK(out[0].column == "b");
    CHECK(out[1].column == "a");
    CHECK(out[2].column == "c");
  }

  SECTION("Empty input gives empty output")
  {
    CHECK(DistributionInterpreter::interpret({}).empty());
  }

  SECTION("Duplicate or empty column names throw")
  {
    CHECK_THROWS_AS(DistributionInterpreter::interpret({{"x", 0.0, 0.0}, {"x", 1.0, 1.0}}),
                    Cognia::InvalidInputShapeException);
    CHECK_THROWS_AS(DistributionInterpreter::interpret({{"", 0.0, 0.0}}), Cognia::InvalidInputShapeException);
  }
}

TEST_CASE("Rule tables", "[interpret]")
{
  auto const &skew = DistributionInterpreter::skewnessRules();
  auto const &kurt = DistributionInterpreter::kurtosisRules();
  REQUIRE(skew.size() == 4);
  REQUIRE(kurt.size() == 4);
  CHECK(skew.front().shape == SkewShape::Undefined);
  CHECK(kurt.front().shape == TailShape::Undefined);
  CHECK(DistributionInterpreter::skewLabel(SkewShape::RightSkewed) == "right-skewed");
  CHECK(DistributionInterpreter::tailLabel(TailShape::Light) == "light tails");
  CHECK(DistributionInterpreter::classifySkewness(-3.0).shape == SkewShape::LeftSkewed);
  CHECK(DistributionInterpreter::classifyKurtosis(0.3).shape == TailShape::Moderate);
}
