#include "ProfileEngine.h"
#include <catch2/catch.hpp>

#include <cmath>
#include <sstream>

namespace {
TypedDataset sample()
{
  std::istringstream in("id,value,group,flag\n"
                        "1,10,a,x\n"
                        "2,11,a,x\n"
                        "3,12,b,\n"
                        "4,13,a,x\n"
                        "5,100,c,x\n"
                        "5,100,c,x\n");
  TypedDataset data("sample.csv");
  data.load(in);
  return data;
}
} // namespace

TEST_CASE("Dataset profile", "[profile]")
{
  auto const data = sample();
  auto const p = ProfileEngine::profile(data, 1.5, 2);

  SECTION("Overview counts")
  {
    CHECK(p.rows == 6);
    CHECK(p.columns == 4);
    REQUIRE(p.overview.size() == 4);
    CHECK(p.overview[0].type == ColumnType::NUMERIC);
    CHECK(p.overview[0].unique == 5);
    CHECK(p.overview[3].missing == 1);
    CHECK(p.overview[3].missingRatio == Approx(1.0 / 6.0));
    CHECK(p.overview[3].unique == 1);
  }

  SECTION("Numeric summaries in column order")
  {
    REQUIRE(p.numeric.size() == 2);
    CHECK(p.numeric[0].name == "id");
    CHECK(p.numeric[1].name == "value");
    CHECK(p.numeric[1].stats.max == Approx(100.0));
  }

  SECTION("IQR outliers")
  {
    REQUIRE(p.outliers.size() == 2);
    auto const &value = p.outliers[1];
    // q1 = 11.25, q3 = 78.25 by linear interpolation
    CHECK(value.lowerFence == Approx(11.25 - 1.5 * 67.0));
    CHECK(value.upperFence == Approx(78.25 + 1.5 * 67.0));
    CHECK(value.count == 0);
    CHECK(p.outliers[0].count == 0);
  }

  SECTION("Categorical top values")
  {
    REQUIRE(p.categorical.size() == 2);
    auto const &group = p.categorical[0];
    CHECK(group.name == "group");
    CHECK(group.unique == 3);
    REQUIRE(group.topCategories.size() == 2);
    CHECK(group.topCategories[0].first == "a");
    CHECK(group.topCategories[0].second == 3);
    CHECK(group.topCategories[1].first == "c");
  }

  SECTION("Data quality")
  {
    CHECK(p.quality.duplicateRows == 1);
    CHECK(p.quality.duplicateRatio == Approx(1.0 / 6.0));
    CHECK(p.quality.numericColumns == 2);
    CHECK(p.quality.categoricalColumns == 2);
  }

  SECTION("Shape stats feed the interpreter")
  {
    auto const shapes = ProfileEngine::shapeStats(p);
    REQUIRE(shapes.size() == 2);
    CHECK(shapes[1].column == "value");
    CHECK(shapes[1].skewness > 0.5);
  }
}

TEST_CASE("Outlier detection flags far values", "[profile]")
{
  std::istringstream in("v\n1\n2\n3\n4\n5\n6\n7\n8\n9\n200\n");
  TypedDataset data("outliers.csv");
  data.load(in);
  auto const p = ProfileEngine::profile(data);
  REQUIRE(p.outliers.size() == 1);
  CHECK(p.outliers[0].count == 1);
  CHECK(p.outliers[0].ratio == Approx(0.1));
}

TEST_CASE("Empty dataset profiles without throwing", "[profile]")
{
  std::istringstream in("a,b\n");
  TypedDataset data("empty.csv");
  data.load(in);
  auto const p = ProfileEngine::profile(data);
  CHECK(p.rows == 0);
  CHECK(p.numeric.empty());
  CHECK(p.quality.duplicateRows == 0);
  CHECK(p.quality.duplicateRatio == Approx(0.0));
}

TEST_CASE("Duplicate rows compare exact values", "[profile]")
{
  auto count = [](std::string const &text) {
    std::istringstream in(text);
    TypedDataset data("dups.csv");
    data.load(in);
    return ProfileEngine::countDuplicateRows(data);
  };

  SECTION("Tiny distinct values are not duplicates")
  {
    CHECK(count("x\n1e-13\n2e-13\n3e-13\n") == 0);
  }

  SECTION("Signed zero is one value")
  {
    CHECK(count("x\n0\n-0\n") == 1);
  }

  SECTION("Differences past 12 decimals are kept apart")
  {
    CHECK(count("x,y\n0.1000000000001,a\n0.1000000000002,a\n") == 0);
    CHECK(count("x,y\n0.1,a\n0.10,a\n") == 1);
  }

  SECTION("No false alert from near-equal rows")
  {
    std::istringstream in("x\n1e-13\n2e-13\n3e-13\n");
    TypedDataset data("dups.csv");
    data.load(in);
    auto const p = ProfileEngine::profile(data);
    CHECK(p.quality.duplicateRows == 0);
    CHECK(p.overview[0].unique == 3);
  }
}

TEST_CASE("Infinite values are profiled as numeric", "[profile]")
{
  std::istringstream in("v\n1\n2\n3\ninf\n");
  TypedDataset data("inf.csv");
  data.load(in);
  auto const p = ProfileEngine::profile(data);
  REQUIRE(p.numeric.size() == 1);
  CHECK(p.numeric[0].stats.count == 3);
  CHECK(p.numeric[0].stats.max == Approx(3.0));
  CHECK(p.overview[0].unique == 4);
}
