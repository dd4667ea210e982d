#include "AlertEngine.h"
#include "Statistics.h"
#include <catch2/catch.hpp>

#include <algorithm>
#include <sstream>

using Catch::Matchers::Contains;

namespace {
std::vector<Alert> alertsFor(const std::string &csv, const AlertThresholds &thresholds = {})
{
  std::istringstream in(csv);
  TypedDataset data("alerts.csv");
  data.load(in);
  auto const profile = ProfileEngine::profile(data);
  return AlertEngine::generate(profile, Statistics::correlationMatrix(data), thresholds);
}

size_t countKind(const std::vector<Alert> &alerts, AlertKind kind)
{
  return static_cast<size_t>(
    std::count_if(alerts.begin(), alerts.end(), [kind](const Alert &a) { return a.kind == kind; }));
}
} // namespace

TEST_CASE("Alert generation", "[alerts]")
{
  SECTION("Clean data raises nothing")
  {
    auto const alerts = alertsFor("a,b\n1,5\n2,3\n3,6\n4,4\n5,5\n");
    CHECK(alerts.empty());
  }

  SECTION("Missing values and constants")
  {
    auto const alerts = alertsFor("a,b,c\n1,7,\n2,7,\n3,7,x\n4,7,y\n5,7,\n");
    REQUIRE(countKind(alerts, AlertKind::HighMissing) == 1);
    CHECK(countKind(alerts, AlertKind::Constant) == 1);
    auto const it = std::find_if(alerts.begin(), alerts.end(),
                                 [](const Alert &a) { return a.kind == AlertKind::HighMissing; });
    CHECK(it->subject == "c");
    CHECK_THAT(it->message, Contains("60.00%"));
  }

  SECTION("All-missing column")
  {
    auto const alerts = alertsFor("a,b\n1,\n2,\n");
    CHECK(countKind(alerts, AlertKind::AllMissing) == 1);
  }

  SECTION("Collinear pairs use the correlation threshold")
  {
    auto const alerts = alertsFor("x,y,z\n1,2,5\n2,4,1\n3,6,4\n4,8,2\n5,10,3\n");
    REQUIRE(countKind(alerts, AlertKind::Collinear) == 1);
    CHECK(alerts.back().subject == "x / y");
  }

  SECTION("Duplicate rows")
  {
    auto const alerts = alertsFor("a,b\n1,u\n1,u\n2,v\n");
    CHECK(countKind(alerts, AlertKind::DuplicateRows) == 1);
  }

  SECTION("Skew and outliers")
  {
    auto const alerts = alertsFor("v\n1\n2\n3\n4\n5\n6\n7\n8\n9\n200\n");
    CHECK(countKind(alerts, AlertKind::StrongSkew) == 1);
    CHECK(countKind(alerts, AlertKind::HighOutliers) == 1);
  }

  SECTION("High cardinality categorical")
  {
    auto const alerts = alertsFor("name\nann\nbob\ncid\ndan\n");
    CHECK(countKind(alerts, AlertKind::HighCardinality) == 1);

    CHECK(countKind(alertsFor("name\nann\nbob\nann\n"), AlertKind::HighCardinality) == 0);
    AlertThresholds strict;
    strict.cardinalityRatio = 0.5;
    CHECK(countKind(alertsFor("name\nann\nbob\nann\n", strict), AlertKind::HighCardinality) == 1);
  }
}

TEST_CASE("Alert kind names", "[alerts]")
{
  CHECK(AlertEngine::kindName(AlertKind::Collinear) == "collinear");
  CHECK(AlertEngine::kindName(AlertKind::HighMissing) == "high_missing");
}
