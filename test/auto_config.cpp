#include "AutoConfig.h"
#include "CogniaExceptions.h"
#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using Catch::Matchers::Contains;

namespace {
AutoConfig parse(std::vector<std::string> args)
{
  args.insert(args.begin(), "cognia");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  return AutoConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}
} // namespace

TEST_CASE("Command line options", "[config]")
{
  SECTION("Defaults")
  {
    auto const c = parse({"data.csv"});
    CHECK(c.datasetPath == "data.csv");
    CHECK(c.reportFile == "cognia_eda_report.html");
    CHECK(c.corrThreshold == Approx(0.6));
    CHECK(c.corrTopN == 10);
    CHECK(c.fullHeatmapMaxFeatures == 10);
    CHECK_FALSE(c.showFullCorrelation);
    CHECK(c.plotCharts);
    CHECK(c.plot.format == "png");
  }

  SECTION("Overrides")
  {
    auto const c = parse({"data.csv", "-o", "out.html", "--show-full-correlation", "--corr-threshold", "0.75",
                          "--corr-top-n", "3", "--delimiter", "tab", "--plot-charts", "false", "--verbose"});
    CHECK(c.reportFile == "out.html");
    CHECK(c.showFullCorrelation);
    CHECK(c.corrThreshold == Approx(0.75));
    CHECK(c.corrTopN == 3);
    CHECK(c.delimiter == '\t');
    CHECK_FALSE(c.plotCharts);
    CHECK(c.verbose);
  }

  SECTION("Invalid values throw")
  {
    CHECK_THROWS_AS(parse({}), Cognia::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--corr-threshold", "1.5"}), Cognia::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--corr-threshold", "abc"}), Cognia::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--plot-format", "gif"}), Cognia::ConfigurationException);
    CHECK_THROWS_AS(parse({"data.csv", "--corr-top-n"}), Cognia::ConfigurationException);
    CHECK_THROWS_WITH(parse({"data.csv", "--no-such-flag", "1"}), Contains("Unknown option: no_such_flag"));
  }
}

TEST_CASE("Config file", "[config]")
{
  const std::string path = "cognia_test_config.yaml";
  {
    std::ofstream out(path);
    out << "# comment\n"
        << "corr_threshold: 0.8\n"
        << "\"alert_missing_ratio\": \"0.5\",\n"
        << "full-heatmap-max-features: 4\n";
  }

  SECTION("Values are merged over the base")
  {
    AutoConfig base;
    base.datasetPath = "data.csv";
    auto const c = AutoConfig::fromFile(path, base);
    CHECK(c.corrThreshold == Approx(0.8));
    CHECK(c.alerts.missingRatio == Approx(0.5));
    CHECK(c.fullHeatmapMaxFeatures == 4);
    CHECK(c.datasetPath == "data.csv");
  }

  SECTION("Bad line reports its line number")
  {
    {
      std::ofstream out(path);
      out << "corr_threshold: 0.8\n"
          << "corr_top_n: many\n";
    }
    AutoConfig base;
    base.datasetPath = "data.csv";
    CHECK_THROWS_WITH(AutoConfig::fromFile(path, base), Contains("line 2"));
  }

  SECTION("Missing file throws")
  {
    CHECK_THROWS_AS(AutoConfig::fromFile("/nonexistent/cognia.yaml", AutoConfig{}), Cognia::ConfigurationException);
  }

  std::remove(path.c_str());
}
