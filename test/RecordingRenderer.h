#pragma once
#include "ChartRenderer.h"

#include <string>
#include <vector>

// Records calls instead of drawing; returns "<id>.png" unless told to fail.
struct RecordingRenderer final : ChartRenderer
{
  bool fail = false;
  int heatmapCalls = 0;
  int histogramCalls = 0;
  int barCalls = 0;
  std::vector<std::string> lastLabels;
  std::vector<std::vector<double>> lastMatrix;
  double lastMin = 0.0;
  double lastMax = 0.0;

  bool isAvailable() const override
  {
    return !fail;
  }

  std::string heatmap(std::string const &id,
                      std::vector<std::vector<double>> const &matrix,
                      std::string const &,
                      std::vector<std::string> const &labels,
                      double scaleMin,
                      double scaleMax) override
  {
    ++heatmapCalls;
    lastMatrix = matrix;
    lastLabels = labels;
    lastMin = scaleMin;
    lastMax = scaleMax;
    return fail ? "" : id + ".png";
  }

  std::string histogram(std::string const &id, std::vector<double> const &, std::string const &) override
  {
    ++histogramCalls;
    return fail ? "" : id + ".png";
  }

  std::string bar(std::string const &id,
                  std::vector<std::string> const &,
                  std::vector<double> const &,
                  std::string const &) override
  {
    ++barCalls;
    return fail ? "" : id + ".png";
  }
};
