#include "Statistics.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats{0, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN};

    std::vector<double> finite;
    finite.reserve(col.size());
    for (double value : col) {
        if (std::isfinite(value)) {
            finite.push_back(value);
        }
    }
    const size_t n = finite.size();
    stats.count = n;
    if (n == 0) return stats;

    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : finite) {
        ++count;
        double delta = value - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.mean = mean;
    stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : kNaN;
    stats.stddev = std::sqrt(stats.variance);

    const auto [minIt, maxIt] = std::minmax_element(finite.begin(), finite.end());
    stats.min = *minIt;
    stats.max = *maxIt;
    stats.median = CommonUtils::medianByNth(finite);
    stats.q1 = CommonUtils::quantileByNth(finite, 0.25);
    stats.q3 = CommonUtils::quantileByNth(finite, 0.75);

    if (n > 2 && stats.stddev > 0) {
        double m3 = 0, m4 = 0;
        for (double val : finite) {
            double diff = val - stats.mean;
            double diff2 = diff * diff;
            m3 += diff2 * diff;
            m4 += diff2 * diff2;
        }

        const double nd = static_cast<double>(n);
        double term1 = nd / ((nd - 1.0) * (nd - 2.0));
        double stddev2 = stats.stddev * stats.stddev;
        double stddev3 = stddev2 * stats.stddev;
        stats.skewness = term1 * (m3 / stddev3);

        if (n > 3) {
            double termK1 = (nd * (nd + 1.0)) / ((nd - 1.0) * (nd - 2.0) * (nd - 3.0));
            double nMinus1 = (nd - 1.0);
            double termK2 = (3.0 * nMinus1 * nMinus1) / ((nd - 2.0) * (nd - 3.0));
            double stddev4 = stddev2 * stddev2;
            stats.kurtosis = termK1 * (m4 / stddev4) - termK2;
        }
    }

    return stats;
}

std::optional<double> Statistics::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());

    double meanX = 0.0;
    double meanY = 0.0;
    size_t pairs = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
        ++pairs;
        meanX += (x[i] - meanX) / static_cast<double>(pairs);
        meanY += (y[i] - meanY) / static_cast<double>(pairs);
    }
    if (pairs < 2) return std::nullopt;

    double sxx = 0.0;
    double syy = 0.0;
    double sxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
        const double dx = x[i] - meanX;
        const double dy = y[i] - meanY;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;

    const double r = sxy / std::sqrt(sxx * syy);
    return std::clamp(r, -1.0, 1.0);
}

FeatureMatrix Statistics::correlationMatrix(const TypedDataset& data) {
    const std::vector<size_t> numericIdx = data.numericColumnIndices();
    const size_t p = numericIdx.size();

    std::vector<std::string> labels;
    std::vector<const std::vector<double>*> series;
    labels.reserve(p);
    series.reserve(p);
    for (size_t idx : numericIdx) {
        const TypedColumn& col = data.columns()[idx];
        labels.push_back(col.name);
        series.push_back(&std::get<std::vector<double>>(col.values));
    }

    FeatureMatrix::Grid grid(p, std::vector<double>(p, kNaN));
    for (size_t i = 0; i < p; ++i) grid[i][i] = 1.0;

    // Rows are independent; each (i, j) cell and its mirror are written by row i only.
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i + 1; j < p; ++j) {
            const std::optional<double> r = pearson(*series[i], *series[j]);
            const double value = r.value_or(kNaN);
            grid[i][j] = value;
            grid[j][i] = value;
        }
    }

    return FeatureMatrix(std::move(labels), std::move(grid));
}
