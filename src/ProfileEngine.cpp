#include "ProfileEngine.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
double safeRatio(size_t part, size_t whole) {
    if (whole == 0) return 0.0;
    return static_cast<double>(part) / static_cast<double>(whole);
}

ColumnOverview overviewOf(const TypedColumn& col) {
    ColumnOverview out;
    out.name = col.name;
    out.type = col.type;
    out.missing = static_cast<size_t>(std::count(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(1)));
    out.nonMissing = col.missing.size() - out.missing;
    out.missingRatio = safeRatio(out.missing, col.missing.size());

    if (col.type == ColumnType::NUMERIC) {
        std::unordered_set<double> seen;
        for (double v : std::get<std::vector<double>>(col.values)) {
            if (!std::isnan(v)) seen.insert(v);
        }
        out.unique = seen.size();
    } else {
        const auto& values = std::get<std::vector<std::string>>(col.values);
        std::unordered_set<std::string> seen;
        for (size_t r = 0; r < values.size(); ++r) {
            if (!col.missing[r]) seen.insert(values[r]);
        }
        out.unique = seen.size();
    }
    return out;
}

OutlierSummary outliersOf(const std::string& name,
                          const std::vector<double>& values,
                          const ColumnStats& stats,
                          double iqrMultiplier) {
    OutlierSummary out;
    out.name = name;
    if (stats.count == 0) {
        out.lowerFence = stats.q1;
        out.upperFence = stats.q3;
        return out;
    }

    const double iqr = stats.q3 - stats.q1;
    out.lowerFence = stats.q1 - iqrMultiplier * iqr;
    out.upperFence = stats.q3 + iqrMultiplier * iqr;
    for (double v : values) {
        if (!std::isfinite(v)) continue;
        if (v < out.lowerFence || v > out.upperFence) ++out.count;
    }
    out.ratio = safeRatio(out.count, stats.count);
    return out;
}

CategoricalSummary categoricalOf(const TypedColumn& col, size_t topN) {
    CategoricalSummary out;
    out.name = col.name;

    const auto& values = std::get<std::vector<std::string>>(col.values);
    std::unordered_map<std::string, size_t> counts;
    std::vector<std::string> firstSeen;
    for (size_t r = 0; r < values.size(); ++r) {
        if (col.missing[r]) continue;
        ++out.nonMissing;
        auto [it, inserted] = counts.emplace(values[r], 0);
        if (inserted) firstSeen.push_back(values[r]);
        ++it->second;
    }
    out.unique = counts.size();

    std::vector<std::pair<std::string, size_t>> ranked;
    ranked.reserve(firstSeen.size());
    for (const auto& v : firstSeen) ranked.emplace_back(v, counts[v]);
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    if (ranked.size() > topN) ranked.resize(topN);
    out.topCategories = std::move(ranked);
    return out;
}
} // namespace

namespace ProfileEngine {

size_t countDuplicateRows(const TypedDataset& data) {
    std::unordered_set<std::string> seen;
    seen.reserve(data.rowCount());
    size_t duplicates = 0;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (!seen.insert(data.rowKey(r)).second) ++duplicates;
    }
    return duplicates;
}

DatasetProfile profile(const TypedDataset& data, double iqrMultiplier, size_t topCategories) {
    DatasetProfile out;
    out.rows = data.rowCount();
    out.columns = data.colCount();

    const auto& columns = data.columns();
    out.overview.reserve(columns.size());
    for (const auto& col : columns) out.overview.push_back(overviewOf(col));

    const std::vector<size_t> numericIdx = data.numericColumnIndices();
    out.numeric.resize(numericIdx.size());
    out.outliers.resize(numericIdx.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t k = 0; k < numericIdx.size(); ++k) {
        const TypedColumn& col = columns[numericIdx[k]];
        const auto& values = std::get<std::vector<double>>(col.values);
        NumericSummary summary{col.name, Statistics::calculateStats(values)};
        out.outliers[k] = outliersOf(col.name, values, summary.stats, iqrMultiplier);
        out.numeric[k] = std::move(summary);
    }

    for (size_t idx : data.categoricalColumnIndices()) {
        out.categorical.push_back(categoricalOf(columns[idx], topCategories));
    }

    out.quality.duplicateRows = countDuplicateRows(data);
    out.quality.duplicateRatio = safeRatio(out.quality.duplicateRows, out.rows);
    out.quality.numericColumns = numericIdx.size();
    out.quality.categoricalColumns = out.categorical.size();
    return out;
}

std::vector<ColumnShapeStats> shapeStats(const DatasetProfile& profile) {
    std::vector<ColumnShapeStats> out;
    out.reserve(profile.numeric.size());
    for (const auto& summary : profile.numeric) {
        out.push_back({summary.name, summary.stats.skewness, summary.stats.kurtosis});
    }
    return out;
}

} // namespace ProfileEngine
