#pragma once
#include "DistributionInterpreter.h"
#include "Statistics.h"
#include "TypedDataset.h"

#include <string>
#include <utility>
#include <vector>

struct ColumnOverview {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    size_t nonMissing = 0;
    size_t missing = 0;
    double missingRatio = 0.0;
    size_t unique = 0;
};

struct NumericSummary {
    std::string name;
    ColumnStats stats;
};

struct OutlierSummary {
    std::string name;
    double lowerFence = 0.0;
    double upperFence = 0.0;
    size_t count = 0;
    double ratio = 0.0;
};

struct CategoricalSummary {
    std::string name;
    size_t nonMissing = 0;
    size_t unique = 0;
    // Most frequent values, count descending; ties keep first-seen order.
    std::vector<std::pair<std::string, size_t>> topCategories;
};

struct DataQualitySummary {
    size_t duplicateRows = 0;
    double duplicateRatio = 0.0;
    size_t numericColumns = 0;
    size_t categoricalColumns = 0;
};

struct DatasetProfile {
    size_t rows = 0;
    size_t columns = 0;
    std::vector<ColumnOverview> overview;
    std::vector<NumericSummary> numeric;
    std::vector<OutlierSummary> outliers;
    std::vector<CategoricalSummary> categorical;
    DataQualitySummary quality;
};

namespace ProfileEngine {
/**
 * @brief Univariate profile of every column plus dataset-level quality counts.
 * @details Numeric statistics run per column in parallel. Outlier fences are Tukey fences
 *          q1 - k*IQR and q3 + k*IQR with k = iqrMultiplier.
 */
DatasetProfile profile(const TypedDataset& data, double iqrMultiplier = 1.5, size_t topCategories = 10);

/**
 * @brief Skewness and kurtosis per numeric column, in column order.
 */
std::vector<ColumnShapeStats> shapeStats(const DatasetProfile& profile);

size_t countDuplicateRows(const TypedDataset& data);
}
