#pragma once

#include "FeatureMatrix.h"
#include "TypedDataset.h"

#include <cstddef>
#include <optional>
#include <vector>

struct ColumnStats {
    size_t count = 0;
    double mean;
    double median;
    double variance;
    double stddev;
    // Bias-corrected sample estimates; NaN when undefined (too few values or zero spread).
    double skewness;
    double kurtosis;
    double min;
    double max;
    double q1;
    double q3;
};

namespace Statistics {
/**
 * @brief Descriptive statistics over the finite values of a column.
 * @details Kurtosis is excess (Fisher) kurtosis. Skewness needs n >= 3 and kurtosis n >= 4.
 *          With no finite values every field except count is NaN.
 */
ColumnStats calculateStats(const std::vector<double>& col);

/**
 * @brief Pearson r over pairwise-complete observations.
 * @return std::nullopt when fewer than two complete pairs exist or either side has zero variance.
 */
std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Correlation matrix over every numeric column of the dataset, in column order.
 * @post Diagonal is 1.0; undefined coefficients are NaN.
 */
FeatureMatrix correlationMatrix(const TypedDataset& data);
}
