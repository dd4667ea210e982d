#pragma once
#include "ChartRenderer.h"
#include "FeatureMatrix.h"
#include <string>
#include <vector>

struct CorrelationPair {
    std::string featureA;
    std::string featureB;
    // Absolute correlation coefficient, in [0,1].
    double strength = 0.0;
};

using RankedPairList = std::vector<CorrelationPair>;

namespace CorrelationRanker {

constexpr double kDefaultThreshold = 0.6;
constexpr size_t kDefaultTopN = 10;

/**
 * @brief Extracts each unordered feature pair once, ranks by |r| and keeps the strongest.
 * @details Visits (i, j) with i < j in matrix order. NaN coefficients are skipped. Sorting is
 *          stable, so equal strengths keep matrix order. Filtering by threshold happens before
 *          truncation to topN.
 * @throws std::invalid_argument when threshold is NaN or outside [0,1].
 */
RankedPairList rankPairs(const FeatureMatrix& matrix,
                         double threshold = kDefaultThreshold,
                         size_t topN = kDefaultTopN);

/**
 * @brief Renders the whole matrix as a heatmap on a fixed [-1,1] colour scale.
 * @post Returns the image artifact path, or an empty string when the matrix is empty or the
 *       renderer produced nothing. Never throws for an empty matrix.
 */
std::string renderHeatmap(const FeatureMatrix& matrix,
                          ChartRenderer& renderer,
                          const std::string& id = "correlation_heatmap",
                          const std::string& title = "Full Correlation Heatmap");

} // namespace CorrelationRanker
