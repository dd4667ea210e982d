#include "CorrelationRanker.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace CorrelationRanker {

RankedPairList rankPairs(const FeatureMatrix& matrix, double threshold, size_t topN) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument("correlation threshold must be within [0,1]");
    }

    const size_t n = matrix.size();
    const auto& labels = matrix.labels();
    const auto& grid = matrix.values();

    RankedPairList pairs;
    if (n < 2 || topN == 0) return pairs;
    pairs.reserve(n * (n - 1) / 2);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            const double r = grid[i][j];
            if (std::isnan(r)) continue;
            pairs.push_back({labels[i], labels[j], std::abs(r)});
        }
    }

    std::stable_sort(pairs.begin(), pairs.end(), [](const CorrelationPair& a, const CorrelationPair& b) {
        return a.strength > b.strength;
    });

    pairs.erase(std::remove_if(pairs.begin(), pairs.end(), [threshold](const CorrelationPair& p) {
        return p.strength < threshold;
    }), pairs.end());

    if (pairs.size() > topN) pairs.resize(topN);
    return pairs;
}

std::string renderHeatmap(const FeatureMatrix& matrix,
                          ChartRenderer& renderer,
                          const std::string& id,
                          const std::string& title) {
    if (matrix.empty()) return "";
    return renderer.heatmap(id, matrix.values(), title, matrix.labels(), -1.0, 1.0);
}

} // namespace CorrelationRanker
