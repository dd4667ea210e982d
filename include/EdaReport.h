#pragma once
#include "AlertEngine.h"
#include "AutoConfig.h"
#include "ChartRenderer.h"
#include "DistributionInterpreter.h"
#include "FeatureMatrix.h"
#include "ProfileEngine.h"
#include "ReportEngine.h"
#include "TypedDataset.h"

#include <cstddef>
#include <vector>

enum class CorrelationLayout {
    FullHeatmap,
    TopPairs,
    TopPairsWithCollapsibleHeatmap
};

struct EdaResult {
    DatasetProfile profile;
    FeatureMatrix correlations;
    std::vector<ShapeInterpretation> interpretations;
    std::vector<Alert> alerts;
};

namespace EdaReport {
/**
 * @brief Chooses how the correlation section is presented.
 * @details Up to fullHeatmapMaxFeatures numeric features the heatmap is readable and shown alone.
 *          Above that the ranked pairs table is shown, with the heatmap collapsed behind it only
 *          when showFullCorrelation is set.
 */
CorrelationLayout chooseCorrelationLayout(size_t numericFeatures,
                                          size_t fullHeatmapMaxFeatures,
                                          bool showFullCorrelation);

/**
 * @brief Lays out the complete report.
 * @param data Source rows for the histograms; nullptr skips them.
 * @param renderer Chart backend, or nullptr to build a report without images.
 */
ReportEngine build(const EdaResult& result,
                   const TypedDataset* data,
                   const AutoConfig& config,
                   ChartRenderer* renderer);
}
