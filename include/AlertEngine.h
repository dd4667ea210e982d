#pragma once
#include "AutoConfig.h"
#include "FeatureMatrix.h"
#include "ProfileEngine.h"

#include <string>
#include <vector>

enum class AlertKind {
    HighMissing,
    AllMissing,
    Constant,
    HighOutliers,
    StrongSkew,
    HighCardinality,
    DuplicateRows,
    Collinear
};

struct Alert {
    AlertKind kind;
    // Empty for dataset-level alerts; "a / b" for pair alerts.
    std::string subject;
    std::string message;
};

namespace AlertEngine {
/**
 * @brief Data-quality warnings derived from a finished profile and its correlation matrix.
 * @details Column alerts come first in column order, then duplicate rows, then collinear pairs
 *          strongest first.
 */
std::vector<Alert> generate(const DatasetProfile& profile,
                            const FeatureMatrix& correlations,
                            const AlertThresholds& thresholds);

std::string kindName(AlertKind kind);
}
