#include "AlertEngine.h"
#include "CommonUtils.h"
#include "CorrelationRanker.h"

#include <cmath>
#include <limits>
#include <unordered_map>

namespace AlertEngine {

std::string kindName(AlertKind kind) {
    switch (kind) {
        case AlertKind::HighMissing: return "high_missing";
        case AlertKind::AllMissing: return "all_missing";
        case AlertKind::Constant: return "constant";
        case AlertKind::HighOutliers: return "high_outliers";
        case AlertKind::StrongSkew: return "strong_skew";
        case AlertKind::HighCardinality: return "high_cardinality";
        case AlertKind::DuplicateRows: return "duplicate_rows";
        case AlertKind::Collinear: return "collinear";
    }
    return "unknown";
}

std::vector<Alert> generate(const DatasetProfile& profile,
                            const FeatureMatrix& correlations,
                            const AlertThresholds& thresholds) {
    std::vector<Alert> alerts;

    std::unordered_map<std::string, const NumericSummary*> numericByName;
    for (const auto& s : profile.numeric) numericByName[s.name] = &s;
    std::unordered_map<std::string, const OutlierSummary*> outliersByName;
    for (const auto& o : profile.outliers) outliersByName[o.name] = &o;
    std::unordered_map<std::string, const CategoricalSummary*> categoricalByName;
    for (const auto& c : profile.categorical) categoricalByName[c.name] = &c;

    for (const auto& col : profile.overview) {
        if (col.nonMissing == 0) {
            if (profile.rows > 0) {
                alerts.push_back({AlertKind::AllMissing, col.name, col.name + " contains no observed values"});
            }
            continue;
        }
        if (col.missingRatio > thresholds.missingRatio) {
            alerts.push_back({AlertKind::HighMissing, col.name,
                              col.name + " has " + CommonUtils::formatPercent(col.missingRatio) + " missing values"});
        }
        if (col.unique == 1 && col.nonMissing > 1) {
            alerts.push_back({AlertKind::Constant, col.name, col.name + " has a constant value"});
            continue;
        }

        if (col.type == ColumnType::NUMERIC) {
            if (const auto it = outliersByName.find(col.name); it != outliersByName.end()) {
                const OutlierSummary& o = *it->second;
                if (o.ratio > thresholds.outlierRatio) {
                    alerts.push_back({AlertKind::HighOutliers, col.name,
                                      col.name + " has " + CommonUtils::formatPercent(o.ratio) +
                                      " outliers (IQR rule)"});
                }
            }
            if (const auto it = numericByName.find(col.name); it != numericByName.end()) {
                const double skew = it->second->stats.skewness;
                if (std::isfinite(skew) && std::abs(skew) >= thresholds.skewAbs) {
                    alerts.push_back({AlertKind::StrongSkew, col.name,
                                      col.name + " is highly skewed (skewness=" + CommonUtils::formatDouble(skew) + ")"});
                }
            }
        } else if (const auto it = categoricalByName.find(col.name); it != categoricalByName.end()) {
            const CategoricalSummary& c = *it->second;
            const double uniqueRatio = static_cast<double>(c.unique) / static_cast<double>(c.nonMissing);
            if (c.nonMissing > 1 && uniqueRatio >= thresholds.cardinalityRatio) {
                alerts.push_back({AlertKind::HighCardinality, col.name,
                                  col.name + " has high cardinality (" + CommonUtils::formatPercent(uniqueRatio) +
                                  " unique values)"});
            }
        }
    }

    if (profile.quality.duplicateRows > 0) {
        alerts.push_back({AlertKind::DuplicateRows, "",
                          "Dataset contains " + std::to_string(profile.quality.duplicateRows) + " duplicate rows (" +
                          CommonUtils::formatPercent(profile.quality.duplicateRatio) + ")"});
    }

    const RankedPairList collinear = CorrelationRanker::rankPairs(
        correlations, thresholds.correlation, std::numeric_limits<size_t>::max());
    for (const auto& p : collinear) {
        alerts.push_back({AlertKind::Collinear, p.featureA + " / " + p.featureB,
                          p.featureA + " and " + p.featureB + " are highly correlated (|r|=" +
                          CommonUtils::formatDouble(p.strength) + ")"});
    }

    return alerts;
}

} // namespace AlertEngine
