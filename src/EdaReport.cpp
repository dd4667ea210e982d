#include "EdaReport.h"
#include "CommonUtils.h"
#include "CorrelationRanker.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
std::string nowReadable() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%d %b %Y, %H:%M");
    return out.str();
}

std::string typeName(ColumnType type) {
    return type == ColumnType::NUMERIC ? "numeric" : "categorical";
}

std::string chartId(const std::string& prefix, size_t index, const std::string& name) {
    return prefix + "_" + std::to_string(index) + "_" + name;
}

void addOverview(ReportEngine& report, const DatasetProfile& profile) {
    report.beginSection("Dataset Overview");
    report.addKeyValue("Total Rows", std::to_string(profile.rows));
    report.addKeyValue("Total Columns", std::to_string(profile.columns));

    std::vector<std::vector<std::string>> rows;
    rows.reserve(profile.overview.size());
    for (const auto& col : profile.overview) {
        rows.push_back({col.name, typeName(col.type), std::to_string(col.nonMissing), std::to_string(col.unique)});
    }
    report.addTable("", {"Column", "Type", "Non-Missing", "Unique"}, rows);

    const DataQualitySummary& dq = profile.quality;
    report.addKeyValue("Duplicate Records",
                       std::to_string(dq.duplicateRows) + " (" + CommonUtils::formatPercent(dq.duplicateRatio) + ")");
    report.addKeyValue("Numeric Columns", std::to_string(dq.numericColumns));
    report.addKeyValue("Categorical Columns", std::to_string(dq.categoricalColumns));
    report.endSection();
}

void addMissing(ReportEngine& report, const DatasetProfile& profile) {
    report.beginSection("Missing Value Analysis");
    std::vector<std::vector<std::string>> rows;
    for (const auto& col : profile.overview) {
        if (col.missing == 0) continue;
        rows.push_back({col.name, std::to_string(col.missing), CommonUtils::formatPercent(col.missingRatio)});
    }
    report.addTable("", {"Column", "Missing Count", "Missing Percent"}, rows);
    report.endSection();
}

void addSummary(ReportEngine& report, const DatasetProfile& profile) {
    report.beginSection("Statistical Summary");
    std::vector<std::vector<std::string>> rows;
    rows.reserve(profile.numeric.size());
    for (const auto& s : profile.numeric) {
        const ColumnStats& st = s.stats;
        rows.push_back({s.name,
                        std::to_string(st.count),
                        CommonUtils::formatDouble(st.mean),
                        CommonUtils::formatDouble(st.stddev),
                        CommonUtils::formatDouble(st.min),
                        CommonUtils::formatDouble(st.q1),
                        CommonUtils::formatDouble(st.median),
                        CommonUtils::formatDouble(st.q3),
                        CommonUtils::formatDouble(st.max),
                        CommonUtils::formatDouble(st.skewness),
                        CommonUtils::formatDouble(st.kurtosis)});
    }
    report.addTable("",
                    {"Column", "Count", "Mean", "Std", "Min", "Q1", "Median", "Q3", "Max", "Skewness", "Kurtosis"},
                    rows);
    report.endSection();
}

void addInterpretation(ReportEngine& report, const std::vector<ShapeInterpretation>& items) {
    report.beginSection("Distribution Interpretation");
    std::vector<std::vector<std::string>> rows;
    rows.reserve(items.size());
    for (const auto& item : items) {
        rows.push_back({item.column,
                        CommonUtils::formatDouble(item.skewness),
                        CommonUtils::formatDouble(item.kurtosis),
                        std::string(DistributionInterpreter::skewLabel(item.skewShape)),
                        std::string(DistributionInterpreter::tailLabel(item.tailShape)),
                        item.narrative});
    }
    report.addTable("", {"Column", "Skewness", "Kurtosis", "Shape", "Tails", "Interpretation"}, rows);
    report.endSection();
}

void addOutliers(ReportEngine& report, const DatasetProfile& profile, double iqrMultiplier) {
    report.beginSection("Outlier Analysis");
    report.addParagraph("Values outside Q1 - " + CommonUtils::formatDouble(iqrMultiplier, 2) + " x IQR and Q3 + " +
                        CommonUtils::formatDouble(iqrMultiplier, 2) + " x IQR are counted as outliers.");
    std::vector<std::vector<std::string>> rows;
    rows.reserve(profile.outliers.size());
    for (const auto& o : profile.outliers) {
        rows.push_back({o.name,
                        CommonUtils::formatDouble(o.lowerFence),
                        CommonUtils::formatDouble(o.upperFence),
                        std::to_string(o.count),
                        CommonUtils::formatPercent(o.ratio)});
    }
    report.addTable("", {"Column", "Lower Fence", "Upper Fence", "Outliers", "Outlier Percent"}, rows);
    report.endSection();
}

void addCategorical(ReportEngine& report, const DatasetProfile& profile, ChartRenderer* renderer) {
    report.beginSection("Categorical Column Explorer");
    if (profile.categorical.empty()) {
        report.addParagraph("No categorical columns.");
    }
    for (size_t i = 0; i < profile.categorical.size(); ++i) {
        const CategoricalSummary& c = profile.categorical[i];
        std::vector<std::vector<std::string>> rows;
        std::vector<std::string> labels;
        std::vector<double> counts;
        for (const auto& [value, count] : c.topCategories) {
            rows.push_back({value, std::to_string(count)});
            labels.push_back(value);
            counts.push_back(static_cast<double>(count));
        }

        std::string image;
        if (renderer) {
            image = renderer->bar(chartId("cat", i, c.name), labels, counts, c.name + " - Category Distribution");
        }
        if (!image.empty()) {
            report.addImage(c.name + " - Category Distribution", image);
        } else {
            report.addTable(c.name + " - Top Categories", {"Value", "Count"}, rows);
        }
    }
    report.endSection();
}

void addNumeric(ReportEngine& report,
                const TypedDataset* data,
                const DatasetProfile& profile,
                ChartRenderer* renderer) {
    report.beginSection("Numeric Column Explorer");
    if (profile.numeric.empty()) {
        report.addParagraph("No numeric columns.");
        report.endSection();
        return;
    }
    if (!renderer || !data) {
        report.addParagraph("Charts were not generated.");
        report.endSection();
        return;
    }
    for (size_t i = 0; i < profile.numeric.size(); ++i) {
        const std::string& name = profile.numeric[i].name;
        const int idx = data->findColumnIndex(name);
        if (idx < 0) continue;
        const auto& values = std::get<std::vector<double>>(data->columns()[static_cast<size_t>(idx)].values);
        const std::string image = renderer->histogram(chartId("hist", i, name), values, name + " - Distribution");
        if (!image.empty()) {
            report.addImage(name + " - Distribution", image);
        } else {
            report.addParagraph(name + ": chart unavailable.");
        }
    }
    report.endSection();
}

void addCorrelation(ReportEngine& report,
                    const FeatureMatrix& correlations,
                    const AutoConfig& config,
                    ChartRenderer* renderer) {
    report.beginSection("Correlation Analysis");
    if (correlations.size() < 2) {
        report.addParagraph("At least two numeric columns are required for correlation analysis.");
        report.endSection();
        return;
    }

    auto heatmap = [&]() -> std::string {
        if (!renderer) return "";
        return CorrelationRanker::renderHeatmap(correlations, *renderer);
    };

    const CorrelationLayout layout = EdaReport::chooseCorrelationLayout(
        correlations.size(), config.fullHeatmapMaxFeatures, config.showFullCorrelation);

    if (layout == CorrelationLayout::FullHeatmap) {
        const std::string image = heatmap();
        if (!image.empty()) {
            report.addImage("Full Correlation Heatmap", image);
        } else {
            report.addParagraph("Correlation heatmap unavailable.");
        }
        report.endSection();
        return;
    }

    const RankedPairList pairs = CorrelationRanker::rankPairs(correlations, config.corrThreshold, config.corrTopN);
    std::vector<std::vector<std::string>> rows;
    rows.reserve(pairs.size());
    for (const auto& p : pairs) {
        rows.push_back({p.featureA, p.featureB, CommonUtils::formatDouble(p.strength)});
    }
    report.addTable("Top Correlated Feature Pairs", {"Feature A", "Feature B", "Strength"}, rows);

    if (layout == CorrelationLayout::TopPairsWithCollapsibleHeatmap) {
        const std::string image = heatmap();
        if (!image.empty()) {
            report.beginCollapsible("Show Full Correlation Heatmap (Advanced)");
            report.addImage("", image);
            report.endCollapsible();
        }
    }
    report.endSection();
}

void addAlerts(ReportEngine& report, const std::vector<Alert>& alerts) {
    report.beginSection("Alerts & Warnings");
    if (alerts.empty()) {
        report.addParagraph("No major data quality issues detected");
    } else {
        std::vector<std::string> items;
        items.reserve(alerts.size());
        for (const auto& a : alerts) items.push_back(a.message);
        report.addList(items, "alerts");
    }
    report.endSection();
}
} // namespace

namespace EdaReport {

CorrelationLayout chooseCorrelationLayout(size_t numericFeatures,
                                          size_t fullHeatmapMaxFeatures,
                                          bool showFullCorrelation) {
    if (numericFeatures <= fullHeatmapMaxFeatures) return CorrelationLayout::FullHeatmap;
    return showFullCorrelation ? CorrelationLayout::TopPairsWithCollapsibleHeatmap : CorrelationLayout::TopPairs;
}

ReportEngine build(const EdaResult& result,
                   const TypedDataset* data,
                   const AutoConfig& config,
                   ChartRenderer* renderer) {
    ReportEngine report("Cognia EDA Report");
    report.addTitle("Cognia - Exploratory Data Analysis Report");
    report.addKeyValue("Generated", nowReadable());
    report.addKeyValue("Dataset", data ? data->filename() : config.datasetPath);

    addOverview(report, result.profile);
    addMissing(report, result.profile);
    addSummary(report, result.profile);
    addInterpretation(report, result.interpretations);
    addOutliers(report, result.profile, config.outlierIqrMultiplier);
    addCategorical(report, result.profile, renderer);
    addNumeric(report, data, result.profile, renderer);
    addCorrelation(report, result.correlations, config, renderer);
    addAlerts(report, result.alerts);

    if (config.verbose) {
        std::cout << "[Cognia][Report] Assembled " << result.profile.columns << " column profiles, "
                  << result.alerts.size() << " alerts\n";
    }
    return report;
}

} // namespace EdaReport
