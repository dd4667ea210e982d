#include "TerminalUI.h"
#include "CommonUtils.h"

#include <algorithm>
#include <iomanip>
#include <iostream>

void TerminalUI::printProfileTable(const DatasetProfile& profile) {
    size_t maxNameLen = 15;
    for (const auto& s : profile.numeric) maxNameLen = std::max(maxNameLen, s.name.length());

    int w = static_cast<int>(maxNameLen) + 2;
    std::cout << "\n============================================ NUMERIC SUMMARY ============================================\n";
    std::cout << std::left
              << std::setw(w) << "Feature"
              << std::setw(12) << "Mean"
              << std::setw(12) << "Median"
              << std::setw(12) << "StdDev"
              << std::setw(12) << "Skewness"
              << std::setw(12) << "Kurtosis"
              << std::setw(12) << "Outliers" << "\n";
    std::cout << std::string(w + 12 * 6, '-') << "\n";

    for (size_t i = 0; i < profile.numeric.size(); ++i) {
        const ColumnStats& st = profile.numeric[i].stats;
        const size_t outliers = i < profile.outliers.size() ? profile.outliers[i].count : 0;
        std::cout << std::left << std::setw(w) << profile.numeric[i].name
                  << std::right
                  << std::setw(10) << CommonUtils::formatDouble(st.mean, 2) << "  "
                  << std::setw(10) << CommonUtils::formatDouble(st.median, 2) << "  "
                  << std::setw(10) << CommonUtils::formatDouble(st.stddev, 2) << "  "
                  << std::setw(10) << CommonUtils::formatDouble(st.skewness, 2) << "  "
                  << std::setw(10) << CommonUtils::formatDouble(st.kurtosis, 2) << "  "
                  << std::setw(10) << outliers << "\n";
    }
    std::cout << "=========================================================================================================\n";
    std::cout << "Rows: " << profile.rows
              << " | Columns: " << profile.columns
              << " (numeric " << profile.quality.numericColumns
              << ", categorical " << profile.quality.categoricalColumns << ")"
              << " | Duplicate rows: " << profile.quality.duplicateRows << "\n";
}

void TerminalUI::printTopPairs(const RankedPairList& pairs, double threshold) {
    std::cout << "\n[Cognia][Correlation] Strongest feature pairs (|r| >= "
              << CommonUtils::formatDouble(threshold, 2) << "):\n";
    if (pairs.empty()) {
        std::cout << "        -> No feature pairs reached the threshold.\n";
        return;
    }
    for (const auto& p : pairs) {
        std::cout << "        -> " << std::left << std::setw(20) << p.featureA << " ~ "
                  << std::setw(20) << p.featureB << std::right
                  << " |r|=" << CommonUtils::formatDouble(p.strength) << "\n";
    }
}

void TerminalUI::printInterpretations(const std::vector<ShapeInterpretation>& items) {
    if (items.empty()) return;
    std::cout << "\n[Cognia][Distribution] Shape interpretation:\n";
    for (const auto& item : items) {
        std::cout << "        -> " << item.column << ": " << item.narrative << "\n";
    }
}

void TerminalUI::printAlerts(const std::vector<Alert>& alerts) {
    if (alerts.empty()) {
        std::cout << "\n[Cognia][Alerts] No major data quality issues detected.\n";
        return;
    }
    std::cout << "\n[Cognia][Alerts] " << alerts.size() << " warning(s):\n";
    for (const auto& a : alerts) {
        std::cout << "        -> " << a.message << "\n";
    }
}
