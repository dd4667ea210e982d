#pragma once
#include <cstddef>
#include <string>

struct PlotConfig {
    std::string format = "png";
    int width = 1100;
    int height = 700;
};

struct AlertThresholds {
    // Flag a column when its missing ratio exceeds this value.
    double missingRatio = 0.20;
    // Flag a numeric column when its IQR-outlier ratio exceeds this value.
    double outlierRatio = 0.05;
    // Flag a numeric column when abs(skewness) reaches this value.
    double skewAbs = 1.0;
    // Flag a numeric pair when abs(correlation) reaches this value.
    double correlation = 0.9;
    // Flag a categorical column when unique/non-missing reaches this value.
    double cardinalityRatio = 0.9;
};

struct AutoConfig {
    std::string datasetPath;
    std::string reportFile = "cognia_eda_report.html";
    std::string assetsDir = "cognia_report_assets";
    char delimiter = ',';

    bool showFullCorrelation = false;
    double corrThreshold = 0.6;
    size_t corrTopN = 10;
    // Numeric feature count up to which the full heatmap is always shown.
    size_t fullHeatmapMaxFeatures = 10;

    bool plotCharts = true;
    bool verbose = false;
    double outlierIqrMultiplier = 1.5;
    size_t categoryChartTopN = 10;

    PlotConfig plot;
    AlertThresholds alerts;

    /**
     * @brief Builds config from CLI args and optional --config file override.
     * @pre argv[1] is the dataset path.
     * @post Returns a validated config object.
     * @throws Cognia::ConfigurationException on invalid arguments or values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Cognia::ConfigurationException on parse/validation failures.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @brief Applies one normalized key (e.g. "corr_threshold") to this config.
     * @throws Cognia::ConfigurationException for unknown keys or bad values.
     */
    void assign(const std::string& key, const std::string& value);

    /**
     * @throws Cognia::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage();
};
