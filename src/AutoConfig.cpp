#include "AutoConfig.h"
#include "CogniaExceptions.h"
#include "CommonUtils.h"
#include <algorithm>
#include <fstream>
#include <unordered_map>
#include <unordered_set>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Cognia::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Cognia::CogniaException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Cognia::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Cognia::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Cognia::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
        } else if (!inQuotes && line[i] == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

char parseDelimiter(const std::string& value) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) {
        throw Cognia::ConfigurationException("delimiter must be a single character: " + value);
    }
    return value[0];
}

struct SizeRule {
    size_t AutoConfig::*member;
    int minValue;
};
} // namespace

void AutoConfig::assign(const std::string& key, const std::string& value) {
    static const std::unordered_map<std::string, std::string AutoConfig::*> stringFields = {
        {"dataset", &AutoConfig::datasetPath},
        {"report_file", &AutoConfig::reportFile},
        {"assets_dir", &AutoConfig::assetsDir}
    };
    static const std::unordered_map<std::string, bool AutoConfig::*> boolFields = {
        {"show_full_correlation", &AutoConfig::showFullCorrelation},
        {"plot_charts", &AutoConfig::plotCharts},
        {"verbose", &AutoConfig::verbose}
    };
    static const std::unordered_map<std::string, double AutoConfig::*> doubleFields = {
        {"corr_threshold", &AutoConfig::corrThreshold},
        {"outlier_iqr_multiplier", &AutoConfig::outlierIqrMultiplier}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"corr_top_n", {&AutoConfig::corrTopN, 0}},
        {"full_heatmap_max_features", {&AutoConfig::fullHeatmapMaxFeatures, 0}},
        {"category_chart_top_n", {&AutoConfig::categoryChartTopN, 1}}
    };
    static const std::unordered_map<std::string, double AlertThresholds::*> alertFields = {
        {"alert_missing_ratio", &AlertThresholds::missingRatio},
        {"alert_outlier_ratio", &AlertThresholds::outlierRatio},
        {"alert_skew_abs", &AlertThresholds::skewAbs},
        {"alert_correlation", &AlertThresholds::correlation},
        {"alert_cardinality_ratio", &AlertThresholds::cardinalityRatio}
    };

    if (key == "delimiter") {
        delimiter = parseDelimiter(value);
        return;
    }
    if (key == "plot_format") {
        plot.format = CommonUtils::toLower(value);
        return;
    }
    if (key == "plot_width") {
        plot.width = parseIntStrict(value, key, 100);
        return;
    }
    if (key == "plot_height") {
        plot.height = parseIntStrict(value, key, 100);
        return;
    }

    if (const auto it = stringFields.find(key); it != stringFields.end()) {
        this->*(it->second) = value;
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        this->*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        this->*(it->second) = parseDoubleStrict(value, key);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        this->*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = alertFields.find(key); it != alertFields.end()) {
        alerts.*(it->second) = parseDoubleStrict(value, key);
        return;
    }

    throw Cognia::ConfigurationException("Unknown option: " + key);
}

std::string AutoConfig::usage() {
    return "Usage: cognia <dataset.csv> [options]\n"
           "Options:\n"
           "  --config <file>                       Load key: value overrides from file\n"
           "  --output, -o <file>                   HTML report path (default: cognia_eda_report.html)\n"
           "  --assets-dir <dir>                    Chart output directory (default: cognia_report_assets)\n"
           "  --delimiter <char>                    CSV delimiter character (default: ,)\n"
           "  --show-full-correlation               Add the collapsible full heatmap for wide datasets\n"
           "  --corr-threshold <0..1>               Minimum |r| for ranked pairs (default: 0.6)\n"
           "  --corr-top-n <N>                      Maximum ranked pairs (default: 10)\n"
           "  --full-heatmap-max-features <N>       Always show heatmap up to N numeric features (default: 10)\n"
           "  --plot-charts <true|false>            Render charts with gnuplot (default: true)\n"
           "  --plot-format <png|svg>               Chart image format (default: png)\n"
           "  --outlier-iqr-multiplier <N>          Tukey fence multiplier (default: 1.5)\n"
           "  --category-chart-top-n <N>            Categories per bar chart (default: 10)\n"
           "  --alert-missing-ratio <0..1>          Missing ratio alert level (default: 0.2)\n"
           "  --alert-outlier-ratio <0..1>          Outlier ratio alert level (default: 0.05)\n"
           "  --alert-skew-abs <N>                  |skewness| alert level (default: 1.0)\n"
           "  --alert-correlation <0..1>            |r| collinearity alert level (default: 0.9)\n"
           "  --alert-cardinality-ratio <0..1>      Unique ratio alert level (default: 0.9)\n"
           "  --verbose                             Enable detailed logs\n"
           "  --help                                Show this help message\n";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Cognia::ConfigurationException("missing dataset path\n" + usage());
    }

    AutoConfig config;
    config.datasetPath = argv[1];
    std::string configPath;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--show-full-correlation") {
            config.showFullCorrelation = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            config.reportFile = argv[++i];
        } else if (arg.rfind("--", 0) == 0 && i + 1 < argc) {
            config.assign(normalizeConfigKey(arg.substr(2)), argv[++i]);
        } else {
            throw Cognia::ConfigurationException("Unrecognized or incomplete argument: " + arg);
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        if (config.datasetPath.empty()) config.datasetPath = argv[1];
    }

    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Cognia::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            config.assign(key, value);
        } catch (const Cognia::CogniaException& ex) {
            throw Cognia::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void AutoConfig::validate() const {
    if (datasetPath.empty()) {
        throw Cognia::ConfigurationException("dataset path must not be empty");
    }
    if (reportFile.empty()) {
        throw Cognia::ConfigurationException("report_file must not be empty");
    }
    if (!(corrThreshold >= 0.0 && corrThreshold <= 1.0)) {
        throw Cognia::ConfigurationException("corr_threshold must be within [0,1]");
    }
    if (!(outlierIqrMultiplier > 0.0)) {
        throw Cognia::ConfigurationException("outlier_iqr_multiplier must be > 0");
    }
    if (categoryChartTopN < 1) {
        throw Cognia::ConfigurationException("category_chart_top_n must be >= 1");
    }

    static const std::unordered_set<std::string> formats = {"png", "svg"};
    if (formats.count(plot.format) == 0) {
        throw Cognia::ConfigurationException("plot_format must be one of: png, svg");
    }

    auto requireRatio = [](double value, const std::string& key) {
        if (!(value >= 0.0 && value <= 1.0)) {
            throw Cognia::ConfigurationException(key + " must be within [0,1]");
        }
    };
    requireRatio(alerts.missingRatio, "alert_missing_ratio");
    requireRatio(alerts.outlierRatio, "alert_outlier_ratio");
    requireRatio(alerts.correlation, "alert_correlation");
    requireRatio(alerts.cardinalityRatio, "alert_cardinality_ratio");
    if (!(alerts.skewAbs > 0.0)) {
        throw Cognia::ConfigurationException("alert_skew_abs must be > 0");
    }
}
