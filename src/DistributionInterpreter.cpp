#include "DistributionInterpreter.h"
#include "CogniaExceptions.h"
#include "CommonUtils.h"

#include <cmath>
#include <unordered_set>
#include <utility>

namespace {
constexpr double kSymmetricSkewLimit = 0.5;
constexpr double kModerateKurtosisLimit = 1.0;

bool notFinite(double v) { return !std::isfinite(v); }
bool positive(double v) { return v > 0.0; }
bool negative(double v) { return v < 0.0; }
bool nearSymmetric(double v) { return std::abs(v) < kSymmetricSkewLimit; }
bool moderateTails(double v) { return std::abs(v) < kModerateKurtosisLimit; }

template <typename Shape>
const ShapeRule<Shape>& firstMatch(const std::vector<ShapeRule<Shape>>& rules, double value) {
    for (const auto& rule : rules) {
        if (rule.matches(value)) return rule;
    }
    // Unreachable: the rows above cover every double.
    return rules.front();
}
} // namespace

namespace DistributionInterpreter {

const std::vector<ShapeRule<SkewShape>>& skewnessRules() {
    static const std::vector<ShapeRule<SkewShape>> rules = {
        {notFinite, SkewShape::Undefined, "undefined",
         "Skewness is undefined due to insufficient data."},
        {nearSymmetric, SkewShape::Symmetric, "symmetric",
         "The distribution is approximately symmetric."},
        {positive, SkewShape::RightSkewed, "right-skewed",
         "The distribution is right-skewed, indicating the presence of higher-value outliers."},
        {negative, SkewShape::LeftSkewed, "left-skewed",
         "The distribution is left-skewed, indicating the presence of lower-value outliers."}
    };
    return rules;
}

const std::vector<ShapeRule<TailShape>>& kurtosisRules() {
    static const std::vector<ShapeRule<TailShape>> rules = {
        {notFinite, TailShape::Undefined, "undefined",
         "Kurtosis is undefined due to insufficient data."},
        {moderateTails, TailShape::Moderate, "moderate tails",
         "The distribution has moderate tails, similar to a normal distribution."},
        {positive, TailShape::Heavy, "heavy tails",
         "The distribution has heavy tails, suggesting a higher likelihood of extreme values."},
        {negative, TailShape::Light, "light tails",
         "The distribution has light tails, suggesting fewer extreme values."}
    };
    return rules;
}

const ShapeRule<SkewShape>& classifySkewness(double skewness) {
    return firstMatch(skewnessRules(), skewness);
}

const ShapeRule<TailShape>& classifyKurtosis(double kurtosis) {
    return firstMatch(kurtosisRules(), kurtosis);
}

std::vector<ShapeInterpretation> interpret(const std::vector<ColumnShapeStats>& stats) {
    std::unordered_set<std::string> seen;
    seen.reserve(stats.size());
    for (const auto& s : stats) {
        if (s.column.empty()) {
            throw Cognia::InvalidInputShapeException("column name must not be empty");
        }
        if (!seen.insert(s.column).second) {
            throw Cognia::InvalidInputShapeException("duplicate column in shape statistics: " + s.column);
        }
    }

    std::vector<ShapeInterpretation> out;
    out.reserve(stats.size());
    for (const auto& s : stats) {
        const auto& skewRule = classifySkewness(s.skewness);
        const auto& tailRule = classifyKurtosis(s.kurtosis);

        ShapeInterpretation item;
        item.column = s.column;
        item.skewness = CommonUtils::roundTo(s.skewness, 3);
        item.kurtosis = CommonUtils::roundTo(s.kurtosis, 3);
        item.skewShape = skewRule.shape;
        item.tailShape = tailRule.shape;
        item.narrative.reserve(skewRule.sentence.size() + tailRule.sentence.size() + 1);
        item.narrative.append(skewRule.sentence);
        item.narrative.push_back(' ');
        item.narrative.append(tailRule.sentence);
        out.push_back(std::move(item));
    }
    return out;
}

std::string_view skewLabel(SkewShape shape) {
    for (const auto& rule : skewnessRules()) {
        if (rule.shape == shape) return rule.label;
    }
    return "undefined";
}

std::string_view tailLabel(TailShape shape) {
    for (const auto& rule : kurtosisRules()) {
        if (rule.shape == shape) return rule.label;
    }
    return "undefined";
}

} // namespace DistributionInterpreter
