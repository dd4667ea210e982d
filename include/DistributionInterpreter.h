#pragma once
#include <string>
#include <string_view>
#include <vector>

enum class SkewShape { Symmetric, RightSkewed, LeftSkewed, Undefined };
enum class TailShape { Moderate, Heavy, Light, Undefined };

struct ColumnShapeStats {
    std::string column;
    double skewness = 0.0;
    double kurtosis = 0.0;
};

struct ShapeInterpretation {
    std::string column;
    // Rounded to three decimals; NaN is kept as NaN.
    double skewness = 0.0;
    double kurtosis = 0.0;
    SkewShape skewShape = SkewShape::Undefined;
    TailShape tailShape = TailShape::Undefined;
    std::string narrative;
};

/**
 * One row of a classification table. Rows are tried in order and the first matching
 * predicate wins, so every table must end in rows that together cover all doubles.
 */
template <typename Shape>
struct ShapeRule {
    using Predicate = bool (*)(double);
    Predicate matches;
    Shape shape;
    std::string_view label;
    std::string_view sentence;
};

namespace DistributionInterpreter {

const std::vector<ShapeRule<SkewShape>>& skewnessRules();
const std::vector<ShapeRule<TailShape>>& kurtosisRules();

const ShapeRule<SkewShape>& classifySkewness(double skewness);
const ShapeRule<TailShape>& classifyKurtosis(double kurtosis);

/**
 * @brief Classifies each column's skewness and excess kurtosis and writes a two-sentence narrative.
 * @details Output order follows input order. Classification uses the unrounded values.
 * @throws Cognia::InvalidInputShapeException when a column name is empty or repeats.
 */
std::vector<ShapeInterpretation> interpret(const std::vector<ColumnShapeStats>& stats);

std::string_view skewLabel(SkewShape shape);
std::string_view tailLabel(TailShape shape);

} // namespace DistributionInterpreter
