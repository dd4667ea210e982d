#pragma once
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Square, symmetric correlation matrix over named numeric features.
 * Rows and columns share one ordering (the order of labels()); the diagonal is 1.0.
 * Off-diagonal entries may be NaN when a correlation is undefined.
 */
class FeatureMatrix {
public:
    using Grid = std::vector<std::vector<double>>;
    using Mapping = std::unordered_map<std::string, std::unordered_map<std::string, double>>;

    FeatureMatrix() = default;

    /**
     * @brief Builds a matrix from ordered labels and a row-major grid.
     * @throws Cognia::InvalidInputShapeException when the grid is not square, labels do not match,
     *         labels repeat, the grid is asymmetric, or the diagonal is not 1.
     */
    FeatureMatrix(std::vector<std::string> labels, Grid values);

    /**
     * @brief Builds a matrix from a nested name -> name -> coefficient mapping.
     * @pre order lists every feature exactly once; it fixes row/column order.
     * @throws Cognia::InvalidInputShapeException when a cell is missing or the result is invalid.
     */
    static FeatureMatrix fromMapping(const std::vector<std::string>& order, const Mapping& mapping);

    size_t size() const noexcept { return labels_.size(); }
    bool empty() const noexcept { return labels_.empty(); }

    const std::vector<std::string>& labels() const noexcept { return labels_; }
    const Grid& values() const noexcept { return values_; }

    double at(size_t row, size_t col) const { return values_.at(row).at(col); }

    static constexpr double kSymmetryTolerance = 1e-9;

private:
    std::vector<std::string> labels_;
    Grid values_;

    void validate() const;
};
