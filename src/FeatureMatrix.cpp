#include "FeatureMatrix.h"
#include "CogniaExceptions.h"

#include <cmath>
#include <unordered_set>

namespace {
bool sameCoefficient(double a, double b) {
    if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
    return std::abs(a - b) <= FeatureMatrix::kSymmetryTolerance;
}
} // namespace

FeatureMatrix::FeatureMatrix(std::vector<std::string> labels, Grid values)
    : labels_(std::move(labels)), values_(std::move(values)) {
    validate();
}

FeatureMatrix FeatureMatrix::fromMapping(const std::vector<std::string>& order, const Mapping& mapping) {
    if (mapping.size() != order.size()) {
        throw Cognia::InvalidInputShapeException("mapping has " + std::to_string(mapping.size()) +
                                                 " rows but order lists " + std::to_string(order.size()) + " features");
    }

    Grid grid(order.size(), std::vector<double>(order.size(), 0.0));
    for (size_t r = 0; r < order.size(); ++r) {
        const auto rowIt = mapping.find(order[r]);
        if (rowIt == mapping.end()) {
            throw Cognia::InvalidInputShapeException("missing row for feature '" + order[r] + "'");
        }
        if (rowIt->second.size() != order.size()) {
            throw Cognia::InvalidInputShapeException("row '" + order[r] + "' is not square");
        }
        for (size_t c = 0; c < order.size(); ++c) {
            const auto cellIt = rowIt->second.find(order[c]);
            if (cellIt == rowIt->second.end()) {
                throw Cognia::InvalidInputShapeException("missing cell ('" + order[r] + "', '" + order[c] + "')");
            }
            grid[r][c] = cellIt->second;
        }
    }
    return FeatureMatrix(order, std::move(grid));
}

void FeatureMatrix::validate() const {
    const size_t n = labels_.size();
    if (values_.size() != n) {
        throw Cognia::InvalidInputShapeException(std::to_string(n) + " labels for " +
                                                 std::to_string(values_.size()) + " matrix rows");
    }

    std::unordered_set<std::string> seen;
    for (const auto& label : labels_) {
        if (!seen.insert(label).second) {
            throw Cognia::InvalidInputShapeException("duplicate feature '" + label + "'");
        }
    }

    for (size_t r = 0; r < n; ++r) {
        if (values_[r].size() != n) {
            throw Cognia::InvalidInputShapeException("row '" + labels_[r] + "' has " +
                                                     std::to_string(values_[r].size()) + " entries, expected " +
                                                     std::to_string(n));
        }
    }

    for (size_t r = 0; r < n; ++r) {
        if (!sameCoefficient(values_[r][r], 1.0)) {
            throw Cognia::InvalidInputShapeException("diagonal entry for '" + labels_[r] + "' is not 1");
        }
        for (size_t c = r + 1; c < n; ++c) {
            if (!sameCoefficient(values_[r][c], values_[c][r])) {
                throw Cognia::InvalidInputShapeException("matrix is not symmetric at ('" + labels_[r] + "', '" +
                                                         labels_[c] + "')");
            }
        }
    }
}
