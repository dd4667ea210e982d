#pragma once
#include <string>
#include <vector>

/**
 * Drawing backend consumed by the analysis code. Implementations return the path of the
 * produced image artifact, or an empty string when nothing could be rendered.
 */
class ChartRenderer {
public:
    virtual ~ChartRenderer() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Renders a labelled square grid with a colour scale fixed to [scaleMin, scaleMax] and a legend.
     * @pre labels.size() == matrix.size().
     */
    virtual std::string heatmap(const std::string& id,
                                const std::vector<std::vector<double>>& matrix,
                                const std::string& title,
                                const std::vector<std::string>& labels,
                                double scaleMin,
                                double scaleMax) = 0;

    virtual std::string histogram(const std::string& id,
                                  const std::vector<double>& values,
                                  const std::string& title) = 0;

    virtual std::string bar(const std::string& id,
                            const std::vector<std::string>& labels,
                            const std::vector<double>& values,
                            const std::string& title) = 0;
};
