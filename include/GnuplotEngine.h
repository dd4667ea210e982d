#pragma once
#include "AutoConfig.h"
#include "ChartRenderer.h"
#include <string>
#include <vector>

/**
 * ChartRenderer backed by an external gnuplot process. Each chart writes a data file and a
 * script into the assets directory, runs gnuplot on it and keeps only the image.
 */
class GnuplotEngine final : public ChartRenderer {
public:
    /**
     * @brief Initializes plotting backend and asset directory.
     * @post assets directory is created if possible.
     */
    GnuplotEngine(std::string assetsDir, PlotConfig cfg);

    /**
     * @brief Checks whether gnuplot executable is available in PATH.
     */
    bool isAvailable() const override;

    std::string heatmap(const std::string& id,
                        const std::vector<std::vector<double>>& matrix,
                        const std::string& title,
                        const std::vector<std::string>& labels,
                        double scaleMin,
                        double scaleMax) override;

    /**
     * @brief Histogram with Freedman-Diaconis bin width (Sturges fallback). Non-finite values are dropped.
     */
    std::string histogram(const std::string& id,
                          const std::vector<double>& values,
                          const std::string& title) override;

    std::string bar(const std::string& id,
                    const std::vector<std::string>& labels,
                    const std::vector<double>& values,
                    const std::string& title) override;

    static std::string sanitizeId(const std::string& id);
    static std::string quoteForGnuplot(const std::string& value);

private:
    std::string assetsDir_;
    PlotConfig cfg_;

    static std::string terminalForFormat(const std::string& format, int width, int height);
    std::string styledHeader(const std::string& id, const std::string& title) const;
    std::string dataPath(const std::string& id) const;
    std::string runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent);
};
