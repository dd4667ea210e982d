#include "EdaPipeline.h"
#include "CogniaExceptions.h"
#include "CorrelationRanker.h"
#include "GnuplotEngine.h"
#include "Statistics.h"
#include "TerminalUI.h"

#include <iostream>
#include <memory>

EdaResult EdaPipeline::analyze(const TypedDataset& data, const AutoConfig& config) {
    EdaResult result;
    result.profile = ProfileEngine::profile(data, config.outlierIqrMultiplier, config.categoryChartTopN);
    if (config.verbose) {
        std::cout << "[Cognia][Profile] " << result.profile.numeric.size() << " numeric, "
                  << result.profile.categorical.size() << " categorical columns profiled\n";
    }

    result.correlations = Statistics::correlationMatrix(data);
    if (config.verbose) {
        std::cout << "[Cognia][Correlation] Matrix over " << result.correlations.size() << " numeric features\n";
    }

    result.interpretations = DistributionInterpreter::interpret(ProfileEngine::shapeStats(result.profile));
    result.alerts = AlertEngine::generate(result.profile, result.correlations, config.alerts);
    return result;
}

int EdaPipeline::run(const AutoConfig& config) {
    std::cout << "[Cognia][Load] Reading " << config.datasetPath << "\n";
    TypedDataset data(config.datasetPath, config.delimiter);
    data.load();
    if (data.colCount() == 0) {
        throw Cognia::DatasetException("Dataset has no columns");
    }
    std::cout << "[Cognia][Load] " << data.rowCount() << " rows x " << data.colCount() << " columns\n";
    if (data.rowCount() == 0) {
        std::cerr << "[Cognia][Warning] Dataset has a header but no rows; report will be mostly empty.\n";
    }

    const EdaResult result = analyze(data, config);

    TerminalUI::printProfileTable(result.profile);
    TerminalUI::printTopPairs(
        CorrelationRanker::rankPairs(result.correlations, config.corrThreshold, config.corrTopN),
        config.corrThreshold);
    if (config.verbose) {
        TerminalUI::printInterpretations(result.interpretations);
    }
    TerminalUI::printAlerts(result.alerts);

    std::unique_ptr<ChartRenderer> renderer;
    if (config.plotCharts) {
        auto gnuplot = std::make_unique<GnuplotEngine>(config.assetsDir, config.plot);
        if (gnuplot->isAvailable()) {
            renderer = std::move(gnuplot);
            std::cout << "[Cognia][Plot] Rendering charts into " << config.assetsDir << "\n";
        } else {
            std::cerr << "[Cognia][Plot] gnuplot not found in PATH; report will not contain charts.\n";
        }
    }

    const ReportEngine report = EdaReport::build(result, &data, config, renderer.get());
    report.save(config.reportFile);
    std::cout << "[Cognia][Report] Saved " << config.reportFile << "\n";
    return 0;
}
