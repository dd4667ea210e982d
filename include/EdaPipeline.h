#pragma once

#include "AutoConfig.h"
#include "EdaReport.h"
#include "TypedDataset.h"

class EdaPipeline final {
public:
    /**
     * @brief Loads the dataset, analyses it, renders charts and writes the HTML report.
     * @return 0 on success.
     * @throws Cognia::CogniaException subclasses on load, analysis or write failures.
     */
    int run(const AutoConfig& config);

    /**
     * @brief Profile, correlation, interpretation and alerts for an already loaded dataset.
     */
    static EdaResult analyze(const TypedDataset& data, const AutoConfig& config);
};
