#pragma once
#include "AlertEngine.h"
#include "CorrelationRanker.h"
#include "DistributionInterpreter.h"
#include "ProfileEngine.h"

#include <vector>

class TerminalUI {
public:
    static void printProfileTable(const DatasetProfile& profile);
    static void printTopPairs(const RankedPairList& pairs, double threshold);
    static void printInterpretations(const std::vector<ShapeInterpretation>& items);
    static void printAlerts(const std::vector<Alert>& alerts);
};
