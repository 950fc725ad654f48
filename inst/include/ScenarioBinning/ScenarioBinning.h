#ifndef SCENARIO_BINNING_H
#define SCENARIO_BINNING_H

#include "BinningConfig.h"
#include "BinningTable.h"
#include "BranchAndBoundSolver.h"
#include "CountMatrix.h"
#include "Exceptions.h"
#include "Logger.h"
#include "PrebinRefiner.h"
#include "Prebinning.h"
#include "ScenarioData.h"
#include "ScenarioOptimalBinning.h"
#include "ScenarioOptimizer.h"
#include "SolverBackend.h"
#include "Transform.h"

#endif // SCENARIO_BINNING_H
