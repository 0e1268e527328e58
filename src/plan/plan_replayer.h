#ifndef PLANCOMP_PLAN_REPLAYER_H
#define PLANCOMP_PLAN_REPLAYER_H

#include "compilers/compiler.h"
#include "plan/sequential_simulator.h"

/*
 * Translates a plan of an input problem forward into a plan of the problem
 * compiled from it. Each step becomes the first applicable compiled
 * instance that maps back to it: a parameterless compiled action, or one
 * with as many parameters as the step, applied to the step's parameters.
 * Auxiliary actions (those mapping back to nothing) are appended greedily
 * until the compiled goals hold.
 */
class PlanReplayer {

private:
    const CompilerResult& _result;
    SequentialSimulator _simulator;

public:
    explicit PlanReplayer(const CompilerResult& result);

    // Raises UsageError if some step has no applicable counterpart
    SequentialPlan replay(const SequentialPlan& plan);

private:
    std::vector<ActionInstance> candidates(const ActionInstance& step);
};

#endif
