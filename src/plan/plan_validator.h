#ifndef PLANCOMP_PLAN_VALIDATOR_H
#define PLANCOMP_PLAN_VALIDATOR_H

#include <string>
#include <vector>
#include <optional>

#include "data/problem.h"
#include "plan/plan.h"
#include "plan/state.h"
#include "plan/sequential_simulator.h"

struct ValidationResult {
    bool valid = false;
    // Why the plan is invalid
    std::string reason;
    // Index of the step that could not be executed, if any
    int failedStep = -1;
    // Value of the problem's quality metric if it has exactly one
    std::optional<double> metricValue;
};

/*
 * Checks a sequential plan against a problem by simulating it from the
 * initial state: every step must be applicable without conflicting
 * effects, every state must respect the bounds of bounded fluents and the
 * state invariants, the final state must satisfy the goals and the state
 * sequence must satisfy the trajectory constraints.
 */
class PlanValidator {

private:
    const Problem& _problem;
    ExpressionStore& _store;
    SequentialSimulator _simulator;
    // Ground fluent expressions of bounded numeric fluents
    std::vector<Expr> _bounded;

public:
    explicit PlanValidator(const Problem& problem);

    ValidationResult validate(const SequentialPlan& plan);

private:
    std::string checkState(const State& state);
    std::string checkTrajectory(const std::vector<State>& states);
    std::vector<Expr> trajectoryConstraints();
    double metricValue(const QualityMetric& metric, const SequentialPlan& plan, const std::vector<State>& states);
};

#endif
