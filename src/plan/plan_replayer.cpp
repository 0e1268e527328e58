
#include "plan/plan_replayer.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"

PlanReplayer::PlanReplayer(const CompilerResult& result) : _result(result), _simulator(*result.problem) {}

std::vector<ActionInstance> PlanReplayer::candidates(const ActionInstance& step) {
    std::vector<ActionInstance> out;
    for (const auto& action : _result.problem->actions()) {
        std::vector<Expr> params;
        if (!action->parameters().empty()) {
            if (action->parameters().size() != step.params.size()) continue;
            params = step.params;
        }
        ActionInstance instance(action, params);
        auto mapped = _result.backMap(instance);
        if (mapped.has_value() && *mapped == step) out.push_back(std::move(instance));
    }
    return out;
}

SequentialPlan PlanReplayer::replay(const SequentialPlan& plan) {
    const ExpressionStore& store = _result.problem->exprs();
    SequentialPlan out;
    State state = _simulator.initialState();

    for (const ActionInstance& step : plan.actions) {
        bool applied = false;
        for (const ActionInstance& candidate : candidates(step)) {
            if (!_simulator.isApplicable(state, candidate)) continue;
            state = _simulator.apply(state, candidate);
            out.actions.push_back(candidate);
            applied = true;
            break;
        }
        if (!applied) 
            throw UsageError("No compiled counterpart of " + Names::to_string(store, step) + " is applicable in " 
                + _result.problem->name());
    }

    // Auxiliary actions, each at most once
    std::vector<std::shared_ptr<const Action>> auxiliary;
    for (const auto& action : _result.problem->actions()) {
        if (action->parameters().empty() && !_result.backMap(ActionInstance(action)).has_value()) 
            auxiliary.push_back(action);
    }
    for (const auto& action : auxiliary) {
        if (_simulator.isGoal(state)) break;
        ActionInstance instance(action);
        if (!_simulator.isApplicable(state, instance)) continue;
        state = _simulator.apply(state, instance);
        out.actions.push_back(instance);
    }

    Log::d("Replayed plan: %s\n", TOSTR(store, out));
    return out;
}
