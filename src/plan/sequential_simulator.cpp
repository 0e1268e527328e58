
#include "plan/sequential_simulator.h"
#include "algo/arg_iterator.h"
#include "algo/substituter.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"

SequentialSimulator::SequentialSimulator(const Problem& problem) : 
        _problem(problem), _store(problem.exprs()), _evaluator(problem.exprs(), problem) {
    for (const auto& action : problem.actions()) if (action->isDurative()) 
        throw UsageError("Cannot simulate durative action " + action->name() + " sequentially");
    if (!problem.timedEffects().empty()) throw UsageError("Cannot simulate timed effects sequentially");
    if (!problem.timedGoals().empty()) throw UsageError("Cannot simulate timed goals sequentially");
}

Substitution SequentialSimulator::binding(const ActionInstance& instance) const {
    const auto& params = instance.action->parameters();
    if (params.size() != instance.params.size()) 
        throw UsageError("Action " + instance.action->name() + " has " + std::to_string(params.size()) 
            + " parameters, but " + std::to_string(instance.params.size()) + " are given");
    std::vector<Expr> src;
    for (size_t i = 0; i < params.size(); i++) {
        if (!_store.isConstant(instance.params[i])) 
            throw UsageError("Actual parameter " + Names::to_string(_store, instance.params[i]) + " of " 
                + instance.action->name() + " is not a constant");
        src.push_back(_store.mkParam(params[i]));
    }
    return Substitution(src, instance.params);
}

std::vector<Expr> SequentialSimulator::unsatisfiedConditions(const State& state, const ActionInstance& instance) {
    Substitution subs = binding(instance);
    std::vector<Expr> unsatisfied;
    for (Expr pre : instance.action->preconditions()) {
        Expr ground = Substituter::substitute(_store, pre, subs);
        if (!_evaluator.holds(ground, state)) unsatisfied.push_back(ground);
    }
    return unsatisfied;
}

std::vector<Substitution> SequentialSimulator::effectBindings(const Effect& effect, const Substitution& subs) const {
    if (!effect.isForall()) return {subs};
    std::vector<const Type*> types;
    for (const Variable* v : effect.forall()) types.push_back(v->type);
    std::vector<Substitution> out;
    for (const auto& values : ArgIterator(ArgIterator::getDomains(types, _problem))) {
        Substitution s = subs;
        for (size_t i = 0; i < values.size(); i++) s[_store.mkVariable(effect.forall()[i])] = values[i];
        out.push_back(std::move(s));
    }
    return out;
}

Expr SequentialSimulator::groundTarget(Expr fluentExp, const State& state) {
    std::vector<Expr> args;
    for (Expr arg : _store.args(fluentExp)) args.push_back(_evaluator.evaluate(arg, state));
    return _store.mkFluentExp(_store.fluent(fluentExp), args);
}

State SequentialSimulator::apply(const State& state, const ActionInstance& instance) {

    auto unsatisfied = unsatisfiedConditions(state, instance);
    if (!unsatisfied.empty()) 
        throw UsageError(Names::to_string(_store, instance) + " is not applicable; violated: " 
            + Names::to_string(_store, unsatisfied));

    Substitution subs = binding(instance);
    FlatHashMap<Expr, Expr, ExprHasher> assigned;
    std::vector<Expr> assignOrder;
    std::vector<std::pair<Expr, Expr>> increments;

    for (const Effect& effect : instance.action->effects()) {
        for (const Substitution& s : effectBindings(effect, subs)) {
            if (!_evaluator.holds(Substituter::substitute(_store, effect.condition(), s), state)) continue;
            Expr target = groundTarget(Substituter::substitute(_store, effect.fluent(), s), state);
            Expr value = _evaluator.evaluate(Substituter::substitute(_store, effect.value(), s), state);

            if (effect.isAssignment()) {
                auto it = assigned.find(target);
                if (it != assigned.end() && it->second != value) 
                    throw ConflictingEffectsError(Names::to_string(_store, instance) + " assigns " 
                        + Names::to_string(_store, it->second) + " and " + Names::to_string(_store, value) 
                        + " to " + Names::to_string(_store, target));
                if (it == assigned.end()) assignOrder.push_back(target);
                assigned[target] = value;
            } else {
                if (effect.isDecrease()) value = _evaluator.evaluate(_store.mkMinus(_store.mkInt(0), value), state);
                increments.emplace_back(target, value);
            }
        }
    }

    State next = state;
    for (Expr target : assignOrder) next.set(target, assigned[target]);
    for (const auto& [target, delta] : increments) {
        if (assigned.count(target)) 
            throw ConflictingEffectsError(Names::to_string(_store, instance) + " both assigns and increases " 
                + Names::to_string(_store, target));
        next.set(target, _evaluator.evaluate(_store.mkPlus(next.get(target), delta), next));
    }
    Log::d("Applied %s\n", TOSTR(_store, instance));
    return next;
}

std::vector<Expr> SequentialSimulator::unsatisfiedGoals(const State& state) {
    std::vector<Expr> unsatisfied;
    for (Expr goal : _problem.goals()) if (!_evaluator.holds(goal, state)) unsatisfied.push_back(goal);
    return unsatisfied;
}
