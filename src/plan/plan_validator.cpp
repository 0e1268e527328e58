
#include <algorithm>

#include "plan/plan_validator.h"
#include "algo/quantifier_expander.h"
#include "algo/simplifier.h"
#include "algo/substituter.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"

PlanValidator::PlanValidator(const Problem& problem) : 
        _problem(problem), _store(problem.exprs()), _simulator(problem) {
    for (const auto& [fe, value] : problem.initialValues()) {
        (void) value;
        const Type* type = _store.fluent(fe)->type;
        if (type->isNumeric() && type->isBounded()) _bounded.push_back(fe);
    }
}

std::string PlanValidator::checkState(const State& state) {
    for (Expr fe : _bounded) {
        const Type* type = _store.fluent(fe)->type;
        double value = _store.numericValue(state.get(fe));
        if ((type->hasLowerBound() && value < type->lowerBound()) 
                || (type->hasUpperBound() && value > type->upperBound())) {
            return "value " + Names::to_string(value) + " of " + Names::to_string(_store, fe) 
                + " is out of the bounds of " + type->toString();
        }
    }
    for (Expr inv : _problem.stateInvariants()) {
        if (!_simulator.holds(inv, state)) return "state invariant " + Names::to_string(_store, inv) + " is violated";
    }
    return "";
}

std::vector<Expr> PlanValidator::trajectoryConstraints() {
    QuantifierExpander expander(_store, _problem);
    Simplifier simplifier(_store);
    std::vector<Expr> out;
    std::vector<Expr> stack;
    for (Expr c : _problem.trajectoryConstraints()) stack.push_back(simplifier.simplify(expander.expand(c)));
    std::reverse(stack.begin(), stack.end());
    while (!stack.empty()) {
        Expr c = stack.back();
        stack.pop_back();
        if (_store.isTrue(c)) continue;
        if (_store.op(c) == OperatorKind::AND) {
            const auto& args = _store.args(c);
            for (auto it = args.rbegin(); it != args.rend(); ++it) stack.push_back(*it);
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string PlanValidator::checkTrajectory(const std::vector<State>& states) {
    for (Expr c : trajectoryConstraints()) {
        std::string name = Names::to_string(_store, c);
        if (_store.isFalse(c)) return "a trajectory constraint is unsatisfiable";
        switch (_store.op(c)) {
        case OperatorKind::ALWAYS: {
            for (const State& s : states) if (!_simulator.holds(_store.arg(c, 0), s)) return name + " is violated";
            break;
        }
        case OperatorKind::SOMETIME: {
            bool reached = false;
            for (const State& s : states) reached = reached || _simulator.holds(_store.arg(c, 0), s);
            if (!reached) return name + " is never satisfied";
            break;
        }
        case OperatorKind::AT_MOST_ONCE: {
            int blocks = 0;
            bool previous = false;
            for (const State& s : states) {
                bool now = _simulator.holds(_store.arg(c, 0), s);
                if (now && !previous) blocks++;
                previous = now;
            }
            if (blocks > 1) return name + " becomes true " + std::to_string(blocks) + " times";
            break;
        }
        case OperatorKind::SOMETIME_BEFORE: {
            bool seenPsi = false;
            for (const State& s : states) {
                if (_simulator.holds(_store.arg(c, 0), s) && !seenPsi) return name + " is violated";
                seenPsi = seenPsi || _simulator.holds(_store.arg(c, 1), s);
            }
            break;
        }
        case OperatorKind::SOMETIME_AFTER: {
            bool pending = false;
            for (const State& s : states) {
                if (_simulator.holds(_store.arg(c, 0), s)) pending = true;
                if (_simulator.holds(_store.arg(c, 1), s)) pending = false;
            }
            if (pending) return name + " is violated";
            break;
        }
        default:
            throw UsageError("Trajectory constraint " + name + " is not a trajectory operator");
        }
    }
    return "";
}

double PlanValidator::metricValue(const QualityMetric& metric, const SequentialPlan& plan, 
        const std::vector<State>& states) {
    switch (metric.kind) {
    case MetricKind::MINIMIZE_ACTION_COSTS: {
        double total = 0;
        for (size_t i = 0; i < plan.size(); i++) {
            const ActionInstance& step = plan.actions[i];
            Expr cost = metric.cost(step.action->name());
            if (!cost.valid()) continue;
            cost = Substituter::substitute(_store, cost, _simulator.binding(step));
            total += _store.numericValue(_simulator.evaluate(cost, states[i]));
        }
        return total;
    }
    case MetricKind::MINIMIZE_EXPRESSION_ON_FINAL_STATE:
    case MetricKind::MAXIMIZE_EXPRESSION_ON_FINAL_STATE:
        return _store.numericValue(_simulator.evaluate(metric.expression, states.back()));
    case MetricKind::MINIMIZE_SEQUENTIAL_PLAN_LENGTH:
    case MetricKind::MINIMIZE_MAKESPAN:
        return plan.size();
    case MetricKind::OVERSUBSCRIPTION: {
        double gain = 0;
        for (const auto& [goal, value] : metric.gains) {
            if (_simulator.holds(goal, states.back())) gain += _store.numericValue(value);
        }
        return gain;
    }
    }
    return 0;
}

ValidationResult PlanValidator::validate(const SequentialPlan& plan) {
    ValidationResult result;
    std::vector<State> states;
    states.push_back(_simulator.initialState());

    result.reason = checkState(states.back());
    if (!result.reason.empty()) {
        result.reason = "initial state: " + result.reason;
        return result;
    }

    for (size_t i = 0; i < plan.size(); i++) {
        const ActionInstance& step = plan.actions[i];
        std::string prefix = "step " + std::to_string(i) + " (" + Names::to_string(_store, step) + "): ";
        try {
            auto unsatisfied = _simulator.unsatisfiedConditions(states.back(), step);
            if (!unsatisfied.empty()) {
                result.reason = prefix + "preconditions " + Names::to_string(_store, unsatisfied) + " are not satisfied";
            } else {
                states.push_back(_simulator.apply(states.back(), step));
                result.reason = checkState(states.back());
                if (!result.reason.empty()) result.reason = prefix + result.reason;
            }
        } catch (const ConflictingEffectsError& e) {
            result.reason = prefix + e.msg();
        }
        if (!result.reason.empty()) {
            result.failedStep = i;
            return result;
        }
    }

    auto unsatisfied = _simulator.unsatisfiedGoals(states.back());
    if (!unsatisfied.empty()) {
        result.reason = "goals " + Names::to_string(_store, unsatisfied) + " are not satisfied";
        return result;
    }
    result.reason = checkTrajectory(states);
    if (!result.reason.empty()) return result;

    result.valid = true;
    if (_problem.qualityMetrics().size() == 1) 
        result.metricValue = metricValue(_problem.qualityMetrics().front(), plan, states);
    Log::v("Plan of length %i is valid for %s\n", (int) plan.size(), _problem.name().c_str());
    return result;
}
