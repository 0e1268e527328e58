
#include "algo/state_evaluator.h"
#include "util/errors.h"
#include "util/names.h"

Expr StateEvaluator::evaluate(Expr e, const State& state) {
    _state = &state;
    Expr value = _simplifier.simplify(walk(_expander.expand(e)));
    _state = nullptr;
    if (!_store.isConstant(value)) 
        throw UsageError("Expression " + Names::to_string(_store, e) + " does not evaluate to a constant, but to " 
            + Names::to_string(_store, value));
    return value;
}

bool StateEvaluator::holds(Expr e, const State& state) {
    Expr value = evaluate(e, state);
    if (!_store.isBoolConstant(value)) 
        throw TypeError("Expression " + Names::to_string(_store, e) + " is not boolean");
    return _store.boolValue(value);
}

Expr StateEvaluator::walkFluentExp(Expr e, const std::vector<Expr>& args) {
    std::vector<Expr> groundArgs;
    for (const Expr& arg : args) {
        Expr a = _simplifier.simplify(arg);
        if (!_store.isConstant(a)) 
            throw UsageError("Fluent expression " + Names::to_string(_store, e) + " is not ground");
        groundArgs.push_back(a);
    }
    Expr fe = _store.mkFluentExp(_store.fluent(e), groundArgs);
    if (!_state->has(fe)) 
        throw UsageError("No value for " + Names::to_string(_store, fe) + " in state");
    return _state->get(fe);
}
