
#include "algo/quantifier_expander.h"
#include "algo/arg_iterator.h"
#include "algo/substituter.h"
#include "data/problem.h"

std::vector<Expr> QuantifierExpander::instantiate(Expr e, Expr body) {
    const auto vars = _store.variables(e);
    std::vector<const Type*> types;
    std::vector<Expr> varExps;
    for (const Variable* v : vars) {
        types.push_back(v->type);
        varExps.push_back(_store.mkVariable(v));
    }
    std::vector<Expr> instances;
    for (const auto& binding : ArgIterator(ArgIterator::getDomains(types, _problem))) {
        instances.push_back(Substituter::substitute(_store, body, Substitution(varExps, binding)));
    }
    return instances;
}

Expr QuantifierExpander::walkExists(Expr e, const std::vector<Expr>& args) {
    return _store.mkOr(instantiate(e, args[0]));
}

Expr QuantifierExpander::walkForall(Expr e, const std::vector<Expr>& args) {
    return _store.mkAnd(instantiate(e, args[0]));
}
