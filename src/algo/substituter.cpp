
#include <algorithm>

#include "algo/substituter.h"
#include "algo/extractors.h"

Expr Substituter::substitute(ExpressionStore& store, Expr e, const Substitution& subs) {
    if (subs.empty()) return e;
    Substituter s(store, subs);
    return s.walk(e);
}

bool Substituter::preVisit(Expr e, Expr& result) {
    
    Expr replacement = _subs.get(e);
    if (replacement.valid()) {
        result = replacement;
        return true;
    }

    if (!isQuantifierOperator(_store.op(e))) return false;

    // Keep only entries not capturing a variable bound here
    const auto& bound = _store.variables(e);
    FreeVarsExtractor freeVars(_store);
    Substitution inner;
    for (const auto& [key, value] : _subs) {
        bool captured = false;
        for (const Variable* v : freeVars.get(key)) {
            if (std::find(bound.begin(), bound.end(), v) != bound.end()) captured = true;
        }
        if (!captured) inner[key] = value;
    }

    Expr body = _store.arg(e, 0);
    Substituter sibling(_store, inner);
    result = _store.rebuild(e, {sibling.walk(body)});
    return true;
}

Expr FluentSubstituter::walkFluentExp(Expr e, const std::vector<Expr>& args) {
    auto it = _fluents.find(_store.fluent(e));
    if (it == _fluents.end()) return rebuild(e, args);
    return _store.mkFluentExp(it->second, args);
}
