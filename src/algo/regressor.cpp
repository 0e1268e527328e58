
#include "algo/regressor.h"

Expr Regressor::gamma(Expr fluentExp, bool positive) {
    std::vector<Expr> guards;
    for (const Effect& e : _effects) {
        if (e.fluent() != fluentExp || !e.isAssignment()) continue;
        Expr value = positive ? e.value() : _store.mkNot(e.value());
        guards.push_back(_store.mkAnd(e.condition(), value));
    }
    return _simplifier.simplify(_store.mkOr(guards));
}

bool Regressor::preVisit(Expr e, Expr& result) {
    if (!_store.isFluentExp(e)) return false;
    if (!_store.type(e)->isBool()) {
        result = unsupported(e, {});
        return true;
    }
    // R(l) = gamma(l) or (l and not gamma(not l))
    result = _store.mkOr(gamma(e, true), _store.mkAnd(e, _store.mkNot(gamma(e, false))));
    return true;
}
