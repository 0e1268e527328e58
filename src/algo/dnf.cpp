
#include "algo/dnf.h"

Disjuncts Dnf::getDisjuncts(Expr e) {
    return walk(_simplifier.simplify(_nnf.get(e)));
}

Expr Dnf::get(Expr e) {
    std::vector<Expr> disjuncts;
    for (auto& conj : getDisjuncts(e)) disjuncts.push_back(_store.mkAnd(conj));
    return _store.mkOr(std::move(disjuncts));
}

bool Dnf::preVisit(Expr e, Disjuncts& result) {
    if (_store.isAnd(e) || _store.isOr(e)) return false;
    if (_store.isTrue(e)) result = Disjuncts(1);
    else if (_store.isFalse(e)) result = Disjuncts();
    else result = Disjuncts{{e}};
    return true;
}

Disjuncts Dnf::walkAnd(Expr e, const std::vector<Disjuncts>& args) {
    (void) e;
    Disjuncts product(1);
    for (const Disjuncts& arg : args) {
        Disjuncts next;
        for (const auto& left : product) for (const auto& right : arg) {
            std::vector<Expr> conj = left;
            conj.insert(conj.end(), right.begin(), right.end());
            next.push_back(std::move(conj));
        }
        product = std::move(next);
        if (product.empty()) return product;
    }

    Disjuncts out;
    for (const auto& conj : product) {
        Expr s = _simplifier.simplify(_store.mkAnd(conj));
        if (_store.isFalse(s)) continue;
        if (_store.isTrue(s)) return Disjuncts(1);
        out.push_back(_store.isAnd(s) ? _store.args(s) : std::vector<Expr>{s});
    }
    return out;
}

Disjuncts Dnf::walkOr(Expr e, const std::vector<Disjuncts>& args) {
    (void) e;
    Disjuncts out;
    for (const Disjuncts& arg : args) for (const auto& conj : arg) {
        if (conj.empty()) return Disjuncts(1);
        out.push_back(conj);
    }
    return out;
}
