
#include <algorithm>
#include <cmath>

#include "algo/simplifier.h"
#include "algo/substituter.h"
#include "data/problem.h"

struct Number {
    bool integral;
    int64_t i;
    double r;

    double value() const {return integral ? (double) i : r;}
};

static Number toNumber(const ExpressionStore& store, Expr e) {
    if (store.is(e, OperatorKind::INT_CONSTANT)) return Number{true, store.intValue(e), 0};
    return Number{false, 0, store.realValue(e)};
}

static Expr toExpr(ExpressionStore& store, const Number& n) {
    return n.integral ? store.mkInt(n.i) : store.mkReal(n.r);
}

static Number add(const Number& a, const Number& b) {
    if (a.integral && b.integral) return Number{true, a.i + b.i, 0};
    return Number{false, 0, a.value() + b.value()};
}

static Number mul(const Number& a, const Number& b) {
    if (a.integral && b.integral) return Number{true, a.i * b.i, 0};
    return Number{false, 0, a.value() * b.value()};
}

Simplifier::Simplifier(ExpressionStore& store, const Problem* problem) : 
        IdentityWalker(store), _problem(problem), _free_vars(store) {
    if (_problem != nullptr) _static_fluents = _problem->staticFluents();
}

Expr Simplifier::walkFluentExp(Expr e, const std::vector<Expr>& args) {
    Expr res = rebuild(e, args);
    if (_problem == nullptr || !_static_fluents.count(_store.fluent(res))) return res;
    for (const Expr& a : args) if (!_store.isConstant(a)) return res;
    Expr value = _problem->initialValue(res);
    return value.valid() ? value : res;
}

Expr Simplifier::flatten(OperatorKind op, const std::vector<Expr>& args) {
    
    bool isAnd = op == OperatorKind::AND;
    Expr absorbing = _store.mkBool(!isAnd);
    Expr neutral = _store.mkBool(isAnd);

    std::vector<Expr> out;
    FlatHashSet<Expr, ExprHasher> seen;
    // x for each literal "not x" in out
    FlatHashSet<Expr, ExprHasher> negated;

    // False iff the absorbing element was found
    auto insert = [&](Expr a) {
        if (a == neutral) return true;
        if (a == absorbing) return false;
        if (seen.count(a)) return true;
        if (_store.isNot(a)) {
            if (seen.count(_store.arg(a, 0))) return false;
        } else if (negated.count(a)) return false;
        seen.insert(a);
        if (_store.isNot(a)) negated.insert(_store.arg(a, 0));
        out.push_back(a);
        return true;
    };

    for (const Expr& a : args) {
        if (_store.op(a) == op) {
            for (const Expr& sub : _store.args(a)) if (!insert(sub)) return absorbing;
        } else if (!insert(a)) return absorbing;
    }

    if (out.empty()) return neutral;
    return isAnd ? _store.mkAnd(std::move(out)) : _store.mkOr(std::move(out));
}

Expr Simplifier::walkAnd(Expr e, const std::vector<Expr>& args) {
    (void) e;
    return flatten(OperatorKind::AND, args);
}

Expr Simplifier::walkOr(Expr e, const std::vector<Expr>& args) {
    (void) e;
    return flatten(OperatorKind::OR, args);
}

Expr Simplifier::negate(Expr a) {
    if (_store.isBoolConstant(a)) return _store.mkBool(!_store.boolValue(a));
    if (_store.isNot(a)) return _store.arg(a, 0);
    return _store.mkNot(a);
}

Expr Simplifier::walkNot(Expr e, const std::vector<Expr>& args) {
    (void) e;
    return negate(args[0]);
}

Expr Simplifier::walkImplies(Expr e, const std::vector<Expr>& args) {
    Expr a = args[0], b = args[1];
    if (_store.isTrue(a)) return b;
    if (_store.isFalse(a)) return _store.mkTrue();
    if (_store.isTrue(b)) return _store.mkTrue();
    if (_store.isFalse(b)) return negate(a);
    if (a == b) return _store.mkTrue();
    return rebuild(e, args);
}

Expr Simplifier::walkIff(Expr e, const std::vector<Expr>& args) {
    Expr a = args[0], b = args[1];
    if (_store.isTrue(a)) return b;
    if (_store.isFalse(a)) return negate(b);
    if (_store.isTrue(b)) return a;
    if (_store.isFalse(b)) return negate(a);
    if (a == b) return _store.mkTrue();
    return rebuild(e, args);
}

Expr Simplifier::walkExists(Expr e, const std::vector<Expr>& args) {
    Expr body = args[0];
    if (_store.isBoolConstant(body)) return body;
    auto free = _free_vars.get(body);
    std::vector<const Variable*> vars;
    for (const Variable* v : _store.variables(e)) {
        if (std::find(free.begin(), free.end(), v) != free.end()) vars.push_back(v);
    }
    if (vars.empty()) return body;
    return eliminateEqualities(vars, body);
}

Expr Simplifier::eliminateEqualities(const std::vector<const Variable*>& vars, Expr body) {
    
    std::vector<Expr> conjuncts = _store.isAnd(body) ? _store.args(body) : std::vector<Expr>{body};

    for (const Variable* v : vars) {
        Expr var = _store.mkVariable(v);
        for (const Expr& c : conjuncts) {
            if (!_store.is(c, OperatorKind::EQUALS)) continue;
            Expr l = _store.arg(c, 0), r = _store.arg(c, 1);
            Expr term;
            if (l == var) term = r;
            else if (r == var) term = l;
            else continue;
            auto termVars = _free_vars.get(term);
            if (std::find(termVars.begin(), termVars.end(), v) != termVars.end()) continue;

            // exists v. (v = t and phi)  ==>  phi[t/v]
            Substitution s;
            s[var] = term;
            Expr newBody = walk(Substituter::substitute(_store, body, s));
            std::vector<const Variable*> remaining;
            for (const Variable* w : vars) if (w != v) remaining.push_back(w);
            return walk(_store.mkExists(remaining, newBody));
        }
    }
    return _store.mkExists(vars, body);
}

Expr Simplifier::walkForall(Expr e, const std::vector<Expr>& args) {
    Expr body = args[0];
    if (_store.isBoolConstant(body)) return body;
    auto free = _free_vars.get(body);
    std::vector<const Variable*> vars;
    for (const Variable* v : _store.variables(e)) {
        if (std::find(free.begin(), free.end(), v) != free.end()) vars.push_back(v);
    }
    return _store.mkForall(vars, body);
}

Expr Simplifier::walkPlus(Expr e, const std::vector<Expr>& args) {
    (void) e;
    Number acc{true, 0, 0};
    std::vector<Expr> rest;
    auto insert = [&](Expr a) {
        if (_store.isNumericConstant(a)) acc = add(acc, toNumber(_store, a));
        else rest.push_back(a);
    };
    for (const Expr& a : args) {
        if (_store.is(a, OperatorKind::PLUS)) for (const Expr& sub : _store.args(a)) insert(sub);
        else insert(a);
    }
    if (rest.empty()) return toExpr(_store, acc);
    if (acc.value() != 0) rest.push_back(toExpr(_store, acc));
    return _store.mkPlus(std::move(rest));
}

Expr Simplifier::walkMinus(Expr e, const std::vector<Expr>& args) {
    Expr a = args[0], b = args[1];
    if (_store.isNumericConstant(a) && _store.isNumericConstant(b)) {
        Number na = toNumber(_store, a), nb = toNumber(_store, b);
        nb = nb.integral ? Number{true, -nb.i, 0} : Number{false, 0, -nb.r};
        return toExpr(_store, add(na, nb));
    }
    if (_store.isNumericConstant(b) && _store.numericValue(b) == 0) return a;
    if (a == b) return _store.mkInt(0);
    return rebuild(e, args);
}

Expr Simplifier::walkTimes(Expr e, const std::vector<Expr>& args) {
    (void) e;
    Number acc{true, 1, 0};
    std::vector<Expr> rest;
    auto insert = [&](Expr a) {
        if (_store.isNumericConstant(a)) acc = mul(acc, toNumber(_store, a));
        else rest.push_back(a);
    };
    for (const Expr& a : args) {
        if (_store.is(a, OperatorKind::TIMES)) for (const Expr& sub : _store.args(a)) insert(sub);
        else insert(a);
    }
    if (rest.empty() || acc.value() == 0) return toExpr(_store, acc);
    if (acc.value() != 1) rest.push_back(toExpr(_store, acc));
    return _store.mkTimes(std::move(rest));
}

Expr Simplifier::walkDiv(Expr e, const std::vector<Expr>& args) {
    Expr a = args[0], b = args[1];
    if (_store.isNumericConstant(b)) {
        Number nb = toNumber(_store, b);
        if (nb.value() == 1) return a;
        if (nb.value() != 0 && _store.isNumericConstant(a)) {
            Number na = toNumber(_store, a);
            if (na.integral && nb.integral && na.i % nb.i == 0) return _store.mkInt(na.i / nb.i);
            return _store.mkReal(na.value() / nb.value());
        }
    }
    return rebuild(e, args);
}

Expr Simplifier::walkLE(Expr e, const std::vector<Expr>& args) {
    Expr a = args[0], b = args[1];
    if (_store.isNumericConstant(a) && _store.isNumericConstant(b)) 
        return _store.mkBool(_store.numericValue(a) <= _store.numericValue(b));
    if (a == b) return _store.mkTrue();
    return rebuild(e, args);
}

Expr Simplifier::walkLT(Expr e, const std::vector<Expr>& args) {
    Expr a = args[0], b = args[1];
    if (_store.isNumericConstant(a) && _store.isNumericConstant(b)) 
        return _store.mkBool(_store.numericValue(a) < _store.numericValue(b));
    if (a == b) return _store.mkFalse();
    return rebuild(e, args);
}

Expr Simplifier::walkEquals(Expr e, const std::vector<Expr>& args) {
    Expr a = args[0], b = args[1];
    if (a == b) return _store.mkTrue();
    if (_store.isNumericConstant(a) && _store.isNumericConstant(b)) 
        return _store.mkBool(_store.numericValue(a) == _store.numericValue(b));
    if (_store.is(a, OperatorKind::OBJECT_EXP) && _store.is(b, OperatorKind::OBJECT_EXP)) 
        return _store.mkFalse();
    return rebuild(e, args);
}

Expr Simplifier::walkAlways(Expr e, const std::vector<Expr>& args) {
    if (_store.isBoolConstant(args[0])) return args[0];
    return rebuild(e, args);
}

Expr Simplifier::walkSometime(Expr e, const std::vector<Expr>& args) {
    if (_store.isBoolConstant(args[0])) return args[0];
    return rebuild(e, args);
}

Expr Simplifier::walkAtMostOnce(Expr e, const std::vector<Expr>& args) {
    if (_store.isBoolConstant(args[0])) return _store.mkTrue();
    return rebuild(e, args);
}

Expr Simplifier::walkSometimeBefore(Expr e, const std::vector<Expr>& args) {
    // phi can never hold, or holds already in the initial state
    if (_store.isFalse(args[0])) return _store.mkTrue();
    if (_store.isTrue(args[0])) return _store.mkFalse();
    return rebuild(e, args);
}

Expr Simplifier::walkSometimeAfter(Expr e, const std::vector<Expr>& args) {
    if (_store.isFalse(args[0]) || _store.isTrue(args[1])) return _store.mkTrue();
    return rebuild(e, args);
}
