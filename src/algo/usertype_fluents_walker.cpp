
#include <algorithm>

#include "algo/usertype_fluents_walker.h"
#include "data/environment.h"
#include "util/errors.h"
#include "util/names.h"

namespace {

template <typename T>
void appendUnique(std::vector<T>& vec, const T& elem) {
    if (std::find(vec.begin(), vec.end(), elem) == vec.end()) vec.push_back(elem);
}

}

UsertypeFluentsWalker::UsertypeFluentsWalker(Environment& env, const FlatHashMap<const Fluent*, const Fluent*>& newFluents) : 
    DagWalker<Result>(env.exprs()), _env(env), _new_fluents(newFluents), _simplifier(env.exprs()) {}

Expr UsertypeFluentsWalker::removeFromCondition(Expr e) {
    Result r = walk(e);
    if (r.lastVar != nullptr || (!r.freeVars.empty() && !_store.type(r.exp)->isBool())) 
        throw ProblemDefinitionError("Cannot remove the user-type fluents of " + Names::to_string(_store, e) 
            + " outside of a condition");
    return _simplifier.simplify(close(r.exp, r.freeVars, r.fluents));
}

UsertypeFluentsResult UsertypeFluentsWalker::leaf(Expr e, const std::vector<Result>& args) {
    (void) args;
    Result r;
    r.exp = e;
    return r;
}

std::vector<Expr> UsertypeFluentsWalker::processArgs(const std::vector<Result>& args, 
        std::vector<const Variable*>& vars, std::vector<Expr>& fluents) {
    std::vector<Expr> exps;
    for (const Result& arg : args) {
        if (_store.type(arg.exp)->isBool()) {
            exps.push_back(close(arg.exp, arg.freeVars, arg.fluents));
            continue;
        }
        if (arg.lastVar != nullptr) {
            appendUnique(vars, arg.lastVar);
            appendUnique(fluents, arg.lastFluent);
        }
        for (const Variable* v : arg.freeVars) appendUnique(vars, v);
        for (const Expr& f : arg.fluents) appendUnique(fluents, f);
        exps.push_back(arg.exp);
    }
    return exps;
}

Expr UsertypeFluentsWalker::close(Expr e, const std::vector<const Variable*>& vars, const std::vector<Expr>& fluents) {
    if (vars.empty()) return e;
    std::vector<Expr> conj = {e};
    conj.insert(conj.end(), fluents.begin(), fluents.end());
    return _store.mkExists(vars, _store.mkAnd(conj));
}

UsertypeFluentsResult UsertypeFluentsWalker::walkFluentExp(Expr e, const std::vector<Result>& args) {
    Result r;
    std::vector<Expr> exps = processArgs(args, r.freeVars, r.fluents);
    const Fluent* f = _store.fluent(e);
    auto it = _new_fluents.find(f);
    if (it == _new_fluents.end()) {
        r.exp = _store.mkFluentExp(f, exps);
        return r;
    }
    const Fluent* nf = it->second;
    r.lastVar = _env.freshVariable(nf->name + "_" + f->type->name(), f->type);
    r.exp = _store.mkVariable(r.lastVar);
    exps.push_back(r.exp);
    r.lastFluent = _store.mkFluentExp(nf, exps);
    return r;
}

UsertypeFluentsResult UsertypeFluentsWalker::closed(Expr e, const std::vector<Result>& args) {
    std::vector<const Variable*> vars;
    std::vector<Expr> fluents;
    Result r;
    r.exp = _store.rebuild(e, processArgs(args, vars, fluents));
    return r;
}

UsertypeFluentsResult UsertypeFluentsWalker::open(Expr e, const std::vector<Result>& args) {
    Result r;
    r.exp = _store.rebuild(e, processArgs(args, r.freeVars, r.fluents));
    return r;
}

UsertypeFluentsResult UsertypeFluentsWalker::relation(Expr e, const std::vector<Result>& args) {
    std::vector<const Variable*> vars;
    std::vector<Expr> fluents;
    Expr rel = _store.rebuild(e, processArgs(args, vars, fluents));
    Result r;
    r.exp = close(rel, vars, fluents);
    return r;
}
