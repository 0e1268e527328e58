
#include <algorithm>

#include "algo/extractors.h"

FreeVarsExtractor::VarList FreeVarsExtractor::walkVariableExp(Expr e, const std::vector<VarList>& args) {
    (void) args;
    return VarList{_store.variable(e)};
}

FreeVarsExtractor::VarList FreeVarsExtractor::unite(Expr e, const std::vector<VarList>& args) {
    (void) e;
    if (args.empty()) return VarList();
    if (args.size() == 1) return args[0];
    VarList out;
    for (const auto& list : args) for (const Variable* v : list) {
        if (std::find(out.begin(), out.end(), v) == out.end()) out.push_back(v);
    }
    return out;
}

FreeVarsExtractor::VarList FreeVarsExtractor::unbind(Expr e, const std::vector<VarList>& args) {
    const auto& bound = _store.variables(e);
    VarList out;
    for (const Variable* v : args[0]) {
        if (std::find(bound.begin(), bound.end(), v) == bound.end()) out.push_back(v);
    }
    return out;
}

std::vector<Expr> FluentsExtractor::walkFluentExp(Expr e, const std::vector<ExprList>& args) {
    ExprList out = unite(e, args);
    out.push_back(e);
    return out;
}

std::vector<Expr> FluentsExtractor::unite(Expr e, const std::vector<ExprList>& args) {
    (void) e;
    if (args.empty()) return ExprList();
    if (args.size() == 1) return args[0];
    ExprList out;
    FlatHashSet<Expr, ExprHasher> seen;
    for (const auto& list : args) for (const Expr& f : list) {
        if (seen.insert(f).second) out.push_back(f);
    }
    return out;
}
