#ifndef PLANCOMP_USERTYPE_FLUENTS_WALKER_H
#define PLANCOMP_USERTYPE_FLUENTS_WALKER_H

#include <vector>

#include "algo/dag_walker.h"
#include "algo/simplifier.h"
#include "util/hashmap.h"

class Environment;

// Rewritten expression together with what binds its fresh variables
struct UsertypeFluentsResult {
    Expr exp;
    // Variable standing for the value of a removed fluent at the top, or null
    const Variable* lastVar = nullptr;
    // The boolean fluent expression f'(args, lastVar), if lastVar is set
    Expr lastFluent;
    // Variables still free in exp apart from lastVar
    std::vector<const Variable*> freeVars;
    // Fluent expressions that must hold for the free variables
    std::vector<Expr> fluents;
};

/*
 * Removes fluents of user types given a map f -> f', where f' has the
 * signature of f plus one parameter of f's type and is boolean. An
 * occurrence f(args) is replaced by a fresh variable v together with the
 * atom f'(args, v); a boolean expression over such variables is closed by
 * an Exists over the conjunction of its atoms.
 */
class UsertypeFluentsWalker : public DagWalker<UsertypeFluentsResult> {

public:
    typedef UsertypeFluentsResult Result;

private:
    Environment& _env;
    FlatHashMap<const Fluent*, const Fluent*> _new_fluents;
    Simplifier _simplifier;

public:
    UsertypeFluentsWalker(Environment& env, const FlatHashMap<const Fluent*, const Fluent*>& newFluents);

    Result remove(Expr e) {return walk(e);}
    // Boolean expression without user-type fluents, simplified
    Expr removeFromCondition(Expr e);

protected:
    Result walkConstant(Expr e, const std::vector<Result>& args) override {return leaf(e, args);}
    Result walkObjectExp(Expr e, const std::vector<Result>& args) override {return leaf(e, args);}
    Result walkParamExp(Expr e, const std::vector<Result>& args) override {return leaf(e, args);}
    Result walkVariableExp(Expr e, const std::vector<Result>& args) override {return leaf(e, args);}
    Result walkFluentExp(Expr e, const std::vector<Result>& args) override;
    Result walkAnd(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkOr(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkNot(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkImplies(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkIff(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkExists(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkForall(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkPlus(Expr e, const std::vector<Result>& args) override {return open(e, args);}
    Result walkMinus(Expr e, const std::vector<Result>& args) override {return open(e, args);}
    Result walkTimes(Expr e, const std::vector<Result>& args) override {return open(e, args);}
    Result walkDiv(Expr e, const std::vector<Result>& args) override {return open(e, args);}
    Result walkLE(Expr e, const std::vector<Result>& args) override {return relation(e, args);}
    Result walkLT(Expr e, const std::vector<Result>& args) override {return relation(e, args);}
    Result walkEquals(Expr e, const std::vector<Result>& args) override {return relation(e, args);}
    Result walkAlways(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkSometime(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkAtMostOnce(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkSometimeBefore(Expr e, const std::vector<Result>& args) override {return closed(e, args);}
    Result walkSometimeAfter(Expr e, const std::vector<Result>& args) override {return closed(e, args);}

    std::string walkerName() const override {return "UsertypeFluentsWalker";}

private:
    Result leaf(Expr e, const std::vector<Result>& args);
    // Boolean arguments are closed; others pass their variables and atoms on.
    std::vector<Expr> processArgs(const std::vector<Result>& args, 
            std::vector<const Variable*>& vars, std::vector<Expr>& fluents);
    // Rebuilt from closed arguments, without free variables
    Result closed(Expr e, const std::vector<Result>& args);
    // Numeric expression passing its variables on
    Result open(Expr e, const std::vector<Result>& args);
    // Comparison closed over the variables of its sides
    Result relation(Expr e, const std::vector<Result>& args);
    Expr close(Expr e, const std::vector<const Variable*>& vars, const std::vector<Expr>& fluents);
};

#endif
