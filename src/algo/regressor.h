#ifndef PLANCOMP_REGRESSOR_H
#define PLANCOMP_REGRESSOR_H

#include <vector>

#include "algo/identity_walker.h"
#include "algo/simplifier.h"
#include "data/effect.h"

/*
 * Regression of a formula over ground boolean fluents through the effects
 * of a ground action: the formula over the state before the action that
 * holds iff the given formula holds after it. A literal l becomes
 * gamma(l) or (l and not gamma(not l)), where gamma(l) is the disjunction
 * of the guards of the effects setting l. Distributes over And, Or and Not;
 * other operators are not supported. Results are simplified.
 */
class Regressor : public IdentityWalker {

private:
    std::vector<Effect> _effects;
    Simplifier _simplifier;

public:
    Regressor(ExpressionStore& store, const std::vector<Effect>& effects) : 
        IdentityWalker(store), _effects(effects), _simplifier(store) {}

    Expr regress(Expr e) {return _simplifier.simplify(walk(e));}

    // Condition under which the action makes the fluent expression true (false)
    Expr gamma(Expr fluentExp, bool positive);

protected:
    bool preVisit(Expr e, Expr& result) override;

    Expr walkObjectExp(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkParamExp(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkVariableExp(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkImplies(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkIff(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkExists(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkForall(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkPlus(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkMinus(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkTimes(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkDiv(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkLE(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkLT(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkEquals(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkAlways(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkSometime(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkAtMostOnce(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkSometimeBefore(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}
    Expr walkSometimeAfter(Expr e, const std::vector<Expr>& args) override {return unsupported(e, args);}

    std::string walkerName() const override {return "Regressor";}
};

#endif
