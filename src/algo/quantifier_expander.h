#ifndef PLANCOMP_QUANTIFIER_EXPANDER_H
#define PLANCOMP_QUANTIFIER_EXPANDER_H

#include "algo/identity_walker.h"

class Problem;

/*
 * Replaces every Exists / Forall by the disjunction / conjunction of its
 * body instantiated with all bindings of the quantified variables over
 * their finite domains in the problem. Inner quantifiers are expanded
 * first; the product order follows ArgIterator.
 */
class QuantifierExpander : public IdentityWalker {

private:
    const Problem& _problem;

public:
    QuantifierExpander(ExpressionStore& store, const Problem& problem) : IdentityWalker(store), _problem(problem) {}

    Expr expand(Expr e) {return walk(e);}

protected:
    Expr walkExists(Expr e, const std::vector<Expr>& args) override;
    Expr walkForall(Expr e, const std::vector<Expr>& args) override;
    std::string walkerName() const override {return "QuantifierExpander";}

private:
    std::vector<Expr> instantiate(Expr e, Expr body);
};

#endif
