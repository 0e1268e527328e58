#ifndef PLANCOMP_DNF_H
#define PLANCOMP_DNF_H

#include <vector>

#include "algo/dag_walker.h"
#include "algo/nnf.h"
#include "algo/simplifier.h"

typedef std::vector<std::vector<Expr>> Disjuncts;

/*
 * Disjunctive normal form of the NNF of an expression, computed as a list
 * of conjunctions of literals: an empty list is false and a list holding an
 * empty conjunction is true. And distributes over Or by the Cartesian
 * product of the argument lists; every product term is simplified and
 * dropped if false. Anything but And/Or is an atom.
 */
class Dnf : public DagWalker<Disjuncts> {

private:
    Nnf _nnf;
    Simplifier _simplifier;

public:
    explicit Dnf(ExpressionStore& store) : DagWalker<Disjuncts>(store), _nnf(store), _simplifier(store) {}

    // The disjuncts of the DNF of e
    Disjuncts getDisjuncts(Expr e);
    // The DNF of e as an expression
    Expr get(Expr e);

protected:
    bool preVisit(Expr e, Disjuncts& result) override;
    Disjuncts walkAnd(Expr e, const std::vector<Disjuncts>& args) override;
    Disjuncts walkOr(Expr e, const std::vector<Disjuncts>& args) override;
    std::string walkerName() const override {return "Dnf";}
};

#endif
