#ifndef PLANCOMP_SIMPLIFIER_H
#define PLANCOMP_SIMPLIFIER_H

#include "algo/identity_walker.h"
#include "algo/extractors.h"
#include "util/hashmap.h"

class Problem;

/*
 * Bottom-up simplification: constant folding of boolean, arithmetic and
 * relational operators, flattening of nested And/Or with removal of
 * duplicates and detection of complementary literals, removal of unused
 * quantified variables and elimination of existential variables that are
 * equated to a term. Given a problem, ground expressions over static
 * fluents are replaced by their initial value.
 * Simplifying a simplified expression returns it unchanged.
 */
class Simplifier : public IdentityWalker {

private:
    const Problem* _problem;
    // Fluents no action or timed effect ever writes
    FlatHashSet<const Fluent*> _static_fluents;
    FreeVarsExtractor _free_vars;

public:
    explicit Simplifier(ExpressionStore& store, const Problem* problem = nullptr);

    Expr simplify(Expr e) {return walk(e);}

protected:
    Expr walkFluentExp(Expr e, const std::vector<Expr>& args) override;
    Expr walkAnd(Expr e, const std::vector<Expr>& args) override;
    Expr walkOr(Expr e, const std::vector<Expr>& args) override;
    Expr walkNot(Expr e, const std::vector<Expr>& args) override;
    Expr walkImplies(Expr e, const std::vector<Expr>& args) override;
    Expr walkIff(Expr e, const std::vector<Expr>& args) override;
    Expr walkExists(Expr e, const std::vector<Expr>& args) override;
    Expr walkForall(Expr e, const std::vector<Expr>& args) override;
    Expr walkPlus(Expr e, const std::vector<Expr>& args) override;
    Expr walkMinus(Expr e, const std::vector<Expr>& args) override;
    Expr walkTimes(Expr e, const std::vector<Expr>& args) override;
    Expr walkDiv(Expr e, const std::vector<Expr>& args) override;
    Expr walkLE(Expr e, const std::vector<Expr>& args) override;
    Expr walkLT(Expr e, const std::vector<Expr>& args) override;
    Expr walkEquals(Expr e, const std::vector<Expr>& args) override;
    Expr walkAlways(Expr e, const std::vector<Expr>& args) override;
    Expr walkSometime(Expr e, const std::vector<Expr>& args) override;
    Expr walkAtMostOnce(Expr e, const std::vector<Expr>& args) override;
    Expr walkSometimeBefore(Expr e, const std::vector<Expr>& args) override;
    Expr walkSometimeAfter(Expr e, const std::vector<Expr>& args) override;

    std::string walkerName() const override {return "Simplifier";}

private:
    Expr flatten(OperatorKind op, const std::vector<Expr>& args);
    Expr negate(Expr e);
    Expr eliminateEqualities(const std::vector<const Variable*>& vars, Expr body);
};

#endif
