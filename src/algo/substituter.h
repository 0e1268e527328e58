#ifndef PLANCOMP_SUBSTITUTER_H
#define PLANCOMP_SUBSTITUTER_H

#include "algo/identity_walker.h"
#include "data/substitution.h"
#include "util/hashmap.h"

/*
 * Replaces sub-expressions according to a substitution. Replacements are
 * not rewritten further. Below a quantifier, entries whose key mentions a
 * bound variable are dropped and the body is rewritten by a fresh sibling
 * substituter, so results computed under one binding context are never
 * reused under another.
 */
class Substituter : public IdentityWalker {

private:
    Substitution _subs;

public:
    Substituter(ExpressionStore& store, const Substitution& subs) : IdentityWalker(store), _subs(subs) {}

    Expr substitute(Expr e) {return walk(e);}

    static Expr substitute(ExpressionStore& store, Expr e, const Substitution& subs);

protected:
    bool preVisit(Expr e, Expr& result) override;
    std::string walkerName() const override {return "Substituter";}
};

// Replaces the fluent of every fluent expression found in the map, keeping
// the (rewritten) arguments.
class FluentSubstituter : public IdentityWalker {

private:
    FlatHashMap<const Fluent*, const Fluent*> _fluents;

public:
    FluentSubstituter(ExpressionStore& store, const FlatHashMap<const Fluent*, const Fluent*>& fluents) : 
        IdentityWalker(store), _fluents(fluents) {}

    Expr substitute(Expr e) {return walk(e);}

protected:
    Expr walkFluentExp(Expr e, const std::vector<Expr>& args) override;
    std::string walkerName() const override {return "FluentSubstituter";}
};

#endif
