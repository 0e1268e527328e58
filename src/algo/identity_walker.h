#ifndef PLANCOMP_IDENTITY_WALKER_H
#define PLANCOMP_IDENTITY_WALKER_H

#include "algo/dag_walker.h"

/*
 * Rebuilds every node from the rewritten results of its arguments.
 * Nodes whose arguments did not change are returned as the very same
 * expression, so callers can detect "no change" by handle equality.
 * Rewriters derive from this walker and override only what they change.
 */
class IdentityWalker : public DagWalker<Expr> {

public:
    explicit IdentityWalker(ExpressionStore& store, bool clearMemo = false) : DagWalker<Expr>(store, clearMemo) {}

protected:
    Expr rebuild(Expr e, const std::vector<Expr>& args) {
        return _store.rebuild(e, std::vector<Expr>(args));
    }

    Expr walkConstant(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkObjectExp(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkParamExp(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkVariableExp(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkFluentExp(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkAnd(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkOr(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkNot(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkImplies(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkIff(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkExists(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkForall(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkPlus(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkMinus(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkTimes(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkDiv(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkLE(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkLT(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkEquals(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkAlways(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkSometime(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkAtMostOnce(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkSometimeBefore(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}
    Expr walkSometimeAfter(Expr e, const std::vector<Expr>& args) override {return rebuild(e, args);}

    std::string walkerName() const override {return "IdentityWalker";}
};

#endif
