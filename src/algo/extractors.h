#ifndef PLANCOMP_EXTRACTORS_H
#define PLANCOMP_EXTRACTORS_H

#include <vector>
#include <bitset>

#include "algo/dag_walker.h"

// Free variables of an expression, in order of first occurrence.
class FreeVarsExtractor : public DagWalker<std::vector<const Variable*>> {

public:
    typedef std::vector<const Variable*> VarList;

    explicit FreeVarsExtractor(ExpressionStore& store) : DagWalker<VarList>(store) {}
    VarList get(Expr e) {return walk(e);}

protected:
    VarList walkConstant(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkObjectExp(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkParamExp(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkVariableExp(Expr e, const std::vector<VarList>& args) override;
    VarList walkFluentExp(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkAnd(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkOr(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkNot(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkImplies(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkIff(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkExists(Expr e, const std::vector<VarList>& args) override {return unbind(e, args);}
    VarList walkForall(Expr e, const std::vector<VarList>& args) override {return unbind(e, args);}
    VarList walkPlus(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkMinus(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkTimes(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkDiv(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkLE(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkLT(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkEquals(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkAlways(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkSometime(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkAtMostOnce(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkSometimeBefore(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}
    VarList walkSometimeAfter(Expr e, const std::vector<VarList>& args) override {return unite(e, args);}

private:
    VarList unite(Expr e, const std::vector<VarList>& args);
    VarList unbind(Expr e, const std::vector<VarList>& args);
};

// All fluent expressions occurring in an expression (also inside fluent
// arguments), in order of first occurrence, inner ones first.
class FluentsExtractor : public DagWalker<std::vector<Expr>> {

public:
    explicit FluentsExtractor(ExpressionStore& store) : DagWalker<std::vector<Expr>>(store) {}
    std::vector<Expr> get(Expr e) {return walk(e);}

protected:
    typedef std::vector<Expr> ExprList;
    ExprList walkConstant(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkObjectExp(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkParamExp(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkVariableExp(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkFluentExp(Expr e, const std::vector<ExprList>& args) override;
    ExprList walkAnd(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkOr(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkNot(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkImplies(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkIff(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkExists(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkForall(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkPlus(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkMinus(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkTimes(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkDiv(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkLE(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkLT(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkEquals(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkAlways(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkSometime(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkAtMostOnce(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkSometimeBefore(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}
    ExprList walkSometimeAfter(Expr e, const std::vector<ExprList>& args) override {return unite(e, args);}

private:
    ExprList unite(Expr e, const std::vector<ExprList>& args);
};

typedef std::bitset<NUM_OPERATOR_KINDS> OperatorSet;

// Set of operators occurring in an expression.
class OperatorsExtractor : public DagWalker<OperatorSet> {

public:
    explicit OperatorsExtractor(ExpressionStore& store) : DagWalker<OperatorSet>(store) {}
    OperatorSet get(Expr e) {return walk(e);}
    static bool has(const OperatorSet& set, OperatorKind op) {return set.test(static_cast<int>(op));}

protected:
    OperatorSet walkConstant(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkObjectExp(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkParamExp(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkVariableExp(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkFluentExp(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkAnd(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkOr(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkNot(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkImplies(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkIff(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkExists(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkForall(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkPlus(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkMinus(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkTimes(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkDiv(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkLE(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkLT(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkEquals(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkAlways(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkSometime(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkAtMostOnce(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkSometimeBefore(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}
    OperatorSet walkSometimeAfter(Expr e, const std::vector<OperatorSet>& args) override {return collect(e, args);}

private:
    OperatorSet collect(Expr e, const std::vector<OperatorSet>& args) {
        OperatorSet out;
        out.set(static_cast<int>(_store.op(e)));
        for (const auto& a : args) out |= a;
        return out;
    }
};

#endif
