#ifndef PLANCOMP_STATE_EVALUATOR_H
#define PLANCOMP_STATE_EVALUATOR_H

#include "algo/identity_walker.h"
#include "algo/quantifier_expander.h"
#include "algo/simplifier.h"
#include "plan/state.h"

class Problem;

/*
 * Value of a ground expression in a state: quantifiers are expanded over
 * the problem's domains, ground fluent expressions are replaced by their
 * value and the result is simplified to a constant.
 */
class StateEvaluator : public IdentityWalker {

private:
    const State* _state = nullptr;
    QuantifierExpander _expander;
    Simplifier _simplifier;

public:
    StateEvaluator(ExpressionStore& store, const Problem& problem) : 
        IdentityWalker(store, /*clearMemo=*/true), _expander(store, problem), _simplifier(store) {}

    // Raises UsageError if the expression does not evaluate to a constant
    Expr evaluate(Expr e, const State& state);
    bool holds(Expr e, const State& state);

protected:
    Expr walkFluentExp(Expr e, const std::vector<Expr>& args) override;
    std::string walkerName() const override {return "StateEvaluator";}
};

#endif
