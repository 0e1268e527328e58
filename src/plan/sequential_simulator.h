#ifndef PLANCOMP_SEQUENTIAL_SIMULATOR_H
#define PLANCOMP_SEQUENTIAL_SIMULATOR_H

#include <vector>

#include "data/problem.h"
#include "data/substitution.h"
#include "algo/state_evaluator.h"
#include "plan/plan.h"
#include "plan/state.h"

/*
 * Executes instantaneous (and sensing) action instances on states of a
 * problem without durative actions, timed effects and timed goals.
 * All effects of an instance are evaluated in the state it is applied to;
 * increase and decrease effects on the same fluent accumulate.
 */
class SequentialSimulator {

private:
    const Problem& _problem;
    ExpressionStore& _store;
    StateEvaluator _evaluator;

public:
    // Raises UsageError if the problem is temporal
    explicit SequentialSimulator(const Problem& problem);

    const Problem& problem() const {return _problem;}
    State initialState() const {return State(_problem);}

    // The preconditions of the instance, with its parameters bound, that
    // do not hold in the state
    std::vector<Expr> unsatisfiedConditions(const State& state, const ActionInstance& instance);
    bool isApplicable(const State& state, const ActionInstance& instance) {
        return unsatisfiedConditions(state, instance).empty();
    }

    // The successor state. Raises UsageError if the instance is not
    // applicable and ConflictingEffectsError if two triggered effects
    // disagree on a fluent.
    State apply(const State& state, const ActionInstance& instance);

    std::vector<Expr> unsatisfiedGoals(const State& state);
    bool isGoal(const State& state) {return unsatisfiedGoals(state).empty();}

    Expr evaluate(Expr e, const State& state) {return _evaluator.evaluate(e, state);}
    bool holds(Expr e, const State& state) {return _evaluator.holds(e, state);}

    // Parameters of the instance mapped to its actual parameters
    Substitution binding(const ActionInstance& instance) const;

private:
    std::vector<Substitution> effectBindings(const Effect& effect, const Substitution& subs) const;
    Expr groundTarget(Expr fluentExp, const State& state);
};

#endif
