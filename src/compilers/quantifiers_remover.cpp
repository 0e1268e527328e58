
#include "compilers/quantifiers_remover.h"
#include "algo/quantifier_expander.h"
#include "algo/arg_iterator.h"
#include "algo/substituter.h"
#include "algo/simplifier.h"
#include "util/log.h"

ProblemKind QuantifiersRemover::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    out.unset("EXISTENTIAL_CONDITIONS").unset("UNIVERSAL_CONDITIONS").unset("FORALL_EFFECTS");
    if (kind.has("EXISTENTIAL_CONDITIONS")) out.set("DISJUNCTIVE_CONDITIONS");
    return out;
}

namespace {

class EffectExpander {

private:
    ExpressionStore& _store;
    const Problem& _problem;
    QuantifierExpander& _expander;
    Simplifier _simplifier;

public:
    EffectExpander(ExpressionStore& store, const Problem& problem, QuantifierExpander& expander) : 
        _store(store), _problem(problem), _expander(expander), _simplifier(store) {}

    // Adds the expanded effect to the list
    void expand(const Effect& e, std::vector<Effect>& out) {
        Expr fluent = _expander.expand(e.fluent());
        Expr value = _expander.expand(e.value());
        Expr condition = _expander.expand(e.condition());
        if (!e.isForall()) {
            addSimultaneousEffect(_store, out, Effect(_store, fluent, value, condition, e.kind()));
            return;
        }
        std::vector<const Type*> types;
        std::vector<Expr> vars;
        for (const Variable* v : e.forall()) {
            types.push_back(v->type);
            vars.push_back(_store.mkVariable(v));
        }
        for (const auto& binding : ArgIterator(ArgIterator::getDomains(types, _problem))) {
            Substitution subs(vars, binding);
            Expr c = _simplifier.simplify(Substituter::substitute(_store, condition, subs));
            if (_store.isFalse(c)) continue;
            addSimultaneousEffect(_store, out, Effect(_store, Substituter::substitute(_store, fluent, subs), 
                Substituter::substitute(_store, value, subs), c, e.kind()));
        }
    }
};

}

CompilerResult QuantifiersRemover::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;

    ExpressionStore& store = problem.exprs();
    auto newProblem = problem.clone();
    newProblem->setName(_name + "_" + problem.name());

    QuantifierExpander expander(store, problem);
    EffectExpander effects(store, problem, expander);
    ActionMap actionMap;

    for (size_t i = 0; i < newProblem->actions().size(); i++) {
        Action& action = *newProblem->actions()[i];
        actionMap[&action] = problem.actions()[i];

        if (!action.isDurative()) {
            std::vector<Expr> pres;
            for (const Expr& c : action.preconditions()) pres.push_back(expander.expand(c));
            action.setPreconditions(pres);
            std::vector<Effect> effs = action.effects();
            action.clearEffects();
            std::vector<Effect> newEffs;
            for (const Effect& e : effs) effects.expand(e, newEffs);
            for (const Effect& e : newEffs) action.addEffect(store, e);
            continue;
        }

        auto conditions = action.conditions();
        action.clearConditions();
        for (const auto& [interval, conds] : conditions) {
            for (const Expr& c : conds) action.addCondition(store, interval, expander.expand(c));
        }
        auto timedEffects = action.timedEffects();
        action.clearEffects();
        for (const auto& [timing, effs] : timedEffects) {
            std::vector<Effect> newEffs;
            for (const Effect& e : effs) effects.expand(e, newEffs);
            for (const Effect& e : newEffs) action.addEffect(store, timing, e);
        }
        DurationInterval d = action.duration();
        action.setDuration(DurationInterval(expander.expand(d.lower), expander.expand(d.upper), d.leftOpen, d.rightOpen));
    }

    newProblem->clearGoals();
    for (const Expr& g : problem.goals()) newProblem->addGoal(expander.expand(g));
    newProblem->clearTimedGoals();
    for (const auto& [interval, goals] : problem.timedGoals()) {
        for (const Expr& g : goals) newProblem->addTimedGoal(interval, expander.expand(g));
    }
    newProblem->clearTimedEffects();
    for (const auto& [timing, effs] : problem.timedEffects()) {
        std::vector<Effect> newEffs;
        for (const Effect& e : effs) effects.expand(e, newEffs);
        for (const Effect& e : newEffs) newProblem->addTimedEffect(timing, e);
    }
    newProblem->clearTrajectoryConstraints();
    for (const Expr& c : problem.trajectoryConstraints()) newProblem->addTrajectoryConstraint(expander.expand(c));
    newProblem->clearStateInvariants();
    for (const Expr& c : problem.stateInvariants()) newProblem->addStateInvariant(expander.expand(c));

    newProblem->clearQualityMetrics();
    for (QualityMetric m : problem.qualityMetrics()) {
        if (m.expression.valid()) m.expression = expander.expand(m.expression);
        for (auto& [goal, gain] : m.gains) goal = expander.expand(goal);
        newProblem->addQualityMetric(m);
    }

    return CompilerResult{newProblem, replaceAction(std::move(actionMap)), _name};
}
