
#include <algorithm>

#include "compilers/bounded_types_remover.h"
#include "algo/arg_iterator.h"
#include "algo/substituter.h"
#include "algo/simplifier.h"
#include "util/log.h"
#include "util/names.h"

ProblemKind BoundedTypesRemover::supportedKind() const {
    return ProblemKind::all();
}

ProblemKind BoundedTypesRemover::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    out.unset("BOUNDED_TYPES");
    return out;
}

namespace {

Expr bound(ExpressionStore& store, const Type* type, double value) {
    if (type->isInt()) return store.mkInt((int64_t) value);
    return store.mkReal(value);
}

// Conjunction of conditions and invariant, as a list of conjuncts; false if empty
bool conjoin(ExpressionStore& store, Simplifier& simplifier, const std::vector<Expr>& conds, 
        Expr invariant, std::vector<Expr>& out) {
    std::vector<Expr> all = conds;
    all.push_back(invariant);
    Expr s = simplifier.simplify(store.mkAnd(all));
    out.clear();
    if (store.isFalse(s)) return false;
    if (store.isAnd(s)) out = store.args(s);
    else if (!store.isTrue(s)) out.push_back(s);
    return true;
}

}

CompilerResult BoundedTypesRemover::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;

    Environment& env = problem.env();
    ExpressionStore& store = env.exprs();
    auto newProblem = problem.clone();
    newProblem->setName(_name + "_" + problem.name());
    newProblem->clearFluents();
    newProblem->clearInitialValues();
    newProblem->clearActions();

    FlatHashMap<const Fluent*, const Fluent*> retyped;
    std::vector<Expr> bounds;
    std::vector<std::pair<Expr, Expr>> initialValues;
    for (const Fluent* f : problem.fluents()) {
        const Type* type = f->type;
        if (!type->isNumeric() || !type->isBounded()) {
            newProblem->addFluent(f, problem.fluentDefault(f));
            continue;
        }
        const Fluent* nf = env.fluent(f->name, env.types().unbounded(type), f->signature);
        retyped[f] = nf;
        newProblem->addFluent(nf, problem.fluentDefault(f));

        std::vector<std::vector<Expr>> bindings;
        if (f->signature.empty()) {
            bindings.emplace_back();
        } else {
            std::vector<const Type*> types;
            for (const Parameter* p : f->signature) types.push_back(p->type);
            for (const auto& args : ArgIterator(ArgIterator::getDomains(types, problem))) bindings.push_back(args);
        }
        for (const auto& args : bindings) {
            Expr fe = store.mkFluentExp(nf, args);
            if (type->hasLowerBound()) bounds.push_back(store.mkLE(bound(store, type, type->lowerBound()), fe));
            if (type->hasUpperBound()) bounds.push_back(store.mkLE(fe, bound(store, type, type->upperBound())));
            // Values that fall back to the bounded type's default
            if (problem.fluentDefault(f).valid()) continue;
            Expr value = problem.initialValue(store.mkFluentExp(f, args));
            if (value.valid()) initialValues.emplace_back(fe, value);
        }
        Log::d("%s: %s retyped to %s\n", _name.c_str(), f->name.c_str(), nf->type->toString().c_str());
    }

    FluentSubstituter substituter(store, retyped);
    auto subst = [&](Expr e) {return e.valid() ? substituter.substitute(e) : e;};
    auto substEffect = [&](const Effect& e) {
        return Effect(store, subst(e.fluent()), subst(e.value()), subst(e.condition()), e.kind(), e.forall());
    };
    auto substAll = [&](const std::vector<Expr>& es) {
        std::vector<Expr> out;
        for (const Expr& e : es) out.push_back(subst(e));
        return out;
    };

    for (const auto& [fe, value] : problem.explicitInitialValues()) newProblem->setInitialValue(subst(fe), value);
    for (const auto& [fe, value] : initialValues) newProblem->setInitialValue(fe, value);

    Expr invariant = store.mkAnd(bounds);
    Simplifier simplifier(store);
    ActionMap actionMap;
    for (const auto& a : problem.actions()) {
        auto na = a->clone();
        na->clearEffects();
        bool feasible = true;
        if (!a->isDurative()) {
            std::vector<Expr> pres;
            feasible = conjoin(store, simplifier, substAll(a->preconditions()), invariant, pres);
            na->setPreconditions(pres);
            for (const Effect& e : a->effects()) na->addEffect(store, substEffect(e));
        } else {
            const DurationInterval& d = a->duration();
            na->setDuration(DurationInterval(subst(d.lower), subst(d.upper), d.leftOpen, d.rightOpen));
            na->clearConditions();
            std::vector<TimeInterval> intervals;
            for (const auto& [interval, conds] : a->conditions()) {
                std::vector<Expr> out;
                feasible = feasible && conjoin(store, simplifier, substAll(conds), invariant, out);
                for (const Expr& c : out) na->addCondition(store, interval, c);
                intervals.push_back(interval);
            }
            for (const auto& [timing, effs] : a->timedEffects()) {
                for (const Effect& e : effs) na->addEffect(store, timing, substEffect(e));
                TimeInterval point(timing);
                if (std::find(intervals.begin(), intervals.end(), point) != intervals.end()) continue;
                std::vector<Expr> out;
                feasible = feasible && conjoin(store, simplifier, {}, invariant, out);
                for (const Expr& c : out) na->addCondition(store, point, c);
                intervals.push_back(point);
            }
        }
        if (!feasible) {
            Log::d("%s: dropping %s, its condition is false\n", _name.c_str(), a->name().c_str());
            continue;
        }
        actionMap[na.get()] = a;
        newProblem->addAction(na);
    }

    std::vector<Expr> goals;
    newProblem->clearGoals();
    if (!conjoin(store, simplifier, substAll(problem.goals()), invariant, goals)) goals = {store.mkFalse()};
    for (const Expr& g : goals) newProblem->addGoal(g);

    newProblem->clearTimedGoals();
    std::vector<TimeInterval> goalIntervals;
    for (const auto& [interval, conds] : problem.timedGoals()) {
        std::vector<Expr> out;
        if (!conjoin(store, simplifier, substAll(conds), invariant, out)) out = {store.mkFalse()};
        for (const Expr& g : out) newProblem->addTimedGoal(interval, g);
        goalIntervals.push_back(interval);
    }
    newProblem->clearTimedEffects();
    for (const auto& [timing, effs] : problem.timedEffects()) {
        for (const Effect& e : effs) newProblem->addTimedEffect(timing, substEffect(e));
        TimeInterval point(timing);
        if (std::find(goalIntervals.begin(), goalIntervals.end(), point) != goalIntervals.end()) continue;
        std::vector<Expr> out;
        if (!conjoin(store, simplifier, {}, invariant, out)) out = {store.mkFalse()};
        for (const Expr& g : out) newProblem->addTimedGoal(point, g);
        goalIntervals.push_back(point);
    }

    newProblem->clearTrajectoryConstraints();
    for (const Expr& c : problem.trajectoryConstraints()) newProblem->addTrajectoryConstraint(subst(c));
    newProblem->clearStateInvariants();
    for (const Expr& c : problem.stateInvariants()) newProblem->addStateInvariant(subst(c));

    newProblem->clearQualityMetrics();
    for (QualityMetric m : problem.qualityMetrics()) {
        for (auto& [name, cost] : m.costs) cost = subst(cost);
        m.defaultCost = subst(m.defaultCost);
        m.expression = subst(m.expression);
        for (auto& [goal, gain] : m.gains) goal = subst(goal);
        newProblem->addQualityMetric(m);
    }

    Log::v("%s: %i fluents retyped, %i bound conditions\n", _name.c_str(), (int) retyped.size(), (int) bounds.size());
    return CompilerResult{newProblem, replaceAction(std::move(actionMap)), _name};
}
