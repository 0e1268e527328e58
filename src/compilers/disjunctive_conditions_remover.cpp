
#include "compilers/disjunctive_conditions_remover.h"
#include "compilers/compiler_utils.h"
#include "algo/dnf.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"

ProblemKind DisjunctiveConditionsRemover::supportedKind() const {
    return ProblemKind::all().unset("STATE_INVARIANTS").unset("TIMED_GOALS");
}

ProblemKind DisjunctiveConditionsRemover::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    out.unset("DISJUNCTIVE_CONDITIONS");
    return out;
}

namespace {

// Guards of assignments in DNF, one effect per disjunct
std::vector<Effect> splitEffect(ExpressionStore& store, Dnf& dnf, const Effect& e) {
    if (!e.isConditional()) return {e};
    Disjuncts disjuncts = dnf.getDisjuncts(e.condition());
    if (disjuncts.size() == 1) 
        return {Effect(store, e.fluent(), e.value(), store.mkAnd(disjuncts.front()), e.kind(), e.forall())};
    if (!disjuncts.empty() && !e.isAssignment()) 
        throw ProblemDefinitionError("Increase or decrease effect " + Names::to_string(store, e) 
            + " has a disjunctive guard; remove conditional effects (CONDITIONAL_EFFECTS_REMOVING) first");
    std::vector<Effect> out;
    for (const auto& conj : disjuncts) {
        out.emplace_back(store, e.fluent(), e.value(), store.mkAnd(conj), e.kind(), e.forall());
    }
    return out;
}

}

void DisjunctiveConditionsRemover::checkUserInput(const Problem& problem) const {
    checkNoReservedNames(problem);
}

CompilerResult DisjunctiveConditionsRemover::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;

    ExpressionStore& store = problem.exprs();
    auto newProblem = problem.clone();
    newProblem->setName(_name + "_" + problem.name());
    newProblem->clearActions();

    // Action names are left free so that the first sibling keeps its name
    FreshNames names(problem, false);
    Dnf dnf(store);
    ActionMap actionMap;
    std::vector<std::pair<std::string, std::string>> newToOldName;

    auto addSibling = [&](const std::shared_ptr<Action>& sibling, const std::shared_ptr<Action>& original) {
        sibling->setName(names.get(original->name()));
        Log::d("%s: %s -> %s\n", _name.c_str(), original->name().c_str(), sibling->name().c_str());
        actionMap[sibling.get()] = original;
        newToOldName.emplace_back(sibling->name(), original->name());
        newProblem->addAction(sibling);
    };

    for (const auto& a : problem.actions()) {
        // Effects are the same for all siblings
        auto base = a->clone();
        base->clearEffects();
        if (!a->isDurative()) {
            for (const Effect& e : a->effects()) 
                for (const Effect& se : splitEffect(store, dnf, e)) base->addEffect(store, se);
        } else {
            for (const auto& [timing, effs] : a->timedEffects()) 
                for (const Effect& e : effs) 
                    for (const Effect& se : splitEffect(store, dnf, e)) base->addEffect(store, timing, se);
        }

        if (!a->isDurative()) {
            Disjuncts disjuncts = dnf.getDisjuncts(store.mkAnd(a->preconditions()));
            if (disjuncts.empty()) Log::d("%s: dropping %s, precondition is false\n", _name.c_str(), a->name().c_str());
            for (const auto& conj : disjuncts) {
                auto sibling = base->clone();
                sibling->setPreconditions(conj);
                addSibling(sibling, a);
            }
            continue;
        }

        std::vector<TimeInterval> intervals;
        std::vector<Disjuncts> conditions;
        for (const auto& [interval, conds] : a->conditions()) {
            intervals.push_back(interval);
            conditions.push_back(dnf.getDisjuncts(store.mkAnd(conds)));
        }
        // Product over the intervals, first interval varying fastest
        size_t numSiblings = 1;
        for (const auto& d : conditions) numSiblings *= d.size();
        if (numSiblings == 0) Log::d("%s: dropping %s, a condition is false\n", _name.c_str(), a->name().c_str());
        std::vector<size_t> counter(conditions.size(), 0);
        for (size_t n = 0; n < numSiblings; n++) {
            auto sibling = base->clone();
            sibling->clearConditions();
            for (size_t i = 0; i < intervals.size(); i++) {
                for (const Expr& c : conditions[i][counter[i]]) sibling->addCondition(store, intervals[i], c);
            }
            addSibling(sibling, a);
            for (size_t i = 0; i < counter.size(); i++) {
                if (++counter[i] < conditions[i].size()) break;
                counter[i] = 0;
            }
        }
    }

    // Goals
    std::vector<std::string> auxiliaryActions;
    Disjuncts goals = dnf.getDisjuncts(store.mkAnd(problem.goals()));
    newProblem->clearGoals();
    if (goals.empty()) {
        newProblem->addGoal(store.mkFalse());
    } else if (goals.size() == 1) {
        for (const Expr& g : goals.front()) newProblem->addGoal(g);
    } else {
        for (const auto& a : problem.actions()) names.take(a->name());
        Environment& env = problem.env();
        const Fluent* reached = env.fluent(names.get("goal_reached"), env.types().boolType());
        newProblem->addFluent(reached, store.mkFalse());
        Expr reachedExp = store.mkFluentExp(reached);
        for (const auto& conj : goals) {
            InstantaneousBody body;
            body.preconditions = conj;
            body.effects.emplace_back(store, reachedExp, store.mkTrue(), store.mkTrue());
            auto aux = std::make_shared<Action>(names.get("achieve_goal"), std::vector<const Parameter*>(), std::move(body));
            actionMap[aux.get()] = nullptr;
            auxiliaryActions.push_back(aux->name());
            newProblem->addAction(aux);
        }
        newProblem->addGoal(reachedExp);
    }

    // Siblings cost what their action costs, auxiliary actions nothing
    newProblem->clearQualityMetrics();
    for (const QualityMetric& m : problem.qualityMetrics()) {
        if (!m.isActionCosts()) {
            newProblem->addQualityMetric(m);
            continue;
        }
        std::map<std::string, Expr> costs;
        for (const auto& [newName, oldName] : newToOldName) {
            Expr cost = m.cost(oldName);
            if (cost.valid()) costs[newName] = cost;
        }
        for (const auto& name : auxiliaryActions) costs[name] = store.mkInt(0);
        newProblem->addQualityMetric(QualityMetric::minimizeActionCosts(costs, m.defaultCost));
    }

    Log::v("%s: %i actions from %i\n", _name.c_str(), (int) newProblem->actions().size(), (int) problem.actions().size());
    return CompilerResult{newProblem, replaceAction(std::move(actionMap)), _name};
}
