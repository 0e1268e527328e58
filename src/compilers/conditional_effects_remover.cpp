
#include "compilers/conditional_effects_remover.h"
#include "compilers/compiler_utils.h"
#include "algo/simplifier.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"

ProblemKind ConditionalEffectsRemover::supportedKind() const {
    return ProblemKind::all();
}

ProblemKind ConditionalEffectsRemover::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    if (!kind.has("CONDITIONAL_EFFECTS")) return out;
    out.unset("CONDITIONAL_EFFECTS");
    out.set("NEGATIVE_CONDITIONS");
    out.set("DISJUNCTIVE_CONDITIONS");
    return out;
}

namespace {

void checkRemovable(const ExpressionStore& store, const Effect& e) {
    if (e.isForall()) 
        throw ProblemDefinitionError("Conditional forall effect " + Names::to_string(store, e) 
            + " cannot be split; remove quantifiers (QUANTIFIERS_REMOVING) first");
}

// The variant of the action for one truth assignment to its effect guards, or null
std::shared_ptr<Action> makeVariant(ExpressionStore& store, const Action& action, size_t assignment, 
        const std::vector<std::pair<Timing, Effect>>& conditional, Simplifier& simplifier) {

    auto variant = action.clone();
    variant->clearEffects();
    size_t numEffects = 0;
    // Unconditional effects first
    if (!action.isDurative()) {
        for (const Effect& e : action.effects()) if (!e.isConditional()) {
            variant->addEffect(store, e);
            numEffects++;
        }
    } else {
        for (const auto& [timing, effs] : action.timedEffects()) for (const Effect& e : effs) if (!e.isConditional()) {
            variant->addEffect(store, timing, e);
            numEffects++;
        }
    }

    try {
        for (size_t i = 0; i < conditional.size(); i++) {
            const auto& [timing, e] = conditional[i];
            bool positive = (assignment >> i) & 1;
            Expr guard = positive ? e.condition() : store.mkNot(e.condition());
            if (!action.isDurative()) variant->addPrecondition(store, guard);
            else variant->addCondition(store, TimeInterval(timing), guard);
            if (!positive) continue;

            Effect unconditional(store, e.fluent(), e.value(), store.mkTrue(), e.kind());
            if (!action.isDurative()) variant->addEffect(store, unconditional);
            else variant->addEffect(store, timing, unconditional);
            numEffects++;
        }
    } catch (const ConflictingEffectsError& ex) {
        Log::d("Dropping variant %i of %s: %s\n", (int) assignment, action.name().c_str(), ex.what());
        return nullptr;
    }

    if (numEffects == 0) return nullptr;
    if (!simplifyConditions(*variant, simplifier)) return nullptr;
    return variant;
}

}

CompilerResult ConditionalEffectsRemover::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;

    ExpressionStore& store = problem.exprs();
    auto newProblem = problem.clone();
    newProblem->setName(_name + "_" + problem.name());
    newProblem->clearActions();
    newProblem->clearQualityMetrics();

    // f := v if c becomes f := (c and v) or (not c and f)
    Simplifier simplifier(store);
    newProblem->clearTimedEffects();
    for (const auto& [timing, effs] : problem.timedEffects()) {
        for (const Effect& e : effs) {
            if (!e.isConditional()) {
                newProblem->addTimedEffect(timing, e);
                continue;
            }
            checkRemovable(store, e);
            if (!store.type(e.fluent())->isBool() || !e.isAssignment()) 
                throw ProblemDefinitionError("The condition of timed effect " + Names::to_string(store, e) 
                    + " cannot be removed without changing the problem");
            Expr c = e.condition();
            Expr value = simplifier.simplify(store.mkOr(store.mkAnd(c, e.value()), store.mkAnd(store.mkNot(c), e.fluent())));
            newProblem->addTimedEffect(timing, Effect(store, e.fluent(), value, store.mkTrue()));
        }
    }

    FreshNames names(problem, true);
    ActionMap actionMap;
    std::vector<ActionOrigin> origins;
    for (const auto& a : problem.actions()) {
        if (!a->hasConditionalEffects()) {
            auto na = a->clone();
            actionMap[na.get()] = a;
            origins.push_back(ActionOrigin{na->name(), a->name(), Substitution()});
            newProblem->addAction(na);
            continue;
        }

        std::vector<std::pair<Timing, Effect>> conditional;
        if (!a->isDurative()) {
            for (const Effect& e : a->effects()) if (e.isConditional()) conditional.emplace_back(Timing(), e);
        } else {
            for (const auto& [timing, effs] : a->timedEffects()) 
                for (const Effect& e : effs) if (e.isConditional()) conditional.emplace_back(timing, e);
        }
        for (const auto& [timing, e] : conditional) checkRemovable(store, e);
        if (conditional.size() >= 8 * sizeof(size_t)) 
            throw ProblemDefinitionError("Action " + a->name() + " has too many conditional effects to be split");
        if (conditional.size() > 12) 
            Log::w("%s: %s has %i conditional effects\n", _name.c_str(), a->name().c_str(), (int) conditional.size());

        size_t numVariants = 0;
        for (size_t assignment = 0; assignment < ((size_t) 1 << conditional.size()); assignment++) {
            auto variant = makeVariant(store, *a, assignment, conditional, simplifier);
            if (!variant) continue;
            // The first variant keeps the action's name
            variant->setName(numVariants == 0 ? a->name() : names.get(a->name()));
            actionMap[variant.get()] = a;
            origins.push_back(ActionOrigin{variant->name(), a->name(), Substitution()});
            newProblem->addAction(variant);
            numVariants++;
        }
        Log::d("%s: %s split into %i variants\n", _name.c_str(), a->name().c_str(), (int) numVariants);
    }

    copyQualityMetrics(problem, *newProblem, origins);
    return CompilerResult{newProblem, replaceAction(std::move(actionMap)), _name};
}
