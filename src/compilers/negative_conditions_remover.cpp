
#include "compilers/negative_conditions_remover.h"
#include "compilers/compiler_utils.h"
#include "algo/identity_walker.h"
#include "algo/simplifier.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"

ProblemKind NegativeConditionsRemover::supportedKind() const {
    return ProblemKind::all().unset("TRAJECTORY_CONSTRAINTS");
}

ProblemKind NegativeConditionsRemover::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    out.unset("NEGATIVE_CONDITIONS");
    return out;
}

namespace {

// Rewrites negated fluents into their shadow fluents, creating these on first use
class NegativeFluentRemover : public IdentityWalker {

private:
    Environment& _env;
    FreshNames& _names;
    FlatHashMap<const Fluent*, const Fluent*> _shadows;
    // Shadowed fluents in order of first negation
    std::vector<const Fluent*> _shadowed;

public:
    NegativeFluentRemover(Environment& env, FreshNames& names) : IdentityWalker(env.exprs()), _env(env), _names(names) {}

    Expr remove(Expr e) {return walk(e);}

    const std::vector<const Fluent*>& shadowed() const {return _shadowed;}
    const Fluent* shadow(const Fluent* f) const {
        auto it = _shadows.find(f);
        return it != _shadows.end() ? it->second : nullptr;
    }

protected:
    bool preVisit(Expr e, Expr& result) override {
        if (!_store.isNot(e)) return false;
        Expr arg = _store.arg(e, 0);
        switch (_store.op(arg)) {
        case OperatorKind::FLUENT_EXP: {
            const Fluent* f = _store.fluent(arg);
            std::vector<Expr> args;
            for (const Expr& a : _store.args(arg)) args.push_back(walk(a));
            result = _store.mkFluentExp(getShadow(f), args);
            return true;
        }
        case OperatorKind::BOOL_CONSTANT:
            result = _store.mkBool(!_store.boolValue(arg));
            return true;
        // not (a <= b) iff b < a
        case OperatorKind::LE:
            result = _store.mkLT(walk(_store.arg(arg, 1)), walk(_store.arg(arg, 0)));
            return true;
        case OperatorKind::LT:
            result = _store.mkLE(walk(_store.arg(arg, 1)), walk(_store.arg(arg, 0)));
            return true;
        default:
            throw ProblemDefinitionError("Negation " + Names::to_string(_store, e) 
                + " is not applied to a fluent; conditions must be in negation normal form");
        }
    }

    Expr walkImplies(Expr e, const std::vector<Expr>& args) override {
        (void) args;
        throw ProblemDefinitionError("Implication " + Names::to_string(_store, e) 
            + " in a condition; conditions must be in negation normal form");
    }
    Expr walkIff(Expr e, const std::vector<Expr>& args) override {
        (void) args;
        throw ProblemDefinitionError("Equivalence " + Names::to_string(_store, e) 
            + " in a condition; conditions must be in negation normal form");
    }

    std::string walkerName() const override {return "NegativeFluentRemover";}

private:
    const Fluent* getShadow(const Fluent* f) {
        auto it = _shadows.find(f);
        if (it != _shadows.end()) return it->second;
        if (!f->type->isBool()) 
            throw ProblemDefinitionError("Negation of non-boolean fluent " + f->name);
        const Fluent* shadow = _env.fluent(_names.get("not_" + f->name), f->type, f->signature);
        Log::d("Shadow fluent %s for %s\n", shadow->name.c_str(), f->name.c_str());
        _shadows[f] = shadow;
        _shadowed.push_back(f);
        return shadow;
    }
};

Effect withCondition(ExpressionStore& store, const Effect& e, Expr condition) {
    return Effect(store, e.fluent(), e.value(), condition, e.kind(), e.forall());
}

}

CompilerResult NegativeConditionsRemover::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;

    Environment& env = problem.env();
    ExpressionStore& store = env.exprs();
    auto newProblem = problem.clone();
    newProblem->setName(_name + "_" + problem.name());

    FreshNames names(problem);
    NegativeFluentRemover remover(env, names);
    ActionMap actionMap;

    // Rewrite all conditions; this determines the shadowed fluents
    for (size_t i = 0; i < newProblem->actions().size(); i++) {
        Action& action = *newProblem->actions()[i];
        actionMap[&action] = problem.actions()[i];
        if (!action.isDurative()) {
            std::vector<Expr> pres;
            for (const Expr& c : action.preconditions()) pres.push_back(remover.remove(c));
            action.setPreconditions(pres);
            auto effs = action.effects();
            action.clearEffects();
            for (const Effect& e : effs) action.addEffect(store, withCondition(store, e, remover.remove(e.condition())));
        } else {
            auto conditions = action.conditions();
            action.clearConditions();
            for (const auto& [interval, conds] : conditions) {
                for (const Expr& c : conds) action.addCondition(store, interval, remover.remove(c));
            }
            auto timedEffects = action.timedEffects();
            action.clearEffects();
            for (const auto& [timing, effs] : timedEffects) {
                for (const Effect& e : effs) 
                    action.addEffect(store, timing, withCondition(store, e, remover.remove(e.condition())));
            }
        }
    }
    newProblem->clearGoals();
    for (const Expr& g : problem.goals()) newProblem->addGoal(remover.remove(g));
    newProblem->clearTimedGoals();
    for (const auto& [interval, goals] : problem.timedGoals()) {
        for (const Expr& g : goals) newProblem->addTimedGoal(interval, remover.remove(g));
    }
    newProblem->clearStateInvariants();
    for (const Expr& c : problem.stateInvariants()) newProblem->addStateInvariant(remover.remove(c));
    std::vector<std::pair<Timing, Effect>> timedEffects;
    for (const auto& [timing, effs] : problem.timedEffects()) {
        for (const Effect& e : effs) timedEffects.emplace_back(timing, withCondition(store, e, remover.remove(e.condition())));
    }
    newProblem->clearQualityMetrics();
    for (QualityMetric m : problem.qualityMetrics()) {
        for (auto& [goal, gain] : m.gains) goal = remover.remove(goal);
        newProblem->addQualityMetric(m);
    }

    // Declare the shadow fluents with complementary initial values. A
    // shadow's default complements whatever f falls back to, type default included.
    for (const Fluent* f : remover.shadowed()) {
        Expr def = problem.defaultValue(f);
        newProblem->addFluent(remover.shadow(f), def.valid() ? store.mkBool(!store.boolValue(def)) : Expr());
    }
    for (const auto& [fe, value] : problem.explicitInitialValues()) {
        const Fluent* shadow = remover.shadow(store.fluent(fe));
        if (shadow == nullptr) continue;
        newProblem->setInitialValue(store.mkFluentExp(shadow, store.args(fe)), store.mkBool(!store.boolValue(value)));
    }

    // Every effect on a shadowed fluent also writes its shadow
    Simplifier simplifier(store);
    auto shadowEffect = [&](const Effect& e) -> std::optional<Effect> {
        const Fluent* shadow = remover.shadow(store.fluent(e.fluent()));
        if (shadow == nullptr) return std::nullopt;
        if (e.isConditional()) 
            throw ProblemDefinitionError("Conditional effect " + Names::to_string(store, e) 
                + " writes a negated fluent; remove conditional effects (CONDITIONAL_EFFECTS_REMOVING) first");
        return Effect(store, store.mkFluentExp(shadow, store.args(e.fluent())), 
            simplifier.simplify(store.mkNot(e.value())), e.condition(), e.kind(), e.forall());
    };
    for (const auto& action : newProblem->actions()) {
        if (!action->isDurative()) {
            auto effs = action->effects();
            for (const Effect& e : effs) {
                auto se = shadowEffect(e);
                if (se.has_value()) action->addEffect(store, *se);
            }
        } else {
            auto timed = action->timedEffects();
            for (const auto& [timing, effs] : timed) {
                for (const Effect& e : effs) {
                    auto se = shadowEffect(e);
                    if (se.has_value()) action->addEffect(store, timing, *se);
                }
            }
        }
    }
    newProblem->clearTimedEffects();
    for (const auto& [timing, e] : timedEffects) {
        newProblem->addTimedEffect(timing, e);
        auto se = shadowEffect(e);
        if (se.has_value()) newProblem->addTimedEffect(timing, *se);
    }

    Log::v("%s: %i shadow fluents\n", _name.c_str(), (int) remover.shadowed().size());
    return CompilerResult{newProblem, replaceAction(std::move(actionMap)), _name};
}
