
#include "compilers/compiler_utils.h"
#include "algo/substituter.h"
#include "util/regex.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"

FreshNames::FreshNames(const Problem& problem, bool includeActions) {
    for (const Fluent* f : problem.fluents()) take(f->name);
    for (const Object* o : problem.objects()) take(o->name);
    for (const Type* t : problem.userTypes()) take(t->name());
    if (includeActions) for (const auto& a : problem.actions()) take(a->name());
}

std::string FreshNames::get(const std::string& base) {
    std::string name = base;
    int n = 0;
    while (isTaken(name)) {
        name = base + "__" + std::to_string(n++) + "__";
    }
    take(name);
    return name;
}

void checkNoReservedNames(const Problem& problem) {
    std::vector<std::string> names;
    for (const Fluent* f : problem.fluents()) names.push_back(f->name);
    for (const Object* o : problem.objects()) names.push_back(o->name);
    for (const Type* t : problem.userTypes()) names.push_back(t->name());
    for (const auto& a : problem.actions()) names.push_back(a->name());
    for (const auto& name : names) {
        if (Regex::hasFreshNameSuffix(name)) 
            throw ProblemDefinitionError("Name \"" + name + "\" of problem " + problem.name() 
                + " ends with the suffix __<N>__, which is reserved for generated names");
    }
}

static bool simplifyConjunction(ExpressionStore& store, const std::vector<Expr>& conds, 
        Simplifier& simplifier, std::vector<Expr>& out) {
    Expr s = simplifier.simplify(store.mkAnd(conds));
    out.clear();
    if (store.isFalse(s)) return false;
    if (store.isTrue(s)) return true;
    if (store.isAnd(s)) out = store.args(s);
    else out.push_back(s);
    return true;
}

bool simplifyConditions(Action& action, Simplifier& simplifier) {
    ExpressionStore& store = simplifier.store();
    if (!action.isDurative()) {
        std::vector<Expr> pres;
        if (!simplifyConjunction(store, action.preconditions(), simplifier, pres)) return false;
        action.setPreconditions(pres);
        return true;
    }
    auto conditions = action.conditions();
    action.clearConditions();
    for (const auto& [interval, conds] : conditions) {
        std::vector<Expr> simplified;
        if (!simplifyConjunction(store, conds, simplifier, simplified)) return false;
        for (const Expr& c : simplified) action.addCondition(store, interval, c);
    }
    return true;
}

static bool instantiateEffect(ExpressionStore& store, const Effect& e, const Substitution& subs, 
        Simplifier& simplifier, std::vector<Effect>& out) {
    Expr condition = simplifier.simplify(Substituter::substitute(store, e.condition(), subs));
    if (store.isFalse(condition)) return true;
    Effect ne(store, Substituter::substitute(store, e.fluent(), subs), Substituter::substitute(store, e.value(), subs), 
        condition, e.kind(), e.forall());
    try {
        addSimultaneousEffect(store, out, ne);
    } catch (const ConflictingEffectsError& ex) {
        Log::d("Dropping instance: %s\n", ex.what());
        return false;
    }
    return true;
}

std::shared_ptr<Action> instantiateAction(ExpressionStore& store, const Action& action, 
        const std::string& name, const Substitution& subs, Simplifier& simplifier) {

    std::shared_ptr<Action> out;
    if (action.isDurative()) {
        DurativeBody body;
        const DurationInterval& d = action.duration();
        body.duration = DurationInterval(
            simplifier.simplify(Substituter::substitute(store, d.lower, subs)), 
            simplifier.simplify(Substituter::substitute(store, d.upper, subs)), 
            d.leftOpen, d.rightOpen);
        for (const auto& [interval, conds] : action.conditions()) {
            std::vector<Expr> newConds;
            for (const Expr& c : conds) newConds.push_back(Substituter::substitute(store, c, subs));
            body.conditions.emplace_back(interval, newConds);
        }
        for (const auto& [timing, effs] : action.timedEffects()) {
            std::vector<Effect> newEffs;
            for (const Effect& e : effs) {
                if (!instantiateEffect(store, e, subs, simplifier, newEffs)) return nullptr;
            }
            if (!newEffs.empty()) body.effects.emplace_back(timing, newEffs);
        }
        out = std::make_shared<Action>(name, std::vector<const Parameter*>(), std::move(body));
    } else {
        InstantaneousBody body;
        for (const Expr& c : action.preconditions()) body.preconditions.push_back(Substituter::substitute(store, c, subs));
        for (const Effect& e : action.effects()) {
            if (!instantiateEffect(store, e, subs, simplifier, body.effects)) return nullptr;
        }
        if (action.isSensing()) {
            SensingBody sensing;
            sensing.body = std::move(body);
            for (const Expr& f : action.observedFluents()) 
                sensing.observedFluents.push_back(Substituter::substitute(store, f, subs));
            out = std::make_shared<Action>(name, std::vector<const Parameter*>(), std::move(sensing));
        } else {
            out = std::make_shared<Action>(name, std::vector<const Parameter*>(), std::move(body));
        }
    }
    if (!simplifyConditions(*out, simplifier)) return nullptr;
    return out;
}

void copyQualityMetrics(const Problem& from, Problem& to, const std::vector<ActionOrigin>& origins) {
    ExpressionStore& store = from.exprs();
    Simplifier simplifier(store);
    for (const QualityMetric& m : from.qualityMetrics()) {
        if (!m.isActionCosts()) {
            to.addQualityMetric(m);
            continue;
        }
        std::map<std::string, Expr> costs;
        for (const ActionOrigin& o : origins) {
            Expr cost = m.cost(o.originalName);
            if (!cost.valid()) continue;
            costs[o.name] = simplifier.simplify(Substituter::substitute(store, cost, o.binding));
        }
        to.addQualityMetric(QualityMetric::minimizeActionCosts(costs, m.defaultCost));
    }
}
