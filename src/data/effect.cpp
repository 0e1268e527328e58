
#include <algorithm>

#include "data/effect.h"
#include "algo/extractors.h"
#include "util/errors.h"
#include "util/names.h"

Effect::Effect(ExpressionStore& store, Expr fluent, Expr value, Expr condition, 
        EffectKind kind, const std::vector<const Variable*>& forall) : 
        _fluent(fluent), _value(value), _condition(condition), _kind(kind), _forall(forall) {

    if (!store.isFluentExp(fluent)) 
        throw ProblemDefinitionError("Effect target " + Names::to_string(store, fluent) + " is not a fluent expression");

    FluentsExtractor fluents(store);
    for (const Expr& arg : store.args(fluent)) {
        if (!fluents.get(arg).empty()) 
            throw ProblemDefinitionError("Arguments of effect target " + Names::to_string(store, fluent) 
                + " contain fluent expressions");
    }

    if (!store.type(condition)->isBool()) 
        throw TypeError("Effect condition " + Names::to_string(store, condition) + " is not boolean");
    const Type* ft = store.type(fluent);
    if (kind != EffectKind::ASSIGN && !ft->isNumeric()) 
        throw TypeError("Increase/decrease effect on non-numeric fluent " + Names::to_string(store, fluent));
    if (!ft->accepts(store.type(value))) 
        throw TypeError("Effect " + Names::to_string(store, fluent) + " := " + Names::to_string(store, value) 
            + " assigns a value of type " + store.type(value)->toString() + " to a fluent of type " + ft->toString());

    FreeVarsExtractor freeVars(store);
    std::vector<const Variable*> free;
    for (Expr e : {fluent, value, condition}) {
        for (const Variable* v : freeVars.get(e)) 
            if (std::find(free.begin(), free.end(), v) == free.end()) free.push_back(v);
    }
    for (const Variable* v : free) {
        if (std::find(forall.begin(), forall.end(), v) == forall.end()) 
            throw UnboundVariablesError("Variable " + v->name + " of effect on " 
                + Names::to_string(store, fluent) + " is not bound by its forall");
    }
    for (const Variable* v : forall) {
        if (std::find(free.begin(), free.end(), v) == free.end()) 
            throw UnboundVariablesError("Forall variable " + v->name + " of effect on " 
                + Names::to_string(store, fluent) + " does not occur in the effect");
    }

    _conditional = !store.isTrue(condition);
}

bool conflicting(const Effect& a, const Effect& b) {
    if (a.fluent() != b.fluent()) return false;
    if (a.isForall() || b.isForall()) return false;
    // Both guarded by different conditions: may never apply together
    if (a.isConditional() && b.isConditional() && a.condition() != b.condition()) return false;
    if (a.isAssignment() && b.isAssignment()) return a.value() != b.value();
    // Increase and decrease accumulate; mixed with an assignment they clash
    return a.isAssignment() || b.isAssignment();
}

void addSimultaneousEffect(const ExpressionStore& store, std::vector<Effect>& effects, const Effect& effect) {
    for (const Effect& other : effects) {
        if (other == effect) return;
        if (conflicting(other, effect)) 
            throw ConflictingEffectsError("Effects on " + Names::to_string(store, effect.fluent()) 
                + " assign " + Names::to_string(store, other.value()) + " and " 
                + Names::to_string(store, effect.value()) + " at the same time");
    }
    effects.push_back(effect);
}
