
#include <algorithm>

#include "data/action.h"
#include "util/errors.h"
#include "util/names.h"

Action::Action(const std::string& name, const std::vector<const Parameter*>& params, InstantaneousBody body) : 
    _name(name), _params(params), _body(std::move(body)) {}
Action::Action(const std::string& name, const std::vector<const Parameter*>& params, DurativeBody body) : 
    _name(name), _params(params), _body(std::move(body)) {}
Action::Action(const std::string& name, const std::vector<const Parameter*>& params, SensingBody body) : 
    _name(name), _params(params), _body(std::move(body)) {}

InstantaneousBody& Action::instantaneous() {
    if (auto* b = std::get_if<InstantaneousBody>(&_body)) return *b;
    if (auto* s = std::get_if<SensingBody>(&_body)) return s->body;
    throw UsageError("Action " + _name + " is durative");
}
const InstantaneousBody& Action::instantaneous() const {
    if (auto* b = std::get_if<InstantaneousBody>(&_body)) return *b;
    if (auto* s = std::get_if<SensingBody>(&_body)) return s->body;
    throw UsageError("Action " + _name + " is durative");
}
DurativeBody& Action::durative() {
    if (auto* b = std::get_if<DurativeBody>(&_body)) return *b;
    throw UsageError("Action " + _name + " is not durative");
}
const DurativeBody& Action::durative() const {
    if (auto* b = std::get_if<DurativeBody>(&_body)) return *b;
    throw UsageError("Action " + _name + " is not durative");
}

const std::vector<Expr>& Action::preconditions() const {
    return instantaneous().preconditions;
}

void Action::addPrecondition(const ExpressionStore& store, Expr precondition) {
    if (!store.type(precondition)->isBool()) 
        throw TypeError("Precondition " + Names::to_string(store, precondition) + " of " + _name + " is not boolean");
    if (store.isTrue(precondition)) return;
    auto& pres = instantaneous().preconditions;
    if (std::find(pres.begin(), pres.end(), precondition) == pres.end()) pres.push_back(precondition);
}

void Action::setPreconditions(const std::vector<Expr>& preconditions) {
    instantaneous().preconditions = preconditions;
}

const std::vector<Effect>& Action::effects() const {
    return instantaneous().effects;
}

void Action::addEffect(const ExpressionStore& store, const Effect& effect) {
    addSimultaneousEffect(store, instantaneous().effects, effect);
}

void Action::clearEffects() {
    if (isDurative()) durative().effects.clear();
    else instantaneous().effects.clear();
}

const DurationInterval& Action::duration() const {
    return durative().duration;
}

void Action::setDuration(const DurationInterval& duration) {
    durative().duration = duration;
}

const std::vector<std::pair<TimeInterval, std::vector<Expr>>>& Action::conditions() const {
    return durative().conditions;
}

void Action::addCondition(const ExpressionStore& store, const TimeInterval& interval, Expr condition) {
    if (!store.type(condition)->isBool()) 
        throw TypeError("Condition " + Names::to_string(store, condition) + " of " + _name + " is not boolean");
    if (interval.lower.isGlobal() || interval.upper.isGlobal()) 
        throw ProblemDefinitionError("Condition of " + _name + " refers to a global timepoint");
    if (store.isTrue(condition)) return;
    auto& conds = durative().conditions;
    for (auto& [i, list] : conds) {
        if (i == interval) {
            if (std::find(list.begin(), list.end(), condition) == list.end()) list.push_back(condition);
            return;
        }
    }
    conds.emplace_back(interval, std::vector<Expr>{condition});
}

void Action::clearConditions() {
    durative().conditions.clear();
}

const std::vector<std::pair<Timing, std::vector<Effect>>>& Action::timedEffects() const {
    return durative().effects;
}

void Action::addEffect(const ExpressionStore& store, const Timing& timing, const Effect& effect) {
    if (timing.isGlobal()) 
        throw ProblemDefinitionError("Effect of " + _name + " at a global timepoint");
    auto& effs = durative().effects;
    for (auto& [t, list] : effs) {
        if (t == timing) {
            addSimultaneousEffect(store, list, effect);
            return;
        }
    }
    effs.emplace_back(timing, std::vector<Effect>{effect});
}

const std::vector<Expr>& Action::observedFluents() const {
    if (auto* s = std::get_if<SensingBody>(&_body)) return s->observedFluents;
    throw UsageError("Action " + _name + " is not a sensing action");
}

void Action::addObservedFluent(const ExpressionStore& store, Expr fluent) {
    auto* s = std::get_if<SensingBody>(&_body);
    if (s == nullptr) throw UsageError("Action " + _name + " is not a sensing action");
    if (!store.isFluentExp(fluent)) 
        throw ProblemDefinitionError("Observation " + Names::to_string(store, fluent) + " is not a fluent expression");
    if (std::find(s->observedFluents.begin(), s->observedFluents.end(), fluent) == s->observedFluents.end()) 
        s->observedFluents.push_back(fluent);
}

std::vector<Effect> Action::allEffects() const {
    if (!isDurative()) return instantaneous().effects;
    std::vector<Effect> out;
    for (const auto& [t, list] : durative().effects) out.insert(out.end(), list.begin(), list.end());
    return out;
}

bool Action::hasConditionalEffects() const {
    for (const Effect& e : allEffects()) if (e.isConditional()) return true;
    return false;
}
