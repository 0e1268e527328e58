
#include <algorithm>

#include "data/problem.h"
#include "algo/arg_iterator.h"
#include "algo/extractors.h"
#include "util/errors.h"
#include "util/names.h"

Problem::Problem(Environment& env, const std::string& name) : _env(env), _name(name) {}

std::shared_ptr<Problem> Problem::clone() const {
    auto p = std::make_shared<Problem>(*this);
    for (auto& action : p->_actions) action = action->clone();
    return p;
}

bool Problem::hasName(const std::string& name) const {
    for (const Fluent* f : _fluents) if (f->name == name) return true;
    for (const Object* o : _objects) if (o->name == name) return true;
    for (const auto& a : _actions) if (a->name() == name) return true;
    for (const Type* t : _user_types) if (t->name() == name) return true;
    return false;
}

void Problem::checkName(const std::string& name) const {
    if (hasName(name)) throw ProblemDefinitionError("Name \"" + name + "\" is already defined in problem " + _name);
}

void Problem::addUserType(const Type* type) {
    collectUserTypes(type);
}

void Problem::collectUserTypes(const Type* type) {
    if (!type->isUser()) return;
    if (std::find(_user_types.begin(), _user_types.end(), type) != _user_types.end()) return;
    if (type->father() != nullptr) collectUserTypes(type->father());
    checkName(type->name());
    _user_types.push_back(type);
}

void Problem::setTypeDefault(const Type* type, Expr value) {
    if (!exprs().isConstant(value)) 
        throw ProblemDefinitionError("Default of type " + type->toString() + " is not a constant");
    if (!type->accepts(exprs().type(value))) 
        throw TypeError("Default " + Names::to_string(exprs(), value) + " does not fit type " + type->toString());
    _type_defaults[type] = value;
}

void Problem::addFluent(const Fluent* fluent, Expr defaultValue) {
    checkName(fluent->name);
    collectUserTypes(fluent->type);
    for (const Parameter* p : fluent->signature) collectUserTypes(p->type);
    _fluents.push_back(fluent);
    if (defaultValue.valid()) {
        if (!exprs().isConstant(defaultValue)) 
            throw ProblemDefinitionError("Default of fluent " + fluent->name + " is not a constant");
        if (!fluent->type->accepts(exprs().type(defaultValue))) 
            throw TypeError("Default " + Names::to_string(exprs(), defaultValue) 
                + " does not fit fluent " + fluent->name);
        _fluent_defaults[fluent] = defaultValue;
    }
}

const Fluent* Problem::fluent(const std::string& name) const {
    for (const Fluent* f : _fluents) if (f->name == name) return f;
    throw UsageError("No fluent named " + name + " in problem " + _name);
}

bool Problem::hasFluent(const std::string& name) const {
    for (const Fluent* f : _fluents) if (f->name == name) return true;
    return false;
}

Expr Problem::fluentDefault(const Fluent* fluent) const {
    auto it = _fluent_defaults.find(fluent);
    return it != _fluent_defaults.end() ? it->second : Expr();
}

Expr Problem::defaultValue(const Fluent* fluent) const {
    Expr def = fluentDefault(fluent);
    if (def.valid()) return def;
    auto it = _type_defaults.find(fluent->type);
    return it != _type_defaults.end() ? it->second : Expr();
}

void Problem::clearFluents() {
    _fluents.clear();
    _fluent_defaults.clear();
}

void Problem::addObject(const Object* object) {
    checkName(object->name);
    collectUserTypes(object->type);
    _objects.push_back(object);
}

void Problem::addObjects(const std::vector<const Object*>& objects) {
    for (const Object* o : objects) addObject(o);
}

const Object* Problem::object(const std::string& name) const {
    for (const Object* o : _objects) if (o->name == name) return o;
    throw UsageError("No object named " + name + " in problem " + _name);
}

bool Problem::hasObject(const std::string& name) const {
    for (const Object* o : _objects) if (o->name == name) return true;
    return false;
}

std::vector<const Object*> Problem::objectsOfType(const Type* type) const {
    std::vector<const Object*> out;
    for (const Object* o : _objects) if (o->type->isSubtypeOf(type)) out.push_back(o);
    return out;
}

std::vector<Expr> Problem::domain(const Type* type) const {
    ExpressionStore& store = exprs();
    std::vector<Expr> out;
    if (type->isBool()) {
        out.push_back(store.mkTrue());
        out.push_back(store.mkFalse());
    } else if (type->isInt() && type->hasLowerBound() && type->hasUpperBound()) {
        for (int64_t i = (int64_t) type->lowerBound(); i <= (int64_t) type->upperBound(); i++) 
            out.push_back(store.mkInt(i));
    } else if (type->isUser()) {
        for (const Object* o : objectsOfType(type)) out.push_back(store.mkObject(o));
    } else {
        throw ProblemDefinitionError("Type " + type->toString() + " has no finite domain");
    }
    return out;
}

void Problem::addAction(std::shared_ptr<Action> action) {
    checkName(action->name());
    for (const Parameter* p : action->parameters()) collectUserTypes(p->type);
    _actions.push_back(std::move(action));
}

std::shared_ptr<Action> Problem::action(const std::string& name) const {
    for (const auto& a : _actions) if (a->name() == name) return a;
    throw UsageError("No action named " + name + " in problem " + _name);
}

bool Problem::hasAction(const std::string& name) const {
    for (const auto& a : _actions) if (a->name() == name) return true;
    return false;
}

void Problem::clearActions() {
    _actions.clear();
}

void Problem::setInitialValue(Expr fluentExp, Expr value) {
    ExpressionStore& store = exprs();
    if (!store.isFluentExp(fluentExp)) 
        throw ProblemDefinitionError("Initial value given for " + Names::to_string(store, fluentExp) 
            + ", which is not a fluent expression");
    for (const Expr& arg : store.args(fluentExp)) {
        if (!store.isConstant(arg)) 
            throw ProblemDefinitionError("Initial value given for non-ground " + Names::to_string(store, fluentExp));
    }
    if (!store.isConstant(value)) 
        throw ProblemDefinitionError("Initial value " + Names::to_string(store, value) + " of " 
            + Names::to_string(store, fluentExp) + " is not a constant");
    if (!store.type(fluentExp)->accepts(store.type(value))) 
        throw TypeError("Initial value " + Names::to_string(store, value) + " does not fit " 
            + Names::to_string(store, fluentExp));

    auto it = _initial_value_index.find(fluentExp);
    if (it != _initial_value_index.end()) {
        _initial_values[it->second].second = value;
    } else {
        _initial_value_index[fluentExp] = _initial_values.size();
        _initial_values.emplace_back(fluentExp, value);
    }
}

Expr Problem::initialValue(Expr fluentExp) const {
    auto it = _initial_value_index.find(fluentExp);
    if (it != _initial_value_index.end()) return _initial_values[it->second].second;
    return defaultValue(exprs().fluent(fluentExp));
}

std::vector<std::pair<Expr, Expr>> Problem::initialValues() const {
    ExpressionStore& store = exprs();
    std::vector<std::pair<Expr, Expr>> out;
    auto add = [&](Expr fe) {
        Expr value = initialValue(fe);
        if (!value.valid()) 
            throw ProblemDefinitionError("Initial value of " + Names::to_string(store, fe) + " is not set");
        out.emplace_back(fe, value);
    };
    for (const Fluent* f : _fluents) {
        if (f->arity() == 0) {
            add(store.mkFluentExp(f));
            continue;
        }
        std::vector<const Type*> types;
        for (const Parameter* p : f->signature) types.push_back(p->type);
        for (const auto& args : ArgIterator(ArgIterator::getDomains(types, *this))) {
            add(store.mkFluentExp(f, args));
        }
    }
    return out;
}

void Problem::clearInitialValues() {
    _initial_values.clear();
    _initial_value_index.clear();
}

void Problem::addGoal(Expr goal) {
    if (!exprs().type(goal)->isBool()) 
        throw TypeError("Goal " + Names::to_string(exprs(), goal) + " is not boolean");
    if (exprs().isTrue(goal)) return;
    if (std::find(_goals.begin(), _goals.end(), goal) == _goals.end()) _goals.push_back(goal);
}

void Problem::addTimedGoal(const TimeInterval& interval, Expr goal) {
    if (!interval.lower.isGlobal() || !interval.upper.isGlobal()) 
        throw ProblemDefinitionError("Timed goal " + Names::to_string(exprs(), goal) 
            + " must refer to global timepoints");
    if (!exprs().type(goal)->isBool()) 
        throw TypeError("Timed goal " + Names::to_string(exprs(), goal) + " is not boolean");
    for (auto& [i, list] : _timed_goals) {
        if (i == interval) {
            if (std::find(list.begin(), list.end(), goal) == list.end()) list.push_back(goal);
            return;
        }
    }
    _timed_goals.emplace_back(interval, std::vector<Expr>{goal});
}

void Problem::addTimedEffect(const Timing& timing, const Effect& effect) {
    if (!timing.isGlobal()) 
        throw ProblemDefinitionError("Timed effect on " + Names::to_string(exprs(), effect.fluent()) 
            + " must happen at a global timepoint");
    for (auto& [t, list] : _timed_effects) {
        if (t == timing) {
            addSimultaneousEffect(exprs(), list, effect);
            return;
        }
    }
    _timed_effects.emplace_back(timing, std::vector<Effect>{effect});
}

void Problem::addTrajectoryConstraint(Expr constraint) {
    ExpressionStore& store = exprs();
    std::vector<Expr> parts = store.isAnd(constraint) ? store.args(constraint) : std::vector<Expr>{constraint};
    for (const Expr& c : parts) {
        if (!isTrajectoryOperator(store.op(c))) 
            throw ProblemDefinitionError("Trajectory constraint " + Names::to_string(store, c) 
                + " is not an always, sometime, at-most-once, sometime-before or sometime-after constraint");
    }
    _trajectory_constraints.push_back(constraint);
}

void Problem::addStateInvariant(Expr invariant) {
    if (!exprs().type(invariant)->isBool()) 
        throw TypeError("State invariant " + Names::to_string(exprs(), invariant) + " is not boolean");
    _state_invariants.push_back(invariant);
}

FlatHashSet<const Fluent*> Problem::staticFluents() const {
    FlatHashSet<const Fluent*> written;
    for (const auto& a : _actions) {
        for (const Effect& e : a->allEffects()) written.insert(exprs().fluent(e.fluent()));
    }
    for (const auto& [t, list] : _timed_effects) {
        for (const Effect& e : list) written.insert(exprs().fluent(e.fluent()));
    }
    FlatHashSet<const Fluent*> out;
    for (const Fluent* f : _fluents) if (!written.count(f)) out.insert(f);
    return out;
}

namespace {

// Accumulates the features of one problem
class KindCollector {

private:
    ExpressionStore& _store;
    ProblemKind& _kind;
    const FlatHashSet<const Fluent*>& _static_fluents;
    OperatorsExtractor _ops;
    FluentsExtractor _fluents;
    bool _simple_numeric = true;

public:
    KindCollector(ExpressionStore& store, ProblemKind& kind, const FlatHashSet<const Fluent*>& staticFluents) : 
        _store(store), _kind(kind), _static_fluents(staticFluents), _ops(store), _fluents(store) {}

    bool simpleNumeric() const {return _simple_numeric;}

    void type(const Type* t) {
        if (t->isUser()) {
            _kind.set("FLAT_TYPING");
            if (t->father() != nullptr) _kind.set("HIERARCHICAL_TYPING");
        } else if (t->isInt()) {
            _kind.set("DISCRETE_NUMBERS");
        } else if (t->isReal()) {
            _kind.set("CONTINUOUS_NUMBERS");
        }
    }

    void fluent(const Fluent* f) {
        type(f->type);
        if (f->type->isNumeric()) {
            _kind.set("NUMERIC_FLUENTS");
            if (f->type->isBounded()) _kind.set("BOUNDED_TYPES");
        } else if (f->type->isUser()) {
            _kind.set("OBJECT_FLUENTS");
        }
        for (const Parameter* p : f->signature) type(p->type);
    }

    void parameter(const Parameter* p) {
        type(p->type);
        const Type* t = p->type;
        if (t->isBool()) _kind.set("BOOL_ACTION_PARAMETERS");
        else if (t->isInt() && t->hasLowerBound() && t->hasUpperBound()) _kind.set("BOUNDED_INT_ACTION_PARAMETERS");
        else if (t->isInt()) _kind.set("UNBOUNDED_INT_ACTION_PARAMETERS");
        else if (t->isReal()) _kind.set("REAL_ACTION_PARAMETERS");
    }

    void condition(Expr e) {
        OperatorSet ops = _ops.get(e);
        if (OperatorsExtractor::has(ops, OperatorKind::EQUALS)) _kind.set("EQUALITIES");
        if (OperatorsExtractor::has(ops, OperatorKind::NOT)) _kind.set("NEGATIVE_CONDITIONS");
        if (OperatorsExtractor::has(ops, OperatorKind::OR)) _kind.set("DISJUNCTIVE_CONDITIONS");
        if (OperatorsExtractor::has(ops, OperatorKind::IMPLIES) || OperatorsExtractor::has(ops, OperatorKind::IFF)) {
            _kind.set("NEGATIVE_CONDITIONS");
            _kind.set("DISJUNCTIVE_CONDITIONS");
        }
        if (OperatorsExtractor::has(ops, OperatorKind::EXISTS)) _kind.set("EXISTENTIAL_CONDITIONS");
        if (OperatorsExtractor::has(ops, OperatorKind::FORALL)) _kind.set("UNIVERSAL_CONDITIONS");
        if (OperatorsExtractor::has(ops, OperatorKind::TIMES) || OperatorsExtractor::has(ops, OperatorKind::DIV)) 
            _simple_numeric = false;
    }

    void effect(const Effect& e) {
        if (e.isConditional()) {
            condition(e.condition());
            _kind.set("CONDITIONAL_EFFECTS");
        }
        if (e.isForall()) _kind.set("FORALL_EFFECTS");
        if (e.isIncrease()) _kind.set("INCREASE_EFFECTS");
        if (e.isDecrease()) _kind.set("DECREASE_EFFECTS");

        Expr value = e.value();
        if (!_store.type(value)->isNumeric()) return;
        if (!_store.isNumericConstant(value)) _simple_numeric = false;
        for (const Expr& fe : _fluents.get(value)) {
            if (_static_fluents.count(_store.fluent(fe))) _kind.set("STATIC_FLUENTS_IN_NUMERIC_ASSIGNMENTS");
            else _kind.set("FLUENTS_IN_NUMERIC_ASSIGNMENTS");
        }
    }

    // Intermediate timings lie strictly inside the action, external ones outside
    void timing(const Timing& t) {
        if (t.delay == 0) return;
        if ((t.isFromStart() && t.delay > 0) || (t.isFromEnd() && t.delay < 0)) 
            _kind.set("INTERMEDIATE_CONDITIONS_AND_EFFECTS");
        else _kind.set("EXTERNAL_CONDITIONS_AND_EFFECTS");
    }

    void action(const Action& a) {
        for (const Parameter* p : a.parameters()) parameter(p);
        if (a.isSensing()) _kind.set("SENSING_ACTIONS");
        if (!a.isDurative()) {
            for (const Expr& c : a.preconditions()) condition(c);
            for (const Effect& e : a.effects()) effect(e);
            return;
        }
        _kind.set("CONTINUOUS_TIME");
        const DurationInterval& d = a.duration();
        if (d.lower != d.upper || d.leftOpen || d.rightOpen) _kind.set("DURATION_INEQUALITIES");
        bool hasFluents = false, onlyStatic = true;
        for (const Expr& bound : {d.lower, d.upper}) {
            if (!bound.valid()) continue;
            for (const Expr& fe : _fluents.get(bound)) {
                hasFluents = true;
                if (!_static_fluents.count(_store.fluent(fe))) onlyStatic = false;
            }
        }
        if (hasFluents) _kind.set(onlyStatic ? "STATIC_FLUENTS_IN_DURATIONS" : "FLUENTS_IN_DURATIONS");
        for (const auto& [interval, conds] : a.conditions()) {
            timing(interval.lower);
            timing(interval.upper);
            for (const Expr& c : conds) condition(c);
        }
        for (const auto& [t, effs] : a.timedEffects()) {
            timing(t);
            for (const Effect& e : effs) effect(e);
        }
    }
};

}

ProblemKind Problem::kind() const {
    ProblemKind kind;
    kind.set("ACTION_BASED");
    auto staticFluents = this->staticFluents();
    KindCollector collector(exprs(), kind, staticFluents);

    for (const Fluent* f : _fluents) collector.fluent(f);
    for (const Object* o : _objects) collector.type(o->type);
    for (const auto& a : _actions) collector.action(*a);
    if (!_timed_effects.empty()) {
        kind.set("CONTINUOUS_TIME");
        kind.set("TIMED_EFFECTS");
    }
    for (const auto& [t, effs] : _timed_effects) for (const Effect& e : effs) collector.effect(e);
    if (!_timed_goals.empty()) {
        kind.set("CONTINUOUS_TIME");
        kind.set("TIMED_GOALS");
    }
    for (const auto& [i, goals] : _timed_goals) for (const Expr& g : goals) collector.condition(g);
    for (const Expr& g : _goals) collector.condition(g);
    if (!_trajectory_constraints.empty()) kind.set("TRAJECTORY_CONSTRAINTS");
    if (!_state_invariants.empty()) kind.set("STATE_INVARIANTS");
    for (const Expr& inv : _state_invariants) collector.condition(inv);

    for (const QualityMetric& m : _metrics) {
        switch (m.kind) {
        case MetricKind::MINIMIZE_ACTION_COSTS: kind.set("ACTIONS_COST"); break;
        case MetricKind::MINIMIZE_EXPRESSION_ON_FINAL_STATE:
        case MetricKind::MAXIMIZE_EXPRESSION_ON_FINAL_STATE: kind.set("FINAL_VALUE"); break;
        case MetricKind::MINIMIZE_SEQUENTIAL_PLAN_LENGTH: kind.set("PLAN_LENGTH"); break;
        case MetricKind::MINIMIZE_MAKESPAN: kind.set("MAKESPAN"); break;
        case MetricKind::OVERSUBSCRIPTION: kind.set("OVERSUBSCRIPTION"); break;
        }
    }

    if (kind.has("DISCRETE_NUMBERS") || kind.has("CONTINUOUS_NUMBERS")) {
        kind.set(collector.simpleNumeric() ? "SIMPLE_NUMERIC_PLANNING" : "GENERAL_NUMERIC_PLANNING");
    }
    return kind;
}
