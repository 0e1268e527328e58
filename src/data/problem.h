#ifndef PLANCOMP_PROBLEM_H
#define PLANCOMP_PROBLEM_H

#include <string>
#include <vector>
#include <memory>

#include "data/environment.h"
#include "data/action.h"
#include "data/metrics.h"
#include "data/problem_kind.h"
#include "util/hashmap.h"

/*
 * A planning problem: fluents, objects, actions, initial values, goals,
 * timed goals and effects, trajectory constraints, state invariants and
 * quality metrics, all expressed in one environment.
 * Initial values are a partial function; a fluent expression without an
 * explicit value falls back to the default of its fluent, then to the
 * default of its type.
 * A problem is only modified while it is being built. Compilers work on
 * a clone(), which shares fluents, objects and types but owns copies of
 * everything else.
 */
class Problem {

private:
    Environment& _env;
    std::string _name;

    std::vector<const Type*> _user_types;
    std::vector<const Fluent*> _fluents;
    FlatHashMap<const Fluent*, Expr> _fluent_defaults;
    FlatHashMap<const Type*, Expr> _type_defaults;
    std::vector<const Object*> _objects;
    std::vector<std::shared_ptr<Action>> _actions;

    // Explicit initial values in the order they were set
    std::vector<std::pair<Expr, Expr>> _initial_values;
    FlatHashMap<Expr, size_t, ExprHasher> _initial_value_index;

    std::vector<Expr> _goals;
    std::vector<std::pair<TimeInterval, std::vector<Expr>>> _timed_goals;
    std::vector<std::pair<Timing, std::vector<Effect>>> _timed_effects;
    std::vector<Expr> _trajectory_constraints;
    std::vector<Expr> _state_invariants;
    std::vector<QualityMetric> _metrics;

public:
    explicit Problem(Environment& env, const std::string& name = "");
    Problem(const Problem& other) = default;

    // Copy with its own actions, initial values, goals and constraints
    std::shared_ptr<Problem> clone() const;

    Environment& env() const {return _env;}
    ExpressionStore& exprs() const {return _env.exprs();}
    const std::string& name() const {return _name;}
    void setName(const std::string& name) {_name = name;}

    // True iff a fluent, object, action or user type has this name
    bool hasName(const std::string& name) const;

    // Types
    const std::vector<const Type*>& userTypes() const {return _user_types;}
    void addUserType(const Type* type);
    void setTypeDefault(const Type* type, Expr value);

    // Fluents
    void addFluent(const Fluent* fluent, Expr defaultValue = Expr());
    const std::vector<const Fluent*>& fluents() const {return _fluents;}
    const Fluent* fluent(const std::string& name) const;
    bool hasFluent(const std::string& name) const;
    // Default initial value of a fluent, or an invalid expression
    Expr fluentDefault(const Fluent* fluent) const;
    // The fluent's default, else the default of its type, else invalid
    Expr defaultValue(const Fluent* fluent) const;
    void clearFluents();

    // Objects
    void addObject(const Object* object);
    void addObjects(const std::vector<const Object*>& objects);
    const std::vector<const Object*>& objects() const {return _objects;}
    const Object* object(const std::string& name) const;
    bool hasObject(const std::string& name) const;
    // Objects of the type or of one of its subtypes, in declaration order
    std::vector<const Object*> objectsOfType(const Type* type) const;
    // Finite domain of the type as constant expressions: true and false,
    // lb..ub of a bounded integer type, or the objects of a user type
    std::vector<Expr> domain(const Type* type) const;

    // Actions
    void addAction(std::shared_ptr<Action> action);
    const std::vector<std::shared_ptr<Action>>& actions() const {return _actions;}
    std::shared_ptr<Action> action(const std::string& name) const;
    bool hasAction(const std::string& name) const;
    void clearActions();

    // Initial values
    void setInitialValue(Expr fluentExp, Expr value);
    // The value of a ground fluent expression in the initial state after
    // fallbacks, or an invalid expression
    Expr initialValue(Expr fluentExp) const;
    const std::vector<std::pair<Expr, Expr>>& explicitInitialValues() const {return _initial_values;}
    // Every ground fluent expression and its initial value, in fluent declaration order
    std::vector<std::pair<Expr, Expr>> initialValues() const;
    void clearInitialValues();

    // Goals
    void addGoal(Expr goal);
    const std::vector<Expr>& goals() const {return _goals;}
    void clearGoals() {_goals.clear();}
    void addTimedGoal(const TimeInterval& interval, Expr goal);
    const std::vector<std::pair<TimeInterval, std::vector<Expr>>>& timedGoals() const {return _timed_goals;}
    void clearTimedGoals() {_timed_goals.clear();}

    void addTimedEffect(const Timing& timing, const Effect& effect);
    const std::vector<std::pair<Timing, std::vector<Effect>>>& timedEffects() const {return _timed_effects;}
    void clearTimedEffects() {_timed_effects.clear();}

    // Constraints
    void addTrajectoryConstraint(Expr constraint);
    const std::vector<Expr>& trajectoryConstraints() const {return _trajectory_constraints;}
    void clearTrajectoryConstraints() {_trajectory_constraints.clear();}
    void addStateInvariant(Expr invariant);
    const std::vector<Expr>& stateInvariants() const {return _state_invariants;}
    void clearStateInvariants() {_state_invariants.clear();}

    // Metrics
    void addQualityMetric(const QualityMetric& metric) {_metrics.push_back(metric);}
    const std::vector<QualityMetric>& qualityMetrics() const {return _metrics;}
    void clearQualityMetrics() {_metrics.clear();}

    // Fluents written by no action and no timed effect
    FlatHashSet<const Fluent*> staticFluents() const;

    // Features this problem uses; recomputed on every call
    ProblemKind kind() const;

private:
    void checkName(const std::string& name) const;
    void collectUserTypes(const Type* type);
};

#endif
