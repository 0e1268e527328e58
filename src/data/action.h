#ifndef PLANCOMP_ACTION_H
#define PLANCOMP_ACTION_H

#include <string>
#include <vector>
#include <variant>
#include <memory>

#include "data/effect.h"
#include "data/timing.h"

struct InstantaneousBody {
    std::vector<Expr> preconditions;
    std::vector<Effect> effects;
};

struct DurativeBody {
    DurationInterval duration;
    std::vector<std::pair<TimeInterval, std::vector<Expr>>> conditions;
    std::vector<std::pair<Timing, std::vector<Effect>>> effects;
};

// An instantaneous action that also observes some fluents
struct SensingBody {
    InstantaneousBody body;
    std::vector<Expr> observedFluents;
};

/*
 * Action: name and parameters shared by all kinds, and a body that is
 * instantaneous, durative or sensing. Accessing the body of another kind
 * raises UsageError. Adding a condition skips true and duplicates; adding
 * an effect checks it against the simultaneous effects.
 */
class Action {

private:
    std::string _name;
    std::vector<const Parameter*> _params;
    std::variant<InstantaneousBody, DurativeBody, SensingBody> _body;

public:
    Action(const std::string& name, const std::vector<const Parameter*>& params, InstantaneousBody body = {});
    Action(const std::string& name, const std::vector<const Parameter*>& params, DurativeBody body);
    Action(const std::string& name, const std::vector<const Parameter*>& params, SensingBody body);

    const std::string& name() const {return _name;}
    void setName(const std::string& name) {_name = name;}
    const std::vector<const Parameter*>& parameters() const {return _params;}
    void setParameters(const std::vector<const Parameter*>& params) {_params = params;}

    bool isInstantaneous() const {return std::holds_alternative<InstantaneousBody>(_body);}
    bool isDurative() const {return std::holds_alternative<DurativeBody>(_body);}
    bool isSensing() const {return std::holds_alternative<SensingBody>(_body);}

    // Instantaneous and sensing actions
    const std::vector<Expr>& preconditions() const;
    void addPrecondition(const ExpressionStore& store, Expr precondition);
    void setPreconditions(const std::vector<Expr>& preconditions);
    const std::vector<Effect>& effects() const;
    void addEffect(const ExpressionStore& store, const Effect& effect);
    void clearEffects();

    // Durative actions
    const DurationInterval& duration() const;
    void setDuration(const DurationInterval& duration);
    const std::vector<std::pair<TimeInterval, std::vector<Expr>>>& conditions() const;
    void addCondition(const ExpressionStore& store, const TimeInterval& interval, Expr condition);
    void clearConditions();
    const std::vector<std::pair<Timing, std::vector<Effect>>>& timedEffects() const;
    void addEffect(const ExpressionStore& store, const Timing& timing, const Effect& effect);

    // Sensing actions
    const std::vector<Expr>& observedFluents() const;
    void addObservedFluent(const ExpressionStore& store, Expr fluent);

    // Every effect of the action, whatever its timing
    std::vector<Effect> allEffects() const;
    bool hasConditionalEffects() const;

    std::shared_ptr<Action> clone() const {return std::make_shared<Action>(*this);}

private:
    InstantaneousBody& instantaneous();
    const InstantaneousBody& instantaneous() const;
    DurativeBody& durative();
    const DurativeBody& durative() const;
};

#endif
