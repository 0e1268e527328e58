#ifndef PLANCOMP_EFFECT_H
#define PLANCOMP_EFFECT_H

#include <vector>

#include "data/expression_store.h"

enum class EffectKind { ASSIGN, INCREASE, DECREASE };

/*
 * fluent := value (or += / -=) if condition holds, for all bindings of the
 * forall variables. Checked on construction: the target is a fluent
 * expression whose arguments contain no fluents, value and condition are
 * well typed, and the free variables of target, value and condition are
 * exactly the forall variables.
 */
class Effect {

private:
    Expr _fluent;
    Expr _value;
    Expr _condition;
    EffectKind _kind;
    std::vector<const Variable*> _forall;
    bool _conditional;

public:
    Effect(ExpressionStore& store, Expr fluent, Expr value, Expr condition, 
            EffectKind kind = EffectKind::ASSIGN, const std::vector<const Variable*>& forall = {});

    Expr fluent() const {return _fluent;}
    Expr value() const {return _value;}
    Expr condition() const {return _condition;}
    EffectKind kind() const {return _kind;}
    const std::vector<const Variable*>& forall() const {return _forall;}

    bool isConditional() const {return _conditional;}
    bool isForall() const {return !_forall.empty();}
    bool isAssignment() const {return _kind == EffectKind::ASSIGN;}
    bool isIncrease() const {return _kind == EffectKind::INCREASE;}
    bool isDecrease() const {return _kind == EffectKind::DECREASE;}

    inline bool operator==(const Effect& other) const {
        return _fluent == other._fluent && _value == other._value && _condition == other._condition 
            && _kind == other._kind && _forall == other._forall;
    }
    inline bool operator!=(const Effect& other) const {return !(*this == other);}
};

// True iff both effects may apply at once and then disagree on the new value.
bool conflicting(const Effect& a, const Effect& b);

// Adds an effect to a set of simultaneous effects. Identical effects are
// kept once; conflicting ones raise ConflictingEffectsError.
void addSimultaneousEffect(const ExpressionStore& store, std::vector<Effect>& effects, const Effect& effect);

#endif
