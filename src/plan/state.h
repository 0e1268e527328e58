#ifndef PLANCOMP_STATE_H
#define PLANCOMP_STATE_H

#include "data/node.h"
#include "util/hashmap.h"

class Problem;

// Total assignment of the ground fluent expressions of a problem to constants
class State {

private:
    FlatHashMap<Expr, Expr, ExprHasher> _values;

public:
    State() = default;
    // The initial state; raises ProblemDefinitionError if a value is missing
    explicit State(const Problem& problem);

    bool has(Expr fluentExp) const {return _values.count(fluentExp);}
    // Raises UsageError if the fluent expression has no value
    Expr get(Expr fluentExp) const;
    void set(Expr fluentExp, Expr value) {_values[fluentExp] = value;}
    size_t size() const {return _values.size();}
};

#endif
