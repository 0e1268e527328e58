
#include "plan/state.h"
#include "data/problem.h"
#include "util/errors.h"

State::State(const Problem& problem) {
    for (const auto& [fe, value] : problem.initialValues()) _values[fe] = value;
}

Expr State::get(Expr fluentExp) const {
    auto it = _values.find(fluentExp);
    if (it == _values.end()) 
        throw UsageError("No value for fluent expression #" + std::to_string(fluentExp.id) + " in state");
    return it->second;
}
