#ifndef PLANCOMP_PLAN_H
#define PLANCOMP_PLAN_H

#include <vector>
#include <memory>
#include <optional>
#include <functional>

#include "data/action.h"

// An action applied to constant actual parameters
struct ActionInstance {
    std::shared_ptr<const Action> action;
    std::vector<Expr> params;

    ActionInstance(std::shared_ptr<const Action> action, std::vector<Expr> params = {}) : 
        action(std::move(action)), params(std::move(params)) {}

    inline bool operator==(const ActionInstance& other) const {
        return action == other.action && params == other.params;
    }
    inline bool operator!=(const ActionInstance& other) const {return !(*this == other);}
};

// Maps an instance of a compiled problem to an instance of the problem it was
// compiled from, or to nothing if the compiler introduced its action
typedef std::function<std::optional<ActionInstance>(const ActionInstance&)> BackMap;

struct SequentialPlan {
    std::vector<ActionInstance> actions;

    SequentialPlan() = default;
    explicit SequentialPlan(std::vector<ActionInstance> actions) : actions(std::move(actions)) {}

    size_t size() const {return actions.size();}
    bool empty() const {return actions.empty();}

    // Applies the map to every instance, dropping the unmapped ones.
    SequentialPlan mapBack(const BackMap& map) const {
        SequentialPlan out;
        for (const ActionInstance& a : actions) {
            auto mapped = map(a);
            if (mapped.has_value()) out.actions.push_back(std::move(*mapped));
        }
        return out;
    }
};

#endif
