#ifndef PLANCOMP_COMPILER_UTILS_H
#define PLANCOMP_COMPILER_UTILS_H

#include <string>
#include <vector>
#include <memory>

#include "data/problem.h"
#include "data/substitution.h"
#include "algo/simplifier.h"
#include "util/hashmap.h"

/*
 * Generates names not used by a problem: the base name itself if it is
 * free, otherwise <base>__<N>__ for the smallest free N. Every generated
 * name is taken from then on.
 */
class FreshNames {

private:
    NodeHashSet<std::string> _taken;

public:
    FreshNames() = default;
    // Takes all names of the problem, optionally without its action names
    explicit FreshNames(const Problem& problem, bool includeActions = true);

    void take(const std::string& name) {_taken.insert(name);}
    bool isTaken(const std::string& name) const {return _taken.count(name);}
    std::string get(const std::string& base);
};

// Raises ProblemDefinitionError if a name of the problem ends with the
// suffix reserved for generated names.
void checkNoReservedNames(const Problem& problem);

// Replaces the preconditions (or, for a durative action, the conditions of
// each interval) by the arguments of their simplified conjunction.
// Returns false iff some conjunction simplified to false.
bool simplifyConditions(Action& action, Simplifier& simplifier);

// The action with its parameters replaced according to the substitution,
// under another name and without parameters. Effect conditions are
// simplified and false ones dropped. Returns null if the instance is
// infeasible: a false condition or conflicting effects.
std::shared_ptr<Action> instantiateAction(ExpressionStore& store, const Action& action, 
        const std::string& name, const Substitution& subs, Simplifier& simplifier);

// A compiled action created from an input action, whose parameters are bound by "binding"
struct ActionOrigin {
    std::string name;
    std::string originalName;
    Substitution binding;
};

// Copies the quality metrics of "from" into "to". Action costs are
// transferred to the compiled actions, with the binding applied.
void copyQualityMetrics(const Problem& from, Problem& to, const std::vector<ActionOrigin>& origins);

#endif
