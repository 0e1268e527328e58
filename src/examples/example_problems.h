#ifndef PLANCOMP_EXAMPLE_PROBLEMS_H
#define PLANCOMP_EXAMPLE_PROBLEMS_H

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include "data/problem.h"
#include "plan/plan.h"

struct ExampleProblem {
    std::string name;
    std::string description;
    std::shared_ptr<Problem> problem;
    // A valid plan, for problems that can be simulated sequentially
    std::optional<SequentialPlan> plan;
};

// Small hand-built problems that together use every feature some compiler removes.
class ExampleProblems {

public:
    static std::vector<std::string> names();
    // Raises UsageError for an unknown name
    static ExampleProblem get(Environment& env, const std::string& name);
    static std::vector<ExampleProblem> all(Environment& env);
};

#endif
