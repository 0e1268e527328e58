#ifndef PLANCOMP_NAMES_H
#define PLANCOMP_NAMES_H

#include <string>
#include <vector>

#include "data/problem.h"
#include "data/substitution.h"
#include "plan/plan.h"

#define TOSTR(...) Names::to_string(__VA_ARGS__).c_str()

namespace Names {
    std::string to_string(const ExpressionStore& store, Expr e);
    std::string to_string(const ExpressionStore& store, const std::vector<Expr>& exprs);
    std::string to_string(const ExpressionStore& store, const Effect& e);
    std::string to_string(const ExpressionStore& store, const Action& a);
    std::string to_string(const ExpressionStore& store, const Substitution& s);
    std::string to_string(const ExpressionStore& store, const ActionInstance& a);
    std::string to_string(const ExpressionStore& store, const SequentialPlan& plan);
    std::string to_string(const Problem& p);
    std::string to_string(const ProblemKind& k);
    std::string to_string(double number);
}

#endif
