
#include "algo/arg_iterator.h"
#include "data/problem.h"

std::vector<std::vector<Expr>> ArgIterator::getDomains(const std::vector<const Type*>& types, const Problem& problem) {
    std::vector<std::vector<Expr>> valuesPerArg;
    for (const Type* type : types) {
        valuesPerArg.push_back(problem.domain(type));
    }
    return valuesPerArg;
}
