#ifndef PLANCOMP_NNF_H
#define PLANCOMP_NNF_H

#include "data/expression_store.h"
#include "util/hashmap.h"

/*
 * Negation normal form: negations are pushed down to the atoms
 * (De Morgan, quantifier duality), implications become disjunctions and
 * equivalences become disjunctions of two conjunctions. Uses an explicit
 * stack of (polarity, expression) pairs; results are memoized per pair.
 */
class Nnf {

private:
    ExpressionStore& _store;

    struct KeyHasher {
        inline std::size_t operator()(const std::pair<int, bool>& key) const {
            size_t h = 17;
            hash_combine(h, key.first);
            hash_combine(h, key.second);
            return h;
        }
    };
    // Maps (expression id, polarity) to the normal form
    FlatHashMap<std::pair<int, bool>, Expr, KeyHasher> _memo;

public:
    explicit Nnf(ExpressionStore& store) : _store(store) {}

    Expr get(Expr e);

private:
    Expr result(Expr e, bool polarity) const {
        return _memo.at(std::pair<int, bool>(e.id, polarity));
    }
};

#endif
