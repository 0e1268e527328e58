#ifndef PLANCOMP_HASHMAP_H
#define PLANCOMP_HASHMAP_H

#include <vector>
#include <robin_hood.h>

#define FlatHashMap robin_hood::unordered_flat_map
#define NodeHashMap robin_hood::unordered_node_map
#define FlatHashSet robin_hood::unordered_flat_set
#define NodeHashSet robin_hood::unordered_node_set

#include "util/hash.h"

struct IntVecHasher {
    inline std::size_t operator()(const std::vector<int>& s) const {
        size_t hash = s.size();
        for (const int& arg : s) {
            hash_combine(hash, arg);
        }
        return hash;
    }
};

#endif
