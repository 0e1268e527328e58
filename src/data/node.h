#ifndef PLANCOMP_NODE_H
#define PLANCOMP_NODE_H

#include <vector>
#include <variant>
#include <cstdint>

#include "data/operator_kind.h"
#include "data/entities.h"
#include "util/hashmap.h"

// Handle of an interned expression node. Two handles are equal iff
// they denote the same node of the same store.
struct Expr {
    int id = -1;

    Expr() = default;
    explicit Expr(int id) : id(id) {}

    bool valid() const {return id >= 0;}

    inline bool operator==(const Expr& other) const {return id == other.id;}
    inline bool operator!=(const Expr& other) const {return id != other.id;}
    inline bool operator<(const Expr& other) const {return id < other.id;}
};

struct ExprHasher {
    inline std::size_t operator()(const Expr& e) const {
        static robin_hood::hash<int> h;
        return h(e.id);
    }
};

struct ExprVecHasher {
    inline std::size_t operator()(const std::vector<Expr>& v) const {
        size_t hash = v.size();
        for (const Expr& e : v) hash_combine(hash, e.id);
        return hash;
    }
};

typedef std::variant<std::monostate, bool, int64_t, double, 
        const Object*, const Parameter*, const Variable*, const Fluent*, 
        std::vector<const Variable*>> Payload;

struct Node {
    OperatorKind op;
    std::vector<Expr> args;
    Payload payload;
    const Type* type;

    Node(OperatorKind op, std::vector<Expr>&& args, Payload&& payload, const Type* type) : 
        op(op), args(std::move(args)), payload(std::move(payload)), type(type) {}
};

// Content of a node, used as interning key.
struct NodeKey {
    OperatorKind op;
    std::vector<Expr> args;
    Payload payload;

    inline bool operator==(const NodeKey& other) const {
        return op == other.op && args == other.args && payload == other.payload;
    }
};

struct NodeKeyHasher {
    std::size_t operator()(const NodeKey& key) const;
};

#endif
