
#include "data/node.h"

std::size_t NodeKeyHasher::operator()(const NodeKey& key) const {
    size_t hash = 1337;
    hash_combine(hash, static_cast<int>(key.op));
    for (const Expr& e : key.args) hash_combine(hash, e.id);
    hash_combine(hash, key.payload.index());
    std::visit([&hash](auto&& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return;
        } else if constexpr (std::is_same_v<T, std::vector<const Variable*>>) {
            for (const Variable* v : p) hash_combine(hash, v);
        } else {
            hash_combine(hash, p);
        }
    }, key.payload);
    return hash;
}

const char* toString(OperatorKind op) {
    switch (op) {
    case OperatorKind::BOOL_CONSTANT: return "BOOL_CONSTANT";
    case OperatorKind::INT_CONSTANT: return "INT_CONSTANT";
    case OperatorKind::REAL_CONSTANT: return "REAL_CONSTANT";
    case OperatorKind::OBJECT_EXP: return "OBJECT_EXP";
    case OperatorKind::PARAM_EXP: return "PARAM_EXP";
    case OperatorKind::VARIABLE_EXP: return "VARIABLE_EXP";
    case OperatorKind::FLUENT_EXP: return "FLUENT_EXP";
    case OperatorKind::AND: return "AND";
    case OperatorKind::OR: return "OR";
    case OperatorKind::NOT: return "NOT";
    case OperatorKind::IMPLIES: return "IMPLIES";
    case OperatorKind::IFF: return "IFF";
    case OperatorKind::EXISTS: return "EXISTS";
    case OperatorKind::FORALL: return "FORALL";
    case OperatorKind::PLUS: return "PLUS";
    case OperatorKind::MINUS: return "MINUS";
    case OperatorKind::TIMES: return "TIMES";
    case OperatorKind::DIV: return "DIV";
    case OperatorKind::LE: return "LE";
    case OperatorKind::LT: return "LT";
    case OperatorKind::EQUALS: return "EQUALS";
    case OperatorKind::ALWAYS: return "ALWAYS";
    case OperatorKind::SOMETIME: return "SOMETIME";
    case OperatorKind::AT_MOST_ONCE: return "AT_MOST_ONCE";
    case OperatorKind::SOMETIME_BEFORE: return "SOMETIME_BEFORE";
    case OperatorKind::SOMETIME_AFTER: return "SOMETIME_AFTER";
    }
    return "?";
}
