
#include "data/expression_store.h"
#include "util/errors.h"

ExpressionStore::ExpressionStore(TypeManager& types) : _types(types) {
    _true = intern(OperatorKind::BOOL_CONSTANT, {}, Payload(true));
    _false = intern(OperatorKind::BOOL_CONSTANT, {}, Payload(false));
}

Expr ExpressionStore::intern(OperatorKind op, std::vector<Expr>&& args, Payload&& payload) {
    NodeKey key{op, args, payload};
    auto it = _index.find(key);
    if (it != _index.end()) return Expr(it->second);

    const Type* type = computeType(op, args, payload);
    int id = _nodes.size();
    _nodes.emplace_back(op, std::move(args), std::move(payload), type);
    _index[std::move(key)] = id;
    return Expr(id);
}

bool ExpressionStore::boolValue(Expr e) const {
    if (!is(e, OperatorKind::BOOL_CONSTANT)) throw TypeError("Not a boolean constant");
    return std::get<bool>(node(e).payload);
}
int64_t ExpressionStore::intValue(Expr e) const {
    if (!is(e, OperatorKind::INT_CONSTANT)) throw TypeError("Not an integer constant");
    return std::get<int64_t>(node(e).payload);
}
double ExpressionStore::realValue(Expr e) const {
    if (!is(e, OperatorKind::REAL_CONSTANT)) throw TypeError("Not a real constant");
    return std::get<double>(node(e).payload);
}
double ExpressionStore::numericValue(Expr e) const {
    if (is(e, OperatorKind::INT_CONSTANT)) return (double) std::get<int64_t>(node(e).payload);
    return realValue(e);
}
const Object* ExpressionStore::object(Expr e) const {
    if (!is(e, OperatorKind::OBJECT_EXP)) throw TypeError("Not an object expression");
    return std::get<const Object*>(node(e).payload);
}
const Parameter* ExpressionStore::parameter(Expr e) const {
    if (!is(e, OperatorKind::PARAM_EXP)) throw TypeError("Not a parameter expression");
    return std::get<const Parameter*>(node(e).payload);
}
const Variable* ExpressionStore::variable(Expr e) const {
    if (!is(e, OperatorKind::VARIABLE_EXP)) throw TypeError("Not a variable expression");
    return std::get<const Variable*>(node(e).payload);
}
const Fluent* ExpressionStore::fluent(Expr e) const {
    if (!is(e, OperatorKind::FLUENT_EXP)) throw TypeError("Not a fluent expression");
    return std::get<const Fluent*>(node(e).payload);
}
const std::vector<const Variable*>& ExpressionStore::variables(Expr e) const {
    if (!isQuantifierOperator(op(e))) throw TypeError("Not a quantifier");
    return std::get<std::vector<const Variable*>>(node(e).payload);
}

Expr ExpressionStore::mkInt(int64_t value) {
    return intern(OperatorKind::INT_CONSTANT, {}, Payload(value));
}
Expr ExpressionStore::mkReal(double value) {
    return intern(OperatorKind::REAL_CONSTANT, {}, Payload(value));
}
Expr ExpressionStore::mkObject(const Object* o) {
    return intern(OperatorKind::OBJECT_EXP, {}, Payload(o));
}
Expr ExpressionStore::mkParam(const Parameter* p) {
    return intern(OperatorKind::PARAM_EXP, {}, Payload(p));
}
Expr ExpressionStore::mkVariable(const Variable* v) {
    return intern(OperatorKind::VARIABLE_EXP, {}, Payload(v));
}
Expr ExpressionStore::mkFluentExp(const Fluent* f, std::vector<Expr> args) {
    return intern(OperatorKind::FLUENT_EXP, std::move(args), Payload(f));
}

Expr ExpressionStore::mkAnd(std::vector<Expr> args) {
    if (args.empty()) return _true;
    if (args.size() == 1) {
        if (!type(args[0])->isBool()) throw TypeError("AND over a non-boolean expression");
        return args[0];
    }
    return intern(OperatorKind::AND, std::move(args), Payload());
}
Expr ExpressionStore::mkOr(std::vector<Expr> args) {
    if (args.empty()) return _false;
    if (args.size() == 1) {
        if (!type(args[0])->isBool()) throw TypeError("OR over a non-boolean expression");
        return args[0];
    }
    return intern(OperatorKind::OR, std::move(args), Payload());
}
Expr ExpressionStore::mkNot(Expr e) {
    return intern(OperatorKind::NOT, {e}, Payload());
}
Expr ExpressionStore::mkImplies(Expr a, Expr b) {
    return intern(OperatorKind::IMPLIES, {a, b}, Payload());
}
Expr ExpressionStore::mkIff(Expr a, Expr b) {
    return intern(OperatorKind::IFF, {a, b}, Payload());
}
Expr ExpressionStore::mkExists(const std::vector<const Variable*>& vars, Expr body) {
    if (vars.empty()) return body;
    return intern(OperatorKind::EXISTS, {body}, Payload(vars));
}
Expr ExpressionStore::mkForall(const std::vector<const Variable*>& vars, Expr body) {
    if (vars.empty()) return body;
    return intern(OperatorKind::FORALL, {body}, Payload(vars));
}

Expr ExpressionStore::mkPlus(std::vector<Expr> args) {
    if (args.empty()) return mkInt(0);
    if (args.size() == 1) return args[0];
    return intern(OperatorKind::PLUS, std::move(args), Payload());
}
Expr ExpressionStore::mkMinus(Expr a, Expr b) {
    return intern(OperatorKind::MINUS, {a, b}, Payload());
}
Expr ExpressionStore::mkTimes(std::vector<Expr> args) {
    if (args.empty()) return mkInt(1);
    if (args.size() == 1) return args[0];
    return intern(OperatorKind::TIMES, std::move(args), Payload());
}
Expr ExpressionStore::mkDiv(Expr a, Expr b) {
    return intern(OperatorKind::DIV, {a, b}, Payload());
}
Expr ExpressionStore::mkLE(Expr a, Expr b) {
    return intern(OperatorKind::LE, {a, b}, Payload());
}
Expr ExpressionStore::mkLT(Expr a, Expr b) {
    return intern(OperatorKind::LT, {a, b}, Payload());
}
Expr ExpressionStore::mkEquals(Expr a, Expr b) {
    return intern(OperatorKind::EQUALS, {a, b}, Payload());
}

Expr ExpressionStore::mkAlways(Expr e) {
    return intern(OperatorKind::ALWAYS, {e}, Payload());
}
Expr ExpressionStore::mkSometime(Expr e) {
    return intern(OperatorKind::SOMETIME, {e}, Payload());
}
Expr ExpressionStore::mkAtMostOnce(Expr e) {
    return intern(OperatorKind::AT_MOST_ONCE, {e}, Payload());
}
Expr ExpressionStore::mkSometimeBefore(Expr phi, Expr psi) {
    return intern(OperatorKind::SOMETIME_BEFORE, {phi, psi}, Payload());
}
Expr ExpressionStore::mkSometimeAfter(Expr phi, Expr psi) {
    return intern(OperatorKind::SOMETIME_AFTER, {phi, psi}, Payload());
}

Expr ExpressionStore::rebuild(Expr e, std::vector<Expr>&& args) {
    if (args == this->args(e)) return e;
    Payload payload = node(e).payload;
    return intern(op(e), std::move(args), std::move(payload));
}

const Type* ExpressionStore::computeType(OperatorKind op, const std::vector<Expr>& args, const Payload& payload) {
    
    auto arity = [&](size_t n) {
        if (args.size() != n) 
            throw TypeError(std::string(toString(op)) + " expects " + std::to_string(n) 
                + " arguments, got " + std::to_string(args.size()));
    };
    auto requireBool = [&]() {
        for (const Expr& a : args) if (!type(a)->isBool()) 
            throw TypeError(std::string(toString(op)) + " over a non-boolean expression");
    };
    auto requireNumeric = [&]() {
        bool real = false;
        for (const Expr& a : args) {
            if (!type(a)->isNumeric()) 
                throw TypeError(std::string(toString(op)) + " over a non-numeric expression");
            real = real || type(a)->isReal();
        }
        return real;
    };

    switch (op) {
    case OperatorKind::BOOL_CONSTANT:
        return _types.boolType();
    case OperatorKind::INT_CONSTANT: {
        double v = (double) std::get<int64_t>(payload);
        return _types.intType(v, v);
    }
    case OperatorKind::REAL_CONSTANT: {
        double v = std::get<double>(payload);
        return _types.realType(v, v);
    }
    case OperatorKind::OBJECT_EXP:
        return std::get<const Object*>(payload)->type;
    case OperatorKind::PARAM_EXP:
        return std::get<const Parameter*>(payload)->type;
    case OperatorKind::VARIABLE_EXP:
        return std::get<const Variable*>(payload)->type;
    case OperatorKind::FLUENT_EXP: {
        const Fluent* f = std::get<const Fluent*>(payload);
        if (args.size() != f->arity()) 
            throw TypeError("Fluent " + f->name + " expects " + std::to_string(f->arity()) 
                + " arguments, got " + std::to_string(args.size()));
        for (size_t i = 0; i < args.size(); i++) {
            if (!f->signature[i]->type->accepts(type(args[i]))) 
                throw TypeError("Argument " + std::to_string(i) + " of fluent " + f->name + " has type " 
                    + type(args[i])->toString() + ", expected " + f->signature[i]->type->toString());
        }
        return f->type;
    }
    case OperatorKind::AND:
    case OperatorKind::OR:
        requireBool();
        return _types.boolType();
    case OperatorKind::NOT:
    case OperatorKind::ALWAYS:
    case OperatorKind::SOMETIME:
    case OperatorKind::AT_MOST_ONCE:
        arity(1); requireBool();
        return _types.boolType();
    case OperatorKind::EXISTS:
    case OperatorKind::FORALL:
        arity(1); requireBool();
        for (const Variable* v : std::get<std::vector<const Variable*>>(payload)) {
            if (v == nullptr) throw TypeError("Null variable under a quantifier");
        }
        return _types.boolType();
    case OperatorKind::IMPLIES:
    case OperatorKind::IFF:
    case OperatorKind::SOMETIME_BEFORE:
    case OperatorKind::SOMETIME_AFTER:
        arity(2); requireBool();
        return _types.boolType();
    case OperatorKind::PLUS:
    case OperatorKind::TIMES:
        return requireNumeric() ? _types.realType() : _types.intType();
    case OperatorKind::MINUS:
        arity(2);
        return requireNumeric() ? _types.realType() : _types.intType();
    case OperatorKind::DIV:
        arity(2); requireNumeric();
        return _types.realType();
    case OperatorKind::LE:
    case OperatorKind::LT:
        arity(2); requireNumeric();
        return _types.boolType();
    case OperatorKind::EQUALS: {
        arity(2);
        const Type* l = type(args[0]);
        const Type* r = type(args[1]);
        if (l->isBool() || r->isBool()) throw TypeError("EQUALS over booleans; use IFF");
        // Numbers of any kind and bounds are comparable; objects need related types
        if (l->isNumeric() && r->isNumeric()) return _types.boolType();
        if (!l->accepts(r) && !r->accepts(l)) 
            throw TypeError("EQUALS over incompatible types " + l->toString() + " and " + r->toString());
        return _types.boolType();
    }
    }
    throw UnsupportedConstructError("Unknown operator");
}
