#ifndef PLANCOMP_EXPRESSION_STORE_H
#define PLANCOMP_EXPRESSION_STORE_H

#include <vector>
#include <deque>
#include <string>

#include "data/node.h"
#include "data/types.h"
#include "util/hashmap.h"

/*
 * Hash-consing store of expression nodes. Every node is created exactly once
 * per content (operator, argument ids, payload) and addressed by a stable id,
 * so structural equality is handle equality.
 * All mk* builders funnel through intern(), type-check their arguments and
 * apply only local reductions: an empty And is true, an empty Or is false,
 * singleton And/Or collapse to their argument and a quantifier without
 * variables is its body.
 */
class ExpressionStore {

private:
    TypeManager& _types;

    // Node arena, indexed by expression id; never shrinks
    std::deque<Node> _nodes;
    // Maps the content of a node to its id
    FlatHashMap<NodeKey, int, NodeKeyHasher> _index;

    Expr _true;
    Expr _false;

public:
    explicit ExpressionStore(TypeManager& types);
    ExpressionStore(const ExpressionStore& other) = delete;

    // Returns the unique node with this content, creating it on first use.
    Expr intern(OperatorKind op, std::vector<Expr>&& args, Payload&& payload);

    const Node& node(Expr e) const {return _nodes[e.id];}
    const Node& operator[](Expr e) const {return _nodes[e.id];}
    size_t size() const {return _nodes.size();}
    TypeManager& types() {return _types;}

    OperatorKind op(Expr e) const {return _nodes[e.id].op;}
    const std::vector<Expr>& args(Expr e) const {return _nodes[e.id].args;}
    Expr arg(Expr e, size_t idx) const {return _nodes[e.id].args[idx];}
    const Type* type(Expr e) const {return _nodes[e.id].type;}

    bool is(Expr e, OperatorKind op) const {return _nodes[e.id].op == op;}
    bool isTrue(Expr e) const {return e == _true;}
    bool isFalse(Expr e) const {return e == _false;}
    bool isBoolConstant(Expr e) const {return is(e, OperatorKind::BOOL_CONSTANT);}
    bool isNumericConstant(Expr e) const {return is(e, OperatorKind::INT_CONSTANT) || is(e, OperatorKind::REAL_CONSTANT);}
    bool isConstant(Expr e) const {return isConstantOperator(op(e)) || is(e, OperatorKind::OBJECT_EXP);}
    bool isFluentExp(Expr e) const {return is(e, OperatorKind::FLUENT_EXP);}
    bool isNot(Expr e) const {return is(e, OperatorKind::NOT);}
    bool isAnd(Expr e) const {return is(e, OperatorKind::AND);}
    bool isOr(Expr e) const {return is(e, OperatorKind::OR);}

    bool boolValue(Expr e) const;
    int64_t intValue(Expr e) const;
    double realValue(Expr e) const;
    // Value of an int or real constant
    double numericValue(Expr e) const;
    const Object* object(Expr e) const;
    const Parameter* parameter(Expr e) const;
    const Variable* variable(Expr e) const;
    const Fluent* fluent(Expr e) const;
    const std::vector<const Variable*>& variables(Expr e) const;

    Expr mkTrue() const {return _true;}
    Expr mkFalse() const {return _false;}
    Expr mkBool(bool value) const {return value ? _true : _false;}
    Expr mkInt(int64_t value);
    Expr mkReal(double value);
    Expr mkObject(const Object* o);
    Expr mkParam(const Parameter* p);
    Expr mkVariable(const Variable* v);
    Expr mkFluentExp(const Fluent* f, std::vector<Expr> args = {});

    Expr mkAnd(std::vector<Expr> args);
    Expr mkAnd(Expr a, Expr b) {return mkAnd(std::vector<Expr>{a, b});}
    Expr mkOr(std::vector<Expr> args);
    Expr mkOr(Expr a, Expr b) {return mkOr(std::vector<Expr>{a, b});}
    Expr mkNot(Expr e);
    Expr mkImplies(Expr a, Expr b);
    Expr mkIff(Expr a, Expr b);
    Expr mkExists(const std::vector<const Variable*>& vars, Expr body);
    Expr mkForall(const std::vector<const Variable*>& vars, Expr body);

    Expr mkPlus(std::vector<Expr> args);
    Expr mkPlus(Expr a, Expr b) {return mkPlus(std::vector<Expr>{a, b});}
    Expr mkMinus(Expr a, Expr b);
    Expr mkTimes(std::vector<Expr> args);
    Expr mkTimes(Expr a, Expr b) {return mkTimes(std::vector<Expr>{a, b});}
    Expr mkDiv(Expr a, Expr b);
    Expr mkLE(Expr a, Expr b);
    Expr mkLT(Expr a, Expr b);
    Expr mkGE(Expr a, Expr b) {return mkLE(b, a);}
    Expr mkGT(Expr a, Expr b) {return mkLT(b, a);}
    Expr mkEquals(Expr a, Expr b);

    Expr mkAlways(Expr e);
    Expr mkSometime(Expr e);
    Expr mkAtMostOnce(Expr e);
    Expr mkSometimeBefore(Expr phi, Expr psi);
    Expr mkSometimeAfter(Expr phi, Expr psi);

    // Rebuilds e with other arguments, keeping operator and payload.
    Expr rebuild(Expr e, std::vector<Expr>&& args);

private:
    const Type* computeType(OperatorKind op, const std::vector<Expr>& args, const Payload& payload);
};

#endif
