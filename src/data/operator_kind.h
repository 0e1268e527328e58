#ifndef PLANCOMP_OPERATOR_KIND_H
#define PLANCOMP_OPERATOR_KIND_H

enum class OperatorKind {
    BOOL_CONSTANT,
    INT_CONSTANT,
    REAL_CONSTANT,
    OBJECT_EXP,
    PARAM_EXP,
    VARIABLE_EXP,
    FLUENT_EXP,
    AND,
    OR,
    NOT,
    IMPLIES,
    IFF,
    EXISTS,
    FORALL,
    PLUS,
    MINUS,
    TIMES,
    DIV,
    LE,
    LT,
    EQUALS,
    ALWAYS,
    SOMETIME,
    AT_MOST_ONCE,
    SOMETIME_BEFORE,
    SOMETIME_AFTER
};

const int NUM_OPERATOR_KINDS = static_cast<int>(OperatorKind::SOMETIME_AFTER) + 1;

const char* toString(OperatorKind op);

inline bool isConstantOperator(OperatorKind op) {
    return op == OperatorKind::BOOL_CONSTANT || op == OperatorKind::INT_CONSTANT || op == OperatorKind::REAL_CONSTANT;
}
inline bool isQuantifierOperator(OperatorKind op) {
    return op == OperatorKind::EXISTS || op == OperatorKind::FORALL;
}
inline bool isArithmeticOperator(OperatorKind op) {
    return op == OperatorKind::PLUS || op == OperatorKind::MINUS 
        || op == OperatorKind::TIMES || op == OperatorKind::DIV;
}
inline bool isRelationOperator(OperatorKind op) {
    return op == OperatorKind::LE || op == OperatorKind::LT || op == OperatorKind::EQUALS;
}
inline bool isTrajectoryOperator(OperatorKind op) {
    return op == OperatorKind::ALWAYS || op == OperatorKind::SOMETIME || op == OperatorKind::AT_MOST_ONCE
        || op == OperatorKind::SOMETIME_BEFORE || op == OperatorKind::SOMETIME_AFTER;
}
// Operators whose arguments and result are all boolean
inline bool isBoolOperator(OperatorKind op) {
    return op == OperatorKind::AND || op == OperatorKind::OR || op == OperatorKind::NOT 
        || op == OperatorKind::IMPLIES || op == OperatorKind::IFF 
        || isQuantifierOperator(op) || isTrajectoryOperator(op);
}

#endif
