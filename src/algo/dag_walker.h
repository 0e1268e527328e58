#ifndef PLANCOMP_DAG_WALKER_H
#define PLANCOMP_DAG_WALKER_H

#include <vector>
#include <string>
#include <utility>

#include "data/expression_store.h"
#include "util/hashmap.h"
#include "util/errors.h"

/*
 * Memoized post-order traversal of an expression DAG with an explicit stack.
 * Each node is handed to the handler of its operator together with the
 * results of its arguments; the default handler of every operator raises
 * UnsupportedConstructError. Results are memoized by node id, so a walker
 * instance must only be reused while the context its results depend on
 * stays the same.
 */
template <typename T>
class DagWalker {

protected:
    ExpressionStore& _store;

    // Results of visited nodes, by node id
    FlatHashMap<int, T> _memo;

    // Forget all results after each top-level walk
    bool _clear_memo;

private:
    int _depth = 0;

    // Also unwinds the depth when a handler throws
    struct DepthGuard {
        DagWalker& walker;
        explicit DepthGuard(DagWalker& walker) : walker(walker) {walker._depth++;}
        ~DepthGuard() {
            walker._depth--;
            if (walker._clear_memo && walker._depth == 0) walker._memo.clear();
        }
    };

public:
    explicit DagWalker(ExpressionStore& store, bool clearMemo = false) : 
        _store(store), _clear_memo(clearMemo) {}
    virtual ~DagWalker() = default;

    ExpressionStore& store() {return _store;}

    T walk(Expr root) {
        DepthGuard guard(*this);
        std::vector<std::pair<Expr, bool>> stack;
        stack.emplace_back(root, false);
        while (!stack.empty()) {
            auto [e, expanded] = stack.back();
            stack.pop_back();
            if (_memo.count(e.id)) continue;

            if (!expanded) {
                T result;
                if (preVisit(e, result)) {
                    _memo[e.id] = std::move(result);
                    continue;
                }
                stack.emplace_back(e, true);
                const auto& args = _store.args(e);
                for (auto it = args.rbegin(); it != args.rend(); ++it) {
                    if (!_memo.count(it->id)) stack.emplace_back(*it, false);
                }
            } else {
                std::vector<T> argResults;
                argResults.reserve(_store.args(e).size());
                for (const Expr& arg : _store.args(e)) argResults.push_back(_memo.at(arg.id));
                T result = dispatch(e, argResults);
                _memo[e.id] = std::move(result);
            }
        }
        T result = _memo.at(root.id);
        return result;
    }

protected:
    // Lets a walker answer a node without visiting its arguments.
    virtual bool preVisit(Expr e, T& result) {
        (void) e; (void) result;
        return false;
    }

    virtual T walkConstant(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkObjectExp(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkParamExp(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkVariableExp(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkFluentExp(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkAnd(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkOr(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkNot(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkImplies(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkIff(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkExists(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkForall(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkPlus(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkMinus(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkTimes(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkDiv(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkLE(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkLT(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkEquals(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkAlways(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkSometime(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkAtMostOnce(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkSometimeBefore(Expr e, const std::vector<T>& args) {return unsupported(e, args);}
    virtual T walkSometimeAfter(Expr e, const std::vector<T>& args) {return unsupported(e, args);}

    T unsupported(Expr e, const std::vector<T>& args) {
        (void) args;
        throw UnsupportedConstructError(std::string("Operator ") + toString(_store.op(e)) 
            + " is not supported by " + walkerName());
    }

    virtual std::string walkerName() const {return "this walker";}

private:
    T dispatch(Expr e, const std::vector<T>& args) {
        switch (_store.op(e)) {
        case OperatorKind::BOOL_CONSTANT:
        case OperatorKind::INT_CONSTANT:
        case OperatorKind::REAL_CONSTANT: return walkConstant(e, args);
        case OperatorKind::OBJECT_EXP: return walkObjectExp(e, args);
        case OperatorKind::PARAM_EXP: return walkParamExp(e, args);
        case OperatorKind::VARIABLE_EXP: return walkVariableExp(e, args);
        case OperatorKind::FLUENT_EXP: return walkFluentExp(e, args);
        case OperatorKind::AND: return walkAnd(e, args);
        case OperatorKind::OR: return walkOr(e, args);
        case OperatorKind::NOT: return walkNot(e, args);
        case OperatorKind::IMPLIES: return walkImplies(e, args);
        case OperatorKind::IFF: return walkIff(e, args);
        case OperatorKind::EXISTS: return walkExists(e, args);
        case OperatorKind::FORALL: return walkForall(e, args);
        case OperatorKind::PLUS: return walkPlus(e, args);
        case OperatorKind::MINUS: return walkMinus(e, args);
        case OperatorKind::TIMES: return walkTimes(e, args);
        case OperatorKind::DIV: return walkDiv(e, args);
        case OperatorKind::LE: return walkLE(e, args);
        case OperatorKind::LT: return walkLT(e, args);
        case OperatorKind::EQUALS: return walkEquals(e, args);
        case OperatorKind::ALWAYS: return walkAlways(e, args);
        case OperatorKind::SOMETIME: return walkSometime(e, args);
        case OperatorKind::AT_MOST_ONCE: return walkAtMostOnce(e, args);
        case OperatorKind::SOMETIME_BEFORE: return walkSometimeBefore(e, args);
        case OperatorKind::SOMETIME_AFTER: return walkSometimeAfter(e, args);
        }
        return unsupported(e, args);
    }
};

#endif
