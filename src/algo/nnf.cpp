
#include <tuple>

#include "algo/nnf.h"

Expr Nnf::get(Expr root) {

    // (polarity, expression, arguments already solved)
    std::vector<std::tuple<bool, Expr, bool>> stack;
    stack.emplace_back(true, root, false);

    while (!stack.empty()) {
        auto [p, e, solved] = stack.back();
        stack.pop_back();
        std::pair<int, bool> key(e.id, p);
        if (_memo.count(key)) continue;

        OperatorKind op = _store.op(e);

        if (solved) {
            Expr res;
            const auto& args = _store.args(e);
            switch (op) {
            case OperatorKind::NOT:
                res = result(args[0], !p);
                break;
            case OperatorKind::AND:
            case OperatorKind::OR: {
                std::vector<Expr> newArgs;
                for (const Expr& a : args) newArgs.push_back(result(a, p));
                // De Morgan
                if ((op == OperatorKind::AND) == p) res = _store.mkAnd(std::move(newArgs));
                else res = _store.mkOr(std::move(newArgs));
                break;
            }
            case OperatorKind::IMPLIES:
                if (p) res = _store.mkOr(result(args[0], false), result(args[1], true));
                else res = _store.mkAnd(result(args[0], true), result(args[1], false));
                break;
            case OperatorKind::IFF: {
                Expr a = args[0], b = args[1];
                if (p) res = _store.mkOr(_store.mkAnd(result(a, true), result(b, true)), 
                                         _store.mkAnd(result(a, false), result(b, false)));
                else res = _store.mkOr(_store.mkAnd(result(a, true), result(b, false)), 
                                       _store.mkAnd(result(a, false), result(b, true)));
                break;
            }
            case OperatorKind::EXISTS:
            case OperatorKind::FORALL: {
                Expr body = result(args[0], p);
                bool exists = (op == OperatorKind::EXISTS) == p;
                const auto vars = _store.variables(e);
                res = exists ? _store.mkExists(vars, body) : _store.mkForall(vars, body);
                break;
            }
            default:
                res = e;
            }
            _memo[key] = res;
            continue;
        }

        switch (op) {
        case OperatorKind::NOT:
            stack.emplace_back(p, e, true);
            stack.emplace_back(!p, _store.arg(e, 0), false);
            break;
        case OperatorKind::AND:
        case OperatorKind::OR:
            stack.emplace_back(p, e, true);
            for (const Expr& a : _store.args(e)) stack.emplace_back(p, a, false);
            break;
        case OperatorKind::IMPLIES:
            stack.emplace_back(p, e, true);
            stack.emplace_back(!p, _store.arg(e, 0), false);
            stack.emplace_back(p, _store.arg(e, 1), false);
            break;
        case OperatorKind::IFF:
            stack.emplace_back(p, e, true);
            for (const Expr& a : _store.args(e)) {
                stack.emplace_back(true, a, false);
                stack.emplace_back(false, a, false);
            }
            break;
        case OperatorKind::EXISTS:
        case OperatorKind::FORALL:
            stack.emplace_back(p, e, true);
            stack.emplace_back(p, _store.arg(e, 0), false);
            break;
        case OperatorKind::BOOL_CONSTANT:
            _memo[key] = p ? e : _store.mkBool(!_store.boolValue(e));
            break;
        default:
            // Atom
            _memo[key] = p ? e : _store.mkNot(e);
        }
    }

    return result(root, true);
}
