
#include <cstdio>
#include <cstdlib>

#include "util/hashmap.h"
#include "util/names.h"
#include "util/log.h"

namespace Names {

    std::string to_string(double number) {
        char buf[32];
        for (int prec = 6; prec <= 17; prec++) {
            snprintf(buf, sizeof(buf), "%.*g", prec, number);
            if (strtod(buf, nullptr) == number) break;
        }
        return std::string(buf);
    }

    static std::string varsToString(const std::vector<const Variable*>& vars) {
        std::string out = "";
        for (size_t i = 0; i < vars.size(); i++) {
            out += (i > 0 ? ", " : "") + vars[i]->name + " - " + vars[i]->type->toString();
        }
        return out;
    }

    static std::string join(const std::vector<std::string>& args, const std::string& sep) {
        std::string out = "";
        for (size_t i = 0; i < args.size(); i++) out += (i > 0 ? sep : "") + args[i];
        return out;
    }

    static std::string render(const ExpressionStore& store, Expr e, const std::vector<std::string>& args) {
        switch (store.op(e)) {
        case OperatorKind::BOOL_CONSTANT: return store.boolValue(e) ? "true" : "false";
        case OperatorKind::INT_CONSTANT: return std::to_string(store.intValue(e));
        case OperatorKind::REAL_CONSTANT: return to_string(store.realValue(e));
        case OperatorKind::OBJECT_EXP: return store.object(e)->name;
        case OperatorKind::PARAM_EXP: return store.parameter(e)->name;
        case OperatorKind::VARIABLE_EXP: return store.variable(e)->name;
        case OperatorKind::FLUENT_EXP: 
            if (args.empty()) return store.fluent(e)->name;
            return store.fluent(e)->name + "(" + join(args, ", ") + ")";
        case OperatorKind::AND: return "(" + join(args, " and ") + ")";
        case OperatorKind::OR: return "(" + join(args, " or ") + ")";
        case OperatorKind::NOT: return "(not " + args[0] + ")";
        case OperatorKind::IMPLIES: return "(" + args[0] + " implies " + args[1] + ")";
        case OperatorKind::IFF: return "(" + args[0] + " iff " + args[1] + ")";
        case OperatorKind::EXISTS: return "(exists (" + varsToString(store.variables(e)) + ") " + args[0] + ")";
        case OperatorKind::FORALL: return "(forall (" + varsToString(store.variables(e)) + ") " + args[0] + ")";
        case OperatorKind::PLUS: return "(" + join(args, " + ") + ")";
        case OperatorKind::MINUS: return "(" + args[0] + " - " + args[1] + ")";
        case OperatorKind::TIMES: return "(" + join(args, " * ") + ")";
        case OperatorKind::DIV: return "(" + args[0] + " / " + args[1] + ")";
        case OperatorKind::LE: return "(" + args[0] + " <= " + args[1] + ")";
        case OperatorKind::LT: return "(" + args[0] + " < " + args[1] + ")";
        case OperatorKind::EQUALS: return "(" + args[0] + " == " + args[1] + ")";
        case OperatorKind::ALWAYS: return "always(" + args[0] + ")";
        case OperatorKind::SOMETIME: return "sometime(" + args[0] + ")";
        case OperatorKind::AT_MOST_ONCE: return "at-most-once(" + args[0] + ")";
        case OperatorKind::SOMETIME_BEFORE: return "sometime-before(" + args[0] + ", " + args[1] + ")";
        case OperatorKind::SOMETIME_AFTER: return "sometime-after(" + args[0] + ", " + args[1] + ")";
        }
        return "?";
    }

    std::string to_string(const ExpressionStore& store, Expr root) {
        if (!root.valid()) return "<none>";
        // Post-order over the DAG with an explicit stack
        FlatHashMap<int, std::string> done;
        std::vector<std::pair<Expr, bool>> stack;
        stack.emplace_back(root, false);
        while (!stack.empty()) {
            auto [e, expanded] = stack.back();
            stack.pop_back();
            if (done.count(e.id)) continue;
            if (!expanded) {
                stack.emplace_back(e, true);
                for (const Expr& arg : store.args(e)) stack.emplace_back(arg, false);
                continue;
            }
            std::vector<std::string> args;
            for (const Expr& arg : store.args(e)) args.push_back(done.at(arg.id));
            done[e.id] = render(store, e, args);
        }
        return done.at(root.id);
    }

    std::string to_string(const ExpressionStore& store, const std::vector<Expr>& exprs) {
        std::vector<std::string> out;
        for (const Expr& e : exprs) out.push_back(to_string(store, e));
        return "[" + join(out, ", ") + "]";
    }

    std::string to_string(const ExpressionStore& store, const Effect& e) {
        std::string out = "";
        if (e.isForall()) out += "forall (" + varsToString(e.forall()) + ") ";
        if (e.isConditional()) out += "if " + to_string(store, e.condition()) + " then ";
        out += to_string(store, e.fluent());
        switch (e.kind()) {
        case EffectKind::ASSIGN: out += " := "; break;
        case EffectKind::INCREASE: out += " += "; break;
        case EffectKind::DECREASE: out += " -= "; break;
        }
        return out + to_string(store, e.value());
    }

    std::string to_string(const ExpressionStore& store, const Action& a) {
        std::string out = a.isDurative() ? "durative-action " : (a.isSensing() ? "sensing-action " : "action ");
        std::vector<std::string> params;
        for (const Parameter* p : a.parameters()) params.push_back(p->name + " - " + p->type->toString());
        out += a.name() + "(" + join(params, ", ") + ") {\n";
        if (!a.isDurative()) {
            out += "    preconditions = [\n";
            for (const Expr& c : a.preconditions()) out += "      " + to_string(store, c) + "\n";
            out += "    ]\n    effects = [\n";
            for (const Effect& e : a.effects()) out += "      " + to_string(store, e) + "\n";
            out += "    ]\n";
            if (a.isSensing()) out += "    observe = " + to_string(store, a.observedFluents()) + "\n";
        } else {
            const DurationInterval& d = a.duration();
            out += "    duration = " + std::string(d.leftOpen ? "(" : "[") + to_string(store, d.lower) 
                + ", " + to_string(store, d.upper) + (d.rightOpen ? ")" : "]") + "\n";
            out += "    conditions = [\n";
            for (const auto& [i, conds] : a.conditions()) {
                out += "      " + i.toString() + ":\n";
                for (const Expr& c : conds) out += "        " + to_string(store, c) + "\n";
            }
            out += "    ]\n    effects = [\n";
            for (const auto& [t, effs] : a.timedEffects()) {
                out += "      " + t.toString() + ":\n";
                for (const Effect& e : effs) out += "        " + to_string(store, e) + "\n";
            }
            out += "    ]\n";
        }
        return out + "  }";
    }

    std::string to_string(const ExpressionStore& store, const Substitution& s) {
        std::string out = "";
        for (const auto& entry : s) {
            out += "[" + to_string(store, entry.first) + "/" + to_string(store, entry.second) + "]";
        }
        return out;
    }

    std::string to_string(const ExpressionStore& store, const ActionInstance& a) {
        std::vector<std::string> args;
        for (const Expr& p : a.params) args.push_back(to_string(store, p));
        if (args.empty()) return a.action->name();
        return a.action->name() + "(" + join(args, ", ") + ")";
    }

    std::string to_string(const ExpressionStore& store, const SequentialPlan& plan) {
        std::string out = "";
        for (size_t i = 0; i < plan.actions.size(); i++) {
            out += std::to_string(i) + " " + to_string(store, plan.actions[i]) + "\n";
        }
        return out;
    }

    std::string to_string(const ProblemKind& k) {
        return k.toString();
    }

    static std::string metricToString(const ExpressionStore& store, const QualityMetric& m) {
        switch (m.kind) {
        case MetricKind::MINIMIZE_ACTION_COSTS: {
            std::vector<std::string> costs;
            for (const auto& [name, cost] : m.costs) costs.push_back(name + ": " + to_string(store, cost));
            if (m.defaultCost.valid()) costs.push_back("default: " + to_string(store, m.defaultCost));
            return "minimize action-costs {" + join(costs, ", ") + "}";
        }
        case MetricKind::MINIMIZE_EXPRESSION_ON_FINAL_STATE: return "minimize " + to_string(store, m.expression);
        case MetricKind::MAXIMIZE_EXPRESSION_ON_FINAL_STATE: return "maximize " + to_string(store, m.expression);
        case MetricKind::MINIMIZE_SEQUENTIAL_PLAN_LENGTH: return "minimize plan-length";
        case MetricKind::MINIMIZE_MAKESPAN: return "minimize makespan";
        case MetricKind::OVERSUBSCRIPTION: {
            std::vector<std::string> gains;
            for (const auto& [goal, gain] : m.gains) gains.push_back(to_string(store, goal) + ": " + to_string(store, gain));
            return "oversubscription {" + join(gains, ", ") + "}";
        }
        }
        return "?";
    }

    std::string to_string(const Problem& p) {
        const ExpressionStore& store = p.exprs();
        std::string out = "problem name = " + p.name() + "\n\n";

        out += "types = [";
        for (size_t i = 0; i < p.userTypes().size(); i++) {
            const Type* t = p.userTypes()[i];
            out += (i > 0 ? ", " : "") + t->name() + (t->father() != nullptr ? " - " + t->father()->name() : "");
        }
        out += "]\n\nfluents = [\n";
        for (const Fluent* f : p.fluents()) {
            std::vector<std::string> sig;
            for (const Parameter* param : f->signature) sig.push_back(param->name + " - " + param->type->toString());
            out += "  " + f->type->toString() + " " + f->name + (sig.empty() ? "" : "(" + join(sig, ", ") + ")");
            Expr def = p.fluentDefault(f);
            if (def.valid()) out += " default = " + to_string(store, def);
            out += "\n";
        }
        out += "]\n\nactions = [\n";
        for (const auto& a : p.actions()) out += "  " + to_string(store, *a) + "\n";
        out += "]\n\nobjects = [\n";
        for (const Type* t : p.userTypes()) {
            std::vector<std::string> names;
            for (const Object* o : p.objects()) if (o->type == t) names.push_back(o->name);
            out += "  " + t->name() + ": [" + join(names, ", ") + "]\n";
        }
        out += "]\n\ninitial values = [\n";
        for (const auto& [fe, value] : p.explicitInitialValues()) {
            out += "  " + to_string(store, fe) + " := " + to_string(store, value) + "\n";
        }
        out += "]\n\ngoals = [\n";
        for (const Expr& g : p.goals()) out += "  " + to_string(store, g) + "\n";
        out += "]\n";

        if (!p.timedGoals().empty()) {
            out += "\ntimed goals = [\n";
            for (const auto& [i, goals] : p.timedGoals()) out += "  " + i.toString() + " " + to_string(store, goals) + "\n";
            out += "]\n";
        }
        if (!p.timedEffects().empty()) {
            out += "\ntimed effects = [\n";
            for (const auto& [t, effs] : p.timedEffects()) {
                for (const Effect& e : effs) out += "  " + t.toString() + " " + to_string(store, e) + "\n";
            }
            out += "]\n";
        }
        if (!p.trajectoryConstraints().empty()) {
            out += "\ntrajectory constraints = [\n";
            for (const Expr& c : p.trajectoryConstraints()) out += "  " + to_string(store, c) + "\n";
            out += "]\n";
        }
        if (!p.stateInvariants().empty()) {
            out += "\nstate invariants = [\n";
            for (const Expr& c : p.stateInvariants()) out += "  " + to_string(store, c) + "\n";
            out += "]\n";
        }
        if (!p.qualityMetrics().empty()) {
            out += "\nquality metrics = [\n";
            for (const auto& m : p.qualityMetrics()) out += "  " + metricToString(store, m) + "\n";
            out += "]\n";
        }
        return out;
    }
}
