
#include <algorithm>

#include "compilers/trajectory_constraints_remover.h"
#include "compilers/compiler_utils.h"
#include "compilers/grounder.h"
#include "algo/quantifier_expander.h"
#include "algo/regressor.h"
#include "algo/state_evaluator.h"
#include "algo/extractors.h"
#include "algo/nnf.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"

ProblemKind TrajectoryConstraintsRemover::supportedKind() const {
    return ProblemKind::all()
        .unset("CONTINUOUS_TIME")
        .unset("INTERMEDIATE_CONDITIONS_AND_EFFECTS")
        .unset("EXTERNAL_CONDITIONS_AND_EFFECTS")
        .unset("TIMED_EFFECTS")
        .unset("TIMED_GOALS")
        .unset("DURATION_INEQUALITIES")
        .unset("UNBOUNDED_INT_ACTION_PARAMETERS")
        .unset("REAL_ACTION_PARAMETERS")
        .unset("SENSING_ACTIONS");
}

ProblemKind TrajectoryConstraintsRemover::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    for (const auto& flag : kind.flags("PARAMETERS")) out.unset(flag);
    if (!kind.has("TRAJECTORY_CONSTRAINTS") && !kind.has("STATE_INVARIANTS")) return out;
    out.unset("TRAJECTORY_CONSTRAINTS");
    out.unset("STATE_INVARIANTS");
    out.set("NEGATIVE_CONDITIONS");
    out.set("DISJUNCTIVE_CONDITIONS");
    out.set("CONDITIONAL_EFFECTS");
    return out;
}

namespace {

// A constraint with its formulas in negation normal form and its monitor
struct Constraint {
    OperatorKind kind;
    Expr phi;
    Expr psi;
    Expr monitor;
};

}

CompilerResult TrajectoryConstraintsRemover::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;

    Environment& env = problem.env();
    ExpressionStore& store = env.exprs();

    // Ground first if needed
    std::shared_ptr<const Problem> grounded;
    BackMap groundingMap;
    bool lifted = std::any_of(problem.actions().begin(), problem.actions().end(), 
        [](const std::shared_ptr<Action>& a) {return !a->parameters().empty();});
    if (lifted) {
        Grounder grounder;
        auto result = grounder.compile(problem);
        grounded = result.problem;
        groundingMap = result.backMap;
    } else {
        grounded = problem.clone();
    }

    // Collect and classify the constraints
    QuantifierExpander expander(store, *grounded);
    Nnf nnf(store);
    Simplifier simplifier(store);
    auto normalize = [&](Expr e) {return simplifier.simplify(nnf.get(expander.expand(e)));};
    std::vector<Constraint> constraints;
    auto addConstraint = [&](Expr c) {
        OperatorKind op = store.op(c);
        Constraint constraint{op, normalize(store.arg(c, 0)), Expr(), Expr()};
        if (op == OperatorKind::SOMETIME_BEFORE || op == OperatorKind::SOMETIME_AFTER) 
            constraint.psi = normalize(store.arg(c, 1));
        constraints.push_back(constraint);
    };
    for (const Expr& c : grounded->trajectoryConstraints()) {
        if (store.isAnd(c)) for (const Expr& arg : store.args(c)) addConstraint(arg);
        else addConstraint(c);
    }
    for (const Expr& inv : grounded->stateInvariants()) addConstraint(store.mkAlways(inv));

    auto newProblem = grounded->clone();
    newProblem->setName(_name + "_" + problem.name());
    newProblem->clearTrajectoryConstraints();
    newProblem->clearStateInvariants();
    newProblem->clearActions();

    // Check the initial state and allocate monitors
    State init(*grounded);
    StateEvaluator evaluator(store, *grounded);
    FreshNames names(*grounded);
    int numMonitors = 0;
    for (Constraint& c : constraints) {
        bool phi = evaluator.holds(c.phi, init);
        if (c.kind == OperatorKind::ALWAYS) {
            if (!phi) throw ProblemDefinitionError("Constraint always(" + Names::to_string(store, c.phi) 
                + ") is violated in the initial state");
            continue;
        }
        std::string base;
        bool initial = false;
        switch (c.kind) {
        case OperatorKind::SOMETIME:
            base = "hold";
            initial = phi;
            break;
        case OperatorKind::SOMETIME_AFTER:
            base = "hold";
            initial = evaluator.holds(c.psi, init) || !phi;
            break;
        case OperatorKind::SOMETIME_BEFORE:
            if (phi) throw ProblemDefinitionError("Constraint sometime-before(" + Names::to_string(store, c.phi) 
                + ", " + Names::to_string(store, c.psi) + ") is violated in the initial state");
            base = "seen-psi";
            initial = evaluator.holds(c.psi, init);
            break;
        case OperatorKind::AT_MOST_ONCE:
            base = "seen-phi";
            initial = phi;
            break;
        default:
            throw UnsupportedConstructError(std::string("Trajectory constraint operator ") + toString(c.kind));
        }
        const Fluent* m = env.fluent(names.get(base + "-" + std::to_string(numMonitors++)), env.types().boolType());
        c.monitor = store.mkFluentExp(m);
        newProblem->addFluent(m, store.mkFalse());
        newProblem->setInitialValue(c.monitor, store.mkBool(initial));
        Log::d("%s: monitor %s, initially %s\n", _name.c_str(), m->name.c_str(), initial ? "true" : "false");
    }

    // Index the constraints by the fluent expressions they mention
    FluentsExtractor fluents(store);
    NodeHashMap<Expr, std::vector<size_t>, ExprHasher> relevance;
    for (size_t i = 0; i < constraints.size(); i++) {
        std::vector<Expr> atoms = fluents.get(constraints[i].phi);
        if (constraints[i].psi.valid()) {
            auto psiAtoms = fluents.get(constraints[i].psi);
            atoms.insert(atoms.end(), psiAtoms.begin(), psiAtoms.end());
        }
        for (const Expr& atom : atoms) {
            auto& indices = relevance[atom];
            if (indices.empty() || indices.back() != i) indices.push_back(i);
        }
    }

    ActionMap actionMap;
    for (size_t idx = 0; idx < grounded->actions().size(); idx++) {
        const auto& a = grounded->actions()[idx];
        std::vector<size_t> relevant;
        for (const Effect& e : a->effects()) {
            auto it = relevance.find(e.fluent());
            if (it == relevance.end()) continue;
            for (size_t i : it->second) {
                if (std::find(relevant.begin(), relevant.end(), i) == relevant.end()) relevant.push_back(i);
            }
        }
        std::sort(relevant.begin(), relevant.end());

        auto na = a->clone();
        Regressor regressor(store, a->effects());
        std::vector<Expr> preconditions = a->preconditions();
        std::vector<Effect> effects;
        auto setMonitor = [&](Expr m, bool value, Expr cond) {
            cond = simplifier.simplify(cond);
            if (!store.isFalse(cond)) effects.emplace_back(store, m, store.mkBool(value), cond);
        };
        for (size_t i : relevant) {
            const Constraint& c = constraints[i];
            Expr rPhi = regressor.regress(c.phi);
            Expr rPsi = c.psi.valid() ? regressor.regress(c.psi) : Expr();
            switch (c.kind) {
            case OperatorKind::ALWAYS:
                if (rPhi != c.phi) preconditions.push_back(rPhi);
                break;
            case OperatorKind::AT_MOST_ONCE:
                if (rPhi == c.phi) break;
                preconditions.push_back(store.mkOr({store.mkNot(rPhi), store.mkNot(c.monitor), c.phi}));
                setMonitor(c.monitor, true, rPhi);
                break;
            case OperatorKind::SOMETIME_BEFORE:
                if (rPhi != c.phi) preconditions.push_back(store.mkOr(store.mkNot(rPhi), c.monitor));
                if (rPsi != c.psi) setMonitor(c.monitor, true, rPsi);
                break;
            case OperatorKind::SOMETIME:
                if (rPhi != c.phi) setMonitor(c.monitor, true, rPhi);
                break;
            case OperatorKind::SOMETIME_AFTER:
                if (rPhi != c.phi || rPsi != c.psi) setMonitor(c.monitor, false, store.mkAnd(rPhi, store.mkNot(rPsi)));
                if (rPsi != c.psi) setMonitor(c.monitor, true, rPsi);
                break;
            default:
                break;
            }
        }
        na->setPreconditions(preconditions);
        if (!simplifyConditions(*na, simplifier)) {
            Log::d("%s: dropping %s, it violates a constraint\n", _name.c_str(), a->name().c_str());
            continue;
        }
        for (const Effect& e : effects) na->addEffect(store, e);
        // Without grounding, map back to the input's own actions
        actionMap[na.get()] = lifted ? a : problem.actions()[idx];
        newProblem->addAction(na);
    }

    for (const Constraint& c : constraints) {
        if (c.kind == OperatorKind::SOMETIME || c.kind == OperatorKind::SOMETIME_AFTER) newProblem->addGoal(c.monitor);
    }

    Log::v("%s: %i constraints, %i monitors\n", _name.c_str(), (int) constraints.size(), numMonitors);
    BackMap backMap = replaceAction(std::move(actionMap));
    if (lifted) backMap = composeBackMaps(backMap, groundingMap);
    return CompilerResult{newProblem, backMap, _name};
}
