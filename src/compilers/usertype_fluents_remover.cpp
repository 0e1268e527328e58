
#include <algorithm>
#include <cctype>

#include "compilers/usertype_fluents_remover.h"
#include "algo/usertype_fluents_walker.h"
#include "algo/arg_iterator.h"
#include "algo/substituter.h"
#include "algo/simplifier.h"
#include "util/log.h"
#include "util/names.h"

ProblemKind UsertypeFluentsRemover::supportedKind() const {
    return ProblemKind::all();
}

ProblemKind UsertypeFluentsRemover::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    if (!kind.has("OBJECT_FLUENTS")) return out;
    out.unset("OBJECT_FLUENTS");
    out.set("CONDITIONAL_EFFECTS");
    out.set("EXISTENTIAL_CONDITIONS");
    out.set("EQUALITIES");
    out.set("NEGATIVE_CONDITIONS");
    return out;
}

namespace {

class EffectConverter {

private:
    const Problem& _problem;
    ExpressionStore& _store;
    UsertypeFluentsWalker& _walker;
    Simplifier _simplifier;

public:
    EffectConverter(const Problem& problem, UsertypeFluentsWalker& walker) : 
        _problem(problem), _store(problem.exprs()), _walker(walker), _simplifier(problem.exprs()) {}

    std::vector<Effect> convert(const Effect& effect) {
        auto target = _walker.remove(effect.fluent());
        auto value = _walker.remove(effect.value());

        Expr newFluent = target.exp;
        Expr newValue = value.exp;
        std::vector<const Variable*> vars = target.freeVars;
        if (target.lastVar != nullptr) {
            vars.push_back(target.lastVar);
            Expr var = _store.mkVariable(target.lastVar);
            if (value.lastVar != nullptr) {
                // f(a) := g(b) becomes f'(a, v) := g'(b, v)
                Substitution s;
                s[_store.mkVariable(value.lastVar)] = var;
                newValue = Substituter::substitute(_store, value.lastFluent, s);
            } else {
                newValue = _store.mkEquals(newValue, var);
            }
            newFluent = target.lastFluent;
        }
        for (const Variable* v : value.freeVars) {
            if (std::find(vars.begin(), vars.end(), v) == vars.end()) vars.push_back(v);
        }
        std::vector<Expr> added = target.fluents;
        added.insert(added.end(), value.fluents.begin(), value.fluents.end());
        Expr condition = _walker.removeFromCondition(effect.condition());
        Expr toAdd = _store.mkAnd(added);

        std::vector<std::vector<Expr>> bindings;
        if (vars.empty()) {
            bindings.emplace_back();
        } else {
            std::vector<const Type*> types;
            for (const Variable* v : vars) types.push_back(v->type);
            for (const auto& objs : ArgIterator(ArgIterator::getDomains(types, _problem))) bindings.push_back(objs);
        }

        std::vector<Effect> out;
        auto emit = [&](Expr fluent, Expr val, Expr cond) {
            if (_store.isFalse(cond)) return;
            Effect e(_store, fluent, val, cond, effect.kind(), effect.forall());
            if (std::find(out.begin(), out.end(), e) == out.end()) out.push_back(e);
        };
        std::vector<Expr> varExps;
        for (const Variable* v : vars) varExps.push_back(_store.mkVariable(v));
        for (const auto& objs : bindings) {
            Substitution subs(varExps, objs);
            Expr fluent = _simplifier.simplify(Substituter::substitute(_store, newFluent, subs));
            Expr val = _simplifier.simplify(Substituter::substitute(_store, newValue, subs));
            Expr guard = Substituter::substitute(_store, toAdd, subs);
            if (!vars.empty() && _store.type(val)->isBool() && !_store.isBoolConstant(val)) {
                emit(fluent, _store.mkTrue(), _simplifier.simplify(_store.mkAnd({condition, guard, val})));
                emit(fluent, _store.mkFalse(), _simplifier.simplify(_store.mkAnd({condition, guard, _store.mkNot(val)})));
            } else {
                emit(fluent, val, _simplifier.simplify(_store.mkAnd(condition, guard)));
            }
        }
        return out;
    }
};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {return std::tolower(c);});
    return s;
}

}

CompilerResult UsertypeFluentsRemover::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;

    Environment& env = problem.env();
    ExpressionStore& store = env.exprs();
    auto newProblem = problem.clone();
    newProblem->setName(_name + "_" + problem.name());
    newProblem->clearFluents();

    FlatHashMap<const Fluent*, const Fluent*> newFluents;
    for (const Fluent* f : problem.fluents()) {
        if (!f->type->isUser()) {
            newProblem->addFluent(f, problem.fluentDefault(f));
            continue;
        }
        std::string base = lowercase(f->type->name());
        std::string paramName = base;
        int count = 0;
        auto nameTaken = [&](const std::string& name) {
            for (const Parameter* p : f->signature) if (p->name == name) return true;
            return false;
        };
        while (nameTaken(paramName)) paramName = base + "_" + std::to_string(count++);
        std::vector<const Parameter*> signature = f->signature;
        signature.push_back(env.parameter(paramName, f->type));
        const Fluent* nf = env.fluent(f->name, env.types().boolType(), signature);
        newFluents[f] = nf;
        newProblem->addFluent(nf);
        Log::d("%s: %s replaced by a boolean fluent of arity %i\n", _name.c_str(), f->name.c_str(), (int) nf->arity());
    }

    UsertypeFluentsWalker walker(env, newFluents);
    EffectConverter converter(problem, walker);
    auto cond = [&](Expr e) {return e.valid() ? walker.removeFromCondition(e) : e;};

    ActionMap actionMap;
    newProblem->clearActions();
    for (const auto& a : problem.actions()) {
        auto na = a->clone();
        na->clearEffects();
        if (!a->isDurative()) {
            std::vector<Expr> pres;
            for (const Expr& c : a->preconditions()) pres.push_back(cond(c));
            na->setPreconditions(pres);
            for (const Effect& e : a->effects()) 
                for (const Effect& ne : converter.convert(e)) na->addEffect(store, ne);
            if (a->isSensing()) {
                // Observing f(args) observes f'(args, o) for every object o
                auto observed = a->observedFluents();
                na = std::make_shared<Action>(na->name(), na->parameters(), SensingBody{InstantaneousBody{na->preconditions(), na->effects()}, {}});
                for (const Expr& fe : observed) {
                    auto it = newFluents.find(store.fluent(fe));
                    if (it == newFluents.end()) {
                        na->addObservedFluent(store, fe);
                        continue;
                    }
                    for (const Object* o : problem.objectsOfType(store.fluent(fe)->type)) {
                        std::vector<Expr> args = store.args(fe);
                        args.push_back(store.mkObject(o));
                        na->addObservedFluent(store, store.mkFluentExp(it->second, args));
                    }
                }
            }
        } else {
            const DurationInterval& d = a->duration();
            na->setDuration(DurationInterval(cond(d.lower), cond(d.upper), d.leftOpen, d.rightOpen));
            na->clearConditions();
            for (const auto& [interval, conds] : a->conditions()) 
                for (const Expr& c : conds) na->addCondition(store, interval, cond(c));
            for (const auto& [timing, effs] : a->timedEffects()) 
                for (const Effect& e : effs) 
                    for (const Effect& ne : converter.convert(e)) na->addEffect(store, timing, ne);
        }
        actionMap[na.get()] = a;
        newProblem->addAction(na);
    }

    newProblem->clearGoals();
    for (const Expr& g : problem.goals()) newProblem->addGoal(cond(g));
    newProblem->clearTimedGoals();
    for (const auto& [interval, goals] : problem.timedGoals()) 
        for (const Expr& g : goals) newProblem->addTimedGoal(interval, cond(g));
    newProblem->clearTimedEffects();
    for (const auto& [timing, effs] : problem.timedEffects()) 
        for (const Effect& e : effs) 
            for (const Effect& ne : converter.convert(e)) newProblem->addTimedEffect(timing, ne);
    newProblem->clearTrajectoryConstraints();
    for (const Expr& c : problem.trajectoryConstraints()) newProblem->addTrajectoryConstraint(cond(c));
    newProblem->clearStateInvariants();
    for (const Expr& c : problem.stateInvariants()) newProblem->addStateInvariant(cond(c));
    newProblem->clearQualityMetrics();
    for (QualityMetric m : problem.qualityMetrics()) {
        for (auto& [name, cost] : m.costs) cost = cond(cost);
        m.defaultCost = cond(m.defaultCost);
        m.expression = cond(m.expression);
        for (auto& [goal, gain] : m.gains) goal = cond(goal);
        newProblem->addQualityMetric(m);
    }

    // f(args) = v becomes f'(args, o) = (o == v) for every object o
    newProblem->clearInitialValues();
    for (const auto& [fe, value] : problem.explicitInitialValues()) {
        if (!newFluents.count(store.fluent(fe))) newProblem->setInitialValue(fe, value);
    }
    for (const Fluent* f : problem.fluents()) {
        auto it = newFluents.find(f);
        if (it == newFluents.end()) continue;
        const Fluent* nf = it->second;
        std::vector<std::vector<Expr>> bindings;
        if (f->signature.empty()) {
            bindings.emplace_back();
        } else {
            std::vector<const Type*> types;
            for (const Parameter* p : f->signature) types.push_back(p->type);
            for (const auto& args : ArgIterator(ArgIterator::getDomains(types, problem))) bindings.push_back(args);
        }
        for (const auto& args : bindings) {
            Expr value = problem.initialValue(store.mkFluentExp(f, args));
            if (!value.valid()) continue;
            for (const Object* o : problem.objectsOfType(f->type)) {
                std::vector<Expr> newArgs = args;
                newArgs.push_back(store.mkObject(o));
                newProblem->setInitialValue(store.mkFluentExp(nf, newArgs), store.mkBool(store.object(value) == o));
            }
        }
    }

    Log::v("%s: %i fluents replaced\n", _name.c_str(), (int) newFluents.size());
    return CompilerResult{newProblem, replaceAction(std::move(actionMap)), _name};
}
