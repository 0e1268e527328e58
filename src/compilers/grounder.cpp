
#include "compilers/grounder.h"
#include "compilers/compiler_utils.h"
#include "algo/arg_iterator.h"
#include "algo/simplifier.h"
#include "util/log.h"
#include "util/names.h"

ProblemKind Grounder::supportedKind() const {
    return ProblemKind::all()
        .unset("UNBOUNDED_INT_ACTION_PARAMETERS")
        .unset("REAL_ACTION_PARAMETERS");
}

ProblemKind Grounder::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    for (const auto& flag : kind.flags("PARAMETERS")) out.unset(flag);
    return out;
}

CompilerResult Grounder::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;

    ExpressionStore& store = problem.exprs();
    auto newProblem = problem.clone();
    newProblem->setName(_name + "_" + problem.name());
    newProblem->clearActions();
    newProblem->clearQualityMetrics();

    Simplifier simplifier(store, &problem);
    FreshNames names(problem, /*includeActions=*/false);
    GroundingMap groundingMap;
    std::vector<ActionOrigin> origins;

    for (const auto& action : problem.actions()) {
        std::vector<const Type*> types;
        std::vector<Expr> paramExps;
        for (const Parameter* p : action->parameters()) {
            types.push_back(p->type);
            paramExps.push_back(store.mkParam(p));
        }

        std::vector<std::vector<Expr>> bindings;
        if (types.empty()) {
            bindings.emplace_back();
        } else {
            for (const auto& args : ArgIterator(ArgIterator::getDomains(types, problem))) bindings.push_back(args);
        }

        size_t numInstances = 0;
        for (const auto& args : bindings) {
            std::string name = action->name();
            for (const Expr& arg : args) name += "_" + Names::to_string(store, arg);

            Substitution subs(paramExps, args);
            auto instance = instantiateAction(store, *action, name, subs, simplifier);
            if (!instance) {
                Log::d("%s: dropping %s\n", _name.c_str(), name.c_str());
                continue;
            }
            instance->setName(names.get(name));
            origins.push_back(ActionOrigin{instance->name(), action->name(), subs});
            groundingMap[instance.get()] = std::make_pair(std::shared_ptr<const Action>(action), args);
            newProblem->addAction(instance);
            numInstances++;
        }
        Log::d("%s: %s has %i of %i instances\n", _name.c_str(), action->name().c_str(), 
            (int) numInstances, (int) bindings.size());
    }

    copyQualityMetrics(problem, *newProblem, origins);
    return CompilerResult{newProblem, liftActionInstance(std::move(groundingMap)), _name};
}
