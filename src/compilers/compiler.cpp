
#include "compilers/compiler.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/timer.h"

const char* toString(CompilationKind kind) {
    switch (kind) {
    case CompilationKind::GROUNDING: return "GROUNDING";
    case CompilationKind::QUANTIFIERS_REMOVING: return "QUANTIFIERS_REMOVING";
    case CompilationKind::NEGATIVE_CONDITIONS_REMOVING: return "NEGATIVE_CONDITIONS_REMOVING";
    case CompilationKind::DISJUNCTIVE_CONDITIONS_REMOVING: return "DISJUNCTIVE_CONDITIONS_REMOVING";
    case CompilationKind::BOUNDED_TYPES_REMOVING: return "BOUNDED_TYPES_REMOVING";
    case CompilationKind::TRAJECTORY_CONSTRAINTS_REMOVING: return "TRAJECTORY_CONSTRAINTS_REMOVING";
    case CompilationKind::USERTYPE_FLUENTS_REMOVING: return "USERTYPE_FLUENTS_REMOVING";
    case CompilationKind::CONDITIONAL_EFFECTS_REMOVING: return "CONDITIONAL_EFFECTS_REMOVING";
    }
    return "?";
}

CompilerResult Compiler::run(const Problem& problem, CompilationKind compilationKind, bool userInput) {
    if (!supportsCompilation(compilationKind)) 
        throw UsageError(_name + " does not support compilation kind " + toString(compilationKind));
    
    ProblemKind kind = problem.kind();
    if (!supports(kind)) {
        std::string unsupported = "";
        ProblemKind supported = supportedKind();
        for (const auto& flag : kind.flags()) if (!supported.has(flag)) unsupported += " " + flag;
        throw UsageError(_name + " cannot handle problem " + problem.name() + "; unsupported features:" + unsupported);
    }

    if (userInput) checkUserInput(problem);

    float time = Timer::elapsedSeconds();
    Log::v("%s: compiling %s (%s)\n", _name.c_str(), problem.name().c_str(), toString(compilationKind));
    CompilerResult result = doCompile(problem, compilationKind);
    Log::v("%s: %i actions, %i fluents after compilation (%.4fs)\n", _name.c_str(), 
        (int) result.problem->actions().size(), (int) result.problem->fluents().size(), 
        Timer::elapsedSeconds() - time);
    return result;
}

BackMap replaceAction(ActionMap&& map) {
    auto table = std::make_shared<ActionMap>(std::move(map));
    return [table](const ActionInstance& instance) -> std::optional<ActionInstance> {
        auto it = table->find(instance.action.get());
        if (it == table->end()) 
            throw UsageError("Action " + instance.action->name() + " has no counterpart in the original problem");
        if (!it->second) return std::nullopt;
        return ActionInstance(it->second, instance.params);
    };
}

BackMap liftActionInstance(GroundingMap&& map) {
    auto table = std::make_shared<GroundingMap>(std::move(map));
    return [table](const ActionInstance& instance) -> std::optional<ActionInstance> {
        auto it = table->find(instance.action.get());
        if (it == table->end()) 
            throw UsageError("Action " + instance.action->name() + " has no counterpart in the original problem");
        if (!it->second.first) return std::nullopt;
        return ActionInstance(it->second.first, it->second.second);
    };
}

BackMap composeBackMaps(BackMap first, BackMap second) {
    return [first, second](const ActionInstance& instance) -> std::optional<ActionInstance> {
        auto mid = first(instance);
        if (!mid.has_value()) return std::nullopt;
        return second(*mid);
    };
}
