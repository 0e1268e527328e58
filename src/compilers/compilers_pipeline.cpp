
#include "compilers/compilers_pipeline.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/timer.h"

CompilersPipeline::CompilersPipeline(const std::vector<std::shared_ptr<Compiler>>& steps) : 
        Compiler("compilers_pipeline", steps.empty() ? CompilationKind::GROUNDING : steps.front()->compilationKind()), 
        _steps(steps) {
    if (_steps.empty()) throw UsageError("A compilers pipeline needs at least one compiler");
    for (const auto& step : _steps) _name += "_" + step->name();
}

ProblemKind CompilersPipeline::supportedKind() const {
    return _steps.front()->supportedKind();
}

bool CompilersPipeline::supportsCompilation(CompilationKind kind) const {
    for (const auto& step : _steps) if (step->supportsCompilation(kind)) return true;
    return false;
}

ProblemKind CompilersPipeline::resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const {
    (void) compilationKind;
    ProblemKind out = kind;
    for (const auto& step : _steps) out = step->resultingProblemKind(out, step->compilationKind());
    return out;
}

std::vector<CompilerResult> CompilersPipeline::compileSteps(const Problem& problem) {
    std::vector<CompilerResult> results;
    for (const auto& step : _steps) step->checkUserInput(problem);
    const Problem* current = &problem;
    for (const auto& step : _steps) {
        results.push_back(step->run(*current, step->compilationKind(), /*userInput=*/false));
        current = results.back().problem.get();
    }
    return results;
}

CompilerResult CompilersPipeline::doCompile(const Problem& problem, CompilationKind compilationKind) {
    (void) compilationKind;
    float time = Timer::elapsedSeconds();
    std::vector<CompilerResult> results = compileSteps(problem);

    // Last step first
    BackMap backMap = results.back().backMap;
    for (size_t i = results.size()-1; i > 0; i--) backMap = composeBackMaps(backMap, results[i-1].backMap);

    Log::i("%s: %i steps (%.4fs)\n", _name.c_str(), (int) results.size(), Timer::elapsedSeconds() - time);
    return CompilerResult{results.back().problem, backMap, _name};
}
