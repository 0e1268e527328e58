#ifndef PLANCOMP_COMPILERS_PIPELINE_H
#define PLANCOMP_COMPILERS_PIPELINE_H

#include <vector>
#include <memory>

#include "compilers/compiler.h"

/*
 * Applies a list of compilers in order, each to the result of the
 * previous one. The back-map of the pipeline maps a plan of the last
 * problem back through all steps. Supports what its first step supports.
 */
class CompilersPipeline : public Compiler {

private:
    std::vector<std::shared_ptr<Compiler>> _steps;

public:
    explicit CompilersPipeline(const std::vector<std::shared_ptr<Compiler>>& steps);

    const std::vector<std::shared_ptr<Compiler>>& steps() const {return _steps;}

    ProblemKind supportedKind() const override;
    bool supportsCompilation(CompilationKind kind) const override;
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

    // Every intermediate result, first step first. The user-input checks of
    // all steps apply to the given problem only.
    std::vector<CompilerResult> compileSteps(const Problem& problem);

protected:
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
