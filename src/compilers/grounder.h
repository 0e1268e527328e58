#ifndef PLANCOMP_GROUNDER_H
#define PLANCOMP_GROUNDER_H

#include "compilers/compiler.h"

/*
 * Replaces every action by one parameterless action per binding of its
 * parameters to their finite domains. Instances whose precondition
 * simplifies to false (using static fluents) or whose effects conflict
 * are dropped. Instance names are <action>_<arg1>_<arg2>..., made fresh.
 */
class Grounder : public Compiler {

public:
    Grounder() : Compiler("grounder", CompilationKind::GROUNDING) {}

    ProblemKind supportedKind() const override;
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

protected:
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
