#ifndef PLANCOMP_USERTYPE_FLUENTS_REMOVER_H
#define PLANCOMP_USERTYPE_FLUENTS_REMOVER_H

#include "compilers/compiler.h"

/*
 * Replaces every fluent f whose value is an object by a boolean fluent f'
 * with one more parameter of f's type: f'(args, o) holds iff f(args) = o.
 * Conditions are rewritten by UsertypeFluentsWalker; effects are
 * instantiated over the objects of the variables introduced for removed
 * fluents and become guarded boolean assignments.
 */
class UsertypeFluentsRemover : public Compiler {

public:
    UsertypeFluentsRemover() : Compiler("usertype_fluents_remover", CompilationKind::USERTYPE_FLUENTS_REMOVING) {}

    ProblemKind supportedKind() const override;
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

protected:
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
