#ifndef PLANCOMP_BOUNDED_TYPES_REMOVER_H
#define PLANCOMP_BOUNDED_TYPES_REMOVER_H

#include "compilers/compiler.h"

/*
 * Retypes every fluent of a bounded numeric type to the unbounded type of
 * the same kind and makes the bounds of all its ground instances an
 * invariant: it is conjoined to every precondition, to every durative
 * condition (also at each effect timing), to the goals and to the timed
 * goals (also at each timed effect). Actions whose condition becomes false
 * are dropped.
 */
class BoundedTypesRemover : public Compiler {

public:
    BoundedTypesRemover() : Compiler("bounded_types_remover", CompilationKind::BOUNDED_TYPES_REMOVING) {}

    ProblemKind supportedKind() const override;
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

protected:
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
