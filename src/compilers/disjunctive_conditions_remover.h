#ifndef PLANCOMP_DISJUNCTIVE_CONDITIONS_REMOVER_H
#define PLANCOMP_DISJUNCTIVE_CONDITIONS_REMOVER_H

#include "compilers/compiler.h"

/*
 * Splits every action into one sibling per disjunct of the DNF of its
 * precondition. The first sibling keeps the action's name, the others are
 * named <name>__<N>__. A durative action gets one sibling per combination
 * of disjuncts of its intervals. Assignments whose guard is disjunctive
 * become one effect per disjunct. A disjunctive goal is replaced by a new
 * fluent that one auxiliary action per disjunct makes true; these actions
 * map back to nothing.
 */
class DisjunctiveConditionsRemover : public Compiler {

public:
    DisjunctiveConditionsRemover() : Compiler("disjunctive_conditions_remover", CompilationKind::DISJUNCTIVE_CONDITIONS_REMOVING) {}

    ProblemKind supportedKind() const override;
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

protected:
    // Rejects names with the suffix reserved for generated names
    void checkUserInput(const Problem& problem) const override;
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
