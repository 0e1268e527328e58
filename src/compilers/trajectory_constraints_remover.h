#ifndef PLANCOMP_TRAJECTORY_CONSTRAINTS_REMOVER_H
#define PLANCOMP_TRAJECTORY_CONSTRAINTS_REMOVER_H

#include "compilers/compiler.h"

/*
 * Compiles trajectory constraints (always, sometime, at-most-once,
 * sometime-before, sometime-after) and state invariants into the actions
 * of the grounded problem. Each constraint but always gets a boolean
 * monitor fluent. Every action writing a fluent of a constraint gets
 * preconditions and conditional effects derived from the regression of
 * the constraint's formulas through its effects; the monitors of sometime
 * and sometime-after constraints become goals.
 */
class TrajectoryConstraintsRemover : public Compiler {

public:
    TrajectoryConstraintsRemover() : Compiler("trajectory_constraints_remover", CompilationKind::TRAJECTORY_CONSTRAINTS_REMOVING) {}

    ProblemKind supportedKind() const override;
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

protected:
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
