#ifndef PLANCOMP_CONDITIONAL_EFFECTS_REMOVER_H
#define PLANCOMP_CONDITIONAL_EFFECTS_REMOVER_H

#include "compilers/compiler.h"

/*
 * Replaces an action with conditional effects by one variant per truth
 * assignment to the effect guards: the guard (or its negation) becomes a
 * precondition, or a condition at the effect's timing, and the effects
 * whose guard is assigned true become unconditional. Variants with
 * conflicting effects, without effects or with a false precondition are
 * dropped. A conditional timed effect of the problem on a boolean fluent
 * is rewritten into an unconditional one; on other fluents it cannot be
 * removed.
 */
class ConditionalEffectsRemover : public Compiler {

public:
    ConditionalEffectsRemover() : Compiler("conditional_effects_remover", CompilationKind::CONDITIONAL_EFFECTS_REMOVING) {}

    ProblemKind supportedKind() const override;
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

protected:
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
