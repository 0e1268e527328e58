#ifndef PLANCOMP_NEGATIVE_CONDITIONS_REMOVER_H
#define PLANCOMP_NEGATIVE_CONDITIONS_REMOVER_H

#include "compilers/compiler.h"

/*
 * Replaces each negated boolean fluent "not f(args)" in a condition by
 * "not_f(args)", where not_f is a new fluent kept complementary to f: it
 * starts with the negated initial values and every effect on f also
 * writes the negated value to not_f. Negated comparisons are flipped.
 * Conditions must be in negation normal form; a negation over anything
 * else, implications and equivalences are definition errors. So is a
 * conditional effect on a negated fluent: conditional effects have to be
 * removed first.
 */
class NegativeConditionsRemover : public Compiler {

public:
    NegativeConditionsRemover() : Compiler("negative_conditions_remover", CompilationKind::NEGATIVE_CONDITIONS_REMOVING) {}

    ProblemKind supportedKind() const override;
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

protected:
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
