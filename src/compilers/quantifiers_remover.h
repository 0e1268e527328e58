#ifndef PLANCOMP_QUANTIFIERS_REMOVER_H
#define PLANCOMP_QUANTIFIERS_REMOVER_H

#include "compilers/compiler.h"

/*
 * Expands every existential and universal quantifier into a disjunction or
 * conjunction over the finite domains of its variables, everywhere in the
 * problem, and every forall effect into one effect per binding.
 */
class QuantifiersRemover : public Compiler {

public:
    QuantifiersRemover() : Compiler("quantifiers_remover", CompilationKind::QUANTIFIERS_REMOVING) {}

    ProblemKind supportedKind() const override {return ProblemKind::all();}
    ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const override;

protected:
    CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) override;
};

#endif
