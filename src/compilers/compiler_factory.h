#ifndef PLANCOMP_COMPILER_FACTORY_H
#define PLANCOMP_COMPILER_FACTORY_H

#include <string>
#include <vector>
#include <memory>

#include "compilers/compiler.h"
#include "compilers/compilers_pipeline.h"

class CompilerFactory {

public:
    static std::shared_ptr<Compiler> get(CompilationKind kind);

    // Short name (gr, qr, ncr, dcr, btr, tcr, ufr, cer), kind name
    // (GROUNDING, ...) or compiler name (grounder, ...)
    static CompilationKind parseKind(const std::string& name);
    // Comma-separated list of names
    static std::vector<CompilationKind> parseKinds(const std::string& list);
    static const char* shortName(CompilationKind kind);

    // Compilation kinds that remove every feature of the kind that some
    // compiler removes, in an order where no step re-introduces a feature
    // removed before
    static std::vector<CompilationKind> defaultKinds(const ProblemKind& kind);

    static std::shared_ptr<CompilersPipeline> pipeline(const std::vector<CompilationKind>& kinds);
};

#endif
