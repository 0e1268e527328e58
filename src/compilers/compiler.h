#ifndef PLANCOMP_COMPILER_H
#define PLANCOMP_COMPILER_H

#include <string>
#include <memory>

#include "data/problem.h"
#include "plan/plan.h"
#include "util/hashmap.h"

enum class CompilationKind {
    GROUNDING,
    QUANTIFIERS_REMOVING,
    NEGATIVE_CONDITIONS_REMOVING,
    DISJUNCTIVE_CONDITIONS_REMOVING,
    BOUNDED_TYPES_REMOVING,
    TRAJECTORY_CONSTRAINTS_REMOVING,
    USERTYPE_FLUENTS_REMOVING,
    CONDITIONAL_EFFECTS_REMOVING
};

const char* toString(CompilationKind kind);

struct CompilerResult {
    std::shared_ptr<const Problem> problem;
    // Maps plans of the compiled problem to plans of the input problem
    BackMap backMap;
    std::string compilerName;
};

/*
 * A semantics-preserving rewrite of a problem into one without some feature.
 * compile() never modifies its input; it checks that the problem's kind and
 * the requested compilation kind are supported and raises UsageError if not.
 */
class Compiler {

protected:
    std::string _name;
    CompilationKind _compilation_kind;

public:
    Compiler(const std::string& name, CompilationKind compilationKind) : 
        _name(name), _compilation_kind(compilationKind) {}
    virtual ~Compiler() = default;

    const std::string& name() const {return _name;}
    CompilationKind compilationKind() const {return _compilation_kind;}

    virtual ProblemKind supportedKind() const = 0;
    bool supports(const ProblemKind& kind) const {return kind.isSubsetOf(supportedKind());}
    virtual bool supportsCompilation(CompilationKind kind) const {return kind == _compilation_kind;}
    virtual ProblemKind resultingProblemKind(const ProblemKind& kind, CompilationKind compilationKind) const = 0;

    CompilerResult compile(const Problem& problem, CompilationKind compilationKind) {
        return run(problem, compilationKind, /*userInput=*/true);
    }
    CompilerResult compile(const Problem& problem) {return compile(problem, _compilation_kind);}

protected:
    // Checks for problems written by the user only, skipped on the output
    // of an earlier step of a pipeline
    virtual void checkUserInput(const Problem& problem) const {(void) problem;}
    virtual CompilerResult doCompile(const Problem& problem, CompilationKind compilationKind) = 0;

private:
    CompilerResult run(const Problem& problem, CompilationKind compilationKind, bool userInput);

    friend class CompilersPipeline;
};

// Compiled action -> the input action it was created from (null if the
// compiler introduced it)
typedef NodeHashMap<const Action*, std::shared_ptr<const Action>> ActionMap;
// Compiled action -> input action and the constants bound to its parameters
typedef NodeHashMap<const Action*, std::pair<std::shared_ptr<const Action>, std::vector<Expr>>> GroundingMap;

// Back-map keeping the actual parameters of each instance
BackMap replaceAction(ActionMap&& map);
// Back-map replacing each ground instance by the lifted action and its binding
BackMap liftActionInstance(GroundingMap&& map);
// Applies first, then second
BackMap composeBackMaps(BackMap first, BackMap second);

#endif
