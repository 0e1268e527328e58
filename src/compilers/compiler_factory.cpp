
#include "compilers/compiler_factory.h"
#include "compilers/grounder.h"
#include "compilers/quantifiers_remover.h"
#include "compilers/negative_conditions_remover.h"
#include "compilers/disjunctive_conditions_remover.h"
#include "compilers/bounded_types_remover.h"
#include "compilers/trajectory_constraints_remover.h"
#include "compilers/usertype_fluents_remover.h"
#include "compilers/conditional_effects_remover.h"
#include "util/errors.h"

namespace {

const std::vector<CompilationKind> ALL_KINDS = {
    CompilationKind::GROUNDING,
    CompilationKind::QUANTIFIERS_REMOVING,
    CompilationKind::NEGATIVE_CONDITIONS_REMOVING,
    CompilationKind::DISJUNCTIVE_CONDITIONS_REMOVING,
    CompilationKind::BOUNDED_TYPES_REMOVING,
    CompilationKind::TRAJECTORY_CONSTRAINTS_REMOVING,
    CompilationKind::USERTYPE_FLUENTS_REMOVING,
    CompilationKind::CONDITIONAL_EFFECTS_REMOVING
};

}

std::shared_ptr<Compiler> CompilerFactory::get(CompilationKind kind) {
    switch (kind) {
    case CompilationKind::GROUNDING: return std::make_shared<Grounder>();
    case CompilationKind::QUANTIFIERS_REMOVING: return std::make_shared<QuantifiersRemover>();
    case CompilationKind::NEGATIVE_CONDITIONS_REMOVING: return std::make_shared<NegativeConditionsRemover>();
    case CompilationKind::DISJUNCTIVE_CONDITIONS_REMOVING: return std::make_shared<DisjunctiveConditionsRemover>();
    case CompilationKind::BOUNDED_TYPES_REMOVING: return std::make_shared<BoundedTypesRemover>();
    case CompilationKind::TRAJECTORY_CONSTRAINTS_REMOVING: return std::make_shared<TrajectoryConstraintsRemover>();
    case CompilationKind::USERTYPE_FLUENTS_REMOVING: return std::make_shared<UsertypeFluentsRemover>();
    case CompilationKind::CONDITIONAL_EFFECTS_REMOVING: return std::make_shared<ConditionalEffectsRemover>();
    }
    throw UsageError("Unknown compilation kind");
}

const char* CompilerFactory::shortName(CompilationKind kind) {
    switch (kind) {
    case CompilationKind::GROUNDING: return "gr";
    case CompilationKind::QUANTIFIERS_REMOVING: return "qr";
    case CompilationKind::NEGATIVE_CONDITIONS_REMOVING: return "ncr";
    case CompilationKind::DISJUNCTIVE_CONDITIONS_REMOVING: return "dcr";
    case CompilationKind::BOUNDED_TYPES_REMOVING: return "btr";
    case CompilationKind::TRAJECTORY_CONSTRAINTS_REMOVING: return "tcr";
    case CompilationKind::USERTYPE_FLUENTS_REMOVING: return "ufr";
    case CompilationKind::CONDITIONAL_EFFECTS_REMOVING: return "cer";
    }
    return "?";
}

CompilationKind CompilerFactory::parseKind(const std::string& name) {
    for (CompilationKind kind : ALL_KINDS) {
        if (name == shortName(kind) || name == toString(kind) || name == get(kind)->name()) return kind;
    }
    throw UsageError("Unknown compilation kind \"" + name + "\"");
}

std::vector<CompilationKind> CompilerFactory::parseKinds(const std::string& list) {
    std::vector<CompilationKind> kinds;
    size_t start = 0;
    while (start <= list.size()) {
        size_t end = list.find(',', start);
        if (end == std::string::npos) end = list.size();
        std::string name = list.substr(start, end-start);
        if (!name.empty()) kinds.push_back(parseKind(name));
        start = end+1;
    }
    if (kinds.empty()) throw UsageError("No compilation kind given");
    return kinds;
}

std::vector<CompilationKind> CompilerFactory::defaultKinds(const ProblemKind& kind) {
    // Each step is taken if the kind projected through the previous steps needs it
    const std::vector<std::pair<CompilationKind, std::vector<std::string>>> order = {
        {CompilationKind::USERTYPE_FLUENTS_REMOVING, {"OBJECT_FLUENTS"}},
        {CompilationKind::GROUNDING, {"BOOL_ACTION_PARAMETERS", "BOUNDED_INT_ACTION_PARAMETERS"}},
        {CompilationKind::QUANTIFIERS_REMOVING, {"EXISTENTIAL_CONDITIONS", "UNIVERSAL_CONDITIONS", "FORALL_EFFECTS"}},
        {CompilationKind::BOUNDED_TYPES_REMOVING, {"BOUNDED_TYPES"}},
        {CompilationKind::TRAJECTORY_CONSTRAINTS_REMOVING, {"TRAJECTORY_CONSTRAINTS", "STATE_INVARIANTS"}},
        {CompilationKind::CONDITIONAL_EFFECTS_REMOVING, {"CONDITIONAL_EFFECTS"}},
        {CompilationKind::DISJUNCTIVE_CONDITIONS_REMOVING, {"DISJUNCTIVE_CONDITIONS"}},
        {CompilationKind::NEGATIVE_CONDITIONS_REMOVING, {"NEGATIVE_CONDITIONS"}}
    };
    std::vector<CompilationKind> kinds;
    ProblemKind current = kind;
    for (const auto& [ck, flags] : order) {
        bool needed = false;
        for (const auto& flag : flags) needed = needed || current.has(flag);
        if (!needed) continue;
        kinds.push_back(ck);
        current = get(ck)->resultingProblemKind(current, ck);
    }
    return kinds;
}

std::shared_ptr<CompilersPipeline> CompilerFactory::pipeline(const std::vector<CompilationKind>& kinds) {
    std::vector<std::shared_ptr<Compiler>> steps;
    for (CompilationKind kind : kinds) steps.push_back(get(kind));
    return std::make_shared<CompilersPipeline>(steps);
}
