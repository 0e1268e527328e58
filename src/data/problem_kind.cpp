
#include "data/problem_kind.h"
#include "util/hashmap.h"
#include "util/errors.h"

const std::vector<ProblemKind::Family>& ProblemKind::families() {
    static const std::vector<Family> FAMILIES = {
        {"PROBLEM_CLASS", {"ACTION_BASED"}},
        {"PROBLEM_TYPE", {"SIMPLE_NUMERIC_PLANNING", "GENERAL_NUMERIC_PLANNING"}},
        {"TIME", {"CONTINUOUS_TIME", "DISCRETE_TIME", "INTERMEDIATE_CONDITIONS_AND_EFFECTS", 
            "EXTERNAL_CONDITIONS_AND_EFFECTS", "TIMED_EFFECTS", "TIMED_GOALS", "DURATION_INEQUALITIES"}},
        {"EXPRESSION_DURATION", {"STATIC_FLUENTS_IN_DURATIONS", "FLUENTS_IN_DURATIONS"}},
        {"NUMBERS", {"CONTINUOUS_NUMBERS", "DISCRETE_NUMBERS", "BOUNDED_TYPES"}},
        {"CONDITIONS_KIND", {"NEGATIVE_CONDITIONS", "DISJUNCTIVE_CONDITIONS", "EQUALITIES", 
            "EXISTENTIAL_CONDITIONS", "UNIVERSAL_CONDITIONS"}},
        {"EFFECTS_KIND", {"CONDITIONAL_EFFECTS", "INCREASE_EFFECTS", "DECREASE_EFFECTS", 
            "STATIC_FLUENTS_IN_NUMERIC_ASSIGNMENTS", "FLUENTS_IN_NUMERIC_ASSIGNMENTS", "FORALL_EFFECTS"}},
        {"TYPING", {"FLAT_TYPING", "HIERARCHICAL_TYPING"}},
        {"PARAMETERS", {"BOOL_ACTION_PARAMETERS", "BOUNDED_INT_ACTION_PARAMETERS", 
            "UNBOUNDED_INT_ACTION_PARAMETERS", "REAL_ACTION_PARAMETERS"}},
        {"FLUENTS_TYPE", {"NUMERIC_FLUENTS", "OBJECT_FLUENTS"}},
        {"CONSTRAINTS_KIND", {"TRAJECTORY_CONSTRAINTS", "STATE_INVARIANTS"}},
        {"QUALITY_METRICS", {"ACTIONS_COST", "PLAN_LENGTH", "MAKESPAN", "FINAL_VALUE", "OVERSUBSCRIPTION"}},
        {"ACTIONS_KIND", {"SENSING_ACTIONS"}}
    };
    return FAMILIES;
}

int ProblemKind::index(const std::string& flag) {
    static const NodeHashMap<std::string, int> indices = [] {
        NodeHashMap<std::string, int> map;
        int idx = 0;
        for (const auto& family : families()) for (const auto& f : family.flags) map[f] = idx++;
        return map;
    }();
    auto it = indices.find(flag);
    if (it == indices.end()) throw UsageError("Unknown problem kind flag \"" + flag + "\"");
    return it->second;
}

ProblemKind::ProblemKind(const std::vector<std::string>& flags) {
    for (const auto& f : flags) set(f);
}

ProblemKind ProblemKind::all() {
    ProblemKind k;
    for (const auto& family : families()) for (const auto& f : family.flags) k.set(f);
    return k;
}

ProblemKind& ProblemKind::set(const std::string& flag) {
    _flags.set(index(flag));
    return *this;
}

ProblemKind& ProblemKind::unset(const std::string& flag) {
    _flags.reset(index(flag));
    return *this;
}

bool ProblemKind::has(const std::string& flag) const {
    return _flags.test(index(flag));
}

std::vector<std::string> ProblemKind::flags() const {
    std::vector<std::string> out;
    int idx = 0;
    for (const auto& family : families()) for (const auto& f : family.flags) {
        if (_flags.test(idx++)) out.push_back(f);
    }
    return out;
}

std::vector<std::string> ProblemKind::flags(const std::string& familyName) const {
    for (const auto& family : families()) {
        if (family.name != familyName) continue;
        std::vector<std::string> out;
        for (const auto& f : family.flags) if (has(f)) out.push_back(f);
        return out;
    }
    throw UsageError("Unknown problem kind family \"" + familyName + "\"");
}

ProblemKind ProblemKind::unite(const ProblemKind& other) const {
    ProblemKind k;
    k._flags = _flags | other._flags;
    return k;
}

ProblemKind ProblemKind::intersect(const ProblemKind& other) const {
    ProblemKind k;
    k._flags = _flags & other._flags;
    return k;
}

std::string ProblemKind::toString() const {
    std::string out;
    for (const auto& family : families()) {
        auto fs = flags(family.name);
        if (fs.empty()) continue;
        if (!out.empty()) out += "; ";
        out += family.name + ": ";
        for (size_t i = 0; i < fs.size(); i++) out += (i > 0 ? ", " : "") + fs[i];
    }
    return "{" + out + "}";
}
