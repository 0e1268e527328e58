
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "examples/example_problems.h"

template <typename E, typename F>
bool raises(F f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void testKindFlags() {
    ProblemKind k;
    assert(k.empty());
    k.set("NEGATIVE_CONDITIONS").set("FLAT_TYPING");
    assert(k.has("NEGATIVE_CONDITIONS"));
    assert(!k.has("DISJUNCTIVE_CONDITIONS"));
    assert(k.flags().size() == 2);
    assert(k.flags("CONDITIONS_KIND") == std::vector<std::string>({"NEGATIVE_CONDITIONS"}));

    ProblemKind larger = k;
    larger.set("EQUALITIES");
    assert(k.isSubsetOf(larger));
    assert(!larger.isSubsetOf(k));
    assert(k <= ProblemKind::all());
    assert(ProblemKind() <= k);
    assert(larger.intersect(k) == k);
    assert(k.unite(larger) == larger);
    larger.unset("EQUALITIES");
    assert(larger == k);

    assert(raises<UsageError>([&]() {k.set("NO_SUCH_FLAG");}));
    assert(raises<UsageError>([&]() {k.has("negative_conditions");}));
}

void testKindComputation(Environment& env) {
    auto basic = ExampleProblems::get(env, "basic").problem;
    ProblemKind kind = basic->kind();
    assert(kind == ProblemKind({"ACTION_BASED", "NEGATIVE_CONDITIONS"}));

    auto robot = ExampleProblems::get(env, "robot").problem;
    kind = robot->kind();
    for (const char* flag : {"ACTION_BASED", "FLAT_TYPING", "OBJECT_FLUENTS", "EQUALITIES", 
            "UNIVERSAL_CONDITIONS", "PLAN_LENGTH"}) {
        assert(kind.has(flag));
    }
    assert(!kind.has("NEGATIVE_CONDITIONS"));
    assert(!kind.has("NUMERIC_FLUENTS"));

    auto counter = ExampleProblems::get(env, "counter").problem;
    kind = counter->kind();
    for (const char* flag : {"NUMERIC_FLUENTS", "BOUNDED_TYPES", "DISCRETE_NUMBERS", "INCREASE_EFFECTS", 
            "DECREASE_EFFECTS", "EQUALITIES", "ACTIONS_COST", "SIMPLE_NUMERIC_PLANNING"}) {
        assert(kind.has(flag));
    }

    auto trajectory = ExampleProblems::get(env, "trajectory").problem;
    kind = trajectory->kind();
    assert(kind.has("TRAJECTORY_CONSTRAINTS"));
    assert(kind.has("STATE_INVARIANTS"));

    auto durative = ExampleProblems::get(env, "durative").problem;
    kind = durative->kind();
    for (const char* flag : {"CONTINUOUS_TIME", "DURATION_INEQUALITIES", "TIMED_EFFECTS", 
            "DISJUNCTIVE_CONDITIONS", "NEGATIVE_CONDITIONS"}) {
        assert(kind.has(flag));
    }
    assert(!kind.has("TIMED_GOALS"));

    auto sensing = ExampleProblems::get(env, "sensing").problem;
    assert(sensing->kind().has("SENSING_ACTIONS"));

    auto quantifiers = ExampleProblems::get(env, "quantifiers").problem;
    kind = quantifiers->kind();
    for (const char* flag : {"UNIVERSAL_CONDITIONS", "EXISTENTIAL_CONDITIONS", "FORALL_EFFECTS"}) {
        assert(kind.has(flag));
    }
}

void testInitialValues(Environment& env) {
    ExpressionStore& s = env.exprs();
    Problem p(env, "values");
    const Type* crate = env.types().userType("Crate");
    const Object* c1 = env.object("c1", crate);
    const Object* c2 = env.object("c2", crate);
    p.addObjects({c1, c2});
    const Parameter* c = env.parameter("c", crate);
    const Fluent* open = env.fluent("open", env.types().boolType(), {c});
    const Fluent* weight = env.fluent("weight", env.types().intType(0, 100), {c});
    p.addFluent(open, s.mkFalse());
    p.addFluent(weight);

    Expr open1 = s.mkFluentExp(open, {s.mkObject(c1)});
    Expr weight1 = s.mkFluentExp(weight, {s.mkObject(c1)});
    Expr weight2 = s.mkFluentExp(weight, {s.mkObject(c2)});
    assert(p.initialValue(open1) == s.mkFalse());
    p.setInitialValue(open1, s.mkTrue());
    assert(p.initialValue(open1) == s.mkTrue());

    // weight(c2) has no value at all yet
    p.setInitialValue(weight1, s.mkInt(10));
    assert(!p.initialValue(weight2).valid());
    assert(raises<ProblemDefinitionError>([&]() {p.initialValues();}));

    // Falls back to the type default
    p.setTypeDefault(weight->type, s.mkInt(5));
    assert(p.initialValue(weight2) == s.mkInt(5));
    auto values = p.initialValues();
    assert(values.size() == 4);
    assert(values[0].first == open1 && values[0].second == s.mkTrue());
    assert(values[2].first == weight1 && values[2].second == s.mkInt(10));
    assert(values[3].first == weight2 && values[3].second == s.mkInt(5));

    assert(raises<TypeError>([&]() {p.setInitialValue(weight1, s.mkInt(101));}));
    assert(raises<ProblemDefinitionError>([&]() {p.setInitialValue(s.mkFluentExp(weight, {s.mkParam(c)}), s.mkInt(1));}));
    assert(raises<ProblemDefinitionError>([&]() {p.addObject(env.object("open", crate));}));
    assert(raises<ProblemDefinitionError>([&]() {p.domain(env.types().realType());}));
    assert(p.domain(weight->type).size() == 101);
}

void testClone(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto original = ExampleProblems::get(env, "basic_or").problem;
    auto copy = original->clone();
    copy->setName("copy");
    copy->action("a")->clearEffects();
    copy->clearGoals();
    copy->setInitialValue(s.mkFluentExp(copy->fluent("x")), s.mkTrue());

    assert(original->name() == "basic_or");
    assert(original->action("a")->effects().size() == 1);
    assert(original->goals().size() == 2);
    assert(original->initialValue(s.mkFluentExp(original->fluent("x"))) == s.mkFalse());
    assert(copy->fluents() == original->fluents());
    assert(copy->action("a") != original->action("a"));
}

void testEffects(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    const Type* crate = env.types().userType("Crate");
    Expr x = s.mkFluentExp(env.fluent("x", b));
    Expr y = s.mkFluentExp(env.fluent("y", b));
    Expr n = s.mkFluentExp(env.fluent("n", env.types().intType()));

    Action a("a", {});
    a.addEffect(s, Effect(s, x, s.mkTrue(), s.mkTrue()));
    // The same effect twice is one effect
    a.addEffect(s, Effect(s, x, s.mkTrue(), s.mkTrue()));
    assert(a.effects().size() == 1);
    assert(raises<ConflictingEffectsError>([&]() {a.addEffect(s, Effect(s, x, s.mkFalse(), s.mkTrue()));}));
    // Differently guarded effects may both be declared
    a.addEffect(s, Effect(s, y, s.mkTrue(), x));
    a.addEffect(s, Effect(s, y, s.mkFalse(), s.mkNot(x)));
    assert(a.effects().size() == 3);

    a.addEffect(s, Effect(s, n, s.mkInt(1), s.mkTrue(), EffectKind::INCREASE));
    a.addEffect(s, Effect(s, n, s.mkInt(2), s.mkTrue(), EffectKind::DECREASE));
    assert(raises<ConflictingEffectsError>([&]() {a.addEffect(s, Effect(s, n, s.mkInt(0), s.mkTrue()));}));

    assert(raises<TypeError>([&]() {Effect(s, x, s.mkInt(1), s.mkTrue());}));
    assert(raises<TypeError>([&]() {Effect(s, x, s.mkTrue(), s.mkTrue(), EffectKind::INCREASE);}));
    assert(raises<ProblemDefinitionError>([&]() {Effect(s, s.mkNot(x), s.mkTrue(), s.mkTrue());}));

    const Variable* v = env.variable("v", crate);
    const Variable* w = env.variable("w", crate);
    const Parameter* c = env.parameter("c", crate);
    const Fluent* open = env.fluent("open", b, {c});
    Expr openV = s.mkFluentExp(open, {s.mkVariable(v)});
    assert(raises<UnboundVariablesError>([&]() {Effect(s, openV, s.mkTrue(), s.mkTrue());}));
    assert(raises<UnboundVariablesError>([&]() {
        Effect(s, openV, s.mkTrue(), s.mkTrue(), EffectKind::ASSIGN, {v, w});
    }));
    Effect forall(s, openV, s.mkTrue(), s.mkTrue(), EffectKind::ASSIGN, {v});
    assert(forall.isForall());
    assert(!forall.isConditional());
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testKindFlags();
    testKindComputation(env);
    testInitialValues(env);
    testClone(env);
    testEffects(env);

    Log::i("All problem tests passed\n");
}
