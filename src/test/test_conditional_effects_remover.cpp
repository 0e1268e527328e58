
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "compilers/conditional_effects_remover.h"
#include "examples/example_problems.h"
#include "plan/plan_replayer.h"
#include "plan/plan_validator.h"

template <typename E, typename F>
bool raises(F f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void testBasic(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto example = ExampleProblems::get(env, "basic_conditional");
    const Problem& p = *example.problem;

    ConditionalEffectsRemover cer;
    auto result = cer.compile(p);
    const Problem& q = *result.problem;
    assert(!q.kind().has("CONDITIONAL_EFFECTS"));

    // The variant where the guard is false has no effects left
    assert(q.actions().size() == 2);
    const Action& ay = *q.action("a_y");
    Expr x = s.mkFluentExp(p.fluent("x"));
    assert(ay.preconditions() == std::vector<Expr>{x});
    assert(ay.effects().size() == 1 && !ay.effects()[0].isConditional());

    PlanReplayer replayer(result);
    SequentialPlan compiled = replayer.replay(*example.plan);
    assert(PlanValidator(q).validate(compiled).valid);
    SequentialPlan back = compiled.mapBack(result.backMap);
    assert(back.actions == example.plan->actions);
    assert(PlanValidator(p).validate(back).valid);
}

void testVariants(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    Problem p(env, "switches");
    std::vector<Expr> f;
    for (const char* name : {"u", "c1", "c2", "t1", "t2"}) {
        const Fluent* fl = env.fluent(name, b);
        p.addFluent(fl, s.mkFalse());
        f.push_back(s.mkFluentExp(fl));
    }
    Expr u = f[0], c1 = f[1], c2 = f[2], t1 = f[3], t2 = f[4];
    auto toggle = std::make_shared<Action>("toggle", std::vector<const Parameter*>());
    toggle->addEffect(s, Effect(s, u, s.mkTrue(), s.mkTrue()));
    toggle->addEffect(s, Effect(s, t1, s.mkTrue(), c1));
    toggle->addEffect(s, Effect(s, t2, s.mkTrue(), c2));
    // Both guards true makes the effects conflict
    auto flip = std::make_shared<Action>("flip", std::vector<const Parameter*>());
    flip->addEffect(s, Effect(s, t1, s.mkTrue(), c1));
    flip->addEffect(s, Effect(s, t1, s.mkFalse(), c2));
    p.addAction(toggle);
    p.addAction(flip);
    p.addGoal(t1);
    p.addQualityMetric(QualityMetric::minimizeActionCosts({{"toggle", s.mkInt(2)}}, s.mkInt(1)));

    ConditionalEffectsRemover cer;
    auto result = cer.compile(p);
    const Problem& q = *result.problem;

    std::vector<std::string> names;
    for (const auto& a : q.actions()) names.push_back(a->name());
    assert(names == std::vector<std::string>({"toggle", "toggle__0__", "toggle__1__", "toggle__2__", 
        "flip", "flip__0__"}));

    // Bit i of the variant index is the truth value of guard i
    const Action& none = *q.action("toggle");
    assert(none.preconditions() == std::vector<Expr>({s.mkNot(c1), s.mkNot(c2)}));
    assert(none.effects().size() == 1 && none.effects()[0].fluent() == u);
    const Action& both = *q.action("toggle__2__");
    assert(both.preconditions() == std::vector<Expr>({c1, c2}));
    assert(both.effects().size() == 3);
    for (const Effect& e : both.effects()) assert(!e.isConditional());
    const Action& onlyFirst = *q.action("flip");
    assert(onlyFirst.preconditions() == std::vector<Expr>({c1, s.mkNot(c2)}));
    assert(onlyFirst.effects()[0].value() == s.mkTrue());

    const QualityMetric& m = q.qualityMetrics().front();
    assert(m.cost("toggle__1__") == s.mkInt(2));
    assert(m.cost("flip__0__") == s.mkInt(1));

    // Every variant maps back to the action it was split from
    for (const auto& a : q.actions()) {
        auto mapped = result.backMap(ActionInstance(a));
        assert(mapped.has_value());
        assert(mapped->action->name() == (a->name().rfind("toggle", 0) == 0 ? "toggle" : "flip"));
    }
}

void testForallRejected(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto example = ExampleProblems::get(env, "quantifiers");
    Problem& p = *example.problem;
    const Fluent* visited = p.fluent("visited");
    const Variable* w = env.variable("w", visited->signature[0]->type);
    Expr visitedW = s.mkFluentExp(visited, {s.mkVariable(w)});
    auto reset = std::make_shared<Action>("reset", std::vector<const Parameter*>());
    reset->addEffect(s, Effect(s, visitedW, s.mkFalse(), visitedW, EffectKind::ASSIGN, {w}));
    p.addAction(reset);

    ConditionalEffectsRemover cer;
    assert(raises<ProblemDefinitionError>([&]() {cer.compile(p);}));
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testBasic(env);
    testVariants(env);
    testForallRejected(env);

    Log::i("All conditional effects remover tests passed\n");
}
