
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "compilers/bounded_types_remover.h"
#include "examples/example_problems.h"
#include "plan/plan_replayer.h"
#include "plan/plan_validator.h"

void testCounter(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto example = ExampleProblems::get(env, "counter");
    const Problem& p = *example.problem;
    assert(p.kind().has("BOUNDED_TYPES"));

    BoundedTypesRemover btr;
    auto result = btr.compile(p);
    const Problem& q = *result.problem;
    assert(!q.kind().has("BOUNDED_TYPES"));

    const Fluent* level = q.fluent("level");
    assert(level != p.fluent("level"));
    assert(level->type->isInt() && !level->type->isBounded());
    Expr fl = s.mkFluentExp(level);
    assert(q.initialValue(fl) == s.mkInt(0));

    // The bounds become conditions of every action and of the goal
    std::vector<Expr> bounds = {s.mkLE(s.mkInt(0), fl), s.mkLE(fl, s.mkInt(1))};
    assert(q.action("inc")->preconditions() == bounds);
    assert(q.action("dec")->preconditions() == bounds);
    assert(q.goals() == std::vector<Expr>({s.mkEquals(fl, s.mkInt(1)), bounds[0], bounds[1]}));
    assert(q.action("inc")->effects().front().fluent() == fl);
    assert(q.qualityMetrics().front().cost("inc") == s.mkInt(1));

    PlanReplayer replayer(result);
    SequentialPlan compiled = replayer.replay(*example.plan);
    auto res = PlanValidator(q).validate(compiled);
    assert(res.valid);
    assert(*res.metricValue == 1);
    assert(PlanValidator(p).validate(compiled.mapBack(result.backMap)).valid);

    // Leaving the bounds is caught either way
    SequentialPlan twice({ActionInstance(q.action("inc")), ActionInstance(q.action("inc"))});
    assert(!PlanValidator(q).validate(twice).valid);
    res = PlanValidator(p).validate(twice.mapBack(result.backMap));
    assert(!res.valid && res.failedStep == 1);
}

void testLiftedBounds(Environment& env) {
    ExpressionStore& s = env.exprs();
    Problem p(env, "tanks");
    const Type* tank = env.types().userType("Tank");
    const Object* t1 = env.object("t1", tank);
    const Object* t2 = env.object("t2", tank);
    p.addObjects({t1, t2});
    const Parameter* t = env.parameter("t", tank);
    const Fluent* fill = env.fluent("fill", env.types().realType(0.0, 5.5), {t});
    const Fluent* flag = env.fluent("flag", env.types().boolType());
    p.addFluent(fill);
    p.addFluent(flag, s.mkFalse());
    p.setInitialValue(s.mkFluentExp(fill, {s.mkObject(t1)}), s.mkReal(1.0));
    p.setInitialValue(s.mkFluentExp(fill, {s.mkObject(t2)}), s.mkReal(2.5));
    auto pour = std::make_shared<Action>("pour", std::vector<const Parameter*>{t});
    pour->addEffect(s, Effect(s, s.mkFluentExp(fill, {s.mkParam(t)}), s.mkReal(3.0), s.mkTrue(), EffectKind::INCREASE));
    p.addAction(pour);
    p.addGoal(s.mkFluentExp(flag));

    BoundedTypesRemover btr;
    auto result = btr.compile(p);
    const Problem& q = *result.problem;
    const Fluent* nf = q.fluent("fill");
    assert(nf->type->isReal() && !nf->type->isBounded());
    assert(q.fluent("flag") == flag);

    // Two bound conditions per ground fluent expression
    assert(q.action("pour")->preconditions().size() == 4);
    assert(q.goals().size() == 5);
    Expr fill2 = s.mkFluentExp(nf, {s.mkObject(t2)});
    assert(q.initialValue(fill2) == s.mkReal(2.5));
    assert(q.goals()[3] == s.mkLE(s.mkReal(0.0), fill2));
    assert(q.goals()[4] == s.mkLE(fill2, s.mkReal(5.5)));
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testCounter(env);
    testLiftedBounds(env);

    Log::i("All bounded types remover tests passed\n");
}
