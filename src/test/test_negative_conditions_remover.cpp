
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "algo/extractors.h"
#include "compilers/negative_conditions_remover.h"
#include "examples/example_problems.h"
#include "plan/plan_replayer.h"
#include "plan/plan_validator.h"

bool hasNegation(const Problem& p) {
    OperatorsExtractor ops(p.exprs());
    auto check = [&](Expr e) {return OperatorsExtractor::has(ops.get(e), OperatorKind::NOT);};
    for (const auto& a : p.actions()) {
        for (const Expr& c : a->preconditions()) if (check(c)) return true;
        for (const Effect& e : a->effects()) if (check(e.condition())) return true;
    }
    for (const Expr& g : p.goals()) if (check(g)) return true;
    return false;
}

void testBasic(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto example = ExampleProblems::get(env, "basic");
    const Problem& p = *example.problem;

    NegativeConditionsRemover ncr;
    auto result = ncr.compile(p);
    const Problem& q = *result.problem;
    assert(q.name() == "negative_conditions_remover_basic");
    assert(!hasNegation(q));
    assert(!q.kind().has("NEGATIVE_CONDITIONS"));
    assert(q.fluents().size() == 2);
    assert(q.hasFluent("not_x"));

    Expr x = s.mkFluentExp(q.fluent("x"));
    Expr notX = s.mkFluentExp(q.fluent("not_x"));
    assert(q.initialValue(notX) == s.mkTrue());
    const auto& a = *q.action("a");
    assert(a.preconditions() == std::vector<Expr>{notX});
    // Writing x also writes its shadow
    assert(a.effects().size() == 2);
    assert(a.effects()[0].fluent() == x && a.effects()[0].value() == s.mkTrue());
    assert(a.effects()[1].fluent() == notX && a.effects()[1].value() == s.mkFalse());

    // The input is untouched
    assert(p.fluents().size() == 1);
    assert(hasNegation(p));

    PlanReplayer replayer(result);
    SequentialPlan compiledPlan = replayer.replay(*example.plan);
    assert(PlanValidator(q).validate(compiledPlan).valid);
    SequentialPlan back = compiledPlan.mapBack(result.backMap);
    assert(back.size() == 1 && back.actions[0].action == p.actions()[0]);
    assert(PlanValidator(p).validate(back).valid);
}

void testLifted(Environment& env) {
    ExpressionStore& s = env.exprs();
    Problem p(env, "doors");
    const Type* door = env.types().userType("Door");
    const Object* d1 = env.object("d1", door);
    const Object* d2 = env.object("d2", door);
    p.addObjects({d1, d2});
    const Parameter* d = env.parameter("d", door);
    const Fluent* open = env.fluent("open", env.types().boolType(), {d});
    const Fluent* notOpen = env.fluent("not_open", env.types().boolType());
    const Fluent* pressure = env.fluent("pressure", env.types().intType(0, 10));
    p.addFluent(open, s.mkFalse());
    p.addFluent(notOpen, s.mkFalse());
    p.addFluent(pressure, s.mkInt(3));
    p.setInitialValue(s.mkFluentExp(open, {s.mkObject(d2)}), s.mkTrue());

    auto openDoor = std::make_shared<Action>("open_door", std::vector<const Parameter*>{d});
    openDoor->addPrecondition(s, s.mkNot(s.mkFluentExp(open, {s.mkParam(d)})));
    openDoor->addPrecondition(s, s.mkNot(s.mkLE(s.mkFluentExp(pressure), s.mkInt(2))));
    openDoor->addEffect(s, Effect(s, s.mkFluentExp(open, {s.mkParam(d)}), s.mkTrue(), s.mkTrue()));
    p.addAction(openDoor);
    p.addGoal(s.mkFluentExp(open, {s.mkObject(d1)}));

    NegativeConditionsRemover ncr;
    auto result = ncr.compile(p);
    const Problem& q = *result.problem;

    // "not_open" is taken, so the shadow gets a fresh name
    assert(q.hasFluent("not_open__0__"));
    const Fluent* shadow = q.fluent("not_open__0__");
    assert(shadow->signature == open->signature);
    assert(q.initialValue(s.mkFluentExp(shadow, {s.mkObject(d1)})) == s.mkTrue());
    assert(q.initialValue(s.mkFluentExp(shadow, {s.mkObject(d2)})) == s.mkFalse());

    const auto& pres = q.action("open_door")->preconditions();
    assert(pres.size() == 2);
    assert(pres[0] == s.mkFluentExp(shadow, {s.mkParam(d)}));
    // not (p <= 2) is 2 < p
    assert(pres[1] == s.mkLT(s.mkInt(2), s.mkFluentExp(pressure)));

    SequentialPlan plan({ActionInstance(q.action("open_door"), {s.mkObject(d1)})});
    assert(PlanValidator(q).validate(plan).valid);
    SequentialPlan invalid({ActionInstance(q.action("open_door"), {s.mkObject(d2)})});
    auto res = PlanValidator(q).validate(invalid);
    assert(!res.valid && res.failedStep == 0);
    assert(PlanValidator(p).validate(plan.mapBack(result.backMap)).valid);
}

void testTypeDefaults(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    Problem p(env, "dark_rooms");
    const Type* room = env.types().userType("Room");
    const Object* r1 = env.object("r1", room);
    const Object* r2 = env.object("r2", room);
    p.addObjects({r1, r2});
    const Parameter* r = env.parameter("r", room);
    // lit has no default of its own: every room is lit but r1
    const Fluent* lit = env.fluent("lit", b, {r});
    const Fluent* inside = env.fluent("inside", b);
    p.setTypeDefault(b, s.mkTrue());
    p.addFluent(lit);
    p.addFluent(inside, s.mkFalse());
    p.setInitialValue(s.mkFluentExp(lit, {s.mkObject(r1)}), s.mkFalse());
    auto enter = std::make_shared<Action>("enter", std::vector<const Parameter*>{r});
    enter->addPrecondition(s, s.mkNot(s.mkFluentExp(lit, {s.mkParam(r)})));
    enter->addEffect(s, Effect(s, s.mkFluentExp(inside), s.mkTrue(), s.mkTrue()));
    p.addAction(enter);
    p.addGoal(s.mkFluentExp(inside));

    NegativeConditionsRemover ncr;
    auto result = ncr.compile(p);
    const Problem& q = *result.problem;
    const Fluent* notLit = q.fluent("not_lit");
    assert(q.fluentDefault(notLit) == s.mkFalse());
    assert(q.initialValue(s.mkFluentExp(notLit, {s.mkObject(r1)})) == s.mkTrue());
    assert(q.initialValue(s.mkFluentExp(notLit, {s.mkObject(r2)})) == s.mkFalse());
    assert(q.initialValue(s.mkFluentExp(lit, {s.mkObject(r2)})) == s.mkTrue());

    SequentialPlan dark({ActionInstance(q.action("enter"), {s.mkObject(r1)})});
    assert(PlanValidator(q).validate(dark).valid);
    assert(PlanValidator(p).validate(dark.mapBack(result.backMap)).valid);

    // Entering a lit room is forbidden on both sides
    SequentialPlan bright({ActionInstance(q.action("enter"), {s.mkObject(r2)})});
    auto res = PlanValidator(q).validate(bright);
    assert(!res.valid && res.failedStep == 0);
    res = PlanValidator(p).validate(bright.mapBack(result.backMap));
    assert(!res.valid && res.failedStep == 0);
}

void testRejected(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();

    // Implications must be removed first
    Problem p(env, "implication");
    const Fluent* x = env.fluent("x", b);
    const Fluent* y = env.fluent("y", b);
    p.addFluent(x, s.mkFalse());
    p.addFluent(y, s.mkFalse());
    p.addGoal(s.mkImplies(s.mkFluentExp(x), s.mkFluentExp(y)));
    NegativeConditionsRemover ncr;
    bool raised = false;
    try {
        ncr.compile(p);
    } catch (const ProblemDefinitionError&) {
        raised = true;
    }
    assert(raised);

    // Conditional effect writing a negated fluent
    Problem q(env, "conditional");
    const Fluent* u = env.fluent("u", b);
    const Fluent* v = env.fluent("v", b);
    q.addFluent(u, s.mkFalse());
    q.addFluent(v, s.mkFalse());
    auto a = std::make_shared<Action>("a", std::vector<const Parameter*>());
    a->addEffect(s, Effect(s, s.mkFluentExp(u), s.mkTrue(), s.mkFluentExp(v)));
    q.addAction(a);
    q.addGoal(s.mkNot(s.mkFluentExp(u)));
    raised = false;
    try {
        ncr.compile(q);
    } catch (const ProblemDefinitionError&) {
        raised = true;
    }
    assert(raised);

    // Trajectory constraints are not supported
    auto trajectory = ExampleProblems::get(env, "trajectory");
    assert(!ncr.supports(trajectory.problem->kind()));
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testBasic(env);
    testLifted(env);
    testTypeDefaults(env);
    testRejected(env);

    Log::i("All negative conditions remover tests passed\n");
}
