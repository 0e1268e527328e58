
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "compilers/usertype_fluents_remover.h"
#include "examples/example_problems.h"
#include "plan/plan_replayer.h"
#include "plan/plan_validator.h"

void testRobot(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto example = ExampleProblems::get(env, "robot");
    const Problem& p = *example.problem;
    assert(p.kind().has("OBJECT_FLUENTS"));

    UsertypeFluentsRemover ufr;
    auto result = ufr.compile(p);
    const Problem& q = *result.problem;
    assert(!q.kind().has("OBJECT_FLUENTS"));

    const Fluent* robotAt = q.fluent("robot_at");
    assert(robotAt != p.fluent("robot_at"));
    assert(robotAt->type->isBool());
    assert(robotAt->arity() == 1);
    const Type* location = p.fluent("robot_at")->type;
    assert(robotAt->signature[0]->name == "location");
    assert(robotAt->signature[0]->type == location);
    assert(q.fluent("visited") == p.fluent("visited"));

    // robot_at = l1  ==>  robot_at(l1), robot_at(l2) and robot_at(l3) false
    auto at = [&](const std::string& name) {return s.mkFluentExp(robotAt, {s.mkObject(q.object(name))});};
    assert(q.initialValue(at("l1")) == s.mkTrue());
    assert(q.initialValue(at("l2")) == s.mkFalse());
    assert(q.initialValue(at("l3")) == s.mkFalse());

    const Action& move = *q.action("move");
    const Parameter* from = move.parameters()[0];
    const Parameter* to = move.parameters()[1];
    assert(move.preconditions() == std::vector<Expr>{s.mkFluentExp(robotAt, {s.mkParam(from)})});
    // One pair of guarded effects per location, then the visited effect
    assert(move.effects().size() == 7);
    const Effect& first = move.effects()[0];
    assert(first.fluent() == at("l1") && first.value() == s.mkTrue());
    assert(first.condition() == s.mkEquals(s.mkParam(to), s.mkObject(q.object("l1"))));
    assert(move.effects()[1].fluent() == at("l1") && move.effects()[1].value() == s.mkFalse());
    assert(!move.effects()[6].isConditional());
    assert(q.goals()[1] == at("l3"));

    PlanReplayer replayer(result);
    SequentialPlan compiled = replayer.replay(*example.plan);
    auto res = PlanValidator(q).validate(compiled);
    assert(res.valid && *res.metricValue == 2);
    SequentialPlan back = compiled.mapBack(result.backMap);
    assert(back.actions == example.plan->actions);
    assert(PlanValidator(p).validate(back).valid);

    // Moving from where the robot is not fails in both problems
    const auto& moveAction = q.action("move");
    SequentialPlan wrong({ActionInstance(moveAction, {s.mkObject(q.object("l2")), s.mkObject(q.object("l3"))})});
    res = PlanValidator(q).validate(wrong);
    assert(!res.valid && res.failedStep == 0);
    assert(!PlanValidator(p).validate(wrong.mapBack(result.backMap)).valid);
}

void testFluentToFluentAssignment(Environment& env) {
    ExpressionStore& s = env.exprs();
    Problem p(env, "copy");
    const Type* place = env.types().userType("Place");
    const Object* p1 = env.object("p1", place);
    const Object* p2 = env.object("p2", place);
    p.addObjects({p1, p2});
    const Fluent* carried = env.fluent("carried", place);
    const Fluent* target = env.fluent("target", place);
    // Its own parameter already takes the name of the type
    const Parameter* placeParam = env.parameter("place", place);
    const Fluent* next = env.fluent("next", place, {placeParam});
    p.addFluent(carried, s.mkObject(p1));
    p.addFluent(target, s.mkObject(p2));
    p.addFluent(next, s.mkObject(p1));
    auto copy = std::make_shared<Action>("copy", std::vector<const Parameter*>());
    copy->addEffect(s, Effect(s, s.mkFluentExp(carried), s.mkFluentExp(target), s.mkTrue()));
    p.addAction(copy);
    p.addGoal(s.mkEquals(s.mkFluentExp(carried), s.mkObject(p2)));

    UsertypeFluentsRemover ufr;
    auto result = ufr.compile(p);
    const Problem& q = *result.problem;
    const Fluent* nc = q.fluent("carried");
    const Fluent* nt = q.fluent("target");
    const Fluent* nn = q.fluent("next");
    assert(nn->arity() == 2);
    assert(nn->signature[0]->name == "place" && nn->signature[1]->name == "place_0");

    // carried := target  ==>  carried(o) := target(o) for every place o
    const Action& nCopy = *q.action("copy");
    assert(nCopy.effects().size() == 4);
    Expr c1 = s.mkFluentExp(nc, {s.mkObject(p1)});
    Expr t1 = s.mkFluentExp(nt, {s.mkObject(p1)});
    assert(nCopy.effects()[0].fluent() == c1 && nCopy.effects()[0].condition() == t1);
    assert(nCopy.effects()[1].fluent() == c1 && nCopy.effects()[1].condition() == s.mkNot(t1));
    assert(q.goals() == std::vector<Expr>{s.mkFluentExp(nc, {s.mkObject(p2)})});
    assert(q.initialValue(s.mkFluentExp(nn, {s.mkObject(p2), s.mkObject(p1)})) == s.mkTrue());
    assert(q.initialValue(s.mkFluentExp(nn, {s.mkObject(p2), s.mkObject(p2)})) == s.mkFalse());

    SequentialPlan plan({ActionInstance(q.action("copy"))});
    assert(PlanValidator(q).validate(plan).valid);
    assert(PlanValidator(p).validate(plan.mapBack(result.backMap)).valid);
    assert(!PlanValidator(q).validate(SequentialPlan()).valid);
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testRobot(env);
    testFluentToFluentAssignment(env);

    Log::i("All user-type fluents remover tests passed\n");
}
