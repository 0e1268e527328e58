
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "compilers/trajectory_constraints_remover.h"
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

void testMonitors(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto example = ExampleProblems::get(env, "trajectory");
    Problem& p = *example.problem;
    // Touches no constrained fluent
    const Fluent* d = env.fluent("d", env.types().boolType());
    p.addFluent(d, s.mkFalse());
    auto setD = std::make_shared<Action>("set_d", std::vector<const Parameter*>());
    setD->addEffect(s, Effect(s, s.mkFluentExp(d), s.mkTrue(), s.mkTrue()));
    p.addAction(setD);

    TrajectoryConstraintsRemover tcr;
    auto result = tcr.compile(p);
    const Problem& q = *result.problem;
    assert(q.trajectoryConstraints().empty());
    assert(q.stateInvariants().empty());
    assert(!q.kind().has("TRAJECTORY_CONSTRAINTS"));
    assert(!q.kind().has("STATE_INVARIANTS"));

    // No monitor for always constraints
    assert(q.fluents().size() == 4 + 4);
    Expr hold0 = s.mkFluentExp(q.fluent("hold-0"));
    Expr seenPsi1 = s.mkFluentExp(q.fluent("seen-psi-1"));
    Expr seenPhi2 = s.mkFluentExp(q.fluent("seen-phi-2"));
    Expr hold3 = s.mkFluentExp(q.fluent("hold-3"));
    assert(q.initialValue(hold0) == s.mkFalse());
    assert(q.initialValue(seenPsi1) == s.mkFalse());
    assert(q.initialValue(seenPhi2) == s.mkFalse());
    // sometime-after(a, c) holds while a was never reached
    assert(q.initialValue(hold3) == s.mkTrue());
    assert(q.goals() == std::vector<Expr>({hold0, hold3}));

    Expr a = s.mkFluentExp(p.fluent("a"));
    Expr b = s.mkFluentExp(p.fluent("b"));
    Expr c = s.mkFluentExp(p.fluent("c"));
    const Action& setA = *q.action("set_a");
    assert(setA.preconditions() == std::vector<Expr>{s.mkOr(s.mkNot(seenPhi2), a)});
    assert(setA.effects().size() == 4);
    assert(setA.effects()[1].fluent() == seenPsi1);
    assert(setA.effects()[2].fluent() == seenPhi2);
    assert(setA.effects()[3].fluent() == hold3 && setA.effects()[3].value() == s.mkFalse());
    assert(setA.effects()[3].condition() == s.mkNot(c));

    const Action& setB = *q.action("set_b");
    assert(setB.preconditions() == std::vector<Expr>({seenPsi1, a}));
    const Action& setC = *q.action("set_c");
    assert(setC.preconditions() == std::vector<Expr>{b});

    // Actions that touch no constrained fluent are left alone
    const Action& compiledD = *q.action("set_d");
    assert(compiledD.preconditions().empty());
    assert(compiledD.effects() == setD->effects());

    PlanReplayer replayer(result);
    SequentialPlan compiled = replayer.replay(*example.plan);
    assert(PlanValidator(q).validate(compiled).valid);
    SequentialPlan back = compiled.mapBack(result.backMap);
    assert(back.size() == 3);
    assert(PlanValidator(p).validate(back).valid);

    // b before a violates sometime-before(b, a) in both problems
    SequentialPlan early({ActionInstance(q.action("set_b"))});
    assert(!PlanValidator(q).validate(early).valid);
    assert(!PlanValidator(p).validate(early.mapBack(result.backMap)).valid);

    // a may become true only once
    SequentialPlan twice({ActionInstance(q.action("set_a")), ActionInstance(q.action("reset_a")),
        ActionInstance(q.action("set_a"))});
    auto res = PlanValidator(q).validate(twice);
    assert(!res.valid && res.failedStep == 2);
    res = PlanValidator(p).validate(twice.mapBack(result.backMap));
    assert(!res.valid);
}

void testInitialStateViolations(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    TrajectoryConstraintsRemover tcr;

    Problem p(env, "always_violated");
    const Fluent* x = env.fluent("x", b);
    p.addFluent(x, s.mkFalse());
    p.addTrajectoryConstraint(s.mkAlways(s.mkFluentExp(x)));
    assert(raises<ProblemDefinitionError>([&]() {tcr.compile(p);}));

    Problem q(env, "before_violated");
    const Fluent* y = env.fluent("y", b);
    const Fluent* z = env.fluent("z", b);
    q.addFluent(y, s.mkTrue());
    q.addFluent(z, s.mkFalse());
    q.addTrajectoryConstraint(s.mkSometimeBefore(s.mkFluentExp(y), s.mkFluentExp(z)));
    assert(raises<ProblemDefinitionError>([&]() {tcr.compile(q);}));

    auto durative = ExampleProblems::get(env, "durative");
    assert(!tcr.supports(durative.problem->kind()));
}

void testLifted(Environment& env) {
    ExpressionStore& s = env.exprs();
    Problem p(env, "tour");
    const Type* location = env.types().userType("Location");
    const Object* l1 = env.object("l1", location);
    const Object* l2 = env.object("l2", location);
    p.addObjects({l1, l2});
    const Parameter* l = env.parameter("l", location);
    const Fluent* visited = env.fluent("visited", env.types().boolType(), {l});
    p.addFluent(visited, s.mkFalse());
    auto visit = std::make_shared<Action>("visit", std::vector<const Parameter*>{l});
    visit->addEffect(s, Effect(s, s.mkFluentExp(visited, {s.mkParam(l)}), s.mkTrue(), s.mkTrue()));
    p.addAction(visit);
    const Variable* v = env.variable("v", location);
    p.addTrajectoryConstraint(s.mkSometime(s.mkForall({v}, s.mkFluentExp(visited, {s.mkVariable(v)}))));

    TrajectoryConstraintsRemover tcr;
    auto result = tcr.compile(p);
    const Problem& q = *result.problem;
    assert(q.actions().size() == 2);
    assert(q.actions()[0]->parameters().empty());
    assert(q.hasFluent("hold-0"));
    assert(q.goals().size() == 1);

    SequentialPlan plan({ActionInstance(q.action("visit_l1")), ActionInstance(q.action("visit_l2"))});
    assert(PlanValidator(q).validate(plan).valid);
    SequentialPlan back = plan.mapBack(result.backMap);
    assert(back.actions[1] == ActionInstance(visit, {s.mkObject(l2)}));
    assert(PlanValidator(p).validate(back).valid);
    SequentialPlan half({ActionInstance(q.action("visit_l1"))});
    assert(!PlanValidator(q).validate(half).valid);
    assert(!PlanValidator(p).validate(half.mapBack(result.backMap)).valid);
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testMonitors(env);
    testInitialStateViolations(env);
    testLifted(env);

    Log::i("All trajectory constraints remover tests passed\n");
}
