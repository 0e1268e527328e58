
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "compilers/disjunctive_conditions_remover.h"
#include "examples/example_problems.h"
#include "plan/plan_replayer.h"
#include "plan/plan_validator.h"

std::vector<std::string> actionNames(const Problem& p) {
    std::vector<std::string> out;
    for (const auto& a : p.actions()) out.push_back(a->name());
    return out;
}

void testSiblings(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto example = ExampleProblems::get(env, "basic_or");
    Problem& p = *example.problem;
    p.addQualityMetric(QualityMetric::minimizeActionCosts({{"a", s.mkInt(3)}}, s.mkInt(1)));
    Expr x = s.mkFluentExp(p.fluent("x"));
    Expr y = s.mkFluentExp(p.fluent("y"));
    Expr z = s.mkFluentExp(p.fluent("z"));

    DisjunctiveConditionsRemover dcr;
    auto result = dcr.compile(p);
    const Problem& q = *result.problem;
    assert(!q.kind().has("DISJUNCTIVE_CONDITIONS"));

    // One sibling per disjunct; the goal is reached by auxiliary actions
    assert(actionNames(q) == std::vector<std::string>({"make_x", "make_y", "a", "a__0__", 
        "achieve_goal", "achieve_goal__0__"}));
    assert(q.action("a")->preconditions() == std::vector<Expr>{x});
    assert(q.action("a__0__")->preconditions() == std::vector<Expr>{y});
    assert(q.action("a__0__")->effects() == p.action("a")->effects());
    assert(q.hasFluent("goal_reached"));
    Expr reached = s.mkFluentExp(q.fluent("goal_reached"));
    assert(q.goals() == std::vector<Expr>{reached});
    assert(q.action("achieve_goal")->preconditions() == std::vector<Expr>({z, x}));
    assert(q.action("achieve_goal__0__")->preconditions() == std::vector<Expr>({z, y}));

    // Siblings cost what their action costs; auxiliary actions are free
    const QualityMetric& m = q.qualityMetrics().front();
    assert(m.cost("a") == s.mkInt(3) && m.cost("a__0__") == s.mkInt(3));
    assert(m.cost("make_x") == s.mkInt(1));
    assert(m.cost("achieve_goal__0__") == s.mkInt(0));

    // Auxiliary actions map back to nothing
    assert(!result.backMap(ActionInstance(q.action("achieve_goal"))).has_value());
    assert(result.backMap(ActionInstance(q.action("a__0__")))->action == p.action("a"));

    PlanReplayer replayer(result);
    SequentialPlan compiled = replayer.replay(*example.plan);
    assert(compiled.size() == 3);
    assert(compiled.actions[1].action->name() == "a");
    assert(compiled.actions[2].action->name() == "achieve_goal");
    auto res = PlanValidator(q).validate(compiled);
    assert(res.valid);
    assert(*res.metricValue == 4);
    SequentialPlan back = compiled.mapBack(result.backMap);
    assert(back.size() == 2);
    res = PlanValidator(p).validate(back);
    assert(res.valid && *res.metricValue == 4);

    // Going through y instead needs the other sibling
    SequentialPlan viaY({ActionInstance(q.action("make_y")), ActionInstance(q.action("a__0__")), 
        ActionInstance(q.action("achieve_goal__0__"))});
    assert(PlanValidator(q).validate(viaY).valid);
}

void testGuardsAndSimpleGoals(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    Problem p(env, "guards");
    const Fluent* x = env.fluent("x", b);
    const Fluent* y = env.fluent("y", b);
    const Fluent* z = env.fluent("z", b);
    for (const Fluent* f : {x, y, z}) p.addFluent(f, s.mkFalse());
    Expr fx = s.mkFluentExp(x), fy = s.mkFluentExp(y), fz = s.mkFluentExp(z);

    auto a = std::make_shared<Action>("a", std::vector<const Parameter*>());
    a->addPrecondition(s, s.mkOr(fx, s.mkNot(fx)));
    a->addEffect(s, Effect(s, fy, s.mkTrue(), s.mkOr(fx, fz)));
    p.addAction(a);
    // Never applicable
    auto never = std::make_shared<Action>("never", std::vector<const Parameter*>());
    never->addPrecondition(s, s.mkAnd(fx, s.mkNot(fx)));
    never->addEffect(s, Effect(s, fz, s.mkTrue(), s.mkTrue()));
    p.addAction(never);
    p.addGoal(s.mkAnd(fy, s.mkOr(fz, s.mkTrue())));

    DisjunctiveConditionsRemover dcr;
    auto result = dcr.compile(p);
    const Problem& q = *result.problem;
    assert(actionNames(q) == std::vector<std::string>{"a"});
    assert(q.action("a")->preconditions().empty());
    const auto& effects = q.action("a")->effects();
    assert(effects.size() == 2);
    assert(effects[0].condition() == fx);
    assert(effects[1].condition() == fz);
    // A single disjunct needs no auxiliary action
    assert(q.goals() == std::vector<Expr>{fy});
    assert(!q.hasFluent("goal_reached"));
}

void testRejected(Environment& env) {
    ExpressionStore& s = env.exprs();
    Problem p(env, "reserved");
    const Fluent* x = env.fluent("x", env.types().boolType());
    p.addFluent(x, s.mkFalse());
    auto a = std::make_shared<Action>("a__1__", std::vector<const Parameter*>());
    a->addEffect(s, Effect(s, s.mkFluentExp(x), s.mkTrue(), s.mkTrue()));
    p.addAction(a);
    p.addGoal(s.mkFluentExp(x));

    DisjunctiveConditionsRemover dcr;
    bool raised = false;
    try {
        dcr.compile(p);
    } catch (const ProblemDefinitionError&) {
        raised = true;
    }
    assert(raised);

    auto trajectory = ExampleProblems::get(env, "trajectory");
    assert(!dcr.supports(trajectory.problem->kind()));
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testSiblings(env);
    testGuardsAndSimpleGoals(env);
    testRejected(env);

    Log::i("All disjunctive conditions remover tests passed\n");
}
