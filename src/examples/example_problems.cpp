
#include "examples/example_problems.h"
#include "util/errors.h"

namespace {

typedef std::vector<const Parameter*> Params;

std::shared_ptr<Action> mkAction(const std::string& name, const Params& params = {}) {
    return std::make_shared<Action>(name, params);
}

void assign(ExpressionStore& s, Action& a, Expr fluent, Expr value, Expr condition = Expr()) {
    a.addEffect(s, Effect(s, fluent, value, condition.valid() ? condition : s.mkTrue()));
}

ExampleProblem basic(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "basic");
    const Fluent* x = env.fluent("x", env.types().boolType());
    p->addFluent(x, s.mkFalse());
    Expr fx = s.mkFluentExp(x);

    auto a = mkAction("a");
    a->addPrecondition(s, s.mkNot(fx));
    assign(s, *a, fx, s.mkTrue());
    p->addAction(a);
    p->addGoal(fx);

    return {"basic", "one fluent, one action with a negative precondition", p, 
        SequentialPlan({ActionInstance(a)})};
}

ExampleProblem basicConditional(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "basic_conditional");
    const Fluent* x = env.fluent("x", env.types().boolType());
    const Fluent* y = env.fluent("y", env.types().boolType());
    p->addFluent(x, s.mkFalse());
    p->addFluent(y, s.mkFalse());
    Expr fx = s.mkFluentExp(x);
    Expr fy = s.mkFluentExp(y);

    auto ax = mkAction("a_x");
    assign(s, *ax, fx, s.mkTrue());
    auto ay = mkAction("a_y");
    assign(s, *ay, fy, s.mkTrue(), fx);
    p->addAction(ax);
    p->addAction(ay);
    p->addGoal(fy);

    return {"basic_conditional", "an effect that only triggers once another action was applied", p, 
        SequentialPlan({ActionInstance(ax), ActionInstance(ay)})};
}

ExampleProblem basicOr(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "basic_or");
    const Type* b = env.types().boolType();
    const Fluent* x = env.fluent("x", b);
    const Fluent* y = env.fluent("y", b);
    const Fluent* z = env.fluent("z", b);
    for (const Fluent* f : {x, y, z}) p->addFluent(f, s.mkFalse());
    Expr fx = s.mkFluentExp(x);
    Expr fy = s.mkFluentExp(y);
    Expr fz = s.mkFluentExp(z);

    auto makeX = mkAction("make_x");
    assign(s, *makeX, fx, s.mkTrue());
    auto makeY = mkAction("make_y");
    assign(s, *makeY, fy, s.mkTrue());
    auto a = mkAction("a");
    a->addPrecondition(s, s.mkOr(fx, fy));
    assign(s, *a, fz, s.mkTrue());
    p->addAction(makeX);
    p->addAction(makeY);
    p->addAction(a);
    p->addGoal(fz);
    p->addGoal(s.mkOr(fx, fy));

    return {"basic_or", "a disjunctive precondition and a disjunctive goal", p, 
        SequentialPlan({ActionInstance(makeX), ActionInstance(a)})};
}

ExampleProblem robot(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "robot");
    const Type* location = env.types().userType("Location");
    const Object* l1 = env.object("l1", location);
    const Object* l2 = env.object("l2", location);
    const Object* l3 = env.object("l3", location);
    p->addObjects({l1, l2, l3});

    const Fluent* robotAt = env.fluent("robot_at", location);
    const Parameter* l = env.parameter("l", location);
    const Fluent* visited = env.fluent("visited", env.types().boolType(), {l});
    p->addFluent(robotAt, s.mkObject(l1));
    p->addFluent(visited, s.mkFalse());
    p->setInitialValue(s.mkFluentExp(visited, {s.mkObject(l1)}), s.mkTrue());

    const Parameter* from = env.parameter("from", location);
    const Parameter* to = env.parameter("to", location);
    auto move = mkAction("move", {from, to});
    move->addPrecondition(s, s.mkEquals(s.mkFluentExp(robotAt), s.mkParam(from)));
    assign(s, *move, s.mkFluentExp(robotAt), s.mkParam(to));
    assign(s, *move, s.mkFluentExp(visited, {s.mkParam(to)}), s.mkTrue());
    p->addAction(move);

    const Variable* v = env.variable("v", location);
    p->addGoal(s.mkForall({v}, s.mkFluentExp(visited, {s.mkVariable(v)})));
    p->addGoal(s.mkEquals(s.mkFluentExp(robotAt), s.mkObject(l3)));
    p->addQualityMetric(QualityMetric::minimizePlanLength());

    return {"robot", "a robot with an object-valued position visiting all locations", p, 
        SequentialPlan({ActionInstance(move, {s.mkObject(l1), s.mkObject(l2)}), 
            ActionInstance(move, {s.mkObject(l2), s.mkObject(l3)})})};
}

ExampleProblem counter(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "counter");
    const Fluent* level = env.fluent("level", env.types().intType(0, 1));
    p->addFluent(level, s.mkInt(0));
    Expr fl = s.mkFluentExp(level);

    auto inc = mkAction("inc");
    inc->addEffect(s, Effect(s, fl, s.mkInt(1), s.mkTrue(), EffectKind::INCREASE));
    auto dec = mkAction("dec");
    dec->addEffect(s, Effect(s, fl, s.mkInt(1), s.mkTrue(), EffectKind::DECREASE));
    p->addAction(inc);
    p->addAction(dec);
    p->addGoal(s.mkEquals(fl, s.mkInt(1)));
    p->addQualityMetric(QualityMetric::minimizeActionCosts({{"inc", s.mkInt(1)}, {"dec", s.mkInt(1)}}));

    return {"counter", "a bounded integer level changed by increase and decrease effects", p, 
        SequentialPlan({ActionInstance(inc)})};
}

ExampleProblem quantifiers(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "quantifiers");
    const Type* location = env.types().userType("Location");
    const Object* l1 = env.object("l1", location);
    const Object* l2 = env.object("l2", location);
    const Object* l3 = env.object("l3", location);
    p->addObjects({l1, l2, l3});

    const Parameter* l = env.parameter("l", location);
    const Fluent* visited = env.fluent("visited", env.types().boolType(), {l});
    const Fluent* done = env.fluent("done", env.types().boolType());
    p->addFluent(visited, s.mkFalse());
    p->addFluent(done, s.mkFalse());
    const Variable* v = env.variable("v", location);
    Expr visitedV = s.mkFluentExp(visited, {s.mkVariable(v)});

    auto visit = mkAction("visit", {l});
    assign(s, *visit, s.mkFluentExp(visited, {s.mkParam(l)}), s.mkTrue());
    auto finish = mkAction("finish");
    finish->addPrecondition(s, s.mkForall({v}, visitedV));
    assign(s, *finish, s.mkFluentExp(done), s.mkTrue());
    auto clear = mkAction("clear");
    clear->addEffect(s, Effect(s, visitedV, s.mkFalse(), s.mkTrue(), EffectKind::ASSIGN, {v}));
    p->addAction(visit);
    p->addAction(finish);
    p->addAction(clear);
    p->addGoal(s.mkFluentExp(done));
    p->addGoal(s.mkExists({v}, visitedV));

    std::vector<ActionInstance> steps;
    for (const Object* o : {l1, l2, l3}) steps.emplace_back(visit, std::vector<Expr>{s.mkObject(o)});
    steps.emplace_back(finish);
    return {"quantifiers", "universal precondition, existential goal and a forall effect", p, 
        SequentialPlan(steps)};
}

ExampleProblem trajectory(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "trajectory");
    const Type* b = env.types().boolType();
    const Fluent* fa = env.fluent("a", b);
    const Fluent* fb = env.fluent("b", b);
    const Fluent* fc = env.fluent("c", b);
    for (const Fluent* f : {fa, fb, fc}) p->addFluent(f, s.mkFalse());
    Expr ea = s.mkFluentExp(fa);
    Expr eb = s.mkFluentExp(fb);
    Expr ec = s.mkFluentExp(fc);

    auto setA = mkAction("set_a");
    assign(s, *setA, ea, s.mkTrue());
    auto setB = mkAction("set_b");
    assign(s, *setB, eb, s.mkTrue());
    auto setC = mkAction("set_c");
    assign(s, *setC, ec, s.mkTrue());
    auto resetA = mkAction("reset_a");
    assign(s, *resetA, ea, s.mkFalse());
    for (const auto& a : {setA, setB, setC, resetA}) p->addAction(a);

    p->addTrajectoryConstraint(s.mkSometime(ec));
    p->addTrajectoryConstraint(s.mkSometimeBefore(eb, ea));
    p->addTrajectoryConstraint(s.mkAtMostOnce(ea));
    p->addTrajectoryConstraint(s.mkSometimeAfter(ea, ec));
    p->addTrajectoryConstraint(s.mkAlways(s.mkOr(s.mkNot(ec), eb)));
    p->addStateInvariant(s.mkOr(s.mkNot(eb), ea));

    return {"trajectory", "every kind of trajectory constraint plus a state invariant", p, 
        SequentialPlan({ActionInstance(setA), ActionInstance(setB), ActionInstance(setC)})};
}

ExampleProblem sensing(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "sensing");
    const Fluent* lightOn = env.fluent("light_on", env.types().boolType());
    const Fluent* checked = env.fluent("checked", env.types().boolType());
    p->addFluent(lightOn, s.mkFalse());
    p->addFluent(checked, s.mkFalse());
    Expr fl = s.mkFluentExp(lightOn);

    auto switchOn = mkAction("switch_on");
    switchOn->addPrecondition(s, s.mkNot(fl));
    assign(s, *switchOn, fl, s.mkTrue());
    auto check = std::make_shared<Action>("check_light", Params(), SensingBody());
    check->addPrecondition(s, fl);
    check->addObservedFluent(s, fl);
    assign(s, *check, s.mkFluentExp(checked), s.mkTrue());
    p->addAction(switchOn);
    p->addAction(check);
    p->addGoal(s.mkFluentExp(checked));

    return {"sensing", "a sensing action observing a fluent", p, 
        SequentialPlan({ActionInstance(switchOn), ActionInstance(check)})};
}

ExampleProblem durative(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto p = std::make_shared<Problem>(env, "durative");
    const Type* b = env.types().boolType();
    const Fluent* x = env.fluent("x", b);
    const Fluent* y = env.fluent("y", b);
    const Fluent* z = env.fluent("z", b);
    for (const Fluent* f : {x, y, z}) p->addFluent(f, s.mkFalse());
    Expr fx = s.mkFluentExp(x);
    Expr fy = s.mkFluentExp(y);
    Expr fz = s.mkFluentExp(z);

    DurativeBody body;
    body.duration = DurationInterval(s.mkInt(2), s.mkInt(4));
    auto work = std::make_shared<Action>("work", Params(), body);
    work->addCondition(s, TimeInterval(Timing::start()), s.mkOr(fx, fy));
    work->addCondition(s, TimeInterval(Timing::end()), s.mkNot(fz));
    work->addEffect(s, Timing::end(), Effect(s, fz, s.mkTrue(), s.mkTrue()));
    p->addAction(work);
    p->addTimedEffect(Timing::globalStart(1), Effect(s, fy, s.mkTrue(), s.mkTrue()));
    p->addGoal(fz);

    return {"durative", "a durative action with a disjunctive start condition and a timed effect", p, 
        std::nullopt};
}

typedef ExampleProblem (*Builder)(Environment&);

const std::vector<std::pair<std::string, Builder>>& builders() {
    static const std::vector<std::pair<std::string, Builder>> table = {
        {"basic", basic},
        {"basic_conditional", basicConditional},
        {"basic_or", basicOr},
        {"robot", robot},
        {"counter", counter},
        {"quantifiers", quantifiers},
        {"trajectory", trajectory},
        {"sensing", sensing},
        {"durative", durative}
    };
    return table;
}

}

std::vector<std::string> ExampleProblems::names() {
    std::vector<std::string> out;
    for (const auto& [name, builder] : builders()) out.push_back(name);
    return out;
}

ExampleProblem ExampleProblems::get(Environment& env, const std::string& name) {
    for (const auto& [n, builder] : builders()) if (n == name) return builder(env);
    throw UsageError("Unknown example problem \"" + name + "\"");
}

std::vector<ExampleProblem> ExampleProblems::all(Environment& env) {
    std::vector<ExampleProblem> out;
    for (const auto& [name, builder] : builders()) out.push_back(builder(env));
    return out;
}
