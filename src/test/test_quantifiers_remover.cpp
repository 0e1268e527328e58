
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "compilers/quantifiers_remover.h"
#include "examples/example_problems.h"
#include "plan/plan_replayer.h"
#include "plan/plan_validator.h"

void testExample(Environment& env) {
    ExpressionStore& s = env.exprs();
    auto example = ExampleProblems::get(env, "quantifiers");
    const Problem& p = *example.problem;
    assert(p.kind().has("UNIVERSAL_CONDITIONS"));
    assert(p.kind().has("EXISTENTIAL_CONDITIONS"));
    assert(p.kind().has("FORALL_EFFECTS"));

    QuantifiersRemover qr;
    auto result = qr.compile(p);
    const Problem& q = *result.problem;
    assert(!q.kind().has("UNIVERSAL_CONDITIONS"));
    assert(!q.kind().has("EXISTENTIAL_CONDITIONS"));
    assert(!q.kind().has("FORALL_EFFECTS"));
    assert(q.kind().has("DISJUNCTIVE_CONDITIONS"));

    const Fluent* visited = p.fluent("visited");
    std::vector<Expr> atoms;
    for (const char* name : {"l1", "l2", "l3"}) atoms.push_back(s.mkFluentExp(visited, {s.mkObject(p.object(name))}));

    // Names and parameters are kept, only the formulas change
    assert(q.actions().size() == 3);
    assert(q.action("visit")->parameters().size() == 1);
    assert(q.action("visit")->effects() == p.action("visit")->effects());
    assert(q.action("finish")->preconditions() == std::vector<Expr>{s.mkAnd(atoms)});
    const Action& clear = *q.action("clear");
    assert(clear.effects().size() == 3);
    for (size_t i = 0; i < 3; i++) {
        assert(clear.effects()[i].fluent() == atoms[i]);
        assert(!clear.effects()[i].isForall());
    }
    assert(q.goals()[0] == s.mkFluentExp(p.fluent("done")));
    assert(q.goals()[1] == s.mkOr(atoms));

    PlanReplayer replayer(result);
    SequentialPlan compiled = replayer.replay(*example.plan);
    assert(PlanValidator(q).validate(compiled).valid);
    SequentialPlan back = compiled.mapBack(result.backMap);
    assert(back.actions == example.plan->actions);
    assert(PlanValidator(p).validate(back).valid);

    // finish before every location is visited
    SequentialPlan early({compiled.actions[0], compiled.actions[3]});
    auto res = PlanValidator(q).validate(early);
    assert(!res.valid && res.failedStep == 1);
}

void testNestedAndEmpty(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    const Type* node = env.types().userType("Node");
    const Type* ghost = env.types().userType("Ghost");
    Problem p(env, "graph");
    const Object* n1 = env.object("n1", node);
    const Object* n2 = env.object("n2", node);
    p.addObjects({n1, n2});
    p.addUserType(ghost);
    const Parameter* from = env.parameter("from", node);
    const Parameter* to = env.parameter("to", node);
    const Fluent* edge = env.fluent("edge", b, {from, to});
    const Parameter* g = env.parameter("g", ghost);
    const Fluent* haunted = env.fluent("haunted", b, {g});
    p.addFluent(edge, s.mkFalse());
    p.addFluent(haunted, s.mkFalse());

    // The action parameter stays free inside the expansion
    const Variable* v = env.variable("v", node);
    const Variable* w = env.variable("w", node);
    auto hop = std::make_shared<Action>("hop", std::vector<const Parameter*>{from});
    hop->addPrecondition(s, s.mkExists({v}, s.mkFluentExp(edge, {s.mkParam(from), s.mkVariable(v)})));
    p.addAction(hop);
    p.addGoal(s.mkForall({v, w}, s.mkFluentExp(edge, {s.mkVariable(v), s.mkVariable(w)})));
    const Variable* x = env.variable("x", ghost);
    p.addGoal(s.mkForall({x}, s.mkFluentExp(haunted, {s.mkVariable(x)})));
    p.addGoal(s.mkNot(s.mkExists({x}, s.mkFluentExp(haunted, {s.mkVariable(x)}))));

    QuantifiersRemover qr;
    auto result = qr.compile(p);
    const Problem& q = *result.problem;
    Expr pf = s.mkParam(from);
    Expr o1 = s.mkObject(n1);
    Expr o2 = s.mkObject(n2);
    assert(q.action("hop")->preconditions() == std::vector<Expr>{
        s.mkOr(s.mkFluentExp(edge, {pf, o1}), s.mkFluentExp(edge, {pf, o2}))});
    // The first variable varies fastest
    assert(q.goals()[0] == s.mkAnd({s.mkFluentExp(edge, {o1, o1}), s.mkFluentExp(edge, {o2, o1}), 
        s.mkFluentExp(edge, {o1, o2}), s.mkFluentExp(edge, {o2, o2})}));
    // Quantifiers over an empty type; a goal that became true is dropped
    assert(q.goals().size() == 2);
    assert(q.goals()[1] == s.mkNot(s.mkFalse()));
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testExample(env);
    testNestedAndEmpty(env);

    Log::i("All quantifiers remover tests passed\n");
}
