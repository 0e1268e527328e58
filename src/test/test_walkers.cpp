
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "algo/regressor.h"
#include "algo/state_evaluator.h"
#include "algo/usertype_fluents_walker.h"
#include "plan/state.h"

template <typename E, typename F>
bool raises(F f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void testRegression(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    Expr x = s.mkFluentExp(env.fluent("x", b));
    Expr y = s.mkFluentExp(env.fluent("y", b));
    Expr z = s.mkFluentExp(env.fluent("z", b));
    Expr c = s.mkFluentExp(env.fluent("c", b));
    Expr n = s.mkFluentExp(env.fluent("n", env.types().intType()));

    // x := true if c; y := false
    std::vector<Effect> effects;
    effects.emplace_back(s, x, s.mkTrue(), c);
    effects.emplace_back(s, y, s.mkFalse(), s.mkTrue());
    Regressor regressor(s, effects);

    assert(regressor.gamma(x, true) == c);
    assert(regressor.gamma(x, false) == s.mkFalse());
    assert(regressor.regress(x) == s.mkOr(c, x));
    assert(regressor.regress(y) == s.mkFalse());
    assert(regressor.regress(z) == z);
    assert(regressor.regress(s.mkNot(y)) == s.mkTrue());
    assert(regressor.regress(s.mkAnd(z, s.mkNot(x))) == s.mkAnd(z, s.mkNot(s.mkOr(c, x))));

    // Formulas over untouched fluents are a fixed point
    Expr untouched = s.mkOr(z, s.mkNot(c));
    assert(regressor.regress(untouched) == untouched);
    assert(regressor.regress(regressor.regress(untouched)) == untouched);

    assert(raises<UnsupportedConstructError>([&]() {regressor.regress(s.mkLE(n, s.mkInt(2)));}));
}

void testStateEvaluation(Environment& env) {
    ExpressionStore& s = env.exprs();
    Problem p(env, "evaluation");
    const Type* room = env.types().userType("Room");
    const Object* r1 = env.object("r1", room);
    const Object* r2 = env.object("r2", room);
    p.addObjects({r1, r2});
    const Parameter* r = env.parameter("r", room);
    const Fluent* clean = env.fluent("clean", env.types().boolType(), {r});
    const Fluent* dirt = env.fluent("dirt", env.types().intType(0, 5), {r});
    p.addFluent(clean, s.mkFalse());
    p.addFluent(dirt, s.mkInt(3));
    p.setInitialValue(s.mkFluentExp(clean, {s.mkObject(r1)}), s.mkTrue());
    p.setInitialValue(s.mkFluentExp(dirt, {s.mkObject(r1)}), s.mkInt(0));

    State state(p);
    assert(state.size() == 4);
    StateEvaluator evaluator(s, p);

    const Variable* v = env.variable("v", room);
    Expr cleanV = s.mkFluentExp(clean, {s.mkVariable(v)});
    Expr dirtV = s.mkFluentExp(dirt, {s.mkVariable(v)});
    assert(evaluator.holds(s.mkExists({v}, cleanV), state));
    assert(!evaluator.holds(s.mkForall({v}, cleanV), state));
    assert(evaluator.holds(s.mkForall({v}, s.mkImplies(cleanV, s.mkEquals(dirtV, s.mkInt(0)))), state));

    Expr total = s.mkPlus(s.mkFluentExp(dirt, {s.mkObject(r1)}), s.mkFluentExp(dirt, {s.mkObject(r2)}));
    assert(evaluator.evaluate(total, state) == s.mkInt(3));
    assert(evaluator.evaluate(s.mkDiv(total, s.mkInt(2)), state) == s.mkReal(1.5));

    // Equalities over different numbers evaluate instead of being rejected
    Expr dirt2 = s.mkFluentExp(dirt, {s.mkObject(r2)});
    assert(!evaluator.holds(s.mkEquals(dirt2, s.mkInt(0)), state));
    assert(evaluator.holds(s.mkEquals(dirt2, s.mkReal(3.0)), state));
    assert(evaluator.holds(s.mkLT(s.mkInt(0), dirt2), state));
    assert(evaluator.evaluate(s.mkEquals(s.mkInt(0), s.mkInt(1)), state) == s.mkFalse());

    state.set(s.mkFluentExp(clean, {s.mkObject(r2)}), s.mkTrue());
    assert(evaluator.holds(s.mkForall({v}, cleanV), state));

    // Not ground
    assert(raises<UsageError>([&]() {evaluator.evaluate(s.mkFluentExp(clean, {s.mkParam(r)}), state);}));
    assert(raises<TypeError>([&]() {evaluator.holds(total, state);}));
}

void testUsertypeFluents(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    const Type* location = env.types().userType("Place");
    const Type* robot = env.types().userType("Robot");
    const Object* home = env.object("home", location);
    const Object* rob = env.object("rob", robot);
    const Parameter* rp = env.parameter("rp", robot);
    const Parameter* lp = env.parameter("lp", location);

    const Fluent* pos = env.fluent("pos", location, {rp});
    const Fluent* posBool = env.fluent("pos", b, {rp, lp});
    FlatHashMap<const Fluent*, const Fluent*> newFluents;
    newFluents[pos] = posBool;
    UsertypeFluentsWalker walker(env, newFluents);

    // pos(rob) = home  ==>  pos(rob, home)
    Expr atHome = s.mkEquals(s.mkFluentExp(pos, {s.mkObject(rob)}), s.mkObject(home));
    assert(walker.removeFromCondition(atHome) == s.mkFluentExp(posBool, {s.mkObject(rob), s.mkObject(home)}));

    // Untouched expressions stay as they are
    const Fluent* charged = env.fluent("charged", b, {rp});
    Expr isCharged = s.mkFluentExp(charged, {s.mkObject(rob)});
    assert(walker.removeFromCondition(isCharged) == isCharged);

    // Nested occurrence inside another fluent introduces one existential
    const Fluent* lit = env.fluent("lit", b, {lp});
    Expr litPos = s.mkFluentExp(lit, {s.mkFluentExp(pos, {s.mkObject(rob)})});
    Expr rewritten = walker.removeFromCondition(litPos);
    assert(s.is(rewritten, OperatorKind::EXISTS));
    assert(s.variables(rewritten).size() == 1);
    assert(s.variables(rewritten)[0]->type == location);
    const auto& conj = s.args(s.arg(rewritten, 0));
    assert(conj.size() == 2);
    assert(s.fluent(conj[0]) == lit);
    assert(s.fluent(conj[1]) == posBool);

    // A bare user-type value is no condition
    assert(raises<ProblemDefinitionError>([&]() {walker.removeFromCondition(s.mkFluentExp(pos, {s.mkObject(rob)}));}));
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testRegression(env);
    testStateEvaluation(env);
    testUsertypeFluents(env);

    Log::i("All walker tests passed\n");
}
