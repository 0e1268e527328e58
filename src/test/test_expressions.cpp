
#include <assert.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/errors.h"

#include "data/environment.h"
#include "data/problem.h"
#include "algo/identity_walker.h"
#include "algo/simplifier.h"
#include "algo/nnf.h"
#include "algo/dnf.h"
#include "algo/extractors.h"
#include "algo/quantifier_expander.h"
#include "algo/substituter.h"

template <typename E, typename F>
bool raises(F f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void testHashConsing(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    const Fluent* x = env.fluent("x", b);
    const Fluent* y = env.fluent("y", b);

    Expr e1 = s.mkAnd(s.mkFluentExp(x), s.mkNot(s.mkFluentExp(y)));
    size_t size = s.size();
    Expr e2 = s.mkAnd(s.mkFluentExp(x), s.mkNot(s.mkFluentExp(y)));
    assert(e1 == e2);
    assert(ExprHasher()(e1) == ExprHasher()(e2));
    assert(s.size() == size);

    // Other order, other node
    Expr e3 = s.mkAnd(s.mkNot(s.mkFluentExp(y)), s.mkFluentExp(x));
    assert(e3 != e1);

    assert(s.mkInt(3) == s.mkInt(3));
    assert(s.mkInt(3) != s.mkReal(3));
    assert(s.type(s.mkInt(3))->isInt());
    assert(s.type(e1)->isBool());
}

void testBuilders(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    const Type* location = env.types().userType("Location");
    const Parameter* l = env.parameter("l", location);
    const Fluent* x = env.fluent("x", b);
    const Fluent* at = env.fluent("at", b, {l});
    const Fluent* level = env.fluent("level", env.types().intType(0, 10));
    Expr fx = s.mkFluentExp(x);

    assert(s.mkAnd(std::vector<Expr>()) == s.mkTrue());
    assert(s.mkOr(std::vector<Expr>()) == s.mkFalse());
    assert(s.mkAnd(std::vector<Expr>{fx}) == fx);
    assert(s.mkOr(std::vector<Expr>{fx}) == fx);
    assert(s.mkExists({}, fx) == fx);
    assert(s.mkForall({}, fx) == fx);

    // Ill-typed constructions
    Expr fl = s.mkFluentExp(level);
    assert(raises<TypeError>([&]() {s.mkAnd(fx, fl);}));
    assert(raises<TypeError>([&]() {s.mkNot(fl);}));
    assert(raises<TypeError>([&]() {s.mkPlus(fl, fx);}));
    assert(raises<TypeError>([&]() {s.mkFluentExp(at);}));
    assert(raises<TypeError>([&]() {s.mkFluentExp(at, {s.mkInt(1)});}));
    assert(raises<TypeError>([&]() {s.mkEquals(fx, s.mkTrue());}));
    assert(raises<TypeError>([&]() {s.boolValue(fl);}));

    // Well-typed ones
    const Object* home = env.object("home", location);
    Expr atHome = s.mkFluentExp(at, {s.mkObject(home)});
    assert(s.type(atHome)->isBool());
    assert(s.fluent(atHome) == at);
    assert(s.type(s.mkLE(fl, s.mkInt(3)))->isBool());
    assert(s.mkGE(fl, s.mkInt(3)) == s.mkLE(s.mkInt(3), fl));
}

void testIdentityWalker(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* location = env.types().userType("Location");
    const Variable* v = env.variable("v", location);
    const Parameter* l = env.parameter("l", location);
    const Fluent* at = env.fluent("at", env.types().boolType(), {l});
    const Fluent* level = env.fluent("level", env.types().realType());
    Expr fl = s.mkFluentExp(level);

    Expr e = s.mkAnd({
        s.mkForall({v}, s.mkImplies(s.mkFluentExp(at, {s.mkVariable(v)}), s.mkLT(fl, s.mkReal(2.5)))),
        s.mkExists({v}, s.mkNot(s.mkFluentExp(at, {s.mkVariable(v)}))),
        s.mkEquals(s.mkPlus(fl, s.mkInt(1)), s.mkTimes(fl, s.mkInt(2))),
        s.mkSometimeBefore(s.mkFluentExp(at, {s.mkParam(l)}), s.mkLE(s.mkDiv(fl, s.mkInt(2)), s.mkMinus(fl, s.mkInt(1))))
    });
    IdentityWalker walker(s);
    assert(walker.walk(e) == e);
    // Memoized second walk
    assert(walker.walk(e) == e);
}

void testSimplifier(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    Expr x = s.mkFluentExp(env.fluent("x", b));
    Expr y = s.mkFluentExp(env.fluent("y", b));
    Expr z = s.mkFluentExp(env.fluent("z", b));
    Expr n = s.mkFluentExp(env.fluent("n", env.types().intType()));
    Simplifier simp(s);

    assert(simp.simplify(s.mkAnd(x, s.mkTrue())) == x);
    assert(simp.simplify(s.mkAnd(x, s.mkFalse())) == s.mkFalse());
    assert(simp.simplify(s.mkOr(x, s.mkTrue())) == s.mkTrue());
    assert(simp.simplify(s.mkAnd(x, s.mkNot(x))) == s.mkFalse());
    assert(simp.simplify(s.mkOr(s.mkNot(x), x)) == s.mkTrue());
    assert(simp.simplify(s.mkNot(s.mkNot(x))) == x);
    assert(simp.simplify(s.mkAnd(s.mkAnd(x, y), s.mkAnd(y, z))) == s.mkAnd({x, y, z}));
    assert(simp.simplify(s.mkImplies(s.mkTrue(), y)) == y);
    assert(simp.simplify(s.mkImplies(x, s.mkFalse())) == s.mkNot(x));
    assert(simp.simplify(s.mkIff(s.mkFalse(), y)) == s.mkNot(y));
    assert(simp.simplify(s.mkPlus(s.mkInt(2), s.mkInt(3))) == s.mkInt(5));
    assert(simp.simplify(s.mkPlus(s.mkInt(2), s.mkReal(0.5))) == s.mkReal(2.5));
    assert(simp.simplify(s.mkLE(s.mkInt(2), s.mkInt(3))) == s.mkTrue());
    assert(simp.simplify(s.mkLT(n, n)) == s.mkFalse());
    assert(simp.simplify(s.mkEquals(s.mkMinus(s.mkInt(4), s.mkInt(1)), s.mkInt(3))) == s.mkTrue());
    assert(simp.simplify(s.mkAlways(s.mkOr(x, s.mkTrue()))) == s.mkTrue());

    // Quantifiers
    const Type* location = env.types().userType("Location");
    const Variable* v = env.variable("v", location);
    const Variable* w = env.variable("w", location);
    const Object* home = env.object("home", location);
    const Parameter* l = env.parameter("l", location);
    const Fluent* at = env.fluent("at", b, {l});
    Expr atV = s.mkFluentExp(at, {s.mkVariable(v)});
    assert(simp.simplify(s.mkExists({v, w}, atV)) == s.mkExists({v}, atV));
    assert(simp.simplify(s.mkForall({v}, x)) == x);
    assert(simp.simplify(s.mkExists({v}, s.mkAnd(atV, s.mkEquals(s.mkVariable(v), s.mkObject(home))))) 
        == s.mkFluentExp(at, {s.mkObject(home)}));

    // Idempotence
    Expr e = s.mkOr(s.mkAnd(x, s.mkNot(y)), s.mkAnd(z, s.mkOr(x, s.mkFalse())));
    Expr once = simp.simplify(e);
    assert(simp.simplify(once) == once);

    // Static fluents take their initial value
    Problem p(env, "static");
    const Fluent* fixed = env.fluent("fixed", b);
    const Fluent* changing = env.fluent("changing", b);
    p.addFluent(fixed, s.mkTrue());
    p.addFluent(changing, s.mkFalse());
    auto a = std::make_shared<Action>("a", std::vector<const Parameter*>());
    a->addEffect(s, Effect(s, s.mkFluentExp(changing), s.mkTrue(), s.mkTrue()));
    p.addAction(a);
    Simplifier withProblem(s, &p);
    assert(withProblem.simplify(s.mkAnd(s.mkFluentExp(fixed), s.mkFluentExp(changing))) == s.mkFluentExp(changing));
}

void testNormalForms(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    Expr x = s.mkFluentExp(env.fluent("x", b));
    Expr y = s.mkFluentExp(env.fluent("y", b));
    Expr z = s.mkFluentExp(env.fluent("z", b));
    Nnf nnf(s);

    assert(nnf.get(s.mkImplies(x, y)) == s.mkOr(s.mkNot(x), y));
    assert(nnf.get(s.mkNot(s.mkAnd(x, y))) == s.mkOr(s.mkNot(x), s.mkNot(y)));
    assert(nnf.get(s.mkNot(s.mkOr(x, s.mkNot(y)))) == s.mkAnd(s.mkNot(x), y));
    assert(nnf.get(s.mkIff(x, y)) == s.mkOr(s.mkAnd(x, y), s.mkAnd(s.mkNot(x), s.mkNot(y))));
    assert(nnf.get(s.mkNot(s.mkTrue())) == s.mkFalse());

    const Type* location = env.types().userType("Location");
    const Variable* v = env.variable("v", location);
    const Parameter* l = env.parameter("l", location);
    Expr atV = s.mkFluentExp(env.fluent("at", b, {l}), {s.mkVariable(v)});
    assert(nnf.get(s.mkNot(s.mkExists({v}, atV))) == s.mkForall({v}, s.mkNot(atV)));

    // (x or y) and (z or not x) has three consistent disjuncts
    Dnf dnf(s);
    auto disjuncts = dnf.getDisjuncts(s.mkAnd(s.mkOr(x, y), s.mkOr(z, s.mkNot(x))));
    assert(disjuncts.size() == 3);
    assert(disjuncts[0] == std::vector<Expr>({x, z}));
    assert(disjuncts[1] == std::vector<Expr>({y, z}));
    assert(disjuncts[2] == std::vector<Expr>({y, s.mkNot(x)}));
    assert(dnf.getDisjuncts(s.mkAnd(x, s.mkNot(x))).empty());
    auto tautology = dnf.getDisjuncts(s.mkOr(x, s.mkTrue()));
    assert(tautology.size() == 1 && tautology[0].empty());
    assert(dnf.get(s.mkNot(s.mkAnd(x, y))) == s.mkOr(s.mkNot(x), s.mkNot(y)));
}

void testExtractors(Environment& env) {
    ExpressionStore& s = env.exprs();
    const Type* b = env.types().boolType();
    const Type* location = env.types().userType("Location");
    const Variable* v = env.variable("v", location);
    const Variable* w = env.variable("w", location);
    const Parameter* l = env.parameter("l", location);
    const Fluent* at = env.fluent("at", b, {l});
    Expr atV = s.mkFluentExp(at, {s.mkVariable(v)});
    Expr atW = s.mkFluentExp(at, {s.mkVariable(w)});

    FreeVarsExtractor freeVars(s);
    auto vars = freeVars.get(s.mkAnd(atW, s.mkExists({v}, s.mkAnd(atV, atW))));
    assert(vars.size() == 1 && vars[0] == w);
    vars = freeVars.get(s.mkOr(atV, atW));
    assert(vars.size() == 2 && vars[0] == v && vars[1] == w);

    FluentsExtractor fluents(s);
    auto fes = fluents.get(s.mkOr(atW, s.mkNot(atV)));
    assert(fes.size() == 2 && fes[0] == atW && fes[1] == atV);

    OperatorsExtractor ops(s);
    auto set = ops.get(s.mkExists({v}, s.mkNot(atV)));
    assert(OperatorsExtractor::has(set, OperatorKind::EXISTS));
    assert(OperatorsExtractor::has(set, OperatorKind::NOT));
    assert(!OperatorsExtractor::has(set, OperatorKind::AND));
}

void testQuantifierExpansion(Environment& env) {
    ExpressionStore& s = env.exprs();
    Problem p(env, "expansion");
    const Type* t = env.types().userType("T");
    std::vector<const Object*> objects = {env.object("o1", t), env.object("o2", t), env.object("o3", t)};
    p.addObjects(objects);
    const Parameter* x = env.parameter("x", t);
    const Fluent* pf = env.fluent("P", env.types().boolType(), {x});
    p.addFluent(pf, s.mkFalse());
    const Variable* v = env.variable("x", t);
    Expr body = s.mkFluentExp(pf, {s.mkVariable(v)});

    std::vector<Expr> instances;
    for (const Object* o : objects) instances.push_back(s.mkFluentExp(pf, {s.mkObject(o)}));

    QuantifierExpander expander(s, p);
    assert(expander.expand(s.mkForall({v}, body)) == s.mkAnd(instances));
    assert(expander.expand(s.mkExists({v}, body)) == s.mkOr(instances));

    // Substitution does not reach bound occurrences
    const Parameter* param = env.parameter("y", t);
    Expr withParam = s.mkAnd(s.mkFluentExp(pf, {s.mkParam(param)}), s.mkExists({v}, body));
    Substitution subs({s.mkParam(param), s.mkVariable(v)}, {s.mkObject(objects[0]), s.mkObject(objects[1])});
    Expr substituted = Substituter::substitute(s, withParam, subs);
    assert(substituted == s.mkAnd(instances[0], s.mkExists({v}, body)));
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    testHashConsing(env);
    testBuilders(env);
    testIdentityWalker(env);
    testSimplifier(env);
    testNormalForms(env);
    testExtractors(env);
    testQuantifierExpansion(env);

    Log::i("All expression tests passed\n");
}
