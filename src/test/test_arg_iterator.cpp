
#include <assert.h>
#include <algorithm>

#include "util/timer.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"

#include "algo/arg_iterator.h"
#include "data/environment.h"
#include "data/problem.h"
#include "util/errors.h"

std::vector<Expr> ints(ExpressionStore& store, std::vector<int> values) {
    std::vector<Expr> out;
    for (int v : values) out.push_back(store.mkInt(v));
    return out;
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Environment env;
    ExpressionStore& store = env.exprs();

    {
        auto args1 = ints(store, {1, 2, 3, 4});
        auto args2 = ints(store, {5});
        auto args3 = ints(store, {6, 7});
        std::vector<std::vector<Expr>> eligibleArgs{args1, args2, args3};

        size_t numInstantiations = 0;
        for (const auto& args : ArgIterator(std::move(eligibleArgs))) {
            assert(args.size() == 3);
            Log::d("%s\n", TOSTR(store, args));
            numInstantiations++;
        }
        assert(numInstantiations == args1.size() * args2.size() * args3.size());
    }

    {
        // First position varies fastest
        auto args1 = ints(store, {1, 2});
        auto args2 = ints(store, {3, 4});
        std::vector<std::vector<Expr>> order;
        for (const auto& args : ArgIterator({args1, args2})) order.push_back(args);
        assert(order.size() == 4);
        assert(order[0] == std::vector<Expr>({args1[0], args2[0]}));
        assert(order[1] == std::vector<Expr>({args1[1], args2[0]}));
        assert(order[2] == std::vector<Expr>({args1[0], args2[1]}));
        assert(order[3] == std::vector<Expr>({args1[1], args2[1]}));
    }

    {
        std::vector<std::vector<Expr>> eligibleArgs{};

        size_t numInstantiations = 0;
        for (const auto& args : ArgIterator(std::move(eligibleArgs))) {
            (void) args;
            numInstantiations++;
        }
        assert(numInstantiations == 0);
    }

    {
        // An empty domain at some position yields nothing
        std::vector<std::vector<Expr>> eligibleArgs{ints(store, {1, 2}), {}};
        ArgIterator it(std::move(eligibleArgs));
        assert(it.size() == 0);
        assert(!(it.begin() != it.end()));
    }
    
    {
        auto args1 = ints(store, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
        auto args2 = ints(store, {1, 2, 3, 4, 5, 6, 7, 8});
        auto args3 = ints(store, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
        auto args4 = ints(store, {1, 2, 3, 4, 5, 6, 7, 8, 9});
        std::vector<std::vector<Expr>> eligibleArgs{args1, args2, args3, args4};

        size_t numInstantiations = 0;
        std::vector<Expr> last;
        for (const auto& args : ArgIterator(std::move(eligibleArgs))) {
            assert(args != last);
            last = args;
            numInstantiations++;
        }
        assert(numInstantiations == args1.size() * args2.size() * args3.size() * args4.size());
    }

    /////// Domains of a problem ////////

    {
        Problem problem(env, "domains");
        const Type* location = env.types().userType("Location");
        const Type* room = env.types().userType("Room", location);
        problem.addObject(env.object("hall", location));
        problem.addObject(env.object("kitchen", room));
        problem.addObject(env.object("bath", room));

        auto domains = ArgIterator::getDomains({env.types().boolType(), env.types().intType(1, 3), room}, problem);
        assert(domains.size() == 3);
        assert(domains[0] == std::vector<Expr>({store.mkTrue(), store.mkFalse()}));
        assert(domains[1] == ints(store, {1, 2, 3}));
        assert(domains[2].size() == 2);
        assert(store.object(domains[2][0])->name == "kitchen");
        assert(problem.domain(location).size() == 3);

        size_t num = 0;
        for (const auto& args : ArgIterator(std::move(domains))) {
            (void) args;
            num++;
        }
        assert(num == 2 * 3 * 2);

        bool thrown = false;
        try {
            problem.domain(env.types().intType());
        } catch (const ProblemDefinitionError&) {
            thrown = true;
        }
        assert(thrown);
    }

    Log::i("All arg iterator tests passed\n");
}
