#include <iostream>
#include <exception>
#include <cstdlib>

#include "data/environment.h"
#include "compilers/compiler_factory.h"
#include "examples/example_problems.h"
#include "plan/plan_replayer.h"
#include "plan/plan_validator.h"
#include "util/errors.h"
#include "util/log.h"
#include "util/names.h"
#include "util/params.h"
#include "util/timer.h"

#ifndef PLANCOMP_VERSION
#define PLANCOMP_VERSION "(dbg)"
#endif

void outputBanner(bool colors) {
    if (colors) std::cout << Modifier(Code::FG_CYAN).str();
    std::cout << "  p l a n c o m p\n";
    if (colors) std::cout << Modifier(Code::FG_DEFAULT).str();
}

bool validateRoundTrip(const ExampleProblem& example, const CompilerResult& result) {

    ExpressionStore& store = example.problem->exprs();
    if (!example.plan.has_value()) {
        Log::i("Example %s has no sequential plan; nothing to validate\n", example.name.c_str());
        return true;
    }

    ValidationResult original = PlanValidator(*example.problem).validate(*example.plan);
    if (!original.valid) {
        Log::e("Plan of example %s is invalid: %s\n", example.name.c_str(), original.reason.c_str());
        return false;
    }

    SequentialPlan compiledPlan = PlanReplayer(result).replay(*example.plan);
    Log::i("Compiled plan: %s\n", TOSTR(store, compiledPlan));
    ValidationResult compiled = PlanValidator(*result.problem).validate(compiledPlan);
    if (!compiled.valid) {
        Log::e("Compiled plan is invalid: %s\n", compiled.reason.c_str());
        return false;
    }

    SequentialPlan mapped = compiledPlan.mapBack(result.backMap);
    Log::i("Plan mapped back: %s\n", TOSTR(store, mapped));
    ValidationResult back = PlanValidator(*example.problem).validate(mapped);
    if (!back.valid) {
        Log::e("Plan mapped back is invalid: %s\n", back.reason.c_str());
        return false;
    }
    if (back.metricValue.has_value()) Log::i("Metric value: %s\n", Names::to_string(*back.metricValue).c_str());
    Log::i("Round trip valid\n");
    return true;
}

int run(Parameters& params) {

    std::string name = params.getExampleName();
    if (name == "list") {
        for (const auto& n : ExampleProblems::names()) Log::log_notime(Log::V0_ESSENTIAL, "%s\n", n.c_str());
        return 0;
    }
    if (name.empty()) {
        Log::w("Please specify an example problem. Use -e=list to list them and -h for help.\n");
        return 1;
    }

    Environment env;
    ExampleProblem example = ExampleProblems::get(env, name);
    Log::i("Example %s: %s\n", example.name.c_str(), example.description.c_str());
    Log::v("Problem kind: %s\n", example.problem->kind().toString().c_str());

    std::vector<CompilationKind> kinds;
    if (params.getParam("c") == "auto") kinds = CompilerFactory::defaultKinds(example.problem->kind());
    else kinds = CompilerFactory::parseKinds(params.getParam("c"));
    if (kinds.empty()) {
        Log::i("Problem %s needs no compilation\n", example.problem->name().c_str());
        return 0;
    }

    std::string steps;
    for (CompilationKind k : kinds) steps += std::string(steps.empty() ? "" : ",") + CompilerFactory::shortName(k);
    Log::i("Compilation steps: %s\n", steps.c_str());

    auto pipeline = CompilerFactory::pipeline(kinds);
    CompilerResult result = pipeline->compile(*example.problem);
    Log::i("Compiled problem: %i actions, %i fluents\n", 
        (int) result.problem->actions().size(), (int) result.problem->fluents().size());
    Log::i("Resulting kind: %s\n", result.problem->kind().toString().c_str());

    if (params.isNonzero("pp")) {
        Log::log_notime(Log::V0_ESSENTIAL, "%s\n", Names::to_string(*result.problem).c_str());
    }

    if (params.isNonzero("vp") && !validateRoundTrip(example, result)) return 1;
    return 0;
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    try {
        params.init(argc, argv);
    } catch (const UsageError& e) {
        Log::init(Log::V2_INFORMATION, false);
        Log::e("%s\n", e.what());
        return 1;
    }

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    if (verbosity >= Log::V2_INFORMATION) {
        outputBanner(params.isNonzero("co"));
        Log::log_notime(Log::V0_ESSENTIAL, "  version %s\n\n", PLANCOMP_VERSION);
    }

    if (params.isSet("h") || params.isSet("help")) {
        params.printUsage();
        return 0;
    }

    try {
        int result = run(params);
        Log::i("Exiting %s.\n", result == 0 ? "happily" : "with errors");
        return result;
    } catch (const PlanningException& e) {
        Log::e("%s\n", e.what());
        return 1;
    }
}
