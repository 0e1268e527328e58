
#include <cstdlib>

#include "util/params.h"
#include "util/errors.h"
#include "util/log.h"

void Parameters::init(int argc, char** argv) {
    setDefaults();
    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg.empty() || arg[0] != '-') {
            if (!_example_name.empty()) throw UsageError("Unrecognized parameter " + arg);
            _example_name = arg;
            continue;
        }
        size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            // Bare flag: switches a zero default on, else is just marked as present
            std::string name = arg.substr(1);
            auto it = _params.find(name);
            if (it == _params.end()) setParam(name, "");
            else if (it->second == "0") it->second = "1";
        } else {
            setParam(arg.substr(1, eq-1), arg.substr(eq+1));
        }
    }
}

void Parameters::setDefaults() {
    setParam("c", "auto"); // compilation kinds to apply
    setParam("co", "0"); // colored output
    setParam("e", ""); // example problem
    setParam("pp", "0"); // print compiled problem
    setParam("v", "2"); // verbosity
    setParam("vp", "1"); // validate back-translated plan
}

void Parameters::printUsage() {

    Log::setForcePrint(true);

    Log::i("Usage: plancomp [<example>] [options]\n");
    Log::i("  <example>  Name of an example problem (same as -e=<example>).\n");
    Log::i("\n");
    Log::i("Option syntax: -OPTION or -OPTION=VALUE .\n");
    Log::i("\n");
    Log::i(" -c=<kinds>          Comma-separated compilation kinds, applied in order:\n");
    Log::i("                     gr (grounding), qr (quantifiers), ncr (negative conditions),\n");
    Log::i("                     dcr (disjunctive conditions), btr (bounded types),\n");
    Log::i("                     tcr (trajectory constraints), ufr (user-type fluents),\n");
    Log::i("                     cer (conditional effects); or auto to derive them from the problem kind\n");
    Log::i(" -co=<0|1>           Colored terminal output\n");
    Log::i(" -e=<example>        Example problem to compile; -e=list lists all examples\n");
    Log::i(" -h                  Print this usage and exit\n");
    Log::i(" -pp=<0|1>           Print the compiled problem\n");
    Log::i(" -v=<verb>           Verbosity: 0=essential 1=warnings 2=information 3=verbose 4=debug\n");
    Log::i(" -vp=<0|1>           Replay the example's plan on the compiled problem and validate\n");
    Log::i("                     the plan mapped back to the original problem\n");
    Log::i("\n");
    printParams();
    Log::setForcePrint(false);
}

void Parameters::printParams() {
    std::string out;
    for (const auto& [name, value] : _params) {
        out += "-" + name;
        if (!value.empty()) out += "=" + value;
        out += " ";
    }
    Log::i("Called with parameters: %s\n", out.c_str());
}

std::string Parameters::getExampleName() const {
    return _example_name.empty() ? getParam("e") : _example_name;
}

void Parameters::setParam(const std::string& name, const std::string& value) {
    _params[name] = value;
}

const std::string& Parameters::lookup(const std::string& name) const {
    auto it = _params.find(name);
    if (it == _params.end()) throw UsageError("Unknown parameter -" + name);
    return it->second;
}

bool Parameters::isSet(const std::string& name) const {
    return _params.count(name);
}

bool Parameters::isNonzero(const std::string& name) const {
    return getIntParam(name) != 0;
}

std::string Parameters::getParam(const std::string& name) const {
    return lookup(name);
}

int Parameters::getIntParam(const std::string& name) const {
    return std::atoi(lookup(name).c_str());
}
