#ifndef PLANCOMP_PARAMS_H
#define PLANCOMP_PARAMS_H

#include <map>
#include <string>

/*
 * Command line options of the form -key=value or -flag, layered over
 * a fixed set of defaults. A single argument without a leading dash names
 * the example problem.
 */
class Parameters {

private:
    std::map<std::string, std::string> _params;
    std::string _example_name;

public:
    void init(int argc, char** argv);
    void setDefaults();
    void printUsage();
    void printParams();

    // The positional argument if one was given, the -e option otherwise
    std::string getExampleName() const;

    bool isSet(const std::string& name) const;
    bool isNonzero(const std::string& name) const;
    std::string getParam(const std::string& name) const;
    int getIntParam(const std::string& name) const;

private:
    void setParam(const std::string& name, const std::string& value);
    const std::string& lookup(const std::string& name) const;
};

#endif
