#ifndef PLANCOMP_ERRORS_H
#define PLANCOMP_ERRORS_H

#include <exception>
#include <string>

// Base of every error raised by the modeling layer and the compilers.
class PlanningException : public std::exception {
protected:
    std::string _msg;
public:
    explicit PlanningException(std::string&& msg) : _msg(std::move(msg)) {}
    ~PlanningException() override {}
    const char* what() const noexcept override { return _msg.c_str(); }
    const std::string& msg() const { return _msg; }
};

// Ill-formed problem: name clashes, violated initial constraints,
// non-constant initial values, inputs a compiler cannot rewrite.
class ProblemDefinitionError : public PlanningException {
public:
    explicit ProblemDefinitionError(std::string&& msg) : PlanningException(std::move(msg)) {}
};

// Free variables of an effect differ from its forall variables.
class UnboundVariablesError : public PlanningException {
public:
    explicit UnboundVariablesError(std::string&& msg) : PlanningException(std::move(msg)) {}
};

class ConflictingEffectsError : public PlanningException {
public:
    explicit ConflictingEffectsError(std::string&& msg) : PlanningException(std::move(msg)) {}
};

// A walker reached an operator it has no rule for.
class UnsupportedConstructError : public PlanningException {
public:
    explicit UnsupportedConstructError(std::string&& msg) : PlanningException(std::move(msg)) {}
};

class TypeError : public PlanningException {
public:
    explicit TypeError(std::string&& msg) : PlanningException(std::move(msg)) {}
};

// API misuse: wrong compilation kind, unknown flags or options.
class UsageError : public PlanningException {
public:
    explicit UsageError(std::string&& msg) : PlanningException(std::move(msg)) {}
};

#endif
