#ifndef PLANCOMP_ENTITIES_H
#define PLANCOMP_ENTITIES_H

#include <string>
#include <vector>

#include "data/types.h"

struct Object {
    std::string name;
    const Type* type;
    Object(const std::string& name, const Type* type) : name(name), type(type) {}
};

// Formal parameter of an action or of a fluent signature
struct Parameter {
    std::string name;
    const Type* type;
    Parameter(const std::string& name, const Type* type) : name(name), type(type) {}
};

// Variable bound by a quantifier or by a forall effect
struct Variable {
    std::string name;
    const Type* type;
    Variable(const std::string& name, const Type* type) : name(name), type(type) {}
};

struct Fluent {
    std::string name;
    const Type* type;
    std::vector<const Parameter*> signature;
    Fluent(const std::string& name, const Type* type, const std::vector<const Parameter*>& signature) : 
        name(name), type(type), signature(signature) {}

    size_t arity() const {return signature.size();}
};

#endif
