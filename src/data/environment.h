#ifndef PLANCOMP_ENVIRONMENT_H
#define PLANCOMP_ENVIRONMENT_H

#include <string>
#include <deque>
#include <vector>

#include "data/types.h"
#include "data/entities.h"
#include "data/expression_store.h"
#include "util/hashmap.h"

/*
 * Modeling context: owns the type manager, the expression store and all
 * objects, parameters, variables and fluents referenced by expressions.
 * Passed by reference to everything that creates or rewrites expressions;
 * must outlive every problem built in it.
 */
class Environment {

private:
    TypeManager _types;
    ExpressionStore _exprs;

    std::deque<Object> _objects;
    std::deque<Parameter> _params;
    std::deque<Variable> _vars;
    std::deque<Fluent> _fluents;

    // Maps an entity name to all entities of that name (one per type)
    NodeHashMap<std::string, std::vector<const Object*>> _objects_by_name;
    NodeHashMap<std::string, std::vector<const Parameter*>> _params_by_name;
    NodeHashMap<std::string, std::vector<const Variable*>> _vars_by_name;

    int _fresh_var_counter = 0;

public:
    Environment();
    Environment(const Environment& other) = delete;

    TypeManager& types() {return _types;}
    ExpressionStore& exprs() {return _exprs;}
    const ExpressionStore& exprs() const {return _exprs;}

    // Interned by (name, type)
    const Object* object(const std::string& name, const Type* type);
    const Parameter* parameter(const std::string& name, const Type* type);
    const Variable* variable(const std::string& name, const Type* type);
    // Variable whose name is not used by any other variable of this environment
    const Variable* freshVariable(const std::string& base, const Type* type);

    // Fluents are never interned: each call declares a new fluent.
    const Fluent* fluent(const std::string& name, const Type* type, 
            const std::vector<const Parameter*>& signature = {});
};

#endif
