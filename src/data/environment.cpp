
#include "data/environment.h"
#include "util/errors.h"

Environment::Environment() : _exprs(_types) {}

template <class T>
static const T* internEntity(std::deque<T>& store, NodeHashMap<std::string, std::vector<const T*>>& byName, 
        const std::string& name, const Type* type) {
    if (type == nullptr) throw TypeError("Entity " + name + " declared without a type");
    auto& list = byName[name];
    for (const T* t : list) if (t->type == type) return t;
    store.emplace_back(name, type);
    list.push_back(&store.back());
    return &store.back();
}

const Object* Environment::object(const std::string& name, const Type* type) {
    if (!type->isUser()) throw TypeError("Object " + name + " must have a user type");
    return internEntity(_objects, _objects_by_name, name, type);
}

const Parameter* Environment::parameter(const std::string& name, const Type* type) {
    return internEntity(_params, _params_by_name, name, type);
}

const Variable* Environment::variable(const std::string& name, const Type* type) {
    return internEntity(_vars, _vars_by_name, name, type);
}

const Variable* Environment::freshVariable(const std::string& base, const Type* type) {
    std::string name = base;
    while (_vars_by_name.count(name)) {
        name = base + "_" + std::to_string(_fresh_var_counter++);
    }
    return variable(name, type);
}

const Fluent* Environment::fluent(const std::string& name, const Type* type, 
        const std::vector<const Parameter*>& signature) {
    if (type == nullptr) throw TypeError("Fluent " + name + " declared without a type");
    _fluents.emplace_back(name, type, signature);
    return &_fluents.back();
}
