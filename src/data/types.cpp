
#include <cmath>
#include <cstdio>

#include "data/types.h"
#include "util/errors.h"

bool Type::isSubtypeOf(const Type* other) const {
    const Type* t = this;
    while (t != nullptr) {
        if (t == other) return true;
        t = t->_father;
    }
    return false;
}

bool Type::accepts(const Type* actual) const {
    if (actual == this) return true;
    if (isBool() || actual->isBool()) return isBool() && actual->isBool();
    if (isUser() || actual->isUser()) {
        return isUser() && actual->isUser() && actual->isSubtypeOf(this);
    }
    // Numbers: an int is a real, never the other way round
    if (isInt() && actual->isReal()) return false;
    // Bounded numbers: the intervals must overlap
    double lower = hasLowerBound() ? lowerBound() : -INFINITY;
    double upper = hasUpperBound() ? upperBound() : INFINITY;
    double aLower = actual->hasLowerBound() ? actual->lowerBound() : -INFINITY;
    double aUpper = actual->hasUpperBound() ? actual->upperBound() : INFINITY;
    return !(upper < aLower || aUpper < lower);
}

static std::string numToString(double d, bool integral) {
    if (integral) return std::to_string((long long) d);
    std::string s = std::to_string(d);
    s.erase(s.find_last_not_of('0') + 1);
    if (s.back() == '.') s.pop_back();
    return s;
}

std::string Type::toString() const {
    if (!isNumeric() || !isBounded()) return _name;
    std::string out = _name + "[";
    out += hasLowerBound() ? numToString(lowerBound(), isInt()) : "-inf";
    out += ", ";
    out += hasUpperBound() ? numToString(upperBound(), isInt()) : "inf";
    return out + "]";
}

TypeManager::TypeManager() {
    _types.emplace_back(TypeKind::BOOL, "bool", nullptr, std::nullopt, std::nullopt);
    _bool = &_types.back();
}

const Type* TypeManager::intType(std::optional<double> lower, std::optional<double> upper) {
    if (lower && *lower != std::floor(*lower)) throw TypeError("Non-integral lower bound of integer type");
    if (upper && *upper != std::floor(*upper)) throw TypeError("Non-integral upper bound of integer type");
    if (lower && upper && *lower > *upper) throw TypeError("Empty integer type: lower bound exceeds upper bound");
    return get(TypeKind::INT, "integer", nullptr, lower, upper);
}

const Type* TypeManager::realType(std::optional<double> lower, std::optional<double> upper) {
    if (lower && upper && *lower > *upper) throw TypeError("Empty real type: lower bound exceeds upper bound");
    return get(TypeKind::REAL, "real", nullptr, lower, upper);
}

const Type* TypeManager::userType(const std::string& name, const Type* father) {
    if (father != nullptr && !father->isUser()) 
        throw TypeError("Father of user type " + name + " must be a user type");
    auto it = _user_types.find(name);
    if (it != _user_types.end()) {
        if (it->second->father() != father) 
            throw TypeError("User type " + name + " redeclared with a different father");
        return it->second;
    }
    _types.emplace_back(TypeKind::USER, name, father, std::nullopt, std::nullopt);
    _user_types[name] = &_types.back();
    return &_types.back();
}

const Type* TypeManager::unbounded(const Type* type) {
    if (type->isInt()) return intType();
    if (type->isReal()) return realType();
    return type;
}

const Type* TypeManager::get(TypeKind kind, const std::string& name, const Type* father, 
        std::optional<double> lower, std::optional<double> upper) {
    char bounds[64];
    snprintf(bounds, sizeof(bounds), "%c%.17g|%c%.17g", lower ? 'l' : '-', lower ? *lower : 0.0, 
            upper ? 'u' : '-', upper ? *upper : 0.0);
    std::string key = std::to_string((int) kind) + "|" + name + "|" + bounds;
    auto it = _index.find(key);
    if (it != _index.end()) return it->second;
    _types.emplace_back(kind, name, father, lower, upper);
    _index[key] = &_types.back();
    return &_types.back();
}
