#ifndef PLANCOMP_TYPES_H
#define PLANCOMP_TYPES_H

#include <string>
#include <deque>
#include <optional>
#include <vector>

#include "util/hashmap.h"

enum class TypeKind { BOOL, INT, REAL, USER };

class Type {

private:
    TypeKind _kind;
    std::string _name;
    const Type* _father = nullptr;
    std::optional<double> _lower;
    std::optional<double> _upper;

public:
    Type(TypeKind kind, const std::string& name, const Type* father, 
            std::optional<double> lower, std::optional<double> upper) : 
        _kind(kind), _name(name), _father(father), _lower(lower), _upper(upper) {}

    TypeKind kind() const {return _kind;}
    bool isBool() const {return _kind == TypeKind::BOOL;}
    bool isInt() const {return _kind == TypeKind::INT;}
    bool isReal() const {return _kind == TypeKind::REAL;}
    bool isNumeric() const {return isInt() || isReal();}
    bool isUser() const {return _kind == TypeKind::USER;}

    // Name of a user type; "bool", "integer" or "real" otherwise
    const std::string& name() const {return _name;}
    const Type* father() const {return _father;}

    bool hasLowerBound() const {return _lower.has_value();}
    bool hasUpperBound() const {return _upper.has_value();}
    bool isBounded() const {return hasLowerBound() || hasUpperBound();}
    double lowerBound() const {return *_lower;}
    double upperBound() const {return *_upper;}

    // True iff this is other or one of its (transitive) subtypes.
    bool isSubtypeOf(const Type* other) const;

    // Values of type "actual" may be used where this type is expected.
    bool accepts(const Type* actual) const;

    std::string toString() const;
};

// Interns types so that type identity is pointer identity.
class TypeManager {

private:
    std::deque<Type> _types;
    // Maps a type's content key to the type
    NodeHashMap<std::string, const Type*> _index;
    NodeHashMap<std::string, const Type*> _user_types;
    const Type* _bool;

public:
    TypeManager();
    TypeManager(const TypeManager& other) = delete;

    const Type* boolType() const {return _bool;}
    const Type* intType(std::optional<double> lower = std::nullopt, std::optional<double> upper = std::nullopt);
    const Type* realType(std::optional<double> lower = std::nullopt, std::optional<double> upper = std::nullopt);
    const Type* userType(const std::string& name, const Type* father = nullptr);

    // Same numeric kind without bounds; other types unchanged.
    const Type* unbounded(const Type* type);

private:
    const Type* get(TypeKind kind, const std::string& name, const Type* father, 
            std::optional<double> lower, std::optional<double> upper);
};

#endif
