#ifndef PLANCOMP_PROBLEM_KIND_H
#define PLANCOMP_PROBLEM_KIND_H

#include <bitset>
#include <string>
#include <vector>

/*
 * Set of named features of a problem, grouped in fixed families.
 * The flag names are shared with other planning tools and must not change.
 * Setting or querying an unknown flag raises UsageError.
 */
class ProblemKind {

public:
    static const int MAX_FLAGS = 64;

    struct Family {
        std::string name;
        std::vector<std::string> flags;
    };

private:
    std::bitset<MAX_FLAGS> _flags;

public:
    ProblemKind() = default;
    ProblemKind(const std::vector<std::string>& flags);

    static const std::vector<Family>& families();
    // The kind with every flag set
    static ProblemKind all();

    ProblemKind& set(const std::string& flag);
    ProblemKind& unset(const std::string& flag);
    bool has(const std::string& flag) const;

    bool empty() const {return _flags.none();}
    std::vector<std::string> flags() const;
    // Flags of a single family
    std::vector<std::string> flags(const std::string& family) const;

    bool isSubsetOf(const ProblemKind& other) const {return (_flags & ~other._flags).none();}
    ProblemKind unite(const ProblemKind& other) const;
    ProblemKind intersect(const ProblemKind& other) const;

    inline bool operator==(const ProblemKind& other) const {return _flags == other._flags;}
    inline bool operator!=(const ProblemKind& other) const {return _flags != other._flags;}
    inline bool operator<=(const ProblemKind& other) const {return isSubsetOf(other);}

    std::string toString() const;

private:
    static int index(const std::string& flag);
};

#endif
