#ifndef PLANCOMP_SUBSTITUTION_H
#define PLANCOMP_SUBSTITUTION_H

#include <vector>
#include <forward_list>

#include "data/node.h"
#include "util/hash.h"

/*
 * Mapping from expressions to the expressions replacing them, kept as a
 * list sorted by expression id. Substitutions are small (action parameters,
 * quantified variables) and copied often, hence no hash table.
 */
class Substitution {

public:
    struct Entry { 
        Expr first; 
        Expr second;

        Entry(Expr first, Expr second) : first(first), second(second) {}
        inline bool operator==(const Entry& other) const {
            return first == other.first && second == other.second;
        }
    };

private:
    std::forward_list<Entry> _entries;

public:
    Substitution() = default;
    Substitution(const Substitution& other) = default;
    Substitution(Substitution&& old) = default;
    // Maps src[i] to dest[i] for each i.
    Substitution(const std::vector<Expr>& src, const std::vector<Expr>& dest);

    void clear();

    size_t size() const;
    bool empty() const;

    std::forward_list<Entry>::const_iterator begin() const;
    std::forward_list<Entry>::const_iterator end() const;

    struct Hasher {
        inline std::size_t operator()(const Substitution& s) const {
            size_t hash = 1337;
            for (const auto& entry : s) {
                hash_combine(hash, entry.first.id);
                hash_combine(hash, entry.second.id);
            }
            return hash;
        }
    };

    // Inserts the key with an invalid value if it is not present yet.
    inline Expr& operator[](const Expr& key) {

        auto it = _entries.begin();

        // Empty list or new smallest key?
        if (it == _entries.end() || key < it->first) {
            _entries.emplace_front(key, Expr());
            return _entries.begin()->second;
        }

        // Scan entries
        auto nextIt = _entries.begin();
        while (it != _entries.end()) {
            
            // Key found: return associated value
            if (it->first == key) return it->second;
            
            // Peek next position
            ++nextIt;

            // Break if this is the position to insert
            if (nextIt == _entries.end() || key < nextIt->first) break;

            // Proceed to next position
            ++it;
        }
        
        // Insert, make iterator point to inserted entry
        _entries.emplace_after(it, key, Expr());
        ++it;

        return it->second;
    }

    // Value for the key, or an invalid expression.
    inline Expr get(const Expr& key) const {
        for (const auto& entry : _entries) {
            if (entry.first == key) return entry.second;
            if (key < entry.first) break;
        }
        return Expr();
    }

    inline bool count(const Expr& key) const {
        return get(key).valid();
    }

    inline bool operator==(const Substitution& other) const {
        return _entries == other._entries;
    }

    inline bool operator!=(const Substitution& other) const {
        return !(*this == other);
    }

    Substitution& operator=(const Substitution& other) = default;
};

#endif
