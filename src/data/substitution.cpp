
#include "data/substitution.h"
#include "util/errors.h"

Substitution::Substitution(const std::vector<Expr>& src, const std::vector<Expr>& dest) {
    if (src.size() != dest.size()) 
        throw UsageError("Substitution over " + std::to_string(src.size()) + " keys but " 
            + std::to_string(dest.size()) + " values");
    for (size_t i = 0; i < src.size(); i++) {
        if (src[i] == dest[i]) continue;
        Expr& val = (*this)[src[i]];
        if (val.valid() && val != dest[i]) throw UsageError("Substitution maps a key to two values");
        val = dest[i];
    }
}

void Substitution::clear() {
    _entries.clear();
}

bool Substitution::empty() const {
    return _entries.empty();
}

size_t Substitution::size() const {
    size_t size = 0;
    auto it = _entries.begin();
    while (it != _entries.end()) {++it; size++;}
    return size;
}

std::forward_list<Substitution::Entry>::const_iterator Substitution::begin() const {
    return _entries.begin();
}
std::forward_list<Substitution::Entry>::const_iterator Substitution::end() const {
    return _entries.end();
}
