#ifndef PLANCOMP_ARG_ITERATOR_H
#define PLANCOMP_ARG_ITERATOR_H

#include <vector>

#include "data/node.h"

class Problem;

/*
 * Enumerates the Cartesian product of per-position candidate values.
 * The first position varies fastest. An empty list of positions or an
 * empty candidate list at some position yields no assignment.
 */
class ArgIterator {

private:

    std::vector<std::vector<Expr>> _eligible_args;

    struct It {
        const std::vector<std::vector<Expr>>& _eligible_args;
        std::vector<size_t> _counter;
        size_t _counter_number;
        std::vector<Expr> _args;

        It(const std::vector<std::vector<Expr>>& eligibleArgs, bool nonempty) 
                : _eligible_args(eligibleArgs), _counter(eligibleArgs.size(), 0), 
                    _counter_number(0), _args(_counter.size()) {
            if (!nonempty) return;
            for (size_t i = 0; i < _args.size(); i++) {
                _args[i] = _eligible_args[i].front();
            }
        }

        const std::vector<Expr>& operator*() {
            return _args;
        }

        const std::vector<Expr>& operator++() {
            for (size_t i = 0; i < _counter.size(); i++) {
                if (_counter[i]+1 == _eligible_args[i].size()) {
                    // reached max value of some position
                    _counter[i] = 0;
                    _args[i] = _eligible_args[i].front();
                } else {
                    // increment and done
                    _counter[i]++;
                    _args[i] = _eligible_args[i].at(_counter[i]);
                    break;
                }
            }
            _counter_number++;
            return _args;
        }

        bool operator==(const It& other) const {
            return _counter_number == other._counter_number;
        }
        bool operator!=(const It& other) const {
            return !(*this == other);
        }

    } _begin, _end;

    static size_t numChoices(const std::vector<std::vector<Expr>>& eligibleArgs) {
        size_t num = eligibleArgs.empty() ? 0 : 1;
        for (const auto& args : eligibleArgs) num *= args.size();
        return num;
    }

public:

    explicit ArgIterator(std::vector<std::vector<Expr>>&& eligibleArgs) : 
            _eligible_args(std::move(eligibleArgs)),
            _begin(_eligible_args, numChoices(_eligible_args) > 0),
            _end(_eligible_args, false) {
        _end._counter_number = numChoices(_eligible_args);
    }

    ArgIterator(const ArgIterator& other) = delete;

    It begin() const {
        return _begin;
    }

    It end() const {
        return _end;
    }

    size_t size() const {
        return _end._counter_number;
    }

    // All assignments of the given types' finite domains in the problem.
    static std::vector<std::vector<Expr>> getDomains(const std::vector<const Type*>& types, const Problem& problem);
};

#endif
