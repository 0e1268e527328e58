#ifndef PLANCOMP_REGEX_H
#define PLANCOMP_REGEX_H

#include <string>
#include <ctre.hpp>

// Suffix reserved for generated names: <base>__<N>__
static constexpr ctll::fixed_string REGEX_FRESH_NAME = ctll::fixed_string{ "(.*)__([0-9]+)__" };

class Regex {
public:
    static bool hasFreshNameSuffix(const std::string& input) {
        return static_cast<bool>(ctre::match<REGEX_FRESH_NAME>(input));
    }

    // Strips any number of trailing fresh-name suffixes.
    static std::string extractBaseOfFreshName(const std::string& input) {
        std::string out = input;
        while (auto m = ctre::match<REGEX_FRESH_NAME>(out)) {
            out = std::string(m.get<1>().to_view());
        }
        return out;
    }
};

#endif
