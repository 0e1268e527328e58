#ifndef PLANCOMP_LOG_H
#define PLANCOMP_LOG_H

#include <string>
#include <cstdio>
#include <cstdarg>

enum Code {
    FG_DEFAULT = 39, 
    FG_CYAN = 36, 
    FG_YELLOW = 33,
    FG_DARK_GRAY = 90, 
    FG_LIGHT_RED = 91, 
    FG_WHITE = 97
};

class Modifier {
private:
    std::string _str;
public:
    explicit Modifier(const Code& pCode) : _str("\033[" + std::to_string(pCode) + "m") {}
    const char* str() {
        return _str.c_str();
    }
};

/*
 * Leveled printf-style logging. Errors and warnings go to stderr with a
 * level tag, everything else to stdout. Each line starts with the seconds
 * elapsed since Timer::init().
 */
class Log {

public:
    static const int V0_ESSENTIAL = 0;
    static const int V1_WARNINGS = 1;
    static const int V2_INFORMATION = 2;
    static const int V3_VERBOSE = 3;
    static const int V4_DEBUG = 4;

private:
    static int verbosity;
    static bool coloredOutput;
    static bool forcePrint;

public:
    static void init(int verbosity, bool coloredOutput);
    static void setForcePrint(bool force);

    // True if messages of the given verbosity are printed.
    // Guards log calls whose arguments are expensive to render.
    static bool enabled(int verb);

    // Debug message
    static bool d(const char* str, ...);
    // Verbose info message
    static bool v(const char* str, ...);
    // Info message
    static bool i(const char* str, ...);
    // Warning, tagged [W]
    static bool w(const char* str, ...);
    // Error, tagged [E]
    static bool e(const char* str, ...);

    // To stdout without time stamp and tag, e.g. for printing a problem
    static bool log_notime(int verb, const char* str, ...);

    static bool log(int verb, const char* str, va_list& vl);

private:
    static FILE* stream(int verb);
    static const char* tag(int verb);
    static void printColorModifier(FILE* out, int verb);
    static void resetColorModifier(FILE* out);

};

#endif
