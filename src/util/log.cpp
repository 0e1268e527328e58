
#include <cstdio>
#include <stdarg.h>

#include "util/log.h"
#include "util/timer.h"

int Log::verbosity = Log::V2_INFORMATION;
bool Log::coloredOutput = false;
bool Log::forcePrint = false;

void Log::init(int verbosity, bool coloredOutput) {
    Log::verbosity = verbosity;
    Log::coloredOutput = coloredOutput;
    if (coloredOutput) resetColorModifier(stdout);
}

void Log::setForcePrint(bool force) {
    forcePrint = force;
}

bool Log::enabled(int verb) {
    return forcePrint || verb <= verbosity;
}

bool Log::d(const char* str, ...) {
    va_list vl;
    va_start(vl, str);
    bool res = log(V4_DEBUG, str, vl);
    va_end(vl);
    return res;
}
bool Log::v(const char* str, ...) {
    va_list vl;
    va_start(vl, str);
    bool res = log(V3_VERBOSE, str, vl);
    va_end(vl);
    return res;
}
bool Log::i(const char* str, ...) {
    va_list vl;
    va_start(vl, str);
    bool res = log(V2_INFORMATION, str, vl);
    va_end(vl);
    return res;
}
bool Log::w(const char* str, ...) {
    va_list vl;
    va_start(vl, str);
    bool res = log(V1_WARNINGS, str, vl);
    va_end(vl);
    return res;
}
bool Log::e(const char* str, ...) {
    va_list vl;
    va_start(vl, str);
    bool res = log(V0_ESSENTIAL, str, vl);
    va_end(vl);
    return res;
}

bool Log::log_notime(int verb, const char* str, ...) {

    if (!enabled(verb)) return false;

    // Program output: always stdout, uncolored at essential level
    bool colored = coloredOutput && verb > V0_ESSENTIAL;
    if (colored) printColorModifier(stdout, verb);
    va_list vl;
    va_start(vl, str);
    vprintf(str, vl);
    va_end(vl);
    if (colored) resetColorModifier(stdout);
    fflush(stdout);
    return false;
}

bool Log::log(int verb, const char* str, va_list& vl) {

    if (!enabled(verb)) return false;
    FILE* out = stream(verb);

    // Begin line with current time
    if (coloredOutput) printColorModifier(out, V4_DEBUG);
    fprintf(out, "%.3f ", Timer::elapsedSeconds());
    if (coloredOutput) resetColorModifier(out);

    if (coloredOutput) printColorModifier(out, verb);
    fprintf(out, "%s", tag(verb));
    vfprintf(out, str, vl);
    if (coloredOutput) resetColorModifier(out);
    fflush(out);
    return false;
}

FILE* Log::stream(int verb) {
    return verb <= V1_WARNINGS && !forcePrint ? stderr : stdout;
}

const char* Log::tag(int verb) {
    if (forcePrint) return "";
    if (verb == V0_ESSENTIAL) return "[E] ";
    if (verb == V1_WARNINGS) return "[W] ";
    return "";
}

void Log::printColorModifier(FILE* out, int verb) {
    static Modifier white(FG_WHITE);
    static Modifier red(FG_LIGHT_RED);
    static Modifier yellow(FG_YELLOW);
    static Modifier gray(FG_DARK_GRAY);

    if (verb == V0_ESSENTIAL) fprintf(out, "%s", red.str());
    if (verb == V1_WARNINGS) fprintf(out, "%s", yellow.str());
    if (verb == V2_INFORMATION) fprintf(out, "%s", white.str());
    if (verb == V3_VERBOSE || verb == V4_DEBUG) fprintf(out, "%s", gray.str());
}

void Log::resetColorModifier(FILE* out) {
    static Modifier resetFg(FG_DEFAULT);
    fprintf(out, "%s", resetFg.str());
}
