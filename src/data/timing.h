#ifndef PLANCOMP_TIMING_H
#define PLANCOMP_TIMING_H

#include <string>

#include "data/node.h"

enum class TimepointKind { GLOBAL_START, GLOBAL_END, START, END };

// A timepoint shifted by a constant delay
struct Timing {
    TimepointKind kind = TimepointKind::START;
    double delay = 0;

    Timing() = default;
    Timing(TimepointKind kind, double delay = 0) : kind(kind), delay(delay) {}

    static Timing start(double delay = 0) {return Timing(TimepointKind::START, delay);}
    static Timing end(double delay = 0) {return Timing(TimepointKind::END, delay);}
    static Timing globalStart(double delay = 0) {return Timing(TimepointKind::GLOBAL_START, delay);}
    static Timing globalEnd(double delay = 0) {return Timing(TimepointKind::GLOBAL_END, delay);}

    bool isFromStart() const {return kind == TimepointKind::START || kind == TimepointKind::GLOBAL_START;}
    bool isFromEnd() const {return !isFromStart();}
    bool isGlobal() const {return kind == TimepointKind::GLOBAL_START || kind == TimepointKind::GLOBAL_END;}

    inline bool operator==(const Timing& other) const {return kind == other.kind && delay == other.delay;}
    inline bool operator!=(const Timing& other) const {return !(*this == other);}

    std::string toString() const;
};

struct TimeInterval {
    Timing lower;
    Timing upper;
    bool leftOpen = false;
    bool rightOpen = false;

    TimeInterval() = default;
    TimeInterval(Timing lower, Timing upper, bool leftOpen = false, bool rightOpen = false) : 
        lower(lower), upper(upper), leftOpen(leftOpen), rightOpen(rightOpen) {}
    // The point interval [t, t]
    explicit TimeInterval(Timing t) : lower(t), upper(t) {}

    bool isPoint() const {return lower == upper && !leftOpen && !rightOpen;}

    inline bool operator==(const TimeInterval& other) const {
        return lower == other.lower && upper == other.upper 
            && leftOpen == other.leftOpen && rightOpen == other.rightOpen;
    }

    std::string toString() const;
};

// Admissible durations of a durative action
struct DurationInterval {
    Expr lower;
    Expr upper;
    bool leftOpen = false;
    bool rightOpen = false;

    DurationInterval() = default;
    DurationInterval(Expr lower, Expr upper, bool leftOpen = false, bool rightOpen = false) : 
        lower(lower), upper(upper), leftOpen(leftOpen), rightOpen(rightOpen) {}
};

#endif
