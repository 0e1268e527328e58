
#include <cstdio>

#include "data/timing.h"

std::string Timing::toString() const {
    std::string out;
    switch (kind) {
    case TimepointKind::GLOBAL_START: out = "global_start"; break;
    case TimepointKind::GLOBAL_END: out = "global_end"; break;
    case TimepointKind::START: out = "start"; break;
    case TimepointKind::END: out = "end"; break;
    }
    if (delay != 0) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%+g", delay);
        out += buf;
    }
    return out;
}

std::string TimeInterval::toString() const {
    if (isPoint()) return "[" + lower.toString() + "]";
    return std::string(leftOpen ? "(" : "[") + lower.toString() + ", " + upper.toString() + (rightOpen ? ")" : "]");
}
