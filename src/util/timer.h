#ifndef PLANCOMP_TIMER_H
#define PLANCOMP_TIMER_H

#include <chrono>

class Timer {

private:
    static double startTime;

public:

    static void init(double start = -1) {
        startTime = start == -1 ? now() : start;
    }

    static double now() {
        using namespace std::chrono;
        return 0.001 * 0.001 * 0.001 * duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
    }

    /**
     * Returns elapsed time since program start (since Timer::init) in seconds.
     */
    static float elapsedSeconds() {
        return now() - startTime;
    }
};

#endif
