
#include "util/timer.h"

double Timer::startTime = 0;
