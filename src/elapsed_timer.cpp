#include "elapsed_timer.h"

#include <cstdio>

std::string format_elapsed(unsigned seconds)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%02u:%02u", seconds / 60, seconds % 60);
    return buf;
}
