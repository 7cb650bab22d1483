#pragma once

#include <string>

/* Whole seconds spent recording.  Driven by a 1 s timeout while the
 * session records; frozen otherwise. */
class ElapsedTimer {
public:
    static constexpr unsigned INTERVAL_MS = 1000;

    void tick()  { ++seconds_; }
    void reset() { seconds_ = 0; }

    unsigned seconds() const { return seconds_; }

private:
    unsigned seconds_ = 0;
};

// MM:SS, both fields zero-padded to two digits; minutes are not capped
std::string format_elapsed(unsigned seconds);
