#pragma once

#include <array>
#include <cstddef>

/* Eased bar heights for the recording meter.  Every bar follows the same
 * target, so the array is a damped response to one scalar level.  The
 * easing does not clamp; values stay inside [FLOOR, 1] up to float drift. */
class LevelBars {
public:
    static constexpr int   BAR_COUNT = 20;
    static constexpr float FLOOR     = 0.15f;
    static constexpr float SPAN      = 0.85f;
    static constexpr float EASING    = 0.3f;

    using Values = std::array<float, BAR_COUNT>;

    LevelBars() { reset(); }

    void update(float level);
    void reset();

    const Values& values()   const { return bars_; }
    float operator[](int i)  const { return bars_[static_cast<std::size_t>(i)]; }

private:
    Values bars_;
};
