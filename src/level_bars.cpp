#include "level_bars.h"

void LevelBars::update(float level)
{
    float target = FLOOR + level * SPAN;
    for (auto& bar : bars_)
        bar += (target - bar) * EASING;
}

void LevelBars::reset()
{
    bars_.fill(FLOOR);
}
