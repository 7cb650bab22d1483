#pragma once

#include <functional>

/* ── Scheduler ─────────────────────────────────────────────────────────────
 *
 *  Repeating tasks on the single UI thread.  A task returns true to keep
 *  running and false to remove itself.  Source ids are never 0, so 0 can
 *  mean "not scheduled".  remove() on an unknown or finished id is a no-op,
 *  and a removed task never runs again, even if it was already due.
 * ──────────────────────────────────────────────────────────────────────── */

class Scheduler {
public:
    using SourceId = unsigned;
    using Task     = std::function<bool()>;

    virtual ~Scheduler() = default;

    virtual SourceId add_frame(Task task)                      = 0;   // once per display frame
    virtual SourceId add_interval(unsigned interval_ms, Task task) = 0;   // wall-clock period
    virtual void     remove(SourceId id)                       = 0;
};
