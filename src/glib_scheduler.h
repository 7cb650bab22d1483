#pragma once

#include <gtk/gtk.h>
#include <map>
#include "scheduler.h"

/* Frame tasks ride the GTK frame clock of one widget (display refresh),
 * interval tasks are plain GLib timeouts on the default main context.
 * Without a widget, or once it is finalized, add_frame() returns 0. */
class GlibScheduler : public Scheduler {
public:
    explicit GlibScheduler(GtkWidget* frame_widget);
    ~GlibScheduler() override;

    GlibScheduler(const GlibScheduler&) = delete;
    GlibScheduler& operator=(const GlibScheduler&) = delete;

    SourceId add_frame(Task task) override;
    SourceId add_interval(unsigned interval_ms, Task task) override;
    void     remove(SourceId id) override;

    size_t active_count() const { return entries_.size(); }

private:
    struct Entry;

    static gboolean on_tick(GtkWidget* widget, GdkFrameClock* clock, gpointer data);
    static gboolean on_timeout(gpointer data);
    static void     on_destroy(gpointer data);

    GtkWidget*                 frame_widget_;
    SourceId                   next_id_ = 1;
    std::map<SourceId, Entry*> entries_;
};
