#include "glib_scheduler.h"

#include <vector>

struct GlibScheduler::Entry {
    GlibScheduler* owner;
    SourceId       id;
    Task           task;
    bool           frame;
    guint          glib_id = 0;
};

GlibScheduler::GlibScheduler(GtkWidget* frame_widget)
    : frame_widget_(frame_widget)
{
    if (frame_widget_)
        g_object_add_weak_pointer(G_OBJECT(frame_widget_),
                                  reinterpret_cast<gpointer*>(&frame_widget_));
}

GlibScheduler::~GlibScheduler()
{
    std::vector<SourceId> ids;
    for (const auto& kv : entries_) ids.push_back(kv.first);
    for (SourceId id : ids) remove(id);

    if (frame_widget_)
        g_object_remove_weak_pointer(G_OBJECT(frame_widget_),
                                     reinterpret_cast<gpointer*>(&frame_widget_));
}

/* ── GLib trampolines ────────────────────────────────────────────────── */

gboolean GlibScheduler::on_tick(GtkWidget* /*widget*/, GdkFrameClock* /*clock*/,
                                gpointer data)
{
    auto* e = static_cast<Entry*>(data);
    return e->task() ? G_SOURCE_CONTINUE : G_SOURCE_REMOVE;
}

gboolean GlibScheduler::on_timeout(gpointer data)
{
    auto* e = static_cast<Entry*>(data);
    return e->task() ? G_SOURCE_CONTINUE : G_SOURCE_REMOVE;
}

void GlibScheduler::on_destroy(gpointer data)
{
    auto* e = static_cast<Entry*>(data);
    e->owner->entries_.erase(e->id);
    delete e;
}

/* ── Scheduler interface ─────────────────────────────────────────────── */

Scheduler::SourceId GlibScheduler::add_frame(Task task)
{
    if (!frame_widget_) return 0;

    auto* e = new Entry{this, next_id_++, std::move(task), true};
    entries_[e->id] = e;
    e->glib_id = gtk_widget_add_tick_callback(frame_widget_, on_tick, e, on_destroy);
    return e->id;
}

Scheduler::SourceId GlibScheduler::add_interval(unsigned interval_ms, Task task)
{
    auto* e = new Entry{this, next_id_++, std::move(task), false};
    entries_[e->id] = e;
    e->glib_id = g_timeout_add_full(G_PRIORITY_DEFAULT, interval_ms,
                                    on_timeout, e, on_destroy);
    return e->id;
}

void GlibScheduler::remove(SourceId id)
{
    auto it = entries_.find(id);
    if (it == entries_.end()) return;

    Entry* e = it->second;
    entries_.erase(it);

    /* on_destroy frees the entry */
    if (!e->frame)
        g_source_remove(e->glib_id);
    else if (frame_widget_)
        gtk_widget_remove_tick_callback(frame_widget_, e->glib_id);
    else
        delete e;   // widget gone; GTK already dropped the callback
}
