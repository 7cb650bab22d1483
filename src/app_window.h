#ifndef APP_WINDOW_H
#define APP_WINDOW_H

#include <gtk/gtk.h>
#include <memory>
#include <vector>
#include <string>
#include "classifier_client.h"
#include "glib_scheduler.h"
#include "recording_session.h"

struct AppWindow {
    GtkWidget *window;
    GtkWidget *header_label;
    GtkWidget *audio_combo;
    GtkWidget *refresh_button;
    GtkWidget *record_button;
    GtkWidget *bars_area;
    GtkWidget *time_label;
    GtkWidget *action_box;
    GtkWidget *submit_button;
    GtkWidget *discard_button;
    GtkWidget *statusbar;
    guint statusbar_context;

    std::string config_file;

    // PulseAudio source names (parallel to combo box entries)
    std::vector<std::string> audio_source_ids;

    // Declared in teardown order: session first, then what it borrows
    std::unique_ptr<ClassifierClient> classifier;
    std::unique_ptr<GlibScheduler>    scheduler;
    std::unique_ptr<RecordingSession> session;
};

AppWindow *app_window_new(GtkApplication *app);

#endif
