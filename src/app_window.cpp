#include "app_window.h"
#include "audio_backend.h"
#include "elapsed_timer.h"
#include "settings.h"

#include <string>
#include <cstdio>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

static void set_status(AppWindow *win, const std::string& msg)
{
    gtk_statusbar_pop(GTK_STATUSBAR(win->statusbar), win->statusbar_context);
    gtk_statusbar_push(GTK_STATUSBAR(win->statusbar), win->statusbar_context,
                       msg.c_str());
}

/* ── Level bars ─────────────────────────────────────────────────────── */

static void rounded_bar(cairo_t *cr, double x, double y, double w, double h)
{
    double r = w / 2.0;
    if (h < w) h = w;
    cairo_new_sub_path(cr);
    cairo_arc(cr, x + r, y + r,     r, M_PI, 2 * M_PI);
    cairo_arc(cr, x + r, y + h - r, r, 0,    M_PI);
    cairo_close_path(cr);
}

static gboolean on_bars_draw(GtkWidget *widget, cairo_t *cr, gpointer data)
{
    auto *win = static_cast<AppWindow *>(data);
    int w = gtk_widget_get_allocated_width(widget);
    int h = gtk_widget_get_allocated_height(widget);
    if (w <= 0 || h <= 0 || !win->session)
        return FALSE;

    const LevelBars& bars = win->session->levels();
    const double bar_w = 8.0;
    const double gap   = 4.0;
    double total = LevelBars::BAR_COUNT * bar_w + (LevelBars::BAR_COUNT - 1) * gap;
    double x = (w - total) / 2.0;

    if (win->session->is_recording())
        cairo_set_source_rgb(cr, 0.97, 0.52, 0.21);
    else
        cairo_set_source_rgb(cr, 0.20, 0.33, 0.85);

    for (int i = 0; i < LevelBars::BAR_COUNT; i++) {
        double bh = bars[i] * h;
        rounded_bar(cr, x, (h - bh) / 2.0, bar_w, bh);
        x += bar_w + gap;
    }
    cairo_fill(cr);
    return TRUE;
}

/* ── Session observers ──────────────────────────────────────────────── */

static void update_controls(AppWindow *win, SessionState state)
{
    bool idle      = state == SessionState::Idle;
    bool recording = state == SessionState::Recording;

    gtk_button_set_label(GTK_BUTTON(win->record_button), recording ? "Stop" : "Record");
    gtk_widget_set_sensitive(win->record_button, state != SessionState::Complete);
    gtk_widget_set_sensitive(win->audio_combo, idle);
    gtk_widget_set_sensitive(win->refresh_button, idle);

    if (state == SessionState::Complete)
        gtk_widget_show(win->action_box);
    else
        gtk_widget_hide(win->action_box);
}

static void on_session_state(AppWindow *win, SessionState state)
{
    update_controls(win, state);
    switch (state) {
    case SessionState::Recording:
        set_status(win, "Recording...");
        break;
    case SessionState::Complete:
        set_status(win, "Recording complete: submit or discard");
        break;
    case SessionState::Idle:
        break;
    }
    gtk_widget_queue_draw(win->bars_area);
}

static void on_session_elapsed(AppWindow *win, unsigned seconds)
{
    gtk_label_set_text(GTK_LABEL(win->time_label), format_elapsed(seconds).c_str());
}

/* ── Audio device helpers ──────────────────────────────────────────── */

static void populate_audio_inputs(AppWindow *win)
{
    gtk_combo_box_text_remove_all(GTK_COMBO_BOX_TEXT(win->audio_combo));
    win->audio_source_ids.clear();

    Settings settings = config_load(win->config_file);
    int saved_index = 0;

    gtk_combo_box_text_append_text(GTK_COMBO_BOX_TEXT(win->audio_combo), "Default input");
    win->audio_source_ids.push_back("");

    for (const AudioDevice& dev : audio_enumerate_inputs()) {
        if (!settings.input_device.empty() && settings.input_device == dev.id)
            saved_index = static_cast<int>(win->audio_source_ids.size());
        gtk_combo_box_text_append_text(GTK_COMBO_BOX_TEXT(win->audio_combo),
                                       dev.description.c_str());
        win->audio_source_ids.push_back(dev.id);
    }

    gtk_combo_box_set_active(GTK_COMBO_BOX(win->audio_combo), saved_index);
}

static void on_audio_combo_changed(GtkComboBox *combo, gpointer data)
{
    auto *win = static_cast<AppWindow *>(data);
    int idx = gtk_combo_box_get_active(combo);
    if (idx < 0 || idx >= static_cast<int>(win->audio_source_ids.size()))
        return;

    const std::string& id = win->audio_source_ids[static_cast<size_t>(idx)];
    win->session->set_capture_source(audio_create_capture_source(id));
    config_save_audio_device(win->config_file, id);

    gchar *text = gtk_combo_box_text_get_active_text(GTK_COMBO_BOX_TEXT(combo));
    if (text) {
        set_status(win, std::string("Audio input: ") + text);
        g_free(text);
    }
}

static void on_refresh_clicked(GtkWidget * /*widget*/, gpointer data)
{
    auto *win = static_cast<AppWindow *>(data);
    populate_audio_inputs(win);
    set_status(win, "Audio devices refreshed");
}

/* ── Buttons ────────────────────────────────────────────────────────── */

static void on_record_clicked(GtkWidget * /*widget*/, gpointer data)
{
    auto *win = static_cast<AppWindow *>(data);

    if (win->session->is_recording()) {
        win->session->stop();
        return;
    }

    switch (win->session->start()) {
    case StartResult::Started:
        break;
    case StartResult::DeviceUnavailable:
        set_status(win, "Microphone unavailable: check the input device and permissions");
        break;
    case StartResult::AlreadyRecording:
    case StartResult::NotIdle:
        break;
    }
}

static void on_submit_clicked(GtkWidget * /*widget*/, gpointer data)
{
    auto *win = static_cast<AppWindow *>(data);
    if (win->session->submit())
        set_status(win, "Recording submitted");
}

static void on_discard_clicked(GtkWidget * /*widget*/, gpointer data)
{
    auto *win = static_cast<AppWindow *>(data);
    if (win->session->discard())
        set_status(win, "Recording discarded");
}

static void on_window_destroy(GtkWidget * /*widget*/, gpointer data)
{
    auto *win = static_cast<AppWindow *>(data);
    win->session->dispose();
    win->session.reset();
    win->scheduler.reset();
    delete win;
}

/* ── Menu callbacks ─────────────────────────────────────────────────── */

static void on_menu_exit(GtkMenuItem * /*item*/, gpointer data)
{
    auto *win = static_cast<AppWindow *>(data);
    gtk_widget_destroy(win->window);
}

AppWindow *app_window_new(GtkApplication *app)
{
    auto *win = new AppWindow{};
    win->config_file = config_path();
    Settings settings = config_load(win->config_file);

    // Main window
    win->window = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(win->window), "Genre Recorder");
    gtk_window_set_default_size(GTK_WINDOW(win->window), 520, 260);
    g_signal_connect(win->window, "destroy", G_CALLBACK(on_window_destroy), win);

    // Outer vertical box (no padding, menubar sits flush against window edges)
    GtkWidget *outer_vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_container_add(GTK_CONTAINER(win->window), outer_vbox);

    // Menu bar
    GtkWidget *menubar = gtk_menu_bar_new();

    GtkWidget *file_menu = gtk_menu_new();
    GtkWidget *file_item = gtk_menu_item_new_with_label("File");
    gtk_menu_item_set_submenu(GTK_MENU_ITEM(file_item), file_menu);

    GtkWidget *exit_item = gtk_menu_item_new_with_label("Exit");
    g_signal_connect(exit_item, "activate", G_CALLBACK(on_menu_exit), win);
    gtk_menu_shell_append(GTK_MENU_SHELL(file_menu), exit_item);

    gtk_menu_shell_append(GTK_MENU_SHELL(menubar), file_item);
    gtk_box_pack_start(GTK_BOX(outer_vbox), menubar, FALSE, FALSE, 0);

    // Content area with padding below the menubar
    GtkWidget *vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_container_set_border_width(GTK_CONTAINER(vbox), 12);
    gtk_box_pack_start(GTK_BOX(outer_vbox), vbox, TRUE, TRUE, 0);

    // Header label
    win->header_label = gtk_label_new("Genre Recorder");
    PangoAttrList *attrs = pango_attr_list_new();
    pango_attr_list_insert(attrs, pango_attr_weight_new(PANGO_WEIGHT_BOLD));
    pango_attr_list_insert(attrs, pango_attr_scale_new(1.4));
    gtk_label_set_attributes(GTK_LABEL(win->header_label), attrs);
    pango_attr_list_unref(attrs);
    gtk_box_pack_start(GTK_BOX(vbox), win->header_label, FALSE, FALSE, 0);

    gtk_box_pack_start(GTK_BOX(vbox), gtk_separator_new(GTK_ORIENTATION_HORIZONTAL), FALSE, FALSE, 0);

    // Audio input row: label + combo + refresh button
    GtkWidget *audio_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_box_pack_start(GTK_BOX(vbox), audio_box, FALSE, FALSE, 0);

    GtkWidget *audio_label = gtk_label_new("Audio Input:");
    gtk_box_pack_start(GTK_BOX(audio_box), audio_label, FALSE, FALSE, 0);

    win->audio_combo = gtk_combo_box_text_new();
    gtk_widget_set_size_request(win->audio_combo, 50, -1);  // allow shrinking
    gtk_box_pack_start(GTK_BOX(audio_box), win->audio_combo, TRUE, TRUE, 0);

    win->refresh_button = gtk_button_new_with_label("Refresh");
    gtk_box_pack_start(GTK_BOX(audio_box), win->refresh_button, FALSE, FALSE, 0);
    g_signal_connect(win->refresh_button, "clicked", G_CALLBACK(on_refresh_clicked), win);

    // Recording row: record button + level bars + elapsed time
    GtkWidget *record_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 12);
    gtk_box_pack_start(GTK_BOX(vbox), record_box, TRUE, TRUE, 0);

    win->record_button = gtk_button_new_with_label("Record");
    gtk_widget_set_size_request(win->record_button, 80, 64);
    gtk_box_pack_start(GTK_BOX(record_box), win->record_button, FALSE, FALSE, 0);
    g_signal_connect(win->record_button, "clicked", G_CALLBACK(on_record_clicked), win);

    win->bars_area = gtk_drawing_area_new();
    gtk_widget_set_size_request(win->bars_area, -1, 64);
    gtk_box_pack_start(GTK_BOX(record_box), win->bars_area, TRUE, TRUE, 0);
    g_signal_connect(win->bars_area, "draw", G_CALLBACK(on_bars_draw), win);

    win->time_label = gtk_label_new("00:00");
    attrs = pango_attr_list_new();
    pango_attr_list_insert(attrs, pango_attr_family_new("monospace"));
    pango_attr_list_insert(attrs, pango_attr_weight_new(PANGO_WEIGHT_BOLD));
    pango_attr_list_insert(attrs, pango_attr_scale_new(1.6));
    gtk_label_set_attributes(GTK_LABEL(win->time_label), attrs);
    pango_attr_list_unref(attrs);
    gtk_widget_set_size_request(win->time_label, 96, -1);
    gtk_box_pack_start(GTK_BOX(record_box), win->time_label, FALSE, FALSE, 0);

    // Submit / discard, shown once a recording is complete
    win->action_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 16);
    gtk_widget_set_halign(win->action_box, GTK_ALIGN_CENTER);
    gtk_box_pack_start(GTK_BOX(vbox), win->action_box, FALSE, FALSE, 0);

    win->submit_button = gtk_button_new_with_label("Submit");
    gtk_box_pack_start(GTK_BOX(win->action_box), win->submit_button, FALSE, FALSE, 0);
    g_signal_connect(win->submit_button, "clicked", G_CALLBACK(on_submit_clicked), win);

    win->discard_button = gtk_button_new_with_label("Discard");
    gtk_box_pack_start(GTK_BOX(win->action_box), win->discard_button, FALSE, FALSE, 0);
    g_signal_connect(win->discard_button, "clicked", G_CALLBACK(on_discard_clicked), win);

    gtk_widget_set_no_show_all(win->action_box, TRUE);
    gtk_widget_show(win->submit_button);
    gtk_widget_show(win->discard_button);

    // Status bar
    win->statusbar = gtk_statusbar_new();
    win->statusbar_context = gtk_statusbar_get_context_id(
        GTK_STATUSBAR(win->statusbar), "main");
    gtk_statusbar_push(GTK_STATUSBAR(win->statusbar), win->statusbar_context, "Ready");
    gtk_box_pack_end(GTK_BOX(vbox), win->statusbar, FALSE, FALSE, 0);

    // Session plumbing; the bars widget's frame clock paces the analyzer
    win->classifier = std::make_unique<ClassifierClient>(settings.classifier_endpoint);
    win->classifier->set_on_response([win](const std::string& body) {
        set_status(win, "Classifier: " + body);
    });
    win->classifier->set_on_failure([win](const std::string& why) {
        set_status(win, "Submission failed: " + why);
    });

    win->scheduler  = std::make_unique<GlibScheduler>(win->bars_area);
    win->session    = std::make_unique<RecordingSession>(*win->scheduler, *win->classifier);
    win->session->set_on_state_changed([win](SessionState s) { on_session_state(win, s); });
    win->session->set_on_levels([win](const LevelBars&) {
        gtk_widget_queue_draw(win->bars_area);
    });
    win->session->set_on_elapsed([win](unsigned s) { on_session_elapsed(win, s); });
    win->session->set_on_error([win](const std::string& msg) { set_status(win, msg); });

    g_signal_connect(win->audio_combo, "changed", G_CALLBACK(on_audio_combo_changed), win);
    populate_audio_inputs(win);   // "changed" installs the capture source

    update_controls(win, SessionState::Idle);
    return win;
}
