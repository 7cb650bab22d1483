#include "settings.h"
#include "classifier_client.h"

#include <glib.h>
#include <cstdio>

std::string config_path()
{
    const gchar *dir = g_get_user_config_dir();  // ~/.config
    std::string path = std::string(dir) + "/GenreRecorder";
    g_mkdir_with_parents(path.c_str(), 0755);
    return path + "/settings.ini";
}

/* read-modify-write so unrelated keys survive */
static bool config_set_string(const std::string& path, const char *group,
                              const char *key, const std::string& value)
{
    GKeyFile *kf = g_key_file_new();
    g_key_file_load_from_file(kf, path.c_str(), G_KEY_FILE_KEEP_COMMENTS, nullptr);
    g_key_file_set_string(kf, group, key, value.c_str());

    GError *err = nullptr;
    bool ok = g_key_file_save_to_file(kf, path.c_str(), &err);
    if (!ok) {
        fprintf(stderr, "Failed to save %s: %s\n", path.c_str(), err->message);
        g_error_free(err);
    }
    g_key_file_free(kf);
    return ok;
}

static std::string config_get_string(GKeyFile *kf, const char *group, const char *key,
                                     const std::string& fallback)
{
    gchar *val = g_key_file_get_string(kf, group, key, nullptr);
    if (!val) return fallback;
    std::string result = val;
    g_free(val);
    return result;
}

Settings config_load(const std::string& path)
{
    Settings s;
    s.classifier_endpoint = ClassifierClient::DEFAULT_ENDPOINT;

    GKeyFile *kf = g_key_file_new();
    if (g_key_file_load_from_file(kf, path.c_str(), G_KEY_FILE_NONE, nullptr)) {
        s.input_device        = config_get_string(kf, "audio", "input_device", "");
        s.classifier_endpoint = config_get_string(kf, "classifier", "endpoint",
                                                  s.classifier_endpoint);
    }
    g_key_file_free(kf);
    return s;
}

bool config_save_audio_device(const std::string& path, const std::string& device_name)
{
    return config_set_string(path, "audio", "input_device", device_name);
}

bool config_save_classifier_endpoint(const std::string& path, const std::string& url)
{
    return config_set_string(path, "classifier", "endpoint", url);
}
