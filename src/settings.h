#pragma once

#include <string>

struct Settings {
    std::string input_device;          // PulseAudio source name, empty = default
    std::string classifier_endpoint;
};

/* ~/.config/GenreRecorder/settings.ini (directory created on demand) */
std::string config_path();

/* missing file or keys fall back to defaults */
Settings config_load(const std::string& path);

bool config_save_audio_device(const std::string& path, const std::string& device_name);
bool config_save_classifier_endpoint(const std::string& path, const std::string& url);
