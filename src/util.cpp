#include <filesystem>
#include <initializer_list>
#include <string.h>
#include <stdlib.h>
#include <SDL.h>
#include <spdlog/spdlog.h>
#include <ini.h>
#include <lconfig.h>
#include "util.hpp"

struct ConfigInfo {
    Config &config;
    HotkeyList &hotkey_list;
};

static int handler(void* user, const char* section, const char* name, const char* value);

bool Config::parse(const std::string &file, HotkeyList &hotkey_list)
{
    ConfigInfo info = {*this, hotkey_list};
    spdlog::debug("Parsing config file '{}'", file);
    int ret = ini_parse(file.c_str(), handler, (void*) &info);
    if (ret < 0) {
        spdlog::critical("Failed to parse config file");
        return false;
    }
    if (ret > 0)
        spdlog::warn("Config file '{}': parse error on line {}", file, ret);
    spdlog::debug("Sucessfully parsed config file");
    return true;
}

void Config::add_bool(const char *value, bool &out)
{
    if (MATCH(value, "true") || MATCH(value, "True")) {
        out = true;
    }
    else if (MATCH(value, "false") || MATCH(value, "False")) {
        out = false;
    }
}

void Config::add_int(const char *value, int &out)
{
    char *end;
    long x = strtol(value, &end, 10);
    if (end != value && *end == '\0') {
        out = (int) x;
    }
}

// Bounds are given in the unit of the value, out is in milliseconds
void Config::add_time(const char *value, Uint32 &out, Uint32 min, Uint32 max, Uint32 unit)
{
    char *end;
    long x = strtol(value, &end, 10);
    if (end == value || *end != '\0' || x < 0)
        return;
    if ((Uint32) x >= min && (Uint32) x <= max) {
        out = (Uint32) x * unit;
    }
}

void Config::add_path(const char *value, std::string &out)
{
    out = value;

    // Remove double quotes
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
}

template <typename T>
void Config::add_percent(const char *value, T &out, T ref, float min, float max)
{
    std::string_view string = value;
    if (string.empty() || string.back() != '%')
        return;
    float percent = atof(std::string(string, 0, string.size() - 1).c_str()) / 100.0f;
    if (percent == 0.0f && strcmp(value, "0%"))
        return;
    if (percent < min)
        percent = min;
    else if (percent > max)
        percent = max;

    out = static_cast<T>(percent * static_cast<float>(ref));
}

static int handler(void* user, const char* section, const char* name, const char* value)
{
    ConfigInfo *info = (ConfigInfo*) user;
    Config &config = info->config;

    if (MATCH(section, "Settings")) {
        if (MATCH(name, "Debug")) {
            config.add_bool(value, config.debug);
        }
        else if (MATCH(name, "BackgroundColor")) {
            if (!hex_to_color(value, config.background_color))
                spdlog::error("Invalid color '{}'", value);
        }
        else if (MATCH(name, "BackgroundImage")) {
            config.add_path(value, config.background_image_path);
        }
    }

    else if (MATCH(section, "Dimmer")) {
        if (MATCH(name, "Layer")) {
            config.add_int(value, config.dim_layer);
        }
        else if (MATCH(name, "Intensity")) {
            config.add_percent<float>(value, config.dim_intensity, 1.f);
        }
        else if (MATCH(name, "FadeInTime")) {
            config.add_time(value, config.dim_fade_in_time, MIN_DIM_TIME, MAX_DIM_TIME, 1);
        }
        else if (MATCH(name, "FadeOutTime")) {
            config.add_time(value, config.dim_fade_out_time, MIN_DIM_TIME, MAX_DIM_TIME, 1);
        }
    }

    else if (MATCH(section, "Screensaver")) {
        if (MATCH(name, "Enabled")) {
            config.add_bool(value, config.screensaver_enabled);
        }
        else if (MATCH(name, "IdleTime")) {
            config.add_time(value, config.screensaver_idle_time, MIN_SCREENSAVER_IDLE_TIME, MAX_SCREENSAVER_IDLE_TIME);
        }
        else if (MATCH(name, "Intensity")) {
            config.add_percent<float>(value, config.screensaver_intensity, 1.f, 0.1f, 1.f);
        }
        else if (MATCH(name, "TransitionTime")) {
            config.add_time(value, config.screensaver_transition_time, MIN_DIM_TIME, MAX_DIM_TIME, 1);
        }
    }

    else if (MATCH(section, "Hotkeys")) {
        info->hotkey_list.add(value);
    }
    return 1;
}

void HotkeyList::add(const char *value)
{
    std::string_view string = value;
    if (string.empty() || string.front() != '#')
        return;
    size_t pos = string.find_first_of(";");
    if (pos == std::string::npos || pos == (string.size() - 1))
        return;

    std::string keycode_s(string.substr(1, pos - 1));
    SDL_Keycode keycode = (SDL_Keycode) strtol(keycode_s.c_str(), nullptr, 16);
    if (!keycode)
        return;

    list.push_back(Hotkey(keycode, string.substr(pos + 1)));
}

// A function to convert a hex-formatted string into a color struct
bool hex_to_color(std::string_view string, SDL_Color &color)
{
    if (string.size() != 7 || string.front() != '#')
        return false;
    std::string hex_s(string.substr(1));

    char *end;
    Uint32 hex = (Uint32) strtoul(hex_s.c_str(), &end, 16);
    if (*end != '\0')
        return false;

    color.r = (Uint8) (hex >> 16);
    color.g = (Uint8) ((hex & 0x0000ff00) >> 8);
    color.b = (Uint8) (hex & 0x000000ff);
    color.a = 0xFF;
    return true;
}

void join_paths(std::string &out, std::initializer_list<const char*> list)
{
    if (list.size() < 2)
        return;
    std::filesystem::path path;
    auto it = list.begin();
    path = *it;
    it++;
    for (; it != list.end(); ++it) {
        if (*it == NULL)
            return;
        path /= *it;
    }
    out = path.string();
}

bool find_file(std::string &out, const char *filename, const char *executable_dir)
{
    std::vector<const char*> prefixes;
    std::string config_dir;
#ifdef __unix__
    const char *home_dir = getenv("HOME");
    if (home_dir != nullptr)
        join_paths(config_dir, {home_dir, ".config", EXECUTABLE_TITLE});
    prefixes.push_back(CURRENT_DIRECTORY);
    if (executable_dir != nullptr)
        prefixes.push_back(executable_dir);
    if (!config_dir.empty())
        prefixes.push_back(config_dir.c_str());
    prefixes.push_back(SYSTEM_SHARE_DIR);
#endif

    for (const char *prefix : prefixes) {
        join_paths(out, {prefix, filename});
        if (std::filesystem::exists(out))
            return true;
    }
    out.clear();
    return false;
}
