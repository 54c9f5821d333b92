#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <initializer_list>
#include <SDL.h>

#define MATCH(a,b) !strcmp(a,b)

#define MIN_DIM_TIME 0
#define MAX_DIM_TIME 60000

#define MIN_SCREENSAVER_IDLE_TIME 5
#define MAX_SCREENSAVER_IDLE_TIME 60000

struct Hotkey {
    SDL_Keycode keycode;
    std::string command;
    Hotkey(SDL_Keycode keycode, std::string_view command) : keycode(keycode), command(command) {};
};

class HotkeyList {
    private:
        std::vector<Hotkey> list;

    public:
        void add(const char *value);
        size_t size() const { return list.size(); }
        std::vector<Hotkey>::iterator begin(void) { return list.begin(); }
        std::vector<Hotkey>::iterator end(void) { return list.end(); }
};

struct Config {
    bool debug = false;
    SDL_Color background_color = {0x20, 0x40, 0x80, 0xFF};
    std::string background_image_path;

    int dim_layer = 1;
    float dim_intensity = 0.6f;
    Uint32 dim_fade_in_time = 200;
    Uint32 dim_fade_out_time = 200;

    bool screensaver_enabled = false;
    Uint32 screensaver_idle_time = 900000;
    float screensaver_intensity = 0.67f;
    Uint32 screensaver_transition_time = 2000;

    bool parse(const std::string &file, HotkeyList &hotkey_list);
    void add_int(const char *value, int &out);
    void add_bool(const char *value, bool &out);
    void add_path(const char *value, std::string &out);
    void add_time(const char *value, Uint32 &out, Uint32 min, Uint32 max, Uint32 unit = 1000);

    template <typename T>
    void add_percent(const char *value, T &out, T ref, float min = 0.0f, float max = 1.0f);
};

bool hex_to_color(std::string_view string, SDL_Color &color);
void join_paths(std::string &out, std::initializer_list<const char*> list);
bool find_file(std::string &out, const char *filename, const char *executable_dir);
