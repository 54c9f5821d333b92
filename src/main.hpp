#pragma once

#include <SDL.h>
#include <string>
#include <fmt/core.h>
#include <spdlog/version.h>

#define DISPLAY_ID 0
#define APPLICATION_WAIT_PERIOD 100

class Display {
    public:
        SDL_Window *window = nullptr;
        SDL_Renderer *renderer = nullptr;

        void open();
        void close();
};

struct Ticks {
    Uint64 main = 0;
    Uint64 last_input = 0;
};

struct State {
    bool minimized = false;
};


#ifdef __GNUC__
#define COMPILER_INFO(f, end) f("Compiler:   GCC {}.{}" end, __GNUC__, __GNUC_MINOR__);
#endif

#ifdef _MSC_VER
#define COMPILER_INFO(f, end) f("Compiler:   Microsoft C/C++ {:.2f}" end, (float) _MSC_VER / 100.0f);
#endif


#define VERSION(name, f, end)                                                                       \
static void name##_version() {                                                                      \
    SDL_version sdl_version;                                                                        \
    SDL_GetVersion(&sdl_version);                                                                   \
    const SDL_version *img_version = IMG_Linked_Version();                                          \
    f(PROJECT_NAME " version " PROJECT_VERSION ", using:" end);                                     \
    f("    SDL        {}.{}.{}" end, sdl_version.major, sdl_version.minor, sdl_version.patch);      \
    f("    SDL_image  {}.{}.{}" end, img_version->major, img_version->minor, img_version->patch);   \
    f("    spdlog     {}.{}.{}" end, SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);         \
    f("    fmt        {}" end, FMT_VERSION);                                                        \
    f(end);                                                                                         \
    f("Build date: " __DATE__ end);                                                                 \
    COMPILER_INFO(f, end);                                                                          \
}

void execute_command(const std::string &command);
void quit(int status);
