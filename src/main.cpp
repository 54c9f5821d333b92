#include <memory>
#include <string>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <getopt.h>
#include <stdlib.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <SDL.h>
#include <SDL_image.h>

#include <lconfig.h>
#include "main.hpp"
#include "dim_layer.hpp"
#include "image.hpp"
#include "screensaver.hpp"
#include "sdl_compositor.hpp"
#include "util.hpp"

Display display;
Config config;
Ticks ticks;
State state;
Background background;
std::unique_ptr<SdlCompositor> compositor;
std::unique_ptr<DimLayer> dim_layer;
std::unique_ptr<Screensaver> screensaver;
char *executable_dir;
std::string log_path;

static void fail(const char *what, const char *error)
{
    spdlog::critical("Could not {}", what);
    spdlog::critical("SDL Error: {}", error);
    quit(EXIT_FAILURE);
}

// Fullscreen window with a vsynced renderer for the background and dim layer
void Display::open()
{
    if (SDL_Init(SDL_INIT_VIDEO) < 0)
        fail("initialize SDL", SDL_GetError());

    constexpr int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
    if ((IMG_Init(img_flags) & img_flags) != img_flags)
        fail("initialize SDL_image", IMG_GetError());

    window = SDL_CreateWindow(PROJECT_NAME,
                 SDL_WINDOWPOS_UNDEFINED,
                 SDL_WINDOWPOS_UNDEFINED,
                 0,
                 0,
                 SDL_WINDOW_FULLSCREEN_DESKTOP
             );
    if (window == nullptr)
        fail("create window", SDL_GetError());
    SDL_ShowCursor(SDL_DISABLE);

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (renderer == nullptr)
        fail("create renderer", SDL_GetError());
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    SDL_RendererInfo info;
    int w = 0, h = 0;
    if (SDL_GetRendererInfo(renderer, &info) == 0 && SDL_GetRendererOutputSize(renderer, &w, &h) == 0)
        spdlog::debug("Display {}x{}, video driver {}, renderer {}", w, h, SDL_GetCurrentVideoDriver(), info.name);
}

void Display::close()
{
    if (renderer != nullptr) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window != nullptr) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    IMG_Quit();
    SDL_Quit();
}

static void cleanup()
{
    screensaver.reset();
    dim_layer.reset();
    compositor.reset();
    background.close();
    display.close();
}

void quit(int status)
{
    spdlog::debug("Quitting program");
    if (status == EXIT_FAILURE) {
        SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR,
            PROJECT_NAME,
            fmt::format("A critical error occurred. Check the log file '{}' for details", log_path).c_str(),
            nullptr
        );
    }
    cleanup();
    exit(status);
}

VERSION(log, spdlog::debug, "")
#ifdef __unix__
VERSION(print, fmt::print, "\n")
static void print_help()
{
    fmt::print("Usage: " EXECUTABLE_TITLE " [OPTIONS]\n");
    fmt::print("    -c p, --config=p     Load config file from path p.\n");
    fmt::print("    -d,   --debug        Enable debug messages.\n");
    fmt::print("    -h,   --help         Show this help message.\n");
    fmt::print("    -v,   --version      Print version information.\n");
}
#endif

static void dim()
{
    dim_layer->show(config.dim_layer, config.dim_intensity, config.dim_fade_in_time);
}

static void undim()
{
    dim_layer->hide(config.dim_fade_out_time);
}

// Must be called with a surface transaction open
void execute_command(const std::string &command)
{
    spdlog::debug("Executing command '{}'", command);
    if (command == ":dim")
        dim();
    else if (command == ":undim")
        undim();
    else if (command == ":toggle") {
        if (dim_layer->is_dimming())
            undim();
        else
            dim();
    }
    else if (command == ":jump")
        dim_layer->show();
    else if (command == ":hide")
        dim_layer->hide();
    else if (command == ":dump") {
        std::string out;
        dim_layer->print_to("  ", out);
        spdlog::info("Dim layer state:\n{}", out);
    }
    else if (command == ":quit")
        quit(EXIT_SUCCESS);
    else
        spdlog::error("Unknown command '{}'", command);
}

static void init_logging()
{
#ifdef __unix__
    char *home_dir = getenv("HOME");
    if (home_dir != nullptr)
        join_paths(log_path, {home_dir, ".local", "share", EXECUTABLE_TITLE, LOG_FILENAME});
#endif
#ifdef _WIN32
    join_paths(log_path, {executable_dir, LOG_FILENAME});
#endif
    std::vector<spdlog::sink_ptr> sinks;
    if (!log_path.empty()) {
        try {
            std::filesystem::create_directories(std::filesystem::path(log_path).parent_path());
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }
        catch (const std::exception &e) {
            fmt::print(stderr, "Could not open log file '{}': {}\n", log_path, e.what());
        }
    }
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    console_sink->set_pattern("[%^%l%$] %v");
    sinks.push_back(console_sink);

    auto logger = std::make_shared<spdlog::logger>(PROJECT_NAME, sinks.begin(), sinks.end());
    logger->set_level((config.debug) ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(logger);
}

int main(int argc, char *argv[])
{
    SDL_Event event;
    std::string config_path;
    HotkeyList hotkey_list;
    int c;
    executable_dir = SDL_GetBasePath();

    // Parse command line
    const char *short_opts = "+c:dhv";
    static struct option long_opts[] = {
        { "config",       required_argument, nullptr, 'c' },
        { "debug",        no_argument,       nullptr, 'd' },
        { "help",         no_argument,       nullptr, 'h' },
        { "version",      no_argument,       nullptr, 'v' },
        { 0, 0, 0, 0 }
    };

    while ((c = getopt_long(argc, argv, short_opts, long_opts, nullptr)) !=-1) {
        switch (c) {
            case 'c':
                config_path = optarg;
                break;

            case 'd':
                config.debug = true;
                break;
#ifdef __unix__
            case 'h':
                print_help();
                return EXIT_SUCCESS;

            case 'v':
                print_version();
                return EXIT_SUCCESS;
#endif
        }
    }

    init_logging();
    if (config.debug) {
        log_version();
        spdlog::debug("");
    }

    // Find and parse the config file
    if (!config_path.empty()) {
        if (!std::filesystem::exists(config_path)) {
            spdlog::critical("Config file '{}' does not exist", config_path);
            quit(EXIT_FAILURE);
        }
    }
    else if (!find_file(config_path, CONFIG_FILENAME, executable_dir)) {
        spdlog::critical("Could not locate config file");
        quit(EXIT_FAILURE);
    }
    bool debug = config.debug;
    if (!config.parse(config_path, hotkey_list))
        quit(EXIT_FAILURE);
    spdlog::debug("Loaded {} hotkeys from '{}'", hotkey_list.size(), config_path);
    if (config.debug && !debug) {
        spdlog::set_level(spdlog::level::debug);
        log_version();
    }

    display.open();
    background.load(display.renderer, config);

    compositor = std::make_unique<SdlCompositor>(display.renderer);
    dim_layer = std::make_unique<DimLayer>(*compositor, DISPLAY_ID);
    if (!dim_layer->has_surface())
        spdlog::error("Dim layer is unavailable, dimming disabled");
    screensaver = std::make_unique<Screensaver>(*dim_layer, config);

    // Main program loop
    spdlog::debug("");
    spdlog::debug("Begin main loop");
    ticks.main = SDL_GetTicks64();
    ticks.last_input = ticks.main;
    while(1) {
        ticks.main = SDL_GetTicks64();
        {
            SurfaceTransaction transaction(*compositor);
            while(SDL_PollEvent(&event)) {
                switch(event.type) {
                    case SDL_QUIT:
                        quit(EXIT_SUCCESS);
                        break;

                    case SDL_KEYDOWN: {
                        ticks.last_input = ticks.main;
                        auto it = std::find_if(hotkey_list.begin(),
                                      hotkey_list.end(),
                                      [&](const Hotkey &h){ return h.keycode == event.key.keysym.sym; }
                                  );
                        if (it != hotkey_list.end())
                            execute_command(it->command);
                        else if (event.key.keysym.sym == SDLK_SPACE)
                            execute_command(":toggle");
                        else if (event.key.keysym.sym == SDLK_RETURN)
                            execute_command(":jump");
                        else if (event.key.keysym.sym == SDLK_ESCAPE)
                            execute_command(":quit");
                        break;
                    }

                    case SDL_MOUSEBUTTONDOWN:
                        ticks.last_input = ticks.main;
                        break;

                    case SDL_WINDOWEVENT:
                        if (event.window.event == SDL_WINDOWEVENT_MINIMIZED)
                            state.minimized = true;
                        else if (event.window.event == SDL_WINDOWEVENT_RESTORED)
                            state.minimized = false;
                        break;
                }
            }

            if (config.screensaver_enabled)
                screensaver->update(ticks.main, ticks.last_input);
            if (dim_layer->is_animating())
                dim_layer->step_animation();
        }

        if (state.minimized) {
            SDL_Delay(APPLICATION_WAIT_PERIOD);
            continue;
        }
        background.draw(display.renderer);
        compositor->draw(DISPLAY_ID);
        SDL_RenderPresent(display.renderer);
    }
    return 0;
}
