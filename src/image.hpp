#pragma once

#include <string>
#include <SDL.h>
#include "util.hpp"

#define free_surface(s)               \
if (s != nullptr) {                   \
    if(s->flags & SDL_PREALLOC) {     \
        free(s->pixels);              \
        s->pixels = nullptr;          \
    }                                 \
    SDL_FreeSurface(s);               \
}

// Content drawn under the dim layer
class Background {
    private:
        SDL_Texture *texture = nullptr;
        SDL_Color color = {0x00, 0x00, 0x00, 0xFF};

    public:
        void load(SDL_Renderer *renderer, const Config &config);
        void draw(SDL_Renderer *renderer);
        void close();
};

SDL_Surface *load_surface(const std::string &file);
