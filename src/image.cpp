#include <SDL.h>
#include <SDL_image.h>
#include <spdlog/spdlog.h>
#include "image.hpp"

SDL_Surface *load_surface(const std::string &file)
{
    SDL_Surface *img = NULL;
    SDL_Surface *out = NULL;
    img = IMG_Load(file.c_str());
    if (img == NULL) {
        spdlog::error("Could not load image from {}", file);
        spdlog::error("SDL Error: {}", IMG_GetError());
        return out;
    }

    // Convert the loaded surface if different pixel format
    if (img->format->format != SDL_PIXELFORMAT_ARGB8888) {
        out = SDL_ConvertSurfaceFormat(img, SDL_PIXELFORMAT_ARGB8888, 0);
        if (out == NULL) {
            spdlog::error("Could not convert image '{}'", file);
            spdlog::error("SDL Error: {}", SDL_GetError());
        }
        free_surface(img);
    }
    else
        out = img;

    return out;
}

void Background::load(SDL_Renderer *renderer, const Config &config)
{
    color = config.background_color;
    if (config.background_image_path.empty())
        return;

    spdlog::debug("Loading background image '{}'", config.background_image_path);
    SDL_Surface *surface = load_surface(config.background_image_path);
    if (surface == nullptr)
        return;
    texture = SDL_CreateTextureFromSurface(renderer, surface);
    free_surface(surface);
    if (texture == nullptr) {
        spdlog::error("Could not create background texture");
        spdlog::error("SDL Error: {}", SDL_GetError());
    }
}

void Background::draw(SDL_Renderer *renderer)
{
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    SDL_RenderClear(renderer);
    if (texture != nullptr)
        SDL_RenderCopy(renderer, texture, NULL, NULL);
}

void Background::close()
{
    if (texture != nullptr) {
        SDL_DestroyTexture(texture);
        texture = nullptr;
    }
}
