#include <algorithm>
#include <cmath>
#include <SDL.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "sdl_compositor.hpp"

SdlSurface::SdlSurface(SdlCompositor &compositor, const std::string &name, SDL_Texture *texture, int w, int h)
: compositor(compositor), name(name), texture(texture)
{
    pending.rect.w = (float) w;
    pending.rect.h = (float) h;
    current = pending;
    compositor.surfaces.push_back(this);
}

SdlSurface::~SdlSurface()
{
    destroy();
}

bool SdlSurface::check()
{
    if (texture == nullptr) {
        last_error = fmt::format("surface '{}' has been destroyed", name);
        return false;
    }
    return true;
}

// Changes made outside of a transaction go straight to the screen
void SdlSurface::changed()
{
    if (compositor.transaction_depth == 0)
        current = pending;
}

bool SdlSurface::set_position(float x, float y)
{
    if (!check())
        return false;
    pending.rect.x = x;
    pending.rect.y = y;
    changed();
    return true;
}

bool SdlSurface::set_size(int w, int h)
{
    if (!check())
        return false;
    if (w < 0 || h < 0) {
        last_error = fmt::format("invalid size {}x{}", w, h);
        return false;
    }
    pending.rect.w = (float) w;
    pending.rect.h = (float) h;
    changed();
    return true;
}

bool SdlSurface::set_layer(int layer)
{
    if (!check())
        return false;
    pending.layer = layer;
    changed();
    return true;
}

bool SdlSurface::set_layer_stack(int display_id)
{
    if (!check())
        return false;
    DisplayInfo info;
    if (!compositor.get_display_info(display_id, info)) {
        last_error = fmt::format("no display {}", display_id);
        return false;
    }
    pending.layer_stack = display_id;
    changed();
    return true;
}

bool SdlSurface::set_alpha(float alpha)
{
    if (!check())
        return false;
    pending.alpha = alpha;
    changed();
    return true;
}

bool SdlSurface::show()
{
    if (!check())
        return false;
    pending.shown = true;
    changed();
    return true;
}

bool SdlSurface::hide()
{
    if (!check())
        return false;
    pending.shown = false;
    changed();
    return true;
}

void SdlSurface::destroy()
{
    if (texture == nullptr)
        return;
    SDL_DestroyTexture(texture);
    texture = nullptr;
    auto &surfaces = compositor.surfaces;
    surfaces.erase(std::remove(surfaces.begin(), surfaces.end(), this), surfaces.end());
}

std::string SdlSurface::describe() const
{
    return fmt::format("Surface(name={}, {}x{} @ {},{}, layer={}, alpha={}, shown={})",
        name,
        current.rect.w,
        current.rect.h,
        current.rect.x,
        current.rect.y,
        current.layer,
        current.alpha,
        current.shown
    );
}

std::string SdlSurface::error() const
{
    return last_error;
}

SdlCompositor::SdlCompositor(SDL_Renderer *renderer) : renderer(renderer)
{
}

SdlCompositor::~SdlCompositor()
{
    if (!surfaces.empty())
        spdlog::warn("Compositor closing with {} surfaces still alive", surfaces.size());
    for (SdlSurface *surface : surfaces) {
        SDL_DestroyTexture(surface->texture);
        surface->texture = nullptr;
    }
    surfaces.clear();
}

std::unique_ptr<Surface> SdlCompositor::create_surface(const std::string &name, int w, int h)
{
    SDL_Surface *surface = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_ARGB8888);
    if (surface == nullptr) {
        spdlog::error("Could not create surface '{}'", name);
        spdlog::error("SDL Error: {}", SDL_GetError());
        return nullptr;
    }
    Uint32 color = SDL_MapRGBA(surface->format, 0, 0, 0, 0xFF);
    SDL_FillRect(surface, NULL, color);
    SDL_Texture *texture = SDL_CreateTextureFromSurface(renderer, surface);
    SDL_FreeSurface(surface);
    if (texture == nullptr) {
        spdlog::error("Could not create texture for surface '{}'", name);
        spdlog::error("SDL Error: {}", SDL_GetError());
        return nullptr;
    }
    SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_BLEND);
    return std::make_unique<SdlSurface>(*this, name, texture, w, h);
}

bool SdlCompositor::get_display_info(int display_id, DisplayInfo &info) const
{
    if (display_id != 0)
        return false;

    int w = 0;
    int h = 0;
    SDL_RenderGetLogicalSize(renderer, &w, &h);
    if (w == 0 || h == 0) {
        if (SDL_GetRendererOutputSize(renderer, &w, &h) < 0) {
            spdlog::error("Could not get renderer output size");
            spdlog::error("SDL Error: {}", SDL_GetError());
            return false;
        }
    }
    info.logical_width = w;
    info.logical_height = h;
    return true;
}

int64_t SdlCompositor::uptime_millis() const
{
    return (int64_t) SDL_GetTicks64();
}

void SdlCompositor::open_transaction()
{
    transaction_depth++;
}

void SdlCompositor::close_transaction()
{
    if (transaction_depth == 0) {
        spdlog::warn("close_transaction called without an open transaction");
        return;
    }
    if (--transaction_depth == 0)
        commit();
}

void SdlCompositor::commit()
{
    for (SdlSurface *surface : surfaces)
        surface->current = surface->pending;
}

void SdlCompositor::draw(int display_id)
{
    std::vector<SdlSurface*> visible;
    for (SdlSurface *surface : surfaces) {
        if (surface->current.shown && surface->current.layer_stack == display_id)
            visible.push_back(surface);
    }
    std::stable_sort(visible.begin(), visible.end(),
        [](const SdlSurface *a, const SdlSurface *b) { return a->current.layer < b->current.layer; }
    );

    for (SdlSurface *surface : visible) {
        float alpha = std::clamp(surface->current.alpha, 0.f, 1.f);
        SDL_SetTextureAlphaMod(surface->texture, (Uint8) std::round(alpha * 255.f));
        SDL_RenderCopyF(renderer, surface->texture, nullptr, &surface->current.rect);
    }
}
