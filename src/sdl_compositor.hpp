#pragma once

#include <memory>
#include <string>
#include <vector>
#include <SDL.h>
#include "surface.hpp"

class SdlCompositor;

class SdlSurface : public Surface {
    private:
        struct State {
            SDL_FRect rect = {0.f, 0.f, 0.f, 0.f};
            int layer = 0;
            int layer_stack = 0;
            float alpha = 1.f;
            bool shown = false;
        };

        SdlCompositor &compositor;
        std::string name;
        SDL_Texture *texture = nullptr;
        State pending;
        State current;
        std::string last_error;

        bool check();
        void changed();

        friend class SdlCompositor;

    public:
        SdlSurface(SdlCompositor &compositor, const std::string &name, SDL_Texture *texture, int w, int h);
        ~SdlSurface();

        SdlSurface(const SdlSurface&) = delete;
        SdlSurface &operator=(const SdlSurface&) = delete;

        bool set_position(float x, float y) override;
        bool set_size(int w, int h) override;
        bool set_layer(int layer) override;
        bool set_layer_stack(int display_id) override;
        bool set_alpha(float alpha) override;
        bool show() override;
        bool hide() override;
        void destroy() override;

        std::string describe() const override;
        std::string error() const override;
};

// Draws solid black surfaces over a single SDL renderer. The renderer is
// display 0.
class SdlCompositor : public Compositor {
    private:
        SDL_Renderer *renderer;
        std::vector<SdlSurface*> surfaces;
        int transaction_depth = 0;

        void commit();

        friend class SdlSurface;

    public:
        explicit SdlCompositor(SDL_Renderer *renderer);
        ~SdlCompositor();

        std::unique_ptr<Surface> create_surface(const std::string &name, int w, int h) override;
        bool get_display_info(int display_id, DisplayInfo &info) const override;
        int64_t uptime_millis() const override;
        void open_transaction() override;
        void close_transaction() override;

        void draw(int display_id);
};
