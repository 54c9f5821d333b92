#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "surface.hpp"

#define DIM_SURFACE_NAME "DimLayer"
#define DIM_SURFACE_INITIAL_SIZE 16

// Multiply by 1.5 so that rotating a frozen frame that includes the dim
// surface does not expose a corner
#define DIM_SURFACE_SCALE 1.5

#define LAYER_UNSET -1

/*
 * A single dim surface covering one display. Alpha transitions are linear
 * and advanced by the caller through step_animation().
 *
 * Every mutating call must be made with a surface transaction open.
 */
class DimLayer {
    private:
        Compositor &compositor;
        int display_id;

        // Actual surface that dims, null once destroyed or if creation failed
        std::unique_ptr<Surface> surface;

        // Last values passed to the surface
        float alpha = 0.f;
        int layer = LAYER_UNSET;
        int last_width = 0;
        int last_height = 0;

        // True after surface->show(), false after surface->hide()
        bool showing = false;

        // Current transition
        float start_alpha = 0.f;
        float target_alpha = 0.f;
        int64_t start_time = 0;
        int64_t duration = 0;

        void set_alpha(float alpha);
        void update_geometry(int layer);
        bool duration_ends_earlier(int64_t duration) const;

    public:
        DimLayer(Compositor &compositor, int display_id);
        ~DimLayer();

        DimLayer(const DimLayer&) = delete;
        DimLayer &operator=(const DimLayer&) = delete;

        bool is_dimming() const { return target_alpha != 0; }
        bool is_animating() const { return target_alpha != alpha; }
        bool is_showing() const { return showing; }
        bool has_surface() const { return surface != nullptr; }
        float get_target_alpha() const { return target_alpha; }
        float get_alpha() const { return alpha; }
        int get_layer() const { return layer; }
        int get_last_width() const { return last_width; }
        int get_last_height() const { return last_height; }

        void show();
        void show(int layer, float alpha, int64_t duration);
        void hide();
        void hide(int64_t duration);
        bool step_animation();
        void destroy_surface();
        void print_to(std::string_view prefix, std::string &out) const;
};
