#include <algorithm>
#include <cmath>
#include <iterator>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "dim_layer.hpp"

DimLayer::DimLayer(Compositor &compositor, int display_id) : compositor(compositor), display_id(display_id)
{
    spdlog::debug("DimLayer: display {}", display_id);
    SurfaceTransaction transaction(compositor);
    surface = compositor.create_surface(DIM_SURFACE_NAME, DIM_SURFACE_INITIAL_SIZE, DIM_SURFACE_INITIAL_SIZE);
    if (surface == nullptr) {
        spdlog::error("Could not create dim surface for display {}", display_id);
        return;
    }
    if (!surface->set_layer_stack(display_id)) {
        spdlog::error("Could not assign dim surface to display {}", display_id);
        spdlog::error("Surface error: {}", surface->error());
        surface->destroy();
        surface.reset();
        return;
    }
    spdlog::debug("  DIM {}: CREATE", surface->describe());
}

DimLayer::~DimLayer()
{
    destroy_surface();
}

void DimLayer::set_alpha(float alpha)
{
    if (this->alpha == alpha)
        return;

    spdlog::debug("DimLayer: set_alpha alpha={}", alpha);
    if (!surface->set_alpha(alpha)) {
        spdlog::warn("Failure setting alpha immediately: {}", surface->error());
    }
    else if (alpha == 0 && showing) {
        spdlog::debug("DimLayer: set_alpha hiding");
        if (surface->hide())
            showing = false;
        else
            spdlog::warn("Failure hiding dim surface: {}", surface->error());
    }
    else if (alpha > 0 && !showing) {
        spdlog::debug("DimLayer: set_alpha showing");
        if (surface->show())
            showing = true;
        else
            spdlog::warn("Failure showing dim surface: {}", surface->error());
    }

    // Keep following the request even if the surface did not
    this->alpha = alpha;
}

// Stretches the surface over the display, only touching it when the display
// size or the requested layer changed
void DimLayer::update_geometry(int layer)
{
    DisplayInfo info;
    if (!compositor.get_display_info(display_id, info)) {
        spdlog::warn("Could not get info for display {}", display_id);
        return;
    }

    const int dw = (int) (info.logical_width * DIM_SURFACE_SCALE);
    const int dh = (int) (info.logical_height * DIM_SURFACE_SCALE);

    // Back off so a quarter of the display sticks out on each side
    const float x_pos = (float) (-dw / 6);
    const float y_pos = (float) (-dh / 6);

    if (last_width != dw || last_height != dh || this->layer != layer) {
        if (!surface->set_position(x_pos, y_pos) ||
        !surface->set_size(dw, dh) ||
        !surface->set_layer(layer)) {
            spdlog::warn("Failure setting size or layer: {}", surface->error());
        }
        last_width = dw;
        last_height = dh;
        this->layer = layer;
    }
}

bool DimLayer::duration_ends_earlier(int64_t duration) const
{
    return compositor.uptime_millis() + duration < start_time + this->duration;
}

// Jump to the end of the current transition
void DimLayer::show()
{
    if (is_animating()) {
        spdlog::debug("DimLayer: show immediate");
        if (surface != nullptr && layer == LAYER_UNSET) {
            // Geometry was never applied, there is no layer to repeat
            set_alpha(target_alpha);
        }
        else
            show(layer, target_alpha, 0);
    }
}

void DimLayer::show(int layer, float alpha, int64_t duration)
{
    spdlog::debug("DimLayer: show layer={} alpha={} duration={}", layer, alpha, duration);
    if (surface == nullptr) {
        spdlog::error("DimLayer: show with no surface");
        // Make sure is_animating() returns false
        target_alpha = this->alpha = 0.f;
        return;
    }

    if (!(alpha >= 0.f && alpha <= 1.f)) {
        spdlog::warn("DimLayer: alpha {} out of range", alpha);
        alpha = std::isnan(alpha) ? 0.f : std::clamp(alpha, 0.f, 1.f);
    }

    update_geometry(layer);

    const int64_t cur_time = compositor.uptime_millis();
    const bool animating = is_animating();
    if ((animating && (target_alpha != alpha || duration_ends_earlier(duration))) ||
    (!animating && this->alpha != alpha)) {
        if (duration <= 0) {
            // No animation required, just set values
            set_alpha(alpha);
        }
        else {
            // Start or continue the transition with new parameters
            start_alpha = this->alpha;
            start_time = cur_time;
            this->duration = duration;
        }
    }
    spdlog::debug("DimLayer: show start_alpha={} start_time={}", start_alpha, start_time);
    target_alpha = alpha;
}

void DimLayer::hide()
{
    if (showing) {
        spdlog::debug("DimLayer: hide immediate");
        hide(0);
    }
}

void DimLayer::hide(int64_t duration)
{
    if (showing && (target_alpha != 0 || duration_ends_earlier(duration))) {
        spdlog::debug("DimLayer: hide duration={}", duration);
        show(layer, 0.f, duration);
    }
}

// Returns true while further steps are needed
bool DimLayer::step_animation()
{
    if (surface == nullptr) {
        spdlog::error("DimLayer: step_animation with no surface");
        target_alpha = alpha = 0.f;
        return false;
    }

    if (is_animating()) {
        const int64_t cur_time = compositor.uptime_millis();
        const float alpha_delta = target_alpha - start_alpha;
        float alpha = start_alpha + alpha_delta * (float) (cur_time - start_time) / (float) duration;
        if ((alpha_delta > 0 && alpha > target_alpha) ||
        (alpha_delta < 0 && alpha < target_alpha)) {
            alpha = target_alpha;
        }
        spdlog::debug("DimLayer: step_animation cur_time={} alpha={}", cur_time, alpha);
        set_alpha(alpha);
    }

    return is_animating();
}

void DimLayer::destroy_surface()
{
    if (surface != nullptr) {
        spdlog::debug("DimLayer: destroy_surface");
        surface->destroy();
        surface.reset();
    }
}

void DimLayer::print_to(std::string_view prefix, std::string &out) const
{
    auto it = std::back_inserter(out);
    fmt::format_to(it, "{}surface={}\n", prefix, surface ? surface->describe() : "null");
    fmt::format_to(it, "{} layer={} alpha={}\n", prefix, layer, alpha);
    fmt::format_to(it, "{}last_width={} last_height={}\n", prefix, last_width, last_height);
    fmt::format_to(it, "{}Last animation: start_time={} duration={} cur_time={}\n",
        prefix, start_time, duration, compositor.uptime_millis()
    );
    fmt::format_to(it, "{} start_alpha={} target_alpha={}\n", prefix, start_alpha, target_alpha);
}
