#pragma once

#include <memory>
#include <string>
#include <fmt/format.h>
#include "surface.hpp"

// Everything the fake surface saw, kept outside of the surface so it can
// still be inspected after the surface is gone
struct SurfaceLog {
    int position_calls = 0;
    int size_calls = 0;
    int layer_calls = 0;
    int layer_stack_calls = 0;
    int alpha_calls = 0;
    int show_calls = 0;
    int hide_calls = 0;
    int destroy_calls = 0;

    float x = 0.f;
    float y = 0.f;
    int w = 0;
    int h = 0;
    int layer = 0;
    int layer_stack = -1;
    float alpha = 1.f;
    bool shown = false;

    bool fail_geometry = false;
    bool fail_layer_stack = false;
    bool fail_alpha = false;
    bool fail_visibility = false;

    int geometry_calls() const { return position_calls + size_calls + layer_calls; }
    int total_calls() const
    {
        return geometry_calls() + layer_stack_calls + alpha_calls + show_calls + hide_calls + destroy_calls;
    }
};

class FakeSurface : public Surface {
    private:
        SurfaceLog &log;
        std::string name;

    public:
        FakeSurface(SurfaceLog &log, const std::string &name, int w, int h) : log(log), name(name)
        {
            log.w = w;
            log.h = h;
        }

        bool set_position(float x, float y) override
        {
            log.position_calls++;
            if (log.fail_geometry)
                return false;
            log.x = x;
            log.y = y;
            return true;
        }

        bool set_size(int w, int h) override
        {
            log.size_calls++;
            if (log.fail_geometry)
                return false;
            log.w = w;
            log.h = h;
            return true;
        }

        bool set_layer(int layer) override
        {
            log.layer_calls++;
            if (log.fail_geometry)
                return false;
            log.layer = layer;
            return true;
        }

        bool set_layer_stack(int display_id) override
        {
            log.layer_stack_calls++;
            if (log.fail_layer_stack)
                return false;
            log.layer_stack = display_id;
            return true;
        }

        bool set_alpha(float alpha) override
        {
            log.alpha_calls++;
            if (log.fail_alpha)
                return false;
            log.alpha = alpha;
            return true;
        }

        bool show() override
        {
            log.show_calls++;
            if (log.fail_visibility)
                return false;
            log.shown = true;
            return true;
        }

        bool hide() override
        {
            log.hide_calls++;
            if (log.fail_visibility)
                return false;
            log.shown = false;
            return true;
        }

        void destroy() override
        {
            log.destroy_calls++;
        }

        std::string describe() const override
        {
            return fmt::format("FakeSurface({})", name);
        }

        std::string error() const override
        {
            return "rejected by fake";
        }
};

class FakeCompositor : public Compositor {
    public:
        SurfaceLog log;
        DisplayInfo info = {1000, 800};
        bool display_available = true;
        bool fail_create = false;
        int64_t now = 0;

        int transaction_depth = 0;
        int transactions = 0;
        int create_depth = -1;
        std::string created_name;

        std::unique_ptr<Surface> create_surface(const std::string &name, int w, int h) override
        {
            create_depth = transaction_depth;
            if (fail_create)
                return nullptr;
            created_name = name;
            return std::make_unique<FakeSurface>(log, name, w, h);
        }

        bool get_display_info(int display_id, DisplayInfo &out) const override
        {
            if (!display_available || display_id != 0)
                return false;
            out = info;
            return true;
        }

        int64_t uptime_millis() const override
        {
            return now;
        }

        void open_transaction() override
        {
            transaction_depth++;
            transactions++;
        }

        void close_transaction() override
        {
            transaction_depth--;
        }
};
