#pragma once

#include <cstdint>
#include <memory>
#include <string>

struct DisplayInfo {
    int logical_width = 0;
    int logical_height = 0;
};

// A native drawable owned by exactly one client. Every setter returns false
// when the compositor rejected the call, error() then describes why.
class Surface {
    public:
        virtual ~Surface() = default;

        virtual bool set_position(float x, float y) = 0;
        virtual bool set_size(int w, int h) = 0;
        virtual bool set_layer(int layer) = 0;
        virtual bool set_layer_stack(int display_id) = 0;
        virtual bool set_alpha(float alpha) = 0;
        virtual bool show() = 0;
        virtual bool hide() = 0;
        virtual void destroy() = 0;

        virtual std::string describe() const = 0;
        virtual std::string error() const = 0;
};

class Compositor {
    public:
        virtual ~Compositor() = default;

        // Surfaces are created opaque and hidden. Returns nullptr on failure.
        virtual std::unique_ptr<Surface> create_surface(const std::string &name, int w, int h) = 0;
        virtual bool get_display_info(int display_id, DisplayInfo &info) const = 0;
        virtual int64_t uptime_millis() const = 0;

        // Surface changes made between the outermost open/close pair reach
        // the screen together
        virtual void open_transaction() = 0;
        virtual void close_transaction() = 0;
};

class SurfaceTransaction {
    private:
        Compositor &compositor;

    public:
        explicit SurfaceTransaction(Compositor &compositor) : compositor(compositor)
        {
            compositor.open_transaction();
        }
        ~SurfaceTransaction()
        {
            compositor.close_transaction();
        }

        SurfaceTransaction(const SurfaceTransaction&) = delete;
        SurfaceTransaction &operator=(const SurfaceTransaction&) = delete;
};
