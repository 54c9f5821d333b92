#pragma once

#include <SDL.h>
#include "dim_layer.hpp"
#include "util.hpp"

// Dims the display through the dim layer after a period without input, then
// returns it to the dim level it had before
class Screensaver {
    private:
        DimLayer &dim_layer;
        int layer;
        float intensity;
        Uint64 idle_time;
        Uint64 transition_time;
        float restore_alpha = 0.f;

    public:
        bool active = false;

        Screensaver(DimLayer &dim_layer, const Config &config);
        void update(Uint64 ticks_main, Uint64 last_input);
};
