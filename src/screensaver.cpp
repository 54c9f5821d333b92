#include <algorithm>
#include <SDL.h>
#include <spdlog/spdlog.h>
#include "screensaver.hpp"

Screensaver::Screensaver(DimLayer &dim_layer, const Config &config)
: dim_layer(dim_layer),
  layer(config.dim_layer),
  intensity(config.screensaver_intensity),
  idle_time(config.screensaver_idle_time),
  transition_time(config.screensaver_transition_time)
{
}

void Screensaver::update(Uint64 ticks_main, Uint64 last_input)
{
    Uint64 idle = ticks_main > last_input ? ticks_main - last_input : 0;
    if (!active) {
        if (idle > idle_time) {
            spdlog::debug("Screensaver activated after {} ms idle", idle);
            active = true;
            restore_alpha = dim_layer.get_target_alpha();
            dim_layer.show(layer, std::max(intensity, restore_alpha), (int64_t) transition_time);
        }
    }
    else if (idle < idle_time) {
        spdlog::debug("Screensaver deactivated");
        active = false;

        // Not hide(): the surface is not showing yet if the fade in has not
        // been stepped past zero
        dim_layer.show(layer, restore_alpha, (int64_t) transition_time);
    }
}
