/**
 * PokeBattle Engine - Field
 *
 * Weather and terrain shared by both sides.
 */

#pragma once

#include "types.hpp"

namespace pokebattle {

struct Field {
    Weather weather = Weather::NONE;
    int weather_turns = 0;
    bool weather_permanent = false;      // set by an ability, lasts until replaced

    Terrain terrain = Terrain::NONE;
    int terrain_turns = 0;
    bool terrain_permanent = false;

    bool has_weather(Weather w) const {
        return weather == w;
    }

    // Hail and snow share "hail-or-snow" semantics for Aurora Veil and Blizzard
    bool is_hail_or_snow() const {
        return weather == Weather::HAIL || weather == Weather::SNOW;
    }

    void set_weather(Weather w, int turns, bool permanent) {
        weather = w;
        weather_turns = (w == Weather::NONE || permanent) ? 0 : turns;
        weather_permanent = (w != Weather::NONE) && permanent;
    }

    void clear_weather() {
        set_weather(Weather::NONE, 0, false);
    }

    void set_terrain(Terrain t, int turns, bool permanent) {
        terrain = t;
        terrain_turns = (t == Terrain::NONE || permanent) ? 0 : turns;
        terrain_permanent = (t != Terrain::NONE) && permanent;
    }

    void clear_terrain() {
        set_terrain(Terrain::NONE, 0, false);
    }
};

} // namespace pokebattle
