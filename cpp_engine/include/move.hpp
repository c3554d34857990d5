/**
 * PokeBattle Engine - Move Definition
 *
 * Immutable move data as loaded by the MoveDex. Runtime PP lives in
 * MoveSlot on the Pokemon, not here.
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace pokebattle {

/**
 * Secondary - One row of a move's secondary-effect table.
 *
 * Only the fields relevant to `kind` are read. `chance` is the probability
 * the row fires once the move has connected (1.0 for guaranteed effects).
 */
struct Secondary {
    SecondaryKind kind = SecondaryKind::STATUS;
    double chance = 1.0;

    StatusCondition status = StatusCondition::NONE;
    VolatileKind volatile_kind = VolatileKind::CONFUSION;
    Stat stat = Stat::ATK;
    int stages = 0;
    double fraction = 0.0;             // recoil / drain / heal
    HazardKind hazard = HazardKind::STEALTH_ROCK;
    ScreenKind screen = ScreenKind::REFLECT;
    Weather weather = Weather::NONE;
    Terrain terrain = Terrain::NONE;
    SideConditionKind side_condition = SideConditionKind::TAILWIND;

    static Secondary make_status(StatusCondition s, double chance = 1.0) {
        Secondary sec;
        sec.kind = SecondaryKind::STATUS;
        sec.status = s;
        sec.chance = chance;
        return sec;
    }

    static Secondary make_volatile(VolatileKind v, double chance = 1.0) {
        Secondary sec;
        sec.kind = SecondaryKind::VOLATILE;
        sec.volatile_kind = v;
        sec.chance = chance;
        return sec;
    }

    static Secondary make_boost(bool self, Stat stat, int stages, double chance = 1.0) {
        Secondary sec;
        sec.kind = self ? SecondaryKind::BOOST_SELF : SecondaryKind::BOOST_TARGET;
        sec.stat = stat;
        sec.stages = stages;
        sec.chance = chance;
        return sec;
    }

    static Secondary make_fraction(SecondaryKind kind, double fraction) {
        Secondary sec;
        sec.kind = kind;
        sec.fraction = fraction;
        return sec;
    }
};

struct MoveFlags {
    bool contact = false;
    bool sound = false;
    bool punch = false;
    bool bite = false;
    bool pulse = false;
    bool powder = false;
    bool charge = false;          // two-turn move (Solar Beam)
    bool recharge = false;        // user must recharge next turn (Hyper Beam)
    bool gravity_banned = false;  // unusable under Gravity
    bool thaws_user = false;
};

/**
 * Move - Immutable move definition.
 */
struct Move {
    MoveID id;
    std::string name;
    PokeType type = PokeType::NORMAL;
    MoveCategory category = MoveCategory::PHYSICAL;
    int base_power = 0;
    double accuracy = 1.0;           // in (0, 1]
    bool always_hits = false;
    int priority = 0;                // -7..+5
    MoveTarget target = MoveTarget::NORMAL;
    MoveFlags flags;
    int pp = 0;
    int crit_stage = 0;
    std::vector<Secondary> secondaries;

    // Set on converted moves (Z-move / Max move)
    bool is_z = false;
    bool is_max = false;

    bool is_status() const { return category == MoveCategory::STATUS; }
    bool is_damaging() const { return category != MoveCategory::STATUS && base_power > 0; }

    bool has_secondary(SecondaryKind kind) const {
        for (const auto& sec : secondaries) {
            if (sec.kind == kind) return true;
        }
        return false;
    }

    // Effects a Sheer Force user loses (chance < 1 rows that hit the target)
    bool has_chance_secondaries() const {
        for (const auto& sec : secondaries) {
            if (sec.chance < 1.0) return true;
        }
        return false;
    }
};

// Ids of moves the engine needs to recognize by name
namespace move_ids {
    constexpr const char* STRUGGLE = "struggle";
    constexpr const char* CONFUSION_SELF_HIT = "confusionselfhit";
    constexpr const char* GRASSY_GLIDE = "grassyglide";
    constexpr const char* THUNDER = "thunder";
    constexpr const char* HURRICANE = "hurricane";
    constexpr const char* BLIZZARD = "blizzard";
    constexpr const char* SOLAR_BEAM = "solarbeam";
    constexpr const char* AURORA_VEIL = "auroraveil";
}

} // namespace pokebattle
