/**
 * PokeBattle Engine - Pokemon
 *
 * A Pokemon in battle: immutable identity plus mutable runtime state
 * (HP, status, boosts, volatiles). Copied by value whenever a BattleState
 * is cloned.
 */

#pragma once

#include "move.hpp"
#include <map>
#include <algorithm>

namespace pokebattle {

/**
 * Stats - Battle stats (already computed, not base-stat formula inputs).
 */
struct Stats {
    int hp = 1;
    int atk = 1;
    int def = 1;
    int spa = 1;
    int spd = 1;
    int spe = 1;

    int get(Stat stat) const {
        switch (stat) {
            case Stat::HP: return hp;
            case Stat::ATK: return atk;
            case Stat::DEF: return def;
            case Stat::SPA: return spa;
            case Stat::SPD: return spd;
            case Stat::SPE: return spe;
            default: return 0;
        }
    }
};

/**
 * Boosts - Stat stages, each clamped to [-6, +6].
 */
struct Boosts {
    int atk = 0;
    int def = 0;
    int spa = 0;
    int spd = 0;
    int spe = 0;
    int accuracy = 0;
    int evasion = 0;

    int get(Stat stat) const {
        switch (stat) {
            case Stat::ATK: return atk;
            case Stat::DEF: return def;
            case Stat::SPA: return spa;
            case Stat::SPD: return spd;
            case Stat::SPE: return spe;
            case Stat::ACCURACY: return accuracy;
            case Stat::EVASION: return evasion;
            default: return 0;
        }
    }

    // Apply a stage change, clamped. Returns the change actually applied.
    int apply(Stat stat, int stages) {
        int* slot = nullptr;
        switch (stat) {
            case Stat::ATK: slot = &atk; break;
            case Stat::DEF: slot = &def; break;
            case Stat::SPA: slot = &spa; break;
            case Stat::SPD: slot = &spd; break;
            case Stat::SPE: slot = &spe; break;
            case Stat::ACCURACY: slot = &accuracy; break;
            case Stat::EVASION: slot = &evasion; break;
            default: return 0;
        }
        int before = *slot;
        *slot = std::clamp(before + stages, -MAX_BOOST, MAX_BOOST);
        return *slot - before;
    }

    bool in_range() const {
        for (int v : {atk, def, spa, spd, spe, accuracy, evasion}) {
            if (v < -MAX_BOOST || v > MAX_BOOST) return false;
        }
        return true;
    }

    void clear() { *this = Boosts{}; }
};

struct MoveSlot {
    Move move;
    int pp = 0;
    int max_pp = 0;
};

/**
 * TeraRecord - One-time type change. Once used it is never restored.
 */
struct TeraRecord {
    bool available = false;
    bool used = false;
    PokeType type = PokeType::NORMAL;
};

struct MegaForme {
    SpeciesID species;
    ItemID item;                 // mega stone required to evolve
    Stats stats;
    std::vector<PokeType> types;
    AbilityID ability;
};

/**
 * VolatileEffect - Entry in the ordered volatile map.
 *
 * turns_left < 0 means "until switch out". `counter` is a per-kind
 * auxiliary value (perish count, consecutive protects, trap source).
 */
struct VolatileEffect {
    int turns_left = -1;
    int counter = 0;
    MoveID move;                 // locked/disabled/charging move where relevant
};

/**
 * Pokemon - A single battler.
 */
struct Pokemon {
    // Identity
    SpeciesID species;
    int level = 100;
    std::vector<PokeType> types;     // original typing
    AbilityID ability;
    ItemID item;                     // empty when none

    // Stats and HP
    Stats stats;
    int current_hp = 1;
    int max_hp = 1;

    // Primary status
    StatusCondition status = StatusCondition::NONE;
    int sleep_turns = 0;             // turns of sleep remaining
    int toxic_counter = 0;           // n in n/16
    bool status_from_opponent = false;

    Boosts boosts;
    std::vector<MoveSlot> moves;

    // Once-per-battle transformations
    TeraRecord tera;
    std::optional<MegaForme> mega_forme;
    bool mega_evolved = false;
    bool dynamaxed = false;
    int pre_dynamax_max_hp = 0;

    // Runtime bookkeeping
    MoveID last_move;                // last move used this stint
    bool item_consumed = false;      // Unburden trigger
    bool switched_in_this_turn = false;
    int protect_streak = 0;          // consecutive successful protects

    std::map<VolatileKind, VolatileEffect> volatiles;

    // ========================================================================
    // HP HELPERS
    // ========================================================================

    bool is_fainted() const {
        return status == StatusCondition::FAINTED || current_hp <= 0;
    }

    bool at_full_hp() const { return current_hp == max_hp; }

    double hp_fraction() const {
        return max_hp > 0 ? static_cast<double>(current_hp) / max_hp : 0.0;
    }

    // Subtract HP, clamp at 0 and mark fainted. Returns HP actually lost.
    int apply_damage(int amount) {
        if (amount <= 0 || is_fainted()) return 0;
        int lost = std::min(amount, current_hp);
        current_hp -= lost;
        if (current_hp == 0) {
            faint();
        }
        return lost;
    }

    // Returns HP actually restored.
    int heal(int amount) {
        if (amount <= 0 || is_fainted()) return 0;
        int gained = std::min(amount, max_hp - current_hp);
        current_hp += gained;
        return gained;
    }

    void faint() {
        current_hp = 0;
        status = StatusCondition::FAINTED;
        sleep_turns = 0;
        toxic_counter = 0;
        volatiles.clear();
    }

    // ========================================================================
    // TYPE HELPERS
    // ========================================================================

    // Typing used for defensive matchups (tera replaces it entirely)
    std::vector<PokeType> effective_types() const {
        if (tera.used) {
            return {tera.type};
        }
        return types;
    }

    bool has_effective_type(PokeType t) const {
        for (PokeType x : effective_types()) {
            if (x == t) return true;
        }
        return false;
    }

    // ========================================================================
    // VOLATILE HELPERS
    // ========================================================================

    bool has_volatile(VolatileKind kind) const {
        return volatiles.find(kind) != volatiles.end();
    }

    VolatileEffect* get_volatile(VolatileKind kind) {
        auto it = volatiles.find(kind);
        return it != volatiles.end() ? &it->second : nullptr;
    }

    const VolatileEffect* get_volatile(VolatileKind kind) const {
        auto it = volatiles.find(kind);
        return it != volatiles.end() ? &it->second : nullptr;
    }

    void add_volatile(VolatileKind kind, VolatileEffect effect) {
        volatiles[kind] = std::move(effect);
    }

    void remove_volatile(VolatileKind kind) {
        volatiles.erase(kind);
    }

    // ========================================================================
    // MOVE HELPERS
    // ========================================================================

    int find_move_slot(const MoveID& move_id) const {
        for (size_t i = 0; i < moves.size(); ++i) {
            if (moves[i].move.id == move_id) return static_cast<int>(i);
        }
        return -1;
    }

    bool has_any_pp() const {
        for (const auto& slot : moves) {
            if (slot.pp > 0) return true;
        }
        return false;
    }

    // ========================================================================
    // SWITCH OUT
    // ========================================================================

    // Volatiles, boosts and the choice lock do not survive leaving the field
    void on_switch_out() {
        volatiles.clear();
        boosts.clear();
        last_move.clear();
        switched_in_this_turn = false;
        protect_streak = 0;
        if (status == StatusCondition::TOXIC) {
            toxic_counter = 1;
        }
    }
};

} // namespace pokebattle
