/**
 * PokeBattle Engine - Status/Field Effect State Machine Implementation
 */

#include "conditions.hpp"
#include "mechanics.hpp"
#include "type_chart.hpp"
#include <algorithm>
#include <cmath>

namespace pokebattle {
namespace conditions {

using namespace mechanics;

namespace {

int fraction_of(int max_hp, double fraction) {
    return std::max(1, static_cast<int>(max_hp * fraction));
}

} // anonymous namespace

// ============================================================================
// HP CHANGES
// ============================================================================

int deal_damage(BattleState& state, SideID side, int amount, const std::string& source) {
    Side& s = state.sides[side];
    if (!s.has_healthy_active() || amount <= 0) {
        return 0;
    }
    Pokemon& p = *s.active;
    int lost = p.apply_damage(amount);
    state.add_log("damage", side, p.species + " (" + source + ")", lost);
    if (p.is_fainted()) {
        state.add_log("faint", side, p.species);
    }
    return lost;
}

int heal(BattleState& state, SideID side, int amount, const std::string& source) {
    Side& s = state.sides[side];
    if (!s.has_healthy_active()) {
        return 0;
    }
    Pokemon& p = *s.active;
    int gained = p.heal(amount);
    if (gained > 0) {
        state.add_log("heal", side, p.species + " (" + source + ")", gained);
    }
    return gained;
}

// ============================================================================
// PRIMARY STATUS
// ============================================================================

bool try_set_status(const EffectTable& table, const FormatRules& rules, BattleState& state,
                    SideID target_side, StatusCondition status, bool from_opponent,
                    bool ability_suppressed) {
    Side& s = state.sides[target_side];
    if (!s.has_healthy_active()) {
        return false;
    }
    Pokemon& p = *s.active;
    if (!can_receive_status(table, state, p, status, ability_suppressed)) {
        return false;
    }

    if (status == StatusCondition::SLEEP && from_opponent && rules.clauses.sleep) {
        for (const auto& other : s.bench) {
            if (!other.is_fainted() && other.status == StatusCondition::SLEEP && other.status_from_opponent) {
                state.add_log("fail", target_side, "sleep clause");
                return false;
            }
        }
    }

    p.status = status;
    p.status_from_opponent = from_opponent;
    if (status == StatusCondition::SLEEP) {
        p.sleep_turns = state.random_range(1, 3);
    }
    if (status == StatusCondition::TOXIC) {
        p.toxic_counter = 1;
    }
    state.add_log("status", target_side, p.species + " " + to_string(status));
    return true;
}

void cure_status(BattleState& state, SideID side, const std::string& source) {
    Side& s = state.sides[side];
    if (!s.has_healthy_active() || s.active->status == StatusCondition::NONE) {
        return;
    }
    Pokemon& p = *s.active;
    StatusCondition old = p.status;
    p.status = StatusCondition::NONE;
    p.sleep_turns = 0;
    p.toxic_counter = 0;
    p.status_from_opponent = false;
    state.add_log("cure", side, p.species + " " + to_string(old) + " (" + source + ")");
}

// ============================================================================
// VOLATILES AND STAGES
// ============================================================================

bool try_add_volatile(const EffectTable& table, BattleState& state, SideID side,
                      VolatileKind kind, SideID source_side) {
    (void)table;
    Side& s = state.sides[side];
    if (!s.has_healthy_active()) {
        return false;
    }
    Pokemon& p = *s.active;
    if (p.has_volatile(kind)) {
        return false;
    }

    VolatileEffect v;
    switch (kind) {
        case VolatileKind::CONFUSION:
            v.turns_left = state.random_range(2, 5);
            break;
        case VolatileKind::FLINCH:
        case VolatileKind::PROTECT:
            v.turns_left = 1;
            break;
        case VolatileKind::TAUNT:
            v.turns_left = 3;
            break;
        case VolatileKind::ENCORE:
            if (p.last_move.empty() || p.last_move == move_ids::STRUGGLE) return false;
            v.move = p.last_move;
            v.turns_left = 3;
            break;
        case VolatileKind::DISABLE:
            if (p.last_move.empty() || p.last_move == move_ids::STRUGGLE) return false;
            v.move = p.last_move;
            v.turns_left = 4;
            break;
        case VolatileKind::LEECH_SEED:
            if (p.has_effective_type(PokeType::GRASS)) return false;
            v.counter = source_side;
            break;
        case VolatileKind::PERISH_SONG:
            v.counter = 3;
            break;
        case VolatileKind::PARTIAL_TRAP:
            v.turns_left = state.random_range(4, 5);
            v.counter = source_side;
            break;
        default:
            break;
    }

    p.add_volatile(kind, v);
    state.add_log("volatile", side, p.species + " " + to_string(kind), v.turns_left);
    return true;
}

int apply_boost(const EffectTable& table, BattleState& state, SideID side, Stat stat, int stages,
                bool from_opponent, bool ability_suppressed) {
    Side& s = state.sides[side];
    if (!s.has_healthy_active() || stages == 0) {
        return 0;
    }
    Pokemon& p = *s.active;

    if (stages < 0 && from_opponent) {
        for (const EffectEntry* e : collect(table, state, p, TriggerPhase::ON_TRY_HIT, ability_suppressed)) {
            if (e->kind == EffectKind::BLOCK_STAT_DROP) {
                state.add_log("ability", side, p.species + " " + e->id + " blocks stat drop");
                return 0;
            }
        }
    }

    int applied = p.boosts.apply(stat, stages);
    std::string sign = applied > 0 ? "+" : "";
    state.add_log("boost", side, p.species + " " + to_string(stat) + " " + sign + std::to_string(applied), applied);
    return applied;
}

// ============================================================================
// FIELD
// ============================================================================

bool set_weather(BattleState& state, Weather weather, int turns, bool permanent, int source_side) {
    if (state.field.weather == weather) {
        return false;
    }
    state.field.set_weather(weather, turns, permanent);
    state.add_log("weather", source_side, to_string(weather), permanent ? 0 : turns);
    return true;
}

bool set_terrain(BattleState& state, Terrain terrain, int turns, bool permanent, int source_side) {
    if (state.field.terrain == terrain) {
        return false;
    }
    state.field.set_terrain(terrain, turns, permanent);
    state.add_log("terrain", source_side, to_string(terrain), permanent ? 0 : turns);
    return true;
}

int side_condition_duration(SideConditionKind kind) {
    return kind == SideConditionKind::TAILWIND ? 4 : 5;
}

bool toggle_side_condition(BattleState& state, SideID side, SideConditionKind kind, int turns) {
    bool is_room = kind == SideConditionKind::TRICK_ROOM
                || kind == SideConditionKind::WONDER_ROOM
                || kind == SideConditionKind::MAGIC_ROOM;

    if (is_room && state.room_active(kind)) {
        state.sides[0].conditions.erase(kind);
        state.sides[1].conditions.erase(kind);
        state.add_log("side_condition_end", side, to_string(kind));
        return true;
    }

    bool active = kind == SideConditionKind::TAILWIND
        ? state.sides[side].has_condition(kind)
        : state.room_active(kind);
    if (active) {
        state.add_log("fail", side, to_string(kind));
        return false;
    }

    state.sides[side].conditions[kind] = turns;
    state.add_log("side_condition", side, to_string(kind), turns);
    return true;
}

// ============================================================================
// SWITCHING
// ============================================================================

void on_switch_out(const EffectTable& table, BattleState& state, SideID side) {
    Side& s = state.sides[side];
    if (!s.has_active()) {
        return;
    }
    Pokemon& p = *s.active;

    if (!p.is_fainted()) {
        for (const EffectEntry* e : collect(table, state, p, TriggerPhase::ON_SWITCH_OUT)) {
            if (e->kind == EffectKind::HEAL_FRACTION && !p.at_full_hp()) {
                heal(state, side, fraction_of(p.max_hp, e->fraction), e->id);
            } else if (e->kind == EffectKind::CURE_ON_SWITCH_OUT) {
                cure_status(state, side, e->id);
            }
        }
    }

    if (p.dynamaxed) {
        revert_dynamax(s, p);
    }
    p.on_switch_out();
}

void apply_entry_hazards(const EffectTable& table, const FormatRules& rules, BattleState& state, SideID side) {
    Side& s = state.sides[side];
    if (!s.has_healthy_active()) {
        return;
    }
    Pokemon& p = *s.active;

    double fraction = hazard_damage_fraction(table, state, side, p);
    if (fraction > 0.0) {
        deal_damage(state, side, fraction_of(p.max_hp, fraction), "hazards");
        if (p.is_fainted()) return;
    }

    Hazards& hz = s.hazards;
    if (hz.toxic_spikes > 0 && is_grounded(table, state, p)) {
        if (p.has_effective_type(PokeType::POISON)) {
            hz.toxic_spikes = 0;
            state.add_log("hazard_clear", side, p.species + " absorbs toxic spikes");
        } else {
            StatusCondition status = toxic_spikes_status(table, state, side, p);
            if (status != StatusCondition::NONE) {
                try_set_status(table, rules, state, side, status, true);
            }
        }
    }

    if (hz.sticky_web && is_grounded(table, state, p)
        && !has_effect_kind(table, state, p, EffectKind::HAZARD_IMMUNITY)) {
        state.add_log("hazard", side, p.species + " sticky web");
        apply_boost(table, state, side, Stat::SPE, -1, true);
    }
}

void apply_switch_in_abilities(const EffectTable& table, BattleState& state, SideID side) {
    Side& s = state.sides[side];
    if (!s.has_healthy_active()) {
        return;
    }
    const Pokemon& p = *s.active;

    for (const EffectEntry* e : collect(table, state, p, TriggerPhase::ON_SWITCH_IN)) {
        switch (e->kind) {
            case EffectKind::STAT_CHANGE_ON_TRIGGER: {
                SideID target = e->target_foe ? opponent_of(side) : side;
                if (!state.sides[target].has_healthy_active()) break;
                state.add_log("ability", side, p.species + " " + e->id);
                apply_boost(table, state, target, e->stat, e->stages, e->target_foe);
                break;
            }
            case EffectKind::SET_WEATHER:
                set_weather(state, e->weather, 0, true, side);
                break;
            case EffectKind::SET_TERRAIN:
                set_terrain(state, e->terrain, 0, true, side);
                break;
            default:
                break;
        }
    }
}

// ============================================================================
// BEFORE MOVE
// ============================================================================

BeforeMoveOutcome before_move(BattleState& state, SideID side, const Move& move) {
    Pokemon& p = *state.sides[side].active;

    if (p.status == StatusCondition::SLEEP) {
        if (p.sleep_turns <= 0 || state.random_chance(1.0 / 3.0)) {
            p.status = StatusCondition::NONE;
            p.sleep_turns = 0;
            p.status_from_opponent = false;
            state.add_log("wake", side, p.species);
        } else {
            --p.sleep_turns;
            state.add_log("asleep", side, p.species);
            return BeforeMoveOutcome::SKIP;
        }
    } else if (p.status == StatusCondition::FREEZE) {
        if (move.flags.thaws_user || state.random_chance(0.2)) {
            p.status = StatusCondition::NONE;
            state.add_log("thaw", side, p.species);
        } else {
            state.add_log("frozen", side, p.species);
            return BeforeMoveOutcome::SKIP;
        }
    }

    if (p.has_volatile(VolatileKind::FLINCH)) {
        p.remove_volatile(VolatileKind::FLINCH);
        state.add_log("flinch", side, p.species);
        return BeforeMoveOutcome::SKIP;
    }

    if (VolatileEffect* confusion = p.get_volatile(VolatileKind::CONFUSION)) {
        if (--confusion->turns_left <= 0) {
            p.remove_volatile(VolatileKind::CONFUSION);
            state.add_log("volatile_end", side, p.species + " confusion");
        } else if (state.random_chance(1.0 / 3.0)) {
            state.add_log("confusion", side, p.species + " hurt itself");
            return BeforeMoveOutcome::CONFUSION_SELF_HIT;
        }
    }

    if (p.status == StatusCondition::PARALYSIS && state.random_chance(0.25)) {
        state.add_log("paralysis", side, p.species + " is fully paralyzed");
        return BeforeMoveOutcome::SKIP;
    }

    return BeforeMoveOutcome::ACT;
}

int confusion_damage(const Pokemon& pokemon, int roll_index) {
    long long a = std::max(1LL, static_cast<long long>(
        std::floor(pokemon.stats.atk * boost_multiplier(pokemon.boosts.atk))));
    long long d = std::max(1LL, static_cast<long long>(
        std::floor(pokemon.stats.def * boost_multiplier(pokemon.boosts.def))));
    long long level_factor = 2LL * pokemon.level / 5 + 2;
    long long base = (level_factor * 40 * a / d) / 50 + 2;
    roll_index = std::clamp(roll_index, 0, NUM_ROLLS - 1);
    return static_cast<int>(std::max(1LL, base * (85 + roll_index) / 100));
}

// ============================================================================
// END OF TURN
// ============================================================================

void end_of_turn(const EffectTable& table, BattleState& state) {
    weather_damage(table, state);
    weather_decay(state);
    grassy_heal(table, state);
    status_residuals(table, state);
    volatile_residuals(table, state);
    item_residuals(table, state);
    ability_residuals(table, state);
    decay_counters(table, state);
}

void weather_damage(const EffectTable& table, BattleState& state) {
    Weather w = state.field.weather;
    if (w != Weather::SAND && w != Weather::HAIL) {
        return;
    }

    for (SideID side = 0; side < 2; ++side) {
        Side& s = state.sides[side];
        if (!s.has_healthy_active()) continue;
        const Pokemon& p = *s.active;

        if (w == Weather::SAND && (p.has_effective_type(PokeType::ROCK) || p.has_effective_type(PokeType::GROUND)
                                   || p.has_effective_type(PokeType::STEEL))) {
            continue;
        }
        if (w == Weather::HAIL && p.has_effective_type(PokeType::ICE)) {
            continue;
        }
        if (indirect_damage_immune(table, state, p, w)) {
            continue;
        }
        deal_damage(state, side, fraction_of(p.max_hp, 1.0 / 16.0), to_string(w));
    }
}

void weather_decay(BattleState& state) {
    Field& f = state.field;
    if (f.weather == Weather::NONE || f.weather_permanent) {
        return;
    }
    if (--f.weather_turns <= 0) {
        state.add_log("weather_end", -1, to_string(f.weather));
        f.clear_weather();
    }
}

void grassy_heal(const EffectTable& table, BattleState& state) {
    if (state.field.terrain != Terrain::GRASSY) {
        return;
    }
    for (SideID side = 0; side < 2; ++side) {
        Side& s = state.sides[side];
        if (!s.has_healthy_active()) continue;
        const Pokemon& p = *s.active;
        if (p.at_full_hp() || !is_grounded(table, state, p)) continue;
        heal(state, side, fraction_of(p.max_hp, 1.0 / 16.0), "grassy terrain");
    }
}

void status_residuals(const EffectTable& table, BattleState& state) {
    for (SideID side = 0; side < 2; ++side) {
        Side& s = state.sides[side];
        if (!s.has_healthy_active()) continue;
        Pokemon& p = *s.active;

        if (p.status != StatusCondition::BURN && p.status != StatusCondition::POISON
            && p.status != StatusCondition::TOXIC) {
            continue;
        }
        bool toxic = p.status == StatusCondition::TOXIC;

        // Poison Heal replaces the residual
        MatchContext ctx;
        ctx.holder = &p;
        ctx.field = &state.field;
        bool healed = false;
        for (const EffectEntry& e : table.lookup(TriggerPhase::END_OF_TURN, EffectSource::ABILITY, p.ability)) {
            if (e.kind == EffectKind::HEAL_FRACTION && condition_matches(e.when, ctx)) {
                if (!p.at_full_hp()) {
                    heal(state, side, fraction_of(p.max_hp, e.fraction), e.id);
                }
                healed = true;
                break;
            }
        }

        int amount = 0;
        if (toxic) {
            amount = std::max(1, p.max_hp * std::max(1, p.toxic_counter) / 16);
            p.toxic_counter = std::min(p.toxic_counter + 1, 15);
        } else {
            const StatusDef& def = status_def(p.status);
            amount = std::max(1, p.max_hp * def.residual_num / def.residual_den);
        }

        if (!healed && !indirect_damage_immune(table, state, p)) {
            deal_damage(state, side, amount, to_string(p.status));
        }
    }
}

void volatile_residuals(const EffectTable& table, BattleState& state) {
    for (SideID side = 0; side < 2; ++side) {
        Side& s = state.sides[side];
        if (!s.has_healthy_active()) continue;

        if (s.active->has_volatile(VolatileKind::LEECH_SEED)
            && !indirect_damage_immune(table, state, *s.active)) {
            int lost = deal_damage(state, side, fraction_of(s.active->max_hp, 1.0 / 8.0), "leech seed");
            if (lost > 0) {
                heal(state, opponent_of(side), lost, "leech seed");
            }
        }
        if (!s.has_healthy_active()) continue;

        Pokemon& p = *s.active;
        if (VolatileEffect* trap = p.get_volatile(VolatileKind::PARTIAL_TRAP)) {
            if (--trap->turns_left <= 0) {
                p.remove_volatile(VolatileKind::PARTIAL_TRAP);
                state.add_log("volatile_end", side, p.species + " partial trap");
            }
            if (!indirect_damage_immune(table, state, p)) {
                deal_damage(state, side, fraction_of(p.max_hp, 1.0 / 8.0), "partial trap");
            }
        }
        if (!s.has_healthy_active()) continue;

        if (VolatileEffect* perish = s.active->get_volatile(VolatileKind::PERISH_SONG)) {
            int count = --perish->counter;
            state.add_log("perish", side, s.active->species, count);
            if (count <= 0) {
                deal_damage(state, side, s.active->current_hp, "perish song");
            }
        }
    }
}

void item_residuals(const EffectTable& table, BattleState& state) {
    for (SideID side = 0; side < 2; ++side) {
        Side& s = state.sides[side];
        if (!s.has_healthy_active()) continue;
        const Pokemon& p = *s.active;
        if (!item_active(state, p)) continue;

        MatchContext ctx;
        ctx.holder = &p;
        ctx.field = &state.field;

        for (const EffectEntry& e : table.lookup(TriggerPhase::END_OF_TURN, EffectSource::ITEM, p.item)) {
            if (!s.has_healthy_active()) break;
            if (!condition_matches(e.when, ctx)) continue;
            if (e.kind == EffectKind::HEAL_FRACTION && !p.at_full_hp()) {
                heal(state, side, fraction_of(p.max_hp, e.fraction), e.id);
            } else if (e.kind == EffectKind::DAMAGE_FRACTION && !indirect_damage_immune(table, state, p)) {
                deal_damage(state, side, fraction_of(p.max_hp, e.fraction), e.id);
            }
        }
    }
}

void ability_residuals(const EffectTable& table, BattleState& state) {
    for (SideID side = 0; side < 2; ++side) {
        Side& s = state.sides[side];
        if (!s.has_healthy_active()) continue;
        const Pokemon& p = *s.active;
        if (p.switched_in_this_turn) continue;

        for (const EffectEntry& e : table.lookup(TriggerPhase::END_OF_TURN, EffectSource::ABILITY, p.ability)) {
            if (e.kind == EffectKind::STAT_CHANGE_ON_TRIGGER) {
                state.add_log("ability", side, p.species + " " + e.id);
                apply_boost(table, state, side, e.stat, e.stages, false);
            }
        }
    }
}

void decay_counters(const EffectTable& table, BattleState& state) {
    (void)table;
    Field& f = state.field;
    if (f.terrain != Terrain::NONE && !f.terrain_permanent && --f.terrain_turns <= 0) {
        state.add_log("terrain_end", -1, to_string(f.terrain));
        f.clear_terrain();
    }

    for (SideID side = 0; side < 2; ++side) {
        Side& s = state.sides[side];

        for (auto it = s.screens.begin(); it != s.screens.end();) {
            if (--it->second <= 0) {
                state.add_log("screen_end", side, to_string(it->first));
                it = s.screens.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = s.conditions.begin(); it != s.conditions.end();) {
            if (--it->second <= 0) {
                state.add_log("side_condition_end", side, to_string(it->first));
                it = s.conditions.erase(it);
            } else {
                ++it;
            }
        }

        if (!s.has_active()) continue;
        Pokemon& p = *s.active;

        if (p.dynamaxed && --s.dynamax_turns <= 0) {
            revert_dynamax(s, p);
            state.add_log("dynamax_end", side, p.species);
        }

        for (VolatileKind kind : {VolatileKind::TAUNT, VolatileKind::ENCORE, VolatileKind::DISABLE}) {
            VolatileEffect* v = p.get_volatile(kind);
            if (!v) continue;
            bool expired = v->turns_left > 0 && --v->turns_left <= 0;
            if (kind == VolatileKind::ENCORE && !expired) {
                int slot = p.find_move_slot(v->move);
                expired = slot < 0 || p.moves[slot].pp <= 0;
            }
            if (expired) {
                p.remove_volatile(kind);
                state.add_log("volatile_end", side, p.species + " " + to_string(kind));
            }
        }

        p.remove_volatile(VolatileKind::FLINCH);
        p.remove_volatile(VolatileKind::PROTECT);
        p.switched_in_this_turn = false;
    }
}

} // namespace conditions
} // namespace pokebattle
