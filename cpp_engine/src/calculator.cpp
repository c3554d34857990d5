/**
 * PokeBattle Engine - Damage & Outcome Calculator Implementation
 *
 * Damage follows the canonical formula with 16 discrete rolls (85..100%).
 * Every modifier after the roll is applied and floored in a fixed order:
 * STAB, type effectiveness, burn, screens, weather, terrain, then the
 * attacker's and defender's damage modifiers from the effect table.
 */

#include "calculator.hpp"
#include "mechanics.hpp"
#include <algorithm>
#include <cmath>

namespace pokebattle {

using namespace mechanics;

namespace {

long long floor_mul(long long value, double mult) {
    return static_cast<long long>(std::floor(static_cast<double>(value) * mult + 1e-9));
}

const Pokemon& require_active(const BattleState& state, SideID side) {
    const Side& s = state.sides[side];
    if (!s.has_healthy_active()) {
        throw MissingEntity("side " + std::to_string(side) + " has no active Pokemon");
    }
    return *s.active;
}

Pokemon& require_active(BattleState& state, SideID side) {
    Side& s = state.sides[side];
    if (!s.has_healthy_active()) {
        throw MissingEntity("side " + std::to_string(side) + " has no active Pokemon");
    }
    return *s.active;
}

double percent_of(double amount, int max_hp) {
    return max_hp > 0 ? 100.0 * amount / max_hp : 0.0;
}

// Probability we move before the opponent's reply
double first_mover_chance(int our_priority, int their_priority, const SpeedCheck& sc) {
    if (our_priority != their_priority) {
        return our_priority > their_priority ? 1.0 : 0.0;
    }
    if (sc.tie) return 0.5;
    return sc.faster ? 1.0 : 0.0;
}

} // anonymous namespace

// ============================================================================
// ROLL HELPERS
// ============================================================================

double DamageRolls::average() const {
    double sum = 0.0;
    for (int r : rolls) sum += r;
    return sum / NUM_ROLLS;
}

double ko_fraction(const DamageRolls& rolls, int hp, bool survive_at_one) {
    if (rolls.immune || survive_at_one) return 0.0;
    int count = 0;
    for (int r : rolls.rolls) {
        if (r >= hp) ++count;
    }
    return static_cast<double>(count) / NUM_ROLLS;
}

double two_hit_ko_fraction(const DamageRolls& rolls, int hp, bool survive_at_one) {
    if (rolls.immune) return 0.0;
    int count = 0;
    for (int first : rolls.rolls) {
        int left = hp - first;
        if (left <= 0) {
            if (!survive_at_one) {
                count += NUM_ROLLS;
                continue;
            }
            left = 1;
        }
        for (int second : rolls.rolls) {
            if (second >= left) ++count;
        }
    }
    return static_cast<double>(count) / (NUM_ROLLS * NUM_ROLLS);
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

Calculator::Calculator(const EffectTable& effects, const MoveDex& dex)
    : effects_(effects)
    , dex_(dex)
{}

CalcResult Calculator::make_error(const Action& action, const EngineError& e) {
    CalcResult r;
    r.action = action;
    r.error = true;
    r.error_kind = e.kind();
    r.error_message = e.what();
    r.accuracy = 0.0;
    r.expected_survival = 0.0;
    r.expected_gain = 0.0;
    return r;
}

// ============================================================================
// EVALUATE
// ============================================================================

CalcResult Calculator::evaluate(const BattleState& state, SideID side, const Action& action,
                                const BeliefContext* belief) const {
    try {
        const BattleState* view = &state;
        BattleState adjusted;
        if (belief && (belief->opponent_item || belief->opponent_ability)) {
            adjusted = state;
            Side& opp = adjusted.get_opponent(side);
            if (opp.active.has_value()) {
                if (belief->opponent_item) opp.active->item = *belief->opponent_item;
                if (belief->opponent_ability) opp.active->ability = *belief->opponent_ability;
            }
            view = &adjusted;
        }

        CalcResult result = std::visit(overloaded{
            [&](const MoveAction&) {
                return evaluate_move(*view, side, resolve_move(*view, side, action), belief);
            },
            [&](const SwitchAction& a) {
                return evaluate_switch(*view, side, a.bench_index, belief);
            },
            [&](const TeraAction&) {
                BattleState after = *view;
                Pokemon& user = require_active(after, side);
                if (!user.tera.available) {
                    throw InvalidAction("terastallization not available for " + user.species);
                }
                apply_terastallize(after.sides[side], user);
                CalcResult r = evaluate_move(after, side, resolve_move(after, side, action), belief);
                fill_tera_deltas(*view, after, side, r);
                return r;
            },
            [&](const MegaAction&) {
                BattleState after = *view;
                Pokemon& user = require_active(after, side);
                if (!user.mega_forme.has_value() || user.mega_evolved) {
                    throw InvalidAction(user.species + " cannot mega evolve");
                }
                apply_mega_evolution(after.sides[side], user);
                return evaluate_move(after, side, resolve_move(after, side, action), belief);
            },
            [&](const ZMoveAction&) {
                return evaluate_move(*view, side, resolve_move(*view, side, action), belief);
            },
            [&](const DynamaxAction&) {
                BattleState after = *view;
                Pokemon& user = require_active(after, side);
                if (!user.dynamaxed) {
                    apply_dynamax(after.sides[side], user);
                }
                return evaluate_move(after, side, resolve_move(after, side, action), belief);
            },
            [&](const PassAction&) {
                return evaluate_pass(*view, side, belief);
            },
        }, action);

        result.action = action;
        return result;

    } catch (const InvalidAction& e) {
        return make_error(action, e);
    } catch (const MissingEntity& e) {
        return make_error(action, e);
    }
}

std::vector<CalcResult> Calculator::evaluate_all(const BattleState& state, SideID side,
                                                 const std::vector<Action>& actions,
                                                 const BeliefContext* belief) const {
    std::vector<CalcResult> results;
    results.reserve(actions.size());
    for (const auto& action : actions) {
        results.push_back(evaluate(state, side, action, belief));
    }
    return results;
}

Move Calculator::resolve_move(const BattleState& state, SideID side, const Action& action) const {
    const Pokemon& user = require_active(state, side);

    auto by_slot = [&user](int slot) -> const Move& {
        if (slot < 0 || slot >= static_cast<int>(user.moves.size())) {
            throw InvalidAction("no move in slot " + std::to_string(slot));
        }
        return user.moves[slot].move;
    };

    return std::visit(overloaded{
        [&](const MoveAction& a) -> Move {
            Move move;
            if (a.move_id.empty()) {
                move = by_slot(a.slot);
            } else if (a.move_id == move_ids::STRUGGLE) {
                return MoveDex::struggle();
            } else if (int slot = user.find_move_slot(a.move_id); slot >= 0) {
                move = user.moves[slot].move;
            } else if (const Move* known = dex_.get_move(a.move_id)) {
                move = *known;
            } else {
                throw InvalidAction("unknown move: " + a.move_id);
            }
            return user.dynamaxed ? convert_to_max_move(move) : move;
        },
        [&](const SwitchAction&) -> Move {
            throw InvalidAction("switch actions do not use a move");
        },
        [&](const TeraAction& a) -> Move { return by_slot(a.slot); },
        [&](const MegaAction& a) -> Move { return by_slot(a.slot); },
        [&](const ZMoveAction& a) -> Move {
            const Move& base = by_slot(a.slot);
            if (base.is_status()) {
                throw InvalidAction("status Z-moves are not supported: " + base.id);
            }
            return convert_to_zmove(base);
        },
        [&](const DynamaxAction& a) -> Move { return convert_to_max_move(by_slot(a.slot)); },
        [&](const PassAction&) -> Move {
            throw InvalidAction("pass does not use a move");
        },
    }, action);
}

// ============================================================================
// MOVE EVALUATION
// ============================================================================

CalcResult Calculator::evaluate_move(const BattleState& state, SideID side, const Move& move,
                                     const BeliefContext* belief) const {
    const Pokemon& attacker = require_active(state, side);
    const Pokemon& defender = require_active(state, opponent_of(side));

    CalcResult r;
    r.accuracy = accuracy(state, side, move);
    r.priority = effective_priority(effects_, state, attacker, move);
    r.speed_check = speed_check(state, side, nullptr, belief);
    r.status_chance = status_chance(state, side, move);

    double dealt = 0.0;
    double p_ko = 0.0;
    double self_cost = 0.0;

    if (move.is_damaging()) {
        DamageRolls rolls = damage_rolls(state, side, move);
        r.effectiveness = rolls.effectiveness;
        r.damage.min_percent = percent_of(rolls.min(), defender.max_hp);
        r.damage.max_percent = percent_of(rolls.max(), defender.max_hp);
        r.damage.avg_percent = percent_of(rolls.average(), defender.max_hp);

        bool sash = survive_at_one_entry(effects_, state, defender,
                                         ignores_abilities(effects_, state, attacker)) != nullptr;
        r.ohko_prob = ko_fraction(rolls, defender.current_hp, sash);
        r.twohko_prob = two_hit_ko_fraction(rolls, defender.current_hp, sash);

        double remaining = percent_of(defender.current_hp, defender.max_hp);
        dealt = r.accuracy * std::min(r.damage.avg_percent, remaining);
        p_ko = r.accuracy * r.ohko_prob;

        // Life Orb style recoil on the user
        if (!rolls.immune && !indirect_damage_immune(effects_, state, attacker)
            && !suppresses_secondaries(effects_, state, attacker, move)) {
            MatchContext ctx;
            ctx.holder = &attacker;
            ctx.move = &move;
            ctx.move_type = rolls.move_type;
            ctx.effectiveness = rolls.effectiveness;
            ctx.field = &state.field;
            for (const EffectEntry* e : collect_matching(effects_, state, attacker,
                                                         TriggerPhase::ON_DAMAGING_HIT, ctx)) {
                if (e->kind == EffectKind::DAMAGE_FRACTION) {
                    self_cost += r.accuracy * 100.0 * e->fraction;
                }
            }
        }
    } else {
        r.effectiveness = matchup(state, move.type, defender);
    }

    Threat threat = strongest_threat(state, side);
    double p_acts = 1.0;
    if (threat.exists) {
        p_acts = 1.0 - first_mover_chance(r.priority, threat.priority, r.speed_check) * p_ko;
    }
    if (move.has_secondary(SecondaryKind::PROTECT)) {
        p_acts *= 1.0 - std::pow(1.0 / 3.0, attacker.protect_streak);
    }

    double taken = 0.0;
    if (threat.exists) {
        double our_remaining = percent_of(attacker.current_hp, attacker.max_hp);
        taken = p_acts * threat.accuracy * std::min(threat.avg_percent, our_remaining);
    }

    r.expected_survival = survive_chance(state, side, threat, attacker.current_hp, p_acts);
    r.expected_gain = dealt - taken - self_cost;
    return r;
}

CalcResult Calculator::evaluate_switch(const BattleState& state, SideID side, int bench_index,
                                       const BeliefContext* belief) const {
    const Side& own = state.sides[side];
    if (bench_index < 0 || bench_index >= own.get_bench_count()) {
        throw InvalidAction("no bench Pokemon at index " + std::to_string(bench_index));
    }
    const Pokemon& incoming = own.bench[bench_index];
    if (incoming.is_fainted()) {
        throw InvalidAction(incoming.species + " is fainted");
    }
    if (!state.get_opponent(side).has_active()) {
        throw MissingEntity("side " + std::to_string(opponent_of(side)) + " has no active Pokemon");
    }

    CalcResult r;
    r.accuracy = 1.0;
    r.hazard_damage = hazard_damage(state, side, bench_index);
    r.speed_check = speed_check(state, side, &incoming, belief);
    if (toxic_spikes_status(effects_, state, side, incoming) != StatusCondition::NONE) {
        r.status_chance = 1.0;
    }

    // Look at the opponent's reply from the incoming Pokemon's point of view
    BattleState after = state;
    Side& after_side = after.sides[side];
    if (after_side.has_active()) {
        after_side.switch_active(bench_index);
    } else {
        after_side.promote_to_active(bench_index);
    }
    Pokemon& in = *after_side.active;
    int chip = static_cast<int>(in.max_hp * hazard_damage_fraction(effects_, state, side, incoming));
    in.current_hp = std::max(0, in.current_hp - chip);
    if (in.current_hp == 0) {
        r.expected_survival = 0.0;
        r.expected_gain = -r.hazard_damage;
        return r;
    }

    Threat threat = strongest_threat(after, side);
    double taken = 0.0;
    if (threat.exists) {
        taken = threat.accuracy * std::min(threat.avg_percent, percent_of(in.current_hp, in.max_hp));
    }
    r.expected_survival = survive_chance(after, side, threat, in.current_hp, 1.0);
    r.expected_gain = -r.hazard_damage - taken;
    return r;
}

CalcResult Calculator::evaluate_pass(const BattleState& state, SideID side,
                                     const BeliefContext* belief) const {
    CalcResult r;
    r.accuracy = 1.0;
    r.expected_survival = 1.0;

    const Side& own = state.sides[side];
    const Side& opp = state.get_opponent(side);
    if (!own.has_healthy_active() || !opp.has_healthy_active()) {
        return r;
    }

    r.speed_check = speed_check(state, side, nullptr, belief);
    Threat threat = strongest_threat(state, side);
    if (threat.exists) {
        const Pokemon& ours = *own.active;
        r.expected_survival = survive_chance(state, side, threat, ours.current_hp, 1.0);
        r.expected_gain = -threat.accuracy * std::min(threat.avg_percent,
                                                      percent_of(ours.current_hp, ours.max_hp));
    }
    return r;
}

Calculator::Threat Calculator::strongest_threat(const BattleState& state, SideID side) const {
    Threat best;
    const Side& own = state.sides[side];
    const Side& opp = state.get_opponent(side);
    if (!own.has_healthy_active() || !opp.has_healthy_active()) {
        return best;
    }

    const Pokemon& foe = *opp.active;
    const Pokemon& target = *own.active;
    SideID foe_side = opponent_of(side);

    std::vector<Move> options;
    for (const auto& slot : foe.moves) {
        if (slot.pp > 0 && slot.move.is_damaging()) {
            options.push_back(foe.dynamaxed ? convert_to_max_move(slot.move) : slot.move);
        }
    }
    if (!foe.has_any_pp()) {
        options.push_back(MoveDex::struggle());
    }

    for (const Move& move : options) {
        DamageRolls rolls = damage_rolls(state, foe_side, move);
        double avg = percent_of(rolls.average(), target.max_hp);
        double acc = accuracy(state, foe_side, move);
        if (!best.exists || avg * acc > best.avg_percent * best.accuracy) {
            best.exists = true;
            best.rolls = rolls;
            best.accuracy = acc;
            best.avg_percent = avg;
            best.priority = effective_priority(effects_, state, foe, move);
        }
    }
    return best;
}

double Calculator::survive_chance(const BattleState& state, SideID side, const Threat& threat,
                                  int hp_before_hit, double p_opponent_acts) const {
    if (!threat.exists) return 1.0;
    const Pokemon& ours = *state.sides[side].active;
    const Pokemon& foe = *state.get_opponent(side).active;
    bool sash = survive_at_one_entry(effects_, state, ours, ignores_abilities(effects_, state, foe)) != nullptr;
    double p_ko = ko_fraction(threat.rolls, hp_before_hit, sash);
    return std::clamp(1.0 - p_opponent_acts * threat.accuracy * p_ko, 0.0, 1.0);
}

void Calculator::fill_tera_deltas(const BattleState& before, const BattleState& after,
                                  SideID side, CalcResult& result) const {
    const Pokemon& was = *before.sides[side].active;
    const Pokemon& now = *after.sides[side].active;

    double offense = 0.0;
    int offense_count = 0;
    for (const auto& slot : was.moves) {
        if (!slot.move.is_damaging()) continue;
        PokeType type_before = resolved_move_type(effects_, before, was, slot.move);
        PokeType type_after = resolved_move_type(effects_, after, now, slot.move);
        offense += stab_multiplier(effects_, after, now, type_after)
                 - stab_multiplier(effects_, before, was, type_before);
        ++offense_count;
    }
    result.tera_offense_delta = offense_count > 0 ? offense / offense_count : 0.0;

    // Positive when the new typing takes less from the opponent's moves
    const Side& opp = before.get_opponent(side);
    double defense = 0.0;
    int defense_count = 0;
    if (opp.has_active()) {
        const Pokemon& foe = *opp.active;
        for (const auto& slot : foe.moves) {
            if (!slot.move.is_damaging()) continue;
            PokeType type = resolved_move_type(effects_, before, foe, slot.move);
            defense += matchup(before, type, was) - matchup(after, type, now);
            ++defense_count;
        }
    }
    result.tera_defense_delta = defense_count > 0 ? defense / defense_count : 0.0;
}

// ============================================================================
// DAMAGE
// ============================================================================

DamageRolls Calculator::damage_rolls(const BattleState& state, SideID attacker_side, const Move& move,
                                     const DamageOptions& options) const {
    const Side& atk_side = state.sides[attacker_side];
    const Side& def_side = state.get_opponent(attacker_side);
    if (!atk_side.has_active() || !def_side.has_active()) {
        throw MissingEntity("damage calculation needs both active Pokemon");
    }
    const Pokemon& attacker = *atk_side.active;
    const Pokemon& defender = *def_side.active;

    DamageRolls out;
    out.move_type = move.type;
    if (!move.is_damaging()) {
        return out;
    }

    bool mold_breaker = ignores_abilities(effects_, state, attacker);

    double ate_mult = 1.0;
    PokeType type = resolved_move_type(effects_, state, attacker, move, &ate_mult);
    out.move_type = type;

    double eff = matchup(state, type, defender);
    for (const EffectEntry* e : collect(effects_, state, defender, TriggerPhase::ON_TRY_HIT, mold_breaker)) {
        if (e->kind != EffectKind::TYPE_IMMUNITY || e->type != type) continue;
        if (type == PokeType::GROUND && state.room_active(SideConditionKind::GRAVITY)) continue;
        eff = 0.0;
    }
    out.effectiveness = eff;
    if (eff == 0.0) {
        out.immune = true;
        return out;
    }

    MatchContext ctx;
    ctx.holder = &attacker;
    ctx.move = &move;
    ctx.move_type = type;
    ctx.effectiveness = eff;
    ctx.field = &state.field;

    MatchContext def_ctx = ctx;
    def_ctx.holder = &defender;

    // Base power
    double power = move.base_power * ate_mult;
    for (const EffectEntry* e : collect_matching(effects_, state, attacker, TriggerPhase::MODIFY_POWER, ctx)) {
        if (e->kind == EffectKind::POWER_MODIFIER) {
            power *= e->multiplier;
        }
    }
    out.power = std::max(1, static_cast<int>(std::floor(power + 1e-9)));

    // Attack and defense stats
    bool physical = move.category == MoveCategory::PHYSICAL;
    Stat atk_stat = physical ? Stat::ATK : Stat::SPA;
    Stat def_stat = physical ? Stat::DEF : Stat::SPD;

    int atk_boost = attacker.boosts.get(atk_stat);
    int def_boost = defender.boosts.get(def_stat);
    if (has_effect_kind(effects_, state, defender, EffectKind::IGNORE_BOOSTS, mold_breaker)) {
        atk_boost = 0;
    }
    if (has_effect_kind(effects_, state, attacker, EffectKind::IGNORE_BOOSTS)) {
        def_boost = 0;
    }
    if (options.crit) {
        atk_boost = std::max(0, atk_boost);
        def_boost = std::min(0, def_boost);
    }

    double attack = std::floor(attacker.stats.get(atk_stat) * boost_multiplier(atk_boost));
    bool ignores_burn = false;
    for (const EffectEntry* e : collect_matching(effects_, state, attacker, TriggerPhase::MODIFY_ATTACK, ctx)) {
        if (e->kind == EffectKind::STAT_MODIFIER && e->stat == atk_stat) {
            attack *= e->multiplier;
        }
        ignores_burn = ignores_burn || e->ignores_burn;
    }

    int raw_def = defender.stats.get(def_stat);
    if (state.room_active(SideConditionKind::WONDER_ROOM)) {
        raw_def = defender.stats.get(physical ? Stat::SPD : Stat::DEF);
    }
    double defense = std::floor(raw_def * boost_multiplier(def_boost));
    for (const EffectEntry* e : collect_matching(effects_, state, defender, TriggerPhase::MODIFY_DEFENSE,
                                                 def_ctx, mold_breaker)) {
        if (e->kind == EffectKind::STAT_MODIFIER && e->stat == def_stat) {
            defense *= e->multiplier;
        }
    }
    if (state.field.weather == Weather::SAND && def_stat == Stat::SPD && defender.has_effective_type(PokeType::ROCK)) {
        defense *= 1.5;
    }
    if (state.field.weather == Weather::SNOW && def_stat == Stat::DEF && defender.has_effective_type(PokeType::ICE)) {
        defense *= 1.5;
    }

    long long a = std::max(1LL, static_cast<long long>(std::floor(attack)));
    long long d = std::max(1LL, static_cast<long long>(std::floor(defense)));
    long long level_factor = 2LL * attacker.level / 5 + 2;
    long long base = (level_factor * out.power * a / d) / 50 + 2;

    // Post-roll modifiers
    double stab = stab_multiplier(effects_, state, attacker, type);
    bool burned = physical && attacker.status == StatusCondition::BURN && !ignores_burn;

    bool screened = false;
    if (!options.crit && !has_effect_kind(effects_, state, attacker, EffectKind::IGNORE_SCREENS)) {
        if (def_side.has_screen(ScreenKind::AURORA_VEIL) && state.field.is_hail_or_snow()) {
            screened = true;
        } else if (physical && def_side.has_screen(ScreenKind::REFLECT)) {
            screened = true;
        } else if (!physical && def_side.has_screen(ScreenKind::LIGHT_SCREEN)) {
            screened = true;
        }
    }

    double weather_mod = 1.0;
    if (state.field.weather == Weather::SUN) {
        if (type == PokeType::FIRE) weather_mod = 1.5;
        if (type == PokeType::WATER) weather_mod = 0.5;
    } else if (state.field.weather == Weather::RAIN) {
        if (type == PokeType::WATER) weather_mod = 1.5;
        if (type == PokeType::FIRE) weather_mod = 0.5;
    }

    double terrain_mod = 1.0;
    if (is_grounded(effects_, state, attacker)) {
        if ((state.field.terrain == Terrain::ELECTRIC && type == PokeType::ELECTRIC)
            || (state.field.terrain == Terrain::GRASSY && type == PokeType::GRASS)
            || (state.field.terrain == Terrain::PSYCHIC && type == PokeType::PSYCHIC)) {
            terrain_mod = 1.3;
        }
    }
    if (state.field.terrain == Terrain::MISTY && type == PokeType::DRAGON && is_grounded(effects_, state, defender)) {
        terrain_mod = 0.5;
    }

    std::vector<double> final_mods;
    for (const EffectEntry* e : collect_matching(effects_, state, attacker, TriggerPhase::ON_DAMAGING_HIT, ctx)) {
        if (e->kind == EffectKind::DAMAGE_MODIFIER) final_mods.push_back(e->multiplier);
    }
    for (const EffectEntry* e : collect_matching(effects_, state, defender, TriggerPhase::ON_TAKING_DAMAGE,
                                                 def_ctx, mold_breaker)) {
        if (e->kind == EffectKind::DAMAGE_MODIFIER) final_mods.push_back(e->multiplier);
    }

    for (int i = 0; i < NUM_ROLLS; ++i) {
        long long dmg = base;
        if (options.crit) dmg = floor_mul(dmg, 1.5);
        dmg = dmg * (85 + i) / 100;
        dmg = floor_mul(dmg, stab);
        dmg = floor_mul(dmg, eff);
        if (burned) dmg = floor_mul(dmg, 0.5);
        if (screened) dmg = floor_mul(dmg, 0.5);
        dmg = floor_mul(dmg, weather_mod);
        dmg = floor_mul(dmg, terrain_mod);
        for (double m : final_mods) {
            dmg = floor_mul(dmg, m);
        }
        out.rolls[i] = static_cast<int>(std::max(1LL, dmg));
    }
    return out;
}

// ============================================================================
// ACCURACY, SPEED, HAZARDS, STATUS
// ============================================================================

double Calculator::accuracy(const BattleState& state, SideID attacker_side, const Move& move) const {
    const Pokemon& attacker = require_active(state, attacker_side);
    const Pokemon& defender = require_active(state, opponent_of(attacker_side));

    if (move.target != MoveTarget::NORMAL) return 1.0;

    // Prankster status moves fail against Dark types
    bool prankster = false;
    effective_priority(effects_, state, attacker, move, &prankster);
    if (prankster && move.is_status() && defender.has_effective_type(PokeType::DARK)) {
        return 0.0;
    }

    if (move.always_hits || move.is_z || move.is_max) return 1.0;

    MatchContext ctx;
    ctx.holder = &attacker;
    ctx.move = &move;
    ctx.move_type = move.type;
    ctx.field = &state.field;

    auto attacker_rows = collect_matching(effects_, state, attacker, TriggerPhase::MODIFY_ACCURACY, ctx);
    for (const EffectEntry* e : attacker_rows) {
        if (e->always_hits) return 1.0;
    }
    for (const EffectEntry* e : collect(effects_, state, defender, TriggerPhase::MODIFY_ACCURACY)) {
        if (e->always_hits) return 1.0;
    }

    double base = move.accuracy;
    if (move.id == move_ids::THUNDER || move.id == move_ids::HURRICANE) {
        if (state.field.weather == Weather::RAIN) return 1.0;
        if (state.field.weather == Weather::SUN) base = 0.5;
    }
    if (move.id == move_ids::BLIZZARD && state.field.is_hail_or_snow()) return 1.0;

    int acc_stage = attacker.boosts.accuracy;
    int eva_stage = defender.boosts.evasion;
    if (has_effect_kind(effects_, state, defender, EffectKind::IGNORE_BOOSTS,
                        ignores_abilities(effects_, state, attacker))) {
        acc_stage = 0;
    }
    if (has_effect_kind(effects_, state, attacker, EffectKind::IGNORE_BOOSTS)) {
        eva_stage = 0;
    }
    int stage = std::clamp(acc_stage - eva_stage, -MAX_BOOST, MAX_BOOST);

    double acc = base * accuracy_multiplier(stage);
    if (state.room_active(SideConditionKind::GRAVITY)) {
        acc *= 5.0 / 3.0;
    }
    for (const EffectEntry* e : attacker_rows) {
        if (e->kind == EffectKind::STAT_MODIFIER && e->stat == Stat::ACCURACY) {
            acc *= e->multiplier;
        }
    }
    return std::clamp(acc, 0.0, 1.0);
}

SpeedCheck Calculator::speed_check(const BattleState& state, SideID side, const Pokemon* ours,
                                   const BeliefContext* belief) const {
    const Side& own = state.sides[side];
    const Side& opp = state.get_opponent(side);
    if (!ours) {
        if (!own.has_active()) {
            throw MissingEntity("side " + std::to_string(side) + " has no active Pokemon");
        }
        ours = &own.active.value();
    }
    if (!opp.has_active()) {
        throw MissingEntity("side " + std::to_string(opponent_of(side)) + " has no active Pokemon");
    }

    SpeedCheck sc;
    sc.our_speed = effective_speed_of(effects_, state, side, *ours);
    sc.their_speed = (belief && belief->opponent_speed)
        ? *belief->opponent_speed
        : effective_speed(effects_, state, opponent_of(side));
    sc.tie = sc.our_speed == sc.their_speed;

    bool trick_room = state.room_active(SideConditionKind::TRICK_ROOM);
    sc.speed_diff = trick_room ? sc.their_speed - sc.our_speed : sc.our_speed - sc.their_speed;
    sc.faster = sc.speed_diff > 0;
    return sc;
}

double Calculator::hazard_damage(const BattleState& state, SideID side, int bench_index) const {
    const Side& own = state.sides[side];
    if (bench_index < 0 || bench_index >= own.get_bench_count()) {
        throw InvalidAction("no bench Pokemon at index " + std::to_string(bench_index));
    }
    return 100.0 * hazard_damage_fraction(effects_, state, side, own.bench[bench_index]);
}

double Calculator::status_chance(const BattleState& state, SideID attacker_side, const Move& move) const {
    const Pokemon& attacker = require_active(state, attacker_side);
    const Pokemon& defender = require_active(state, opponent_of(attacker_side));

    if (move.target != MoveTarget::NORMAL) return 0.0;

    bool mold_breaker = ignores_abilities(effects_, state, attacker);
    if (move.is_status() && status_move_blocked(effects_, state, defender, mold_breaker)) {
        return 0.0;
    }

    bool immune = false;
    if (move.is_damaging()) {
        immune = damage_rolls(state, attacker_side, move).immune;
    } else if (move.type == PokeType::ELECTRIC) {
        immune = matchup(state, move.type, defender) == 0.0;
    }
    if (immune) return 0.0;

    bool sheer_force = suppresses_secondaries(effects_, state, attacker, move);
    double best = 0.0;
    for (const auto& sec : move.secondaries) {
        if (sec.kind != SecondaryKind::STATUS) continue;
        if (sheer_force && sec.chance < 1.0) continue;
        if (!can_receive_status(effects_, state, defender, sec.status, mold_breaker)) continue;
        best = std::max(best, sec.chance);
    }
    return accuracy(state, attacker_side, move) * best;
}

} // namespace pokebattle
