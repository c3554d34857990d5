/**
 * PokeBattle Engine - Engine Implementation
 *
 * Core battle logic: get_legal_actions(), evaluate() and advance().
 *
 * A turn walks QUEUED -> PRIORITY_SORTED -> RESOLVING -> END_OF_TURN
 * -> ADVANCED. Switches resolve first, then tera/mega/dynamax, then
 * moves by priority and effective speed.
 */

#include "engine.hpp"
#include "conditions.hpp"
#include "mechanics.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <unordered_set>

using json = nlohmann::json;

namespace pokebattle {

using namespace mechanics;

namespace {

int fraction_of(int value, double fraction) {
    return std::max(1, static_cast<int>(value * fraction));
}

} // anonymous namespace

// ============================================================================
// CONFIG
// ============================================================================

bool EngineConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[EngineConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);

        moves_path = data.value("moves", moves_path);
        formats_path = data.value("formats", formats_path);
        effects_path = data.value("effects", effects_path);
        default_seed = data.value("default_seed", default_seed);
        check_invariants = data.value("check_invariants", check_invariants);

        if (data.contains("trace")) {
            const auto& trace = data["trace"];
            trace_enabled = trace.value("enabled", trace_enabled);
            trace_dir = trace.value("dir", trace_dir);
        }

        std::cout << "[EngineConfig] Loaded " << filepath << std::endl;
        return true;

    } catch (const json::parse_error& e) {
        std::cerr << "[EngineConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[EngineConfig] Error loading config: " << e.what() << std::endl;
        return false;
    }
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

BattleEngine::BattleEngine()
    : BattleEngine(EngineConfig{})
{}

BattleEngine::BattleEngine(const EngineConfig& config)
    : config_(config)
    , calculator_(effects_, dex_)
    , generator_(effects_)
{
    register_all_abilities(effects_);
    register_all_items(effects_);

    if (!config_.moves_path.empty()) {
        dex_.load_from_json(config_.moves_path);
    }
    if (!config_.formats_path.empty()) {
        formats_.load_from_json(config_.formats_path);
    }
    if (!config_.effects_path.empty()) {
        effects_.load_from_json(config_.effects_path);
    }
}

// ============================================================================
// CORE API
// ============================================================================

std::vector<LegalAction> BattleEngine::get_legal_actions(const BattleState& state, SideID side) const {
    const FormatRules& rules = require_format(state.format_id);
    return generator_.generate(state, side, rules);
}

std::vector<CalcResult> BattleEngine::evaluate(const BattleState& state, SideID side,
                                               const std::vector<Action>& actions,
                                               const BeliefContext* belief) const {
    require_format(state.format_id);
    return calculator_.evaluate_all(state, side, actions, belief);
}

AdvanceResult BattleEngine::advance(const BattleState& state, const Action& side0, const Action& side1) const {
    AdvanceResult result;
    result.state = state.clone();
    size_t log_start = result.state.log.size();

    result.stage = advance_inplace(result.state, side0, side1);

    result.log.assign(result.state.log.begin() + static_cast<std::ptrdiff_t>(log_start),
                      result.state.log.end());
    return result;
}

TurnStage BattleEngine::advance_inplace(BattleState& state, const Action& side0, const Action& side1) const {
    const FormatRules& rules = require_format(state.format_id);
    if (state.is_finished()) {
        throw InvalidAction("battle is finished");
    }

    std::array<Action, 2> choices{side0, side1};
    for (SideID side = 0; side < 2; ++side) {
        validate_choice(state, side, rules, choices[side]);
    }
    state.last_actions[0] = choices[0];
    state.last_actions[1] = choices[1];

    // Forced-switch window: replacements only, no end of turn
    bool forced = false;
    for (const auto& s : state.sides) {
        forced = forced || s.forced_switch || !s.has_healthy_active();
    }
    if (forced) {
        resolve_forced_switches(state, rules, choices);
        process_faints(state);
        check_win_conditions(state);
        if (config_.check_invariants) check_invariants(state);
        return TurnStage::RESOLVING;
    }

    // QUEUED
    std::vector<QueuedAction> queue = build_queue(state, choices);
    std::vector<QueuedAction> switches;
    std::vector<QueuedAction> moves;
    for (auto& q : queue) {
        (q.is_switch ? switches : moves).push_back(std::move(q));
    }

    // Switches always go first
    sort_queue(state, switches);
    for (const auto& q : switches) {
        apply_switch(state, q.side, std::get<SwitchAction>(q.action).bench_index, rules, false);
        process_faints(state);
        check_win_conditions(state);
        if (config_.check_invariants) check_invariants(state);
        if (state.is_finished()) return TurnStage::RESOLVING;
    }

    // Transformations happen before any move and count for turn order
    for (const auto& q : moves) {
        apply_transformation(state, q.side, q.action);
    }

    // PRIORITY_SORTED
    sort_queue(state, moves);

    // RESOLVING
    for (const auto& q : moves) {
        if (state.is_finished()) break;
        const Side& s = state.sides[q.side];
        if (!s.has_healthy_active()) {
            state.add_log("skip", q.side, "user fainted");
            continue;
        }

        std::visit(overloaded{
            [&](const SwitchAction& a) { apply_switch(state, q.side, a.bench_index, rules, false); },
            [&](const PassAction&) { apply_pass(state, q.side); },
            [&](const MoveAction&) { apply_move(state, q.side, q.action, rules); },
            [&](const TeraAction&) { apply_move(state, q.side, q.action, rules); },
            [&](const MegaAction&) { apply_move(state, q.side, q.action, rules); },
            [&](const ZMoveAction&) { apply_move(state, q.side, q.action, rules); },
            [&](const DynamaxAction&) { apply_move(state, q.side, q.action, rules); },
        }, q.action);

        process_faints(state);
        check_win_conditions(state);
        if (config_.check_invariants) check_invariants(state);
    }
    if (state.is_finished()) {
        return TurnStage::RESOLVING;
    }

    // END_OF_TURN
    conditions::end_of_turn(effects_, state);
    process_faints(state);
    check_win_conditions(state);
    if (config_.check_invariants) check_invariants(state);
    if (state.is_finished()) {
        return TurnStage::END_OF_TURN;
    }

    state.turn++;
    return TurnStage::ADVANCED;
}

// ============================================================================
// BATTLE SETUP
// ============================================================================

BattleState BattleEngine::create_battle(const FormatID& format_id,
                                        std::vector<Pokemon> team0,
                                        std::vector<Pokemon> team1,
                                        std::optional<uint64_t> seed) const {
    const FormatRules& rules = require_format(format_id);

    std::array<std::vector<Pokemon>*, 2> teams{&team0, &team1};
    for (SideID side = 0; side < 2; ++side) {
        const auto& team = *teams[side];
        if (team.empty() || static_cast<int>(team.size()) > MAX_BENCH + 1) {
            throw InvalidAction("team " + std::to_string(side) + " must have 1-" +
                                std::to_string(MAX_BENCH + 1) + " Pokemon");
        }
        if (rules.clauses.species) {
            std::unordered_set<SpeciesID> seen;
            for (const auto& p : team) {
                if (!seen.insert(to_id(p.species)).second) {
                    throw InvalidAction("species clause: duplicate " + p.species);
                }
            }
        }
    }

    BattleState state;
    state.format_id = format_id;
    state.seed_rng(seed.value_or(config_.default_seed));

    for (SideID side = 0; side < 2; ++side) {
        Side& s = state.sides[side];
        auto& team = *teams[side];
        s.name = side == 0 ? "p1" : "p2";
        s.active = std::move(team.front());
        for (size_t i = 1; i < team.size(); ++i) {
            s.bench.push_back(std::move(team[i]));
        }
    }

    state.phase = BattlePhase::BATTLE;
    state.turn = 1;
    state.add_log("start", -1, format_id);
    for (SideID side = 0; side < 2; ++side) {
        state.add_log("switch", side, state.sides[side].active->species);
    }

    // Lead abilities activate fastest first
    int speed0 = effective_speed(effects_, state, 0);
    int speed1 = effective_speed(effects_, state, 1);
    SideID first = 0;
    if (speed1 > speed0 || (speed1 == speed0 && state.random_int(2) == 1)) {
        first = 1;
    }
    conditions::apply_switch_in_abilities(effects_, state, first);
    conditions::apply_switch_in_abilities(effects_, state, opponent_of(first));

    check_invariants(state);
    return state;
}

// ============================================================================
// TURN PHASES
// ============================================================================

void BattleEngine::validate_choice(const BattleState& state, SideID side, const FormatRules& rules,
                                   const Action& action) const {
    std::vector<LegalAction> candidates = generator_.generate(state, side, rules);
    const Side& s = state.sides[side];
    const Pokemon* active = s.has_active() ? &s.active.value() : nullptr;

    const LegalAction* match = find_candidate(candidates, active, action);
    if (!match) {
        throw InvalidAction("side " + std::to_string(side) + ": " + action_to_string(action) +
                            " is not a candidate action");
    }
    if (match->disabled) {
        throw InvalidAction("side " + std::to_string(side) + ": " + action_to_string(action) +
                            " is disabled (" + match->reason + ")");
    }
}

void BattleEngine::resolve_forced_switches(BattleState& state, const FormatRules& rules,
                                           const std::array<Action, 2>& choices) const {
    for (SideID side = 0; side < 2; ++side) {
        if (const auto* sw = std::get_if<SwitchAction>(&choices[side])) {
            apply_switch(state, side, sw->bench_index, rules, true);
        }
    }
}

std::vector<BattleEngine::QueuedAction> BattleEngine::build_queue(BattleState& state,
                                                                  const std::array<Action, 2>& choices) const {
    std::vector<QueuedAction> queue;
    for (SideID side = 0; side < 2; ++side) {
        QueuedAction q;
        q.side = side;
        q.action = choices[side];
        q.is_switch = is_switch(choices[side]);
        queue.push_back(std::move(q));
    }
    state.add_log("turn", -1, "", state.turn);
    return queue;
}

void BattleEngine::sort_queue(BattleState& state, std::vector<QueuedAction>& queue) const {
    for (auto& q : queue) {
        q.priority = 0;
        q.speed = 0;
        if (!state.sides[q.side].has_healthy_active()) continue;

        const Pokemon& user = *state.sides[q.side].active;
        q.speed = effective_speed(effects_, state, q.side);
        if (!q.is_switch && !is_pass(q.action)) {
            Move move = calculator_.resolve_move(state, q.side, q.action);
            q.priority = effective_priority(effects_, state, user, move);
        }
    }

    bool trick_room = state.room_active(SideConditionKind::TRICK_ROOM);
    auto before = [trick_room](const QueuedAction& a, const QueuedAction& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.speed != b.speed) return trick_room ? a.speed < b.speed : a.speed > b.speed;
        return false;
    };
    std::stable_sort(queue.begin(), queue.end(), before);

    // Exact ties are ordered by a draw from the battle RNG, never by input order
    for (size_t i = 0; i < queue.size();) {
        size_t j = i + 1;
        while (j < queue.size() && !before(queue[i], queue[j]) && !before(queue[j], queue[i])) {
            ++j;
        }
        if (j - i > 1) {
            state.add_log("speed_tie", -1, "", static_cast<int>(j - i));
            for (size_t k = j - 1; k > i; --k) {
                size_t pick = i + static_cast<size_t>(state.random_int(static_cast<int>(k - i + 1)));
                std::swap(queue[k], queue[pick]);
            }
        }
        i = j;
    }
}

void BattleEngine::apply_transformation(BattleState& state, SideID side, const Action& action) const {
    Side& s = state.sides[side];
    if (!s.has_healthy_active()) return;
    Pokemon& p = *s.active;

    std::visit(overloaded{
        [&](const TeraAction&) {
            apply_terastallize(s, p);
            state.add_log("terastallize", side, p.species + " " + to_string(p.tera.type));
        },
        [&](const MegaAction&) {
            SpeciesID before = p.species;
            apply_mega_evolution(s, p);
            state.add_log("mega", side, before + " -> " + p.species);
            conditions::apply_switch_in_abilities(effects_, state, side);
        },
        [&](const DynamaxAction&) {
            if (!p.dynamaxed) {
                apply_dynamax(s, p);
                state.add_log("dynamax", side, p.species, p.current_hp);
            }
        },
        [](const MoveAction&) {},
        [](const SwitchAction&) {},
        [](const ZMoveAction&) {},
        [](const PassAction&) {},
    }, action);
}

// ============================================================================
// ACTION APPLICATION
// ============================================================================

void BattleEngine::apply_switch(BattleState& state, SideID side, int bench_index,
                                const FormatRules& rules, bool forced) const {
    Side& s = state.sides[side];
    if (bench_index < 0 || bench_index >= s.get_bench_count()) {
        throw InvalidAction("no bench Pokemon at index " + std::to_string(bench_index));
    }
    if (s.bench[bench_index].is_fainted()) {
        throw InvalidAction(s.bench[bench_index].species + " is fainted");
    }

    if (s.has_active()) {
        conditions::on_switch_out(effects_, state, side);
        if (!forced || !s.active->is_fainted()) {
            state.add_log("switch_out", side, s.active->species);
        }
        s.switch_active(bench_index);
    } else {
        s.promote_to_active(bench_index);
    }
    s.forced_switch = false;

    Pokemon& incoming = *s.active;
    incoming.switched_in_this_turn = true;
    state.add_log("switch", side, incoming.species);

    conditions::apply_entry_hazards(effects_, rules, state, side);
    conditions::apply_switch_in_abilities(effects_, state, side);
}

void BattleEngine::apply_pass(BattleState& state, SideID side) const {
    Side& s = state.sides[side];
    if (s.has_healthy_active() && s.active->has_volatile(VolatileKind::RECHARGE)) {
        s.active->remove_volatile(VolatileKind::RECHARGE);
        state.add_log("recharge", side, s.active->species);
        return;
    }
    state.add_log("pass", side, "");
}

void BattleEngine::apply_move(BattleState& state, SideID side, const Action& action,
                              const FormatRules& rules) const {
    Side& s = state.sides[side];
    Pokemon& user = *s.active;
    SideID foe = opponent_of(side);

    int slot = action_move_slot(action);
    if (const auto* mv = std::get_if<MoveAction>(&action)) {
        if (!mv->move_id.empty() && mv->move_id != move_ids::STRUGGLE) {
            slot = user.find_move_slot(mv->move_id);
        }
    }
    Move move = calculator_.resolve_move(state, side, action);
    MoveID base_id = slot >= 0 ? user.moves[slot].move.id : move.id;

    if (std::holds_alternative<ZMoveAction>(action)) {
        s.zmove_used = true;
    }

    const VolatileEffect* charging = user.get_volatile(VolatileKind::CHARGING);
    bool releasing = charging && charging->move == base_id;

    if (move.target == MoveTarget::NORMAL && !state.sides[foe].has_healthy_active()) {
        state.add_log("noop", side, user.species + " " + move.name + " has no target");
        return;
    }

    // Status and volatile checks
    switch (conditions::before_move(state, side, move)) {
        case conditions::BeforeMoveOutcome::SKIP:
            user.protect_streak = 0;
            user.remove_volatile(VolatileKind::CHARGING);
            return;
        case conditions::BeforeMoveOutcome::CONFUSION_SELF_HIT:
            user.protect_streak = 0;
            conditions::deal_damage(state, side,
                                    conditions::confusion_damage(user, state.random_int(NUM_ROLLS)),
                                    "confusion");
            return;
        case conditions::BeforeMoveOutcome::ACT:
            break;
    }

    // PP and locks
    if (slot >= 0 && !releasing) {
        MoveSlot& ms = user.moves[slot];
        ms.pp = std::max(0, ms.pp - 1);
    }
    user.last_move = base_id;
    if (!user.dynamaxed && base_id != move_ids::STRUGGLE && !user.has_volatile(VolatileKind::CHOICE_LOCK)
        && has_effect_kind(effects_, state, user, EffectKind::CHOICE_LOCK)) {
        VolatileEffect lock;
        lock.move = base_id;
        user.add_volatile(VolatileKind::CHOICE_LOCK, lock);
    }
    state.add_log("move", side, user.species + " used " + move.name);

    // Running the locked move out of PP ends the lock
    if (const VolatileEffect* lock = user.get_volatile(VolatileKind::CHOICE_LOCK)) {
        int locked = user.find_move_slot(lock->move);
        if (locked < 0 || user.moves[locked].pp <= 0) {
            user.remove_volatile(VolatileKind::CHOICE_LOCK);
            state.add_log("volatile_end", side, user.species + " choice lock");
        }
    }

    // Two-turn moves
    if (releasing) {
        user.remove_volatile(VolatileKind::CHARGING);
    } else if (move.flags.charge) {
        bool instant = move.id == move_ids::SOLAR_BEAM && state.field.weather == Weather::SUN;
        if (!instant) {
            VolatileEffect c;
            c.move = base_id;
            user.add_volatile(VolatileKind::CHARGING, c);
            state.add_log("charge", side, user.species + " " + move.name);
            return;
        }
    }

    // Protect: consecutive uses succeed with 1/3^n
    if (move.has_secondary(SecondaryKind::PROTECT)) {
        double chance = std::pow(1.0 / 3.0, user.protect_streak);
        if (state.random_chance(chance)) {
            conditions::try_add_volatile(effects_, state, side, VolatileKind::PROTECT, side);
            user.protect_streak++;
        } else {
            state.add_log("fail", side, move.name);
            user.protect_streak = 0;
        }
        return;
    }
    user.protect_streak = 0;

    if (move.target == MoveTarget::NORMAL) {
        Pokemon& target = *state.sides[foe].active;
        bool mold_breaker = ignores_abilities(effects_, state, user);

        if (target.has_volatile(VolatileKind::PROTECT)) {
            state.add_log("protected", foe, target.species);
            return;
        }
        if (move.is_status() && status_move_blocked(effects_, state, target, mold_breaker)) {
            state.add_log("blocked", foe, target.species + " " + move.name);
            return;
        }
        if (move.is_status()) {
            bool immune = (move.type == PokeType::ELECTRIC && matchup(state, move.type, target) == 0.0)
                       || (move.flags.powder && target.has_effective_type(PokeType::GRASS));
            if (immune) {
                state.add_log("immune", foe, target.species);
                return;
            }
        }
        if (!state.random_chance(calculator_.accuracy(state, side, move))) {
            state.add_log("miss", side, user.species + " " + move.name);
            return;
        }
    }

    int dealt = 0;
    if (move.is_damaging()) {
        dealt = apply_damaging_hit(state, side, move);
        if (dealt < 0) return;
    }

    apply_secondaries(state, side, move, rules, dealt);

    if (move.flags.recharge && s.has_healthy_active()) {
        s.active->add_volatile(VolatileKind::RECHARGE, VolatileEffect{});
    }
}

int BattleEngine::apply_damaging_hit(BattleState& state, SideID side, const Move& move) const {
    SideID foe = opponent_of(side);
    Pokemon& attacker = *state.sides[side].active;
    Pokemon& defender = *state.sides[foe].active;
    bool mold_breaker = ignores_abilities(effects_, state, attacker);

    PokeType type = resolved_move_type(effects_, state, attacker, move);

    // Absorbing and redirecting immunities
    for (const EffectEntry* e : collect(effects_, state, defender, TriggerPhase::ON_TRY_HIT, mold_breaker)) {
        if (e->kind != EffectKind::TYPE_IMMUNITY || e->type != type) continue;
        if (type == PokeType::GROUND && state.room_active(SideConditionKind::GRAVITY)) continue;

        state.add_log("immune", foe, defender.species + " " + e->id);
        if (e->fraction > 0.0 && !defender.at_full_hp()) {
            conditions::heal(state, foe, fraction_of(defender.max_hp, e->fraction), e->id);
        }
        if (e->stages != 0) {
            conditions::apply_boost(effects_, state, foe, e->stat, e->stages, false);
        }
        if (e->add_volatile) {
            defender.add_volatile(*e->add_volatile, VolatileEffect{});
        }
        return -1;
    }

    DamageOptions options;
    options.crit = state.random_chance(crit_chance(move.crit_stage));
    DamageRolls rolls = calculator_.damage_rolls(state, side, move, options);
    if (rolls.immune) {
        state.add_log("immune", foe, defender.species);
        return -1;
    }
    int damage = rolls.rolls[state.random_int(NUM_ROLLS)];

    if (const EffectEntry* sash = survive_at_one_entry(effects_, state, defender, mold_breaker)) {
        if (damage >= defender.current_hp) {
            damage = defender.current_hp - 1;
            state.add_log(sash->source == EffectSource::ITEM ? "item" : "ability", foe,
                          defender.species + " " + sash->id);
            if (sash->consumed) {
                defender.item.clear();
                defender.item_consumed = true;
            }
        }
    }

    if (options.crit) {
        state.add_log("crit", foe, defender.species);
    }
    if (rolls.effectiveness > 1.0) {
        state.add_log("super_effective", foe, defender.species);
    } else if (rolls.effectiveness < 1.0) {
        state.add_log("resisted", foe, defender.species);
    }

    int dealt = conditions::deal_damage(state, foe, damage, move.name);

    if (type == PokeType::FIRE && defender.status == StatusCondition::FREEZE) {
        defender.status = StatusCondition::NONE;
        state.add_log("thaw", foe, defender.species);
    }

    // Contact punishers (Rough Skin, Rocky Helmet)
    if (move.flags.contact && !attacker.is_fainted() && !indirect_damage_immune(effects_, state, attacker)) {
        for (const EffectEntry* e : collect(effects_, state, defender, TriggerPhase::ON_CONTACT_HIT)) {
            if (e->kind != EffectKind::DAMAGE_FRACTION || attacker.is_fainted()) continue;
            conditions::deal_damage(state, side, fraction_of(attacker.max_hp, e->fraction), e->id);
        }
    }

    // Life Orb style recoil
    if (dealt > 0 && !attacker.is_fainted() && !indirect_damage_immune(effects_, state, attacker)
        && !suppresses_secondaries(effects_, state, attacker, move)) {
        MatchContext ctx;
        ctx.holder = &attacker;
        ctx.move = &move;
        ctx.move_type = type;
        ctx.effectiveness = rolls.effectiveness;
        ctx.field = &state.field;
        for (const EffectEntry* e : collect_matching(effects_, state, attacker,
                                                     TriggerPhase::ON_DAMAGING_HIT, ctx)) {
            if (e->kind == EffectKind::DAMAGE_FRACTION) {
                conditions::deal_damage(state, side, fraction_of(attacker.max_hp, e->fraction), e->id);
            }
        }
    }

    check_damage_items(state, foe);
    return dealt;
}

void BattleEngine::check_damage_items(BattleState& state, SideID side) const {
    Side& s = state.sides[side];
    if (!s.has_healthy_active()) return;
    Pokemon& p = *s.active;
    if (!item_active(state, p)) return;

    MatchContext ctx;
    ctx.holder = &p;
    ctx.field = &state.field;
    for (const EffectEntry& e : effects_.lookup(TriggerPhase::ON_TAKING_DAMAGE, EffectSource::ITEM, p.item)) {
        if (e.kind != EffectKind::HEAL_FRACTION || !condition_matches(e.when, ctx)) continue;
        conditions::heal(state, side, fraction_of(p.max_hp, e.fraction), e.id);
        if (e.consumed) {
            p.item.clear();
            p.item_consumed = true;
        }
        break;
    }
}

void BattleEngine::apply_secondaries(BattleState& state, SideID side, const Move& move,
                                     const FormatRules& rules, int damage_dealt) const {
    const Pokemon& user = *state.sides[side].active;
    bool sheer_force = suppresses_secondaries(effects_, state, user, move);

    for (const Secondary& sec : move.secondaries) {
        if (sec.chance < 1.0) {
            if (sheer_force || !state.random_chance(sec.chance)) continue;
        }
        apply_secondary(state, side, move, sec, rules, damage_dealt);
    }
}

void BattleEngine::apply_secondary(BattleState& state, SideID side, const Move& move,
                                   const Secondary& sec, const FormatRules& rules,
                                   int damage_dealt) const {
    Side& own = state.sides[side];
    SideID foe = opponent_of(side);
    SideID target = move.target == MoveTarget::SELF ? side : foe;
    bool target_up = state.sides[target].has_healthy_active();
    bool user_up = own.has_healthy_active();
    const Pokemon& user = *own.active;
    bool mold_breaker = ignores_abilities(effects_, state, user);

    switch (sec.kind) {
        case SecondaryKind::STATUS:
            if (!target_up) break;
            if (!conditions::try_set_status(effects_, rules, state, target, sec.status, target != side, mold_breaker)
                && move.is_status()) {
                state.add_log("fail", side, move.name);
            }
            break;

        case SecondaryKind::VOLATILE:
            if (sec.volatile_kind == VolatileKind::PERISH_SONG) {
                for (SideID each = 0; each < 2; ++each) {
                    if (state.sides[each].has_healthy_active()) {
                        conditions::try_add_volatile(effects_, state, each, VolatileKind::PERISH_SONG, side);
                    }
                }
                break;
            }
            if (!target_up) break;
            if (!conditions::try_add_volatile(effects_, state, target, sec.volatile_kind, side) && move.is_status()) {
                state.add_log("fail", side, move.name);
            }
            break;

        case SecondaryKind::FLINCH:
            if (state.sides[foe].has_healthy_active()) {
                conditions::try_add_volatile(effects_, state, foe, VolatileKind::FLINCH, side);
            }
            break;

        case SecondaryKind::BOOST_TARGET:
            if (target_up) {
                conditions::apply_boost(effects_, state, target, sec.stat, sec.stages, target != side, mold_breaker);
            }
            break;

        case SecondaryKind::BOOST_SELF:
            if (user_up) {
                conditions::apply_boost(effects_, state, side, sec.stat, sec.stages, false);
            }
            break;

        case SecondaryKind::RECOIL:
            if (damage_dealt > 0 && user_up && !indirect_damage_immune(effects_, state, user)) {
                conditions::deal_damage(state, side, fraction_of(damage_dealt, sec.fraction), "recoil");
            }
            break;

        case SecondaryKind::DRAIN:
            if (damage_dealt > 0 && user_up) {
                conditions::heal(state, side, fraction_of(damage_dealt, sec.fraction), "drain");
            }
            break;

        case SecondaryKind::HEAL:
            if (!user_up) break;
            if (user.at_full_hp()) {
                state.add_log("fail", side, move.name);
            } else {
                conditions::heal(state, side, fraction_of(user.max_hp, sec.fraction), move.name);
            }
            break;

        case SecondaryKind::SET_HAZARD: {
            Hazards& hz = state.sides[foe].hazards;
            int layers = 0;
            switch (sec.hazard) {
                case HazardKind::STEALTH_ROCK:
                    if (!hz.stealth_rock) { hz.stealth_rock = true; layers = 1; }
                    break;
                case HazardKind::SPIKES:
                    if (hz.spikes < 3) layers = ++hz.spikes;
                    break;
                case HazardKind::TOXIC_SPIKES:
                    if (hz.toxic_spikes < 2) layers = ++hz.toxic_spikes;
                    break;
                case HazardKind::STICKY_WEB:
                    if (!hz.sticky_web) { hz.sticky_web = true; layers = 1; }
                    break;
            }
            if (layers > 0) {
                state.add_log("hazard_set", foe, to_string(sec.hazard), layers);
            } else {
                state.add_log("fail", side, move.name);
            }
            break;
        }

        case SecondaryKind::CLEAR_HAZARDS:
            if (own.hazards.any()) {
                own.hazards.clear();
                state.add_log("hazard_clear", side, move.name);
            }
            break;

        case SecondaryKind::SET_SCREEN: {
            bool needs_snow = sec.screen == ScreenKind::AURORA_VEIL && !state.field.is_hail_or_snow();
            if (own.has_screen(sec.screen) || needs_snow) {
                state.add_log("fail", side, move.name);
                break;
            }
            int turns = screen_duration(effects_, state, user);
            own.screens[sec.screen] = turns;
            state.add_log("screen", side, to_string(sec.screen), turns);
            break;
        }

        case SecondaryKind::SET_WEATHER: {
            int turns = weather_duration(effects_, state, user, sec.weather);
            if (!conditions::set_weather(state, sec.weather, turns, false, side) && move.is_status()) {
                state.add_log("fail", side, move.name);
            }
            break;
        }

        case SecondaryKind::SET_TERRAIN: {
            int turns = terrain_duration(effects_, state, user);
            if (!conditions::set_terrain(state, sec.terrain, turns, false, side) && move.is_status()) {
                state.add_log("fail", side, move.name);
            }
            break;
        }

        case SecondaryKind::SET_SIDE_CONDITION:
            conditions::toggle_side_condition(state, side, sec.side_condition,
                                              conditions::side_condition_duration(sec.side_condition));
            break;

        case SecondaryKind::PROTECT:
            break;

        // The user leaves through the replacement window once the turn has
        // resolved; the next advance takes only its side's switch
        case SecondaryKind::SELF_SWITCH:
            if (user_up && own.healthy_bench_count() > 0 && !own.forced_switch) {
                own.forced_switch = true;
                state.add_log("self_switch", side, user.species);
            }
            break;
    }
}

// ============================================================================
// FAINTS AND WIN CONDITION
// ============================================================================

void BattleEngine::process_faints(BattleState& state) const {
    for (auto& s : state.sides) {
        if (s.has_active() && s.active->is_fainted() && !s.forced_switch && s.healthy_bench_count() > 0) {
            s.forced_switch = true;
            state.add_log("forced_switch", s.id, s.active->species);
        }
    }
}

void BattleEngine::check_win_conditions(BattleState& state) const {
    bool out0 = state.sides[0].all_fainted();
    bool out1 = state.sides[1].all_fainted();
    if (!out0 && !out1) return;

    state.phase = BattlePhase::FINISHED;
    for (auto& s : state.sides) {
        s.forced_switch = false;
    }

    if (out0 != out1) {
        state.winner = out0 ? SideID{1} : SideID{0};
        state.add_log("win", *state.winner, state.sides[*state.winner].name);
    } else {
        state.winner.reset();
        state.add_log("tie", -1, "");
    }
}

// ============================================================================
// INVARIANTS
// ============================================================================

void BattleEngine::check_invariants(const BattleState& state) const {
    auto fail = [](const std::string& what) {
        throw StateInvariantViolation(what);
    };

    for (const auto& s : state.sides) {
        std::string side_name = "side " + std::to_string(s.id);

        if (s.get_bench_count() > MAX_BENCH) fail(side_name + ": bench too large");
        if (s.hazards.spikes < 0 || s.hazards.spikes > 3) fail(side_name + ": spikes out of range");
        if (s.hazards.toxic_spikes < 0 || s.hazards.toxic_spikes > 2) fail(side_name + ": toxic spikes out of range");
        for (const auto& [kind, turns] : s.screens) {
            if (turns < 0) fail(side_name + ": negative " + to_string(kind) + " counter");
        }
        for (const auto& [kind, turns] : s.conditions) {
            if (turns < 0) fail(side_name + ": negative " + to_string(kind) + " counter");
        }
        if (s.dynamax_turns < 0) fail(side_name + ": negative dynamax counter");

        for (const Pokemon* p : s.get_all_pokemon()) {
            std::string who = side_name + " " + p->species;
            if (p->current_hp < 0 || p->current_hp > p->max_hp) {
                fail(who + ": HP " + std::to_string(p->current_hp) + " outside [0, " +
                     std::to_string(p->max_hp) + "]");
            }
            if ((p->status == StatusCondition::FAINTED) != (p->current_hp == 0)) {
                fail(who + ": fainted flag disagrees with HP");
            }
            if (!p->boosts.in_range()) fail(who + ": boost out of range");
            if (p->tera.used && p->tera.available) fail(who + ": tera used but still available");
            if (p->level < 1 || p->level > 100) fail(who + ": level out of range");
            for (const auto& slot : p->moves) {
                if (slot.pp < 0 || slot.pp > slot.max_pp) fail(who + ": PP out of range for " + slot.move.id);
            }
            if (p->moves.size() > static_cast<size_t>(MAX_MOVES)) fail(who + ": too many moves");
        }
    }

    if (state.field.weather_turns < 0) fail("negative weather counter");
    if (state.field.terrain_turns < 0) fail("negative terrain counter");
}

} // namespace pokebattle
