/**
 * PokeBattle Engine - Shared Mechanics
 *
 * Read-only rule helpers used by the calculator, the legal action
 * generator and the resolution engine: stage multipliers, effect-table
 * queries, grounding, speed, priority, hazards and move conversion.
 * Nothing here mutates a BattleState except the apply_* transformations,
 * which act on a single Pokemon.
 */

#pragma once

#include "battle_state.hpp"
#include "effect_table.hpp"

namespace pokebattle {
namespace mechanics {

// ============================================================================
// STAGE MULTIPLIERS
// ============================================================================

// (2+b)/2 for b >= 0, 2/(2-b) otherwise
double boost_multiplier(int stage);

// (3+b)/3 for b >= 0, 3/(3-b) otherwise
double accuracy_multiplier(int stage);

// 1/24, 1/8, 1/2, then always
double crit_chance(int crit_stage);

// ============================================================================
// EFFECT-TABLE QUERIES
// ============================================================================

/**
 * MatchContext - What an EffectCondition is evaluated against.
 */
struct MatchContext {
    const Pokemon* holder = nullptr;
    const Move* move = nullptr;
    PokeType move_type = PokeType::TYPELESS;
    double effectiveness = 1.0;
    const Field* field = nullptr;
};

bool condition_matches(const EffectCondition& cond, const MatchContext& ctx);

// Item effects are off under Magic Room, with no item, or once consumed
bool item_active(const BattleState& state, const Pokemon& holder);

/**
 * Entries of the holder's ability and held item for a phase.
 * `ability_suppressed` drops the ability rows (Mold Breaker on the other side).
 */
std::vector<const EffectEntry*> collect(const EffectTable& table, const BattleState& state,
                                        const Pokemon& holder, TriggerPhase phase,
                                        bool ability_suppressed = false);

// Entries for a phase that also pass their gating condition
std::vector<const EffectEntry*> collect_matching(const EffectTable& table, const BattleState& state,
                                                 const Pokemon& holder, TriggerPhase phase,
                                                 const MatchContext& ctx,
                                                 bool ability_suppressed = false);

// True if the holder's ability or active item has any entry of `kind`
bool has_effect_kind(const EffectTable& table, const BattleState& state,
                     const Pokemon& holder, EffectKind kind, bool ability_suppressed = false);

bool ignores_abilities(const EffectTable& table, const BattleState& state, const Pokemon& attacker);

// Focus Sash / Sturdy row that would leave the holder at 1 HP, or nullptr
const EffectEntry* survive_at_one_entry(const EffectTable& table, const BattleState& state,
                                        const Pokemon& holder, bool ability_suppressed = false);

// Sheer Force: the move's chance-based secondaries are dropped
bool suppresses_secondaries(const EffectTable& table, const BattleState& state,
                            const Pokemon& attacker, const Move& move);

// Good as Gold / Magic Bounce on the target of a status move
bool status_move_blocked(const EffectTable& table, const BattleState& state,
                         const Pokemon& target, bool ability_suppressed = false);

// ============================================================================
// POSITIONING AND IMMUNITIES
// ============================================================================

bool is_grounded(const EffectTable& table, const BattleState& state, const Pokemon& pokemon);

// Weather/hazard/recoil damage immunity. `weather` set = weather damage check.
bool indirect_damage_immune(const EffectTable& table, const BattleState& state,
                            const Pokemon& pokemon, std::optional<Weather> weather = std::nullopt);

/**
 * Whether `status` can be inflicted on `target` right now: typing,
 * abilities, terrain and an existing primary status all block it.
 */
bool can_receive_status(const EffectTable& table, const BattleState& state, const Pokemon& target,
                        StatusCondition status, bool ability_suppressed = false);

bool is_trapped(const EffectTable& table, const BattleState& state, const Pokemon& pokemon);

// ============================================================================
// SPEED AND PRIORITY
// ============================================================================

int effective_speed(const EffectTable& table, const BattleState& state, SideID side);

int effective_speed_of(const EffectTable& table, const BattleState& state, SideID side,
                       const Pokemon& pokemon);

/**
 * Move priority after ability and terrain modifiers. `prankster` is set
 * when a fails-vs-Dark modifier contributed.
 */
int effective_priority(const EffectTable& table, const BattleState& state,
                       const Pokemon& user, const Move& move, bool* prankster = nullptr);

// ============================================================================
// HAZARDS
// ============================================================================

// Fraction of max HP lost to hazards when `incoming` switches in on `side`
double hazard_damage_fraction(const EffectTable& table, const BattleState& state,
                              SideID side, const Pokemon& incoming);

// Poison/toxic from toxic spikes, or NONE
StatusCondition toxic_spikes_status(const EffectTable& table, const BattleState& state,
                                    SideID side, const Pokemon& incoming);

// ============================================================================
// TYPES AND STAB
// ============================================================================

/**
 * Type the move hits with after TYPE_CHANGE abilities. `power_mult`
 * receives the accompanying power multiplier (1.0 when unchanged).
 */
PokeType resolved_move_type(const EffectTable& table, const BattleState& state,
                            const Pokemon& attacker, const Move& move, double* power_mult = nullptr);

double stab_multiplier(const EffectTable& table, const BattleState& state,
                       const Pokemon& attacker, PokeType move_type);

// Effectiveness honoring Gravity (Ground hits Flying)
double matchup(const BattleState& state, PokeType move_type, const Pokemon& defender);

// ============================================================================
// DURATIONS
// ============================================================================

int screen_duration(const EffectTable& table, const BattleState& state, const Pokemon& setter);
int weather_duration(const EffectTable& table, const BattleState& state, const Pokemon& setter, Weather weather);
int terrain_duration(const EffectTable& table, const BattleState& state, const Pokemon& setter);

// ============================================================================
// MOVE CONVERSION (Z-moves, Max moves)
// ============================================================================

std::optional<PokeType> zcrystal_type(const ItemID& item);

int zmove_power(int base_power);
int max_move_power(int base_power, PokeType type);

Move convert_to_zmove(const Move& base);
Move convert_to_max_move(const Move& base);

// ============================================================================
// TRANSFORMATIONS
// ============================================================================

void apply_terastallize(Side& side, Pokemon& pokemon);
void apply_mega_evolution(Side& side, Pokemon& pokemon);
void apply_dynamax(Side& side, Pokemon& pokemon);
void revert_dynamax(Side& side, Pokemon& pokemon);

} // namespace mechanics
} // namespace pokebattle
