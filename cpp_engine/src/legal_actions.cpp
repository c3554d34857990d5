/**
 * PokeBattle Engine - Legal Action Generator Implementation
 */

#include "legal_actions.hpp"
#include "mechanics.hpp"

namespace pokebattle {

using namespace mechanics;

namespace {

LegalAction make_candidate(Action action, std::string label, std::string reason = "") {
    LegalAction la;
    la.action = std::move(action);
    la.label = std::move(label);
    la.disabled = !reason.empty();
    la.reason = std::move(reason);
    return la;
}

bool has_enabled(const std::vector<LegalAction>& out) {
    for (const auto& la : out) {
        if (la.is_enabled()) return true;
    }
    return false;
}

} // anonymous namespace

LegalActionGenerator::LegalActionGenerator(const EffectTable& effects)
    : effects_(effects)
{}

// ============================================================================
// TOP LEVEL
// ============================================================================

std::vector<LegalAction> LegalActionGenerator::generate(const BattleState& state, SideID side,
                                                        const FormatRules& rules) const {
    std::vector<LegalAction> out;
    const Side& s = state.sides[side];

    if (state.is_finished()) {
        out.push_back(make_candidate(actions::pass(), "pass"));
        return out;
    }

    // Forced-switch window: replacing a fainted (or absent) active
    if (s.forced_switch || !s.has_healthy_active()) {
        add_switch_actions(state, side, true, out);
        if (s.healthy_bench_count() == 0) {
            out.push_back(make_candidate(actions::pass(), "pass"));
        } else {
            out.push_back(make_candidate(actions::pass(), "pass", "must switch"));
        }
        return out;
    }

    // The other side is replacing its active; this side waits
    if (state.get_opponent(side).forced_switch) {
        out.push_back(make_candidate(actions::pass(), "pass"));
        return out;
    }

    add_move_actions(state, side, out);
    add_tera_actions(state, side, rules, out);
    add_mega_actions(state, side, rules, out);
    add_zmove_actions(state, side, rules, out);
    add_dynamax_actions(state, side, rules, out);
    add_switch_actions(state, side, false, out);

    if (has_enabled(out)) {
        out.push_back(make_candidate(actions::pass(), "pass", "other actions available"));
    } else {
        out.push_back(make_candidate(actions::pass(), "pass"));
    }
    return out;
}

bool LegalActionGenerator::is_legal(const BattleState& state, SideID side, const FormatRules& rules,
                                    const Action& action) const {
    std::vector<LegalAction> candidates = generate(state, side, rules);
    const Side& s = state.sides[side];
    const Pokemon* active = s.has_active() ? &s.active.value() : nullptr;
    const LegalAction* match = find_candidate(candidates, active, action);
    return match != nullptr && match->is_enabled();
}

const LegalAction* find_candidate(const std::vector<LegalAction>& candidates,
                                  const Pokemon* active, const Action& action) {
    Action normalized = action;
    if (const auto* mv = std::get_if<MoveAction>(&action)) {
        if (!mv->move_id.empty() && mv->move_id != move_ids::STRUGGLE && active) {
            int slot = active->find_move_slot(mv->move_id);
            if (slot < 0) return nullptr;
            normalized = actions::move(slot);
        }
    }
    for (const auto& la : candidates) {
        if (la.action == normalized) return &la;
    }
    return nullptr;
}

// ============================================================================
// MOVES
// ============================================================================

std::string LegalActionGenerator::locked_in_reason(const Pokemon& pokemon) const {
    if (pokemon.has_volatile(VolatileKind::RECHARGE)) {
        return "must recharge";
    }
    if (pokemon.has_volatile(VolatileKind::CHARGING)) {
        return "charging";
    }
    return "";
}

std::string LegalActionGenerator::move_block_reason(const BattleState& state, SideID side, int slot) const {
    const Pokemon& p = *state.sides[side].active;
    if (slot < 0 || slot >= static_cast<int>(p.moves.size())) {
        return "no such move";
    }
    const MoveSlot& ms = p.moves[slot];
    const Move& move = ms.move;

    if (ms.pp <= 0) {
        return "no PP";
    }
    if (p.has_volatile(VolatileKind::RECHARGE)) {
        return "must recharge";
    }
    if (const VolatileEffect* charging = p.get_volatile(VolatileKind::CHARGING)) {
        return charging->move == move.id ? "" : "charging";
    }
    if (const VolatileEffect* disable = p.get_volatile(VolatileKind::DISABLE)) {
        if (disable->move == move.id) return "disabled";
    }
    if (p.has_volatile(VolatileKind::TAUNT) && move.is_status()) {
        return "taunted";
    }
    if (const VolatileEffect* encore = p.get_volatile(VolatileKind::ENCORE)) {
        if (encore->move != move.id) return "encore";
    }
    if (!p.dynamaxed && has_effect_kind(effects_, state, p, EffectKind::CHOICE_LOCK)) {
        // The lock lasts while the locked move still has PP
        if (const VolatileEffect* lock = p.get_volatile(VolatileKind::CHOICE_LOCK)) {
            int locked = p.find_move_slot(lock->move);
            if (lock->move != move.id && locked >= 0 && p.moves[locked].pp > 0) return "choice locked";
        }
    }
    if (move.is_status()) {
        for (const EffectEntry* e : collect(effects_, state, p, TriggerPhase::BEFORE_MOVE)) {
            if (e->kind == EffectKind::STATUS_MOVE_BLOCK) return e->id;
        }
    }
    if (move.flags.gravity_banned && state.room_active(SideConditionKind::GRAVITY)) {
        return "gravity";
    }
    return "";
}

void LegalActionGenerator::add_move_actions(const BattleState& state, SideID side,
                                            std::vector<LegalAction>& out) const {
    const Pokemon& p = *state.sides[side].active;

    for (size_t i = 0; i < p.moves.size(); ++i) {
        int slot = static_cast<int>(i);
        out.push_back(make_candidate(actions::move(slot), p.moves[i].move.name,
                                     move_block_reason(state, side, slot)));
    }

    if (!p.has_any_pp()) {
        out.push_back(make_candidate(actions::struggle(), "Struggle", locked_in_reason(p)));
    }
}

// ============================================================================
// TRANSFORMATION VARIANTS
// ============================================================================

void LegalActionGenerator::add_tera_actions(const BattleState& state, SideID side, const FormatRules& rules,
                                            std::vector<LegalAction>& out) const {
    const Side& s = state.sides[side];
    const Pokemon& p = *s.active;

    std::string reason;
    if (!rules.tera_allowed) reason = "tera not allowed by format";
    else if (s.tera_used) reason = "tera already used";
    else if (!p.tera.available || p.tera.used) reason = "no tera type";
    else if (p.dynamaxed) reason = "dynamax already active";

    for (size_t i = 0; i < p.moves.size(); ++i) {
        int slot = static_cast<int>(i);
        std::string r = reason.empty() ? move_block_reason(state, side, slot) : reason;
        out.push_back(make_candidate(actions::tera(slot), "tera " + p.moves[i].move.name, r));
    }
}

void LegalActionGenerator::add_mega_actions(const BattleState& state, SideID side, const FormatRules& rules,
                                            std::vector<LegalAction>& out) const {
    const Side& s = state.sides[side];
    const Pokemon& p = *s.active;

    std::string reason;
    if (!rules.mega_allowed) reason = "mega not allowed by format";
    else if (s.mega_used || p.mega_evolved) reason = "mega already used";
    else if (!p.mega_forme || p.item != p.mega_forme->item || !item_active(state, p)) reason = "no mega stone";
    else if (p.dynamaxed) reason = "dynamax already active";

    for (size_t i = 0; i < p.moves.size(); ++i) {
        int slot = static_cast<int>(i);
        std::string r = reason.empty() ? move_block_reason(state, side, slot) : reason;
        out.push_back(make_candidate(actions::mega(slot), "mega " + p.moves[i].move.name, r));
    }
}

void LegalActionGenerator::add_zmove_actions(const BattleState& state, SideID side, const FormatRules& rules,
                                             std::vector<LegalAction>& out) const {
    const Side& s = state.sides[side];
    const Pokemon& p = *s.active;

    std::string reason;
    std::optional<PokeType> crystal = item_active(state, p) ? zcrystal_type(p.item) : std::nullopt;
    if (!rules.zmove_allowed) reason = "zmove not allowed by format";
    else if (s.zmove_used) reason = "zmove already used";
    else if (!crystal) reason = "no z-crystal";
    else if (p.dynamaxed) reason = "dynamax already active";

    for (size_t i = 0; i < p.moves.size(); ++i) {
        int slot = static_cast<int>(i);
        const Move& move = p.moves[i].move;
        std::string r = reason;
        if (r.empty() && (move.type != *crystal || !move.is_damaging())) {
            r = "no matching z-crystal";
        }
        if (r.empty()) {
            r = move_block_reason(state, side, slot);
        }
        out.push_back(make_candidate(actions::zmove(slot), "z " + move.name, r));
    }
}

void LegalActionGenerator::add_dynamax_actions(const BattleState& state, SideID side, const FormatRules& rules,
                                               std::vector<LegalAction>& out) const {
    const Side& s = state.sides[side];
    const Pokemon& p = *s.active;

    std::string reason;
    if (!rules.dynamax_allowed) reason = "dynamax not allowed by format";
    else if (p.dynamaxed) reason = "dynamax already active";
    else if (s.dynamax_used) reason = "dynamax already used";

    for (size_t i = 0; i < p.moves.size(); ++i) {
        int slot = static_cast<int>(i);
        std::string r = reason;
        if (r.empty()) {
            // Dynamaxing drops the choice lock, so only PP and hard locks apply
            if (p.moves[i].pp <= 0) r = "no PP";
            else r = locked_in_reason(p);
        }
        out.push_back(make_candidate(actions::dynamax(slot), "dynamax " + p.moves[i].move.name, r));
    }
}

// ============================================================================
// SWITCHES
// ============================================================================

void LegalActionGenerator::add_switch_actions(const BattleState& state, SideID side, bool forced,
                                              std::vector<LegalAction>& out) const {
    const Side& s = state.sides[side];

    std::string reason;
    if (!forced && s.has_healthy_active()) {
        const Pokemon& p = *s.active;
        reason = locked_in_reason(p);
        if (reason.empty() && is_trapped(effects_, state, p)) {
            reason = "trapped";
        }
    }

    for (int i = 0; i < s.get_bench_count(); ++i) {
        const Pokemon& b = s.bench[i];
        std::string r = b.is_fainted() ? "fainted" : reason;
        out.push_back(make_candidate(actions::switch_to(i), "switch " + b.species, r));
    }
}

} // namespace pokebattle
