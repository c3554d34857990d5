/**
 * PokeBattle Engine - Action Representation
 *
 * Actions are a closed variant. Every component dispatches on them with
 * std::visit over an `overloaded` visitor, so adding an alternative
 * without handling it everywhere fails to compile.
 */

#pragma once

#include "types.hpp"
#include <variant>
#include <functional>

namespace pokebattle {

// ============================================================================
// ACTION ALTERNATIVES
// ============================================================================

/**
 * Use a move. `move_id`, when set, takes precedence over `slot` and is
 * resolved against the active Pokemon's moves ("struggle" is always valid
 * when the generator offered it).
 */
struct MoveAction {
    int slot = 0;
    MoveID move_id;

    bool operator==(const MoveAction& o) const { return slot == o.slot && move_id == o.move_id; }
};

struct SwitchAction {
    int bench_index = 0;

    bool operator==(const SwitchAction& o) const { return bench_index == o.bench_index; }
};

// Terastallize, then use the move in `slot`
struct TeraAction {
    int slot = 0;

    bool operator==(const TeraAction& o) const { return slot == o.slot; }
};

struct MegaAction {
    int slot = 0;

    bool operator==(const MegaAction& o) const { return slot == o.slot; }
};

struct ZMoveAction {
    int slot = 0;

    bool operator==(const ZMoveAction& o) const { return slot == o.slot; }
};

struct DynamaxAction {
    int slot = 0;

    bool operator==(const DynamaxAction& o) const { return slot == o.slot; }
};

struct PassAction {
    bool operator==(const PassAction&) const { return true; }
};

using Action = std::variant<
    MoveAction,
    SwitchAction,
    TeraAction,
    MegaAction,
    ZMoveAction,
    DynamaxAction,
    PassAction
>;

// ============================================================================
// VISITOR HELPER
// ============================================================================

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// ============================================================================
// FACTORY METHODS
// ============================================================================

namespace actions {

inline Action move(int slot) { return MoveAction{slot, ""}; }
inline Action move_by_id(const MoveID& id) { return MoveAction{-1, id}; }
inline Action struggle() { return MoveAction{-1, "struggle"}; }
inline Action switch_to(int bench_index) { return SwitchAction{bench_index}; }
inline Action tera(int slot) { return TeraAction{slot}; }
inline Action mega(int slot) { return MegaAction{slot}; }
inline Action zmove(int slot) { return ZMoveAction{slot}; }
inline Action dynamax(int slot) { return DynamaxAction{slot}; }
inline Action pass() { return PassAction{}; }

} // namespace actions

// ============================================================================
// HELPERS
// ============================================================================

inline const char* action_type_name(const Action& action) {
    return std::visit(overloaded{
        [](const MoveAction&) { return "move"; },
        [](const SwitchAction&) { return "switch"; },
        [](const TeraAction&) { return "tera"; },
        [](const MegaAction&) { return "mega"; },
        [](const ZMoveAction&) { return "zmove"; },
        [](const DynamaxAction&) { return "dynamax"; },
        [](const PassAction&) { return "pass"; },
    }, action);
}

inline bool is_switch(const Action& action) {
    return std::holds_alternative<SwitchAction>(action);
}

inline bool is_pass(const Action& action) {
    return std::holds_alternative<PassAction>(action);
}

// Slot of the move the action will use, or -1 (switch, pass, by-id moves)
inline int action_move_slot(const Action& action) {
    return std::visit(overloaded{
        [](const MoveAction& a) { return a.move_id.empty() ? a.slot : -1; },
        [](const SwitchAction&) { return -1; },
        [](const TeraAction& a) { return a.slot; },
        [](const MegaAction& a) { return a.slot; },
        [](const ZMoveAction& a) { return a.slot; },
        [](const DynamaxAction& a) { return a.slot; },
        [](const PassAction&) { return -1; },
    }, action);
}

inline std::string action_to_string(const Action& action) {
    return std::visit(overloaded{
        [](const MoveAction& a) -> std::string {
            if (!a.move_id.empty()) return "move " + a.move_id;
            return "move " + std::to_string(a.slot);
        },
        [](const SwitchAction& a) -> std::string { return "switch " + std::to_string(a.bench_index); },
        [](const TeraAction& a) -> std::string { return "tera " + std::to_string(a.slot); },
        [](const MegaAction& a) -> std::string { return "mega " + std::to_string(a.slot); },
        [](const ZMoveAction& a) -> std::string { return "zmove " + std::to_string(a.slot); },
        [](const DynamaxAction& a) -> std::string { return "dynamax " + std::to_string(a.slot); },
        [](const PassAction&) -> std::string { return "pass"; },
    }, action);
}

/**
 * LegalAction - A candidate produced by the Legal Action Generator.
 *
 * Disabled candidates are still listed so callers can show why an
 * option is unavailable.
 */
struct LegalAction {
    Action action;
    bool disabled = false;
    std::string reason;
    std::string label;           // e.g. "Earthquake", "switch Garchomp"

    bool is_enabled() const { return !disabled; }
};

} // namespace pokebattle

// Hash function for Action (for use in unordered_set/map)
namespace std {
    template<>
    struct hash<pokebattle::Action> {
        size_t operator()(const pokebattle::Action& a) const {
            size_t h = hash<size_t>()(a.index());
            h ^= hash<int>()(pokebattle::action_move_slot(a)) << 1;
            if (auto* sw = std::get_if<pokebattle::SwitchAction>(&a)) {
                h ^= hash<int>()(sw->bench_index) << 2;
            }
            if (auto* mv = std::get_if<pokebattle::MoveAction>(&a)) {
                h ^= hash<string>()(mv->move_id) << 3;
            }
            return h;
        }
    };
}
