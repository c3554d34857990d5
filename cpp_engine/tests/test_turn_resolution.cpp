/**
 * Tests for Turn Resolution
 *
 * Ordering, faint handling, forced switches, win/tie detection and the
 * purity of advance().
 */

#include <sstream>
#include "test_helpers.hpp"

using namespace pokebattle;
using namespace fixtures;

// ============================================================================
// BATTLE SETUP
// ============================================================================

TEST(CreateBattle, LeadsAndStartingTurn) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey()}, {dragapult()});

    TEST_ASSERT_EQ(1, state.turn);
    TEST_ASSERT_EQ(static_cast<int>(BattlePhase::BATTLE), static_cast<int>(state.phase));
    TEST_ASSERT_EQ(std::string("Garchomp"), state.sides[0].active->species);
    TEST_ASSERT_EQ(1, state.sides[0].get_bench_count());
    TEST_ASSERT_EQ(0, state.sides[1].get_bench_count());
    TEST_ASSERT_EQ(std::string("p1"), state.sides[0].name);
    TEST_ASSERT_EQ(std::string("p2"), state.sides[1].name);
    TEST_ASSERT_FALSE(state.winner.has_value());
}

TEST(CreateBattle, RejectsBadTeams) {
    BattleEngine engine;
    TEST_ASSERT_THROWS(start(engine, {}, {dragapult()}), InvalidAction);

    // Species clause
    TEST_ASSERT_THROWS(start(engine, {garchomp(), garchomp("choicescarf")}, {dragapult()}), InvalidAction);

    std::vector<Pokemon> seven;
    for (int i = 0; i < 7; ++i) {
        seven.push_back(weak("Mon" + std::to_string(i), 100, 50));
    }
    TEST_ASSERT_THROWS(start(engine, seven, {dragapult()}), InvalidAction);
}

TEST(CreateBattle, UnknownFormat) {
    BattleEngine engine;
    bool threw = false;
    try {
        start(engine, {garchomp()}, {dragapult()}, "gen1randombattle");
    } catch (const UnsupportedFormat& e) {
        threw = true;
        TEST_ASSERT_EQ(static_cast<int>(ErrorKind::UNSUPPORTED_FORMAT), static_cast<int>(e.kind()));
    }
    TEST_ASSERT(threw);
}

TEST(CreateBattle, SwitchInAbilitiesFire) {
    BattleEngine engine;
    Pokemon gyarados = make_pokemon("Gyarados", {PokeType::WATER, PokeType::FLYING},
                                    Stats{331, 286, 194, 140, 236, 260}, {tackle()}, "intimidate");
    BattleState state = start(engine, {gyarados}, {garchomp()});

    TEST_ASSERT_EQ(-1, state.sides[1].active->boosts.atk);
    TEST_ASSERT_TRUE(log_has(state.log, "ability", 0));
}

// ============================================================================
// TURN ORDER
// ============================================================================

TEST(TurnOrder, PriorityBeatsSpeed) {
    BattleEngine engine;
    Pokemon slowbro = make_pokemon("Slowbro", {PokeType::WATER, PokeType::PSYCHIC},
                                   Stats{394, 186, 256, 236, 196, 96}, {quick_attack()});
    BattleState state = start(engine, {dragapult()}, {slowbro});

    AdvanceResult r = engine.advance(state, actions::move(1), actions::move(0));
    std::vector<int> order = move_order(r.log);

    TEST_ASSERT_EQ(2u, order.size());
    TEST_ASSERT_EQ(1, order[0]);
    TEST_ASSERT_EQ(0, order[1]);
    // Quick Attack cannot touch a Ghost
    TEST_ASSERT_TRUE(log_has(r.log, "immune", 0));
    TEST_ASSERT_EQ(317, r.state.sides[0].active->current_hp);
}

TEST(TurnOrder, FasterMovesFirst) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});

    AdvanceResult r = engine.advance(state, actions::move(2), actions::move(1));
    std::vector<int> order = move_order(r.log);

    TEST_ASSERT_EQ(2u, order.size());
    TEST_ASSERT_EQ(0, order[0]);
    TEST_ASSERT_EQ(1, order[1]);
    TEST_ASSERT_EQ(2, r.state.sides[0].active->boosts.atk);
    TEST_ASSERT_TRUE(r.state.sides[0].hazards.stealth_rock);
}

TEST(TurnOrder, TrickRoomReversesSpeed) {
    BattleEngine engine;
    BattleState state = start(engine, {corviknight()}, {blissey()});

    // Trick Room has -7 priority, so Blissey moves first this turn
    AdvanceResult r1 = engine.advance(state, actions::move(2), actions::move(3));
    TEST_ASSERT_EQ(1, move_order(r1.log)[0]);
    TEST_ASSERT_TRUE(r1.state.room_active(SideConditionKind::TRICK_ROOM));

    // Corviknight (170) is faster than Blissey (146), but the room is up
    AdvanceResult r2 = engine.advance(r1.state, actions::move(3), actions::move(3));
    std::vector<int> order = move_order(r2.log);
    TEST_ASSERT_EQ(2u, order.size());
    TEST_ASSERT_EQ(1, order[0]);
    TEST_ASSERT_EQ(0, order[1]);
}

TEST(TurnOrder, SpeedTiesDrawFromRng) {
    BattleEngine engine;

    // Equal speed: across seeds each side moves first some of the time
    for (bool trick_room : {false, true}) {
        bool side0_first = false;
        bool side1_first = false;
        for (uint64_t seed = 1; seed <= 32; ++seed) {
            BattleState state = start(engine, {weak("Ditto", 300, 100)}, {weak("Eevee", 300, 100)},
                                      "gen9ou", seed);
            if (trick_room) {
                state.sides[0].conditions[SideConditionKind::TRICK_ROOM] = 5;
            }
            AdvanceResult r = engine.advance(state, actions::move(0), actions::move(0));
            TEST_ASSERT_TRUE(log_has(r.log, "speed_tie"));

            std::vector<int> order = move_order(r.log);
            TEST_ASSERT_EQ(2u, order.size());
            (order[0] == 0 ? side0_first : side1_first) = true;
        }
        TEST_ASSERT_MSG(side0_first && side1_first,
                        trick_room ? "ties under Trick Room follow input order" : "ties follow input order");
    }
}

TEST(TurnOrder, SwitchesResolveBeforeMoves) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), corviknight()}, {blissey()});

    AdvanceResult r1 = engine.advance(state, actions::move(2), actions::move(3));
    TEST_ASSERT_EQ(2, r1.state.sides[0].active->boosts.atk);

    // Corviknight comes in on the rocks: neutral Rock damage is 1/8
    AdvanceResult r2 = engine.advance(r1.state, actions::switch_to(0), actions::move(3));
    const Side& s = r2.state.sides[0];
    TEST_ASSERT_EQ(std::string("Corviknight"), s.active->species);
    TEST_ASSERT_EQ(398 - 49, s.active->current_hp);
    TEST_ASSERT_EQ(std::string("Garchomp"), s.bench[0].species);
    TEST_ASSERT_EQ(0, s.bench[0].boosts.atk);
    TEST_ASSERT_TRUE(s.bench[0].last_move.empty());
    TEST_ASSERT_EQ(3, r2.state.turn);

    bool switched_first = false;
    for (const auto& e : r2.log) {
        if (e.event == "switch") { switched_first = true; break; }
        if (e.event == "move") break;
    }
    TEST_ASSERT(switched_first);
}

// ============================================================================
// MOVE RESOLUTION
// ============================================================================

TEST(Resolution, ProtectBlocksTheHit) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});

    AdvanceResult r = engine.advance(state, actions::move(1), actions::move(2));
    TEST_ASSERT_TRUE(log_has(r.log, "protected", 1));
    TEST_ASSERT_EQ(386, r.state.sides[1].active->current_hp);
    TEST_ASSERT_EQ(1, r.state.sides[1].active->protect_streak);
    // Protect is cleared at end of turn
    TEST_ASSERT_FALSE(r.state.sides[1].active->has_volatile(VolatileKind::PROTECT));
}

TEST(Resolution, PpIsSpent) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {blissey()});

    AdvanceResult r = engine.advance(state, actions::move(2), actions::move(3));
    TEST_ASSERT_EQ(15, r.state.sides[0].active->moves[2].pp);
    TEST_ASSERT_EQ(16, r.state.sides[0].active->moves[0].pp);
    TEST_ASSERT_EQ(std::string("swordsdance"), r.state.sides[0].active->last_move);
}

TEST(Resolution, LifeOrbRecoil) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp("lifeorb")}, {blissey()});

    AdvanceResult r = engine.advance(state, actions::move(1), actions::move(3));
    TEST_ASSERT_EQ(357 - 35, r.state.sides[0].active->current_hp);
    TEST_ASSERT_TRUE(log_has_detail(r.log, "damage", "Garchomp (lifeorb)"));
    TEST_ASSERT_FALSE(r.state.sides[1].active->is_fainted());
}

TEST(Resolution, FaintedTargetIsNoop) {
    BattleEngine engine;
    // Rattata outspeeds and dies to Rough Skin before Garchomp moves
    BattleState state = start(engine, {garchomp()}, {weak("Rattata", 1, 300), weak("Pidgey", 100, 50)});

    AdvanceResult r = engine.advance(state, actions::move(0), actions::move(0));
    TEST_ASSERT_TRUE(log_has_detail(r.log, "damage", "Rattata (roughskin)"));
    TEST_ASSERT_TRUE(log_has(r.log, "faint", 1));
    TEST_ASSERT_TRUE(log_has(r.log, "noop", 0));
    TEST_ASSERT_EQ(1u, move_order(r.log).size());
    TEST_ASSERT_TRUE(r.state.sides[1].forced_switch);
    TEST_ASSERT_EQ(static_cast<int>(TurnStage::ADVANCED), static_cast<int>(r.stage));
}

TEST(Resolution, FaintedUserIsSkipped) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {weak("Magikarp", 10, 10), weak("Pidgey", 100, 50)});

    AdvanceResult r = engine.advance(state, actions::move(0), actions::move(0));
    TEST_ASSERT_TRUE(log_has(r.log, "skip", 1));
    TEST_ASSERT_FALSE(r.state.is_finished());
    TEST_ASSERT_TRUE(r.state.sides[1].forced_switch);
}

// ============================================================================
// FORCED SWITCHES
// ============================================================================

TEST(ForcedSwitch, ReplacementWindow) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {weak("Rattata", 1, 300), weak("Pidgey", 100, 50)});
    BattleState fainted = engine.advance(state, actions::move(0), actions::move(0)).state;

    auto forced = engine.get_legal_actions(fainted, 1);
    const LegalAction* pass = find_action(forced, actions::pass());
    TEST_ASSERT_NOT_NULL(pass);
    TEST_ASSERT_TRUE(pass->disabled);
    TEST_ASSERT_EQ(std::string("must switch"), pass->reason);
    TEST_ASSERT_EQ(1, count_enabled(forced));

    auto waiting = engine.get_legal_actions(fainted, 0);
    TEST_ASSERT_EQ(1u, waiting.size());
    TEST_ASSERT_TRUE(is_pass(waiting[0].action));

    int turn = fainted.turn;
    AdvanceResult r = engine.advance(fainted, actions::pass(), actions::switch_to(0));
    TEST_ASSERT_EQ(static_cast<int>(TurnStage::RESOLVING), static_cast<int>(r.stage));
    TEST_ASSERT_EQ(std::string("Pidgey"), r.state.sides[1].active->species);
    TEST_ASSERT_FALSE(r.state.sides[1].forced_switch);
    TEST_ASSERT_EQ(turn, r.state.turn);
    TEST_ASSERT_FALSE(log_has(r.log, "move"));
}

TEST(ForcedSwitch, PivotMoveSwitchesTheUserOut) {
    Move uturn = attack("uturn", PokeType::BUG, MoveCategory::PHYSICAL, 70);
    uturn.flags.contact = true;
    Secondary pivot;
    pivot.kind = SecondaryKind::SELF_SWITCH;
    uturn.secondaries.push_back(pivot);
    Pokemon ninjask = make_pokemon("Ninjask", {PokeType::BUG, PokeType::FLYING},
                                   Stats{285, 216, 126, 112, 136, 364}, {uturn, tackle()});

    BattleEngine engine;
    BattleState state = start(engine, {ninjask, corviknight()}, {blissey()});
    int blissey_hp = state.sides[1].active->current_hp;

    AdvanceResult r1 = engine.advance(state, actions::move(0), actions::move(0));
    TEST_ASSERT_TRUE(log_has(r1.log, "self_switch", 0));
    TEST_ASSERT(r1.state.sides[1].active->current_hp < blissey_hp);
    TEST_ASSERT_TRUE(r1.state.sides[0].forced_switch);
    TEST_ASSERT_EQ(std::string("Ninjask"), r1.state.sides[0].active->species);

    // Only the pivoting side picks a replacement
    auto candidates = engine.get_legal_actions(r1.state, 0);
    TEST_ASSERT_EQ(1, count_enabled(candidates));
    TEST_ASSERT_NULL(find_action(candidates, actions::move(0)));
    TEST_ASSERT_TRUE(find_action(candidates, actions::switch_to(0))->is_enabled());
    TEST_ASSERT_EQ(1u, engine.get_legal_actions(r1.state, 1).size());

    AdvanceResult r2 = engine.advance(r1.state, actions::switch_to(0), actions::pass());
    TEST_ASSERT_EQ(static_cast<int>(TurnStage::RESOLVING), static_cast<int>(r2.stage));
    TEST_ASSERT_TRUE(log_has(r2.log, "switch_out", 0));
    TEST_ASSERT_EQ(std::string("Corviknight"), r2.state.sides[0].active->species);
    TEST_ASSERT_EQ(std::string("Ninjask"), r2.state.sides[0].bench[0].species);
    TEST_ASSERT_FALSE(r2.state.sides[0].forced_switch);
    TEST_ASSERT_EQ(r1.state.turn, r2.state.turn);
}

TEST(ForcedSwitch, PivotWithoutBenchStaysIn) {
    Move volt_switch = attack("voltswitch", PokeType::ELECTRIC, MoveCategory::SPECIAL, 70);
    Secondary pivot;
    pivot.kind = SecondaryKind::SELF_SWITCH;
    volt_switch.secondaries.push_back(pivot);
    Pokemon rotom = make_pokemon("Rotom", {PokeType::ELECTRIC, PokeType::GHOST},
                                 Stats{241, 136, 196, 226, 196, 208}, {volt_switch});

    BattleEngine engine;
    BattleState state = start(engine, {rotom}, {blissey()});
    AdvanceResult r = engine.advance(state, actions::move(0), actions::move(0));
    TEST_ASSERT_FALSE(log_has(r.log, "self_switch"));
    TEST_ASSERT_FALSE(r.state.sides[0].forced_switch);
    TEST_ASSERT_EQ(static_cast<int>(TurnStage::ADVANCED), static_cast<int>(r.stage));
}

TEST(ForcedSwitch, MovesAreRejectedDuringWindow) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {weak("Rattata", 1, 300), weak("Pidgey", 100, 50)});
    BattleState fainted = engine.advance(state, actions::move(0), actions::move(0)).state;

    bool threw = false;
    try {
        engine.advance(fainted, actions::move(0), actions::switch_to(0));
    } catch (const InvalidAction&) {
        threw = true;
    }
    TEST_ASSERT_MSG(threw, "waiting side may only pass");
}

// ============================================================================
// WIN AND TIE
// ============================================================================

TEST(WinCondition, LastPokemonFalls) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {weak("Magikarp", 10, 10)});

    AdvanceResult r = engine.advance(state, actions::move(0), actions::move(0));
    TEST_ASSERT_TRUE(r.state.is_finished());
    TEST_ASSERT_TRUE(r.state.winner.has_value());
    TEST_ASSERT_EQ(0, *r.state.winner);
    TEST_ASSERT_TRUE(log_has(r.log, "win", 0));
    TEST_ASSERT_EQ(1u, move_order(r.log).size());
    TEST_ASSERT_EQ(static_cast<int>(TurnStage::RESOLVING), static_cast<int>(r.stage));

    bool threw = false;
    try {
        engine.advance(r.state, actions::pass(), actions::pass());
    } catch (const InvalidAction&) {
        threw = true;
    }
    TEST_ASSERT_MSG(threw, "finished battle rejects further turns");
}

TEST(WinCondition, SimultaneousFaintIsTie) {
    BattleEngine engine;
    Pokemon spiky = make_pokemon("Ferroseed", {PokeType::NORMAL}, Stats{1, 50, 50, 50, 50, 10},
                                 {tackle()}, "roughskin");
    BattleState state = start(engine, {weak("Rattata", 1, 300)}, {spiky});

    AdvanceResult r = engine.advance(state, actions::move(0), actions::move(0));
    TEST_ASSERT_TRUE(r.state.is_finished());
    TEST_ASSERT_FALSE(r.state.winner.has_value());
    TEST_ASSERT_TRUE(log_has(r.log, "tie"));
}

// ============================================================================
// ADVANCE CONTRACT
// ============================================================================

TEST(Advance, InputStateUntouched) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {dragapult()});
    size_t log_size = state.log.size();

    AdvanceResult r = engine.advance(state, actions::move(0), actions::move(1));
    TEST_ASSERT_EQ(1, state.turn);
    TEST_ASSERT_EQ(log_size, state.log.size());
    TEST_ASSERT_EQ(357, state.sides[0].active->current_hp);
    TEST_ASSERT_EQ(16, state.sides[0].active->moves[0].pp);
    TEST_ASSERT_EQ(log_size + r.log.size(), r.state.log.size());
}

TEST(Advance, SameSeedSameResult) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {dragapult()}, "gen9ou", 1234);

    AdvanceResult a = engine.advance(state, actions::move(1), actions::move(1));
    AdvanceResult b = engine.advance(state, actions::move(1), actions::move(1));

    TEST_ASSERT_EQ(a.log.size(), b.log.size());
    for (size_t i = 0; i < a.log.size(); ++i) {
        TEST_ASSERT(a.log[i] == b.log[i]);
    }
    TEST_ASSERT_EQ(a.state.sides[0].active->current_hp, b.state.sides[0].active->current_hp);
    TEST_ASSERT_EQ(a.state.sides[1].active->current_hp, b.state.sides[1].active->current_hp);
}

TEST(Advance, RejectsIllegalChoices) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey()}, {dragapult()});

    bool threw = false;
    try {
        engine.advance(state, actions::switch_to(5), actions::move(0));
    } catch (const InvalidAction&) {
        threw = true;
    }
    TEST_ASSERT_MSG(threw, "nonexistent bench slot");

    threw = false;
    try {
        engine.advance(state, actions::pass(), actions::move(0));
    } catch (const InvalidAction&) {
        threw = true;
    }
    TEST_ASSERT_MSG(threw, "pass is disabled while moves are available");

    threw = false;
    try {
        engine.advance(state, actions::move_by_id("hyperbeam"), actions::move(0));
    } catch (const InvalidAction&) {
        threw = true;
    }
    TEST_ASSERT_MSG(threw, "unknown move id");
}

TEST(Advance, MoveByIdMatchesSlot) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {blissey()});

    AdvanceResult r = engine.advance(state, actions::move_by_id("swordsdance"), actions::move(3));
    TEST_ASSERT_EQ(2, r.state.sides[0].active->boosts.atk);
}

TEST(Advance, InvariantsHoldAfterTurn) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), corviknight()}, {dragapult(), heatran()});

    for (int i = 0; i < 3 && !state.is_finished(); ++i) {
        auto own = engine.get_legal_actions(state, 0);
        auto foe = engine.get_legal_actions(state, 1);
        Action a0 = actions::pass();
        Action a1 = actions::pass();
        for (const auto& la : own) { if (la.is_enabled()) { a0 = la.action; break; } }
        for (const auto& la : foe) { if (la.is_enabled()) { a1 = la.action; break; } }
        state = engine.advance(state, a0, a1).state;
        engine.check_invariants(state);
    }
    TEST_ASSERT(state.turn >= 2);
}

TEST(Advance, BrokenStateIsReported) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {dragapult()});
    state.sides[0].active->current_hp = 9999;

    bool threw = false;
    try {
        engine.check_invariants(state);
    } catch (const StateInvariantViolation& e) {
        threw = true;
        TEST_ASSERT_EQ(static_cast<int>(ErrorKind::STATE_INVARIANT_VIOLATION), static_cast<int>(e.kind()));
    }
    TEST_ASSERT(threw);
}
