/**
 * Tests for the Legal Action Generator
 */

#include <sstream>
#include "test_helpers.hpp"

using namespace pokebattle;
using namespace fixtures;

namespace {

std::string reason_of(const std::vector<LegalAction>& candidates, const Action& action) {
    const LegalAction* la = find_action(candidates, action);
    if (!la) throw std::runtime_error("candidate not listed: " + action_to_string(action));
    return la->reason;
}

bool enabled(const std::vector<LegalAction>& candidates, const Action& action) {
    const LegalAction* la = find_action(candidates, action);
    return la != nullptr && la->is_enabled();
}

} // anonymous namespace

// ============================================================================
// ORDERING AND DEFAULTS
// ============================================================================

TEST(LegalActions, CandidateOrder) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey(), corviknight()}, {heatran()});

    auto candidates = engine.get_legal_actions(state, 0);

    // 4 moves, 4 x (tera, mega, zmove, dynamax), 2 switches, pass
    TEST_ASSERT_EQ(23u, candidates.size());
    for (int i = 0; i < 4; ++i) {
        TEST_ASSERT_TRUE(candidates[i].action == actions::move(i));
        TEST_ASSERT_TRUE(candidates[i].is_enabled());
    }
    TEST_ASSERT_TRUE(candidates[4].action == actions::tera(0));
    TEST_ASSERT_TRUE(candidates[20].action == actions::switch_to(0));
    TEST_ASSERT_TRUE(candidates[21].action == actions::switch_to(1));
    TEST_ASSERT_TRUE(is_pass(candidates.back().action));

    TEST_ASSERT_EQ(std::string("earthquake"), candidates[0].label);
    TEST_ASSERT_EQ(std::string("switch Blissey"), candidates[20].label);
}

TEST(LegalActions, PassOnlyWhenNothingElse) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_FALSE(candidates.back().is_enabled());
    TEST_ASSERT_EQ(std::string("other actions available"), candidates.back().reason);
}

TEST(LegalActions, FormatGatesTransformations) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("no tera type"), reason_of(candidates, actions::tera(0)));
    TEST_ASSERT_EQ(std::string("mega not allowed by format"), reason_of(candidates, actions::mega(0)));
    TEST_ASSERT_EQ(std::string("zmove not allowed by format"), reason_of(candidates, actions::zmove(0)));
    TEST_ASSERT_EQ(std::string("dynamax not allowed by format"), reason_of(candidates, actions::dynamax(0)));
}

TEST(LegalActions, TeraOncePerSide) {
    BattleEngine engine;
    Pokemon chomp = garchomp();
    chomp.tera.available = true;
    chomp.tera.type = PokeType::STEEL;
    Pokemon bliss = blissey();
    bliss.tera.available = true;
    bliss.tera.type = PokeType::FAIRY;
    BattleState state = start(engine, {chomp, bliss}, {heatran()});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::tera(0)));

    state.sides[0].tera_used = true;
    candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("tera already used"), reason_of(candidates, actions::tera(0)));
}

TEST(LegalActions, MegaNeedsStoneAndFormat) {
    BattleEngine engine;
    Pokemon chomp = garchomp("garchompite");
    MegaForme forme;
    forme.species = "Garchomp-Mega";
    forme.item = "garchompite";
    forme.stats = Stats{357, 394, 266, 276, 226, 282};
    forme.types = {PokeType::DRAGON, PokeType::GROUND};
    forme.ability = "sandforce";
    chomp.mega_forme = forme;

    BattleState state = start(engine, {chomp}, {heatran()}, "gen9nationaldex");
    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::mega(0)));

    state.sides[0].active->item = "leftovers";
    candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("no mega stone"), reason_of(candidates, actions::mega(0)));
}

TEST(LegalActions, DynamaxInSwordShieldFormat) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()}, "gen8battlestadiumsingles");

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::dynamax(0)));
    TEST_ASSERT_EQ(std::string("tera not allowed by format"), reason_of(candidates, actions::tera(0)));

    state.sides[0].dynamax_used = true;
    candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("dynamax already used"), reason_of(candidates, actions::dynamax(0)));
}

// ============================================================================
// MOVE LOCKS
// ============================================================================

TEST(MoveLocks, ChoiceLockOffersOneMove) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp("choicescarf")}, {heatran()});
    VolatileEffect lock;
    lock.move = "earthquake";
    state.sides[0].active->add_volatile(VolatileKind::CHOICE_LOCK, lock);

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(0)));
    for (int slot = 1; slot < 4; ++slot) {
        TEST_ASSERT_EQ(std::string("choice locked"), reason_of(candidates, actions::move(slot)));
    }

    // Losing the item releases the lock
    state.sides[0].active->item.clear();
    candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(1)));
}

TEST(MoveLocks, ChoiceLockHoldsUntilSwitchOut) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp("choicescarf"), corviknight()}, {heatran()});

    // Tackle locks the scarf holder in
    state = engine.advance(state, actions::move(1), actions::move(1)).state;
    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(1)));
    TEST_ASSERT_EQ(std::string("choice locked"), reason_of(candidates, actions::move(0)));
    TEST_ASSERT_EQ(std::string("choice locked"), reason_of(candidates, actions::move(3)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::switch_to(0)));

    // Still locked a turn later
    state = engine.advance(state, actions::move(1), actions::move(1)).state;
    candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("choice locked"), reason_of(candidates, actions::move(0)));

    // Out and back in: every move is open again
    state = engine.advance(state, actions::switch_to(0), actions::move(1)).state;
    state = engine.advance(state, actions::switch_to(0), actions::move(1)).state;
    TEST_ASSERT_EQ(std::string("Garchomp"), state.sides[0].active->species);
    TEST_ASSERT_FALSE(state.sides[0].active->has_volatile(VolatileKind::CHOICE_LOCK));
    candidates = engine.get_legal_actions(state, 0);
    for (int slot = 0; slot < 4; ++slot) {
        TEST_ASSERT_TRUE(enabled(candidates, actions::move(slot)));
    }
}

TEST(MoveLocks, ChoiceLockEndsWhenLockedMoveRunsOut) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp("choicescarf")}, {heatran()});
    state.sides[0].active->moves[1].pp = 1;

    AdvanceResult r = engine.advance(state, actions::move(1), actions::move(1));
    TEST_ASSERT_TRUE(log_has_detail(r.log, "volatile_end", "Garchomp choice lock"));
    TEST_ASSERT_FALSE(r.state.sides[0].active->has_volatile(VolatileKind::CHOICE_LOCK));

    auto candidates = engine.get_legal_actions(r.state, 0);
    TEST_ASSERT_EQ(std::string("no PP"), reason_of(candidates, actions::move(1)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(0)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(2)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(3)));
    TEST_ASSERT_NULL(find_action(candidates, actions::struggle()));

    // The next move chosen locks the holder in again
    r = engine.advance(r.state, actions::move(3), actions::move(1));
    candidates = engine.get_legal_actions(r.state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(3)));
    TEST_ASSERT_EQ(std::string("choice locked"), reason_of(candidates, actions::move(0)));
}

TEST(MoveLocks, ChoiceLockOnEmptyMoveIsIgnored) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp("choicescarf")}, {heatran()});
    Pokemon& chomp = *state.sides[0].active;
    VolatileEffect lock;
    lock.move = "tackle";
    chomp.add_volatile(VolatileKind::CHOICE_LOCK, lock);
    chomp.moves[1].pp = 0;

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(0)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(2)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(3)));
    TEST_ASSERT_EQ(std::string("no PP"), reason_of(candidates, actions::move(1)));
    TEST_ASSERT_EQ(std::string("other actions available"), reason_of(candidates, actions::pass()));
}

TEST(MoveLocks, TauntBlocksStatusMoves) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});
    state.sides[0].active->add_volatile(VolatileKind::TAUNT, VolatileEffect{3, 0, ""});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(0)));
    TEST_ASSERT_EQ(std::string("taunted"), reason_of(candidates, actions::move(2)));
}

TEST(MoveLocks, EncoreForcesLastMove) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});
    state.sides[0].active->add_volatile(VolatileKind::ENCORE, VolatileEffect{3, 0, "tackle"});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(1)));
    TEST_ASSERT_EQ(std::string("encore"), reason_of(candidates, actions::move(0)));
    TEST_ASSERT_EQ(std::string("encore"), reason_of(candidates, actions::move(3)));
}

TEST(MoveLocks, DisableBlocksOneMove) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});
    state.sides[0].active->add_volatile(VolatileKind::DISABLE, VolatileEffect{4, 0, "earthquake"});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("disabled"), reason_of(candidates, actions::move(0)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(1)));
}

TEST(MoveLocks, AssaultVestBlocksStatusMoves) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp("assaultvest")}, {heatran()});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("assaultvest"), reason_of(candidates, actions::move(2)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::move(0)));
}

TEST(MoveLocks, GravityGroundsAirborneMoves) {
    BattleEngine engine;
    Pokemon chomp = garchomp();
    chomp.moves[3].move.flags.gravity_banned = true;
    BattleState state = start(engine, {chomp}, {heatran()});
    state.sides[1].conditions[SideConditionKind::GRAVITY] = 5;

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("gravity"), reason_of(candidates, actions::move(3)));
}

TEST(MoveLocks, RechargeLocksEverything) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey()}, {heatran()});
    state.sides[0].active->add_volatile(VolatileKind::RECHARGE, VolatileEffect{});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("must recharge"), reason_of(candidates, actions::move(0)));
    TEST_ASSERT_EQ(std::string("must recharge"), reason_of(candidates, actions::switch_to(0)));
    TEST_ASSERT_EQ(1, count_enabled(candidates));
    TEST_ASSERT_TRUE(candidates.back().is_enabled());
}

TEST(MoveLocks, StruggleOnlyWithoutPp) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_NULL(find_action(candidates, actions::struggle()));

    for (auto& slot : state.sides[0].active->moves) slot.pp = 0;
    candidates = engine.get_legal_actions(state, 0);

    for (int slot = 0; slot < 4; ++slot) {
        TEST_ASSERT_EQ(std::string("no PP"), reason_of(candidates, actions::move(slot)));
    }
    TEST_ASSERT_TRUE(enabled(candidates, actions::struggle()));
    TEST_ASSERT_EQ(1, count_enabled(candidates));
}

// ============================================================================
// SWITCHING
// ============================================================================

TEST(Switching, FaintedBenchIsDisabled) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey(), corviknight()}, {heatran()});
    state.sides[0].bench[0].faint();

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("fainted"), reason_of(candidates, actions::switch_to(0)));
    TEST_ASSERT_TRUE(enabled(candidates, actions::switch_to(1)));
}

TEST(Switching, PartialTrapBlocksSwitching) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp(), blissey()}, {heatran()});
    state.sides[0].active->add_volatile(VolatileKind::PARTIAL_TRAP, VolatileEffect{4, 1, ""});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(std::string("trapped"), reason_of(candidates, actions::switch_to(0)));

    // Shed Shell always escapes
    state.sides[0].active->item = "shedshell";
    candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::switch_to(0)));
}

TEST(Switching, GhostsAreNeverTrapped) {
    BattleEngine engine;
    BattleState state = start(engine, {dragapult(), blissey()}, {heatran()});
    state.sides[0].active->add_volatile(VolatileKind::PARTIAL_TRAP, VolatileEffect{4, 1, ""});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_TRUE(enabled(candidates, actions::switch_to(0)));
}

TEST(Switching, ForcedSwitchWindow) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran(), blissey(), corviknight()});
    state.sides[1].active->faint();
    state.sides[1].forced_switch = true;

    auto replacing = engine.get_legal_actions(state, 1);
    TEST_ASSERT_EQ(3u, replacing.size());
    TEST_ASSERT_TRUE(enabled(replacing, actions::switch_to(0)));
    TEST_ASSERT_TRUE(enabled(replacing, actions::switch_to(1)));
    TEST_ASSERT_FALSE(replacing.back().is_enabled());
    TEST_ASSERT_EQ(std::string("must switch"), replacing.back().reason);

    auto waiting = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(1u, waiting.size());
    TEST_ASSERT_TRUE(is_pass(waiting[0].action));
    TEST_ASSERT_TRUE(waiting[0].is_enabled());
}

TEST(Switching, FinishedBattleOnlyPasses) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});
    state.phase = BattlePhase::FINISHED;

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT_EQ(1u, candidates.size());
    TEST_ASSERT_TRUE(is_pass(candidates[0].action));
}

TEST(Switching, NeverEmpty) {
    BattleEngine engine;
    BattleState state = start(engine, {garchomp()}, {heatran()});
    for (auto& slot : state.sides[0].active->moves) slot.pp = 0;
    state.sides[0].active->add_volatile(VolatileKind::RECHARGE, VolatileEffect{});

    auto candidates = engine.get_legal_actions(state, 0);
    TEST_ASSERT(!candidates.empty());
    TEST_ASSERT(count_enabled(candidates) >= 1);
}
