#include <gtest/gtest.h>
#include "odds21/odds_evaluator.hpp"
#include <algorithm>
#include <stdexcept>

using namespace odds21;

// Win probability from a fresh 11-card deck under optimal play
static const double FRESH_DECK_WIN = 0.4661459836459837;

// Distinct non-terminal states reachable from a fresh deck
static const std::size_t FRESH_DECK_STATES = 6884;

class OddsEvaluatorTest : public ::testing::Test {
protected:
    OddsEvaluatorTest() : evaluator(cache) {}

    GameState dealt(const std::vector<CardValue>& values) {
        return make_player_state(CardSet::from_values(values));
    }

    OddsCache cache;
    OddsEvaluator evaluator;
};

TEST_F(OddsEvaluatorTest, FreshDeckGolden) {
    OddsResult result = evaluator.evaluate(GameState());

    EXPECT_DOUBLE_EQ(result.win_probability(), FRESH_DECK_WIN);
    EXPECT_GT(result.win_probability(), 0.0);
    EXPECT_LT(result.win_probability(), 1.0);

    // Standing on 0 always loses: the dealer's first card beats it
    ASSERT_TRUE(result.has_breakdown());
    EXPECT_LT(result.stand_probability(), 0.5);
    EXPECT_EQ(result.stand_probability(), 0.0);
    EXPECT_DOUBLE_EQ(result.hit_probability(), FRESH_DECK_WIN);
}

TEST_F(OddsEvaluatorTest, WarmUpCacheSize) {
    std::size_t cached = evaluator.warm_up();

    EXPECT_EQ(cached, FRESH_DECK_STATES);
    EXPECT_EQ(cache.size(), FRESH_DECK_STATES);
    EXPECT_EQ(evaluator.stats().expansions, FRESH_DECK_STATES);
}

TEST_F(OddsEvaluatorTest, WarmUpTwiceAddsNothing) {
    evaluator.warm_up();
    evaluator.reset_stats();

    EXPECT_EQ(evaluator.warm_up(), FRESH_DECK_STATES);
    EXPECT_EQ(evaluator.stats().expansions, 0u);
    EXPECT_EQ(evaluator.stats().cache_hits, 1u);
}

TEST_F(OddsEvaluatorTest, BlackjackShortCircuits) {
    OddsResult result = evaluator.evaluate(dealt({10, 11}));

    EXPECT_EQ(result.win_probability(), 1.0);
    EXPECT_FALSE(result.has_breakdown());
    EXPECT_EQ(evaluator.stats().expansions, 0u);
    EXPECT_EQ(evaluator.stats().terminal_hits, 1u);
    EXPECT_TRUE(cache.empty());
}

TEST_F(OddsEvaluatorTest, BustShortCircuits) {
    OddsResult result = evaluator.evaluate(dealt({10, 9, 5}));

    EXPECT_EQ(result.win_probability(), 0.0);
    EXPECT_FALSE(result.has_breakdown());
    EXPECT_EQ(evaluator.stats().expansions, 0u);
    EXPECT_TRUE(cache.empty());
}

TEST_F(OddsEvaluatorTest, TerminalIgnoresRemainingAndDealer) {
    GameState at_target(CardSet::full_deck(), 21, TurnPhase::DEALER_TURN, 15);
    GameState bust(CardSet::from_values({1, 2}), 22, TurnPhase::PLAYER_TURN, 0);

    EXPECT_EQ(evaluator.evaluate(at_target).win_probability(), 1.0);
    EXPECT_EQ(evaluator.evaluate(bust).win_probability(), 0.0);
}

TEST_F(OddsEvaluatorTest, SixteenBreakdown) {
    OddsResult result = evaluator.evaluate(dealt({10, 6}));

    ASSERT_TRUE(result.has_breakdown());
    EXPECT_DOUBLE_EQ(result.stand_probability(), 0.30912698412698414);
    EXPECT_DOUBLE_EQ(result.hit_probability(), 0.3829365079365079);
    EXPECT_EQ(result.win_probability(), result.hit_probability());
}

TEST_F(OddsEvaluatorTest, OtherGoldenHands) {
    EXPECT_DOUBLE_EQ(evaluator.evaluate(dealt({5})).win_probability(), 0.40095238095238095);
    EXPECT_DOUBLE_EQ(evaluator.evaluate(dealt({10})).win_probability(), 0.5131216931216931);
    EXPECT_DOUBLE_EQ(evaluator.evaluate(dealt({2, 3})).win_probability(), 0.45079365079365075);
}

TEST_F(OddsEvaluatorTest, MemoizedResultIsIdentical) {
    OddsResult first = evaluator.evaluate(dealt({10, 6}));
    uint64_t expansions = evaluator.stats().expansions;
    EXPECT_GT(expansions, 0u);

    OddsResult second = evaluator.evaluate(dealt({6, 10}));

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.win_probability(), second.win_probability());
    EXPECT_EQ(evaluator.stats().expansions, expansions);
}

TEST_F(OddsEvaluatorTest, ResultIndependentOfCallHistory) {
    OddsResult cold = evaluator.evaluate(dealt({3, 4}));

    OddsCache warm_cache;
    OddsEvaluator warm(warm_cache);
    warm.warm_up();
    OddsResult from_warm = warm.evaluate(dealt({3, 4}));

    EXPECT_EQ(cold, from_warm);
}

TEST_F(OddsEvaluatorTest, AllCachedProbabilitiesInRange) {
    evaluator.warm_up();

    for (const auto& entry : cache) {
        const OddsResult& result = entry.second;
        EXPECT_GE(result.win_probability(), 0.0);
        EXPECT_LE(result.win_probability(), 1.0);
    }
}

TEST_F(OddsEvaluatorTest, OptimalPlayDominance) {
    evaluator.warm_up();

    int decision_points = 0;
    for (const auto& entry : cache) {
        const OddsResult& result = entry.second;
        bool player_turn = entry.first.phase == static_cast<uint8_t>(TurnPhase::PLAYER_TURN);
        EXPECT_EQ(result.has_breakdown(), player_turn);
        if (result.has_breakdown()) {
            EXPECT_EQ(result.win_probability(),
                      std::max(result.stand_probability(), result.hit_probability()));
            ++decision_points;
        }
    }
    EXPECT_GT(decision_points, 0);
}

TEST_F(OddsEvaluatorTest, StandNeverWorseWithHigherScore) {
    // Remaining {1..9} (sum 45) so the dealer never runs out of cards
    CardSet remaining = CardSet::from_values({1, 2, 3, 4, 5, 6, 7, 8, 9});

    double previous = -1.0;
    for (int score = 0; score < BLACKJACK; ++score) {
        GameState state(remaining, score, TurnPhase::PLAYER_TURN, 0);
        double stand = evaluator.evaluate(state).stand_probability();
        EXPECT_GE(stand, previous) << "score " << score;
        previous = stand;
    }

    for (int score = BLACKJACK + 1; score < BLACKJACK + 5; ++score) {
        GameState state(remaining, score, TurnPhase::PLAYER_TURN, 0);
        EXPECT_EQ(evaluator.evaluate(state).win_probability(), 0.0);
    }
}

TEST_F(OddsEvaluatorTest, DealerStateHasNoBreakdown) {
    GameState state(CardSet::from_values({1, 2, 3, 4, 5, 6, 7, 8, 9}), 18,
                    TurnPhase::DEALER_TURN, 0);
    OddsResult result = evaluator.evaluate(state);

    EXPECT_FALSE(result.has_breakdown());
    EXPECT_THROW(result.stand_probability(), std::logic_error);
    EXPECT_GT(result.win_probability(), 0.0);
    EXPECT_LT(result.win_probability(), 1.0);
}

TEST_F(OddsEvaluatorTest, DealerAveragesOverNextCard) {
    // Player 20, dealer 15, cards {1, 6, 7}:
    //   1 -> dealer 16, then {6, 7} both bust -> 1
    //   6 -> dealer 21 beats 20               -> 0
    //   7 -> dealer 22 busts                  -> 1
    GameState state(CardSet::from_values({1, 6, 7}), 20, TurnPhase::DEALER_TURN, 15);

    EXPECT_DOUBLE_EQ(evaluator.evaluate(state).win_probability(), 2.0 / 3.0);
}

TEST_F(OddsEvaluatorTest, RejectsNegativeScore) {
    GameState state(CardSet::full_deck(), -1, TurnPhase::PLAYER_TURN, 0);

    EXPECT_THROW(evaluator.evaluate(state), std::invalid_argument);
}

TEST_F(OddsEvaluatorTest, PlayerWithNoCardsLeftMustStand) {
    GameState state(CardSet(), 5, TurnPhase::PLAYER_TURN, 0);
    OddsResult result = evaluator.evaluate(state);

    // Forced stand, then the dealer has nothing to draw
    EXPECT_EQ(result.win_probability(), 1.0);
    EXPECT_FALSE(result.has_breakdown());
}

TEST(OddsEvaluatorRulesTest, TwoCardDeckByHand) {
    // Deck {1, 2}, target 2:
    //   stand on 0: dealer draws and passes 0 without busting -> 0
    //   hit 1 -> score 1, {2} left: stand loses to 2, hit busts -> 0
    //   hit 2 -> score 2 == target                             -> 1
    OddsCache cache(GameRules(2, CardSet::from_values({1, 2})));
    OddsEvaluator evaluator(cache);

    OddsResult result = evaluator.evaluate(GameState(cache.rules().deck, 0,
                                                     TurnPhase::PLAYER_TURN, 0));

    EXPECT_EQ(result.stand_probability(), 0.0);
    EXPECT_EQ(result.hit_probability(), 0.5);
    EXPECT_EQ(result.win_probability(), 0.5);
    EXPECT_EQ(cache.size(), 4u);
}

TEST(OddsEvaluatorRulesTest, DealerExhaustionOnSmallDeck) {
    OddsCache cache(GameRules(4, CardSet::from_values({1, 2, 3})));
    OddsEvaluator evaluator(cache);

    EXPECT_EQ(evaluator.warm_up(), 13u);
    OddsResult result = evaluator.evaluate(GameState(cache.rules().deck, 0,
                                                     TurnPhase::PLAYER_TURN, 0));
    EXPECT_DOUBLE_EQ(result.win_probability(), 5.0 / 6.0);

    // Player 3 with {3} left: dealer draws 3, ties, and has nothing more to draw
    GameState tied(CardSet::from_values({3}), 3, TurnPhase::DEALER_TURN, 0);
    EXPECT_EQ(evaluator.evaluate(tied).win_probability(), 1.0);
}

TEST(OddsEvaluatorRulesTest, PlayerExhaustsSmallDeck) {
    // Deck {1, 2}, target 10: drawing both cards leaves score 3 with nothing
    // to draw, so the player stands and the dealer cannot move
    OddsCache cache(GameRules(10, CardSet::from_values({1, 2})));
    OddsEvaluator evaluator(cache);

    EXPECT_EQ(evaluator.warm_up(), 7u);

    GameState exhausted = make_player_state(CardSet::from_values({1, 2}), cache.rules());
    OddsResult result = evaluator.evaluate(exhausted);
    EXPECT_EQ(result.win_probability(), 1.0);
    EXPECT_FALSE(result.has_breakdown());

    //   stand on 0 -> both dealer draws beat 0           -> 0
    //   hit 1 -> hit again reaches the exhausted state    -> 1
    //   hit 2 -> stand, dealer draws 1 and runs out       -> 1
    OddsResult root = evaluator.evaluate(GameState(cache.rules().deck, 0,
                                                   TurnPhase::PLAYER_TURN, 0));
    EXPECT_EQ(root.stand_probability(), 0.0);
    EXPECT_EQ(root.hit_probability(), 1.0);
}

TEST(OddsEvaluatorRulesTest, RejectsCardsOutsideRuleDeck) {
    OddsCache cache(GameRules(4, CardSet::from_values({1, 2, 3})));
    OddsEvaluator evaluator(cache);

    EXPECT_THROW(evaluator.evaluate(GameState()), std::invalid_argument);
}

TEST(OddsEvaluatorRulesTest, SeparateCachesDoNotMix) {
    OddsCache standard_cache;
    OddsCache small_cache(GameRules(4, CardSet::from_values({1, 2, 3})));
    OddsEvaluator standard(standard_cache);
    OddsEvaluator small(small_cache);

    small.warm_up();
    standard.warm_up();

    EXPECT_EQ(small_cache.size(), 13u);
    EXPECT_EQ(standard_cache.size(), FRESH_DECK_STATES);
    EXPECT_DOUBLE_EQ(standard.evaluate(GameState()).win_probability(), FRESH_DECK_WIN);
}

TEST(OddsEvaluatorRulesTest, EvaluatorsShareCache) {
    OddsCache cache;
    OddsEvaluator first(cache);
    OddsEvaluator second(cache);

    first.warm_up();
    OddsResult result = second.evaluate(GameState());

    EXPECT_DOUBLE_EQ(result.win_probability(), FRESH_DECK_WIN);
    EXPECT_EQ(second.stats().expansions, 0u);
    EXPECT_EQ(second.stats().cache_hits, 1u);
}
