/**
 * @file advisor.hpp
 * @brief Top-level odds interface for UI callers and Python bindings.
 *
 * Provides the one operation a front end needs: given the card values dealt to the
 * player so far, return the win probability under optimal play together with the
 * per-action breakdown and a hit/stand recommendation.
 *
 * Key Features:
 *   - Owns its cache and evaluator (one Advisor per session)
 *   - Start-up warm-up walks the whole game tree once
 *   - Validation with human-readable messages, mirrored by exceptions in get_odds()
 *   - Explicit tie-break: stand when standing and hitting are equally good
 *
 * Usage from Python (via pybind11):
 * @code
 *   advisor = _odds21_core.Advisor()
 *   advisor.warm_up()
 *   odds = advisor.get_odds([10, 6])
 *   print(odds.win_probability, odds.stand_probability, odds.hit_probability)
 *   print(advisor.recommend(odds))   # Recommendation.HIT
 * @endcode
 */

#pragma once

#include "odds_evaluator.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace odds21 {

/**
 * @brief Odds for the player's current hand, ready for display.
 *
 * Per-action fields are only meaningful when is_decision_point is true (the player
 * has neither hit 21 nor busted); otherwise they are 0.
 */
struct OddsSummary {
    double win_probability;          ///< Win probability under optimal play
    bool is_decision_point;          ///< True if the player still has a choice
    double stand_probability;        ///< Win probability when standing now
    double hit_probability;          ///< Win probability when hitting now
    double bust_on_hit_probability;  ///< Chance the next card takes the score past the target
    int player_score;                ///< Sum of the dealt cards
    int cards_remaining;             ///< Cards left in the deck

    /** @brief Default constructor: no decision, all zero */
    OddsSummary()
        : win_probability(0.0), is_decision_point(false), stand_probability(0.0),
          hit_probability(0.0), bust_on_hit_probability(0.0), player_score(0),
          cards_remaining(0) {}
};

/** @brief Suggested action for a summary. */
enum class Recommendation {
    NONE = 0,   ///< No decision to make (21 or bust)
    STAND = 1,  ///< Standing is at least as good as hitting
    HIT = 2     ///< Hitting is strictly better
};

/**
 * @brief Get human-readable name for a recommendation.
 * @return "None", "Stand" or "Hit"
 */
const char* recommendation_name(Recommendation rec);

/**
 * @brief Result of checking a dealt-card list with a human-readable error.
 */
struct DealtValidationResult {
    bool valid;                 ///< True if the list is a legal deal
    std::string error_message;  ///< Error description if invalid, empty if valid

    /** @brief Default constructor: valid */
    DealtValidationResult() : valid(true), error_message("") {}

    /**
     * @brief Construct validation result.
     * @param v Whether the deal is valid
     * @param msg Error message (should be empty if v is true)
     */
    DealtValidationResult(bool v, const std::string& msg) : valid(v), error_message(msg) {}
};

/**
 * @brief Session object answering odds queries for dealt cards.
 *
 * Owns one OddsCache and one OddsEvaluator. Call warm_up() once at start-up, then
 * get_odds() on every change to the dealt cards.
 *
 * Thread Safety: Not thread-safe. Create separate instances per thread.
 */
class Advisor {
public:
    /**
     * @brief Construct an advisor for a rule set (cache starts empty).
     * @param rules Game rules (standard 21 by default)
     * @throws std::invalid_argument if rules are malformed
     */
    Advisor(const GameRules& rules = GameRules());

    // evaluator_ refers to cache_, so a copy would point into the original
    Advisor(const Advisor&) = delete;
    Advisor& operator=(const Advisor&) = delete;

    /**
     * @brief Fill the cache for the full initial deck.
     * @return Number of cached states (6884 for the standard rules)
     *
     * Blocking; finishes well under a second for the standard rules.
     */
    std::size_t warm_up();

    /**
     * @brief Check a dealt-card list without throwing.
     * @param dealt Card values dealt to the player
     * @return DealtValidationResult with valid flag and error message
     *
     * Errors: "Card value out of range: 12", "Duplicate card value: 5",
     * "Card value not in deck: 11" (custom rules only).
     */
    DealtValidationResult validate_dealt(const std::vector<CardValue>& dealt) const;

    /**
     * @brief Compute odds for the player's dealt cards.
     * @param dealt Distinct card values dealt to the player
     * @return OddsSummary for the PLAYER_TURN state those cards define
     * @throws std::invalid_argument with the validate_dealt() message on bad input
     */
    OddsSummary get_odds(const std::vector<CardValue>& dealt);

    /**
     * @brief Pick hit or stand for a summary.
     * @param summary Result of get_odds()
     * @return STAND if stand >= hit, HIT if hit > stand, NONE without a decision
     */
    static Recommendation recommend(const OddsSummary& summary);

    /**
     * @brief Odds for an arbitrary state under this advisor's rules.
     * @see OddsEvaluator::evaluate()
     */
    OddsResult evaluate(const GameState& state) { return evaluator_.evaluate(state); }

    /** @brief Rules in use */
    const GameRules& rules() const { return cache_.rules(); }

    /** @brief Read-only view of the evaluator (statistics, cache size) */
    const OddsEvaluator& evaluator() const { return evaluator_; }

private:
    /**
     * @brief Fraction of remaining cards that bust the player on a hit.
     * @param state PLAYER_TURN state
     */
    double bust_on_hit(const GameState& state) const;

    OddsCache cache_;          ///< Memoized results (declared before evaluator_)
    OddsEvaluator evaluator_;  ///< Search over cache_
};

} // namespace odds21
