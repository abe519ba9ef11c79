/**
 * @file odds_evaluator.hpp
 * @brief Memoized expectimax search for the player's win probability.
 *
 * The evaluator walks the game tree below a state:
 *   - Terminal states return their fixed outcome (0 or 1) and are never cached
 *   - DEALER_TURN: mean of the children's win probabilities over every remaining card
 *     (each card is equally likely to be drawn next)
 *   - PLAYER_TURN: stand = win probability of the stand child,
 *                  hit   = mean of the hit children's win probabilities,
 *                  win   = max(stand, hit)
 *
 * Children are averaged in ascending card order, so a state always produces the
 * same bits regardless of what was evaluated before it.
 *
 * The reachable space from the full deck is small (6884 non-terminal states for the
 * standard rules), and warm_up() walks all of it once at start-up.
 *
 * Thread Safety: Not thread-safe. The evaluator mutates its cache and statistics.
 */

#pragma once

#include "game_state.hpp"
#include "odds_cache.hpp"
#include <cstddef>
#include <cstdint>

namespace odds21 {

/**
 * @brief Counters describing the work an evaluator has done.
 */
struct EvaluatorStats {
    uint64_t expansions;     ///< Cache misses that recursed into children
    uint64_t cache_hits;     ///< Lookups answered from the cache
    uint64_t terminal_hits;  ///< States resolved by a terminal rule

    /** @brief Default constructor: all counters zero */
    EvaluatorStats() : expansions(0), cache_hits(0), terminal_hits(0) {}
};

/**
 * @brief Computes OddsResult values for game states, memoized in an OddsCache.
 *
 * The cache is owned by the caller and must outlive the evaluator. Several
 * evaluators may share one cache; they then share its rules and its entries.
 *
 * Usage:
 * @code
 *   OddsCache cache;
 *   OddsEvaluator evaluator(cache);
 *   evaluator.warm_up();
 *   OddsResult r = evaluator.evaluate(GameState());  // full deck, player to act
 *   double p = r.win_probability();
 * @endcode
 */
class OddsEvaluator {
public:
    /**
     * @brief Construct an evaluator over an existing cache.
     * @param cache Memoization cache (rules are taken from it)
     */
    OddsEvaluator(OddsCache& cache);

    /**
     * @brief Compute the odds for a state.
     * @param state Well-formed state for the cache's rules
     * @return Win probability, plus stand/hit breakdown at a decision point
     * @throws std::invalid_argument on a negative score
     * @throws std::logic_error (debug builds) on a search deeper than the deck allows
     *
     * A non-terminal player state with no card left has no decision: the
     * player must stand, and the result carries no breakdown.
     *
     * Repeated calls with the same state return identical results; after the
     * first call they are answered from the cache without new expansions.
     */
    OddsResult evaluate(const GameState& state);

    /**
     * @brief Evaluate the starting state of the full deck to fill the cache.
     * @return Number of cached states afterwards
     */
    std::size_t warm_up();

    /** @brief Rules in use (those of the cache) */
    const GameRules& rules() const { return cache_.rules(); }

    /** @brief Read-only view of the cache (for diagnostics/testing) */
    const OddsCache& cache() const { return cache_; }

    /** @brief Work counters since construction or the last reset_stats() */
    const EvaluatorStats& stats() const { return stats_; }

    /** @brief Zero the work counters (the cache is kept) */
    void reset_stats() { stats_ = EvaluatorStats(); }

private:
    /**
     * @brief Recursive step behind evaluate().
     * @param state State to evaluate
     * @param depth Number of transitions from the top-level call
     */
    OddsResult evaluate_node(const GameState& state, int depth);

    /**
     * @brief Mean win probability over every card that can be drawn next.
     * @param state Non-terminal state with at least one remaining card
     * @param depth Depth of state
     */
    double mean_over_draws(const GameState& state, int depth);

    OddsCache& cache_;     ///< Memoization cache (not owned)
    EvaluatorStats stats_; ///< Work counters
};

} // namespace odds21
