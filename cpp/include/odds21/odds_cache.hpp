/**
 * @file odds_cache.hpp
 * @brief Odds results and the insert-only memoization cache.
 *
 * The cache maps a canonical StateKey to the OddsResult computed for that state.
 *
 * Lifecycle:
 *   - Empty at construction
 *   - Grows monotonically as the evaluator expands new states
 *   - No eviction, no expiry, no overwrite: a stored result never changes
 *   - Dropped with its owner (a new session builds a new cache)
 *
 * The cache is bound to the GameRules it was built with. An evaluator reads its rules
 * from the cache, so results computed under one rule set cannot leak into another.
 *
 * Thread Safety: Not thread-safe. Use one cache per thread.
 */

#pragma once

#include "game_state.hpp"
#include "rules.hpp"
#include <cstddef>
#include <unordered_map>

namespace odds21 {

/**
 * @brief Immutable win probability for one state.
 *
 * Every result carries the win probability under optimal play. Results for a player
 * decision point (PLAYER_TURN, not terminal) additionally carry the stand and hit
 * probabilities; for leaves and dealer states the breakdown does not exist.
 */
class OddsResult {
public:
    /** @brief Default constructor: leaf with win probability 0 */
    OddsResult() : win_(0.0), stand_(0.0), hit_(0.0), has_breakdown_(false) {}

    /**
     * @brief Result without a hit/stand breakdown (terminal or dealer state).
     * @param win_probability Win probability in [0, 1]
     */
    static OddsResult leaf(double win_probability);

    /**
     * @brief Result for a player decision point.
     * @param stand_probability Win probability when standing now
     * @param hit_probability Win probability when hitting now (then playing optimally)
     * @return Result with win probability max(stand, hit)
     */
    static OddsResult decision(double stand_probability, double hit_probability);

    /** @brief Win probability under optimal play */
    double win_probability() const { return win_; }

    /** @brief True if stand/hit probabilities are available */
    bool has_breakdown() const { return has_breakdown_; }

    /**
     * @brief Win probability when standing now.
     * @throws std::logic_error if !has_breakdown()
     */
    double stand_probability() const;

    /**
     * @brief Win probability when hitting now.
     * @throws std::logic_error if !has_breakdown()
     */
    double hit_probability() const;

    bool operator==(const OddsResult& other) const {
        return win_ == other.win_ && stand_ == other.stand_ &&
               hit_ == other.hit_ && has_breakdown_ == other.has_breakdown_;
    }
    bool operator!=(const OddsResult& other) const { return !(*this == other); }

private:
    double win_;          ///< Win probability under optimal play
    double stand_;        ///< Stand probability (decision points only)
    double hit_;          ///< Hit probability (decision points only)
    bool has_breakdown_;  ///< True for decision points
};

/**
 * @brief Insert-only map from canonical state key to OddsResult.
 *
 * Usage:
 * @code
 *   OddsCache cache;                     // standard rules
 *   OddsEvaluator evaluator(cache);
 *   evaluator.warm_up();
 *   std::size_t n = cache.size();        // 6884 for the standard rules
 * @endcode
 */
class OddsCache {
public:
    using Map = std::unordered_map<StateKey, OddsResult, StateKeyHash>;
    using const_iterator = Map::const_iterator;

    /**
     * @brief Construct an empty cache for a rule set.
     * @param rules Rules every stored result was computed under
     * @throws std::invalid_argument if rules are malformed
     */
    OddsCache(const GameRules& rules = GameRules());

    /** @brief Rules this cache belongs to */
    const GameRules& rules() const { return rules_; }

    /**
     * @brief Look up a stored result.
     * @param key Canonical state key
     * @return Pointer to the stored result, or nullptr on a miss
     *
     * The pointer stays valid until the cache is destroyed (unordered_map
     * references are stable across inserts).
     */
    const OddsResult* find(const StateKey& key) const;

    /**
     * @brief Store a result for a key that is not cached yet.
     * @param key Canonical state key
     * @param result Result computed for that key
     * @return True if inserted, false if the key was already present (entry kept)
     */
    bool insert(const StateKey& key, const OddsResult& result);

    /** @brief Check whether a key is cached */
    bool contains(const StateKey& key) const { return entries_.count(key) != 0; }

    /** @brief Number of cached states */
    std::size_t size() const { return entries_.size(); }

    /** @brief True if nothing is cached yet */
    bool empty() const { return entries_.empty(); }

    /** @brief Read-only iteration over (key, result) pairs, in no particular order */
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    GameRules rules_;  ///< Rules the entries were computed under
    Map entries_;      ///< Stored results
};

} // namespace odds21
