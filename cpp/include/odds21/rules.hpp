/**
 * @file rules.hpp
 * @brief Rule set configuration for an odds evaluator.
 *
 * The standard game uses the full 11-card deck and a target of 21. Other rule sets
 * (a smaller deck, a lower target) let independent evaluator instances run side by
 * side, and let tests check game trees small enough to work out by hand.
 */

#pragma once

#include "card.hpp"

namespace odds21 {

/**
 * @brief Fixed rules for one evaluator and its cache.
 *
 * Defaults reproduce the standard game.
 */
struct GameRules {
    int target_score;   ///< Exact score that wins; above it is a bust (default 21)
    CardSet deck;       ///< Initial deck before any card is dealt (default 1-11)

    /** @brief Default constructor: standard 21 rules with the full deck */
    GameRules() : target_score(BLACKJACK), deck(CardSet::full_deck()) {}

    /**
     * @brief Construct custom rules.
     * @param target Target score (must be positive)
     * @param initial_deck Non-empty initial deck
     */
    GameRules(int target, const CardSet& initial_deck)
        : target_score(target), deck(initial_deck) {}

    bool operator==(const GameRules& other) const {
        return target_score == other.target_score && deck == other.deck;
    }
    bool operator!=(const GameRules& other) const { return !(*this == other); }
};

/**
 * @brief Reject malformed rules.
 * @param rules Rules to check
 * @throws std::invalid_argument if the deck is empty or the target is not positive
 */
void validate_rules(const GameRules& rules);

} // namespace odds21
