/**
 * @file game_state.hpp
 * @brief Game state model: phases, canonical keys, terminal rules and child states.
 *
 * A game state is the tuple (remaining cards, player score, turn phase, dealer score).
 * The player acts first (PLAYER_TURN) and may hit any number of times; standing hands
 * control to the dealer (DEALER_TURN), who draws mechanically until a terminal
 * condition fires. There is no way back from DEALER_TURN to PLAYER_TURN.
 *
 * Terminal rules, checked in this order (the first match decides):
 *   | # | Condition                                   | Win probability |
 *   |---|---------------------------------------------|-----------------|
 *   | 1 | player score == target                      | 1               |
 *   | 2 | player score >  target                      | 0               |
 *   | 3 | dealer score >  target                      | 1               |
 *   | 4 | DEALER_TURN and dealer score > player score | 0               |
 *   | 5 | DEALER_TURN and no card left to draw        | 1               |
 *
 * Rule 5 never fires with the standard deck and target; it keeps small custom rule
 * sets total.
 *
 * Standing always starts the dealer's count at 0.
 */

#pragma once

#include "card.hpp"
#include "rules.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace odds21 {

/** @brief Which side is acting. */
enum class TurnPhase {
    PLAYER_TURN = 0,  ///< Player has not stood yet
    DEALER_TURN = 1   ///< Player stood; dealer draws mechanically
};

/**
 * @brief Get human-readable name for a phase.
 * @param phase TurnPhase value
 * @return "PlayerTurn" or "DealerTurn"
 */
const char* turn_phase_name(TurnPhase phase);

/**
 * @brief Complete state of one game instance.
 *
 * Scores are sums of the values dealt to each side. The remaining set, the player
 * score and the dealer score are expected to come from one valid deal of the
 * rule set's deck; check_state() only enforces the cheap structural part of that.
 */
struct GameState {
    CardSet remaining;    ///< Cards not yet drawn
    int player_score;     ///< Sum of the player's cards
    TurnPhase phase;      ///< Whose turn it is
    int dealer_score;     ///< Sum of the dealer's cards (0 until the dealer draws)

    /** @brief Default constructor: full deck, nothing dealt, player to act */
    GameState()
        : remaining(CardSet::full_deck()), player_score(0),
          phase(TurnPhase::PLAYER_TURN), dealer_score(0) {}

    /**
     * @brief Construct a state from its parts.
     * @param cards Remaining cards
     * @param player Player score
     * @param turn Turn phase
     * @param dealer Dealer score
     */
    GameState(const CardSet& cards, int player, TurnPhase turn, int dealer)
        : remaining(cards), player_score(player), phase(turn), dealer_score(dealer) {}

    /** @brief Render as "<PlayerTurn player=16 dealer=0 remaining={1,2}>" */
    std::string to_string() const;
};

/**
 * @brief Build the PLAYER_TURN state for a set of dealt cards.
 * @param dealt Cards already dealt to the player
 * @param rules Rule set providing the initial deck
 * @return State with remaining = deck minus dealt, player score = sum(dealt)
 * @throws std::invalid_argument if a dealt card is not in the rule set's deck
 */
GameState make_player_state(const CardSet& dealt, const GameRules& rules = GameRules());

/**
 * @brief Reject structurally malformed states.
 * @throws std::invalid_argument on a negative score
 */
void check_state(const GameState& state);

/**
 * @brief Canonical memoization key for a game state.
 *
 * Plain fields compared and hashed directly. Only make_state_key() builds one, so
 * every key is canonical.
 */
struct StateKey {
    uint16_t remaining_mask;  ///< CardSet::mask() of the remaining cards
    uint8_t player_score;     ///< Player score (fits: deck total is 66)
    uint8_t phase;            ///< TurnPhase as integer
    uint8_t dealer_score;     ///< Dealer score

    bool operator==(const StateKey& other) const {
        return remaining_mask == other.remaining_mask &&
               player_score == other.player_score &&
               phase == other.phase &&
               dealer_score == other.dealer_score;
    }
    bool operator!=(const StateKey& other) const { return !(*this == other); }

    /** @brief Pack all fields into one 64-bit integer (unique per key) */
    uint64_t packed() const {
        return static_cast<uint64_t>(remaining_mask) |
               (static_cast<uint64_t>(player_score) << 16) |
               (static_cast<uint64_t>(phase) << 24) |
               (static_cast<uint64_t>(dealer_score) << 32);
    }
};

/** @brief Hash functor for StateKey (for std::unordered_map) */
struct StateKeyHash {
    std::size_t operator()(const StateKey& key) const {
        return std::hash<uint64_t>()(key.packed());
    }
};

/**
 * @brief Build the canonical key for a state.
 * @param state State to encode (scores must fit in 0-255)
 * @return Key equal for exactly the states with identical fields
 * @throws std::invalid_argument if a score does not fit the key
 */
StateKey make_state_key(const GameState& state);

/**
 * @brief Result of checking a state against the terminal rules.
 */
struct TerminalCheck {
    bool terminal;           ///< True if a terminal rule fired
    double win_probability;  ///< 0 or 1 (only valid when terminal)

    /** @brief Default constructor: non-terminal */
    TerminalCheck() : terminal(false), win_probability(0.0) {}

    /**
     * @brief Construct a terminal outcome.
     * @param win Fixed win probability of the terminal state
     */
    explicit TerminalCheck(double win) : terminal(true), win_probability(win) {}
};

/**
 * @brief Classify a state against the terminal rules (see file header for order).
 * @param state State to inspect
 * @param target_score Winning score for the rule set
 * @return TerminalCheck with the fixed outcome if a rule fired
 */
TerminalCheck check_terminal(const GameState& state, int target_score = BLACKJACK);

/**
 * @brief Child state after the player stands.
 * @param state PLAYER_TURN state
 * @return DEALER_TURN state, same cards and player score, dealer score 0
 */
GameState stand_child(const GameState& state);

/**
 * @brief Child state after drawing one card.
 * @param state Any non-terminal state
 * @param value Card drawn (must be in state.remaining)
 * @return Same phase, card removed, value added to the acting side's score
 */
GameState draw_child(const GameState& state, CardValue value);

/**
 * @brief All children reachable by one draw, in ascending card order.
 * @param state Any non-terminal state
 * @return One child per remaining card
 */
std::vector<GameState> draw_children(const GameState& state);

} // namespace odds21
