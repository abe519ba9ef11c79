/**
 * @file game_state.cpp
 * @brief Implementation of terminal recognition, key building and child derivation.
 *
 * Child derivation:
 *   - Stand: PLAYER_TURN -> DEALER_TURN, dealer score reset to 0
 *   - Draw:  remove one card, add it to the acting side's score
 *
 * Draw children are produced in ascending card order; the evaluator averages them in
 * that order so results are bit-for-bit reproducible.
 */

#include "../include/odds21/game_state.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

namespace odds21 {

const char* turn_phase_name(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::PLAYER_TURN: return "PlayerTurn";
        case TurnPhase::DEALER_TURN: return "DealerTurn";
    }
    return "?";
}

std::string GameState::to_string() const {
    std::ostringstream oss;
    oss << "<" << turn_phase_name(phase)
        << " player=" << player_score
        << " dealer=" << dealer_score
        << " remaining=" << remaining.to_string() << ">";
    return oss.str();
}

GameState make_player_state(const CardSet& dealt, const GameRules& rules) {
    for (CardValue v : dealt.values()) {
        if (!rules.deck.contains(v)) {
            throw std::invalid_argument("Card value not in deck: " + std::to_string(v));
        }
    }
    // Dealt cards are a subset of the deck, so masking them out is exact
    CardSet remaining = CardSet::from_mask(
        static_cast<uint16_t>(rules.deck.mask() & ~dealt.mask()));
    return GameState(remaining, dealt.sum(), TurnPhase::PLAYER_TURN, 0);
}

void check_state(const GameState& state) {
    if (state.player_score < 0) {
        throw std::invalid_argument("Negative player score: " +
                                    std::to_string(state.player_score));
    }
    if (state.dealer_score < 0) {
        throw std::invalid_argument("Negative dealer score: " +
                                    std::to_string(state.dealer_score));
    }
}

StateKey make_state_key(const GameState& state) {
    const int max_score = std::numeric_limits<uint8_t>::max();
    if (state.player_score < 0 || state.player_score > max_score ||
        state.dealer_score < 0 || state.dealer_score > max_score) {
        throw std::invalid_argument("Score out of key range: " + state.to_string());
    }

    StateKey key;
    key.remaining_mask = state.remaining.mask();
    key.player_score = static_cast<uint8_t>(state.player_score);
    key.phase = static_cast<uint8_t>(state.phase);
    key.dealer_score = static_cast<uint8_t>(state.dealer_score);
    return key;
}

TerminalCheck check_terminal(const GameState& state, int target_score) {
    if (state.player_score == target_score) {
        return TerminalCheck(1.0);
    }
    if (state.player_score > target_score) {
        return TerminalCheck(0.0);
    }
    if (state.dealer_score > target_score) {
        return TerminalCheck(1.0);
    }
    if (state.phase == TurnPhase::DEALER_TURN) {
        if (state.dealer_score > state.player_score) {
            return TerminalCheck(0.0);
        }
        // Dealer ran out of cards without passing the player
        if (state.remaining.empty()) {
            return TerminalCheck(1.0);
        }
    }
    return TerminalCheck();
}

GameState stand_child(const GameState& state) {
    return GameState(state.remaining, state.player_score, TurnPhase::DEALER_TURN, 0);
}

GameState draw_child(const GameState& state, CardValue value) {
    GameState child = state;
    child.remaining = state.remaining.without(value);
    if (state.phase == TurnPhase::PLAYER_TURN) {
        child.player_score += value;
    } else {
        child.dealer_score += value;
    }
    return child;
}

std::vector<GameState> draw_children(const GameState& state) {
    std::vector<GameState> children;
    children.reserve(NUM_CARD_VALUES);
    for (CardValue v : state.remaining.values()) {
        children.push_back(draw_child(state, v));
    }
    return children;
}

} // namespace odds21
