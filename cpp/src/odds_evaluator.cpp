/**
 * @file odds_evaluator.cpp
 * @brief Implementation of the memoized expectimax search.
 *
 * Evaluation order for one state:
 *   1. Terminal rules (never cached)
 *   2. Cache lookup by canonical key
 *   3. Expansion: average over draws, plus the stand child for PLAYER_TURN
 *   4. Store, then return
 *
 * Depth bound: every transition either draws a card or stands, and standing happens
 * at most once, so no path is longer than deck size + 1. Debug builds check
 * deck size + 2 to catch a cycle introduced by a rule change.
 */

#include "../include/odds21/odds_evaluator.hpp"
#include <stdexcept>

namespace odds21 {

OddsEvaluator::OddsEvaluator(OddsCache& cache) : cache_(cache) {}

OddsResult OddsEvaluator::evaluate(const GameState& state) {
    check_state(state);
    if ((state.remaining.mask() & ~rules().deck.mask()) != 0) {
        throw std::invalid_argument("Remaining cards " + state.remaining.to_string() +
                                    " are not part of the deck " +
                                    rules().deck.to_string());
    }
    return evaluate_node(state, 0);
}

std::size_t OddsEvaluator::warm_up() {
    evaluate(GameState(rules().deck, 0, TurnPhase::PLAYER_TURN, 0));
    return cache_.size();
}

OddsResult OddsEvaluator::evaluate_node(const GameState& state, int depth) {
#ifndef NDEBUG
    if (depth > rules().deck.size() + 2) {
        throw std::logic_error("Search depth " + std::to_string(depth) +
                               " exceeds the deck bound at " + state.to_string());
    }
#endif

    TerminalCheck terminal = check_terminal(state, rules().target_score);
    if (terminal.terminal) {
        stats_.terminal_hits++;
        return OddsResult::leaf(terminal.win_probability);
    }

    StateKey key = make_state_key(state);
    if (const OddsResult* cached = cache_.find(key)) {
        stats_.cache_hits++;
        return *cached;
    }

    stats_.expansions++;

    OddsResult result;
    if (state.phase == TurnPhase::DEALER_TURN) {
        // Dealer has no choice: expectation over the next card
        result = OddsResult::leaf(mean_over_draws(state, depth));
    } else if (state.remaining.empty()) {
        // Nothing to draw: standing is forced, so there is no decision
        result = OddsResult::leaf(evaluate_node(stand_child(state), depth + 1).win_probability());
    } else {
        double stand = evaluate_node(stand_child(state), depth + 1).win_probability();
        double hit = mean_over_draws(state, depth);
        result = OddsResult::decision(stand, hit);
    }

    cache_.insert(key, result);
    return result;
}

double OddsEvaluator::mean_over_draws(const GameState& state, int depth) {
    std::vector<GameState> children = draw_children(state);

    double total = 0.0;
    for (const GameState& child : children) {
        total += evaluate_node(child, depth + 1).win_probability();
    }
    return total / static_cast<double>(children.size());
}

} // namespace odds21
