/**
 * @file advisor.cpp
 * @brief Implementation of the top-level odds interface.
 *
 * get_odds() builds the PLAYER_TURN state for the dealt cards:
 *   - remaining = rule set deck minus dealt cards
 *   - player score = sum of dealt cards
 *   - dealer score = 0
 * and evaluates it. Display metrics are thin compositions of that one evaluation;
 * no rounding happens here.
 */

#include "../include/odds21/advisor.hpp"
#include <stdexcept>

namespace odds21 {

const char* recommendation_name(Recommendation rec) {
    switch (rec) {
        case Recommendation::NONE: return "None";
        case Recommendation::STAND: return "Stand";
        case Recommendation::HIT: return "Hit";
    }
    return "?";
}

Advisor::Advisor(const GameRules& rules) : cache_(rules), evaluator_(cache_) {}

std::size_t Advisor::warm_up() {
    return evaluator_.warm_up();
}

DealtValidationResult Advisor::validate_dealt(const std::vector<CardValue>& dealt) const {
    CardSet seen;
    for (CardValue v : dealt) {
        if (!is_valid_card_value(v)) {
            return DealtValidationResult(false, "Card value out of range: " + std::to_string(v));
        }
        if (seen.contains(v)) {
            return DealtValidationResult(false, "Duplicate card value: " + std::to_string(v));
        }
        if (!rules().deck.contains(v)) {
            return DealtValidationResult(false, "Card value not in deck: " + std::to_string(v));
        }
        seen = seen.with(v);
    }
    return DealtValidationResult(true, "");
}

OddsSummary Advisor::get_odds(const std::vector<CardValue>& dealt) {
    auto validation = validate_dealt(dealt);
    if (!validation.valid) {
        throw std::invalid_argument(validation.error_message);
    }

    GameState state = make_player_state(CardSet::from_values(dealt), rules());
    OddsResult result = evaluator_.evaluate(state);

    OddsSummary summary;
    summary.win_probability = result.win_probability();
    summary.player_score = state.player_score;
    summary.cards_remaining = state.remaining.size();
    summary.is_decision_point = result.has_breakdown();

    if (summary.is_decision_point) {
        summary.stand_probability = result.stand_probability();
        summary.hit_probability = result.hit_probability();
        summary.bust_on_hit_probability = bust_on_hit(state);
    }

    return summary;
}

Recommendation Advisor::recommend(const OddsSummary& summary) {
    if (!summary.is_decision_point) {
        return Recommendation::NONE;
    }
    // Ties go to standing
    if (summary.stand_probability >= summary.hit_probability) {
        return Recommendation::STAND;
    }
    return Recommendation::HIT;
}

double Advisor::bust_on_hit(const GameState& state) const {
    std::vector<CardValue> values = state.remaining.values();
    if (values.empty()) {
        return 0.0;
    }

    int busting = 0;
    for (CardValue v : values) {
        if (state.player_score + v > rules().target_score) busting++;
    }
    return static_cast<double>(busting) / static_cast<double>(values.size());
}

} // namespace odds21
