/**
 * @file rules.cpp
 * @brief Validation of configurable rule sets.
 */

#include "../include/odds21/rules.hpp"
#include <stdexcept>
#include <string>

namespace odds21 {

void validate_rules(const GameRules& rules) {
    if (rules.target_score <= 0) {
        throw std::invalid_argument("Target score must be positive (got " +
                                    std::to_string(rules.target_score) + ")");
    }
    if (rules.deck.empty()) {
        throw std::invalid_argument("Rule set deck must hold at least one card");
    }
}

} // namespace odds21
