/**
 * @file card.cpp
 * @brief Implementation of the CardSet bit-mask helpers.
 *
 * Provides:
 *   - Checked construction from masks and value lists
 *   - Add/remove operations returning new sets
 *   - Size, sum and ascending value listing
 *   - Debug rendering ("{1,2,3}")
 *
 * Contract violations (out-of-range or duplicate values) throw std::invalid_argument.
 */

#include "../include/odds21/card.hpp"
#include <sstream>
#include <stdexcept>

namespace odds21 {

CardSet CardSet::from_mask(uint16_t mask) {
    if ((mask & ~FULL_DECK_MASK) != 0) {
        std::ostringstream oss;
        oss << "Card mask has bits outside the deck: 0x" << std::hex << mask;
        throw std::invalid_argument(oss.str());
    }
    return CardSet(mask);
}

CardSet CardSet::from_values(const std::vector<CardValue>& values) {
    CardSet set;
    for (CardValue v : values) {
        if (!is_valid_card_value(v)) {
            throw std::invalid_argument("Card value out of range: " + std::to_string(v));
        }
        if (set.contains(v)) {
            throw std::invalid_argument("Duplicate card value: " + std::to_string(v));
        }
        set.mask_ |= bit(v);
    }
    return set;
}

CardSet CardSet::with(CardValue value) const {
    if (!is_valid_card_value(value)) {
        throw std::invalid_argument("Card value out of range: " + std::to_string(value));
    }
    return CardSet(static_cast<uint16_t>(mask_ | bit(value)));
}

CardSet CardSet::without(CardValue value) const {
    if (!contains(value)) {
        throw std::invalid_argument("Card value not in set: " + std::to_string(value));
    }
    return CardSet(static_cast<uint16_t>(mask_ & ~bit(value)));
}

int CardSet::size() const {
    int count = 0;
    for (uint16_t m = mask_; m != 0; m &= static_cast<uint16_t>(m - 1)) {
        ++count;
    }
    return count;
}

int CardSet::sum() const {
    int total = 0;
    for (CardValue v = MIN_CARD_VALUE; v <= MAX_CARD_VALUE; ++v) {
        if (mask_ & bit(v)) total += v;
    }
    return total;
}

std::vector<CardValue> CardSet::values() const {
    std::vector<CardValue> out;
    out.reserve(NUM_CARD_VALUES);
    for (CardValue v = MIN_CARD_VALUE; v <= MAX_CARD_VALUE; ++v) {
        if (mask_ & bit(v)) out.push_back(v);
    }
    return out;
}

std::string CardSet::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (CardValue v : values()) {
        if (!first) oss << ",";
        oss << v;
        first = false;
    }
    oss << "}";
    return oss.str();
}

} // namespace odds21
