/**
 * @file card.hpp
 * @brief Card values and the canonical remaining-card set for the 21 odds engine.
 *
 * This file defines the fundamental card data structures used throughout the evaluator.
 * Cards carry no suit: a card is simply its integer value in [1, 11], and the initial
 * deck holds exactly one card of each value (11 cards, total value 66).
 *
 * Encoding scheme:
 *   - A CardSet is an 11-bit mask, bit (value - 1) set when the value is present
 *   - Example: {1, 2, 3}  = 0b00000000111 = 0x007
 *   - Example: full deck  = 0b11111111111 = 0x7FF
 *
 * Because membership is the only information stored, two sets holding the same values
 * are bit-identical no matter in which order cards were removed. This makes the mask
 * directly usable as the remaining-set part of a memoization key.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace odds21 {

/** @brief Card value (1-11). */
using CardValue = int;

/** @brief Lowest card value in the deck */
constexpr int MIN_CARD_VALUE = 1;

/** @brief Highest card value in the deck */
constexpr int MAX_CARD_VALUE = 11;

/** @brief Number of distinct card values (one card per value) */
constexpr int NUM_CARD_VALUES = MAX_CARD_VALUE - MIN_CARD_VALUE + 1;

/** @brief Score that wins outright; anything above it is a bust */
constexpr int BLACKJACK = 21;

/** @brief Mask with every card value present */
constexpr uint16_t FULL_DECK_MASK = (1u << NUM_CARD_VALUES) - 1;

/**
 * @brief Check whether an integer is a legal card value.
 * @param value Candidate value
 * @return True if value lies in [MIN_CARD_VALUE, MAX_CARD_VALUE]
 */
constexpr bool is_valid_card_value(int value) {
    return value >= MIN_CARD_VALUE && value <= MAX_CARD_VALUE;
}

/**
 * @brief Unordered set of distinct card values, canonical by construction.
 *
 * CardSet is a small value type (one 16-bit mask). Each value is present at most
 * once, so duplicates cannot be represented. Mutating helpers return a new set
 * and leave the original untouched.
 *
 * Usage:
 * @code
 *   CardSet deck = CardSet::full_deck();
 *   CardSet rest = deck.without(10).without(6);  // {1,2,3,4,5,7,8,9,11}
 *   int n = rest.size();                         // 9
 * @endcode
 */
class CardSet {
public:
    /** @brief Construct an empty set */
    CardSet() : mask_(0) {}

    /**
     * @brief Construct a set directly from its bit mask.
     * @param mask Bit (v - 1) set for each value v; bits above 11 must be clear
     * @throws std::invalid_argument if bits outside the 11-card range are set
     */
    static CardSet from_mask(uint16_t mask);

    /**
     * @brief Build a set from a list of card values.
     * @param values Distinct values, each in [1, 11]
     * @return Set containing exactly those values
     * @throws std::invalid_argument on an out-of-range or duplicate value
     */
    static CardSet from_values(const std::vector<CardValue>& values);

    /** @brief The initial 11-card deck {1, 2, ..., 11} */
    static CardSet full_deck() { return CardSet(FULL_DECK_MASK); }

    /** @brief Check whether a value is in the set (false for out-of-range values) */
    bool contains(CardValue value) const {
        return is_valid_card_value(value) && (mask_ & bit(value)) != 0;
    }

    /**
     * @brief Copy of this set with one value added.
     * @throws std::invalid_argument if value is out of range
     */
    CardSet with(CardValue value) const;

    /**
     * @brief Copy of this set with one value removed.
     * @throws std::invalid_argument if value is out of range or not present
     */
    CardSet without(CardValue value) const;

    /** @brief Values of the full deck not present in this set */
    CardSet complement() const { return CardSet(static_cast<uint16_t>(~mask_ & FULL_DECK_MASK)); }

    /** @brief Number of cards in the set (0-11) */
    int size() const;

    /** @brief True if no card is left */
    bool empty() const { return mask_ == 0; }

    /** @brief Sum of the values in the set (0-66) */
    int sum() const;

    /** @brief Values in ascending order */
    std::vector<CardValue> values() const;

    /** @brief Raw bit mask (bit v - 1 for value v) */
    uint16_t mask() const { return mask_; }

    /** @brief Render as "{1,2,3}" for debugging */
    std::string to_string() const;

    bool operator==(const CardSet& other) const { return mask_ == other.mask_; }
    bool operator!=(const CardSet& other) const { return mask_ != other.mask_; }

private:
    explicit CardSet(uint16_t mask) : mask_(mask) {}

    static uint16_t bit(CardValue value) {
        return static_cast<uint16_t>(1u << (value - MIN_CARD_VALUE));
    }

    uint16_t mask_; ///< Bit (v - 1) set for each value v present
};

} // namespace odds21
