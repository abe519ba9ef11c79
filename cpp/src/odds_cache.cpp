/**
 * @file odds_cache.cpp
 * @brief Implementation of OddsResult and the insert-only OddsCache.
 */

#include "../include/odds21/odds_cache.hpp"
#include <algorithm>
#include <stdexcept>

namespace odds21 {

OddsResult OddsResult::leaf(double win_probability) {
    OddsResult result;
    result.win_ = win_probability;
    return result;
}

OddsResult OddsResult::decision(double stand_probability, double hit_probability) {
    OddsResult result;
    result.win_ = std::max(stand_probability, hit_probability);
    result.stand_ = stand_probability;
    result.hit_ = hit_probability;
    result.has_breakdown_ = true;
    return result;
}

double OddsResult::stand_probability() const {
    if (!has_breakdown_) {
        throw std::logic_error("Stand probability requested for a state with no decision");
    }
    return stand_;
}

double OddsResult::hit_probability() const {
    if (!has_breakdown_) {
        throw std::logic_error("Hit probability requested for a state with no decision");
    }
    return hit_;
}

OddsCache::OddsCache(const GameRules& rules) : rules_(rules) {
    validate_rules(rules_);
}

const OddsResult* OddsCache::find(const StateKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool OddsCache::insert(const StateKey& key, const OddsResult& result) {
    // emplace leaves an existing entry untouched
    return entries_.emplace(key, result).second;
}

} // namespace odds21
