// Example usage: warm the cache, then print odds and advice for a few hands
//
//   ./example_usage            # built-in sample hands
//   ./example_usage 10 6       # odds for the dealt cards 10 and 6

#include "../include/odds21/advisor.hpp"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace odds21;

std::string percent(double probability) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << probability * 100.0 << "%";
    return oss.str();
}

void print_odds(Advisor& advisor, const std::vector<CardValue>& dealt) {
    auto validation = advisor.validate_dealt(dealt);
    if (!validation.valid) {
        std::cout << "\nInvalid hand: " << validation.error_message << std::endl;
        return;
    }

    std::cout << "\n=== Dealt: " << CardSet::from_values(dealt).to_string() << " ===" << std::endl;

    uint64_t expansions_before = advisor.evaluator().stats().expansions;
    OddsSummary odds = advisor.get_odds(dealt);
    uint64_t expansions = advisor.evaluator().stats().expansions - expansions_before;

    std::cout << "Score: " << odds.player_score
              << " (" << odds.cards_remaining << " cards left)" << std::endl;
    std::cout << "Win chance (optimal play): " << percent(odds.win_probability) << std::endl;

    if (odds.is_decision_point) {
        std::cout << "  If you stand: " << percent(odds.stand_probability) << std::endl;
        std::cout << "  If you hit:   " << percent(odds.hit_probability) << std::endl;
        std::cout << "  Bust on hit:  " << percent(odds.bust_on_hit_probability) << std::endl;
        std::cout << "Advice: " << recommendation_name(Advisor::recommend(odds)) << std::endl;
    } else if (odds.win_probability >= 1.0) {
        std::cout << "Advice: you have " << BLACKJACK << ", nothing to decide" << std::endl;
    } else {
        std::cout << "Advice: bust, nothing to decide" << std::endl;
    }
    std::cout << "New expansions: " << expansions << std::endl;
}

int main(int argc, char** argv) {
    std::cout << "=== 21 Odds Advisor ===" << std::endl;

    Advisor advisor;

    auto start = std::chrono::high_resolution_clock::now();
    std::size_t cached = advisor.warm_up();
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> elapsed = end - start;

    std::cout << "Warm-up: " << cached << " states cached in "
              << std::fixed << std::setprecision(1) << elapsed.count() << " ms" << std::endl;
    std::cout.unsetf(std::ios::fixed);

    const EvaluatorStats& stats = advisor.evaluator().stats();
    std::cout << "  expansions=" << stats.expansions
              << " cache_hits=" << stats.cache_hits
              << " terminal_hits=" << stats.terminal_hits << std::endl;

    if (argc > 1) {
        std::vector<CardValue> dealt;
        for (int i = 1; i < argc; ++i) {
            char* end_ptr = nullptr;
            errno = 0;
            long value = std::strtol(argv[i], &end_ptr, 10);
            if (end_ptr == argv[i] || *end_ptr != '\0' || errno == ERANGE) {
                std::cerr << "Not a card value: " << argv[i] << std::endl;
                return 1;
            }
            // Range check before narrowing so large inputs cannot wrap
            if (value < MIN_CARD_VALUE || value > MAX_CARD_VALUE) {
                std::cerr << "Card value out of range: " << argv[i] << std::endl;
                return 1;
            }
            dealt.push_back(static_cast<CardValue>(value));
        }

        auto validation = advisor.validate_dealt(dealt);
        if (!validation.valid) {
            std::cerr << "Invalid hand: " << validation.error_message << std::endl;
            return 1;
        }
        print_odds(advisor, dealt);
        return 0;
    }

    // Sample hands: fresh deck, low start, 16, exactly 21, bust
    std::vector<std::vector<CardValue>> samples = {
        {},
        {2, 3},
        {10, 6},
        {10, 11},
        {10, 9, 5}
    };
    for (const auto& dealt : samples) {
        print_odds(advisor, dealt);
    }

    std::cout << "\n=== Example Complete ===" << std::endl;
    return 0;
}
