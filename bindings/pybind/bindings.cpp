#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "odds21/advisor.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_odds21_core, m) {
    m.doc() = "Exact win odds and hit/stand advice for the 11-card 21 game";

    // Expose constants
    m.attr("MIN_CARD_VALUE") = odds21::MIN_CARD_VALUE;
    m.attr("MAX_CARD_VALUE") = odds21::MAX_CARD_VALUE;
    m.attr("NUM_CARD_VALUES") = odds21::NUM_CARD_VALUES;
    m.attr("BLACKJACK") = odds21::BLACKJACK;

    // TurnPhase enum
    py::enum_<odds21::TurnPhase>(m, "TurnPhase")
        .value("PLAYER_TURN", odds21::TurnPhase::PLAYER_TURN)
        .value("DEALER_TURN", odds21::TurnPhase::DEALER_TURN)
        .export_values();

    // Recommendation enum
    py::enum_<odds21::Recommendation>(m, "Recommendation")
        .value("NONE", odds21::Recommendation::NONE)
        .value("STAND", odds21::Recommendation::STAND)
        .value("HIT", odds21::Recommendation::HIT)
        .export_values();

    // CardSet, built from and converted to Python lists of values
    py::class_<odds21::CardSet>(m, "CardSet")
        .def(py::init<>())
        .def_static("full_deck", &odds21::CardSet::full_deck)
        .def_static("from_values", &odds21::CardSet::from_values, py::arg("values"))
        .def("contains", &odds21::CardSet::contains, py::arg("value"))
        .def("values", &odds21::CardSet::values)
        .def("sum", &odds21::CardSet::sum)
        .def("__len__", &odds21::CardSet::size)
        .def("__eq__", [](const odds21::CardSet& a, const odds21::CardSet& b) { return a == b; })
        .def("__repr__", [](const odds21::CardSet& set) {
            return "<CardSet " + set.to_string() + ">";
        });

    // GameRules
    py::class_<odds21::GameRules>(m, "GameRules")
        .def(py::init<>())
        .def(py::init([](int target_score, const std::vector<int>& deck) {
                 return odds21::GameRules(target_score, odds21::CardSet::from_values(deck));
             }),
             py::arg("target_score"),
             py::arg("deck"))
        .def_readonly("target_score", &odds21::GameRules::target_score)
        .def_property_readonly("deck", [](const odds21::GameRules& rules) {
            return rules.deck.values();
        })
        .def("__repr__", [](const odds21::GameRules& rules) {
            return "<GameRules target=" + std::to_string(rules.target_score) +
                   " deck=" + rules.deck.to_string() + ">";
        });

    // GameState
    py::class_<odds21::GameState>(m, "GameState")
        .def(py::init<>())
        .def(py::init<const odds21::CardSet&, int, odds21::TurnPhase, int>(),
             py::arg("remaining"),
             py::arg("player_score"),
             py::arg("phase"),
             py::arg("dealer_score") = 0)
        .def_readwrite("remaining", &odds21::GameState::remaining)
        .def_readwrite("player_score", &odds21::GameState::player_score)
        .def_readwrite("phase", &odds21::GameState::phase)
        .def_readwrite("dealer_score", &odds21::GameState::dealer_score)
        .def("__repr__", &odds21::GameState::to_string);

    // OddsResult: breakdown is None where no decision exists
    py::class_<odds21::OddsResult>(m, "OddsResult")
        .def_property_readonly("win_probability", &odds21::OddsResult::win_probability)
        .def_property_readonly("has_breakdown", &odds21::OddsResult::has_breakdown)
        .def_property_readonly("stand_probability", [](const odds21::OddsResult& r) -> py::object {
            if (!r.has_breakdown()) return py::none();
            return py::float_(r.stand_probability());
        })
        .def_property_readonly("hit_probability", [](const odds21::OddsResult& r) -> py::object {
            if (!r.has_breakdown()) return py::none();
            return py::float_(r.hit_probability());
        })
        .def("__repr__", [](const odds21::OddsResult& r) {
            return "<OddsResult win=" + std::to_string(r.win_probability()) + ">";
        });

    // OddsSummary: per-action fields are None where no decision exists
    py::class_<odds21::OddsSummary>(m, "OddsSummary")
        .def_readonly("win_probability", &odds21::OddsSummary::win_probability)
        .def_readonly("is_decision_point", &odds21::OddsSummary::is_decision_point)
        .def_readonly("player_score", &odds21::OddsSummary::player_score)
        .def_readonly("cards_remaining", &odds21::OddsSummary::cards_remaining)
        .def_property_readonly("stand_probability", [](const odds21::OddsSummary& s) -> py::object {
            if (!s.is_decision_point) return py::none();
            return py::float_(s.stand_probability);
        })
        .def_property_readonly("hit_probability", [](const odds21::OddsSummary& s) -> py::object {
            if (!s.is_decision_point) return py::none();
            return py::float_(s.hit_probability);
        })
        .def_property_readonly("bust_on_hit_probability", [](const odds21::OddsSummary& s) -> py::object {
            if (!s.is_decision_point) return py::none();
            return py::float_(s.bust_on_hit_probability);
        })
        .def("__repr__", [](const odds21::OddsSummary& s) {
            return "<OddsSummary score=" + std::to_string(s.player_score) +
                   " win=" + std::to_string(s.win_probability) + ">";
        });

    // Evaluator statistics
    py::class_<odds21::EvaluatorStats>(m, "EvaluatorStats")
        .def_readonly("expansions", &odds21::EvaluatorStats::expansions)
        .def_readonly("cache_hits", &odds21::EvaluatorStats::cache_hits)
        .def_readonly("terminal_hits", &odds21::EvaluatorStats::terminal_hits);

    // Validation result
    py::class_<odds21::DealtValidationResult>(m, "DealtValidationResult")
        .def_readonly("valid", &odds21::DealtValidationResult::valid)
        .def_readonly("error_message", &odds21::DealtValidationResult::error_message)
        .def("__repr__", [](const odds21::DealtValidationResult& result) {
            if (result.valid) {
                return std::string("<DealtValidationResult valid=True>");
            } else {
                return std::string("<DealtValidationResult valid=False error='") +
                       result.error_message + std::string("'>");
            }
        });

    // Advisor class
    py::class_<odds21::Advisor>(m, "Advisor")
        .def(py::init<>())
        .def(py::init<const odds21::GameRules&>(), py::arg("rules"))
        .def("warm_up", &odds21::Advisor::warm_up,
             "Evaluate the full deck once and return the cache size")
        .def("validate_dealt", &odds21::Advisor::validate_dealt,
             py::arg("dealt"),
             "Check a list of dealt card values")
        .def("get_odds", &odds21::Advisor::get_odds,
             py::arg("dealt"),
             "Win, stand, hit and bust-on-hit probabilities for dealt cards")
        .def_static("recommend", &odds21::Advisor::recommend,
             py::arg("summary"),
             "Hit or stand (ties stand)")
        .def("evaluate", &odds21::Advisor::evaluate,
             py::arg("state"),
             "Odds for an arbitrary game state")
        .def_property_readonly("cache_size", [](const odds21::Advisor& advisor) {
            return advisor.evaluator().cache().size();
        })
        .def_property_readonly("stats", [](const odds21::Advisor& advisor) {
            return advisor.evaluator().stats();
        })
        .def("__repr__", [](const odds21::Advisor& advisor) {
            return "<Advisor cached=" + std::to_string(advisor.evaluator().cache().size()) + ">";
        });
}
