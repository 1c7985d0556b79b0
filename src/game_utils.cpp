#include "bj/game_utils.hpp"
#include <sstream>

namespace bj_engine {

std::string action_to_string(Action action) {
    switch (action) {
        case Action::HIT:       return "HIT";
        case Action::STAND:     return "STAND";
        case Action::DOUBLE:    return "DOUBLE";
        case Action::SPLIT:     return "SPLIT";
        case Action::SURRENDER: return "SURRENDER";
        default:                return "UNKNOWN_ACTION";
    }
}

std::string actions_to_string(const std::vector<Action>& actions) {
    std::string s;
    for (size_t i = 0; i < actions.size(); ++i) {
        s += action_to_string(actions[i]);
        if (i + 1 < actions.size()) s += ",";
    }
    return s;
}

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << (cards[i] == INVALID_CARD ? "--" : bj_engine::to_string(cards[i]));
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

} // namespace bj_engine
