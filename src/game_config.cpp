#include "bj/game_config.h"
#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace bj_engine {

void GameConfig::validate() const {
    if (!(penetration >= 0.0 && penetration <= 1.0)) {
        throw std::invalid_argument("GameConfig: penetration must be within [0, 1]");
    }
    if (!(blackjack_payout > 0.0)) {
        throw std::invalid_argument("GameConfig: blackjack_payout must be > 0");
    }
    if (max_splits < 0 || max_splits > 3) {
        throw std::invalid_argument("GameConfig: max_splits must be within [0, 3]");
    }
    if (!(starting_bankroll >= 0.0)) {
        throw std::invalid_argument("GameConfig: starting_bankroll must be >= 0");
    }
    if (!(base_bet > 0.0)) {
        throw std::invalid_argument("GameConfig: base_bet must be > 0");
    }
}

GameConfig GameConfig::defaults() {
    return GameConfig{};
}

GameConfig GameConfig::s17_rules() {
    GameConfig config;
    config.dealer_rule = DealerRule::S17;
    return config;
}

std::string to_string(const GameConfig& config) {
    std::stringstream ss;
    ss << "Dealer: " << dealer_rule_to_string(config.dealer_rule)
       << std::fixed << std::setprecision(0)
       << " | Penetration: " << config.penetration * 100.0 << "%"
       << std::setprecision(2)
       << " | Blackjack pays: " << config.blackjack_payout << ":1"
       << " | DAS: " << (config.allow_das ? "Yes" : "No")
       << " | Surrender: " << (config.allow_surrender ? "Yes" : "No")
       << " | Max splits: " << config.max_splits
       << " | RSA: " << (config.resplit_aces ? "Yes" : "No")
       << " | Bankroll: " << config.starting_bankroll
       << " | Base bet: " << config.base_bet;
    return ss.str();
}

} // namespace bj_engine
