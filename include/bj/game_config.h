#ifndef BJ_GAME_CONFIG_H
#define BJ_GAME_CONFIG_H

#include <string>
#include "bj/common_types.h"

namespace bj_engine {

// Règles de la table + paramètres de session, validés à la construction du moteur
struct GameConfig {
    DealerRule dealer_rule       = DealerRule::H17;
    double     penetration       = 0.65;   // Fraction du paquet distribuée avant remélange
    double     blackjack_payout  = 1.5;    // 3:2 = 1.5, 6:5 = 1.2
    int        max_splits        = 3;      // Jusqu'à 4 mains
    bool       allow_das         = true;   // Double après split
    bool       allow_surrender   = true;   // Abandon tardif
    bool       resplit_aces      = true;
    double     starting_bankroll = 1000.0;
    double     base_bet          = 10.0;

    // std::invalid_argument si une valeur est hors domaine (pas de clamp silencieux)
    void validate() const;

    static GameConfig defaults();
    static GameConfig s17_rules();
};

std::string to_string(const GameConfig& config);

} // namespace bj_engine

#endif // BJ_GAME_CONFIG_H
