#ifndef BJ_COMMON_TYPES_H
#define BJ_COMMON_TYPES_H

namespace bj_engine {

// Statut d'une main pendant le tour
enum class HandStatus {
    ACTIVE,      // Peut encore agir
    STOOD,       // Le joueur reste
    BUSTED,      // Valeur > 21
    BLACKJACK,   // 21 naturel (deux cartes, main non splittée)
    SURRENDERED, // Abandon
    DOUBLED      // Doublée: une seule carte de plus
};

// Règle du croupier sur le soft 17
enum class DealerRule {
    H17, // Tire sur soft 17
    S17  // Reste sur soft 17
};

// Actions possibles du joueur
enum class Action {
    HIT,
    STAND,
    DOUBLE,
    SPLIT,
    SURRENDER
};

// Issue d'une main à la fin du tour
enum class RoundResult {
    WIN,
    LOSE,
    PUSH,
    BLACKJACK,
    SURRENDER
};

// Phases du tour piloté par GameEngine
enum class RoundPhase {
    IDLE,
    DEALING,
    PLAYER_TURN,
    DEALER_TURN,
    RESOLVED
};

inline const char* hand_status_to_string(HandStatus s) {
    switch (s) {
        case HandStatus::ACTIVE: return "ACTIVE";
        case HandStatus::STOOD: return "STOOD";
        case HandStatus::BUSTED: return "BUSTED";
        case HandStatus::BLACKJACK: return "BLACKJACK";
        case HandStatus::SURRENDERED: return "SURRENDERED";
        case HandStatus::DOUBLED: return "DOUBLED";
        default: return "INVALID";
    }
}

inline const char* dealer_rule_to_string(DealerRule r) {
    switch (r) {
        case DealerRule::H17: return "H17";
        case DealerRule::S17: return "S17";
        default: return "INVALID";
    }
}

inline const char* round_result_to_string(RoundResult r) {
    switch (r) {
        case RoundResult::WIN: return "WIN";
        case RoundResult::LOSE: return "LOSE";
        case RoundResult::PUSH: return "PUSH";
        case RoundResult::BLACKJACK: return "BLACKJACK";
        case RoundResult::SURRENDER: return "SURRENDER";
        default: return "INVALID";
    }
}

inline const char* round_phase_to_string(RoundPhase p) {
    switch (p) {
        case RoundPhase::IDLE: return "IDLE";
        case RoundPhase::DEALING: return "DEALING";
        case RoundPhase::PLAYER_TURN: return "PLAYER_TURN";
        case RoundPhase::DEALER_TURN: return "DEALER_TURN";
        case RoundPhase::RESOLVED: return "RESOLVED";
        default: return "INVALID";
    }
}

} // namespace bj_engine

#endif // BJ_COMMON_TYPES_H
