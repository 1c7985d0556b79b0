#ifndef BJ_GAME_UTILS_HPP
#define BJ_GAME_UTILS_HPP

#include <string>
#include <vector>
#include "bj/common_types.h"
#include "core/cards.hpp" // Pour Card et to_string(Card)

namespace bj_engine {

// Fonction utilitaire pour convertir une Action en string
std::string action_to_string(Action action);

// "HIT,STAND,..." pour les logs de légalité
std::string actions_to_string(const std::vector<Action>& actions);

// "[As Kd]", INVALID_CARD affiché "--"
std::string vec_to_string(const std::vector<Card>& cards);

} // namespace bj_engine

#endif // BJ_GAME_UTILS_HPP
