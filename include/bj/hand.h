#ifndef BJ_HAND_H
#define BJ_HAND_H

#include <vector>
#include <string>
#include <utility> // Pour std::pair
#include "core/cards.hpp"
#include "bj/common_types.h"

namespace bj_engine {

// Valeur d'une main pour les décisions: total + drapeau soft
struct SoftValue {
    int  total   = 0;
    bool is_soft = false;
};

// Main de blackjack: cartes ordonnées + statut + mise.
// La valeur est toujours recalculée depuis les cartes (jamais mise en cache),
// et les prédicats d'éligibilité sont des fonctions pures de {cartes, statut}.
class Hand {
public:
    Hand() = default;
    explicit Hand(double bet, bool is_split_hand = false);

    // Ajoute une carte; passe en BUSTED si la valeur dépasse 21.
    // Une main non ACTIVE refuse la carte, sauf la carte unique d'une main DOUBLED.
    void add_card(Card card);

    // Accesseurs
    const std::vector<Card>& get_cards() const { return cards_; }
    size_t     size() const { return cards_.size(); }
    HandStatus get_status() const { return status_; }
    double     get_bet() const { return bet_; }
    bool       is_split_hand() const { return is_split_hand_; }
    bool       is_doubled() const { return is_doubled_; }
    Card       upcard() const;
    Card       hole_card() const;

    // Valeurs
    int       value() const;
    SoftValue soft_value() const;
    bool      is_soft() const;
    bool      is_hard() const;

    bool is_blackjack() const;
    bool is_busted() const;
    bool is_pair() const;
    bool is_ten_pair() const;

    // Éligibilité
    bool can_hit() const;
    bool can_stand() const;
    bool can_double() const;
    bool can_split() const;
    bool can_surrender() const;

    // Transitions de statut (validées)
    void stand();
    void double_down(); // Mise doublée, statut DOUBLED
    void surrender();
    void mark_blackjack();

    // Deux nouvelles mains d'une carte chacune, même mise, is_split_hand = true
    std::pair<Hand, Hand> split() const;

    std::string to_string() const;

private:
    std::vector<Card> cards_;
    HandStatus        status_ = HandStatus::ACTIVE;
    double            bet_ = 0.0;
    bool              is_split_hand_ = false;
    bool              is_doubled_ = false;

    int raw_total() const;
    int ace_count() const;
};

} // namespace bj_engine

#endif // BJ_HAND_H
