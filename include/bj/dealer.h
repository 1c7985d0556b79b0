#ifndef BJ_DEALER_H
#define BJ_DEALER_H

#include <functional>
#include <string>
#include "core/cards.hpp"
#include "bj/common_types.h"
#include "bj/hand.h"

namespace bj_engine {

// Capacité de distribution injectée: le croupier ne touche jamais le sabot
using DealCardFn = std::function<Card()>;

// Croupier à politique fixe (H17/S17).
// La carte fermée (deuxième carte) ne doit pas être exposée avant reveal_hole_card().
class Dealer {
public:
    explicit Dealer(DealerRule rule = DealerRule::H17);

    Hand& new_hand();
    void  receive_card(Card card);

    const Hand& get_hand() const { return hand_; }
    DealerRule  get_rule() const { return rule_; }
    bool        is_hole_card_revealed() const { return hole_card_revealed_; }

    Card upcard() const { return hand_.upcard(); }
    Card hole_card() const { return hand_.hole_card(); }
    int  upcard_value() const;
    bool upcard_is_ace() const;
    bool upcard_is_ten() const;

    Card reveal_hole_card();
    bool has_blackjack() const;   // Peek: ne révèle rien
    void mark_blackjack();

    bool should_hit() const;
    void play(const DealCardFn& deal_card);

    int  final_value() const { return hand_.value(); }
    bool is_busted() const { return hand_.is_busted(); }

    // "Ks [?]" avant la révélation, toutes les cartes après
    std::string showing() const;

private:
    Hand       hand_;
    DealerRule rule_;
    bool       hole_card_revealed_ = false;
};

} // namespace bj_engine

#endif // BJ_DEALER_H
