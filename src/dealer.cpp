#include "bj/dealer.h"
#include "spdlog/spdlog.h"
#include <stdexcept>

namespace bj_engine {

Dealer::Dealer(DealerRule rule)
    : hand_(),
      rule_(rule),
      hole_card_revealed_(false)
{
}

Hand& Dealer::new_hand() {
    hand_ = Hand();
    hole_card_revealed_ = false;
    return hand_;
}

void Dealer::receive_card(Card card) {
    hand_.add_card(card);
}

int Dealer::upcard_value() const {
    return card_value(upcard());
}

bool Dealer::upcard_is_ace() const { return is_ace(upcard()); }
bool Dealer::upcard_is_ten() const { return is_ten_value(upcard()); }

Card Dealer::reveal_hole_card() {
    hole_card_revealed_ = true;
    spdlog::debug("Dealer: carte fermée révélée {}", to_string(hole_card()));
    return hole_card();
}

bool Dealer::has_blackjack() const {
    return hand_.is_blackjack();
}

void Dealer::mark_blackjack() {
    hand_.mark_blackjack();
}

// Tire sous 17; sur soft 17 uniquement en H17; reste sinon
bool Dealer::should_hit() const {
    const SoftValue sv = hand_.soft_value();
    if (sv.total < 17) return true;
    if (sv.total == 17 && sv.is_soft) return rule_ == DealerRule::H17;
    return false;
}

void Dealer::play(const DealCardFn& deal_card) {
    if (!deal_card) {
        throw std::invalid_argument("Dealer::play: deal_card capability is empty");
    }
    if (!hole_card_revealed_) {
        reveal_hole_card();
    }

    while (should_hit() && !hand_.is_busted()) {
        const Card card = deal_card();
        receive_card(card);
        spdlog::debug("Dealer tire {} -> {}", to_string(card), hand_.to_string());
    }

    // add_card a déjà positionné BUSTED le cas échéant
    if (!hand_.is_busted()) {
        hand_.stand();
    }
    spdlog::debug("Dealer termine: {} ({})", hand_.to_string(), hand_status_to_string(hand_.get_status()));
}

std::string Dealer::showing() const {
    const auto& cards = hand_.get_cards();
    if (cards.empty()) return "(no cards)";
    if (cards.size() == 1) return to_string(cards[0]);
    if (!hole_card_revealed_) return to_string(cards[0]) + " [?]";

    std::string s;
    for (Card c : cards) s += to_string(c) + " ";
    s.pop_back();
    return s;
}

} // namespace bj_engine
