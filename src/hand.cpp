#include "bj/hand.h"
#include "bj/errors.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <sstream>

namespace bj_engine {

Hand::Hand(double bet, bool is_split_hand)
    : cards_(),
      status_(HandStatus::ACTIVE),
      bet_(bet),
      is_split_hand_(is_split_hand),
      is_doubled_(false)
{
}

// -----------------------------------------------------------------------------
//  Cartes
// -----------------------------------------------------------------------------
void Hand::add_card(Card card) {
    if (card >= INVALID_CARD) {
        throw std::invalid_argument("Hand::add_card: carte invalide");
    }
    const bool doubled_draw = (status_ == HandStatus::DOUBLED && cards_.size() == 2);
    if (status_ != HandStatus::ACTIVE && !doubled_draw) {
        throw IllegalActionError(std::string("Cannot add a card to a hand in status ") + hand_status_to_string(status_));
    }
    cards_.push_back(card);
    if (value() > 21) {
        status_ = HandStatus::BUSTED;
        spdlog::trace("Hand {} -> BUSTED", to_string());
    }
}

Card Hand::upcard() const { return cards_.empty() ? INVALID_CARD : cards_[0]; }
Card Hand::hole_card() const { return cards_.size() < 2 ? INVALID_CARD : cards_[1]; }

int Hand::raw_total() const {
    int total = 0;
    for (Card c : cards_) total += card_value(c);
    return total;
}

int Hand::ace_count() const {
    return static_cast<int>(std::count_if(cards_.begin(), cards_.end(), [](Card c) { return is_ace(c); }));
}

// -----------------------------------------------------------------------------
//  Valeurs
// -----------------------------------------------------------------------------
// Somme avec As = 11, puis un As repasse à 1 tant que le total dépasse 21.
// Le résultat peut dépasser 21 si tous les As sont déjà à 1.
int Hand::value() const {
    return soft_value().total;
}

SoftValue Hand::soft_value() const {
    int total = raw_total();
    int aces_at_eleven = ace_count();
    while (total > 21 && aces_at_eleven > 0) {
        total -= 10;
        --aces_at_eleven;
    }
    return SoftValue{total, aces_at_eleven > 0 && total <= 21};
}

bool Hand::is_soft() const { return soft_value().is_soft; }
bool Hand::is_hard() const { return !is_soft(); }

// Un As + figure issu d'un split fait 21 mais n'est jamais un blackjack naturel
bool Hand::is_blackjack() const {
    return cards_.size() == 2 && value() == 21 && !is_split_hand_;
}

bool Hand::is_busted() const { return value() > 21; }

// Rangs identiques uniquement: 10-J n'est pas une paire
bool Hand::is_pair() const {
    return cards_.size() == 2 && get_rank(cards_[0]) == get_rank(cards_[1]);
}

bool Hand::is_ten_pair() const {
    return cards_.size() == 2 && is_ten_value(cards_[0]) && is_ten_value(cards_[1]);
}

// -----------------------------------------------------------------------------
//  Éligibilité
// -----------------------------------------------------------------------------
bool Hand::can_hit() const { return status_ == HandStatus::ACTIVE && !is_busted(); }
bool Hand::can_stand() const { return status_ == HandStatus::ACTIVE; }
bool Hand::can_double() const { return cards_.size() == 2 && status_ == HandStatus::ACTIVE; }
bool Hand::can_split() const { return is_pair() && status_ == HandStatus::ACTIVE; }
bool Hand::can_surrender() const { return cards_.size() == 2 && status_ == HandStatus::ACTIVE; }

// -----------------------------------------------------------------------------
//  Transitions
// -----------------------------------------------------------------------------
void Hand::stand() {
    // Une main doublée est forcée à STOOD après sa carte unique
    const bool doubled_done = (status_ == HandStatus::DOUBLED && cards_.size() == 3);
    if (!can_stand() && !doubled_done) {
        throw IllegalActionError(std::string("Cannot stand on a hand in status ") + hand_status_to_string(status_));
    }
    status_ = HandStatus::STOOD;
}

void Hand::double_down() {
    if (!can_double()) {
        throw IllegalActionError("Cannot double: not first two cards or already acted");
    }
    bet_ *= 2;
    is_doubled_ = true;
    status_ = HandStatus::DOUBLED;
}

void Hand::surrender() {
    if (!can_surrender()) {
        throw IllegalActionError("Cannot surrender: only allowed on first two cards");
    }
    status_ = HandStatus::SURRENDERED;
}

void Hand::mark_blackjack() {
    if (status_ != HandStatus::ACTIVE || !is_blackjack()) {
        throw IllegalActionError("Cannot mark as blackjack: not a natural or already resolved");
    }
    status_ = HandStatus::BLACKJACK;
}

std::pair<Hand, Hand> Hand::split() const {
    if (!can_split()) {
        throw InvalidOperationError("Cannot split: not a pair or already acted");
    }
    Hand first(bet_, true);
    Hand second(bet_, true);
    first.cards_.push_back(cards_[0]);
    second.cards_.push_back(cards_[1]);
    return {first, second};
}

// Ex: "[As 6d] = 17 (soft)"
std::string Hand::to_string() const {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards_.size(); ++i) {
        ss << bj_engine::to_string(cards_[i]);
        if (i + 1 < cards_.size()) ss << " ";
    }
    const SoftValue sv = soft_value();
    ss << "] = " << sv.total << (sv.is_soft ? " (soft)" : "");
    return ss.str();
}

} // namespace bj_engine
