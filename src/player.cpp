#include "bj/player.h"
#include "bj/errors.h"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <algorithm>
#include <numeric>
#include <cstddef>
#include <sstream>
#include <iomanip>

namespace bj_engine {

Player::Player(double bankroll, int max_splits)
    : bankroll_(bankroll),
      max_splits_(max_splits),
      split_count_(0),
      hands_()
{
    if (bankroll < 0.0) throw std::invalid_argument("Player bankroll must be >= 0");
    if (max_splits < 0 || max_splits > DEFAULT_MAX_SPLITS) {
        throw std::invalid_argument("Player max_splits must be within [0, " + std::to_string(DEFAULT_MAX_SPLITS) + "]");
    }
}

void Player::validate_hand_index(size_t hand_index) const {
    if (hand_index >= hands_.size()) {
        throw std::out_of_range("Idx main " + std::to_string(hand_index) + " (" + std::to_string(hands_.size()) + " mains)");
    }
}

const Hand& Player::get_hand(size_t hand_index) const { validate_hand_index(hand_index); return hands_[hand_index]; }
Hand& Player::get_hand(size_t hand_index) { validate_hand_index(hand_index); return hands_[hand_index]; }

// -----------------------------------------------------------------------------
//  Mises
// -----------------------------------------------------------------------------
Hand& Player::new_hand(double bet) {
    if (bet <= 0.0) throw std::invalid_argument("Bet must be > 0");
    if (bet > bankroll_) {
        throw InsufficientFundsError("Bet " + std::to_string(bet) + " exceeds bankroll " + std::to_string(bankroll_));
    }

    hands_.clear();
    split_count_ = 0;
    hands_.emplace_back(bet);
    bankroll_ -= bet;

    spdlog::debug("Player: nouvelle main, mise {} (bankroll {})", bet, bankroll_);
    return hands_.back();
}

// Remplace la main i par ses deux moitiés, la seconde insérée juste après la première
std::pair<Hand, Hand> Player::split_hand(size_t hand_index) {
    validate_hand_index(hand_index);
    if (split_count_ >= max_splits_) {
        throw SplitLimitError("Maximum splits (" + std::to_string(max_splits_) + ") reached");
    }
    const Hand& hand = hands_[hand_index];
    if (!hand.can_split()) {
        throw IllegalActionError("Hand cannot be split (not a pair)");
    }
    const double bet = hand.get_bet();
    if (bet > bankroll_) {
        throw InsufficientFundsError("Insufficient bankroll for split bet");
    }

    auto halves = hand.split();
    bankroll_ -= bet;
    hands_[hand_index] = halves.first;
    hands_.insert(hands_.begin() + static_cast<std::ptrdiff_t>(hand_index) + 1, halves.second);
    ++split_count_;

    spdlog::debug("Player: split main {} ({} mains, split {}/{}, bankroll {})",
                  hand_index, hands_.size(), split_count_, max_splits_, bankroll_);
    return halves;
}

void Player::double_down(size_t hand_index) {
    validate_hand_index(hand_index);
    Hand& hand = hands_[hand_index];
    if (!hand.can_double()) {
        throw IllegalActionError("Cannot double: not first two cards or already acted");
    }
    const double bet = hand.get_bet();
    if (bet > bankroll_) {
        throw InsufficientFundsError("Insufficient bankroll to double");
    }

    bankroll_ -= bet;
    hand.double_down();
    spdlog::debug("Player: double main {}, mise {} (bankroll {})", hand_index, hand.get_bet(), bankroll_);
}

// Abandon tardif: la moitié de la mise revient dans la bankroll
double Player::surrender_hand(size_t hand_index) {
    validate_hand_index(hand_index);
    Hand& hand = hands_[hand_index];
    if (!hand.can_surrender()) {
        throw IllegalActionError("Cannot surrender: only allowed on first two cards");
    }

    const double refund = hand.get_bet() / 2.0;
    hand.surrender();
    bankroll_ += refund;
    spdlog::debug("Player: abandon main {}, remboursement {} (bankroll {})", hand_index, refund, bankroll_);
    return refund;
}

void Player::receive_payout(double amount) {
    if (amount < 0.0) throw std::invalid_argument("Payout must be >= 0");
    bankroll_ += amount;
}

void Player::reset_for_round() {
    hands_.clear();
    split_count_ = 0;
}

// -----------------------------------------------------------------------------
//  État des mains
// -----------------------------------------------------------------------------
std::optional<size_t> Player::active_hand_index() const {
    for (size_t i = 0; i < hands_.size(); ++i) {
        if (hands_[i].get_status() == HandStatus::ACTIVE) return i;
    }
    return std::nullopt;
}

bool Player::all_hands_complete() const {
    return std::none_of(hands_.begin(), hands_.end(),
                        [](const Hand& h) { return h.get_status() == HandStatus::ACTIVE; });
}

double Player::total_bet() const {
    return std::accumulate(hands_.begin(), hands_.end(), 0.0,
                           [](double sum, const Hand& h) { return sum + h.get_bet(); });
}

std::string Player::to_string() const {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << "Player(bankroll=$" << bankroll_ << ", hands=[";
    for (size_t i = 0; i < hands_.size(); ++i) {
        ss << hands_[i].to_string() << (i + 1 < hands_.size() ? ", " : "");
    }
    ss << "])";
    return ss.str();
}

} // namespace bj_engine
