#ifndef BJ_PLAYER_H
#define BJ_PLAYER_H

#include <vector>
#include <optional>
#include <string>
#include <utility>
#include "bj/hand.h"

namespace bj_engine {

// Bankroll + mains du joueur (1 au départ, jusqu'à max_splits + 1 après splits).
// La bankroll est débitée une fois par mise (nouvelle main, split, double)
// et créditée une fois par remboursement/paiement (abandon, receive_payout).
class Player {
public:
    static constexpr int DEFAULT_MAX_SPLITS = 3;

    explicit Player(double bankroll, int max_splits = DEFAULT_MAX_SPLITS);

    Hand&                  new_hand(double bet);
    std::pair<Hand, Hand>  split_hand(size_t hand_index);
    void                   double_down(size_t hand_index);
    double                 surrender_hand(size_t hand_index);
    void                   receive_payout(double amount);
    void                   reset_for_round();

    // Accesseurs
    double                   get_bankroll() const { return bankroll_; }
    int                      get_max_splits() const { return max_splits_; }
    int                      split_count() const { return split_count_; }
    const std::vector<Hand>& get_hands() const { return hands_; }
    const Hand&              get_hand(size_t hand_index) const;
    Hand&                    get_hand(size_t hand_index);
    size_t                   num_hands() const { return hands_.size(); }

    std::optional<size_t> active_hand_index() const;
    bool                  all_hands_complete() const;
    double                total_bet() const;
    bool                  can_split_more() const { return split_count_ < max_splits_; }

    std::string to_string() const;

private:
    double            bankroll_;
    int               max_splits_;
    int               split_count_ = 0;
    std::vector<Hand> hands_;

    void validate_hand_index(size_t hand_index) const;
};

} // namespace bj_engine

#endif // BJ_PLAYER_H
