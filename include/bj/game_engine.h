#ifndef BJ_GAME_ENGINE_H
#define BJ_GAME_ENGINE_H

#include <vector>
#include <string>
#include <optional>
#include <functional>
#include "core/cards.hpp"
#include "core/shoe.hpp"
#include "bj/common_types.h"
#include "bj/game_config.h"
#include "bj/hand.h"
#include "bj/dealer.h"
#include "bj/player.h"

namespace bj_engine {

// Notification synchrone pour chaque carte visible (compteur de cartes, affichage...).
// Ne doit pas lever d'exception.
using CardCallback = std::function<void(Card)>;

// Résultat d'une main à la fin du tour
struct HandResult {
    Hand        hand;
    RoundResult result = RoundResult::LOSE;
    double      payout = 0.0; // Net: négatif pour une perte

    std::string to_string() const;
};

struct RoundSummary {
    std::vector<HandResult> player_hands;
    Hand                    dealer_hand;
    double                  total_payout = 0.0;

    double net_result() const { return total_payout; }
    std::string to_string() const;
};

// Donne initiale renvoyée par start_round
struct InitialDeal {
    Hand player_hand;
    Card dealer_upcard = INVALID_CARD;
};

// Orchestration d'un tour complet: donne, actions du joueur, jeu du croupier, paiements.
// Possède le sabot, le joueur et le croupier; seul composant avec un état transverse au tour.
class GameEngine {
public:
    // Joueur 2 cartes + croupier 2 cartes
    static constexpr int INITIAL_DEAL_CARDS = 4;

    explicit GameEngine(const GameConfig& config, CardCallback on_card_exposed = nullptr);
    // Sabot fourni (graine fixe, ordre imposé en test); sa pénétration doit égaler celle de la config
    GameEngine(const GameConfig& config, Shoe shoe, CardCallback on_card_exposed = nullptr);

    void set_on_card_exposed(CardCallback on_card_exposed) { on_card_exposed_ = std::move(on_card_exposed); }

    // Déroulement d'un tour
    InitialDeal                 start_round(std::optional<double> bet = std::nullopt);
    std::optional<RoundSummary> check_early_blackjack();
    std::vector<Action>         get_available_actions(size_t hand_index = 0) const;
    std::optional<Card>         execute_action(Action action, size_t hand_index = 0);
    void                        play_dealer();
    RoundSummary                resolve_round();

    // Accesseurs (lecture seule)
    const GameConfig& get_config() const { return config_; }
    const Player&     get_player() const { return player_; }
    const Dealer&     get_dealer() const { return dealer_; }
    const Shoe&       get_shoe() const { return shoe_; }
    RoundPhase        get_phase() const { return phase_; }
    double            get_bankroll() const { return player_.get_bankroll(); }
    bool              needs_shuffle() const { return shoe_.needs_shuffle(); }
    bool              is_early_check_done() const { return early_check_done_; }

private:
    GameConfig   config_;
    Shoe         shoe_;
    Player       player_;
    Dealer       dealer_;
    CardCallback on_card_exposed_;

    RoundPhase                  phase_ = RoundPhase::IDLE;
    bool                        early_check_done_ = false;
    bool                        dealer_done_ = false;
    std::optional<RoundSummary> early_summary_;

    void expose(Card card) const;
    Card deal_to_player(size_t hand_index);
    Card deal_to_dealer(bool face_up);
    void require_cards(int count) const;
    void reject_action(Action action, size_t hand_index) const;
    RoundSummary create_summary(std::vector<HandResult> hand_results) const;
};

} // namespace bj_engine

#endif // BJ_GAME_ENGINE_H
