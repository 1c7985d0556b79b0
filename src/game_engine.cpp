#include "bj/game_engine.h"
#include "bj/errors.h"
#include "bj/game_utils.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace bj_engine {

namespace {

const GameConfig& validated(const GameConfig& config) {
    config.validate();
    return config;
}

} // namespace

// -----------------------------------------------------------------------------
//  Résumés
// -----------------------------------------------------------------------------
std::string HandResult::to_string() const {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << std::showpos
       << round_result_to_string(result) << ": " << hand.to_string() << " -> $" << payout;
    return ss.str();
}

std::string RoundSummary::to_string() const {
    std::stringstream ss;
    ss << "Dealer: " << dealer_hand.to_string() << "\nPlayer hands:\n";
    for (const auto& hr : player_hands) {
        ss << "  " << hr.to_string() << "\n";
    }
    ss << std::fixed << std::setprecision(2) << std::showpos << "Net: $" << total_payout;
    return ss.str();
}

// -----------------------------------------------------------------------------
//  Constructeurs
// -----------------------------------------------------------------------------
GameEngine::GameEngine(const GameConfig& config, CardCallback on_card_exposed)
    : config_          (validated(config)),
      shoe_            (config.penetration),
      player_          (config.starting_bankroll, config.max_splits),
      dealer_          (config.dealer_rule),
      on_card_exposed_ (std::move(on_card_exposed))
{
    spdlog::debug("GameEngine initialisé: {}", bj_engine::to_string(config_));
}

GameEngine::GameEngine(const GameConfig& config, Shoe shoe, CardCallback on_card_exposed)
    : config_          (validated(config)),
      shoe_            (std::move(shoe)),
      player_          (config.starting_bankroll, config.max_splits),
      dealer_          (config.dealer_rule),
      on_card_exposed_ (std::move(on_card_exposed))
{
    if (shoe_.penetration() != config_.penetration) {
        throw std::invalid_argument("GameEngine: shoe penetration differs from configured penetration");
    }
    spdlog::debug("GameEngine initialisé (sabot fourni): {}", bj_engine::to_string(config_));
}

// -----------------------------------------------------------------------------
//  Distribution
// -----------------------------------------------------------------------------
void GameEngine::expose(Card card) const {
    spdlog::trace("Carte exposée: {}", to_string(card));
    if (on_card_exposed_) on_card_exposed_(card);
}

Card GameEngine::deal_to_player(size_t hand_index) {
    const Card card = shoe_.deal();
    Hand& hand = player_.get_hand(hand_index);
    hand.add_card(card);
    expose(card);
    spdlog::debug("Main {} reçoit {} -> {}", hand_index, to_string(card), hand.to_string());
    return card;
}

Card GameEngine::deal_to_dealer(bool face_up) {
    const Card card = shoe_.deal();
    dealer_.receive_card(card);
    if (face_up) {
        expose(card);
        spdlog::debug("Dealer reçoit {}", to_string(card));
    } else {
        spdlog::debug("Dealer reçoit sa carte fermée");
    }
    return card;
}

// Vérifié avant toute mutation pour qu'une action échoue sans effet partiel
void GameEngine::require_cards(int count) const {
    if (shoe_.cards_remaining() < count) {
        throw ShoeExhaustedError("Shoe has " + std::to_string(shoe_.cards_remaining()) +
                                 " cards left, " + std::to_string(count) + " needed");
    }
}

// -----------------------------------------------------------------------------
//  1. start_round
// -----------------------------------------------------------------------------
InitialDeal GameEngine::start_round(std::optional<double> bet) {
    const double amount = bet.value_or(config_.base_bet);
    if (amount <= 0.0) throw std::invalid_argument("Bet must be > 0");
    if (amount > player_.get_bankroll()) {
        throw InsufficientFundsError("Bet " + std::to_string(amount) + " exceeds bankroll " +
                                     std::to_string(player_.get_bankroll()));
    }
    if (phase_ == RoundPhase::PLAYER_TURN || phase_ == RoundPhase::DEALER_TURN) {
        spdlog::warn("start_round: tour précédent abandonné en phase {}", round_phase_to_string(phase_));
    }

    phase_ = RoundPhase::DEALING;
    early_check_done_ = false;
    dealer_done_ = false;
    early_summary_.reset();

    // Une pénétration proche de 1 peut laisser moins d'une donne sans atteindre le seuil
    if (shoe_.needs_shuffle() || shoe_.cards_remaining() < INITIAL_DEAL_CARDS) {
        spdlog::info("Remélange du sabot (pénétration {:.0f}%, {} cartes restantes)",
                     shoe_.penetration_reached() * 100.0, shoe_.cards_remaining());
        shoe_.shuffle();
        // La carte brûlée est visible: elle doit être comptée
        const std::vector<Card> burned = shoe_.burn(1);
        spdlog::debug("Cartes brûlées: {}", vec_to_string(burned));
        for (Card card : burned) expose(card);
    }
    require_cards(INITIAL_DEAL_CARDS);

    player_.new_hand(amount);
    dealer_.new_hand();

    deal_to_player(0);        // Joueur 1
    deal_to_dealer(true);     // Carte visible du croupier
    deal_to_player(0);        // Joueur 2
    deal_to_dealer(false);    // Carte fermée: PAS exposée

    phase_ = RoundPhase::PLAYER_TURN;
    spdlog::debug("Donne initiale: joueur {} | dealer {}", player_.get_hand(0).to_string(), dealer_.showing());
    return InitialDeal{player_.get_hand(0), dealer_.upcard()};
}

// -----------------------------------------------------------------------------
//  2. check_early_blackjack: peek unique du croupier
// -----------------------------------------------------------------------------
std::optional<RoundSummary> GameEngine::check_early_blackjack() {
    if (early_check_done_) return early_summary_;
    if (phase_ != RoundPhase::PLAYER_TURN) {
        throw std::logic_error(std::string("check_early_blackjack: no round in progress (phase ") +
                               round_phase_to_string(phase_) + ")");
    }
    early_check_done_ = true;

    Hand& player_hand = player_.get_hand(0);
    const bool player_bj = player_hand.is_blackjack();
    const bool dealer_might_have_bj = dealer_.upcard_is_ace() || dealer_.upcard_is_ten();

    if (!player_bj && !dealer_might_have_bj) return std::nullopt;

    // Le peek ne révèle rien au compteur: seule une révélation effective expose la carte fermée
    const bool dealer_bj = dealer_.has_blackjack();
    spdlog::debug("Peek: joueur BJ={} dealer BJ={}", player_bj, dealer_bj);

    const double bet = player_hand.get_bet();
    std::vector<HandResult> results;

    if (dealer_bj) {
        expose(dealer_.reveal_hole_card());
        dealer_.mark_blackjack();
        if (player_bj) {
            player_hand.mark_blackjack();
            player_.receive_payout(bet);
            results.push_back({player_hand, RoundResult::PUSH, 0.0});
        } else {
            results.push_back({player_hand, RoundResult::LOSE, -bet});
        }
    } else if (player_bj) {
        const double payout = bet * config_.blackjack_payout;
        player_hand.mark_blackjack();
        player_.receive_payout(bet + payout);
        expose(dealer_.reveal_hole_card());
        results.push_back({player_hand, RoundResult::BLACKJACK, payout});
    } else {
        return std::nullopt;
    }

    phase_ = RoundPhase::RESOLVED;
    early_summary_ = create_summary(std::move(results));
    spdlog::info("Résolution anticipée: {} (net {:+.2f}, bankroll {:.2f})",
                 round_result_to_string(early_summary_->player_hands.front().result),
                 early_summary_->total_payout, player_.get_bankroll());
    return early_summary_;
}

// -----------------------------------------------------------------------------
//  3. get_available_actions
// -----------------------------------------------------------------------------
std::vector<Action> GameEngine::get_available_actions(size_t hand_index) const {
    std::vector<Action> actions;
    if (phase_ != RoundPhase::PLAYER_TURN || !early_check_done_ || hand_index >= player_.num_hands()) {
        spdlog::trace("get_available_actions: aucune action (phase {}, peek {}, main {})",
                      round_phase_to_string(phase_), early_check_done_, hand_index);
        return actions;
    }

    const Hand& hand = player_.get_hand(hand_index);
    const bool covers_bet = player_.get_bankroll() >= hand.get_bet();
    const bool ace_resplit_blocked = hand.is_split_hand() && hand.is_pair() &&
                                     is_ace(hand.get_cards()[0]) && !config_.resplit_aces;

    if (hand.can_hit()) actions.push_back(Action::HIT);
    if (hand.can_stand()) actions.push_back(Action::STAND);
    if (hand.can_double() && covers_bet && (!hand.is_split_hand() || config_.allow_das)) {
        actions.push_back(Action::DOUBLE);
    }
    if (hand.can_split() && player_.can_split_more() && covers_bet && !ace_resplit_blocked) {
        actions.push_back(Action::SPLIT);
    }
    if (hand.can_surrender() && config_.allow_surrender) actions.push_back(Action::SURRENDER);

    spdlog::trace("Actions main {}: {}", hand_index, actions_to_string(actions));
    return actions;
}

// Lève l'erreur la plus précise pour une action absente de l'ensemble légal
void GameEngine::reject_action(Action action, size_t hand_index) const {
    spdlog::warn("Action {} refusée sur la main {}", action_to_string(action), hand_index);
    const Hand& hand = player_.get_hand(hand_index);
    const std::string what = "Illegal action " + action_to_string(action) + " on hand " + std::to_string(hand_index);

    if (action == Action::SPLIT && hand.can_split() && !player_.can_split_more()) {
        throw SplitLimitError("Maximum splits (" + std::to_string(player_.get_max_splits()) + ") reached");
    }
    const bool hand_allows = (action == Action::SPLIT && hand.can_split()) ||
                             (action == Action::DOUBLE && hand.can_double());
    if (hand_allows && player_.get_bankroll() < hand.get_bet()) {
        throw InsufficientFundsError(what + ": bankroll " + std::to_string(player_.get_bankroll()) +
                                     " < bet " + std::to_string(hand.get_bet()));
    }
    throw IllegalActionError(what);
}

// -----------------------------------------------------------------------------
//  4. execute_action: légalité revérifiée ici
// -----------------------------------------------------------------------------
std::optional<Card> GameEngine::execute_action(Action action, size_t hand_index) {
    if (phase_ != RoundPhase::PLAYER_TURN) {
        throw IllegalActionError(std::string("No player action allowed in phase ") + round_phase_to_string(phase_));
    }
    if (!early_check_done_) {
        throw std::logic_error("check_early_blackjack() must run before player actions");
    }
    if (hand_index >= player_.num_hands()) {
        throw std::out_of_range("Idx main " + std::to_string(hand_index));
    }

    const std::vector<Action> legal = get_available_actions(hand_index);
    if (std::find(legal.begin(), legal.end(), action) == legal.end()) {
        reject_action(action, hand_index);
    }

    std::optional<Card> dealt;
    switch (action) {
        case Action::HIT: {
            require_cards(1);
            dealt = deal_to_player(hand_index);
            break;
        }
        case Action::STAND: {
            player_.get_hand(hand_index).stand();
            spdlog::debug("Main {} STAND", hand_index);
            break;
        }
        case Action::DOUBLE: {
            require_cards(1);
            player_.double_down(hand_index);
            dealt = deal_to_player(hand_index);
            Hand& hand = player_.get_hand(hand_index);
            if (!hand.is_busted()) hand.stand();
            break;
        }
        case Action::SPLIT: {
            require_cards(2);
            player_.split_hand(hand_index);
            deal_to_player(hand_index);
            deal_to_player(hand_index + 1);
            break;
        }
        case Action::SURRENDER: {
            player_.surrender_hand(hand_index);
            break;
        }
        default: throw IllegalActionError("Type action inconnu");
    }

    if (player_.all_hands_complete()) {
        spdlog::debug("Toutes les mains du joueur sont terminées");
    }
    return dealt;
}

// -----------------------------------------------------------------------------
//  5. play_dealer
// -----------------------------------------------------------------------------
void GameEngine::play_dealer() {
    if (phase_ != RoundPhase::PLAYER_TURN) {
        throw std::logic_error(std::string("play_dealer: invalid phase ") + round_phase_to_string(phase_));
    }
    if (!early_check_done_) {
        throw std::logic_error("check_early_blackjack() must run before dealer play");
    }
    if (!player_.all_hands_complete()) {
        throw std::logic_error("play_dealer: player still has an active hand");
    }
    phase_ = RoundPhase::DEALER_TURN;

    if (!dealer_.is_hole_card_revealed()) {
        expose(dealer_.reveal_hole_card());
    }
    // Sabot épuisé pendant le tirage: le tour reste en DEALER_TURN sans dealer_done_, donc non résolvable
    dealer_.play([this]() {
        const Card card = shoe_.deal();
        expose(card);
        return card;
    });
    dealer_done_ = true;
    spdlog::debug("Dealer: {}", vec_to_string(dealer_.get_hand().get_cards()));
}

// -----------------------------------------------------------------------------
//  6. resolve_round
// -----------------------------------------------------------------------------
RoundSummary GameEngine::resolve_round() {
    if (phase_ != RoundPhase::DEALER_TURN) {
        throw std::logic_error(std::string("resolve_round: dealer has not played (phase ") +
                               round_phase_to_string(phase_) + ")");
    }
    if (!dealer_done_) {
        throw std::logic_error("resolve_round: dealer turn did not complete, round cannot be settled");
    }

    const int  dealer_value  = dealer_.final_value();
    const bool dealer_busted = dealer_.is_busted();
    std::vector<HandResult> results;

    for (const Hand& hand : player_.get_hands()) {
        const double bet = hand.get_bet();

        // Déjà remboursé de moitié: chiffre informatif, pas de second débit
        if (hand.get_status() == HandStatus::SURRENDERED) {
            results.push_back({hand, RoundResult::SURRENDER, -bet / 2.0});
            continue;
        }
        // Une main sautée perd toujours, même si le croupier saute ensuite
        if (hand.is_busted()) {
            results.push_back({hand, RoundResult::LOSE, -bet});
            continue;
        }

        const int player_value = hand.value();
        if (dealer_busted || player_value > dealer_value) {
            player_.receive_payout(bet * 2.0);
            results.push_back({hand, RoundResult::WIN, bet});
        } else if (player_value < dealer_value) {
            results.push_back({hand, RoundResult::LOSE, -bet});
        } else {
            player_.receive_payout(bet);
            results.push_back({hand, RoundResult::PUSH, 0.0});
        }
    }

    phase_ = RoundPhase::RESOLVED;
    RoundSummary summary = create_summary(std::move(results));
    spdlog::info("Tour résolu: dealer {} | net {:+.2f} | bankroll {:.2f}",
                 dealer_.get_hand().to_string(), summary.total_payout, player_.get_bankroll());
    return summary;
}

RoundSummary GameEngine::create_summary(std::vector<HandResult> hand_results) const {
    RoundSummary summary;
    summary.total_payout = 0.0;
    for (const auto& hr : hand_results) summary.total_payout += hr.payout;
    summary.player_hands = std::move(hand_results);
    summary.dealer_hand = dealer_.get_hand();
    return summary;
}

} // namespace bj_engine
