#include "bj/game_engine.h"
#include "bj/game_config.h"
#include "bj/game_utils.hpp"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cerr
#include <string>     // std::string
#include <vector>     // std::vector
#include <exception>  // std::exception
#include <map>        // std::map

int main(int /*argc*/, char* /*argv*/[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Démarrage du simulateur de blackjack…");

    // ─────────────────────────────────────────────────────────────
    // Paramètres généraux
    // ─────────────────────────────────────────────────────────────
    const int    num_rounds      = 50;
    const int    stand_threshold = 17;   // Politique « comme le croupier »
    const double bet_size        = 10.0;

    bj_engine::GameConfig config = bj_engine::GameConfig::defaults();
    config.dealer_rule       = bj_engine::DealerRule::H17;
    config.penetration       = 0.65;
    config.blackjack_payout  = 1.5;
    config.starting_bankroll = 1000.0;
    config.base_bet          = bet_size;

    try
    {
        // 1. Moteur + callback d'exposition (ici un simple compteur de cartes vues)
        int exposed_cards = 0;
        bj_engine::GameEngine engine(config, [&exposed_cards](bj_engine::Card card) {
            ++exposed_cards;
            spdlog::debug("Exposée: {}", bj_engine::to_string(card));
        });
        spdlog::info("Règles: {}", bj_engine::to_string(config));

        std::map<bj_engine::RoundResult, int> tally;
        int rounds_played = 0;

        // 2. Boucle de tours
        for (int round = 1; round <= num_rounds; ++round)
        {
            if (engine.get_bankroll() < config.base_bet) {
                spdlog::warn("Bankroll insuffisante ({:.2f}) ; arrêt après {} tours.",
                             engine.get_bankroll(), rounds_played);
                break;
            }

            const auto deal = engine.start_round();
            spdlog::debug("Tour {}: joueur {} | dealer montre {}", round,
                          deal.player_hand.to_string(), bj_engine::to_string(deal.dealer_upcard));

            bj_engine::RoundSummary summary;
            if (auto early = engine.check_early_blackjack()) {
                summary = *early;
            } else {
                // Le joueur tire sous le seuil, reste ensuite; pas de double/split/abandon
                const auto& player = engine.get_player();
                while (auto idx = player.active_hand_index()) {
                    const auto& hand = player.get_hand(*idx);
                    const bj_engine::Action action = hand.value() < stand_threshold
                                                   ? bj_engine::Action::HIT
                                                   : bj_engine::Action::STAND;
                    engine.execute_action(action, *idx);
                }
                engine.play_dealer();
                summary = engine.resolve_round();
            }

            for (const auto& hr : summary.player_hands) tally[hr.result]++;
            ++rounds_played;
            spdlog::info("Tour {} :\n{}", round, summary.to_string());
        }

        // 3. Bilan
        spdlog::info("Tours joués : {} | cartes exposées : {} | bankroll finale : {:.2f} ({:+.2f})",
                     rounds_played, exposed_cards, engine.get_bankroll(),
                     engine.get_bankroll() - config.starting_bankroll);
        for (const auto& [result, count] : tally) {
            spdlog::info("  {:<10} {}", bj_engine::round_result_to_string(result), count);
        }
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
