#include "bj/player.h"
#include "bj/errors.h"
#include "test_utils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>

using namespace bj_engine;
using bj_test::C;
using Catch::Matchers::WithinAbs;

namespace {

// Joueur avec une main de départ à deux cartes
Player player_with(double bankroll, double bet, const std::string& c1, const std::string& c2,
                   int max_splits = Player::DEFAULT_MAX_SPLITS) {
    Player player(bankroll, max_splits);
    Hand& hand = player.new_hand(bet);
    hand.add_card(C(c1));
    hand.add_card(C(c2));
    return player;
}

} // namespace

TEST_CASE("Player construction", "[Player]") {
    REQUIRE_THROWS_AS(Player(-1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(Player(100.0, 4), std::invalid_argument);
    REQUIRE_THROWS_AS(Player(100.0, -1), std::invalid_argument);

    Player player(100.0);
    REQUIRE(player.get_bankroll() == 100.0);
    REQUIRE(player.get_max_splits() == 3);
    REQUIRE(player.num_hands() == 0);
    REQUIRE(player.all_hands_complete());
    REQUIRE_FALSE(player.active_hand_index().has_value());
}

TEST_CASE("Player::new_hand debits the bet", "[Player][bet]") {
    Player player(100.0);

    SECTION("Valid bet") {
        Hand& hand = player.new_hand(25.0);
        REQUIRE(hand.get_bet() == 25.0);
        REQUIRE(player.get_bankroll() == 75.0);
        REQUIRE(player.num_hands() == 1);
        REQUIRE(player.active_hand_index() == std::optional<size_t>(0));
    }

    SECTION("Whole bankroll can be bet") {
        player.new_hand(100.0);
        REQUIRE(player.get_bankroll() == 0.0);
    }

    SECTION("Non-positive bet") {
        REQUIRE_THROWS_AS(player.new_hand(0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(player.new_hand(-5.0), std::invalid_argument);
        REQUIRE(player.get_bankroll() == 100.0);
    }

    SECTION("Bet above bankroll") {
        REQUIRE_THROWS_AS(player.new_hand(100.01), InsufficientFundsError);
        REQUIRE(player.get_bankroll() == 100.0);
        REQUIRE(player.num_hands() == 0);
    }
}

TEST_CASE("Player::split_hand", "[Player][split]") {
    SECTION("Halves keep their position and the bankroll pays a second bet") {
        Player player = player_with(100.0, 10.0, "8c", "8d");
        auto halves = player.split_hand(0);

        REQUIRE(halves.first.get_cards() == std::vector<Card>{C("8c")});
        REQUIRE(halves.second.get_cards() == std::vector<Card>{C("8d")});
        REQUIRE(player.num_hands() == 2);
        REQUIRE(player.get_hand(0).get_cards() == std::vector<Card>{C("8c")});
        REQUIRE(player.get_hand(1).get_cards() == std::vector<Card>{C("8d")});
        REQUIRE(player.get_bankroll() == 80.0);
        REQUIRE(player.split_count() == 1);
        REQUIRE(player.total_bet() == 20.0);
    }

    SECTION("Resplit inserts right after the split hand") {
        Player player = player_with(100.0, 10.0, "8c", "8d");
        player.split_hand(0);
        player.get_hand(0).add_card(C("8h"));
        player.get_hand(1).add_card(C("2s"));
        player.split_hand(0);

        REQUIRE(player.num_hands() == 3);
        REQUIRE(player.get_hand(0).get_cards() == std::vector<Card>{C("8c")});
        REQUIRE(player.get_hand(1).get_cards() == std::vector<Card>{C("8h")});
        REQUIRE(player.get_hand(2).get_cards() == std::vector<Card>{C("8d"), C("2s")});
        REQUIRE(player.get_bankroll() == 70.0);
    }

    SECTION("Split limit") {
        Player player = player_with(100.0, 10.0, "8c", "8d", 0);
        REQUIRE_FALSE(player.can_split_more());
        REQUIRE_THROWS_AS(player.split_hand(0), SplitLimitError);
        REQUIRE(player.num_hands() == 1);
        REQUIRE(player.get_bankroll() == 90.0);
    }

    SECTION("Not a pair") {
        Player player = player_with(100.0, 10.0, "8c", "9d");
        REQUIRE_THROWS_AS(player.split_hand(0), IllegalActionError);
    }

    SECTION("Bankroll too small for the second bet") {
        Player player = player_with(15.0, 10.0, "8c", "8d");
        REQUIRE_THROWS_AS(player.split_hand(0), InsufficientFundsError);
        REQUIRE(player.num_hands() == 1);
        REQUIRE(player.get_bankroll() == 5.0);
    }

    SECTION("Bad index") {
        Player player = player_with(100.0, 10.0, "8c", "8d");
        REQUIRE_THROWS_AS(player.split_hand(1), std::out_of_range);
    }
}

TEST_CASE("Player::double_down", "[Player][double]") {
    SECTION("Debits an equal amount and doubles the hand bet") {
        Player player = player_with(100.0, 10.0, "5c", "6d");
        player.double_down(0);
        REQUIRE(player.get_bankroll() == 80.0);
        REQUIRE(player.get_hand(0).get_bet() == 20.0);
        REQUIRE(player.get_hand(0).get_status() == HandStatus::DOUBLED);
        REQUIRE_FALSE(player.active_hand_index().has_value());
    }

    SECTION("Insufficient funds leaves everything untouched") {
        Player player = player_with(15.0, 10.0, "5c", "6d");
        REQUIRE_THROWS_AS(player.double_down(0), InsufficientFundsError);
        REQUIRE(player.get_bankroll() == 5.0);
        REQUIRE(player.get_hand(0).get_bet() == 10.0);
        REQUIRE(player.get_hand(0).get_status() == HandStatus::ACTIVE);
    }

    SECTION("Only on the first two cards") {
        Player player = player_with(100.0, 10.0, "2c", "3d");
        player.get_hand(0).add_card(C("4h"));
        REQUIRE_THROWS_AS(player.double_down(0), IllegalActionError);
    }
}

TEST_CASE("Player::surrender_hand refunds half the bet", "[Player][surrender]") {
    Player player = player_with(100.0, 10.0, "Tc", "6d");
    REQUIRE_THAT(player.surrender_hand(0), WithinAbs(5.0, 1e-9));
    REQUIRE_THAT(player.get_bankroll(), WithinAbs(95.0, 1e-9));
    REQUIRE(player.get_hand(0).get_status() == HandStatus::SURRENDERED);
    REQUIRE(player.all_hands_complete());
    REQUIRE_THROWS_AS(player.surrender_hand(0), IllegalActionError);
}

TEST_CASE("Player payouts and round reset", "[Player]") {
    Player player = player_with(100.0, 10.0, "Tc", "9d");
    player.receive_payout(20.0);
    REQUIRE(player.get_bankroll() == 110.0);
    REQUIRE_THROWS_AS(player.receive_payout(-1.0), std::invalid_argument);

    player.reset_for_round();
    REQUIRE(player.num_hands() == 0);
    REQUIRE(player.split_count() == 0);
    REQUIRE(player.get_bankroll() == 110.0);
    REQUIRE_THROWS_AS(player.get_hand(0), std::out_of_range);
}

TEST_CASE("Active hand follows the hand order", "[Player]") {
    Player player = player_with(100.0, 10.0, "8c", "8d");
    player.split_hand(0);
    player.get_hand(0).add_card(C("3h"));
    player.get_hand(1).add_card(C("Ts"));

    REQUIRE(player.active_hand_index() == std::optional<size_t>(0));
    player.get_hand(0).stand();
    REQUIRE(player.active_hand_index() == std::optional<size_t>(1));
    player.get_hand(1).stand();
    REQUIRE_FALSE(player.active_hand_index().has_value());
    REQUIRE(player.all_hands_complete());
}
