#include "core/shoe.hpp"
#include "bj/errors.h"
#include "test_utils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <algorithm>
#include <set>
#include <vector>

using namespace bj_engine;
using bj_test::C;
using bj_test::stacked_deck;
using Catch::Matchers::WithinAbs;

TEST_CASE("Shoe construction", "[Shoe]") {
    SECTION("Fresh shoe holds the full deck") {
        Shoe shoe(0.65, 42u);
        REQUIRE(shoe.cards_remaining() == DECK_SIZE);
        REQUIRE(shoe.cards_dealt() == 0);
        REQUIRE_THAT(shoe.decks_remaining(), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(shoe.penetration_reached(), WithinAbs(0.0, 1e-9));
        REQUIRE_FALSE(shoe.needs_shuffle());
    }

    SECTION("Penetration outside [0, 1] is rejected") {
        REQUIRE_THROWS_AS(Shoe(-0.1, 1u), std::invalid_argument);
        REQUIRE_THROWS_AS(Shoe(1.5, 1u), std::invalid_argument);
        REQUIRE_NOTHROW(Shoe(0.0, 1u));
        REQUIRE_NOTHROW(Shoe(1.0, 1u));
    }
}

TEST_CASE("Shoe deals each card exactly once", "[Shoe][deal]") {
    Shoe shoe(1.0, 7u);
    std::set<Card> seen;
    for (int i = 0; i < DECK_SIZE; ++i) {
        const Card c = shoe.deal();
        REQUIRE(c < INVALID_CARD);
        REQUIRE(seen.insert(c).second);
        REQUIRE(shoe.cards_remaining() + shoe.cards_dealt() == DECK_SIZE);
    }
    REQUIRE(shoe.cards_remaining() == 0);
    REQUIRE_THROWS_AS(shoe.deal(), ShoeExhaustedError);
}

TEST_CASE("Same seed gives the same order", "[Shoe][shuffle]") {
    Shoe a(0.65, 1234u);
    Shoe b(0.65, 1234u);
    REQUIRE(a.peek(DECK_SIZE) == b.peek(DECK_SIZE));

    // Un paquet mélangé n'est (quasiment) jamais dans l'ordre canonique
    REQUIRE(a.peek(DECK_SIZE) != create_deck());
}

TEST_CASE("Shuffle restores all cards", "[Shoe][shuffle]") {
    Shoe shoe(0.5, 99u);
    for (int i = 0; i < 30; ++i) shoe.deal();
    REQUIRE(shoe.needs_shuffle());

    shoe.shuffle();
    REQUIRE(shoe.cards_remaining() == DECK_SIZE);
    REQUIRE(shoe.cards_dealt() == 0);
    REQUIRE_FALSE(shoe.needs_shuffle());

    auto cards = shoe.peek(DECK_SIZE);
    std::sort(cards.begin(), cards.end());
    REQUIRE(cards == create_deck());
}

TEST_CASE("Penetration threshold", "[Shoe][penetration]") {
    Shoe shoe(0.5, 3u);
    shoe.set_cards_for_testing(create_deck());

    for (int i = 0; i < 25; ++i) shoe.deal();
    REQUIRE_FALSE(shoe.needs_shuffle());
    shoe.deal();
    REQUIRE_THAT(shoe.penetration_reached(), WithinAbs(0.5, 1e-9));
    REQUIRE(shoe.needs_shuffle());

    SECTION("Zero penetration always asks for a shuffle") {
        Shoe eager(0.0, 3u);
        REQUIRE(eager.needs_shuffle());
    }
}

TEST_CASE("Burn and peek", "[Shoe][burn]") {
    Shoe shoe(0.65, 5u);
    shoe.set_cards_for_testing(stacked_deck({"As", "Kd", "7h"}));

    SECTION("peek does not deal") {
        REQUIRE(shoe.peek(2) == std::vector<Card>{C("As"), C("Kd")});
        REQUIRE(shoe.cards_dealt() == 0);
        REQUIRE(shoe.deal() == C("As"));
    }

    SECTION("burn returns the burned cards and counts them as dealt") {
        const auto burned = shoe.burn(2);
        REQUIRE(burned == std::vector<Card>{C("As"), C("Kd")});
        REQUIRE(shoe.cards_dealt() == 2);
        REQUIRE(shoe.deal() == C("7h"));
    }

    SECTION("burn past the end stops at the last card") {
        for (int i = 0; i < DECK_SIZE - 1; ++i) shoe.deal();
        const auto burned = shoe.burn(3);
        REQUIRE(burned.size() == 1);
        REQUIRE(shoe.cards_remaining() == 0);
        REQUIRE(shoe.peek(5).empty());
    }
}

TEST_CASE("set_cards_for_testing", "[Shoe][testing]") {
    Shoe shoe(0.65, 11u);

    SECTION("Installs the exact order and resets counters") {
        shoe.deal();
        shoe.set_cards_for_testing(stacked_deck({"Tc", "6s"}));
        REQUIRE(shoe.cards_dealt() == 0);
        REQUIRE(shoe.deal() == C("Tc"));
        REQUIRE(shoe.deal() == C("6s"));
        REQUIRE(shoe.deal() == C("2c"));
    }

    SECTION("Rejects anything that is not a permutation of the deck") {
        auto short_deck = create_deck();
        short_deck.pop_back();
        REQUIRE_THROWS_AS(shoe.set_cards_for_testing(short_deck), std::invalid_argument);

        auto duplicated = create_deck();
        duplicated[1] = duplicated[0];
        REQUIRE_THROWS_AS(shoe.set_cards_for_testing(duplicated), std::invalid_argument);
    }
}

TEST_CASE("Shoe::to_string", "[Shoe]") {
    Shoe shoe(0.65, 1u);
    REQUIRE(shoe.to_string() == "Shoe(52 cards remaining, 0.0% dealt, reshuffle at 65%)");
}
