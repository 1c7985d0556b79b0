#ifndef BJ_CARDS_HPP
#define BJ_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace bj_engine {

// Une carte est une simple valeur (rang + couleur) encodée sur 8 bits.
// Aucune identité au-delà du rang et de la couleur.
using Card = uint8_t;

// Nombre de cartes dans le paquet unique
constexpr int  DECK_SIZE    = 52;
// Constante pour une carte invalide/inconnue
constexpr Card INVALID_CARD = 52;

// Enum pour les couleurs (suits)
enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };
// Enum pour les rangs (ranks)
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

// Format: index 0-51 = suit * 13 + rank
constexpr Card make_card(Rank r, Suit s) {
    return static_cast<uint8_t>(s) * 13 + static_cast<uint8_t>(r);
}

constexpr Rank get_rank(Card c) {
    if (c >= INVALID_CARD) return static_cast<Rank>(13);
    return static_cast<Rank>(c % 13);
}

constexpr Suit get_suit(Card c) {
    if (c >= INVALID_CARD) return static_cast<Suit>(4);
    return static_cast<Suit>(c / 13);
}

// Valeur en points: 2-10 = valeur faciale, figures = 10, As = 11.
// La main se charge de ramener les As à 1 si besoin.
constexpr int card_value(Card c) {
    if (c >= INVALID_CARD) return 0;
    const Rank r = get_rank(c);
    if (r == Rank::ACE) return 11;
    if (r >= Rank::TEN) return 10;
    return static_cast<int>(r) + 2;
}

constexpr bool is_ace(Card c) { return c < INVALID_CARD && get_rank(c) == Rank::ACE; }
constexpr bool is_ten_value(Card c) { return card_value(c) == 10; }

// Les 52 cartes dans l'ordre canonique (trèfle, carreau, coeur, pique; 2..A)
std::vector<Card> create_deck();

// "As", "Td"; INVALID_CARD -> "??"
std::string to_string(Card c);

// Inverse de to_string(Card), insensible à la casse. std::invalid_argument sinon.
Card card_from_string(const std::string& s);

} // namespace bj_engine

#endif // BJ_CARDS_HPP
