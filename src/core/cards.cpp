#include "core/cards.hpp"
#include <stdexcept>
#include <cctype>
#include <cstring>

namespace bj_engine {

namespace {

// Indexés par la valeur des enums Rank/Suit
constexpr char RANK_CHARS[] = "23456789TJQKA";
constexpr char SUIT_CHARS[] = "cdhs";

// Position de c dans la table, -1 si absent
int index_in(const char* table, char c) {
    if (c == '\0') return -1;
    const char* found = std::strchr(table, c);
    return found ? static_cast<int>(found - table) : -1;
}

} // namespace

std::vector<Card> create_deck() {
    std::vector<Card> cards;
    cards.reserve(DECK_SIZE);
    for (int s = 0; s < 4; ++s) {
        for (int r = 0; r < 13; ++r) {
            cards.push_back(make_card(static_cast<Rank>(r), static_cast<Suit>(s)));
        }
    }
    return cards;
}

std::string to_string(Card c) {
    if (c >= INVALID_CARD) return "??";
    return {RANK_CHARS[static_cast<int>(get_rank(c))], SUIT_CHARS[static_cast<int>(get_suit(c))]};
}

Card card_from_string(const std::string& s) {
    if (s.length() != 2) {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    const int r = index_in(RANK_CHARS, static_cast<char>(std::toupper(static_cast<unsigned char>(s[0]))));
    const int su = index_in(SUIT_CHARS, static_cast<char>(std::tolower(static_cast<unsigned char>(s[1]))));
    if (r < 0) throw std::invalid_argument("Invalid card string '" + s + "': bad rank");
    if (su < 0) throw std::invalid_argument("Invalid card string '" + s + "': bad suit");
    return make_card(static_cast<Rank>(r), static_cast<Suit>(su));
}

} // namespace bj_engine
