#ifndef BJ_CORE_SHOE_HPP
#define BJ_CORE_SHOE_HPP

#include "core/cards.hpp"
#include <vector>
#include <random>
#include <string>
#include <cstdint>

namespace bj_engine {

// Sabot à un seul paquet: mélange, distribution séquentielle, pénétration, burn.
// Invariant: cards_remaining() + cards_dealt() == DECK_SIZE.
class Shoe {
public:
    static constexpr double DEFAULT_PENETRATION = 0.65;

    // Sabot neuf, déjà mélangé. Pénétration hors [0, 1] -> std::invalid_argument.
    explicit Shoe(double penetration = DEFAULT_PENETRATION);
    Shoe(double penetration, uint32_t seed);
    ~Shoe() = default;

    void shuffle();
    Card deal();
    std::vector<Card> burn(int count = 1);

    // Aperçu des prochaines cartes sans les distribuer (debug/tests uniquement)
    std::vector<Card> peek(int count = 1) const;

    int    cards_remaining() const;
    int    cards_dealt() const { return dealt_count_; }
    double decks_remaining() const;
    double penetration_reached() const;
    double penetration() const { return penetration_; }
    bool   needs_shuffle() const;

    // Installe un ordre exact (permutation des 52 cartes), la première carte sort en premier
    void set_cards_for_testing(const std::vector<Card>& specific_deck);

    std::string to_string() const;

private:
    std::vector<Card> cards_;
    size_t            next_card_index_;
    int               dealt_count_;
    double            penetration_;
    std::mt19937      rng_;
};

} // namespace bj_engine

#endif // BJ_CORE_SHOE_HPP
