#include "core/shoe.hpp"
#include "bj/errors.h"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace bj_engine {

namespace {

void validate_penetration(double penetration) {
    if (!(penetration >= 0.0 && penetration <= 1.0)) {
        throw std::invalid_argument("Shoe penetration must be within [0, 1], got " + std::to_string(penetration));
    }
}

} // namespace

Shoe::Shoe(double penetration)
    : cards_(),
      next_card_index_(0),
      dealt_count_(0),
      penetration_(penetration)
{
    validate_penetration(penetration);
    std::random_device rd;
    rng_.seed(rd());
    shuffle();
}

Shoe::Shoe(double penetration, uint32_t seed)
    : cards_(),
      next_card_index_(0),
      dealt_count_(0),
      penetration_(penetration),
      rng_(seed)
{
    validate_penetration(penetration);
    shuffle();
}

// Remet les 52 cartes dans le sabot puis les mélange
void Shoe::shuffle() {
    cards_ = create_deck();
    std::shuffle(cards_.begin(), cards_.end(), rng_);
    next_card_index_ = 0;
    dealt_count_ = 0;
    spdlog::debug("Shoe: mélange effectué ({} cartes)", cards_.size());
}

Card Shoe::deal() {
    if (next_card_index_ >= cards_.size()) {
        throw ShoeExhaustedError("Shoe is empty, cannot deal card. Check needs_shuffle() before the round.");
    }
    ++dealt_count_;
    return cards_[next_card_index_++];
}

// Les cartes brûlées sont retournées: elles sont visibles et doivent être comptées
std::vector<Card> Shoe::burn(int count) {
    std::vector<Card> burned;
    for (int i = 0; i < count && next_card_index_ < cards_.size(); ++i) {
        burned.push_back(deal());
    }
    if (static_cast<int>(burned.size()) < count) {
        spdlog::warn("Shoe: burn de {} cartes demandé, seulement {} disponibles", count, burned.size());
    }
    return burned;
}

std::vector<Card> Shoe::peek(int count) const {
    const size_t available = cards_.size() - next_card_index_;
    const size_t n = count < 0 ? 0 : std::min(static_cast<size_t>(count), available);
    return std::vector<Card>(cards_.begin() + next_card_index_, cards_.begin() + next_card_index_ + n);
}

int Shoe::cards_remaining() const {
    return static_cast<int>(cards_.size() - next_card_index_);
}

double Shoe::decks_remaining() const {
    return static_cast<double>(cards_remaining()) / DECK_SIZE;
}

double Shoe::penetration_reached() const {
    return static_cast<double>(dealt_count_) / DECK_SIZE;
}

// À vérifier AVANT un nouveau tour, jamais au milieu d'un tour
bool Shoe::needs_shuffle() const {
    return penetration_reached() >= penetration_;
}

void Shoe::set_cards_for_testing(const std::vector<Card>& specific_deck) {
    if (specific_deck.size() != static_cast<size_t>(DECK_SIZE)) {
        throw std::invalid_argument("Specific deck for testing must contain exactly " + std::to_string(DECK_SIZE) + " cards.");
    }
    std::vector<Card> sorted = specific_deck;
    std::sort(sorted.begin(), sorted.end());
    if (sorted != create_deck()) {
        throw std::invalid_argument("Specific deck for testing must be a permutation of the 52-card deck.");
    }
    cards_ = specific_deck;
    next_card_index_ = 0;
    dealt_count_ = 0;
}

std::string Shoe::to_string() const {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1)
       << "Shoe(" << cards_remaining() << " cards remaining, "
       << penetration_reached() * 100.0 << "% dealt, reshuffle at "
       << std::setprecision(0) << penetration_ * 100.0 << "%)";
    return ss.str();
}

} // namespace bj_engine
