#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include <stdexcept>
#include <string>
#include <algorithm> // Pour std::copy
#include <utility>   // Pour std::swap

namespace lir {

uint64_t bounded_random(std::mt19937_64& rng, uint64_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("bounded_random: bound must be positive.");
    }
    // Rejet des valeurs sous 2^64 mod bound pour garder l'uniformité
    const uint64_t threshold = (0 - bound) % bound;
    while (true) {
        uint64_t r = rng();
        if (r >= threshold) {
            return r % bound;
        }
    }
}

Deck::Deck() {
    // Ordre canonique : couleur puis rang
    for (int i = 0; i < NUM_DECK_CARDS; ++i) {
        cards_[i] = card_from_index(i);
    }
}

void Deck::shuffle(std::mt19937_64& rng) {
    const int first = next_card_index_;
    for (int i = NUM_DECK_CARDS - 1; i > first; --i) {
        int j = first + static_cast<int>(bounded_random(rng, static_cast<uint64_t>(i - first + 1)));
        std::swap(cards_[i], cards_[j]);
    }
}

std::span<const Card> Deck::deal(int n) {
    if (n < 1) {
        throw std::invalid_argument("Deck::deal: card count must be at least 1, got " + std::to_string(n) + ".");
    }
    if (n > get_cards_remaining()) {
        throw DeckEmptyError("Cannot deal " + std::to_string(n) + " cards, only "
                             + std::to_string(get_cards_remaining()) + " remaining.");
    }
    std::span<const Card> dealt(cards_.data() + next_card_index_, static_cast<size_t>(n));
    next_card_index_ += n;
    return dealt;
}

void Deck::deal_into(std::span<Card> out) {
    auto dealt = deal(static_cast<int>(out.size()));
    std::copy(dealt.begin(), dealt.end(), out.begin());
}

void Deck::reset() {
    next_card_index_ = 0;
}

std::span<const Card> Deck::get_dealt_cards() const {
    return std::span<const Card>(cards_.data(), static_cast<size_t>(next_card_index_));
}

std::span<const Card> Deck::get_remaining_cards() const {
    return std::span<const Card>(cards_.data() + next_card_index_,
                                 static_cast<size_t>(get_cards_remaining()));
}

RankCounts Deck::remaining_rank_counts() const {
    RankCounts counts{};
    for (Card c : get_remaining_cards()) {
        ++counts[rank_value(c.rank)];
    }
    return counts;
}

void Deck::set_cards_for_testing(const std::vector<Card>& specific_deck) {
    if (specific_deck.size() != static_cast<size_t>(NUM_DECK_CARDS)) {
        throw std::invalid_argument("Specific deck for testing must contain exactly " + std::to_string(NUM_DECK_CARDS) + " cards.");
    }
    if (cards_to_board(specific_deck) != FULL_DECK) {
        throw std::invalid_argument("Specific deck for testing must contain each of the 52 cards exactly once.");
    }
    std::copy(specific_deck.begin(), specific_deck.end(), cards_.begin());
    next_card_index_ = 0; // Reset l'index pour commencer à dealer depuis le début du deck fourni
}

} // namespace lir
