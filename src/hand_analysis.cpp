#include "lir/hand_analysis.h"
#include <array>
#include <bit>       // Pour std::popcount
#include <cstdint>
#include <stdexcept>
#include <string>

namespace lir {

namespace {

constexpr int HIGH_CARD_THRESHOLD = 10; // Dix, Valet, Dame, Roi, As

// Masque des valeurs présentes : bit v pour la valeur v (1 = As bas, 14 = As haut)
using ValueMask = uint16_t;

constexpr ValueMask window_mask(int low) {
    return static_cast<ValueMask>(0x1F << low); // 5 valeurs consécutives à partir de low
}

inline int lowest_value(ValueMask m) { return std::countr_zero(m); }
inline int highest_value(ValueMask m) { return 15 - std::countl_zero(m); }

// Version ACE-low : l'As (bit 14) devient 1
inline ValueMask to_ace_low(ValueMask m) {
    if (m & (1u << 14)) {
        m = static_cast<ValueMask>((m & ~(1u << 14)) | (1u << 1));
    }
    return m;
}

struct StraightPotential {
    int connected = 0;
    int gaps = 0;
    bool open_ended = false;
    bool inside = false;
};

// Parcourt les fenêtres [low, low+4], low = 1..10, en lecture ACE-high puis ACE-low.
// La première fenêtre qui améliore le meilleur compte fixe le type de tirage.
StraightPotential analyze_straight_potential(ValueMask values, int num_cards) {
    StraightPotential out;
    if (num_cards < 3) {
        return out;
    }
    out.connected = 1;
    out.gaps = 4;

    std::array<ValueMask, 2> value_sets{values, 0};
    int num_sets = 1;
    const bool has_ace = (values & (1u << 14)) != 0;
    const bool has_low_cards = (values & 0x3C) != 0; // Valeurs 2..5
    if (has_ace && has_low_cards) {
        value_sets[num_sets++] = to_ace_low(values);
    }

    for (int s = 0; s < num_sets; ++s) {
        const ValueMask set = value_sets[s];
        if (std::popcount(set) < 3) continue;

        for (int low = 1; low <= 10; ++low) {
            const ValueMask in_window = set & window_mask(low);
            const int count = std::popcount(in_window);
            if (count < 3) continue;
            const int num_gaps = 5 - count;
            if (count > out.connected || (count == out.connected && num_gaps < out.gaps)) {
                out.connected = count;
                out.gaps = num_gaps;
                if (count == 4 && num_cards >= 4) {
                    const int min_v = lowest_value(in_window);
                    const int max_v = highest_value(in_window);
                    if (max_v - min_v == 3) {
                        // Quatre consécutives : ouvert sauf contre l'As (A-2-3-4 ou J-Q-K-A)
                        out.open_ended = min_v > 1 && max_v < 14;
                        out.inside = !out.open_ended;
                    } else {
                        out.open_ended = false;
                        out.inside = true;
                    }
                }
            }
        }
    }
    return out;
}

HandAnalysis analyze_cards(std::span<const Card> cards) {
    HandAnalysis a;
    const int n = static_cast<int>(cards.size());

    std::array<int, 15> rank_counts{};
    ValueMask values = 0;
    for (const Card& c : cards) {
        const int v = rank_value(c.rank);
        ++rank_counts[v];
        values |= static_cast<ValueMask>(1u << v);
        if (v >= HIGH_CARD_THRESHOLD) ++a.high_cards;
    }

    // Groupe assorti dominant ; à égalité, la couleur apparue en premier
    std::array<int, NUM_SUITS> suit_counts{};
    for (const Card& c : cards) ++suit_counts[static_cast<int>(c.suit)];
    Suit dominant = cards[0].suit;
    for (const Card& c : cards) {
        if (suit_counts[static_cast<int>(c.suit)] > suit_counts[static_cast<int>(dominant)]) {
            dominant = c.suit;
        }
    }
    a.suited_cards = suit_counts[static_cast<int>(dominant)];

    ValueMask suited_values = 0;
    for (const Card& c : cards) {
        if (c.suit != dominant) continue;
        const int v = rank_value(c.rank);
        suited_values |= static_cast<ValueMask>(1u << v);
        if (v >= HIGH_CARD_THRESHOLD) ++a.suited_high_cards;
    }

    const StraightPotential sp = analyze_straight_potential(values, n);
    a.connected_cards = sp.connected;
    a.gaps = sp.gaps;
    a.is_open_straight_draw = sp.open_ended;
    a.is_inside_straight_draw = sp.inside;

    // Mains faites
    int max_count = 0;
    int pair_count = 0;
    int pair_value = 0;
    for (int v = 2; v <= 14; ++v) {
        if (rank_counts[v] == 0) continue;
        if (rank_counts[v] > max_count) max_count = rank_counts[v];
        if (rank_counts[v] == 2) {
            ++pair_count;
            pair_value = v;
        }
    }
    a.has_trips = max_count >= 3; // Carré à 4 cartes compris
    a.has_two_pair = pair_count == 2;
    a.has_pair = max_count == 2 && !a.has_two_pair;
    if (a.has_pair) {
        a.pair_rank = static_cast<Rank>(pair_value);
        a.has_high_pair = pair_value >= HIGH_CARD_THRESHOLD;
    }
    a.has_paying_hand = a.has_trips || a.has_high_pair || a.has_two_pair;

    // Tirages : 3 assorties suffisent à 3 cartes, il en faut 4 à 4 cartes
    a.is_flush_draw = n == 3 ? a.suited_cards == 3 : a.suited_cards >= 4;
    a.is_straight_draw = n == 3 ? a.connected_cards >= 3 : a.connected_cards >= 4;

    if (a.is_flush_draw) {
        const int high_spread = highest_value(suited_values) - lowest_value(suited_values) + 1;
        int spread = high_spread;
        const bool has_ace = (suited_values & (1u << 14)) != 0;
        if (has_ace && lowest_value(suited_values) <= 5) {
            const ValueMask low = to_ace_low(suited_values);
            const int low_spread = highest_value(low) - lowest_value(low) + 1;
            if (low_spread < spread) spread = low_spread;
        }
        a.is_straight_flush_draw = spread <= 5;
        // Tirage royal : 3 figures assorties ou plus, As compris
        a.is_royal_draw = a.suited_high_cards >= 3 && has_ace;
        if (a.is_straight_flush_draw) {
            a.straight_flush_spread = spread;
        }
        constexpr ValueMask ACE_TWO_THREE = (1u << 14) | (1u << 2) | (1u << 3);
        constexpr ValueMask TWO_THREE_FOUR = (1u << 2) | (1u << 3) | (1u << 4);
        a.is_excluded_sf_consecutive = a.suited_cards == 3
            && (suited_values == ACE_TWO_THREE || suited_values == TWO_THREE_FOUR);
    }
    return a;
}

} // namespace

HandAnalysis analyze_three_cards(std::span<const Card> cards) {
    if (cards.size() != 3) {
        throw std::invalid_argument("Expected 3 cards, got " + std::to_string(cards.size()));
    }
    return analyze_cards(cards);
}

HandAnalysis analyze_four_cards(std::span<const Card> cards) {
    if (cards.size() != 4) {
        throw std::invalid_argument("Expected 4 cards, got " + std::to_string(cards.size()));
    }
    return analyze_cards(cards);
}

} // namespace lir
