// CaveGen Core
// random.hpp - Seeded pseudo-random streams shared by every generation stage

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cavegen::core {

// ============================================================================
// Random Source Interface
// ============================================================================

// Every stage that needs randomness takes a RandomSource& so a run is fully
// determined by the generators handed to it.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform double in [0, 1)
    [[nodiscard]] virtual double next_uniform() = 0;
};

// ============================================================================
// Seeded Random
// ============================================================================

// xoshiro256** stream keyed by a seed string.
//
// Seeding: the seed bytes are hashed with 64-bit FNV-1a, the hash drives a
// SplitMix64 sequence and its first four outputs become the xoshiro state.
// next_uniform() takes the top 53 bits of each output, so the same seed
// string yields the same double sequence on every platform.
// std::mt19937 with std::uniform_real_distribution is not used because the
// distributions differ between standard libraries, which would change levels.
class SeededRandom final : public RandomSource {
public:
    explicit SeededRandom(std::string_view seed);

    [[nodiscard]] double next_uniform() override;

    /// Raw 64-bit output
    [[nodiscard]] uint64_t next_u64();

    /// Independent stream for a named stage, seeded by "<seed>:<label>"
    [[nodiscard]] SeededRandom derive(std::string_view label) const;

    [[nodiscard]] const std::string& seed() const { return seed_; }

    /// 64-bit FNV-1a over the seed bytes
    [[nodiscard]] static uint64_t hash_seed(std::string_view seed);

private:
    std::string seed_;
    std::array<uint64_t, 4> state_{};
};

// ============================================================================
// Helpers
// ============================================================================

/// Integer in [min, max] inclusive: floor(r * (max - min + 1)) + min
[[nodiscard]] int random_int(RandomSource& rng, int min, int max);

/// Double in [min, max)
[[nodiscard]] double random_float(RandomSource& rng, double min, double max);

/// Index in [0, count)
[[nodiscard]] size_t random_index(RandomSource& rng, size_t count);

/// True with the given probability
[[nodiscard]] bool random_chance(RandomSource& rng, double probability);

template <typename T>
[[nodiscard]] const T& random_choice(RandomSource& rng, std::span<const T> items) {
    if (items.empty()) {
        throw std::invalid_argument("random_choice requires a non-empty range");
    }
    return items[random_index(rng, items.size())];
}

template <typename T>
[[nodiscard]] const T& random_choice(RandomSource& rng, const std::vector<T>& items) {
    return random_choice(rng, std::span<const T>(items));
}

/// Index drawn proportionally to non-negative weights
[[nodiscard]] size_t weighted_index(RandomSource& rng, std::span<const double> weights);

template <typename T>
[[nodiscard]] const T& weighted_choice(RandomSource& rng, const std::vector<T>& items,
                                       const std::vector<double>& weights) {
    if (items.empty() || items.size() != weights.size()) {
        throw std::invalid_argument("weighted_choice requires matching, non-empty items and weights");
    }
    return items[weighted_index(rng, weights)];
}

/// Fisher-Yates shuffle in place
template <typename T>
void shuffle(RandomSource& rng, std::vector<T>& items) {
    for (size_t i = items.size(); i > 1; --i) {
        size_t j = random_index(rng, i);
        std::swap(items[i - 1], items[j]);
    }
}

}  // namespace cavegen::core
