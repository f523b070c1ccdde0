// CaveGen Core
// random.cpp - Seeded pseudo-random stream implementation

#include <cavegen/core/random.hpp>

#include <cmath>

namespace cavegen::core {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

[[nodiscard]] uint64_t splitmix64(uint64_t& state) {
    uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

[[nodiscard]] constexpr uint64_t rotl(uint64_t x, int k) {
    return (x << k) | (x >> (64 - k));
}

}  // namespace

// ============================================================================
// SeededRandom
// ============================================================================

SeededRandom::SeededRandom(std::string_view seed) : seed_(seed) {
    if (seed_.empty()) {
        throw std::invalid_argument("Seed must be a non-empty string");
    }

    uint64_t sm = hash_seed(seed_);
    for (auto& word : state_) {
        word = splitmix64(sm);
    }
}

uint64_t SeededRandom::hash_seed(std::string_view seed) {
    uint64_t hash = FNV_OFFSET_BASIS;
    for (char c : seed) {
        hash ^= static_cast<uint8_t>(c);
        hash *= FNV_PRIME;
    }
    return hash;
}

uint64_t SeededRandom::next_u64() {
    const uint64_t result = rotl(state_[1] * 5, 7) * 9;
    const uint64_t t = state_[1] << 17;

    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];
    state_[2] ^= t;
    state_[3] = rotl(state_[3], 45);

    return result;
}

double SeededRandom::next_uniform() {
    return static_cast<double>(next_u64() >> 11) * 0x1.0p-53;
}

SeededRandom SeededRandom::derive(std::string_view label) const {
    std::string derived = seed_;
    derived += ':';
    derived += label;
    return SeededRandom(derived);
}

// ============================================================================
// Helpers
// ============================================================================

int random_int(RandomSource& rng, int min, int max) {
    if (min > max) {
        throw std::invalid_argument("random_int requires min <= max");
    }
    const double span = static_cast<double>(max) - static_cast<double>(min) + 1.0;
    return static_cast<int>(std::floor(rng.next_uniform() * span)) + min;
}

double random_float(RandomSource& rng, double min, double max) {
    return min + rng.next_uniform() * (max - min);
}

size_t random_index(RandomSource& rng, size_t count) {
    if (count == 0) {
        throw std::invalid_argument("random_index requires a non-zero count");
    }
    auto index = static_cast<size_t>(std::floor(rng.next_uniform() * static_cast<double>(count)));
    return index < count ? index : count - 1;
}

bool random_chance(RandomSource& rng, double probability) {
    return rng.next_uniform() < probability;
}

size_t weighted_index(RandomSource& rng, std::span<const double> weights) {
    if (weights.empty()) {
        throw std::invalid_argument("weighted_index requires at least one weight");
    }

    double total = 0.0;
    for (double w : weights) {
        if (w < 0.0) {
            throw std::invalid_argument("weighted_index requires non-negative weights");
        }
        total += w;
    }
    if (total <= 0.0) {
        throw std::invalid_argument("weighted_index requires a positive total weight");
    }

    double target = rng.next_uniform() * total;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (target < weights[i]) {
            return i;
        }
        target -= weights[i];
    }
    // Rounding can leave a sliver past the last bucket
    for (size_t i = weights.size(); i > 0; --i) {
        if (weights[i - 1] > 0.0) {
            return i - 1;
        }
    }
    return weights.size() - 1;
}

}  // namespace cavegen::core
