// CaveGen Core Tests
// random_test.cpp - Seeded random stream and helper tests

#include <gtest/gtest.h>

#include <cavegen/core/random.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <vector>

namespace cavegen::core {
namespace {

class SeededRandomTest : public ::testing::Test {};

// Test: FNV-1a reference values
TEST_F(SeededRandomTest, HashSeedMatchesFnv1a) {
    EXPECT_EQ(SeededRandom::hash_seed(""), 0xcbf29ce484222325ULL);
    EXPECT_EQ(SeededRandom::hash_seed("a"), 0xaf63dc4c8601ec8cULL);
}

// Test: The stream is pinned bit for bit so saved seeds rebuild the same level anywhere
TEST_F(SeededRandomTest, DefaultSeedStreamIsPinned) {
    SeededRandom rng("cavegen-level-1");
    EXPECT_EQ(rng.next_u64(), 0xe1d297ccf5c3bd17ULL);
    EXPECT_EQ(rng.next_u64(), 0x674e1465d25d4269ULL);
    EXPECT_EQ(rng.next_u64(), 0x2e11c0eb52b45ca8ULL);
}

TEST_F(SeededRandomTest, EmptySeedRejected) {
    EXPECT_THROW(SeededRandom(""), std::invalid_argument);
}

// Test: Same seed string yields the same sequence
TEST_F(SeededRandomTest, SameSeedSameSequence) {
    SeededRandom a("demo-visual-evidence");
    SeededRandom b("demo-visual-evidence");
    for (int i = 0; i < 1000; ++i) {
        ASSERT_EQ(a.next_u64(), b.next_u64()) << "Diverged at draw " << i;
    }
}

TEST_F(SeededRandomTest, DifferentSeedsDiffer) {
    SeededRandom a("level-1");
    SeededRandom b("level-2");
    int differences = 0;
    for (int i = 0; i < 100; ++i) {
        if (a.next_uniform() != b.next_uniform()) {
            ++differences;
        }
    }
    EXPECT_GT(differences, 90);
}

TEST_F(SeededRandomTest, UniformWithinUnitInterval) {
    SeededRandom rng("bounds");
    double sum = 0.0;
    constexpr int N = 20000;
    for (int i = 0; i < N; ++i) {
        double v = rng.next_uniform();
        ASSERT_GE(v, 0.0);
        ASSERT_LT(v, 1.0);
        sum += v;
    }
    EXPECT_NEAR(sum / N, 0.5, 0.02);
}

// Test: derive() depends only on the seed and label, not on draws made so far
TEST_F(SeededRandomTest, DeriveIsIndependentOfParentPosition) {
    SeededRandom parent("pipeline");
    SeededRandom early = parent.derive("coins");
    for (int i = 0; i < 50; ++i) {
        (void)parent.next_uniform();
    }
    SeededRandom late = parent.derive("coins");
    EXPECT_EQ(early.seed(), "pipeline:coins");
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(early.next_u64(), late.next_u64());
    }
}

TEST_F(SeededRandomTest, DerivedStreamsDiffer) {
    SeededRandom parent("pipeline");
    SeededRandom spawn = parent.derive("spawn");
    SeededRandom goal = parent.derive("goal");
    EXPECT_NE(spawn.next_u64(), goal.next_u64());
}

class RandomHelpersTest : public ::testing::Test {
protected:
    SeededRandom rng_{"helpers"};
};

TEST_F(RandomHelpersTest, RandomIntInclusiveBounds) {
    std::set<int> seen;
    for (int i = 0; i < 2000; ++i) {
        int v = random_int(rng_, 2, 6);
        ASSERT_GE(v, 2);
        ASSERT_LE(v, 6);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 5u);
    EXPECT_THROW((void)random_int(rng_, 5, 4), std::invalid_argument);
}

TEST_F(RandomHelpersTest, RandomFloatRange) {
    for (int i = 0; i < 500; ++i) {
        double v = random_float(rng_, -2.0, 3.0);
        ASSERT_GE(v, -2.0);
        ASSERT_LT(v, 3.0);
    }
}

TEST_F(RandomHelpersTest, RandomIndexRejectsEmpty) {
    EXPECT_THROW((void)random_index(rng_, 0), std::invalid_argument);
    EXPECT_EQ(random_index(rng_, 1), 0u);
}

TEST_F(RandomHelpersTest, RandomChoiceReturnsMember) {
    std::vector<int> items = {3, 7, 11};
    for (int i = 0; i < 50; ++i) {
        int v = random_choice(rng_, items);
        EXPECT_TRUE(v == 3 || v == 7 || v == 11);
    }
    std::vector<int> empty;
    EXPECT_THROW((void)random_choice(rng_, empty), std::invalid_argument);
}

// Test: Zero-weight entries are never chosen
TEST_F(RandomHelpersTest, WeightedIndexSkipsZeroWeights) {
    std::vector<double> weights = {0.0, 1.0, 0.0, 3.0};
    int counts[4] = {0, 0, 0, 0};
    for (int i = 0; i < 4000; ++i) {
        ++counts[weighted_index(rng_, weights)];
    }
    EXPECT_EQ(counts[0], 0);
    EXPECT_EQ(counts[2], 0);
    EXPECT_GT(counts[3], counts[1] * 2);
}

TEST_F(RandomHelpersTest, WeightedIndexRejectsBadWeights) {
    std::vector<double> negative = {1.0, -1.0};
    std::vector<double> zero = {0.0, 0.0};
    EXPECT_THROW((void)weighted_index(rng_, negative), std::invalid_argument);
    EXPECT_THROW((void)weighted_index(rng_, zero), std::invalid_argument);
}

TEST_F(RandomHelpersTest, ShuffleIsPermutation) {
    std::vector<int> items(30);
    for (int i = 0; i < 30; ++i) {
        items[static_cast<size_t>(i)] = i;
    }
    std::vector<int> shuffled = items;
    shuffle(rng_, shuffled);
    EXPECT_NE(shuffled, items);
    std::sort(shuffled.begin(), shuffled.end());
    EXPECT_EQ(shuffled, items);
}

}  // namespace
}  // namespace cavegen::core
