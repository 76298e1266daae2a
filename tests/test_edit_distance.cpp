#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <string>
#include "edit_distance.hpp"
#include "test_helpers.hpp"

using namespace strsearch;
using namespace strsearch_test;

TEST(EditDistanceTest, KnownDistances) {
    EXPECT_EQ(edit_distance("kitten", "sitting"), 3u);
    EXPECT_EQ(edit_distance("", "abc"), 3u);
    EXPECT_EQ(edit_distance("abc", ""), 3u);
    EXPECT_EQ(edit_distance("abc", "abc"), 0u);
    EXPECT_EQ(edit_distance("", ""), 0u);
    EXPECT_EQ(edit_distance("flaw", "lawn"), 2u);
    EXPECT_EQ(edit_distance("abc", "xyz"), 3u);
    EXPECT_EQ(edit_distance("a", "ab"), 1u);
}

TEST(EditDistanceTest, IdentityIsZero) {
    std::mt19937 rng(11);
    for (int iter = 0; iter < 300; ++iter) {
        std::string s = random_string(rng, random_size(rng, 0, 30), "abcd");
        ASSERT_EQ(edit_distance(s, s), 0u) << s;
    }
}

TEST(EditDistanceTest, Symmetric) {
    std::mt19937 rng(12);
    for (int iter = 0; iter < 500; ++iter) {
        std::string a = random_string(rng, random_size(rng, 0, 20), "abc");
        std::string b = random_string(rng, random_size(rng, 0, 20), "abc");
        ASSERT_EQ(edit_distance(a, b), edit_distance(b, a)) << a << " / " << b;
    }
}

TEST(EditDistanceTest, TriangleInequality) {
    std::mt19937 rng(13);
    for (int iter = 0; iter < 500; ++iter) {
        std::string a = random_string(rng, random_size(rng, 0, 12), "ab");
        std::string b = random_string(rng, random_size(rng, 0, 12), "ab");
        std::string c = random_string(rng, random_size(rng, 0, 12), "ab");
        ASSERT_LE(edit_distance(a, c), edit_distance(a, b) + edit_distance(b, c))
            << a << " / " << b << " / " << c;
    }
}

TEST(EditDistanceTest, SingleMutationChangesDistanceByAtMostOne) {
    std::mt19937 rng(14);
    std::uniform_int_distribution<int> byte(0, 255);
    for (int iter = 0; iter < 1000; ++iter) {
        std::string s = random_string(rng, random_size(rng, 3, 10), "abcdefgh");
        std::string mutated = s;
        mutated[random_size(rng, 0, s.size() - 1)] = static_cast<char>(byte(rng));
        ASSERT_LE(edit_distance(s, mutated), 1u);

        std::string other = random_string(rng, random_size(rng, 0, 10), "abcdefgh");
        size_t before = edit_distance(s, other);
        size_t after = edit_distance(mutated, other);
        ASSERT_LE(after, before + 1);
        ASSERT_LE(before, after + 1);
    }
}

TEST(EditDistanceTest, BoundedByLongerLength) {
    std::mt19937 rng(15);
    for (int iter = 0; iter < 300; ++iter) {
        std::string a = random_string(rng, random_size(rng, 0, 15), "abc");
        std::string b = random_string(rng, random_size(rng, 0, 15), "abc");
        size_t d = edit_distance(a, b);
        ASSERT_LE(d, std::max(a.size(), b.size()));
        ASSERT_GE(d, a.size() > b.size() ? a.size() - b.size() : b.size() - a.size());
    }
}

TEST(EditDistanceTest, LargeInputsUseLinearMemory) {
    // A full 5000 x 5000 matrix of size_t would take 200 MB
    std::string a(5000, 'a');
    std::string b = a;
    b[2500] = 'b';
    b.push_back('c');
    EXPECT_EQ(edit_distance(a, b), 2u);
}
