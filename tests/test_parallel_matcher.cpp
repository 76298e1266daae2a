#include <gtest/gtest.h>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "parallel_matcher.hpp"
#include "test_helpers.hpp"

using namespace strsearch;
using namespace strsearch_test;

class ParallelMatcherTest : public ::testing::Test {
protected:
    ParallelMatcher matcher;

    static ParallelOptions threads(size_t n) {
        ParallelOptions opts;
        opts.num_threads = n;
        return opts;
    }
};

TEST_F(ParallelMatcherTest, MatchesSequentialSearch) {
    std::mt19937 rng(314);
    std::string hay = random_string(rng, 50000, "ab");
    for (const char* sub : {"a", "abab", "bbbbb", "abaabba"}) {
        auto cp = compile(sub);
        auto expected = find_all_list(cp, hay, 0);
        for (size_t n : {1, 2, 3, 4, 7, 16}) {
            EXPECT_EQ(matcher.find_all(cp, hay, threads(n)), expected)
                << "pattern " << sub << " with " << n << " threads";
        }
        EXPECT_EQ(matcher.count_matches(cp, hay, threads(4)), expected.size());
    }
}

TEST_F(ParallelMatcherTest, MatchesStraddlingChunkBoundariesAreFoundOnce) {
    // Every offset matches, so every chunk boundary is straddled
    std::string hay(1000, 'a');
    auto cp = compile("aaaaa");
    auto expected = brute_force_offsets(hay, "aaaaa");
    for (size_t n : {2, 3, 10, 333}) {
        EXPECT_EQ(matcher.find_all(cp, hay, threads(n)), expected) << n << " threads";
    }
}

TEST_F(ParallelMatcherTest, RandomInputsWithTinyChunks) {
    std::mt19937 rng(2718);
    for (int iter = 0; iter < 200; ++iter) {
        std::string hay = random_string(rng, random_size(rng, 1, 60), "ab");
        std::string sub = random_string(rng, random_size(rng, 1, 4), "ab");
        auto cp = compile(sub);
        size_t n = random_size(rng, 1, 8);
        ASSERT_EQ(matcher.find_all(cp, hay, threads(n)), brute_force_offsets(hay, sub))
            << hay << " / " << sub << " with " << n << " threads";
    }
}

TEST_F(ParallelMatcherTest, AutoDetectedThreadCount) {
    ParallelOptions opts;
    EXPECT_EQ(ParallelMatcher::resolve_thread_count(100, opts), 1u) << "small inputs run on one thread";
    EXPECT_GE(ParallelMatcher::resolve_thread_count(10'000'000, opts), 1u);

    opts.min_chars_per_thread = 0;
    EXPECT_GE(ParallelMatcher::resolve_thread_count(10, opts), 1u);
}

TEST_F(ParallelMatcherTest, ExplicitThreadCountIsClampedToInputLength) {
    EXPECT_EQ(ParallelMatcher::resolve_thread_count(3, threads(8)), 3u);
    EXPECT_EQ(ParallelMatcher::resolve_thread_count(100, threads(8)), 8u);
}

TEST_F(ParallelMatcherTest, EmptyHaystack) {
    EXPECT_TRUE(matcher.find_all(compile("a"), "", threads(4)).empty());
}

TEST_F(ParallelMatcherTest, ReversePatternIsRejected) {
    EXPECT_THROW(matcher.find_all(compile_reversed("a"), "aaa"), InvalidArgumentError);
}

TEST_F(ParallelMatcherTest, SharedPatternAcrossConcurrentCalls) {
    std::mt19937 rng(1);
    std::string hay = random_string(rng, 20000, "abc");
    const auto cp = compile("abc");
    auto expected = find_all_list(cp, hay);

    std::vector<std::vector<size_t>> results(4);
    std::vector<std::thread> callers;
    for (size_t i = 0; i < results.size(); ++i) {
        callers.emplace_back([&, i]() {
            ParallelMatcher local;
            results[i] = local.find_all(cp, hay, threads(i + 1));
        });
    }
    for (auto& t : callers) t.join();
    for (const auto& r : results) EXPECT_EQ(r, expected);
}
