#include <gtest/gtest.h>
#include <string>
#include "errors.hpp"
#include "replace.hpp"

using namespace strsearch;

static ReplaceOptions which(Which w) {
    ReplaceOptions opts;
    opts.which = w;
    return opts;
}

TEST(ReplaceTest, ReplaceAll) {
    EXPECT_EQ(replace("abcdabcd", "a", "b", which(Which::All)), "bbcdbbcd");
    EXPECT_EQ(replace("  abab cdabb a", "ab", "hello", which(Which::All)), "  hellohello cdhellob a");
    EXPECT_EQ(replace("1aa234a", "a", "b"), "1bb234b") << "All is the default";
}

TEST(ReplaceTest, ReplaceLeftAndRight) {
    EXPECT_EQ(replace("abcdabcd", "a", "b", which(Which::Left)), "bbcdabcd");
    EXPECT_EQ(replace("abcdabcd", "a", "b", which(Which::Right)), "abcdbbcd");
}

TEST(ReplaceTest, AbsentSubLeavesInputUnchanged) {
    EXPECT_EQ(replace(" a b c d ", "ab", "nope", which(Which::Left)), " a b c d ");
    EXPECT_EQ(replace(" a b c d ", "ab", "nope", which(Which::Right)), " a b c d ");
    EXPECT_EQ(replace(" a b c d ", "ab", "nope"), " a b c d ");
}

TEST(ReplaceTest, AllDoesNotReplaceOverlaps) {
    EXPECT_EQ(replace("aaaa", "aa", "b"), "bb");
    EXPECT_EQ(replace("aaa", "aa", "b"), "ba");
}

TEST(ReplaceTest, ReplacementMayContainSub) {
    EXPECT_EQ(replace("aXa", "a", "aa"), "aaXaa") << "replaced text is never rescanned";
}

TEST(ReplaceTest, EmptyReplacementDeletes) {
    EXPECT_EQ(replace("a-b-c", "-", ""), "abc");
}

TEST(ReplaceTest, EmptySubIsRejected) {
    EXPECT_THROW(replace("abc", "", "x"), InvalidArgumentError);
    EXPECT_THROW(replace("abc", "", "x", which(Which::Left)), InvalidArgumentError);
}
