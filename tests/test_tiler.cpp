#include <gtest/gtest.h>
#include "tiler.hpp"
#include "test_helpers.hpp"
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using rkrGST::Match;
using rkrGST::tile;
using rkrGST::tile_tokens;

TEST(TilerTest, SharedSubstring) {
    EXPECT_EQ(tile("lower", "yellow", 3, 2), (std::vector<Match>{{0, 3, 3}}));
}

TEST(TilerTest, RepeatedSubstringTiledOnce) {
    EXPECT_EQ(tile("lowerlow", "yellow lowlow", 3, 2),
              (std::vector<Match>{{0, 3, 3}, {5, 7, 3}}));
}

TEST(TilerTest, IdenticalInputsGrowSearchLength) {
    // The first pass finds a match longer than twice the search length and restarts with it.
    EXPECT_EQ(tile("abcdefgh", "abcdefgh", 3, 2), (std::vector<Match>{{0, 0, 8}}));
}

TEST(TilerTest, LongestTileAcceptedFirst) {
    // "abcd" and "cdef" compete for "cd"; the longer "cdefgh" wins it.
    auto tiles = tile("abcdefgh", "cdefgh abcd", 4, 2);
    ASSERT_FALSE(tiles.empty());
    EXPECT_EQ(tiles[0], (Match{2, 0, 6}));
    EXPECT_EQ(tiles, (std::vector<Match>{{2, 0, 6}, {0, 7, 2}}));
}

TEST(TilerTest, ShorterTilesFoundInLaterPasses) {
    auto tiles = tile("xyzab_uvwxyz", "uvwxyz_ab", 4, 2);
    EXPECT_EQ(tiles, (std::vector<Match>{{6, 0, 6}, {3, 7, 2}}));
}

TEST(TilerTest, EmptyInputs) {
    EXPECT_TRUE(tile("", "", 3, 2).empty());
    EXPECT_TRUE(tile("", "yellow", 3, 2).empty());
    EXPECT_TRUE(tile("lower", "", 3, 2).empty());
}

TEST(TilerTest, MinimumLongerThanInputs) {
    EXPECT_TRUE(tile("abc", "abc", 5, 4).empty());
    EXPECT_TRUE(tile("abcdef", "abc", 8, 4).empty());
}

TEST(TilerTest, NoCommonSubstring) {
    EXPECT_TRUE(tile("aaaa", "bbbb", 2, 1).empty());
}

TEST(TilerTest, SingleTokenTiles) {
    auto tiles = tile("ab", "ba", 1, 1);
    EXPECT_EQ(tiles, (std::vector<Match>{{0, 1, 1}, {1, 0, 1}}));
}

TEST(TilerTest, InvalidLengthsRejected) {
    EXPECT_THROW(tile("abc", "abc", 0, 1), std::invalid_argument);
    EXPECT_THROW(tile("abc", "abc", 3, 0), std::invalid_argument);
    EXPECT_THROW(tile("abc", "abc", 2, 3), std::invalid_argument);
    EXPECT_THROW(tile("", "", 0, 0), std::invalid_argument);
}

TEST(TilerTest, HugeInitialSearchLength) {
    const size_t huge = static_cast<size_t>(-1);
    EXPECT_EQ(tile("lower", "yellow", huge, 3), (std::vector<Match>{{0, 3, 3}}));
}

TEST(TilerTest, BinaryBytes) {
    const std::string pattern("\x00\xff\x80\x01\x02\x00", 6);
    const std::string text("\x7f\x00\xff\x80\x01\x02", 6);
    EXPECT_EQ(tile(pattern, text, 4, 2), (std::vector<Match>{{0, 1, 5}}));
}

TEST(TilerTest, CountAndTiledLength) {
    EXPECT_EQ(rkrGST::count_tiles("lowerlow", "yellow lowlow", 3, 2), 2u);
    EXPECT_EQ(rkrGST::tiled_length("lowerlow", "yellow lowlow", 3, 2), 6u);
    EXPECT_EQ(rkrGST::count_tiles("", "abc", 3, 2), 0u);
    EXPECT_THROW(rkrGST::count_tiles("abc", "abc", 1, 2), std::invalid_argument);
}

TEST(TilerTest, MatchOrdering) {
    EXPECT_LT((Match{0, 5, 3}), (Match{1, 0, 1}));
    EXPECT_LT((Match{1, 0, 9}), (Match{1, 1, 1}));
    EXPECT_LT((Match{1, 1, 1}), (Match{1, 1, 2}));
    EXPECT_EQ((Match{2, 3, 4}), (Match{2, 3, 4}));
    EXPECT_NE((Match{2, 3, 4}), (Match{2, 3, 5}));
}

TEST(TilerTokensTest, IntegerTokens) {
    EXPECT_EQ(tile_tokens({1, 2, 3, 4, 5}, {9, 1, 2, 3, 9}, 3, 2), (std::vector<Match>{{0, 1, 3}}));
}

TEST(TilerTokensTest, HashCollisionIsVerified) {
    // 70000 and 135521 are congruent modulo the Adler base, so both windows hash alike.
    EXPECT_EQ(tile_tokens({70000, 1, 2}, {135521, 1, 2}, 3, 2), (std::vector<Match>{{1, 1, 2}}));
}

TEST(TilerTokensTest, SameResultAsBytes) {
    const std::string pattern = "the quick brown fox jumps over the lazy dog";
    const std::string text = "a lazy dog and a quick brown cat jump over the fox";
    std::vector<uint32_t> p(pattern.begin(), pattern.end());
    std::vector<uint32_t> t(text.begin(), text.end());
    EXPECT_EQ(tile_tokens(p, t, 8, 3), tile(pattern, text, 8, 3));
}

TEST(TilerTest, TilesAreMaximalOnBothSides) {
    // Both common runs are tiled from their first position, not from a later window.
    const std::string pattern = "qabcdefrstuvw";
    const std::string text = "rstuvw-qabcdef";
    auto tiles = tile(pattern, text, 3, 2);
    test_utils::expect_valid_tiling(pattern, text, tiles, 2);
    EXPECT_EQ(tiles, (std::vector<Match>{{0, 7, 7}, {7, 0, 6}}));
}

class TilerPropertyTest : public ::testing::TestWithParam<size_t> {};

TEST_P(TilerPropertyTest, RandomInputsProduceValidTilings) {
    const size_t alphabet = GetParam();
    std::mt19937 rng(static_cast<unsigned>(1234 + alphabet));
    std::uniform_int_distribution<size_t> len(0, 300);
    std::uniform_int_distribution<size_t> min_len(1, 4);
    std::uniform_int_distribution<size_t> extra(0, 20);

    for (int round = 0; round < 40; ++round) {
        std::string pattern = test_utils::random_sequence(rng, len(rng), alphabet);
        std::string text = test_utils::random_sequence(rng, len(rng), alphabet);
        const size_t m = min_len(rng);
        const size_t s = m + extra(rng);

        auto tiles = tile(pattern, text, s, m);
        test_utils::expect_valid_tiling(pattern, text, tiles, m);
        EXPECT_EQ(tiles, tile(pattern, text, s, m)) << "round " << round;
    }
}

TEST_P(TilerPropertyTest, ShuffledCopyIsFullyCovered) {
    // Text made of blocks of the pattern: every block is a common substring.
    const size_t alphabet = GetParam();
    std::mt19937 rng(static_cast<unsigned>(99 + alphabet));
    std::string pattern = test_utils::random_sequence(rng, 200, alphabet);
    std::string text = pattern.substr(100) + pattern.substr(0, 100);

    auto tiles = tile(pattern, text, 20, 5);
    test_utils::expect_valid_tiling(pattern, text, tiles, 5);
    uint64_t covered = 0;
    for (const auto& m : tiles) covered += m.length;
    EXPECT_EQ(covered, pattern.size());
}

INSTANTIATE_TEST_SUITE_P(Alphabets, TilerPropertyTest, ::testing::Values(2, 4, 26));
