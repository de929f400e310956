#include "BackgroundSignatures.hpp"
#include "Errors.hpp"
#include "TestData.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace sigproj;

TEST(BackgroundSignaturesTest, GeneratesRequestedSizes) {
    std::vector<std::string> genes = testdata::numberedLabels("G", 30);
    std::mt19937 rng(11);
    std::vector<Signature> background = generateBackgroundSignatures(genes, {5, 10}, 4, rng);

    ASSERT_EQ(background.size(), 8u);
    std::set<std::string> universe(genes.begin(), genes.end());
    for (size_t i = 0; i < background.size(); ++i) {
        int expected = i < 4 ? 5 : 10;
        EXPECT_EQ(background[i].size(), static_cast<size_t>(expected));
        EXPECT_FALSE(background[i].isSigned());
        for (const auto& entry : background[i].genes()) {
            EXPECT_EQ(universe.count(entry.first), 1u);
            EXPECT_EQ(entry.second, 1);
        }
    }
    EXPECT_EQ(background[0].name(), "BG_5_0");
    EXPECT_EQ(background[7].name(), "BG_10_3");
}

TEST(BackgroundSignaturesTest, OversizedGroupsAreSkipped) {
    std::vector<std::string> genes = testdata::numberedLabels("G", 8);
    std::mt19937 rng(3);
    std::vector<std::string> warnings;
    std::vector<Signature> background = generateBackgroundSignatures(genes, {5, 20}, 2, rng, &warnings);
    EXPECT_EQ(background.size(), 2u);
    EXPECT_EQ(warnings.size(), 1u);
}

TEST(BackgroundSignaturesTest, SeededGenerationIsReproducible) {
    std::vector<std::string> genes = testdata::numberedLabels("G", 40);
    std::mt19937 first(99);
    std::mt19937 second(99);
    std::vector<Signature> a = generateBackgroundSignatures(genes, {6}, 5, first);
    std::vector<Signature> b = generateBackgroundSignatures(genes, {6}, 5, second);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].genes(), b[i].genes());
    }
}

TEST(BackgroundSignaturesTest, RejectsNegativeRepetitions) {
    std::mt19937 rng(1);
    EXPECT_THROW(generateBackgroundSignatures({"A", "B"}, {1}, -1, rng), ConfigurationError);
}
