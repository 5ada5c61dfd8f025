#include "paint/TileMatcher.h"
#include "TestCatalogs.h"

#include <gtest/gtest.h>

using namespace Tessera;
using namespace Tessera::Test;

TEST(TileMatcher, ResultAlwaysHonorsMask) {
    const WangCatalog catalog = ThreeColorCatalog();
    SeededRandom random(3);
    TileMatcher matcher(catalog, random);

    // Every corner assignment over {empty, Grass, Dirt, Sand}
    for (int n = 0; n < 256; ++n) {
        const int tr = n & 3;
        const int br = (n >> 2) & 3;
        const int bl = (n >> 4) & 3;
        const int tl = (n >> 6) & 3;
        const ColorVector desired = ColorVector::FromArray({0, tr, 0, br, 0, bl, 0, tl});
        const SlotMask mask = desired.Mask();

        const auto match = matcher.FindBestMatch(desired, mask);
        const bool dirtAndSand = desired.HasColor(Dirt) && desired.HasColor(Sand);

        if (dirtAndSand) {
            EXPECT_FALSE(match.has_value()) << desired.ToString();
        } else {
            ASSERT_TRUE(match.has_value()) << desired.ToString();
            EXPECT_TRUE(match->colors.MatchesMasked(desired, mask))
                << desired.ToString() << " got " << match->colors.ToString();
        }
    }
}

TEST(TileMatcher, PenaltySumsDistances) {
    const WangCatalog catalog = ThreeColorCatalog();
    SeededRandom random;
    TileMatcher matcher(catalog, random);

    const ColorVector sand = ColorVector::AllCorners(Sand);
    EXPECT_EQ(matcher.Penalty(sand, sand), 0);
    EXPECT_EQ(matcher.Penalty(sand, ColorVector::AllCorners(Grass)), 4);
    EXPECT_EQ(matcher.Penalty(sand, ColorVector::AllCorners(Dirt)), 8);

    // Empty desired slots are free
    EXPECT_EQ(matcher.Penalty(ColorVector(), ColorVector::AllCorners(Dirt)), 0);
}

TEST(TileMatcher, PenaltyReportsUnreachable) {
    const WangCatalog catalog = IslandCatalog();
    SeededRandom random;
    TileMatcher matcher(catalog, random);

    const ColorVector desired = ColorVector::FromArray({0, 2, 0, 2, 0, 2, 0, Water});
    EXPECT_EQ(matcher.Penalty(desired, ColorVector::AllCorners(Dirt)), kUnreachable);
}

TEST(TileMatcher, SoftSlotsPickCheapestCandidate) {
    const WangCatalog catalog = ThreeColorCatalog();
    SeededRandom random(11);
    TileMatcher matcher(catalog, random);

    // Only TopRight is hard; TopLeft wants Sand and only Grass-Sand tiles have it
    const ColorVector desired = ColorVector::FromArray({0, Grass, 0, Grass, 0, Grass, 0, Sand});
    SlotMask mask;
    mask.Set(TopRight);

    const auto match = matcher.FindBestMatch(desired, mask);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->tile, TileRef(24));
    EXPECT_EQ(match->colors, desired);
}

TEST(TileMatcher, UnreachableSoftSlotRejectsCandidate) {
    const WangCatalog catalog = IslandCatalog();
    SeededRandom random;
    TileMatcher matcher(catalog, random);

    // TopRight must be Dirt, TopLeft would like Water: nothing bridges them
    const ColorVector desired = ColorVector::FromArray({0, Dirt, 0, 0, 0, 0, 0, Water});
    SlotMask mask;
    mask.Set(TopRight);

    EXPECT_FALSE(matcher.FindBestMatch(desired, mask).has_value());
}

TEST(TileMatcher, NoCandidateReturnsNullopt) {
    const WangCatalog catalog = TwoColorCatalog();
    SeededRandom random;
    TileMatcher matcher(catalog, random);

    const ColorVector desired = ColorVector::AllEdges(Grass);
    EXPECT_FALSE(matcher.FindBestMatch(desired, desired.Mask()).has_value());
}

TEST(TileMatcher, TiesAreWeightedByProbability) {
    WangCatalog catalog;
    catalog.AddColor("Grass", Color());
    catalog.AddVariant(ColorVector::AllCorners(1), TileRef(0), 1.0f);
    catalog.AddVariant(ColorVector::AllCorners(1), TileRef(1), 3.0f);

    const ColorVector desired = ColorVector::AllCorners(1);

    ScriptedRandom low({0.2});
    EXPECT_EQ(TileMatcher(catalog, low).FindBestMatch(desired, desired.Mask())->tile,
              TileRef(0));

    ScriptedRandom high({0.5});
    EXPECT_EQ(TileMatcher(catalog, high).FindBestMatch(desired, desired.Mask())->tile,
              TileRef(1));
}

TEST(TileMatcher, ZeroWeightTiesFallBackToLastCandidate) {
    WangCatalog catalog;
    catalog.AddColor("Grass", Color(), 0.0f);
    catalog.AddVariant(ColorVector::AllCorners(1), TileRef(0));
    catalog.AddVariant(ColorVector::AllCorners(1), TileRef(1));
    catalog.AddVariant(ColorVector::AllCorners(1), TileRef(2));

    ScriptedRandom random({0.0});
    TileMatcher matcher(catalog, random);

    const ColorVector desired = ColorVector::AllCorners(1);
    const auto match = matcher.FindBestMatch(desired, desired.Mask());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->tile, TileRef(2));
}

TEST(TileMatcher, CheaperCandidateBeatsHeavierOne) {
    WangCatalog catalog;
    catalog.AddColor("A", Color());
    catalog.AddColor("B", Color());
    catalog.SetDistance(1, 2, 1);
    catalog.AddVariant(ColorVector::FromArray({0, 1, 0, 2, 0, 2, 0, 2}), TileRef(0), 100.0f);
    catalog.AddVariant(ColorVector::FromArray({0, 1, 0, 1, 0, 2, 0, 2}), TileRef(1), 0.01f);

    SeededRandom random(5);
    TileMatcher matcher(catalog, random);

    const ColorVector desired = ColorVector::FromArray({0, 1, 0, 1, 0, 2, 0, 2});
    SlotMask mask;
    mask.Set(TopRight);

    EXPECT_EQ(matcher.FindBestMatch(desired, mask)->tile, TileRef(1));
}
