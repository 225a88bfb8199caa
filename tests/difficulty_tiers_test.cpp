#include "difficulty_tiers.h"
#include <gtest/gtest.h>

TEST(DifficultyTiers, TableValues)
{
    ASSERT_EQ(3, TOTAL_DEFINED_TIERS);

    const TierConfig* pBasic = get_tier_config(TIER_BASIC);
    EXPECT_EQ(9, pBasic->rows);
    EXPECT_EQ(9, pBasic->cols);
    EXPECT_EQ(5, pBasic->required_word_count);
    EXPECT_EQ(10, pBasic->points_per_completion);
    EXPECT_EQ(600, pBasic->time_limit_seconds);

    const TierConfig* pIntermediate = get_tier_config(TIER_INTERMEDIATE);
    EXPECT_EQ(12, pIntermediate->rows);
    EXPECT_EQ(10, pIntermediate->required_word_count);
    EXPECT_EQ(15, pIntermediate->points_per_completion);
    EXPECT_EQ(1200, pIntermediate->time_limit_seconds);

    const TierConfig* pAdvanced = get_tier_config(TIER_ADVANCED);
    EXPECT_EQ(15, pAdvanced->cols);
    EXPECT_EQ(15, pAdvanced->required_word_count);
    EXPECT_EQ(20, pAdvanced->points_per_completion);
    EXPECT_EQ(1800, pAdvanced->time_limit_seconds);
}

TEST(DifficultyTiers, OutOfRangeFallsBackToBasic)
{
    EXPECT_EQ(TIER_BASIC, get_tier_config((difficulty_tier_t)7)->tier);
}

TEST(DifficultyTiers, NamesInBothLanguages)
{
    difficulty_tier_t tier;

    EXPECT_TRUE(tier_from_name("basic", &tier));
    EXPECT_EQ(TIER_BASIC, tier);
    EXPECT_TRUE(tier_from_name("  Intermedio ", &tier));
    EXPECT_EQ(TIER_INTERMEDIATE, tier);
    EXPECT_TRUE(tier_from_name("ADVANCED", &tier));
    EXPECT_EQ(TIER_ADVANCED, tier);
    EXPECT_TRUE(tier_from_name("avanzado", &tier));
    EXPECT_EQ(TIER_ADVANCED, tier);
    EXPECT_TRUE(tier_from_name("b\xC3\xA1sico", &tier));
    EXPECT_EQ(TIER_BASIC, tier);
}

TEST(DifficultyTiers, UnknownNameFallsBackToBasic)
{
    difficulty_tier_t tier = TIER_ADVANCED;
    EXPECT_FALSE(tier_from_name("expert", &tier));
    EXPECT_EQ(TIER_BASIC, tier);
    EXPECT_FALSE(tier_from_name(NULL, &tier));
}
