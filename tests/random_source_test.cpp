#include "random_source.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

// Custom source yielding 0, 1, 2, ...
static uint32_t counting_next_u32(void* p_state)
{
    uint32_t* pCounter = (uint32_t*)p_state;
    return (*pCounter)++;
}

TEST(RandomSource, SameSeedSameSequence)
{
    random_source_t a, b;
    ASSERT_TRUE(random_source_create_seeded(&a, 1234));
    ASSERT_TRUE(random_source_create_seeded(&b, 1234));

    for (int i = 0; i < 100; i++)
    {
        EXPECT_EQ(a.next_u32(a.p_state), b.next_u32(b.p_state));
    }

    random_source_free(&a);
    random_source_free(&b);
    EXPECT_TRUE(a.p_state == NULL);
}

TEST(RandomSource, RandomBelowStaysInRange)
{
    random_source_t source;
    ASSERT_TRUE(random_source_create_seeded(&source, 7));

    for (int i = 0; i < 1000; i++)
    {
        EXPECT_LT(random_below(&source, 13), 13u);
    }
    EXPECT_EQ(0u, random_below(&source, 1));

    random_source_free(&source);
}

TEST(RandomSource, ShuffleIsAPermutation)
{
    random_source_t source;
    ASSERT_TRUE(random_source_create_seeded(&source, 99));

    std::vector<int> values;
    for (int i = 0; i < 50; i++) values.push_back(i);
    shuffle_int_array(&source, values.data(), (int)values.size());

    std::vector<int> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    for (int i = 0; i < 50; i++) EXPECT_EQ(i, sorted[i]);

    random_source_free(&source);
}

TEST(RandomSource, CustomSourceIsUsedAndNotFreed)
{
    uint32_t counter = 0;
    random_source_t source = { counting_next_u32, &counter };

    EXPECT_EQ(0u, random_below(&source, 10));
    EXPECT_EQ(1u, random_below(&source, 10));
    EXPECT_EQ(2u, counter);

    random_source_free(&source);
    EXPECT_EQ(2u, counter);
    EXPECT_TRUE(source.next_u32 == NULL);
}

TEST(RandomSource, FreedSourceCanBeRecreated)
{
    random_source_t source;
    ASSERT_TRUE(random_source_create_seeded(&source, 5));
    uint32_t first = source.next_u32(source.p_state);
    random_source_free(&source);
    EXPECT_TRUE(source.p_state == NULL);
    random_source_free(&source);

    ASSERT_TRUE(random_source_create_seeded(&source, 5));
    EXPECT_EQ(first, source.next_u32(source.p_state));
    random_source_free(&source);
}

TEST(ParseSeedText, AcceptsPlainDecimal)
{
    uint32_t seed = 0;
    ASSERT_TRUE(parse_seed_text("0", &seed));
    EXPECT_EQ(0u, seed);
    ASSERT_TRUE(parse_seed_text("42", &seed));
    EXPECT_EQ(42u, seed);
    ASSERT_TRUE(parse_seed_text("4294967295", &seed));
    EXPECT_EQ(4294967295u, seed);
}

TEST(ParseSeedText, RejectsEmptySignedAndOutOfRange)
{
    uint32_t seed = 7;
    EXPECT_FALSE(parse_seed_text("", &seed));
    EXPECT_FALSE(parse_seed_text(NULL, &seed));
    EXPECT_FALSE(parse_seed_text("-1", &seed));
    EXPECT_FALSE(parse_seed_text("+5", &seed));
    EXPECT_FALSE(parse_seed_text(" 5", &seed));
    EXPECT_FALSE(parse_seed_text("12abc", &seed));
    EXPECT_FALSE(parse_seed_text("4294967296", &seed));
    EXPECT_FALSE(parse_seed_text("99999999999999999999999", &seed));
    EXPECT_EQ(7u, seed);
}
