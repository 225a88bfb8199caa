#include "crossword_grid.h"
#include <gtest/gtest.h>
#include <string.h>

class CrosswordGridTest : public ::testing::Test
{
protected:
    void SetUp() override { ASSERT_TRUE(grid_create(7, 7, &grid)); }
    void TearDown() override { grid_free(&grid); }

    void place(const char* answer, direction_t direction, int row, int col)
    {
        int length = (int)strlen(answer);
        ASSERT_TRUE(grid_can_place(&grid, answer, length, direction, row, col));
        grid_apply_placement(&grid, answer, length, direction, row, col, written);
    }

    crossword_grid_t grid;
    bool written[CROSSWORD_MAX_ANSWER_LENGTH];
};

TEST_F(CrosswordGridTest, RejectsBadSize)
{
    crossword_grid_t other;
    EXPECT_FALSE(grid_create(0, 5, &other));
    EXPECT_TRUE(other.cells == NULL);
}

TEST_F(CrosswordGridTest, OutOfBoundsReadsEmpty)
{
    EXPECT_EQ('\0', grid_get(&grid, -1, 0));
    EXPECT_EQ('\0', grid_get(&grid, 0, 7));
}

TEST_F(CrosswordGridTest, BoundsAreChecked)
{
    EXPECT_TRUE(grid_can_place(&grid, "HOUSE", 5, DIRECTION_ACROSS, 0, 2));
    EXPECT_FALSE(grid_can_place(&grid, "HOUSE", 5, DIRECTION_ACROSS, 0, 3));
    EXPECT_FALSE(grid_can_place(&grid, "HOUSE", 5, DIRECTION_DOWN, 3, 0));
    EXPECT_FALSE(grid_can_place(&grid, "HOUSE", 5, DIRECTION_DOWN, -1, 0));
}

TEST_F(CrosswordGridTest, CrossingMustAgree)
{
    place("CAT", DIRECTION_ACROSS, 3, 2);

    EXPECT_TRUE(grid_can_place(&grid, "BAG", 3, DIRECTION_DOWN, 2, 3));
    EXPECT_FALSE(grid_can_place(&grid, "BIG", 3, DIRECTION_DOWN, 2, 3));
    EXPECT_EQ(1, grid_count_overlaps(&grid, 3, DIRECTION_DOWN, 2, 3));
}

TEST_F(CrosswordGridTest, EndCapsMustBeEmpty)
{
    place("CAT", DIRECTION_ACROSS, 3, 2);

    // Would end right above the C
    EXPECT_FALSE(grid_can_place(&grid, "OX", 2, DIRECTION_DOWN, 1, 2));
    // Would continue the across word
    EXPECT_FALSE(grid_can_place(&grid, "SO", 2, DIRECTION_ACROSS, 3, 5));
}

TEST_F(CrosswordGridTest, ParallelNeighboursRejected)
{
    place("CAT", DIRECTION_ACROSS, 3, 2);

    EXPECT_FALSE(grid_can_place(&grid, "DOG", 3, DIRECTION_ACROSS, 2, 2));
    EXPECT_FALSE(grid_can_place(&grid, "DOG", 3, DIRECTION_ACROSS, 4, 4));
    EXPECT_TRUE(grid_can_place(&grid, "DOG", 3, DIRECTION_ACROSS, 5, 2));
}

TEST_F(CrosswordGridTest, SameDirectionOverlapRejected)
{
    place("CAR", DIRECTION_ACROSS, 3, 1);

    // CART would swallow CAR
    EXPECT_FALSE(grid_can_place(&grid, "CART", 4, DIRECTION_ACROSS, 3, 1));
}

TEST_F(CrosswordGridTest, UndoRestoresPreviousState)
{
    place("CAT", DIRECTION_ACROSS, 3, 2);

    bool crossWritten[CROSSWORD_MAX_ANSWER_LENGTH];
    ASSERT_TRUE(grid_can_place(&grid, "BAG", 3, DIRECTION_DOWN, 2, 3));
    grid_apply_placement(&grid, "BAG", 3, DIRECTION_DOWN, 2, 3, crossWritten);
    EXPECT_TRUE(crossWritten[0]);
    EXPECT_FALSE(crossWritten[1]);
    EXPECT_TRUE(crossWritten[2]);

    grid_undo_placement(&grid, 3, DIRECTION_DOWN, 2, 3, crossWritten);
    EXPECT_EQ('\0', grid_get(&grid, 2, 3));
    EXPECT_EQ('A', grid_get(&grid, 3, 3));
    EXPECT_EQ('\0', grid_get(&grid, 4, 3));

    // The crossing cell is free for a down word again
    EXPECT_TRUE(grid_can_place(&grid, "BAG", 3, DIRECTION_DOWN, 2, 3));
}

TEST_F(CrosswordGridTest, ClearEmptiesEverything)
{
    place("CAT", DIRECTION_ACROSS, 3, 2);
    grid_clear(&grid);

    for (int r = 0; r < grid.rows; r++)
        for (int c = 0; c < grid.cols; c++)
            EXPECT_EQ('\0', grid_get(&grid, r, c));
    EXPECT_TRUE(grid_can_place(&grid, "DOG", 3, DIRECTION_ACROSS, 3, 2));
}
